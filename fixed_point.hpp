/**
 * reggis export - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "reggis_model.hpp"
#include <string>
#include <string_view>
#include <cstdint>
#include <limits>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace reggis {

// safe multiplication a*b -> res, with overflow check (signed)
inline bool mul_check(std::int64_t a, std::int64_t b, std::int64_t& res) {
    if (a == 0 || b == 0) { res = 0; return true; }
    if (a > 0) {
        if (b > 0) { if (a > (std::numeric_limits<std::int64_t>::max() / b)) return false; }
        else { if (b < (std::numeric_limits<std::int64_t>::min() / a)) return false; }
    } else {
        if (b > 0) { if (a < (std::numeric_limits<std::int64_t>::min() / b)) return false; }
        else { if (b < (std::numeric_limits<std::int64_t>::max() / a)) return false; }
    }
    res = a * b;
    return true;
}

inline bool add_check(std::int64_t a, std::int64_t b, std::int64_t& res) {
    if (b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) return false;
    if (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b) return false;
    res = a + b;
    return true;
}

// round(a*b/den), ties away from zero, exact and without __int128.
// a is split into quotient/remainder by den so only r*b must fit (r < den).
inline bool mul_div_round(std::int64_t a, std::int64_t b, std::int64_t den, std::int64_t& out) {
    if (den <= 0) return false;
    if (a == std::numeric_limits<std::int64_t>::min() ||
        b == std::numeric_limits<std::int64_t>::min()) return false;

    const bool neg = (a < 0) != (b < 0);
    const std::int64_t ua = a < 0 ? -a : a;
    const std::int64_t ub = b < 0 ? -b : b;

    const std::int64_t q = ua / den;
    const std::int64_t r = ua % den;

    std::int64_t hi, lo;
    if (!mul_check(q, ub, hi)) return false;
    if (!mul_check(r, ub, lo)) return false;

    std::int64_t v = lo / den;
    const std::int64_t rem = lo % den;
    if (rem >= den - rem) ++v; // 2*rem >= den, half-up

    if (!add_check(hi, v, v)) return false;
    out = neg ? -v : v;
    return true;
}

// a * b for two 5-decimal values; the smaller magnitude goes through the remainder path
inline bool fixed_mul(Fixed5 a, Fixed5 b, Fixed5& out) {
    std::int64_t x = a.scaled, y = b.scaled;
    auto mag = [](std::int64_t v){ return v < 0 ? -(v + 1) : v; };
    if (mag(y) > mag(x)) std::swap(x, y);
    return mul_div_round(x, y, kFixedScale, out.scaled);
}

// "1.234,56" or "1234.56" -> value scaled by 10^5 (robust, exception-free).
// Digits beyond the fifth decimal round half-up.
inline bool parse_fixed(std::string_view in, Fixed5& out) {
    std::string s(in);
    // remove simple ASCII groupings/spaces
    s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char ch){
        return ch==' '||ch=='\t'||ch=='\r'||ch=='\n'||ch=='\''||ch=='_'||ch==0xA0;
    }), s.end());
    if (s.empty()) return false;

    bool neg = false;
    if (s.front()=='+' || s.front()=='-') {
        neg = (s.front()=='-');
        s.erase(s.begin());
    }

    // determine decimal separator
    size_t lastDot = s.find_last_of('.');
    size_t lastCom = s.find_last_of(',');
    char dec = 0;
    if (lastDot != std::string::npos || lastCom != std::string::npos) {
        if (lastDot == std::string::npos) dec = ',';
        else if (lastCom == std::string::npos) dec = '.';
        else dec = (lastDot > lastCom) ? '.' : ',';
    }

    std::string intp, frac;
    if (dec) {
        size_t pos = s.find_last_of(dec);
        intp = s.substr(0, pos);
        frac = s.substr(pos+1);
    } else {
        intp = s;
    }

    // remove the grouping separator
    char other = dec ? (dec=='.' ? ',' : '.') : 0;
    if (other) intp.erase(std::remove(intp.begin(), intp.end(), other), intp.end());

    auto only_digits = [](const std::string& t)->bool {
        for (unsigned char c : t) if (c < '0' || c > '9') return false;
        return true;
    };
    if (intp.empty() && frac.empty()) return false;
    if (intp.empty()) intp = "0";
    if (!only_digits(intp) || !only_digits(frac)) return false;

    bool roundUp = false;
    if ((int)frac.size() > kFixedDecimals) {
        roundUp = frac[(size_t)kFixedDecimals] >= '5';
        frac.resize((size_t)kFixedDecimals);
    } else {
        frac.append((size_t)(kFixedDecimals - (int)frac.size()), '0');
    }

    std::int64_t ip = 0;
    for (unsigned char c : intp) {
        if (!mul_check(ip, 10, ip) || !add_check(ip, (std::int64_t)(c - '0'), ip)) return false;
    }
    std::int64_t fp = 0;
    for (unsigned char c : frac) fp = fp * 10 + (c - '0');

    std::int64_t v;
    if (!mul_check(ip, kFixedScale, v)) return false;
    if (!add_check(v, fp + (roundUp ? 1 : 0), v)) return false;
    out.scaled = neg ? -v : v;
    return true;
}

// Fixed5 -> "1234,50000" / "1234.50000" (never consults the host locale)
inline std::string fmt_fixed(const Fixed5& f, bool use_decimal_comma = true) {
    std::int64_t v = f.scaled;
    bool neg = v < 0;
    std::uint64_t uv = neg ? (std::uint64_t)0 - (std::uint64_t)v : (std::uint64_t)v;
    std::uint64_t major = uv / (std::uint64_t)kFixedScale;
    std::uint64_t frac  = uv % (std::uint64_t)kFixedScale;

    std::ostringstream oss;
    if (neg) oss << '-';
    oss << major
        << (use_decimal_comma ? ',' : '.')
        << std::setw(kFixedDecimals) << std::setfill('0') << frac;
    return oss.str();
}

// Percent column: "19" when whole, otherwise trailing zeros trimmed ("5,5")
inline std::string fmt_percent(const Fixed5& f, bool use_decimal_comma = true) {
    std::string s = fmt_fixed(f, use_decimal_comma);
    const size_t sep = s.size() - (size_t)kFixedDecimals - 1;
    size_t end = s.size();
    while (end > sep + 1 && s[end - 1] == '0') --end;
    if (end == sep + 1) end = sep;
    s.resize(end);
    return s;
}

} // namespace reggis
