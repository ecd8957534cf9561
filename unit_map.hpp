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
#include "fixed_point.hpp"
#include "text_norm.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <optional>
#include <sstream>

namespace reggis {

// ----------------------------- Embedded CSV -----------------------------
// Format:
// CODE;LABEL;FACTOR      (quantity_in_label = quantity * FACTOR)
inline constexpr const char* kUnitCsvEmbedded = R"CSV(CODE;LABEL;FACTOR
KGM;Kg;1
KG;Kg;1
GRM;Kg;0.001
TNE;Kg;1000
LBR;Kg;0.45359237
LTR;Lt;1
LT;Lt;1
MLT;Lt;0.001
NIU;Un;1
EA;Un;1
EV;Un;1
JR;Un;1
UN;Un;1
94;Un;1
)CSV";

// Format:
// ISO;REGGIS
inline constexpr const char* kCurrencyCsvEmbedded = R"CSV(ISO;REGGIS
COP;1
USD;2
EUR;3
)CSV";

inline constexpr const char* kCanonicalCurrency = "COP";

inline std::vector<std::string> split_semicolon(std::string_view line) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= line.size()) {
        size_t pos = line.find(';', start);
        if (pos == std::string_view::npos) {
            out.emplace_back(trim_copy(line.substr(start)));
            break;
        }
        out.emplace_back(trim_copy(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return out;
}

// ----------------------------- Map-Types ---------------------------
// Factor kept as exact fraction num/den ("0.45359237" -> 45359237/100000000)
struct UnitRule {
    std::string label;       // "Kg"
    std::int64_t num{1};
    std::int64_t den{1};
};

using UnitMap = std::map<std::string, UnitRule>;       // key = upper-case unit code
using CurrencyMap = std::map<std::string, std::string>; // ISO -> REGGIS code

inline bool parse_factor(std::string_view s, std::int64_t& num, std::int64_t& den) {
    num = 0; den = 1;
    bool seenDot = false;
    for (char c : s) {
        if (c == '.') {
            if (seenDot) return false;
            seenDot = true;
            continue;
        }
        if (c < '0' || c > '9') return false;
        if (!mul_check(num, 10, num) || !add_check(num, c - '0', num)) return false;
        if (seenDot && !mul_check(den, 10, den)) return false;
    }
    return num > 0;
}

// Builds the unit map from the embedded CSV.
inline UnitMap build_unit_map_from_embedded() {
    UnitMap map;
    std::istringstream iss(std::string{kUnitCsvEmbedded});
    std::string line;
    while (std::getline(iss, line)) {
        auto cols = split_semicolon(line);
        if (cols.size() < 3) continue;
        if (cols[0] == "CODE") continue; // Header

        UnitRule rule;
        rule.label = cols[1];
        if (cols[0].empty() || rule.label.empty() || !parse_factor(cols[2], rule.num, rule.den))
            continue;
        map.insert({ upper_trim(cols[0]), rule });
    }
    return map;
}

inline CurrencyMap build_currency_map_from_embedded() {
    CurrencyMap map;
    std::istringstream iss(std::string{kCurrencyCsvEmbedded});
    std::string line;
    while (std::getline(iss, line)) {
        auto cols = split_semicolon(line);
        if (cols.size() < 2 || cols[0] == "ISO") continue;
        if (cols[0].empty() || cols[1].empty()) continue;
        map.insert({ upper_trim(cols[0]), cols[1] });
    }
    return map;
}

// Singleton access (build once, then reuse)
inline const UnitMap& get_unit_map() {
    static const UnitMap M = build_unit_map_from_embedded();
    return M;
}

inline const CurrencyMap& get_currency_map() {
    static const CurrencyMap M = build_currency_map_from_embedded();
    return M;
}

inline const UnitRule* lookup_unit(const UnitMap& m, std::string_view code) {
    if (auto it = m.find(upper_trim(code)); it != m.end()) return &it->second;
    return nullptr;
}

inline std::string lookup_currency_code(const CurrencyMap& m, std::string_view iso) {
    if (auto it = m.find(upper_trim(iso)); it != m.end()) return it->second;
    return {};
}

// ----------------------------- Normalization ---------------------------
struct NormalizeOptions {
    std::string usd_rate;              // COP per USD, decimal string; empty = no rate
    std::string eur_rate;              // COP per EUR
    bool prefer_document_rate = false; // use PaymentExchangeRate when the invoice states one
};

struct UnitResult {
    std::string unit;      // label, or the verbatim code when unknown
    Fixed5 quantity;
    Fixed5 unitPrice;
    bool converted = false;
};

// quantity * factor, price / factor; quantity * price is preserved.
inline UnitResult normalize_unit(std::string_view code, Fixed5 quantity, Fixed5 unitPrice) {
    UnitResult r;
    r.unit = trim_copy(code);
    r.quantity = quantity;
    r.unitPrice = unitPrice;

    const UnitRule* rule = lookup_unit(get_unit_map(), code);
    if (!rule) return r;

    Fixed5 q, p;
    if (!mul_div_round(quantity.scaled, rule->num, rule->den, q.scaled)) return r;
    if (!mul_div_round(unitPrice.scaled, rule->den, rule->num, p.scaled)) return r;

    r.unit = rule->label;
    r.quantity = q;
    r.unitPrice = p;
    r.converted = true;
    return r;
}

struct CurrencyResult {
    std::string currency;      // ISO code of the resulting amount
    std::string reggisCode;    // "1" after conversion, else the verbatim ISO code
    Fixed5 unitPrice;
    bool converted = false;
};

inline std::optional<Fixed5> configured_rate(std::string_view iso, const NormalizeOptions& opt) {
    const std::string key = upper_trim(iso);
    const std::string* s = nullptr;
    if (key == "USD") s = &opt.usd_rate;
    else if (key == "EUR") s = &opt.eur_rate;
    if (!s || trim_copy(*s).empty()) return std::nullopt;

    Fixed5 rate;
    if (!parse_fixed(*s, rate) || rate.scaled <= 0) return std::nullopt;
    return rate;
}

// Foreign prices -> COP. Empty currency counts as COP.
inline CurrencyResult convert_currency(std::string_view iso, Fixed5 unitPrice,
                                       const std::optional<Fixed5>& documentRate,
                                       const NormalizeOptions& opt)
{
    CurrencyResult r;
    std::string ccy = upper_trim(iso);
    if (ccy.empty()) ccy = kCanonicalCurrency;
    r.currency = ccy;
    r.reggisCode = ccy;
    r.unitPrice = unitPrice;

    const std::string code = lookup_currency_code(get_currency_map(), ccy);
    if (code.empty()) return r;

    if (ccy == kCanonicalCurrency) {
        r.reggisCode = code;
        r.converted = true;
        return r;
    }

    std::optional<Fixed5> rate;
    if (opt.prefer_document_rate && documentRate && documentRate->scaled > 0)
        rate = documentRate;
    if (!rate)
        rate = configured_rate(ccy, opt);
    if (!rate) return r;

    Fixed5 p;
    if (!fixed_mul(unitPrice, *rate, p)) return r;

    r.currency = kCanonicalCurrency;
    r.reggisCode = lookup_currency_code(get_currency_map(), kCanonicalCurrency);
    r.unitPrice = p;
    r.converted = true;
    return r;
}

} // namespace reggis
