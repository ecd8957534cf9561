/**
 * reggis export - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include <string>
#include <string_view>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <utf8proc.h>

namespace reggis {

// ----------------------- minimal ASCII utilities (UTF-8 safe) ------------------
inline std::string trim_copy(std::string_view sv) {
    auto is_space = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t b = 0, e = sv.size();
    while (b < e && is_space(static_cast<unsigned char>(sv[b]))) ++b;
    while (e > b && is_space(static_cast<unsigned char>(sv[e-1]))) --e;
    return std::string(sv.substr(b, e - b));
}

inline std::string upper_trim(std::string_view s) {
    std::string r = trim_copy(s);
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c){ return static_cast<char>(c < 0x80 ? std::toupper(c) : c); });
    return r;
}

inline std::string lower_trim(std::string_view s) {
    std::string r = trim_copy(s);
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c){ return static_cast<char>(c < 0x80 ? std::tolower(c) : c); });
    return r;
}

// strips a leading UTF-8 BOM (spreadsheet exports carry one on the first cell)
inline std::string_view strip_bom(std::string_view s) {
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF)
        s.remove_prefix(3);
    return s;
}

// RAII deleter for buffers allocated by utf8proc_map (uses malloc internally)
struct Utf8ProcDeleter {
    void operator()(utf8proc_uint8_t* p) const noexcept { if (p) std::free(p); }
};

// Check if codepoint is considered whitespace (Unicode separators + ASCII controls)
inline bool isUnicodeSpaceOrControlWS(utf8proc_int32_t cp) {
    const int cat = utf8proc_category(cp);
    if (cat == UTF8PROC_CATEGORY_ZS ||
        cat == UTF8PROC_CATEGORY_ZL ||
        cat == UTF8PROC_CATEGORY_ZP) {
        return true;
    }
    switch (cp) {
    case 0x09: // \t
    case 0x0A: // \n
    case 0x0B: // \v
    case 0x0C: // \f
    case 0x0D: // \r
        return true;
    default:
        return false;
    }
}

inline bool isZeroWidth(utf8proc_int32_t cp) {
    switch (cp) {
    case 0x200B: // ZERO WIDTH SPACE
    case 0x200C: // ZERO WIDTH NON-JOINER
    case 0x200D: // ZERO WIDTH JOINER
    case 0x2060: // WORD JOINER
    case 0xFEFF: // BOM / ZERO WIDTH NO-BREAK SPACE
        return true;
    default:
        return false;
    }
}

// NFC + optional casefold. Whitespace runs collapse to a single ASCII blank,
// leading/trailing blanks dropped.
inline std::string normalize_freetext(std::string_view in, bool do_casefold = true)
{
    utf8proc_uint8_t* raw = nullptr;
    utf8proc_option_t opts = UTF8PROC_COMPOSE; // NFC
    if (do_casefold) opts = (utf8proc_option_t)(opts | UTF8PROC_CASEFOLD);

    const utf8proc_ssize_t nlen = utf8proc_map(
        reinterpret_cast<const utf8proc_uint8_t*>(in.data()),
        static_cast<utf8proc_ssize_t>(in.size()),
        &raw, opts
    );
    if (nlen < 0 || !raw) {
        return std::string(in); // invalid UTF-8: keep input
    }
    std::unique_ptr<utf8proc_uint8_t, Utf8ProcDeleter> norm(raw);

    std::string out;
    out.reserve(static_cast<size_t>(nlen));
    const utf8proc_uint8_t* p   = norm.get();
    const utf8proc_uint8_t* end = norm.get() + nlen;
    bool pendingBlank = false;

    while (p < end) {
        utf8proc_int32_t cp = 0;
        const utf8proc_ssize_t adv =
            utf8proc_iterate(p, (utf8proc_ssize_t)(end - p), &cp);
        if (adv <= 0) { // Skip invalid byte
            ++p;
            continue;
        }
        p += adv;

        if (isUnicodeSpaceOrControlWS(cp)) {
            if (!out.empty()) pendingBlank = true;
            continue;
        }
        if (isZeroWidth(cp)) {
            continue;
        }
        if (pendingBlank) {
            out.push_back(' ');
            pendingBlank = false;
        }

        utf8proc_uint8_t buf[4];
        const utf8proc_ssize_t w = utf8proc_encode_char(cp, buf);
        if (w > 0) {
            out.append(reinterpret_cast<char*>(buf), (size_t)w);
        }
    }

    return out;
}

// casefolded comparison key with single blanks ("Procesadora  de LECHES" -> "procesadora de leches")
inline std::string fold_key(std::string_view in) {
    return normalize_freetext(in, /*casefold=*/true);
}

} // namespace reggis
