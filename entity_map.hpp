/**
 * reggis export - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "text_norm.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <utility>

namespace reggis {

// Closed set of legal entities (tax id -> display name)
inline const std::vector<std::pair<std::string, std::string>>& known_entities() {
    static const std::vector<std::pair<std::string, std::string>> v = {
        { "800245795", "Lactalis" },
        { "890903711", "Proleche" },
    };
    return v;
}

inline bool is_known_entity(std::string_view taxId) {
    const std::string id = trim_copy(taxId);
    for (const auto& e : known_entities())
        if (e.first == id) return true;
    return false;
}

// Brand tokens in product names, first match wins.
struct BrandToken {
    const char* token;    // substring of the casefolded name
    const char* entity;
};

inline const std::vector<BrandToken>& brand_tokens() {
    static const std::vector<BrandToken> v = {
        { "PARMALAT", "800245795" },
        { "PROLECHE", "890903711" },
    };
    return v;
}

// Brand entity for a product name, or the seller tax id when no token matches.
inline std::string effective_entity(std::string_view productName, std::string_view sellerTaxId) {
    const std::string hay = fold_key(productName);
    for (const auto& b : brand_tokens()) {
        if (hay.find(fold_key(b.token)) != std::string::npos)
            return b.entity;
    }
    return trim_copy(sellerTaxId);
}

// SOCIEDAD text accepted at import (casefolded key -> tax id)
inline const std::map<std::string, std::string>& get_entity_alias_map() {
    static const std::map<std::string, std::string> m = [] {
        std::map<std::string, std::string> r;
        const std::pair<const char*, const char*> aliases[] = {
            { "Parmalat",              "800245795" },
            { "Lactalis",              "800245795" },
            { "Proleche",              "890903711" },
            { "Procesadora de Leches", "890903711" },
        };
        for (const auto& a : aliases) r.insert({ fold_key(a.first), a.second });
        for (const auto& e : known_entities()) r.insert({ e.first, e.first });
        return r;
    }();
    return m;
}

// "Parmalat" -> "800245795"; empty result for text outside the closed set
inline std::string canonicalize_entity(std::string_view sociedad) {
    const auto& m = get_entity_alias_map();
    if (auto it = m.find(fold_key(sociedad)); it != m.end()) return it->second;
    return {};
}

} // namespace reggis
