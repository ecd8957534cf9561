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
#include "unit_map.hpp"
#include "entity_map.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <istream>
#include <string>
#include <cstring>
#include <optional>
#include <initializer_list>
#include <utility>

namespace reggis {

// UBL 2.1 namespaces
inline constexpr const char* kNsUblPrefix   = "urn:oasis:names:specification:ubl:schema:xsd:";
inline constexpr const char* kNsInvoice     = "urn:oasis:names:specification:ubl:schema:xsd:Invoice-2";
inline constexpr const char* kNsCreditNote  = "urn:oasis:names:specification:ubl:schema:xsd:CreditNote-2";
inline constexpr const char* kNsDebitNote   = "urn:oasis:names:specification:ubl:schema:xsd:DebitNote-2";
inline constexpr const char* kNsAttachedDoc = "urn:oasis:names:specification:ubl:schema:xsd:AttachedDocument-2";
inline constexpr const char* kNsCac = "urn:oasis:names:specification:ubl:schema:xsd:CommonAggregateComponents-2";

// ---------- Helpers (namespace-agnostic, only classic loops) ----------
inline const char* ln(const pugi::xml_node& n) {
    if (!n) return "";
    const char* full = n.name();
    const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_node& n, const char* wanted) { return std::strcmp(ln(n), wanted) == 0; }

inline const char* ln(const pugi::xml_attribute& a) {
    if (!a) return "";
    const char* full = a.name(); const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_attribute& a, const char* wanted) { return std::strcmp(ln(a), wanted) == 0; }

// direct child with local name
inline pugi::xml_node child_any(const pugi::xml_node& p, const char* name) {
    for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling())
        if (isln(c, name)) return c;
    return pugi::xml_node();
}

// depth search (recursive) over all descendants
inline pugi::xml_node desc_any(const pugi::xml_node& p, const char* name) {
    for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling()) {
        if (isln(c, name)) return c;
        pugi::xml_node found = desc_any(c, name);
        if (found) return found;
    }
    return pugi::xml_node();
}

// child path "A/B/C" by local names
inline pugi::xml_node path_any(const pugi::xml_node& p, std::initializer_list<const char*> names) {
    pugi::xml_node n = p;
    for (const char* name : names) {
        n = child_any(n, name);
        if (!n) break;
    }
    return n;
}

inline std::string txt(const pugi::xml_node& n) {
    std::string s = n.text().as_string(); // UTF-8
    // trim
    auto notsp = [](int ch){ return ch!=' ' && ch!='\t' && ch!='\n' && ch!='\r'; };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
    s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
    return s;
}
inline std::string child_text(const pugi::xml_node& p, const char* name) {
    pugi::xml_node n = child_any(p, name);
    return n ? txt(n) : std::string();
}
inline std::string desc_text(const pugi::xml_node& p, const char* name) {
    pugi::xml_node n = desc_any(p, name);
    return n ? txt(n) : std::string();
}
inline std::string path_text(const pugi::xml_node& p, std::initializer_list<const char*> names) {
    pugi::xml_node n = path_any(p, names);
    return n ? txt(n) : std::string();
}

// namespace URI bound to the element's prefix (or the default namespace)
inline std::string ns_uri(const pugi::xml_node& n) {
    const char* full = n.name();
    const char* c = std::strchr(full, ':');
    const std::string attr = c ? "xmlns:" + std::string(full, (size_t)(c - full)) : std::string("xmlns");
    for (pugi::xml_node p = n; p && p.type() == pugi::node_element; p = p.parent()) {
        if (pugi::xml_attribute a = p.attribute(attr.c_str())) return a.value();
    }
    return {};
}

// all pcdata/cdata children concatenated (CDATA payloads may be split)
inline std::string raw_text(const pugi::xml_node& n) {
    std::string s;
    for (pugi::xml_node c = n.first_child(); c; c = c.next_sibling())
        if (c.type() == pugi::node_pcdata || c.type() == pugi::node_cdata)
            s += c.value();
    return s;
}

inline Fixed5 parse_fixed_or_zero(const std::string& s) {
    Fixed5 f;
    if (!parse_fixed(s, f)) f.scaled = 0;
    return f;
}

inline std::optional<Fixed5> parse_fixed_opt(const std::string& s) {
    Fixed5 f;
    if (s.empty() || !parse_fixed(s, f)) return std::nullopt;
    return f;
}

inline Party parse_party(const pugi::xml_node& party) {
    Party p;
    if (!party) return p;

    p.taxId = path_text(party, {"PartyTaxScheme", "CompanyID"});
    if (p.taxId.empty()) p.taxId = path_text(party, {"PartyIdentification", "ID"});

    p.name = path_text(party, {"PartyLegalEntity", "RegistrationName"});
    if (p.name.empty()) p.name = path_text(party, {"PartyName", "Name"});

    p.city = path_text(party, {"PhysicalLocation", "Address", "CityName"});
    if (p.city.empty()) p.city = path_text(party, {"PartyTaxScheme", "RegistrationAddress", "CityName"});
    return p;
}

// first TaxTotal/TaxSubtotal/TaxCategory/Percent under the node
inline std::optional<Fixed5> tax_percent_of(const pugi::xml_node& node) {
    for (pugi::xml_node tt = node.first_child(); tt; tt = tt.next_sibling()) {
        if (!isln(tt, "TaxTotal")) continue;
        for (pugi::xml_node st = tt.first_child(); st; st = st.next_sibling()) {
            if (!isln(st, "TaxSubtotal")) continue;
            if (auto v = parse_fixed_opt(path_text(st, {"TaxCategory", "Percent"}))) return v;
        }
    }
    return std::nullopt;
}

inline InvoiceHeader parse_header(const pugi::xml_node& root) {
    InvoiceHeader h;
    h.number = child_text(root, "ID");
    h.issueDate = child_text(root, "IssueDate");
    h.dueDate = child_text(root, "DueDate");
    if (h.dueDate.empty()) h.dueDate = desc_text(root, "PaymentDueDate");
    if (h.dueDate.empty()) h.dueDate = h.issueDate;

    h.currency = child_text(root, "DocumentCurrencyCode");
    if (h.currency.empty()) h.currency = kCanonicalCurrency;

    h.exchangeRate = parse_fixed_opt(path_text(root, {"PaymentExchangeRate", "CalculationRate"}));
    h.taxPercent = tax_percent_of(root);

    h.seller = parse_party(path_any(root, {"AccountingSupplierParty", "Party"}));
    h.buyer  = parse_party(path_any(root, {"AccountingCustomerParty", "Party"}));
    return h;
}

inline DocKind detect_kind(const pugi::xml_node& root) {
    const std::string ns = ns_uri(root);
    if (isln(root, "Invoice")          && ns == kNsInvoice)     return DocKind::Invoice;
    if (isln(root, "CreditNote")       && ns == kNsCreditNote)  return DocKind::CreditNote;
    if (isln(root, "DebitNote")        && ns == kNsDebitNote)   return DocKind::DebitNote;
    if (isln(root, "AttachedDocument") && ns == kNsAttachedDoc) return DocKind::AttachedDocument;
    return DocKind::Other;
}

inline bool is_ubl_root(const pugi::xml_node& root) {
    return ns_uri(root).rfind(kNsUblPrefix, 0) == 0;
}

struct ExtractOptions {
    // quantity, price and base must be > 0, else the line is dropped as invalid
    bool require_positive_amounts = true;

    std::string principal = "V";   // V = seller, C = buyer
    std::string activa_factura = "1";
    std::string activa_bodega = "1";
    std::string incentivo;

    NormalizeOptions normalize;
};

// ---------- Parser-Class ----------
class Parser {
public:
    Parser() = default;
    explicit Parser(ExtractOptions opt) : opt_(std::move(opt)) {}

    const ExtractOptions& options() const { return opt_; }

    bool parse_file(const std::string& path, Document& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load_file(path.c_str(), pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error=std::string("XML file parse error: ") + ok.description(); return false; }
        return parse_doc(doc, out, error, 0);
    }

    bool parse_file(std::istream& is, Document& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load(is, pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error=std::string("XML file parse error: ") + ok.description(); return false; }
        return parse_doc(doc, out, error, 0);
    }

    bool parse_string(const std::string& xml_utf8, Document& out, std::string* error=nullptr) const {
        return parse_buffer(xml_utf8.data(), xml_utf8.size(), out, error);
    }

    bool parse_buffer(const void* data, size_t size, Document& out, std::string* error=nullptr) const {
        return parse_buffer_at(data, size, out, error, 0);
    }

private:
    ExtractOptions opt_;

    bool parse_buffer_at(const void* data, size_t size, Document& out, std::string* error, int depth) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load_buffer(data, size, pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error=std::string("XML parse error: ") + ok.description(); return false; }
        return parse_doc(doc, out, error, depth);
    }

    bool parse_doc(const pugi::xml_document& doc, Document& out, std::string* error, int depth) const {
        pugi::xml_node root = doc.document_element();
        if (!root){ if(error)*error="Empty document"; return false; }
        if (!is_ubl_root(root)){ if(error)*error=std::string("Not a UBL document: ") + root.name(); return false; }

        out.kind = detect_kind(root);
        out.rootName = ln(root);

        switch (out.kind) {
        case DocKind::AttachedDocument:
            return unwrap_attached(root, out, error, depth);
        case DocKind::Invoice:
            return parse_invoice(root, out, error);
        case DocKind::CreditNote:
        case DocKind::DebitNote:
            out.header.number = child_text(root, "ID");
            return true;
        default:
            return true;
        }
    }

    // AttachedDocument carries the invoice as text in Attachment/ExternalReference/Description
    bool unwrap_attached(const pugi::xml_node& root, Document& out, std::string* error, int depth) const {
        if (depth > 0){ if(error)*error="Nested AttachedDocument"; return false; }

        std::string embedded = trim_copy(raw_text(path_any(root, {"Attachment", "ExternalReference", "Description"})));
        if (embedded.empty() || embedded.front() != '<') {
            // fallback: any Description holding markup
            embedded.clear();
            for (pugi::xml_node a = root.first_child(); a && embedded.empty(); a = a.next_sibling()) {
                pugi::xml_node d = desc_any(a, "Description");
                std::string s = d ? trim_copy(raw_text(d)) : std::string();
                if (!s.empty() && s.front() == '<') embedded = s;
            }
        }
        if (embedded.empty()){ if(error)*error="AttachedDocument without embedded XML"; return false; }

        Document inner;
        if (!parse_buffer_at(embedded.data(), embedded.size(), inner, error, depth + 1)) return false;
        out = std::move(inner);
        return true;
    }

    bool parse_invoice(const pugi::xml_node& root, Document& out, std::string* error) const {
        out.header = parse_header(root);
        if (out.header.number.empty()){ if(error)*error="Invoice without cbc:ID"; return false; }

        int ordinal = 0;
        for (pugi::xml_node n = root.first_child(); n; n = n.next_sibling()) {
            if (!isln(n, "InvoiceLine")) continue;
            if (ns_uri(n) != kNsCac){ if(error)*error="InvoiceLine outside the cac namespace"; return false; }

            InvoiceLine line;
            if (parse_line(n, out.header, line)) {
                line.lineOrdinal = ordinal;
                out.lines.push_back(std::move(line));
            } else {
                out.invalidLines++;
            }
            ordinal++;
        }
        return true;
    }

    // false => line violates the business rules
    bool parse_line(const pugi::xml_node& il, const InvoiceHeader& h, InvoiceLine& l) const {
        l.invoiceNumber = h.number;
        l.issueDate = h.issueDate;
        l.dueDate = h.dueDate;
        l.buyerTaxId = h.buyer.taxId;
        l.buyerName = h.buyer.name;
        l.sellerTaxId = h.seller.taxId;
        l.sellerName = h.seller.name;
        l.municipality = h.buyer.city;
        l.principal = opt_.principal;
        l.activaFactura = opt_.activa_factura;
        l.activaBodega = opt_.activa_bodega;
        l.incentivo = opt_.incentivo;

        pugi::xml_node item = child_any(il, "Item");
        l.productName = child_text(item, "Description");
        if (l.productName.empty()) l.productName = child_text(item, "Name");
        l.productCode = path_text(item, {"SellersItemIdentification", "ID"});
        if (l.productCode.empty()) l.productCode = path_text(item, {"StandardItemIdentification", "ID"});

        pugi::xml_node qn = child_any(il, "InvoicedQuantity");
        for (pugi::xml_attribute at = qn.first_attribute(); at; at = at.next_attribute())
            if (isln(at, "unitCode")) { l.rawUnit = trim_copy(at.value()); break; }
        const Fixed5 qty = parse_fixed_or_zero(qn ? txt(qn) : std::string());
        const Fixed5 price = parse_fixed_or_zero(path_text(il, {"Price", "PriceAmount"}));
        l.originalQuantity = qty;

        // unit first, then currency on the per-unit price
        UnitResult u = normalize_unit(l.rawUnit, qty, price);
        CurrencyResult c = convert_currency(h.currency, u.unitPrice, h.exchangeRate, opt_.normalize);
        l.unit = u.unit;
        l.quantity = u.quantity;
        l.unitPrice = c.unitPrice;
        l.currency = c.currency;
        l.currencyCode = c.reggisCode;
        l.normalized = u.converted && c.converted;

        l.effectiveEntity = effective_entity(l.productName, h.seller.taxId);

        std::optional<Fixed5> rate = tax_percent_of(il);
        if (!rate) {
            for (pugi::xml_node ac = il.first_child(); ac && !rate; ac = ac.next_sibling())
                if (isln(ac, "AllowanceCharge"))
                    rate = parse_fixed_opt(path_text(ac, {"TaxCategory", "Percent"}));
        }
        if (!rate) rate = h.taxPercent;
        l.taxRateStated = rate.has_value();
        l.taxPercent = rate.value_or(Fixed5{});

        if (!fixed_mul(l.quantity, l.unitPrice, l.totalWithoutTax)) return false;
        if (!mul_div_round(l.totalWithoutTax.scaled, l.taxPercent.scaled, 100 * kFixedScale, l.taxAmount.scaled)) return false;
        if (!add_check(l.totalWithoutTax.scaled, l.taxAmount.scaled, l.totalWithTax.scaled)) return false;

        if (opt_.require_positive_amounts) {
            if (l.quantity.scaled <= 0 || l.unitPrice.scaled <= 0 || l.totalWithoutTax.scaled <= 0)
                return false;
        }
        return true;
    }
};

} // namespace reggis
