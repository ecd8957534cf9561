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
#include "reference_store.hpp"
#include <string>

namespace reggis {

enum class RejectReason { None, UnknownMaterial, UnknownClient };

inline const char* to_string(RejectReason r) {
    switch (r) {
    case RejectReason::None:            return "None";
    case RejectReason::UnknownMaterial: return "UnknownMaterial";
    case RejectReason::UnknownClient:   return "UnknownClient";
    }
    return "Unknown";
}

struct Rejection {
    RejectReason reason{RejectReason::None};
    std::string productCode;
    std::string entity;
    std::string buyerTaxId;
    std::string invoiceNumber;
    std::string source;
};

struct FilterOptions {
    bool validate_materials = false;
    bool validate_clients = false;
};

// Accept/reject one line against a read view. Materials are checked first.
inline bool filter_line(const InvoiceLine& line, const FilterOptions& opt,
                        const ReferenceStore::ReadView& view, Rejection* rejection = nullptr)
{
    RejectReason reason = RejectReason::None;
    if (opt.validate_materials && !view.lookup_material(line.productCode, line.effectiveEntity))
        reason = RejectReason::UnknownMaterial;
    else if (opt.validate_clients && !view.lookup_client(line.buyerTaxId))
        reason = RejectReason::UnknownClient;

    if (reason == RejectReason::None) return true;
    if (rejection) {
        rejection->reason = reason;
        rejection->productCode = line.productCode;
        rejection->entity = line.effectiveEntity;
        rejection->buyerTaxId = line.buyerTaxId;
        rejection->invoiceNumber = line.invoiceNumber;
        rejection->source = line.source;
    }
    return false;
}

} // namespace reggis
