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
#include <vector>
#include <cstdint>
#include <optional>

namespace reggis {

// --- Basis ---
// Decimal value stored as integer scaled by 10^5 (5 fixed decimals)
constexpr int kFixedDecimals = 5;
constexpr std::int64_t kFixedScale = 100000;

struct Fixed5 {
    std::int64_t scaled{0};   // 1.5 -> 150000

    static Fixed5 from_int(std::int64_t v) { return Fixed5{ v * kFixedScale }; }
    bool operator==(const Fixed5& o) const { return scaled == o.scaled; }
    bool operator!=(const Fixed5& o) const { return scaled != o.scaled; }
};

// Error taxonomy shared by import, walk and run results
enum class ErrorKind {
    None,
    FormatInvalid,      // reference import header mismatch
    MalformedDocument,  // one invoice failed to parse
    ArchiveUnreadable,  // zip could not be opened
    EntryUnreadable,    // entry inside a zip could not be read
    InputUnreadable,    // input folder / reference file missing
    OutputUnwritable,   // export could not be written
    StoreFailure        // sqlite failure
};

inline const char* to_string(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:              return "None";
    case ErrorKind::FormatInvalid:     return "FormatInvalid";
    case ErrorKind::MalformedDocument: return "MalformedDocument";
    case ErrorKind::ArchiveUnreadable: return "ArchiveUnreadable";
    case ErrorKind::EntryUnreadable:   return "EntryUnreadable";
    case ErrorKind::InputUnreadable:   return "InputUnreadable";
    case ErrorKind::OutputUnwritable:  return "OutputUnwritable";
    case ErrorKind::StoreFailure:      return "StoreFailure";
    }
    return "Unknown";
}

// Parties
struct Party {
    std::string taxId;        // PartyTaxScheme/CompanyID | PartyIdentification/ID
    std::string name;         // PartyLegalEntity/RegistrationName | PartyName/Name
    std::string city;         // PhysicalLocation/Address/CityName
};

// Invoice header (read once per document)
struct InvoiceHeader {
    std::string number;           // cbc:ID
    std::string issueDate;        // cbc:IssueDate (YYYY-MM-DD)
    std::string dueDate;          // DueDate | PaymentDueDate | IssueDate
    std::string currency;         // DocumentCurrencyCode, "COP" if absent
    std::optional<Fixed5> exchangeRate; // PaymentExchangeRate/CalculationRate
    std::optional<Fixed5> taxPercent;   // document level TaxTotal percent
    Party buyer;                  // AccountingCustomerParty
    Party seller;                 // AccountingSupplierParty
};

// One exported line (InvoiceLine)
struct InvoiceLine {
    std::string invoiceNumber;
    std::string issueDate;
    std::string dueDate;
    std::string productName;      // Item/Description | Item/Name
    std::string productCode;      // underlying code (SellersItemIdentification/ID)
    std::string unit;             // REGGIS label after normalization (Kg, Lt, Un) or verbatim code
    std::string rawUnit;          // InvoicedQuantity@unitCode
    Fixed5 quantity;              // normalized
    Fixed5 originalQuantity;      // as invoiced
    Fixed5 unitPrice;             // normalized (per canonical unit, in COP)
    std::string buyerTaxId;
    std::string buyerName;
    std::string sellerTaxId;
    std::string sellerName;
    std::string municipality;     // buyer city
    std::string effectiveEntity;  // brand token entity or seller tax id
    std::string currency;         // ISO code of exported amounts
    std::string currencyCode;     // REGGIS code (1,2,3) or ISO code if unknown
    Fixed5 taxPercent;
    bool taxRateStated = false;
    Fixed5 totalWithoutTax;
    Fixed5 taxAmount;
    Fixed5 totalWithTax;
    std::string principal;        // V | C
    std::string activaFactura;
    std::string activaBodega;
    std::string incentivo;
    bool normalized = true;       // false => unit or currency passed through verbatim
    std::string source;           // "archive.zip/entry.xml" or "file.xml"
    int unitOrdinal{-1};          // enumeration position of the source unit
    int documentOrdinal{-1};      // document position inside the unit
    int lineOrdinal{-1};          // line position inside the document
};

// Document kind (root element local name)
enum class DocKind { Invoice, CreditNote, DebitNote, AttachedDocument, Other };

struct Document {
    DocKind kind{DocKind::Other};
    std::string rootName;         // local name of the effective root
    InvoiceHeader header;
    std::vector<InvoiceLine> lines;
    int invalidLines{0};          // lines dropped by business rules
};

} // namespace reggis
