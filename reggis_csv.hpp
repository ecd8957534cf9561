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
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace reggis {

struct ExportOptions {
    char delimiter = ';';
    bool include_header = true;
    bool write_utf8_bom = true;    // Excel-compatible
    bool decimal_comma = true;     // "1,50000" instead of "1.50000"
    std::string file_label;        // REGGIS_<label>_<timestamp>.csv; empty = input folder name
};

inline std::string csv_escape(const std::string& s, char delimiter) {
    bool needQuotes = s.find(delimiter) != std::string::npos ||
                      s.find('"')       != std::string::npos ||
                      s.find('\n')      != std::string::npos ||
                      s.find('\r')      != std::string::npos;
    std::string out = s;
    // double quotes
    for (size_t pos = 0; (pos = out.find('"', pos)) != std::string::npos; pos += 2)
        out.insert(pos, "\"");
    if (needQuotes) {
        out.insert(out.begin(), '"');
        out.push_back('"');
    }
    return out;
}

// display value / canonical value (dot decimals, trimmed)
using ReggisRow = std::vector<std::pair<std::string,std::string>>;
using ExportData = std::vector<ReggisRow>;

enum class ExportField {
    InvoiceNumber,
    ProductName,
    ProductCode,
    Unit,
    Quantity,
    UnitPrice,
    IssueDate,
    DueDate,
    BuyerTaxId,
    BuyerName,
    SellerTaxId,
    SellerName,
    Principal,
    Municipality,
    TaxPercent,
    Description,
    ActivaFactura,
    ActivaBodega,
    Incentivo,
    OriginalQuantity,
    Currency,
    TotalWithoutTax,
    TaxAmount,
    TotalWithTax,
    Count // Array size
};

constexpr std::size_t to_index(ExportField f) noexcept {
    return static_cast<std::size_t>(f);
}

// Column titles in ExportField order
inline const std::vector<std::string>& reggis_headers() {
    static const std::vector<std::string> h = {
        "N° Factura",
        "Nombre Producto",
        "Codigo Subyacente",
        "Unidad Medida en Kg,Un,Lt",
        "Cantidad (5 decimales - separdor coma)",
        "Precio Unitario (5 decimales - separdor coma)",
        "Fecha Factura Año-Mes-Dia",
        "Fecha Pago Año-Mes-Dia",
        "Nit Comprador (Existente)",
        "Nombre Comprador",
        "Nit Vendedor (Existente)",
        "Nombre Vendedor",
        "Principal V,C",
        "Municipio (Nombre Exacto de la Ciudad)",
        "Iva (N°%)",
        "Descripción",
        "Activa Factura",
        "Activa Bodega",
        "Incentivo",
        "Cantidad Original (5 decimales - separdor coma)",
        "Moneda (1,2,3)",
        "Total Sin IVA",
        "Total IVA",
        "Total Con IVA",
    };
    return h;
}

inline ReggisRow make_row(const InvoiceLine& l, bool decimal_comma) {
    auto num = [&](const Fixed5& f) { return std::make_pair(fmt_fixed(f, decimal_comma), fmt_fixed(f, false)); };
    auto pct = [&](const Fixed5& f) { return std::make_pair(fmt_percent(f, decimal_comma), fmt_percent(f, false)); };
    auto str = [](const std::string& s) { return std::make_pair(s, trim_copy(s)); };

    return ReggisRow{
        str(l.invoiceNumber),
        str(l.productName),
        str(l.productCode),
        str(l.unit),
        num(l.quantity),
        num(l.unitPrice),
        str(l.issueDate),
        str(l.dueDate),
        str(l.buyerTaxId),
        str(l.buyerName),
        str(l.sellerTaxId),
        str(l.sellerName),
        str(l.principal),
        str(l.municipality),
        pct(l.taxPercent),
        str(l.productName),
        str(l.activaFactura),
        str(l.activaBodega),
        str(l.incentivo),
        num(l.originalQuantity),
        str(l.currencyCode),
        num(l.totalWithoutTax),
        num(l.taxAmount),
        num(l.totalWithTax),
    };
}

inline void write_csv_row(std::ostream& os, const std::vector<std::string>& fields, char D) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i) os << D;
        os << csv_escape(fields[i], D);
    }
    os << "\n";
}

// === Actual export function ===========================================
inline void export_lines_csv(const std::vector<InvoiceLine>& lines, std::ostream* osPtr=nullptr,
                             ExportData* vPtr=nullptr, const ExportOptions& opt = {})
{
    if (osPtr && opt.write_utf8_bom) {
        const unsigned char bom[3] = {0xEF,0xBB,0xBF};
        osPtr->write(reinterpret_cast<const char*>(bom), 3);
    }
    const char D = opt.delimiter;

    if (osPtr && opt.include_header)
        write_csv_row(*osPtr, reggis_headers(), D);

    std::vector<std::string> display;
    for (const auto& line : lines) {
        ReggisRow row = make_row(line, opt.decimal_comma);
        if (osPtr) {
            display.clear();
            for (const auto& item : row) display.push_back(item.first);
            write_csv_row(*osPtr, display, D);
        }
        if (vPtr) vPtr->push_back(std::move(row));
    }
}

// ---------------------------------- Output file ----------------------------------

// suffixes tried before giving up on a name
constexpr int kMaxExportSuffix = 10000;

// "REGGIS_<label>_<YYYYMMDD_HHMMSS>"
inline std::string export_basename(const std::string& label, std::time_t when) {
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &when);
#else
    localtime_r(&when, &tm);
#endif
    std::ostringstream oss;
    oss << "REGGIS_" << (label.empty() ? std::string("export") : label) << '_'
        << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

// Creates p only if absent. errc::file_exists when another writer holds the name.
inline bool create_exclusive(const std::filesystem::path& p, std::error_code& ec) {
    std::FILE* f = std::fopen(p.string().c_str(), "wbx");
    if (!f) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    std::fclose(f);
    ec.clear();
    return true;
}

// Claims the first free name of base.csv, base_1.csv, base_2.csv ... by creating
// an empty placeholder, so concurrent writers never pick the same file.
inline bool reserve_export_path(const std::filesystem::path& dir, const std::string& base,
                                std::filesystem::path& out, std::string* error = nullptr)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    for (int n = 0; n < kMaxExportSuffix; ++n) {
        const fs::path p = dir / fs::u8path(n == 0 ? base + ".csv" : base + "_" + std::to_string(n) + ".csv");
        if (fs::exists(fs::path(p).concat(".part"), ec)) continue;
        if (create_exclusive(p, ec)) {
            out = p;
            return true;
        }
        if (ec != std::errc::file_exists) {
            if (error) *error = "cannot create " + p.u8string() + ": " + ec.message();
            return false;
        }
    }
    if (error) *error = "no free file name for " + base;
    return false;
}

// Writes to "<name>.part" and renames over the reserved name on success;
// nothing is left behind on failure.
inline bool write_export_file(const std::vector<InvoiceLine>& lines, const std::string& outDir,
                              const ExportOptions& opt, std::time_t when,
                              std::string& outPath, std::string* error = nullptr)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path dir = fs::u8path(outDir);
    fs::create_directories(dir, ec);
    if (!fs::is_directory(dir, ec)) {
        if (error) *error = "output folder not usable: " + outDir;
        return false;
    }

    fs::path finalPath;
    if (!reserve_export_path(dir, export_basename(opt.file_label, when), finalPath, error))
        return false;
    const fs::path partPath = fs::path(finalPath).concat(".part");
    auto discard = [&] {
        std::error_code ignore;
        fs::remove(partPath, ignore);
        fs::remove(finalPath, ignore);
    };
    {
        std::ofstream os(partPath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!os) {
            discard();
            if (error) *error = "cannot create " + partPath.u8string();
            return false;
        }
        export_lines_csv(lines, &os, nullptr, opt);
        os.flush();
        if (!os) {
            os.close();
            discard();
            if (error) *error = "write failed: " + partPath.u8string();
            return false;
        }
    }

    fs::rename(partPath, finalPath, ec);
    if (ec) {
        discard();
        if (error) *error = "cannot publish " + finalPath.u8string() + ": " + ec.message();
        return false;
    }
    outPath = finalPath.u8string();
    return true;
}

} // namespace reggis
