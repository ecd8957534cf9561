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
#include "reggis_parser_pugi.hpp"
#include "reference_store.hpp"
#include "text_norm.hpp"
#include "zip_util.hpp"
#include <pugixml.hpp>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace reggis {

// Column headers of the reference sources (matched exactly after trim/BOM strip)
inline constexpr const char* kHdrCodigo      = "CODIGO";
inline constexpr const char* kHdrDescripcion = "DESCRIPCION";
inline constexpr const char* kHdrSociedad    = "SOCIEDAD";
inline constexpr const char* kHdrCodPadre    = "Cód.Padre";
inline constexpr const char* kHdrNombrePadre = "Nombre Código Padre";
inline constexpr const char* kHdrNit         = "NIT";

// upper bound for a single part inside an .xlsx
constexpr std::uint64_t kMaxXlsxPartBytes = 256ull * 1024 * 1024;

struct TableRow {
    int number{0};                  // 1-based row number in the source
    std::vector<std::string> cells;
};

struct Table {
    std::vector<std::string> header;
    int headerRow{0};
    std::vector<TableRow> rows;     // blank rows removed
};

inline bool is_blank_row(const std::vector<std::string>& cells) {
    for (const auto& c : cells)
        if (!trim_copy(c).empty()) return false;
    return true;
}

inline void add_table_row(Table& t, int number, std::vector<std::string> cells) {
    if (is_blank_row(cells)) return;
    if (t.header.empty()) {
        t.header = std::move(cells);
        t.headerRow = number;
        return;
    }
    t.rows.push_back({ number, std::move(cells) });
}

// ---------------------------------- CSV ----------------------------------

// RFC 4180 records; delimiter taken from the first line (';' if present, else ',')
inline bool read_csv_text(std::string_view text, Table& out, std::string* error = nullptr) {
    text = strip_bom(text);

    const std::string_view firstLine = text.substr(0, text.find('\n'));
    const char D = firstLine.find(';') != std::string_view::npos ? ';' : ',';

    std::vector<std::string> cells;
    std::string field;
    bool inQuotes = false;
    bool fieldStarted = false;
    int record = 1;

    auto end_field = [&]{
        cells.push_back(std::move(field));
        field.clear();
        fieldStarted = false;
    };
    auto end_record = [&]{
        end_field();
        add_table_row(out, record, std::move(cells));
        cells.clear();
        ++record;
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (inQuotes) {
            if (ch == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') { field.push_back('"'); ++i; }
                else inQuotes = false;
            } else {
                field.push_back(ch);
            }
            continue;
        }
        if (ch == '"' && !fieldStarted) { inQuotes = true; fieldStarted = true; continue; }
        if (ch == D) { end_field(); continue; }
        if (ch == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            end_record();
            continue;
        }
        if (ch == '\n') { end_record(); continue; }
        field.push_back(ch);
        fieldStarted = true;
    }
    if (inQuotes) {
        if (error) *error = "unterminated quoted field in record " + std::to_string(record);
        return false;
    }
    if (fieldStarted || !field.empty() || !cells.empty()) end_record();
    return true;
}

inline bool read_csv_file(const std::string& path, Table& out, std::string* error = nullptr) {
    std::ifstream in(std::filesystem::u8path(path), std::ios::in | std::ios::binary);
    if (!in) {
        if (error) *error = "cannot open " + path;
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return read_csv_text(text, out, error);
}

// ---------------------------------- XLSX ----------------------------------

// XFD, the last column a worksheet can address
constexpr int kMaxXlsxColumns = 16384;
constexpr int kColumnNone = -1;
constexpr int kColumnOutOfRange = -2;

// "BC12" -> 54 (0-based column), kColumnNone when the reference has no letters,
// kColumnOutOfRange past XFD
inline int column_of_ref(std::string_view ref) {
    int col = 0;
    size_t i = 0;
    for (; i < ref.size() && ref[i] >= 'A' && ref[i] <= 'Z'; ++i) {
        if (i == 3) return kColumnOutOfRange;
        col = col * 26 + (ref[i] - 'A' + 1);
    }
    if (i == 0) return kColumnNone;
    return col > kMaxXlsxColumns ? kColumnOutOfRange : col - 1;
}

inline std::string inline_string_text(const pugi::xml_node& si) {
    // <si><t>..</t></si> or rich text <si><r><t>..</t></r>...</si>
    if (pugi::xml_node t = child_any(si, "t")) return t.text().as_string();
    std::string s;
    for (pugi::xml_node r = si.first_child(); r; r = r.next_sibling())
        if (isln(r, "r")) s += child_any(r, "t").text().as_string();
    return s;
}

// first worksheet path via workbook.xml and its relationships
inline std::string first_sheet_path(zip_t* archive) {
    std::string workbook_xml, rels_xml;
    if (zip_read_name(archive, "xl/workbook.xml", kMaxXlsxPartBytes, workbook_xml) &&
        zip_read_name(archive, "xl/_rels/workbook.xml.rels", kMaxXlsxPartBytes, rels_xml))
    {
        std::map<std::string, std::string> rel_map;
        pugi::xml_document rels_doc;
        if (rels_doc.load_buffer(rels_xml.data(), rels_xml.size())) {
            for (pugi::xml_node rel = rels_doc.document_element().first_child(); rel; rel = rel.next_sibling()) {
                if (!isln(rel, "Relationship")) continue;
                std::string id = rel.attribute("Id").as_string();
                std::string target = rel.attribute("Target").as_string();
                if (!id.empty() && !target.empty()) rel_map[id] = target;
            }
        }

        pugi::xml_document wb_doc;
        if (wb_doc.load_buffer(workbook_xml.data(), workbook_xml.size())) {
            pugi::xml_node sheets = child_any(wb_doc.document_element(), "sheets");
            for (pugi::xml_node sheet = sheets.first_child(); sheet; sheet = sheet.next_sibling()) {
                if (!isln(sheet, "sheet")) continue;
                std::string rid;
                for (pugi::xml_attribute a = sheet.first_attribute(); a; a = a.next_attribute())
                    if (isln(a, "id")) { rid = a.value(); break; }
                auto it = rel_map.find(rid);
                if (it == rel_map.end()) continue;
                // Target is relative to xl/ unless absolute
                const std::string& target = it->second;
                return target.front() == '/' ? target.substr(1) : "xl/" + target;
            }
        }
    }
    return "xl/worksheets/sheet1.xml";
}

inline bool read_xlsx_file(const std::string& path, Table& out, std::string* error = nullptr) {
    ZipHandle archive = open_zip_readonly(path, error);
    if (!archive) return false;

    // shared strings table (optional part)
    std::vector<std::string> shared_strings;
    std::string shared_xml;
    if (zip_read_name(archive.get(), "xl/sharedStrings.xml", kMaxXlsxPartBytes, shared_xml)) {
        pugi::xml_document sdoc;
        if (sdoc.load_buffer(shared_xml.data(), shared_xml.size())) {
            for (pugi::xml_node si = sdoc.document_element().first_child(); si; si = si.next_sibling())
                if (isln(si, "si")) shared_strings.push_back(inline_string_text(si));
        }
    }

    const std::string sheet_path = first_sheet_path(archive.get());
    std::string sheet_xml;
    if (!zip_read_name(archive.get(), sheet_path, kMaxXlsxPartBytes, sheet_xml, error)) return false;

    pugi::xml_document sheet_doc;
    pugi::xml_parse_result ok = sheet_doc.load_buffer(sheet_xml.data(), sheet_xml.size());
    if (!ok) {
        if (error) *error = std::string("worksheet parse error: ") + ok.description();
        return false;
    }

    pugi::xml_node sheet_data = child_any(sheet_doc.document_element(), "sheetData");
    int implicitRow = 0;
    for (pugi::xml_node row = sheet_data.first_child(); row; row = row.next_sibling()) {
        if (!isln(row, "row")) continue;
        int number = row.attribute("r").as_int(0);
        number = number > 0 ? number : implicitRow + 1;
        implicitRow = number;

        std::vector<std::string> cells;
        int implicitCol = -1;
        for (pugi::xml_node c = row.first_child(); c; c = c.next_sibling()) {
            if (!isln(c, "c")) continue;
            int col = column_of_ref(c.attribute("r").as_string());
            if (col == kColumnNone) col = implicitCol + 1;
            if (col == kColumnOutOfRange || col >= kMaxXlsxColumns) continue;
            implicitCol = col;

            const std::string type = c.attribute("t").as_string();
            std::string value;
            if (type == "s") {
                int idx = child_any(c, "v").text().as_int(-1);
                if (idx >= 0 && idx < (int)shared_strings.size()) value = shared_strings[(size_t)idx];
            } else if (type == "inlineStr") {
                value = inline_string_text(child_any(c, "is"));
            } else {
                value = child_any(c, "v").text().as_string();
            }

            if ((int)cells.size() <= col) cells.resize((size_t)col + 1);
            cells[(size_t)col] = std::move(value);
        }
        add_table_row(out, number, std::move(cells));
    }
    return true;
}

inline std::string lower_extension(const std::string& path) {
    return lower_trim(std::filesystem::u8path(path).extension().u8string());
}

// .csv or .xlsx by extension
inline bool read_table_file(const std::string& path, Table& out, std::string* error = nullptr) {
    const std::string ext = lower_extension(path);
    if (ext == ".csv") return read_csv_file(path, out, error);
    if (ext == ".xlsx") return read_xlsx_file(path, out, error);
    if (error) *error = "unsupported reference file type '" + ext + "'";
    return false;
}

// ---------------------------------- Header check ----------------------------------

// index of every required column; false if one is missing
inline bool map_columns(const std::vector<std::string>& header,
                        std::initializer_list<const char*> required,
                        std::vector<size_t>& idx, std::string* error = nullptr)
{
    idx.clear();
    std::string missing;
    for (const char* want : required) {
        size_t found = header.size();
        for (size_t i = 0; i < header.size(); ++i) {
            if (trim_copy(strip_bom(header[i])) == want) { found = i; break; }
        }
        if (found == header.size()) {
            if (!missing.empty()) missing += ", ";
            missing += want;
        } else {
            idx.push_back(found);
        }
    }
    if (!missing.empty()) {
        if (error) *error = "missing column(s): " + missing;
        return false;
    }
    return true;
}

inline std::string cell_at(const TableRow& r, size_t i) {
    return i < r.cells.size() ? r.cells[i] : std::string();
}

// ---------------------------------- Entry points ----------------------------------

// Loads the table and checks its header; fills r.error on failure.
inline bool load_reference_table(const std::string& path, std::initializer_list<const char*> required,
                                 Table& table, std::vector<size_t>& idx, ImportResult& r)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(std::filesystem::u8path(path), ec)) {
        r.error = ErrorKind::InputUnreadable;
        r.message = "reference file not found: " + path;
        return false;
    }
    std::string err;
    const std::string ext = lower_extension(path);
    if (ext != ".csv" && ext != ".xlsx") {
        r.error = ErrorKind::FormatInvalid;
        r.message = "unsupported reference file type '" + ext + "'";
        return false;
    }
    if (!read_table_file(path, table, &err)) {
        r.error = ErrorKind::InputUnreadable;
        r.message = err;
        return false;
    }
    if (table.header.empty()) {
        r.error = ErrorKind::FormatInvalid;
        r.message = "no header row";
        return false;
    }
    if (!map_columns(table.header, required, idx, &err)) {
        r.error = ErrorKind::FormatInvalid;
        r.message = err;
        return false;
    }
    return true;
}

inline ImportResult import_materials_file(ReferenceStore& store, const std::string& path) {
    ImportResult r;
    Table table;
    std::vector<size_t> idx;
    if (!load_reference_table(path, { kHdrCodigo, kHdrDescripcion, kHdrSociedad }, table, idx, r))
        return r;

    std::vector<MaterialRow> rows;
    rows.reserve(table.rows.size());
    for (const auto& tr : table.rows)
        rows.push_back({ tr.number, cell_at(tr, idx[0]), cell_at(tr, idx[1]), cell_at(tr, idx[2]) });

    try {
        return store.import_materials(rows);
    } catch (const StoreError& e) {
        r.error = ErrorKind::StoreFailure;
        r.message = e.what();
        return r;
    }
}

inline ImportResult import_clients_file(ReferenceStore& store, const std::string& path) {
    ImportResult r;
    Table table;
    std::vector<size_t> idx;
    if (!load_reference_table(path, { kHdrCodPadre, kHdrNombrePadre, kHdrNit }, table, idx, r))
        return r;

    std::vector<ClientRow> rows;
    rows.reserve(table.rows.size());
    for (const auto& tr : table.rows)
        rows.push_back({ tr.number, cell_at(tr, idx[0]), cell_at(tr, idx[1]), cell_at(tr, idx[2]) });

    try {
        return store.import_clients(rows);
    } catch (const StoreError& e) {
        r.error = ErrorKind::StoreFailure;
        r.message = e.what();
        return r;
    }
}

} // namespace reggis
