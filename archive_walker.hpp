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
#include "text_norm.hpp"
#include "zip_util.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace reggis {

struct WalkOptions {
    std::uint64_t max_entry_bytes = 64ull * 1024 * 1024; // per XML document; 0 = unlimited
};

// One top-level input file
struct SourceUnit {
    std::string path;      // full path (UTF-8)
    std::string name;      // file name, also the sort key
    bool isArchive = false;
    int ordinal{-1};       // position in the sorted listing
};

struct WalkIssue {
    std::string path;      // "archive.zip" or "archive.zip/entry.xml"
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

using DocumentFn = std::function<void(const std::string& source, const std::string& xml)>;
using IssueFn = std::function<void(WalkIssue issue)>;

inline bool has_ext_ci(const std::string& name, const char* ext) {
    const std::string e(ext);
    if (name.size() < e.size()) return false;
    return lower_trim(name.substr(name.size() - e.size())) == e;
}

// Top-level regular .xml/.zip files, sorted by file name (byte order).
inline bool list_units(const std::string& root, std::vector<SourceUnit>& out, std::string* error = nullptr) {
    namespace fs = std::filesystem;
    out.clear();

    std::error_code ec;
    const fs::path dir = fs::u8path(root);
    if (!fs::is_directory(dir, ec)) {
        if (error) *error = "input folder not found: " + root;
        return false;
    }

    fs::directory_iterator it(dir, ec), end;
    if (ec) {
        if (error) *error = "cannot list " + root + ": " + ec.message();
        return false;
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            if (error) *error = "cannot list " + root + ": " + ec.message();
            return false;
        }
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;

        SourceUnit u;
        u.name = it->path().filename().u8string();
        u.path = it->path().u8string();
        if (has_ext_ci(u.name, ".zip")) u.isArchive = true;
        else if (!has_ext_ci(u.name, ".xml")) continue;
        out.push_back(std::move(u));
    }
    if (ec) {
        if (error) *error = "cannot list " + root + ": " + ec.message();
        return false;
    }

    std::sort(out.begin(), out.end(), [](const SourceUnit& a, const SourceUnit& b){ return a.name < b.name; });
    for (size_t i = 0; i < out.size(); ++i) out[i].ordinal = (int)i;
    return true;
}

inline bool read_loose_file(const std::string& path, std::uint64_t max_bytes, std::string& out, std::string* error) {
    std::ifstream in(std::filesystem::u8path(path), std::ios::in | std::ios::binary);
    if (!in) {
        if (error) *error = "cannot open file";
        return false;
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(std::filesystem::u8path(path), ec);
    if (!ec && max_bytes && size > max_bytes) {
        if (error) *error = "file exceeds " + std::to_string(max_bytes) + " bytes";
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        if (error) *error = "read error";
        return false;
    }
    return true;
}

// Feeds every XML document of one unit to onDoc, in entry order.
// Archives are one level deep: nested archives and non-XML entries are ignored.
inline void walk_unit(const SourceUnit& unit, const WalkOptions& opt, const DocumentFn& onDoc, const IssueFn& onIssue) {
    std::string err;
    if (!unit.isArchive) {
        std::string xml;
        if (!read_loose_file(unit.path, opt.max_entry_bytes, xml, &err)) {
            onIssue({ unit.name, ErrorKind::EntryUnreadable, err });
            return;
        }
        onDoc(unit.name, xml);
        return;
    }

    ZipHandle archive = open_zip_readonly(unit.path, &err);
    if (!archive) {
        onIssue({ unit.name, ErrorKind::ArchiveUnreadable, err });
        return;
    }

    const zip_int64_t total_entries = zip_get_num_entries(archive.get(), 0);
    for (zip_int64_t idx = 0; idx < total_entries; ++idx) {
        const char* raw_name = zip_get_name(archive.get(), (zip_uint64_t)idx, 0);
        if (!raw_name) {
            onIssue({ unit.name + "/#" + std::to_string(idx), ErrorKind::EntryUnreadable,
                      zip_strerror(archive.get()) });
            continue;
        }
        const std::string entry_name(raw_name);
        if (entry_name.empty() || entry_name.back() == '/') continue;  // directory
        if (!has_ext_ci(entry_name, ".xml")) continue;

        const std::string source = unit.name + "/" + entry_name;
        std::string xml;
        err.clear();
        if (!zip_read_index(archive.get(), (zip_uint64_t)idx, opt.max_entry_bytes, xml, &err)) {
            onIssue({ source, ErrorKind::EntryUnreadable, err });
            continue;
        }
        onDoc(source, xml);
    }
}

} // namespace reggis
