/**
 * reggis export - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include <zip.h>
#include <cstdint>
#include <memory>
#include <string>

namespace reggis {

struct ZipDiscard {
    void operator()(zip_t* z) const noexcept { if (z) zip_discard(z); }
};
using ZipHandle = std::unique_ptr<zip_t, ZipDiscard>;

struct ZipFileClose {
    void operator()(zip_file_t* f) const noexcept { if (f) zip_fclose(f); }
};

inline ZipHandle open_zip_readonly(const std::string& path, std::string* error = nullptr) {
    int zip_error = 0;
    zip_t* archive = zip_open(path.c_str(), ZIP_RDONLY, &zip_error);
    if (!archive) {
        if (error) {
            zip_error_t ze;
            zip_error_init_with_code(&ze, zip_error);
            *error = std::string("cannot open archive: ") + zip_error_strerror(&ze);
            zip_error_fini(&ze);
        }
        return ZipHandle();
    }
    return ZipHandle(archive);
}

// Read one entry by index into a string (with size validation)
inline bool zip_read_index(zip_t* archive, zip_uint64_t index, std::uint64_t max_bytes,
                           std::string& out, std::string* error = nullptr)
{
    zip_stat_t entry_stat;
    zip_stat_init(&entry_stat);
    if (zip_stat_index(archive, index, 0, &entry_stat) != 0) {
        if (error) *error = std::string("cannot stat entry: ") + zip_strerror(archive);
        return false;
    }
    if (!(entry_stat.valid & ZIP_STAT_SIZE)) {
        if (error) *error = "entry size unknown";
        return false;
    }
    if (max_bytes && entry_stat.size > max_bytes) {
        if (error) *error = "entry exceeds " + std::to_string(max_bytes) + " bytes";
        return false;
    }

    std::unique_ptr<zip_file_t, ZipFileClose> handle(zip_fopen_index(archive, index, 0));
    if (!handle) {
        if (error) *error = std::string("cannot open entry: ") + zip_strerror(archive);
        return false;
    }

    out.assign(static_cast<size_t>(entry_stat.size), '\0');
    zip_int64_t bytes_read = entry_stat.size ? zip_fread(handle.get(), &out[0], entry_stat.size) : 0;
    if (bytes_read < 0 || (zip_uint64_t)bytes_read != entry_stat.size) {
        if (error) *error = std::string("cannot read entry: ") + zip_file_strerror(handle.get());
        out.clear();
        return false;
    }
    return true;
}

inline bool zip_read_name(zip_t* archive, const std::string& name, std::uint64_t max_bytes,
                          std::string& out, std::string* error = nullptr)
{
    zip_int64_t idx = zip_name_locate(archive, name.c_str(), 0);
    if (idx < 0) {
        if (error) *error = "entry not found: " + name;
        return false;
    }
    return zip_read_index(archive, (zip_uint64_t)idx, max_bytes, out, error);
}

} // namespace reggis
