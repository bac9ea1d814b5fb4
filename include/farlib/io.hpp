#pragma once

#include <cstddef>

#include <string>
#include <vector>

#include <farlib/archive.hpp>
#include <farlib/disappointment.hpp>
#include <farlib/llfio.hpp>
#include <farlib/span.hpp>

namespace farlib
{

//! Reads the whole file at base/path into memory. Fails with
//! archive_errc::archive_too_large if the file can't be addressed with 32 bit
//! offsets.
auto read_archive_file(llfio::path_handle const &base, llfio::path_view path)
        -> result<std::vector<std::byte>>;

//! Creates or truncates the file at base/path and writes content to it.
auto write_archive_file(llfio::path_handle const &base,
                        llfio::path_view path,
                        ro_dynblob content) -> result<void>;

//! Reads a member file from disk, the archive entry is named name.
auto load_file_content(llfio::path_handle const &base,
                       llfio::path_view path,
                       std::string name) -> result<file_content>;

} // namespace farlib
