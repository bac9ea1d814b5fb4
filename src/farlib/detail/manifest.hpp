#pragma once

#include <cstddef>
#include <cstdint>

#include <span>
#include <vector>

#include <farlib/archive_fwd.hpp>
#include <farlib/disappointment.hpp>
#include <farlib/span.hpp>

namespace farlib::detail
{

// size, duplicated size, offset, name length
inline constexpr std::size_t manifest_record_head_size = 16;
inline constexpr std::size_t manifest_count_size = 4;

struct manifest
{
    std::vector<file_entry> entries;
    std::vector<manifest_inconsistency> inconsistencies;
};

//! Parses the manifest which starts at manifestOffset inside of archive.
auto decode_manifest(ro_dynblob archive,
                     std::uint32_t manifestOffset,
                     manifest_policy policy = manifest_policy::tolerant)
        -> result<manifest>;

auto encoded_manifest_size(std::span<file_entry const> entries) noexcept
        -> std::size_t;

//! Writes the count followed by one record per entry to the front of out.
auto encode_manifest(rw_dynblob out, std::span<file_entry const> entries)
        -> result<void>;

} // namespace farlib::detail
