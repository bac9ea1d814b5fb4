#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <farlib/disappointment.hpp>
#include <farlib/span.hpp>

namespace farlib::detail
{

/* archive layout (little endian throughout):
 * [header
 *   8 bytes magic "FAR!byAZ"
 *   4 bytes version
 *   4 bytes manifest offset
 * ]
 * [data region
 *   concatenated file contents in manifest order, no padding
 * ]
 * [manifest
 *   4 bytes file count
 *   [record
 *     4 bytes size
 *     4 bytes size (duplicated)
 *     4 bytes absolute offset
 *     4 bytes name length
 *     name length bytes utf-8 name
 *   ] * file count
 * ]
 */

inline constexpr std::array<std::byte, 8> archive_magic{
        std::byte{'F'}, std::byte{'A'}, std::byte{'R'}, std::byte{'!'},
        std::byte{'b'}, std::byte{'y'}, std::byte{'A'}, std::byte{'Z'}};

inline constexpr std::size_t header_size = 16;
inline constexpr std::size_t version_field_offset = 8;
inline constexpr std::size_t manifest_offset_field_offset = 12;

inline constexpr std::uint32_t default_version = 1;

struct archive_header
{
    std::uint32_t version;
    std::uint32_t manifest_offset;

    friend constexpr auto operator==(archive_header const &,
                                     archive_header const &) noexcept -> bool
            = default;
};

//! Validates the magic number and reads version and manifest offset.
//! The version isn't interpreted.
auto decode_archive_header(ro_dynblob archive) noexcept
        -> result<archive_header>;

void encode_archive_header(rw_blob<header_size> out,
                           archive_header const &header) noexcept;

//! Back-fills the manifest offset of an already encoded header.
void patch_manifest_offset(rw_blob<header_size> out,
                           std::uint32_t manifestOffset) noexcept;

} // namespace farlib::detail
