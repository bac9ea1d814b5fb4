#include "farlib/detail/archive_header.hpp"

#include <algorithm>

#include <farlib/utils/binary_codec.hpp>

namespace farlib::detail
{

auto decode_archive_header(ro_dynblob archive) noexcept
        -> result<archive_header>
{
    // the magic number is checked first, so that any input which is long
    // enough to carry it is rejected as foreign rather than as truncated
    if (archive.size() < archive_magic.size())
    {
        return archive_errc::truncated_input;
    }
    if (!std::ranges::equal(archive.first<archive_magic.size()>(),
                            std::span(archive_magic)))
    {
        return archive_errc::invalid_magic;
    }
    if (archive.size() < header_size)
    {
        return archive_errc::truncated_input;
    }

    utils::binary_codec const codec(archive.first<header_size>());

    return archive_header{
            .version = codec.read<std::uint32_t>(version_field_offset),
            .manifest_offset
            = codec.read<std::uint32_t>(manifest_offset_field_offset),
    };
}

void encode_archive_header(rw_blob<header_size> out,
                           archive_header const &header) noexcept
{
    copy(std::span(archive_magic), out);

    utils::binary_codec codec(out);
    codec.write(header.version, version_field_offset);
    codec.write(header.manifest_offset, manifest_offset_field_offset);
}

void patch_manifest_offset(rw_blob<header_size> out,
                           std::uint32_t manifestOffset) noexcept
{
    store_primitive(out, manifestOffset, manifest_offset_field_offset);
}

} // namespace farlib::detail
