#include "farlib/detail/manifest.hpp"

#include <algorithm>
#include <cstring>
#include <string_view>
#include <utility>

#include <dplx/dp/legacy/memory_buffer.hpp>

#include <farlib/utils/binary_codec.hpp>

#include "../utf.hpp"

namespace farlib::detail
{

namespace
{

auto remaining_bytes(dplx::dp::memory_view const &stream) noexcept
        -> std::size_t
{
    return static_cast<std::size_t>(stream.remaining_size());
}

auto consume_primitive(dplx::dp::memory_view &stream) noexcept
        -> std::uint32_t
{
    ro_blob<sizeof(std::uint32_t)> const field(
            stream.consume(sizeof(std::uint32_t)), sizeof(std::uint32_t));
    return load_primitive<std::uint32_t>(field);
}

} // namespace

auto decode_manifest(ro_dynblob archive,
                     std::uint32_t manifestOffset,
                     manifest_policy policy) -> result<manifest>
{
    if (manifestOffset > archive.size())
    {
        return archive_errc::truncated_manifest;
    }
    // the memory view tracks its size as int
    if (!std::in_range<int>(archive.size() - manifestOffset))
    {
        return archive_errc::archive_too_large;
    }

    dplx::dp::memory_view stream(archive.subspan(manifestOffset));

    if (remaining_bytes(stream) < manifest_count_size)
    {
        return archive_errc::truncated_manifest;
    }
    auto const fileCount = consume_primitive(stream);

    manifest decoded;
    // each record occupies at least its fixed size head, therefore a count
    // beyond that is bogus and must not drive the allocation
    decoded.entries.reserve(std::min<std::size_t>(
            fileCount, remaining_bytes(stream) / manifest_record_head_size));

    for (std::size_t i = 0; i < fileCount; ++i)
    {
        if (remaining_bytes(stream) < manifest_record_head_size)
        {
            return archive_errc::truncated_manifest;
        }
        auto const size = consume_primitive(stream);
        auto const duplicateSize = consume_primitive(stream);
        auto const offset = consume_primitive(stream);
        auto const nameLength = consume_primitive(stream);

        if (remaining_bytes(stream) < nameLength)
        {
            return archive_errc::truncated_manifest;
        }
        auto const *const nameBytes = stream.consume(static_cast<int>(nameLength));
        std::string_view const name(reinterpret_cast<char const *>(nameBytes),
                                    nameLength);

        if (!utf::is_valid(name))
        {
            return archive_errc::invalid_utf8_name;
        }

        if (size != duplicateSize)
        {
            if (policy == manifest_policy::strict)
            {
                return archive_errc::manifest_inconsistent;
            }
            decoded.inconsistencies.push_back(manifest_inconsistency{
                    .index = i,
                    .size = size,
                    .duplicate_size = duplicateSize,
            });
        }

        decoded.entries.push_back(file_entry{
                .name = std::string(name),
                .size = size,
                .offset = offset,
        });
    }

    return decoded;
}

auto encoded_manifest_size(std::span<file_entry const> entries) noexcept
        -> std::size_t
{
    std::size_t size = manifest_count_size;
    for (auto const &entry : entries)
    {
        size += manifest_record_head_size + entry.name.size();
    }
    return size;
}

auto encode_manifest(rw_dynblob out, std::span<file_entry const> entries)
        -> result<void>
{
    if (!std::in_range<std::uint32_t>(entries.size()))
    {
        return archive_errc::oversized_content;
    }
    auto const manifestSize = encoded_manifest_size(entries);
    if (out.size() < manifestSize)
    {
        return archive_errc::truncated_manifest;
    }
    if (!std::in_range<int>(manifestSize))
    {
        return archive_errc::archive_too_large;
    }

    dplx::dp::memory_buffer stream(out.first(manifestSize));

    auto emit = [&stream](std::uint32_t value) {
        rw_blob<sizeof(std::uint32_t)> field(
                stream.consume(sizeof(std::uint32_t)), sizeof(std::uint32_t));
        store_primitive(field, value);
    };

    emit(static_cast<std::uint32_t>(entries.size()));
    for (auto const &entry : entries)
    {
        if (!std::in_range<std::uint32_t>(entry.name.size()))
        {
            return archive_errc::oversized_content;
        }
        auto const nameLength = static_cast<std::uint32_t>(entry.name.size());

        // the size is stored twice, archives in the wild expect that
        emit(entry.size);
        emit(entry.size);
        emit(entry.offset);
        emit(nameLength);

        if (nameLength > 0)
        {
            std::memcpy(stream.consume(static_cast<int>(nameLength)),
                        entry.name.data(), nameLength);
        }
    }

    return oc::success();
}

} // namespace farlib::detail
