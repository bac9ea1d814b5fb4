#include "farlib/archive.hpp"

#include <algorithm>
#include <utility>

#include "farlib/detail/archive_header.hpp"
#include "farlib/detail/manifest.hpp"

namespace farlib
{

#pragma region file_content

file_content::file_content(std::string name,
                           std::uint32_t size,
                           std::vector<std::byte> data) noexcept
    : mName(std::move(name))
    , mSize(size)
    , mData(std::move(data))
{
}

auto file_content::from_bytes(std::string name, std::vector<std::byte> data)
        -> result<file_content>
{
    if (!std::in_range<std::uint32_t>(data.size()))
    {
        return archive_errc::oversized_content;
    }
    auto const size = static_cast<std::uint32_t>(data.size());
    return file_content(std::move(name), size, std::move(data));
}

auto file_content::make(std::string name,
                        std::uint32_t size,
                        std::vector<std::byte> data) -> result<file_content>
{
    if (data.size() != size)
    {
        return archive_errc::content_size_mismatch;
    }
    return file_content(std::move(name), size, std::move(data));
}

auto file_content::from_archive(file_entry const &entry, ro_dynblob source)
        -> result<file_content>
{
    // 64 bit arithmetic, offset + size must not wrap
    if (std::uint64_t{entry.offset} + entry.size > source.size())
    {
        return archive_errc::offset_out_of_range;
    }
    auto const slice = source.subspan(entry.offset, entry.size);
    return file_content(entry.name, entry.size,
                        std::vector<std::byte>(slice.begin(), slice.end()));
}

#pragma endregion

#pragma region archive

archive::archive(std::uint32_t version,
                 std::vector<file_entry> entries,
                 std::vector<file_content> contents,
                 std::vector<manifest_inconsistency> inconsistencies) noexcept
    : mVersion(version)
    , mEntries(std::move(entries))
    , mContents(std::move(contents))
    , mInconsistencies(std::move(inconsistencies))
{
}

auto archive::build(std::vector<file_content> files) -> archive
{
    std::vector<file_entry> entries;
    entries.reserve(files.size());

    // offsets which exceed the u32 range wrap here, serialize() rejects
    // such an archive with archive_too_large
    auto offset = static_cast<std::uint32_t>(detail::header_size);
    for (auto const &file : files)
    {
        entries.push_back(file_entry{
                .name = file.name(),
                .size = file.size(),
                .offset = offset,
        });
        offset += file.size();
    }

    return archive(detail::default_version, std::move(entries),
                   std::move(files), {});
}

auto archive::decode(ro_dynblob buffer, manifest_policy policy)
        -> result<archive>
{
    FARLIB_TRY(auto &&header, detail::decode_archive_header(buffer));
    FARLIB_TRY(auto &&manifest,
               detail::decode_manifest(buffer, header.manifest_offset,
                                       policy));

    return archive(header.version, std::move(manifest.entries), {},
                   std::move(manifest.inconsistencies));
}

auto archive::hydrate(ro_dynblob buffer) const -> result<archive>
{
    std::vector<file_content> contents;
    contents.reserve(mEntries.size());

    for (auto const &entry : mEntries)
    {
        FARLIB_TRY(auto &&content, file_content::from_archive(entry, buffer));
        contents.push_back(std::move(content));
    }

    return archive(mVersion, mEntries, std::move(contents), mInconsistencies);
}

auto archive::extract(std::size_t index, ro_dynblob buffer) const
        -> result<file_content>
{
    if (index >= mEntries.size())
    {
        return archive_errc::no_such_entry;
    }
    return file_content::from_archive(mEntries[index], buffer);
}

auto archive::serialize() const -> result<std::vector<std::byte>>
{
    if (!is_hydrated())
    {
        return archive_errc::not_hydrated;
    }

    std::uint64_t dataSize = 0;
    for (auto const &content : mContents)
    {
        dataSize += content.size();
    }
    if (!std::in_range<std::uint32_t>(detail::header_size + dataSize))
    {
        return archive_errc::archive_too_large;
    }
    auto const manifestOffset
            = static_cast<std::uint32_t>(detail::header_size + dataSize);

    // the in-memory offsets aren't trusted, they are recomputed from the
    // content layout
    std::vector<file_entry> layout;
    layout.reserve(mContents.size());
    auto offset = static_cast<std::uint32_t>(detail::header_size);
    for (auto const &content : mContents)
    {
        layout.push_back(file_entry{
                .name = content.name(),
                .size = content.size(),
                .offset = offset,
        });
        offset += content.size();
    }

    auto const manifestSize = detail::encoded_manifest_size(layout);
    std::vector<std::byte> image(detail::header_size + dataSize
                                 + manifestSize);
    rw_dynblob out(image);

    detail::encode_archive_header(
            out.first<detail::header_size>(),
            detail::archive_header{.version = mVersion, .manifest_offset = 0});

    auto dataRegion = out.subspan(detail::header_size);
    for (auto const &content : mContents)
    {
        dataRegion = copy(content.data(), dataRegion);
    }

    FARLIB_TRY(detail::encode_manifest(out.subspan(manifestOffset), layout));

    detail::patch_manifest_offset(out.first<detail::header_size>(),
                                  manifestOffset);
    return image;
}

auto archive::find(std::string_view name) const noexcept
        -> std::optional<std::size_t>
{
    auto const it = std::ranges::find(mEntries, name, &file_entry::name);
    if (it == mEntries.end())
    {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - mEntries.begin());
}

auto archive::data_region_size() const noexcept -> std::uint64_t
{
    std::uint64_t size = 0;
    for (auto const &entry : mEntries)
    {
        size += entry.size;
    }
    return size;
}

#pragma endregion

} // namespace farlib
