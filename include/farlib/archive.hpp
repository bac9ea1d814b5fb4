#pragma once

#include <cstddef>
#include <cstdint>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <farlib/archive_fwd.hpp>
#include <farlib/disappointment.hpp>
#include <farlib/span.hpp>

namespace farlib
{

//! A named, materialized file. data.size() == size holds for every instance,
//! the factories are the only way to create one.
class file_content
{
public:
    //! takes the size from the data
    static auto from_bytes(std::string name, std::vector<std::byte> data)
            -> result<file_content>;
    //! fails with content_size_mismatch unless data.size() == size
    static auto make(std::string name,
                     std::uint32_t size,
                     std::vector<std::byte> data) -> result<file_content>;
    //! copies source[entry.offset, entry.offset + entry.size)
    static auto from_archive(file_entry const &entry, ro_dynblob source)
            -> result<file_content>;

    auto name() const noexcept -> std::string const &
    {
        return mName;
    }
    auto size() const noexcept -> std::uint32_t
    {
        return mSize;
    }
    auto data() const noexcept -> std::span<std::byte const>
    {
        return mData;
    }

    friend auto operator==(file_content const &,
                           file_content const &) noexcept -> bool = default;

private:
    file_content(std::string name,
                 std::uint32_t size,
                 std::vector<std::byte> data) noexcept;

    std::string mName;
    std::uint32_t mSize;
    std::vector<std::byte> mData;
};

/**
 * In-memory representation of a FAR container.
 *
 * An archive either originates from a set of file contents (build) in which
 * case the contents are available right away, or from an archive buffer
 * (decode) in which case only the entries are known until hydrate() copies
 * the file bytes out of the buffer. Instances are never modified, hydrate()
 * yields a new archive.
 */
class archive
{
public:
    //! Creates a version 1 archive with entries describing the given files.
    //! The entry offsets are the absolute offsets the files will occupy
    //! after serialization.
    static auto build(std::vector<file_content> files) -> archive;

    //! Validates the header and parses the manifest. The returned archive
    //! doesn't hold any file contents.
    static auto decode(ro_dynblob buffer,
                       manifest_policy policy = manifest_policy::tolerant)
            -> result<archive>;

    //! Copies the bytes of every entry out of buffer which needs to be the
    //! buffer this archive was decoded from.
    auto hydrate(ro_dynblob buffer) const -> result<archive>;

    //! Copies the bytes of a single entry out of buffer.
    auto extract(std::size_t index, ro_dynblob buffer) const
            -> result<file_content>;

    //! Produces the byte exact archive image. Requires the contents to be
    //! loaded unless the archive has no entries.
    auto serialize() const -> result<std::vector<std::byte>>;

    //! Index of the first entry with the given name.
    auto find(std::string_view name) const noexcept
            -> std::optional<std::size_t>;

    auto version() const noexcept -> std::uint32_t
    {
        return mVersion;
    }
    auto file_count() const noexcept -> std::size_t
    {
        return mEntries.size();
    }
    auto entries() const noexcept -> std::span<file_entry const>
    {
        return mEntries;
    }
    auto contents() const noexcept -> std::span<file_content const>
    {
        return mContents;
    }
    auto inconsistencies() const noexcept
            -> std::span<manifest_inconsistency const>
    {
        return mInconsistencies;
    }
    auto is_hydrated() const noexcept -> bool
    {
        return !mContents.empty() || mEntries.empty();
    }
    //! sum of all entry sizes
    auto data_region_size() const noexcept -> std::uint64_t;

private:
    archive(std::uint32_t version,
            std::vector<file_entry> entries,
            std::vector<file_content> contents,
            std::vector<manifest_inconsistency> inconsistencies) noexcept;

    std::uint32_t mVersion;
    std::vector<file_entry> mEntries;
    std::vector<file_content> mContents;
    std::vector<manifest_inconsistency> mInconsistencies;
};

} // namespace farlib
