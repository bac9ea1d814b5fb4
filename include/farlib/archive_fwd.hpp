#pragma once

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>

#include <fmt/format.h>

namespace farlib
{

class archive;
class file_content;

//! Metadata of a stored file. The offset is the absolute position of the
//! file's first byte inside the archive buffer.
struct file_entry
{
    std::string name;
    std::uint32_t size;
    std::uint32_t offset;

    friend auto operator==(file_entry const &, file_entry const &) noexcept
            -> bool = default;
};

//! A manifest record whose duplicated size field disagrees with the primary
//! size field. The primary size is the one used for the entry.
struct manifest_inconsistency
{
    std::size_t index;
    std::uint32_t size;
    std::uint32_t duplicate_size;

    friend constexpr auto operator==(manifest_inconsistency const &,
                                     manifest_inconsistency const &) noexcept
            -> bool = default;
};

enum class manifest_policy
{
    //! record size field mismatches as manifest_inconsistency
    tolerant,
    //! fail with archive_errc::manifest_inconsistent
    strict,
};

} // namespace farlib

namespace fmt
{
template <>
struct formatter<farlib::file_entry>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(farlib::file_entry const &entry, FormatContext &ctx) const
    {
        using namespace std::string_view_literals;
        return fmt::format_to(ctx.out(), "{} [{} bytes @ {}]"sv, entry.name,
                              entry.size, entry.offset);
    }
};
} // namespace fmt
