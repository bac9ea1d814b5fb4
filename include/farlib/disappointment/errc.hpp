#pragma once

#include <algorithm>
#include <string_view>

#include <boost/predef/compiler.h>

#include <status-code/error.hpp>
#include <status-code/system_code.hpp>

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnon-virtual-dtor"
#endif

namespace farlib
{

namespace system_error = SYSTEM_ERROR2_NAMESPACE;

enum class archive_errc : int
{
    success = 0,
    invalid_magic = 1,
    truncated_input,
    truncated_manifest,
    invalid_utf8_name,
    offset_out_of_range,
    manifest_inconsistent,
    not_hydrated,
    content_size_mismatch,
    oversized_content,
    archive_too_large,
    no_such_entry,
};

class archive_domain_type;
using archive_code = system_error::status_code<archive_domain_type>;

class archive_domain_type : public system_error::status_code_domain
{
    using base = system_error::status_code_domain;
    template <class DomainType>
    friend class system_error::status_code;

public:
    static constexpr std::string_view uuid
            = "3B6E0A52-8C1D-4E7F-A2D9-5F4C1E9B07A6";

    constexpr ~archive_domain_type() noexcept = default;
    constexpr archive_domain_type() noexcept
        : base(uuid.data(), base::_uuid_size<uuid.size()>{})
    {
    }
    constexpr archive_domain_type(archive_domain_type const &) noexcept
            = default;
    constexpr auto operator=(archive_domain_type const &) noexcept
            -> archive_domain_type & = default;

    using value_type = archive_errc;
    using base::string_ref;

    [[nodiscard]] constexpr auto name() const noexcept -> string_ref override
    {
        return string_ref("farlib-domain");
    }
    [[nodiscard]] constexpr auto payload_info() const noexcept
            -> payload_info_t override
    {
        return {sizeof(value_type),
                sizeof(value_type) + sizeof(archive_domain_type *),
                std::max(alignof(value_type), alignof(archive_domain_type *))};
    }

    static constexpr auto get() noexcept -> archive_domain_type const &;

protected:
    [[nodiscard]] constexpr auto
    _do_failure(system_error::status_code<void> const &code) const noexcept
            -> bool override
    {
        return static_cast<archive_code const &>(code).value()
               != archive_errc::success;
    }

    [[nodiscard]] constexpr auto
    map_to_generic(value_type const value) const noexcept -> system_error::errc
    {
        using enum archive_errc;
        using sys_errc = system_error::errc;
        switch (value)
        {
        case success:
            return sys_errc::success;

        case invalid_magic:
        case truncated_input:
        case truncated_manifest:
        case invalid_utf8_name:
        case offset_out_of_range:
        case manifest_inconsistent:
            return sys_errc::bad_message;

        case not_hydrated:
        case content_size_mismatch:
            return sys_errc::invalid_argument;

        case oversized_content:
        case archive_too_large:
            return sys_errc::file_too_large;

        case no_such_entry:
            return sys_errc::no_such_file_or_directory;

        default:
            return sys_errc::unknown;
        }
    }

    [[nodiscard]] constexpr auto
    map_to_message(value_type const value) const noexcept -> std::string_view
    {
        using enum archive_errc;
        using namespace std::string_view_literals;

        switch (value)
        {
        case success:
            return "success"sv;

        case invalid_magic:
            return "the magic number at the beginning of the archive didn't match"sv;

        case truncated_input:
            return "the input ended before the archive header could be read"sv;

        case truncated_manifest:
            return "the input ended before a manifest field or record could be read"sv;

        case invalid_utf8_name:
            return "a manifest entry name is not valid utf-8"sv;

        case offset_out_of_range:
            return "an entry's byte range lies outside of the archive buffer"sv;

        case manifest_inconsistent:
            return "the duplicated size field of a manifest record disagrees with its primary size"sv;

        case not_hydrated:
            return "the archive has entries but their contents haven't been loaded"sv;

        case content_size_mismatch:
            return "the declared file size differs from the number of data bytes"sv;

        case oversized_content:
            return "a file or entry name is too large for a 32 bit length field"sv;

        case archive_too_large:
            return "the archive exceeds the supported size range"sv;

        case no_such_entry:
            return "no entry exists at the given index"sv;

        default:
            return "unknown farlib archive error code"sv;
        }
    }

    [[nodiscard]] constexpr auto
    _do_equivalent(system_error::status_code<void> const &lhs,
                   system_error::status_code<void> const &rhs) const noexcept
            -> bool override
    {
        auto const &alhs = static_cast<archive_code const &>(lhs);
        if (rhs.domain() == *this)
        {
            return alhs.value()
                   == static_cast<archive_code const &>(rhs).value();
        }
        if (rhs.domain() == system_error::generic_code_domain)
        {
            system_error::errc sysErrc
                    = static_cast<system_error::generic_code const &>(rhs)
                              .value();

            return system_error::errc::unknown != sysErrc
                   && map_to_generic(alhs.value()) == sysErrc;
        }
        return false;
    }
    [[nodiscard]] constexpr auto
    _generic_code(system_error::status_code<void> const &code) const noexcept
            -> system_error::generic_code override
    {
        return map_to_generic(static_cast<archive_code const &>(code).value());
    }

    [[nodiscard]] constexpr auto
    _do_message(system_error::status_code<void> const &code) const noexcept
            -> string_ref override
    {
        auto const archiveCode = static_cast<archive_code const &>(code);
        auto const message = map_to_message(archiveCode.value());
        return string_ref(message.data(), message.size());
    }

    SYSTEM_ERROR2_NORETURN void _do_throw_exception(
            system_error::status_code<void> const &code) const override
    {
        throw system_error::status_error<archive_domain_type>(
                static_cast<archive_code const &>(code).clone());
    }
};
inline constexpr archive_domain_type archive_domain{};

constexpr auto archive_domain_type::get() noexcept
        -> archive_domain_type const &
{
    return archive_domain;
}

constexpr auto make_status_code(archive_errc c) noexcept -> archive_code
{
    return archive_code(system_error::in_place, c);
}

} // namespace farlib

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic pop
#endif
