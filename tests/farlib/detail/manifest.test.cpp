#include "farlib/detail/manifest.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

using namespace farlib;
using namespace farlib::detail;

namespace farlib_tests
{

namespace
{

struct manifest_writer
{
    std::vector<std::byte> bytes;

    auto u32(std::uint32_t value) -> manifest_writer &
    {
        for (int i = 0; i < 4; ++i)
        {
            bytes.push_back(static_cast<std::byte>(value >> (8 * i)));
        }
        return *this;
    }
    auto text(std::string_view name) -> manifest_writer &
    {
        auto const encoded = bytes_of(name);
        bytes.insert(bytes.end(), encoded.begin(), encoded.end());
        return *this;
    }
    auto record(std::uint32_t size,
                std::uint32_t duplicateSize,
                std::uint32_t offset,
                std::string_view name) -> manifest_writer &
    {
        u32(size).u32(duplicateSize).u32(offset);
        return u32(static_cast<std::uint32_t>(name.size())).text(name);
    }
};

} // namespace

} // namespace farlib_tests

using farlib_tests::manifest_writer;

BOOST_AUTO_TEST_SUITE(manifest_tests)

BOOST_AUTO_TEST_CASE(decode_reads_records_in_order)
{
    manifest_writer w;
    w.text("0123").u32(2).record(4, 4, 0, "a.txt").record(0, 0, 4, "empty");

    auto rx = decode_manifest(w.bytes, 4U);
    TEST_RESULT_REQUIRE(rx);
    auto const &entries = rx.assume_value().entries;
    BOOST_TEST_REQUIRE(entries.size() == 2U);
    BOOST_TEST((entries[0] == file_entry{"a.txt", 4U, 0U}));
    BOOST_TEST((entries[1] == file_entry{"empty", 0U, 4U}));
    BOOST_TEST(rx.assume_value().inconsistencies.empty());
}

BOOST_AUTO_TEST_CASE(encode_emits_the_size_twice)
{
    std::vector<file_entry> const entries{
            {"x", 10U, 16U},
            {"yz", 3U, 26U},
    };
    std::vector<std::byte> out(encoded_manifest_size(entries));
    BOOST_TEST(out.size() == 4U + 17U + 18U);

    TEST_RESULT_REQUIRE(encode_manifest(out, entries));

    manifest_writer expected;
    expected.u32(2).record(10, 10, 16, "x").record(3, 3, 26, "yz");
    BOOST_CHECK_EQUAL_COLLECTIONS(out.begin(), out.end(),
                                  expected.bytes.begin(),
                                  expected.bytes.end());
}

BOOST_AUTO_TEST_CASE(encode_rejects_small_buffers)
{
    std::vector<file_entry> const entries{{"name", 1U, 16U}};
    std::vector<std::byte> out(encoded_manifest_size(entries) - 1U);

    auto rx = encode_manifest(out, entries);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == archive_errc::truncated_manifest);
}

BOOST_AUTO_TEST_CASE(name_length_counts_utf8_bytes)
{
    std::vector<file_entry> const entries{{"r\xC3\xA9sum\xC3\xA9.txt", 0U, 16U}};
    std::vector<std::byte> out(encoded_manifest_size(entries));
    TEST_RESULT_REQUIRE(encode_manifest(out, entries));

    // count(4) size(4) size(4) offset(4) then the name length
    BOOST_TEST(out[16] == std::byte{12});
    BOOST_TEST(out.size() == 4U + 16U + 12U);
}

BOOST_AUTO_TEST_CASE(offset_beyond_buffer_is_truncated)
{
    manifest_writer w;
    w.u32(0);

    auto rx = decode_manifest(w.bytes, 5U);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == archive_errc::truncated_manifest);
}

BOOST_AUTO_TEST_CASE(missing_count_is_truncated)
{
    manifest_writer w;
    w.text("abcd").text("xy");

    auto rx = decode_manifest(w.bytes, 4U);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == archive_errc::truncated_manifest);
}

BOOST_AUTO_TEST_CASE(record_ending_early_is_truncated)
{
    manifest_writer w;
    w.u32(1).u32(5).u32(5);

    auto rx = decode_manifest(w.bytes, 0U);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == archive_errc::truncated_manifest);
}

BOOST_AUTO_TEST_CASE(name_ending_early_is_truncated)
{
    manifest_writer w;
    w.u32(1).u32(5).u32(5).u32(16).u32(10).text("short");

    auto rx = decode_manifest(w.bytes, 0U);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == archive_errc::truncated_manifest);
}

BOOST_AUTO_TEST_CASE(huge_count_fails_without_allocating_for_it)
{
    manifest_writer w;
    w.u32(0xFFFF'FFFFU).record(1, 1, 16, "a");

    auto rx = decode_manifest(w.bytes, 0U);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == archive_errc::truncated_manifest);
}

BOOST_AUTO_TEST_CASE(invalid_names_are_rejected)
{
    manifest_writer w;
    w.u32(1).record(0, 0, 16, "\xC0\xAF");

    auto rx = decode_manifest(w.bytes, 0U);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == archive_errc::invalid_utf8_name);
}

BOOST_AUTO_TEST_CASE(size_mismatch_is_recorded_when_tolerant)
{
    manifest_writer w;
    w.u32(2).record(3, 3, 16, "ok").record(5, 7, 19, "odd");

    auto rx = decode_manifest(w.bytes, 0U, manifest_policy::tolerant);
    TEST_RESULT_REQUIRE(rx);
    auto const &decoded = rx.assume_value();
    BOOST_TEST_REQUIRE(decoded.entries.size() == 2U);
    BOOST_TEST(decoded.entries[1].size == 5U);
    BOOST_TEST_REQUIRE(decoded.inconsistencies.size() == 1U);
    BOOST_TEST((decoded.inconsistencies[0]
                == manifest_inconsistency{
                        .index = 1U, .size = 5U, .duplicate_size = 7U}));
}

BOOST_AUTO_TEST_CASE(size_mismatch_fails_when_strict)
{
    manifest_writer w;
    w.u32(1).record(5, 7, 16, "odd");

    auto rx = decode_manifest(w.bytes, 0U, manifest_policy::strict);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == archive_errc::manifest_inconsistent);
}

BOOST_AUTO_TEST_CASE(regions_beyond_the_cursor_range_are_rejected)
{
    if constexpr (sizeof(std::size_t) > sizeof(int))
    {
        manifest_writer w;
        w.u32(0);

        // only the extent is large, the size check precedes every read
        ro_dynblob const oversized(w.bytes.data(), std::size_t{3} << 30);

        auto rx = decode_manifest(oversized, 0U);
        BOOST_TEST_REQUIRE(rx.has_error());
        BOOST_TEST(rx.assume_error() == archive_errc::archive_too_large);
    }
}

BOOST_AUTO_TEST_SUITE_END()
