#include "farlib/detail/archive_header.hpp"

#include <array>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

using namespace farlib;
using namespace farlib::detail;

BOOST_AUTO_TEST_SUITE(archive_header_tests)

BOOST_AUTO_TEST_CASE(encode_writes_magic_and_little_endian_fields)
{
    std::array<std::byte, header_size> buffer{};
    encode_archive_header(buffer, archive_header{.version = 0x0403'0201U,
                                                 .manifest_offset = 0x33U});

    auto const expected = farlib_tests::bytes_of(
            std::string_view("FAR!byAZ\x01\x02\x03\x04\x33\0\0\0", 16));
    BOOST_CHECK_EQUAL_COLLECTIONS(buffer.begin(), buffer.end(),
                                  expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(decode_reads_encoded_header)
{
    std::array<std::byte, header_size + 4> buffer{};
    archive_header const header{.version = 7U, .manifest_offset = 20U};
    encode_archive_header(std::span(buffer).first<header_size>(), header);

    auto rx = decode_archive_header(buffer);
    TEST_RESULT_REQUIRE(rx);
    BOOST_TEST((rx.assume_value() == header));
}

BOOST_AUTO_TEST_CASE(patch_replaces_the_manifest_offset_only)
{
    std::array<std::byte, header_size> buffer{};
    encode_archive_header(buffer,
                          archive_header{.version = 1U, .manifest_offset = 0U});
    patch_manifest_offset(buffer, 51U);

    auto rx = decode_archive_header(buffer);
    TEST_RESULT_REQUIRE(rx);
    BOOST_TEST(rx.assume_value().version == 1U);
    BOOST_TEST(rx.assume_value().manifest_offset == 51U);
}

BOOST_AUTO_TEST_CASE(foreign_prefix_is_rejected_before_length_checks)
{
    auto const buffer = farlib_tests::bytes_of("PK\x03\x04xxxx");

    auto rx = decode_archive_header(buffer);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == archive_errc::invalid_magic);
}

BOOST_AUTO_TEST_CASE(short_buffers_are_truncated)
{
    auto const tooShortForMagic = farlib_tests::bytes_of("FAR!");
    auto rx = decode_archive_header(tooShortForMagic);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == archive_errc::truncated_input);

    auto const magicOnly = farlib_tests::bytes_of("FAR!byAZ\x01");
    rx = decode_archive_header(magicOnly);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == archive_errc::truncated_input);
}

BOOST_AUTO_TEST_CASE(version_is_passed_through)
{
    std::array<std::byte, header_size> buffer{};
    encode_archive_header(buffer, archive_header{.version = 0xFFFF'FFFFU,
                                                 .manifest_offset = 16U});

    auto rx = decode_archive_header(buffer);
    TEST_RESULT_REQUIRE(rx);
    BOOST_TEST(rx.assume_value().version == 0xFFFF'FFFFU);
}

BOOST_AUTO_TEST_SUITE_END()
