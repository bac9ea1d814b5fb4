// Copyright 2018-2019 Henrik Steffen Gaßmann
//
#pragma once

#include <cassert>
#include <cstddef>
#include <cstring>

#include <span>
#include <type_traits>

#include <boost/endian/conversion.hpp>
#include <boost/type_traits/type_identity.hpp>

#include <farlib/span.hpp>

namespace farlib
{
//! Loads a little endian integer (or enum) stored at memory[offset].
template <typename T, std::size_t Extent>
inline auto load_primitive(std::span<const std::byte, Extent> memory,
                           std::size_t offset = 0) noexcept
        -> std::remove_cvref_t<T>
{
    using type = std::remove_cvref_t<T>;
    static_assert(std::is_integral_v<type> || std::is_enum_v<type>);
    using underlying_type =
            typename std::conditional_t<std::is_enum_v<type>,
                                        std::underlying_type<type>,
                                        boost::type_identity<type>>::type;

    assert(offset + sizeof(underlying_type) <= memory.size_bytes());

    using boost::endian::little_to_native;

    underlying_type stored;
    std::memcpy(&stored, memory.data() + offset, sizeof(underlying_type));
    return type{little_to_native(stored)};
}

template <typename T, std::size_t Extent>
inline auto load_primitive(std::span<std::byte, Extent> memory,
                           std::size_t offset = 0) noexcept
{
    return load_primitive<T>(std::span<const std::byte, Extent>(memory),
                             offset);
}

//! Stores value as little endian integer at memory[offset].
template <typename T, std::size_t Extent>
inline void store_primitive(std::span<std::byte, Extent> memory,
                            T value,
                            std::size_t offset = 0) noexcept
{
    using type = std::remove_cvref_t<T>;
    static_assert(std::is_integral_v<type> || std::is_enum_v<type>);
    using underlying_type =
            typename std::conditional_t<std::is_enum_v<type>,
                                        std::underlying_type<type>,
                                        boost::type_identity<type>>::type;

    assert(offset + sizeof(underlying_type) <= memory.size_bytes());

    using boost::endian::native_to_little;

    auto stored = native_to_little(static_cast<underlying_type>(value));
    std::memcpy(memory.data() + offset, &stored, sizeof(underlying_type));
}
} // namespace farlib

namespace farlib::utils
{

template <typename T, std::size_t Extent = dynamic_extent>
class binary_codec final
{
public:
    using element_type = T;

    binary_codec() = delete;
    explicit binary_codec(std::span<T, Extent> buffer) noexcept
        : mBuffer(buffer)
    {
    }

    template <typename U>
    auto read(std::size_t offset) const noexcept -> std::remove_cvref_t<U>
    {
        return load_primitive<U>(mBuffer, offset);
    }

    template <typename U>
        requires(!std::is_const_v<T>)
    void write(U value, std::size_t offset) noexcept
    {
        store_primitive(mBuffer, value, offset);
    }

private:
    std::span<T, Extent> mBuffer;
};

template <std::size_t Extent>
binary_codec(std::span<std::byte, Extent>) -> binary_codec<std::byte, Extent>;
template <std::size_t Extent>
binary_codec(std::span<std::byte const, Extent>)
        -> binary_codec<std::byte const, Extent>;

} // namespace farlib::utils
