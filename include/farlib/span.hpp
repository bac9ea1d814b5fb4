#pragma once

#include <cstddef>

#include <algorithm>
#include <span>
#include <type_traits>

namespace farlib
{
inline constexpr std::size_t dynamic_extent = std::dynamic_extent;

template <class T,
          class U = T,
          std::size_t X = std::dynamic_extent,
          std::size_t Y = X>
    requires std::is_assignable_v<U &, T &>
constexpr auto copy(std::span<T, X> source, std::span<U, Y> dest)
{
    if constexpr (X == std::dynamic_extent || Y == std::dynamic_extent)
    {
        auto const n = std::min(source.size(), dest.size());
        std::copy_n(source.data(), n, dest.data());
        return dest.subspan(n);
    }
    else
    {
        constexpr auto N = std::min(X, Y);
        std::copy_n(source.data(), N, dest.data());
        return dest.template subspan<N>();
    }
}

template <std::size_t Extent>
using rw_blob = std::span<std::byte, Extent>;
using rw_dynblob = rw_blob<dynamic_extent>;

template <std::size_t Extent>
using ro_blob = std::span<const std::byte, Extent>;
using ro_dynblob = ro_blob<dynamic_extent>;

} // namespace farlib
