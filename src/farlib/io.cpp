#include "farlib/io.hpp"

#include <cstring>
#include <utility>

namespace farlib
{

namespace
{

auto read_whole_file(llfio::path_handle const &base,
                     llfio::path_view path,
                     archive_errc tooLarge) -> result<std::vector<std::byte>>
{
    FARLIB_TRY(auto &&file,
               llfio::file(base, path, llfio::file_handle::mode::read,
                           llfio::file_handle::creation::open_existing));
    FARLIB_TRY(auto &&maxExtent, file.maximum_extent());
    if (!std::in_range<std::uint32_t>(maxExtent))
    {
        return tooLarge;
    }

    std::vector<std::byte> content(static_cast<std::size_t>(maxExtent));
    rw_dynblob remaining(content);
    llfio::file_handle::extent_type readPos = 0;
    while (!remaining.empty())
    {
        llfio::file_handle::buffer_type buffers[] = {remaining};
        FARLIB_TRY(auto &&readBuffers, file.read({buffers, readPos}));
        if (readBuffers.empty() || readBuffers[0].size() == 0)
        {
            // the file shrank while we were reading it
            content.resize(content.size() - remaining.size());
            break;
        }
        auto const n = readBuffers[0].size();
        if (readBuffers[0].data() != remaining.data())
        {
            std::memcpy(remaining.data(), readBuffers[0].data(), n);
        }
        remaining = remaining.subspan(n);
        readPos += n;
    }
    return content;
}

} // namespace

auto read_archive_file(llfio::path_handle const &base, llfio::path_view path)
        -> result<std::vector<std::byte>>
{
    return read_whole_file(base, path, archive_errc::archive_too_large);
}

auto write_archive_file(llfio::path_handle const &base,
                        llfio::path_view path,
                        ro_dynblob content) -> result<void>
{
    FARLIB_TRY(auto &&file,
               llfio::file(base, path, llfio::file_handle::mode::write,
                           llfio::file_handle::creation::always_new));

    llfio::file_handle::const_buffer_type writeBuffers[] = {content};
    FARLIB_TRY(file.write({writeBuffers, 0}));

    return oc::success();
}

auto load_file_content(llfio::path_handle const &base,
                       llfio::path_view path,
                       std::string name) -> result<file_content>
{
    FARLIB_TRY(auto &&data,
               read_whole_file(base, path, archive_errc::oversized_content));
    return file_content::from_bytes(std::move(name), std::move(data));
}

} // namespace farlib
