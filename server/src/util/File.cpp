#include "File.hpp"

#include "util/asio.hpp"

#include <stdexcept>

#ifdef BOOST_ASIO_HAS_IO_URING
#include <boost/asio/random_access_file.hpp>
#include <boost/asio/read_at.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/write_at.hpp>
#else // BOOST_ASIO_HAS_IO_URING
#include <fstream>
#endif // BOOST_ASIO_HAS_IO_URING

struct Util::File::Handle final
{
#ifdef BOOST_ASIO_HAS_IO_URING
    Handle(IOContext &ioc, const std::filesystem::path &path, Mode mode) :
        file(ioc, path.string(),
             mode == Mode::read ? boost::asio::random_access_file::read_only :
                                  boost::asio::random_access_file::write_only |
                                      boost::asio::random_access_file::create |
                                      boost::asio::random_access_file::truncate)
    {
    }

    boost::asio::random_access_file file;
#else // BOOST_ASIO_HAS_IO_URING
    Handle(IOContext &, const std::filesystem::path &path, Mode mode)
    {
        file.exceptions(std::ios::badbit | std::ios::failbit);
        file.open(path, std::ios::binary | (mode == Mode::read ? std::ios::in : std::ios::out | std::ios::trunc));
    }

    std::fstream file;
#endif // BOOST_ASIO_HAS_IO_URING
};

Util::File::~File() = default;

Util::File::File() = default;

Util::File::File(IOContext &ioc, std::filesystem::path path, Mode mode) :
    handle(std::make_unique<Handle>(ioc, path, mode)), path(std::move(path))
{
}

Util::File::File(File &&) noexcept = default;
Util::File &Util::File::operator=(File &&) noexcept = default;

uint64_t Util::File::size() const
{
#ifdef BOOST_ASIO_HAS_IO_URING
    return handle->file.size();
#else // BOOST_ASIO_HAS_IO_URING
    return std::filesystem::file_size(path);
#endif // BOOST_ASIO_HAS_IO_URING
}

Awaitable<std::vector<std::byte>> Util::File::readAt(uint64_t offset, size_t length)
{
    std::vector<std::byte> result(length);
    if (length == 0) {
        co_return result;
    }

#ifdef BOOST_ASIO_HAS_IO_URING
    boost::system::error_code ec;
    size_t n = co_await boost::asio::async_read_at(handle->file, offset, boost::asio::buffer(result),
                                                   boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec && ec != boost::asio::error::eof) {
        throw std::runtime_error("Error reading " + path.string() + ": " + ec.message());
    }
#else // BOOST_ASIO_HAS_IO_URING
    // Clear any end of file left by a previous read, so the seek works.
    handle->file.clear();
    size_t n = 0;
    try {
        handle->file.seekg((std::streamoff)offset);
        handle->file.read((char *)result.data(), (std::streamsize)length);
        n = length;
    }
    catch (const std::ios::failure &) {
        if (!handle->file.eof()) {
            throw;
        }
        n = (size_t)handle->file.gcount();
    }
#endif // BOOST_ASIO_HAS_IO_URING

    result.resize(n);
    co_return result;
}

Awaitable<std::vector<std::byte>> Util::File::readExactAt(uint64_t offset, size_t length)
{
    std::vector<std::byte> result = co_await readAt(offset, length);
    if (result.size() != length) {
        throw std::runtime_error(path.string() + " ended " + std::to_string(length - result.size()) +
                                 " bytes before the end of a read.");
    }
    co_return result;
}

Awaitable<void> Util::File::append(std::span<const std::byte> data)
{
#ifdef BOOST_ASIO_HAS_IO_URING
    co_await boost::asio::async_write_at(handle->file, appendOffset, boost::asio::buffer(data.data(), data.size()),
                                         boost::asio::use_awaitable);
#else // BOOST_ASIO_HAS_IO_URING
    handle->file.write((const char *)data.data(), (std::streamsize)data.size());
    handle->file.flush();
#endif // BOOST_ASIO_HAS_IO_URING
    appendOffset += data.size();
    co_return;
}
