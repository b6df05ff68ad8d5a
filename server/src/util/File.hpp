#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "util/awaitable.hpp"

class IOContext;

namespace Util
{

/**
 * A file that's read at explicit offsets, or written by appending.
 *
 * Reads don't move a shared position, so responding to a byte range is one readAt() per chunk. With io_uring
 * available to Asio the IO is asynchronous. Otherwise it blocks the calling thread.
 */
class File final
{
public:
    enum class Mode
    {
        /**
         * Open an existing file for reading.
         */
        read,

        /**
         * Create the file, or truncate it, for appending.
         */
        create
    };

    ~File();

    /**
     * No file. Assign an opened one later.
     */
    File();

    /**
     * @throws std::exception if the file can't be opened.
     */
    explicit File(IOContext &ioc, std::filesystem::path path, Mode mode = Mode::read);

    File(File &&) noexcept;
    File &operator=(File &&) noexcept;

    operator bool() const
    {
        return (bool)handle;
    }

    uint64_t size() const;

    /**
     * Read up to length bytes starting at offset.
     *
     * @return Fewer than length bytes only if the file ends first. Empty at or past the end.
     */
    Awaitable<std::vector<std::byte>> readAt(uint64_t offset, size_t length);

    /**
     * @throws std::runtime_error if the file ends before offset + length.
     */
    Awaitable<std::vector<std::byte>> readExactAt(uint64_t offset, size_t length);

    /**
     * Write to the end of a file opened with Mode::create.
     */
    Awaitable<void> append(std::span<const std::byte> data);

    Awaitable<void> append(std::string_view data)
    {
        return append(std::span((const std::byte *)data.data(), data.size()));
    }

    const std::filesystem::path &getPath() const
    {
        return path;
    }

private:
    struct Handle;

    std::unique_ptr<Handle> handle;
    std::filesystem::path path;

    /**
     * Where the next append goes.
     */
    uint64_t appendOffset = 0;
};

} // namespace Util
