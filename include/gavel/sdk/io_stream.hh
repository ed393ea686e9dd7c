/**
 * @file io_stream.hh
 * @brief Read-only binary stream abstraction
 * @ingroup sdk_io
 */

#ifndef GAVEL_SDK_IO_STREAM_H
#define GAVEL_SDK_IO_STREAM_H

#include <gavel/sdk/types.hh>
#include <gavel/sdk/export_gavel_sdk.h>
#include <memory>
#include <string>
#include <vector>

namespace gavel {

/**
 * @enum seek_origin
 * @brief Seek origin for stream positioning
 * @ingroup sdk_io
 */
enum class seek_origin : int {
    set = 0,  ///< From beginning of stream (SEEK_SET)
    cur = 1,  ///< From current position (SEEK_CUR)
    end = 2   ///< From end of stream (SEEK_END)
};

/**
 * @class io_stream
 * @brief Source of encoded bytes for decoders and fetchers
 * @ingroup sdk_io
 *
 * Decoders only ever read, so unlike a general purpose stream there is no
 * write side. Memory streams wrap fetched payloads; file streams back the
 * local asset fetcher.
 *
 * @code
 * auto stream = io_from_file("sounds/general/sfx-guilty.opus");
 * if (!stream) {
 *     // not found
 * }
 * auto bytes = read_all(stream.get());
 * @endcode
 *
 * @see io_from_file(), io_from_memory(), decoder
 */
class GAVEL_SDK_EXPORT io_stream {
public:
    virtual ~io_stream() = default;

    /**
     * @brief Read up to @p size_bytes into @p ptr
     * @return Bytes actually read, 0 on EOF or error
     */
    virtual size_t read(void* ptr, size_t size_bytes) = 0;

    /**
     * @brief Reposition the stream
     * @return New position from start, or -1 on error
     */
    virtual int64_t seek(int64_t offset, seek_origin whence) = 0;

    /**
     * @brief Current byte position from start, or -1 on error
     */
    virtual int64_t tell() = 0;

    /**
     * @brief Total size in bytes, or -1 if unknown
     */
    virtual int64_t get_size() = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief Open a file for binary reading
 * @return New stream, or nullptr if the file cannot be opened
 */
GAVEL_SDK_EXPORT std::unique_ptr<io_stream> io_from_file(const std::string& filename);

/**
 * @brief Wrap a memory block
 * @note The memory must outlive the stream
 */
GAVEL_SDK_EXPORT std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes);

/**
 * @brief Read everything from the current position to the end
 */
GAVEL_SDK_EXPORT std::vector<uint8_t> read_all(io_stream* stream);

} // namespace gavel

#endif // GAVEL_SDK_IO_STREAM_H
