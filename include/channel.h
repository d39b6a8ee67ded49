/**
 * @file channel.h
 * @brief Serial command channel.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_CHANNEL_H_
#define NOVAAT_CHANNEL_H_

#include <cstddef>
#include <cstdint>

#include "dispatcher.h"
#include "framer.h"

namespace at {

/**
 * @brief Defines resources and callbacks used by the channel.
 *
 * The API expects a *non-blocking* buffered
 * implementation, e.g. unistd or Arduino.
 *
 *   https://linux.die.net/man/2/read
 *   https://linux.die.net/man/2/write
 */
typedef struct {
    /**
     * @brief Read 'size' bytes into 'data' from stream.
     *
     * @param [out] data - buffer to read into.
     * @param [in] size - number of bytes to read.
     * @return number of bytes read.
     */
    int (*read)(void *data, size_t size);

    /**
     * @brief Write 'size' bytes from 'data' to stream.
     *
     * @param [in] data - buffer to write.
     * @param [in] size - number of bytes to write.
     * @return number of bytes written.
     */
    int (*write)(const void *data, size_t size);
} context_t;

/** Connects a byte stream to a dispatcher. */
class Channel {
public:
    /**
     * @brief Constructor.
     *
     * @param [in] context - stream callbacks, must outlive the channel.
     * @param [in] dispatcher - handles complete lines.
     */
    Channel(context_t &context, Dispatcher &dispatcher);

    /**
     * @brief Handle communication on the stream.
     *
     * Reads whatever is available, dispatches each complete line and
     * writes the encoded responses. Lines that are not commands go to the
     * dispatcher's unsolicited callback.
     *
     * @return number of bytes read.
     * @return -EINVAL if the stream carried a line that is not text.
     * @return -EIO if a response could not be written.
     */
    int process();

private:
    /**
     * @brief Process a complete line.
     *
     * @param [in] line - line without terminator.
     * @param [in] size - length of the line.
     * @param [in] user - private data.
     */
    static void line_callback(const char *line, size_t size, void *user);

    inline int read(void *data, size_t size) const
    {
        return ctx.read(data, size);
    }

    inline int write(const void *data, size_t size) const
    {
        return ctx.write(data, size);
    }

    /** Stream operating context. */
    const context_t &ctx;

    /** Command dispatcher. */
    Dispatcher &dispatcher;

    /** Line framer. */
    Framer framer;

    /** Receive buffer. */
    uint8_t buffer[kBufferSize];

    /** First error raised while processing the current chunk. */
    int status = 0;
};

} // namespace at

#endif // NOVAAT_CHANNEL_H_
