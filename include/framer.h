/**
 * @file framer.h
 * @brief Splits a serial byte stream into lines.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_FRAMER_H_
#define NOVAAT_FRAMER_H_

/**@{*/
/** Allows user to specify buffer size with -DNOVAAT_BUFFER_SIZE. */
#ifndef NOVAAT_BUFFER_SIZE
#define NOVAAT_BUFFER_SIZE 556
#endif
/**@}*/

#if NOVAAT_BUFFER_SIZE < 256
#warning NOVAAT_BUFFER_SIZE must be at least 256
#endif

#include <cstddef>
#include <cstdint>

namespace at {

/**
 * @brief Maximum length of a command line.
 *
 * This can be set with -DNOVAAT_BUFFER_SIZE (default 556).
 */
constexpr size_t kBufferSize = (NOVAAT_BUFFER_SIZE);

typedef void (*line_cb_t)(const char *line, size_t size, void *user);

/**
 * @brief Collects bytes until a CR or LF and emits the line.
 *
 * Empty lines (such as the LF of a CRLF pair) are dropped. A line longer
 * than kBufferSize is discarded up to its terminator.
 */
class Framer {
public:
    /**
     * @brief Register a function to be called with each complete line.
     *
     * @param [in] func - line callback.
     * @param [in] user - private data.
     */
    void set_line_callback(line_cb_t func, void *user=nullptr);

    /**
     * @brief Load incoming data.
     *
     * @param [in] data - buffer.
     * @param [in] size - length of buffer.
     */
    void load(const uint8_t *data, size_t size);

    /** Drop any partial line. */
    void reset();

    /** Returns the number of bytes waiting for a terminator. */
    inline size_t pending() const
    {
        return count;
    }

private:
    /**
     * @brief Invoke the line callback.
     *
     * @param [in] data - line without terminator.
     * @param [in] size - length of data.
     */
    inline void emit_line(const char *data, size_t size)
    {
        if(line_cb)
            line_cb(data, size, line_cb_user);
    }

    /** Function called with a complete line. */
    line_cb_t line_cb = nullptr;

    /** User data passed to line callback. */
    void *line_cb_user = nullptr;

    char buffer[kBufferSize];       /**< Line buffer. */
    size_t count = 0;               /**< The number of bytes in the buffer. */
    bool discard = false;           /**< Dropping an overlong line. */
};

} // namespace at

#endif // NOVAAT_FRAMER_H_
