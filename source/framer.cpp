/**
 * @file framer.cpp
 * @brief Splits a serial byte stream into lines.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include "debug.h"
#include "framer.h"

namespace at {

void Framer::load(const uint8_t *data, size_t size)
{
    if (data == nullptr)
        return;

    for (size_t i = 0; i < size; ++i) {
        const char c = static_cast<char>(data[i]);

        if (c == '\r' || c == '\n') {
            if (discard) {
                // End of the overlong line
                discard = false;
            }
            else if (count > 0) {
                emit_line(buffer, count);
            }

            count = 0;
            continue;
        }

        if (discard)
            continue;

        if (count >= kBufferSize) {
            LOG_WARN("Line exceeds %u bytes, discarding\n",
                    static_cast<unsigned>(kBufferSize));
            discard = true;
            count = 0;
            continue;
        }

        buffer[count++] = c;
    }
}

void Framer::set_line_callback(line_cb_t func, void *user)
{
    line_cb = func;
    line_cb_user = user;
}

void Framer::reset()
{
    count = 0;
    discard = false;
}

} // namespace at
