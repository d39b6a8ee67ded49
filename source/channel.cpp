/**
 * @file channel.cpp
 * @brief Serial command channel.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cerrno>
#include <string>
#include <vector>

#include "channel.h"
#include "debug.h"
#include "encoder.h"

namespace at {

Channel::Channel(context_t &context, Dispatcher &dispatcher) :
        ctx(context), dispatcher(dispatcher)
{
    framer.set_line_callback(line_callback, this);
}

int Channel::process()
{
    const int count = read(buffer, kBufferSize);
    if (count <= 0)
        return 0;

    status = 0;
    framer.load(buffer, count);

    return (status < 0) ? status : count;
}

void Channel::line_callback(const char *line, size_t size, void *user)
{
    Channel *ctx = static_cast<Channel*>(user);

    std::vector<Response> responses;
    const int result = ctx->dispatcher.handle(line, size, responses);

    if (result == -EINVAL) {
        LOG_ERROR("Discarded a line that is not text\n");
        if (ctx->status == 0)
            ctx->status = result;
        return;
    }

    if (result < 0)
        return;  // Blank or unsolicited

    const std::string out = encode(responses, ctx->dispatcher.config());
    const int written = ctx->write(out.data(), out.size());
    if (written < 0 || static_cast<size_t>(written) != out.size()) {
        LOG_ERROR("Short write (%d of %u)\n",
                written, static_cast<unsigned>(out.size()));
        if (ctx->status == 0)
            ctx->status = -EIO;
    }
}

} // namespace at
