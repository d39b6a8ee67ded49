/**
 * @file response.cpp
 * @brief AT command response.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>

#include "response.h"

namespace at {

/** True if 'line' can be sent as a single line. */
static bool is_single_line(const char *line, size_t size)
{
    return memchr(line, '\r', size) == nullptr
            && memchr(line, '\n', size) == nullptr;
}

const char *cause_name(Cause cause)
{
    switch (cause) {
    case Cause::none:
        return "none";
    case Cause::malformed_command:
        return "malformed command";
    case Cause::unterminated_quote:
        return "unterminated quote";
    case Cause::unexpected_parameters:
        return "unexpected parameters";
    case Cause::missing_parameters:
        return "missing parameters";
    case Cause::not_found:
        return "not found";
    case Cause::capability_mismatch:
        return "capability mismatch";
    case Cause::handler_failure:
        return "handler failure";
    }

    return "unknown";
}

Cause cause_of(int error)
{
    switch (error) {
    case 0:
        return Cause::none;
    case -EBADMSG:
        return Cause::malformed_command;
    case -EILSEQ:
        return Cause::unterminated_quote;
    case -E2BIG:
        return Cause::unexpected_parameters;
    case -ENODATA:
        return Cause::missing_parameters;
    case -ENOENT:
        return Cause::not_found;
    case -ENOTSUP:
        return Cause::capability_mismatch;
    default:
        return (error < 0) ? Cause::handler_failure : Cause::none;
    }
}

int Response::add(const char *line)
{
    if (line == nullptr)
        return -EINVAL;

    return add(std::string(line));
}

int Response::add(const std::string &line)
{
    if (closed())
        return -EPERM;

    if (!is_single_line(line.data(), line.size()))
        return -EINVAL;

    info_lines.push_back(line);
    return 0;
}

int Response::addf(const char *format, ...)
{
    if (closed())
        return -EPERM;

    if (format == nullptr)
        return -EINVAL;

    va_list argp;
    char buffer[256];

    va_start(argp, format);
    int size = vsnprintf(buffer, sizeof(buffer), format, argp);
    va_end(argp);

    if (size < 0)
        return -EINVAL;

    if (static_cast<size_t>(size) < sizeof(buffer))
        return add(std::string(buffer, size));

    // Too long for the stack buffer, format again into a string
    std::string line(size, '\0');

    va_start(argp, format);
    vsnprintf(&line[0], line.size() + 1, format, argp);
    va_end(argp);

    return add(line);
}

void Response::set_cme_error(int code)
{
    rsp_cme_code = code;
}

int Response::set_final(const char *text)
{
    if (closed())
        return -EPERM;

    if (text == nullptr || *text == '\0' || !is_single_line(text, strlen(text)))
        return -EINVAL;

    rsp_final = text;
    return 0;
}

int Response::complete()
{
    if (closed())
        return -EALREADY;

    rsp_status = rsp_final.empty() ? Status::ok : Status::custom;
    rsp_cause = Cause::none;
    return 0;
}

int Response::fail(Cause cause, bool extended)
{
    if (closed())
        return -EALREADY;

    info_lines.clear();
    rsp_final.clear();

    if (extended && rsp_cme_code >= 0)
        rsp_status = Status::cme_error;
    else
        rsp_status = Status::error;

    rsp_cause = (cause == Cause::none) ? Cause::handler_failure : cause;
    return 0;
}

} // namespace at
