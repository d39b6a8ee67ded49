/**
 * @file request.cpp
 * @brief Outbound AT command line buffer.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cstring>

#include "encoder.h"
#include "request.h"

namespace at {

Request::Request()
{
    payload.reserve(16);
    payload.push_back('A');
    payload.push_back('T');
    payload.push_back('\r');
}

Request::Request(const Command &cmd) :
        Request()
{
    add(cmd);
}

void Request::add(const Command &cmd)
{
    const std::string body = encode_body(cmd);
    add(body.data(), body.size());
}

void Request::add(const void *data, size_t size)
{
    if (data == nullptr || size == 0)
        return;

    if (payload.size() == 3) {
        // 'AT\r' -> 'AT'
        payload.pop_back();
    }
    else {
        // Change the terminating '\r' character to a ';'
        payload.back() = ';';
    }

    // Expand the vector to fit the new command
    const size_t end = payload.size();
    payload.resize(end + size);
    memcpy(payload.data() + end, data, size);

    // Re-add the terminator
    payload.push_back('\r');
}

void Request::add(const char *data)
{
    if (data != nullptr)
        add(data, strlen(data));
}

std::string Request::line() const
{
    return std::string(payload.begin(), payload.end() - 1);
}

} // namespace at
