/**
 * @file request.h
 * @brief Outbound AT command line buffer.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_REQUEST_H_
#define NOVAAT_REQUEST_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "command.h"

namespace at {

/**
 * @brief Builds a command line to send to a device.
 *
 * Commands added after the first are chained with ';' and the line is
 * terminated with '\r', e.g. "AT+CMEE=1;+CSQ\r".
 */
class Request
{
public:
    /** Constructor, starts as the bare line 'AT\r'. */
    Request();

    /**
     * @brief Constructor.
     *
     * @param [in] cmd - first command.
     */
    explicit Request(const Command &cmd);

    /**
     * @brief Add a command.
     *
     * @param [in] cmd - command to add.
     */
    void add(const Command &cmd);

    /**
     * @brief Add a pre-encoded command.
     *
     * @param [in] data - command body without 'AT', e.g. "+CSQ".
     * @param [in] size - data size.
     */
    void add(const void *data, size_t size);

    /**
     * @brief Add a pre-encoded command.
     *
     * @param [in] data - command body without 'AT'.
     */
    void add(const char *data);

    /**
     * @brief Return the data pointer.
     */
    inline const uint8_t* data() const
    {
        return payload.data();
    }

    /**
     * @brief Return the payload size in bytes.
     */
    inline size_t size() const
    {
        return payload.size();
    }

    /** Returns the line without the terminating '\r'. */
    std::string line() const;

private:
    std::vector<uint8_t> payload; /**< Command line. */
};

} // namespace at

#endif // NOVAAT_REQUEST_H_
