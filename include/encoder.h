/**
 * @file encoder.h
 * @brief AT command and response encoder.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_ENCODER_H_
#define NOVAAT_ENCODER_H_

#include <string>
#include <vector>

#include "command.h"
#include "config.h"
#include "parameter.h"
#include "response.h"

namespace at {

/**
 * @brief Encode a single parameter.
 *
 * Strings are quoted with embedded quotes doubled. Integers are written
 * without leading zeros unless a width was given. Tokens are written as is
 * unless they contain ';' or would not decode back to the same token, in
 * which case they are quoted.
 */
std::string encode(const Parameter &param);

/**
 * @brief Encode a comma separated parameter list.
 *
 * A first token starting with '?' is quoted so it is not read as a type
 * marker.
 */
std::string encode(const std::vector<Parameter> &params);

/**
 * @brief Encode a command without the 'AT' prefix, e.g. "+CSQ=1,2".
 *
 * Extended execute commands with parameters put a space after the name
 * ("+FOO 1,2"). Used to chain commands on one line.
 */
std::string encode_body(const Command &cmd);

/** Encode a command line, e.g. "AT+CSQ=1,2" (no terminator). */
std::string encode(const Command &cmd);

/**
 * @brief Encode a response.
 *
 * With Config::verbose every line is framed as "\r\n<text>\r\n". Otherwise
 * information lines end with "\r\n" and the status is a numeric result
 * code followed by "\r". A response that is not closed yields only its
 * information lines.
 */
std::string encode(const Response &rsp, const Config &config = Config());

/** Encode the responses of a command line in order. */
std::string encode(
        const std::vector<Response> &responses,
        const Config &config = Config());

/** Returns the status line text of 'rsp', e.g. "OK" or "+CME ERROR: 10". */
std::string status_text(const Response &rsp);

} // namespace at

#endif // NOVAAT_ENCODER_H_
