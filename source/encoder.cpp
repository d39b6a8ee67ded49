/**
 * @file encoder.cpp
 * @brief AT command and response encoder.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cinttypes>
#include <cstdio>
#include <cstring>

#include "encoder.h"

namespace at {

/** V.250 numeric result codes (ATV0). */
static const struct {
    const char *text;
    const char *code;
} kResultCodes[] = {
    { "OK", "0" },
    { "CONNECT", "1" },
    { "RING", "2" },
    { "NO CARRIER", "3" },
    { "ERROR", "4" },
    { "NO DIALTONE", "6" },
    { "BUSY", "7" },
    { "NO ANSWER", "8" },
};

static std::string quote(const std::string &text)
{
    std::string out;
    out.reserve(text.size() + 2);

    out.push_back('"');
    for (const char c : text) {
        if (c == '"')
            out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');

    return out;
}

/**
 * @brief True if 'text' decodes back to the same token when written as is.
 *
 * A ';' outside quotes would end the command.
 */
static bool is_bare_safe(const std::string &text)
{
    if (text.find(';') != std::string::npos)
        return false;

    std::vector<Parameter> params;
    if (decode_parameters(text, params) != 0)
        return false;

    return params.size() == 1 && params[0] == Parameter::token(text);
}

std::string encode(const Parameter &param)
{
    switch (param.type()) {
    case Parameter::Type::omitted:
        return "";
    case Parameter::Type::integer: {
        char buffer[32];
        snprintf(buffer, sizeof(buffer), "%0*" PRId64,
                static_cast<int>(param.width()), param.value());
        return buffer;
    }
    case Parameter::Type::string:
        return quote(param.text());
    case Parameter::Type::token:
        if (is_bare_safe(param.text()))
            return param.text();
        return quote(param.text());
    }

    return "";
}

/**
 * @brief Encode a parameter list.
 *
 * A leading token starting with one of 'markers' is quoted, it would
 * otherwise be read as a type marker.
 */
static std::string encode_list(
        const std::vector<Parameter> &params, const char *markers)
{
    std::string out;
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0)
            out.push_back(',');

        const Parameter &param = params[i];
        if (i == 0 && param.is_token() && !param.text().empty()
                && strchr(markers, param.text()[0]) != nullptr)
            out += quote(param.text());
        else
            out += encode(param);
    }

    return out;
}

std::string encode(const std::vector<Parameter> &params)
{
    return encode_list(params, "?");
}

std::string encode_body(const Command &cmd)
{
    std::string out = cmd.name();

    switch (cmd.type()) {
    case Type::test:
        out += "=?";
        break;
    case Type::read:
        out += "?";
        break;
    case Type::set:
        out += "=";
        out += encode(cmd.parameters());
        break;
    case Type::execute:
        if (cmd.is_basic() && cmd.parameters().size() == 1
                && cmd.parameter(0).is_token()) {
            // Dial string
            out += cmd.parameter(0).text();
        }
        else if (!cmd.is_basic() && !cmd.parameters().empty()) {
            // AT+FOO 1,2, digits after the name would extend it
            out += " ";
            out += encode_list(cmd.parameters(), "?=");
        }
        else {
            out += encode(cmd.parameters());
        }
        break;
    }

    return out;
}

std::string encode(const Command &cmd)
{
    return "AT" + encode_body(cmd);
}

std::string status_text(const Response &rsp)
{
    switch (rsp.status()) {
    case Status::pending:
        return "";
    case Status::ok:
        return "OK";
    case Status::error:
        return "ERROR";
    case Status::cme_error: {
        char buffer[32];
        snprintf(buffer, sizeof(buffer), "+CME ERROR: %d", rsp.cme_code());
        return buffer;
    }
    case Status::custom:
        return rsp.final_text();
    }

    return "";
}

/** Returns the ATV0 form of a status line. */
static std::string numeric_code(const std::string &text)
{
    for (const auto &result : kResultCodes) {
        if (text == result.text)
            return result.code;
    }

    return text;
}

std::string encode(const Response &rsp, const Config &config)
{
    std::string out;

    for (const std::string &line : rsp.lines()) {
        if (config.verbose)
            out += "\r\n";
        out += line;
        out += "\r\n";
    }

    if (!rsp.closed())
        return out;

    if (config.verbose) {
        out += "\r\n";
        out += status_text(rsp);
        out += "\r\n";
    }
    else {
        out += numeric_code(status_text(rsp));
        out += "\r";
    }

    return out;
}

std::string encode(
        const std::vector<Response> &responses, const Config &config)
{
    std::string out;
    for (const Response &rsp : responses)
        out += encode(rsp, config);

    return out;
}

} // namespace at
