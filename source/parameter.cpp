/**
 * @file parameter.cpp
 * @brief AT command parameter values and decoder.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cerrno>
#include <cctype>
#include <climits>

#include "parameter.h"

namespace at {

Parameter Parameter::integer(int64_t value, unsigned width)
{
    Parameter param;
    param.param_type = Type::integer;
    param.param_value = value;
    param.param_width = width;
    return param;
}

Parameter Parameter::string(const std::string &text)
{
    Parameter param;
    param.param_type = Type::string;
    param.param_text = text;
    return param;
}

Parameter Parameter::token(const std::string &text)
{
    Parameter param;
    param.param_type = Type::token;
    param.param_text = text;
    return param;
}

Parameter Parameter::omitted()
{
    return Parameter();
}

bool Parameter::operator==(const Parameter &other) const
{
    if (param_type != other.param_type)
        return false;

    switch (param_type) {
    case Type::omitted:
        return true;
    case Type::integer:
        return param_value == other.param_value;
    case Type::string:
    case Type::token:
        return param_text == other.param_text;
    }

    return false;
}

size_t find_closing_quote(const char *data, size_t size, size_t open)
{
    size_t i = open + 1;
    while (i < size) {
        if (data[i] == '"') {
            if ((i + 1) < size && data[i + 1] == '"') {
                // Escaped quote
                i += 2;
                continue;
            }
            return i;
        }
        i += 1;
    }

    return size;
}

/**
 * @brief Parse an optionally signed decimal number.
 *
 * @return true if the whole segment is a number that fits in int64_t.
 */
static bool parse_integer(const char *data, size_t size, int64_t &value)
{
    size_t i = 0;
    bool negative = false;

    if (size > 0 && (data[0] == '+' || data[0] == '-')) {
        negative = (data[0] == '-');
        i = 1;
    }

    if (i >= size)
        return false;

    // Accumulate as a negative number so INT64_MIN is representable
    int64_t result = 0;
    for (; i < size; ++i) {
        if (!isdigit(static_cast<unsigned char>(data[i])))
            return false;

        const int digit = data[i] - '0';
        if (result < (INT64_MIN + digit) / 10)
            return false;

        result = (result * 10) - digit;
    }

    if (!negative) {
        if (result == INT64_MIN)
            return false;
        result = -result;
    }

    value = result;
    return true;
}

/** Convert one trimmed segment into a parameter. */
static Parameter decode_segment(const char *data, size_t size)
{
    if (size == 0)
        return Parameter::omitted();

    int64_t value = 0;
    if (parse_integer(data, size, value))
        return Parameter::integer(value);

    if (size >= 2 && data[0] == '"' &&
            find_closing_quote(data, size, 0) == (size - 1)) {
        // "abc""def" -> abc"def
        std::string text;
        text.reserve(size - 2);

        for (size_t i = 1; i < (size - 1); ++i) {
            text.push_back(data[i]);
            if (data[i] == '"')
                i += 1;
        }

        return Parameter::string(text);
    }

    return Parameter::token(std::string(data, size));
}

int decode_parameters(
        const char *tail, size_t size, std::vector<Parameter> &params)
{
    params.clear();

    if (tail == nullptr && size > 0)
        return -EINVAL;

    size_t start = 0;
    size_t i = 0;

    while (true) {
        // Find the end of this segment, skipping quoted regions
        while (i < size && tail[i] != ',') {
            if (tail[i] == '"') {
                i = find_closing_quote(tail, size, i);
                if (i >= size) {
                    params.clear();
                    return -EILSEQ;
                }
            }
            i += 1;
        }

        // Trim whitespace around the segment
        size_t first = start;
        size_t last = i;
        while (first < last && isspace(static_cast<unsigned char>(tail[first])))
            first += 1;
        while (last > first && isspace(static_cast<unsigned char>(tail[last - 1])))
            last -= 1;

        params.push_back(decode_segment(tail + first, last - first));

        if (i >= size)
            break;

        // Move past the comma
        i += 1;
        start = i;
    }

    return 0;
}

int decode_parameters(
        const std::string &tail, std::vector<Parameter> &params)
{
    return decode_parameters(tail.data(), tail.size(), params);
}

} // namespace at
