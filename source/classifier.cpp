/**
 * @file classifier.cpp
 * @brief AT command type classification.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cctype>
#include <cerrno>

#include "classifier.h"

namespace at {

/** True if 'text' is empty or whitespace. */
static bool is_blank(const std::string &text)
{
    for (const char c : text) {
        if (!isspace(static_cast<unsigned char>(c)))
            return false;
    }

    return true;
}

Type type_of(Marker marker)
{
    switch (marker) {
    case Marker::assign_query:
        return Type::test;
    case Marker::query:
        return Type::read;
    case Marker::assign:
        return Type::set;
    case Marker::none:
        break;
    }

    return Type::execute;
}

int classify(const Token &token, const Config &config, Type &type)
{
    type = type_of(token.marker);

    switch (type) {
    case Type::test:
    case Type::read:
        if (!is_blank(token.tail))
            return -E2BIG;
        break;
    case Type::set:
        if (config.strict_empty_set && is_blank(token.tail))
            return -ENODATA;
        break;
    case Type::execute:
        if (!is_blank(token.tail) && !token.basic && !config.execute_parameters)
            return -E2BIG;
        break;
    }

    return 0;
}

} // namespace at
