/**
 * @file command.cpp
 * @brief Parsed AT command.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include "command.h"

namespace at {

const char *type_name(Type type)
{
    switch (type) {
    case Type::test:
        return "test";
    case Type::read:
        return "read";
    case Type::set:
        return "set";
    case Type::execute:
        return "execute";
    }

    return "unknown";
}

Command::Command(const std::string &name, Type type,
        const std::vector<Parameter> &parameters, const std::string &raw) :
        cmd_name(name), cmd_type(type), cmd_parameters(parameters), cmd_raw(raw)
{
}

const Parameter &Command::parameter(size_t index) const
{
    static const Parameter kOmitted;

    if (index >= cmd_parameters.size())
        return kOmitted;

    return cmd_parameters[index];
}

bool Command::is_basic() const
{
    if (cmd_name.empty())
        return false;

    switch (cmd_name[0]) {
    case '+':
    case '%':
    case '#':
        return false;
    default:
        return true;
    }
}

bool Command::operator==(const Command &other) const
{
    // The raw line is diagnostic only
    return cmd_name == other.cmd_name
            && cmd_type == other.cmd_type
            && cmd_parameters == other.cmd_parameters;
}

} // namespace at
