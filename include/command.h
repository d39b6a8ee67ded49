/**
 * @file command.h
 * @brief Parsed AT command.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_COMMAND_H_
#define NOVAAT_COMMAND_H_

#include <string>
#include <vector>

#include "parameter.h"

namespace at {

/**
 * @brief AT command type.
 * @see classify().
 */
enum class Type {
    test, /**< AT+FOO=? - query the supported values. */
    read, /**< AT+FOO? - query the current value. */
    set, /**< AT+FOO=<params> - assign values. */
    execute, /**< AT+FOO - run the command. */
};

/** Returns a printable name for 'type'. */
const char *type_name(Type type);

/** One command decoded from an inbound line. */
class Command
{
public:
    /**
     * @brief Constructor.
     *
     * @param [in] name - case normalized command name, e.g. "+CSQ", "D", "&F".
     * @param [in] type - command type.
     * @param [in] parameters - decoded parameters.
     * @param [in] raw - the complete line the command was taken from.
     */
    Command(const std::string &name, Type type,
            const std::vector<Parameter> &parameters = {},
            const std::string &raw = "");

    /** Returns the command name. */
    inline const std::string &name() const
    {
        return cmd_name;
    }

    /** Returns the command type. */
    inline Type type() const
    {
        return cmd_type;
    }

    /** Returns the decoded parameters in line order. */
    inline const std::vector<Parameter> &parameters() const
    {
        return cmd_parameters;
    }

    /** Returns the parameter at 'index', or an omitted value if out of range. */
    const Parameter &parameter(size_t index) const;

    /** Returns the original line. */
    inline const std::string &raw() const
    {
        return cmd_raw;
    }

    /** True for V.250 basic commands (E, &F, S7, D). */
    bool is_basic() const;

    bool operator==(const Command &other) const;

    inline bool operator!=(const Command &other) const
    {
        return !(*this == other);
    }

private:
    std::string cmd_name; /**< Command name. */
    Type cmd_type; /**< Command type. */
    std::vector<Parameter> cmd_parameters; /**< Decoded parameters. */
    std::string cmd_raw; /**< Original line. */
};

} // namespace at

#endif // NOVAAT_COMMAND_H_
