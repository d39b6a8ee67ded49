/**
 * @file config.h
 * @brief Dialect options for a command channel.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_CONFIG_H_
#define NOVAAT_CONFIG_H_

namespace at {

/**
 * @brief Per-channel dialect options.
 *
 * Each Dispatcher holds its own copy, so channels with different
 * dialects can share one process.
 */
struct Config {
    /** Treat a bare '=' (AT+FOO=) as missing parameters. */
    bool strict_empty_set = false;

    /** Upper-case command names before lookup. */
    bool case_insensitive = true;

    /** Allow a parameter tail on extended execute commands (AT+FOO 1,2). */
    bool execute_parameters = false;

    /** Report coded handler failures as '+CME ERROR: <n>' (AT+CMEE=1). */
    bool extended_errors = false;

    /** Text result codes (ATV1). Numeric codes (ATV0) when false. */
    bool verbose = true;

    /** Basic commands that consume the rest of the line (dial strings). */
    const char *dial_commands = "D";
};

} // namespace at

#endif // NOVAAT_CONFIG_H_
