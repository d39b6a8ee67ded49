/**
 * @file registry.h
 * @brief AT command handler registry.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_REGISTRY_H_
#define NOVAAT_REGISTRY_H_

#include <cstdint>
#include <map>
#include <string>

#include "command.h"
#include "response.h"

namespace at {

/**
 * @brief Command handler function.
 *
 * Information lines are added to 'rsp'; the status line is chosen by the
 * dispatcher from the return value.
 *
 * @param [in] cmd - decoded command.
 * @param [out] rsp - response being built.
 * @param [in] user - private data given at registration.
 * @return 0 on success, a negative value on failure.
 */
typedef int (*handler_cb_t)(const Command &cmd, Response &rsp, void *user);

/**@{*/
/** Capability bits, see Handler::capabilities(). */
constexpr uint8_t kCanTest = (1 << 0);
constexpr uint8_t kCanRead = (1 << 1);
constexpr uint8_t kCanSet = (1 << 2);
constexpr uint8_t kCanExecute = (1 << 3);
/**@}*/

/**
 * @brief Functions implementing one command.
 *
 * A null function means the command type is not supported.
 */
typedef struct {
    /** AT+FOO=? */
    handler_cb_t test;

    /** AT+FOO? */
    handler_cb_t read;

    /** AT+FOO=<params> */
    handler_cb_t set;

    /** AT+FOO */
    handler_cb_t execute;

    /** Private data passed to every function. */
    void *user;
} handler_t;

/** Returns the capability bits of 'handler'. */
uint8_t capabilities(const handler_t &handler);

/** Returns the function for 'type', or nullptr if unsupported. */
handler_cb_t function_for(const handler_t &handler, Type type);

/**
 * @brief Maps command names to handlers.
 *
 * Names are stored in upper case, lookups match exactly. A dispatcher that
 * does not fold case only reaches commands sent in upper case. Lookups may
 * run concurrently as long as no registration happens at the same time.
 */
class Registry {
public:
    /**
     * @brief Add a handler.
     *
     * @param [in] name - command name in any case, e.g. "+CSQ", "D", "&F".
     * @param [in] handler - supported functions.
     * @return 0 on success.
     * @return -EINVAL if 'name' is not a valid command name.
     * @return -EINVAL if 'handler' supports no command type.
     * @return -EEXIST if 'name' is already registered.
     */
    int register_command(const char *name, const handler_t &handler);

    /**
     * @brief Add a handler or overwrite an existing one.
     *
     * @param [in] name - command name.
     * @param [in] handler - supported functions.
     * @return 0 on success.
     * @return -EINVAL if 'name' or 'handler' is invalid.
     */
    int replace_command(const char *name, const handler_t &handler);

    /**
     * @brief Remove a handler.
     *
     * Removing a name that is not registered does nothing.
     */
    void unregister_command(const char *name);

    /**
     * @brief Find the handler for a command.
     *
     * @param [in] name - upper case command name.
     * @return the handler, or nullptr if 'name' is not registered.
     */
    const handler_t *lookup(const std::string &name) const;

    /** Returns the number of registered commands. */
    inline size_t size() const
    {
        return handlers.size();
    }

    /**
     * @brief Check a command name.
     *
     * Valid names are a letter, '&' or '\' followed by a letter, 'S' followed
     * by digits, or '+', '%' or '#' followed by at least one extended name
     * character.
     */
    static bool is_valid_name(const char *name);

private:
    /** Registered handlers by name. */
    std::map<std::string, handler_t> handlers;
};

} // namespace at

#endif // NOVAAT_REGISTRY_H_
