/**
 * @file dispatcher.h
 * @brief AT command dispatcher.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_DISPATCHER_H_
#define NOVAAT_DISPATCHER_H_

#include <cstddef>
#include <string>
#include <vector>

#include "config.h"
#include "registry.h"
#include "response.h"
#include "tokenizer.h"

/** Parses and dispatches AT commands. */
namespace at {

/**
 * @brief Called with a line that is not an AT command.
 *
 * @param [in] line - the line as received.
 * @param [in] size - length of 'line'.
 * @param [in] user - private data.
 */
typedef void (*unsolicited_cb_t)(const char *line, size_t size, void *user);

/**
 * @brief Runs command lines against a registry of handlers.
 *
 * Each call to handle() consumes one complete line and produces one
 * response per command on it. A failing command does not stop the commands
 * after it. The only state kept between calls is the last command line,
 * used by 'A/'.
 *
 * One dispatcher serves one channel. Dispatchers on different threads may
 * share a registry that is no longer being modified.
 */
class Dispatcher {
public:
    /**
     * @brief Constructor.
     *
     * @param [in] registry - command handlers, must outlive the dispatcher.
     * @param [in] config - dialect options.
     */
    Dispatcher(const Registry &registry, const Config &config = Config());

    /**
     * @brief Set a function to be called with non-command lines.
     *
     * @param [in] func - function to be called.
     * @param [in] user - pointer to be passed when 'func' is called.
     */
    void set_unsolicited_callback(unsolicited_cb_t func, void *user = nullptr);

    /**
     * @brief Process one line.
     *
     * @param [in] line - newline stripped line.
     * @param [in] size - length of 'line'.
     * @param [out] responses - one response per command, cleared first.
     * @return 0 if responses were produced.
     * @return -ENODATA if the line is blank and was ignored.
     * @return -ENOMSG if the line is not a command and was passed to the
     *         unsolicited callback.
     * @return -EINVAL if 'line' is null or contains NUL, CR or LF.
     */
    int handle(const char *line, size_t size, std::vector<Response> &responses);

    /** @overload */
    int handle(const std::string &line, std::vector<Response> &responses);

    /** Returns the dialect options, which may be changed between lines. */
    inline Config &config()
    {
        return cfg;
    }

    /** @overload */
    inline const Config &config() const
    {
        return cfg;
    }

    /** Returns the line repeated by 'A/', empty if there is none. */
    inline const std::string &last_line() const
    {
        return history;
    }

    /** Forget the line repeated by 'A/'. */
    inline void clear_history()
    {
        history.clear();
    }

private:
    /**
     * @brief Dispatch every command left in 'tokenizer'.
     *
     * @return true if at least one command succeeded.
     */
    bool run(Tokenizer &tokenizer, const std::string &raw,
            std::vector<Response> &responses);

    /**
     * @brief Classify, decode, look up and invoke one command.
     *
     * @return 0 if the handler succeeded, a negative error otherwise.
     */
    int dispatch(const Token &token, const std::string &raw, Response &rsp);

    /** Call the handler function, closing 'rsp' from its result. */
    int invoke(handler_cb_t func, void *user, const Command &cmd, Response &rsp);

    /** Close 'rsp' as failed because of 'error'. */
    int reject(const Token &token, int error, Response &rsp);

    /** Invoke the unsolicited callback. */
    inline void emit_unsolicited(const char *line, size_t size)
    {
        if (unsolicited_cb)
            unsolicited_cb(line, size, unsolicited_cb_user);
    }

    /** Command handlers. */
    const Registry &registry;

    /** Dialect options. */
    Config cfg;

    /** User function to call with unsolicited lines. */
    unsolicited_cb_t unsolicited_cb = nullptr;

    /** User private data for unsolicited callback. */
    void *unsolicited_cb_user = nullptr;

    /** Last line with a successfully dispatched command. */
    std::string history;
};

} // namespace at

#endif // NOVAAT_DISPATCHER_H_
