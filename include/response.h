/**
 * @file response.h
 * @brief AT command response.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_RESPONSE_H_
#define NOVAAT_RESPONSE_H_

#include <string>
#include <vector>

namespace at {

/** Why a command failed. */
enum class Cause {
    none, /**< 0x0 - No failure. */
    malformed_command, /**< 0x1 - Line structure could not be parsed. */
    unterminated_quote, /**< 0x2 - A quote was never closed. */
    unexpected_parameters, /**< 0x3 - Parameters given to a type without them. */
    missing_parameters, /**< 0x4 - Set command without parameters (strict). */
    not_found, /**< 0x5 - No handler for the command name. */
    capability_mismatch, /**< 0x6 - Handler does not support the type. */
    handler_failure, /**< 0x7 - Handler reported an error. */
};

/** Returns a printable name for 'cause'. */
const char *cause_name(Cause cause);

/**
 * @brief Map a parse or lookup error code to a cause.
 *
 *   -EBADMSG -> malformed_command
 *   -EILSEQ  -> unterminated_quote
 *   -E2BIG   -> unexpected_parameters
 *   -ENODATA -> missing_parameters
 *   -ENOENT  -> not_found
 *   -ENOTSUP -> capability_mismatch
 *
 * Any other negative value maps to handler_failure, 0 to none.
 */
Cause cause_of(int error);

/** Terminal status of a response. */
enum class Status {
    pending, /**< Not finished yet. */
    ok, /**< OK */
    error, /**< ERROR */
    cme_error, /**< +CME ERROR: <n> */
    custom, /**< Final result chosen by the handler, e.g. CONNECT. */
};

/**
 * @brief Information lines closed by exactly one status line.
 *
 * Lines can be added until complete() or fail() is called. After that the
 * response is closed and further changes are rejected.
 */
class Response {
public:
    /**
     * @brief Append an information line.
     *
     * @param [in] line - text without line terminators.
     * @return 0 on success.
     * @return -EINVAL if 'line' is null or contains CR or LF.
     * @return -EPERM if the response is closed.
     */
    int add(const char *line);

    /** @overload */
    int add(const std::string &line);

    /**
     * @brief Append a formatted information line.
     *
     * @param [in] format - printf style format.
     * @return 0 on success.
     * @return -EINVAL if formatting fails or the result contains CR or LF.
     * @return -EPERM if the response is closed.
     */
    int addf(const char *format, ...)
#if defined(__GNUC__)
            __attribute__((format(printf, 2, 3)))
#endif
            ;

    /**
     * @brief Attach a numeric CME error code to a failure.
     *
     * Only used if the command fails and extended errors are enabled.
     */
    void set_cme_error(int code);

    /**
     * @brief Replace 'OK' with a custom final result on success.
     *
     * @param [in] text - final result, e.g. "CONNECT".
     * @return 0 on success.
     * @return -EINVAL if 'text' is null, empty or contains CR or LF.
     * @return -EPERM if the response is closed.
     */
    int set_final(const char *text);

    /**
     * @brief Close the response as successful.
     *
     * The status becomes Status::custom if a final result was set,
     * otherwise Status::ok.
     *
     * @return 0 on success.
     * @return -EALREADY if the response is closed.
     */
    int complete();

    /**
     * @brief Close the response as failed.
     *
     * Information lines added before the failure are discarded.
     *
     * @param [in] cause - reason for the failure.
     * @param [in] extended - report an attached CME code as +CME ERROR.
     * @return 0 on success.
     * @return -EALREADY if the response is closed.
     */
    int fail(Cause cause, bool extended = false);

    /** Returns the information lines. */
    inline const std::vector<std::string> &lines() const
    {
        return info_lines;
    }

    /** Returns the terminal status. */
    inline Status status() const
    {
        return rsp_status;
    }

    /** Returns the failure cause, Cause::none on success. */
    inline Cause cause() const
    {
        return rsp_cause;
    }

    /** Returns the attached CME error code, or -1. */
    inline int cme_code() const
    {
        return rsp_cme_code;
    }

    /** Returns the custom final result text. */
    inline const std::string &final_text() const
    {
        return rsp_final;
    }

    /** True once a status line has been chosen. */
    inline bool closed() const
    {
        return rsp_status != Status::pending;
    }

private:
    std::vector<std::string> info_lines;    /**< Information lines. */
    std::string rsp_final;                  /**< Custom final result. */
    Status rsp_status = Status::pending;    /**< Terminal status. */
    Cause rsp_cause = Cause::none;          /**< Failure cause. */
    int rsp_cme_code = -1;                  /**< Attached CME code. */
};

} // namespace at

#endif // NOVAAT_RESPONSE_H_
