/**
 * @file parameter.h
 * @brief AT command parameter values and decoder.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_PARAMETER_H_
#define NOVAAT_PARAMETER_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace at {

/** Discriminated AT parameter value. */
class Parameter {
public:
    /** Parameter kind. */
    enum class Type {
        omitted, /**< Empty slot between commas. */
        integer, /**< Optionally signed decimal number. */
        string, /**< Double quoted string. */
        token, /**< Any other unquoted text. */
    };

    /** Constructs an omitted parameter. */
    Parameter() = default;

    /**
     * @brief Integer parameter.
     *
     * @param [in] value - numeric value.
     * @param [in] width - zero padded width used when encoding (0 = none).
     */
    static Parameter integer(int64_t value, unsigned width = 0);

    /** Quoted string parameter, 'text' is stored unescaped. */
    static Parameter string(const std::string &text);

    /** Bare token parameter, e.g. a symbolic constant or hex string. */
    static Parameter token(const std::string &text);

    /** Omitted parameter. */
    static Parameter omitted();

    inline Type type() const
    {
        return param_type;
    }

    inline bool is_omitted() const
    {
        return param_type == Type::omitted;
    }

    inline bool is_integer() const
    {
        return param_type == Type::integer;
    }

    inline bool is_string() const
    {
        return param_type == Type::string;
    }

    inline bool is_token() const
    {
        return param_type == Type::token;
    }

    /** Returns the numeric value, 0 unless is_integer(). */
    inline int64_t value() const
    {
        return param_value;
    }

    /** Returns the encoding width of an integer. */
    inline unsigned width() const
    {
        return param_width;
    }

    /** Returns the text of a string or token, empty otherwise. */
    inline const std::string &text() const
    {
        return param_text;
    }

    /** Width is a rendering hint and does not take part in comparison. */
    bool operator==(const Parameter &other) const;

    inline bool operator!=(const Parameter &other) const
    {
        return !(*this == other);
    }

private:
    Type param_type = Type::omitted;    /**< Kind of value. */
    int64_t param_value = 0;            /**< Integer value. */
    unsigned param_width = 0;           /**< Integer encoding width. */
    std::string param_text;             /**< String or token text. */
};

/**
 * @brief Split a parameter tail into typed values.
 *
 * The tail is split on commas outside of double quotes. Each segment is
 * trimmed and becomes Omitted (empty), Integer (sign and digits), String
 * (quoted, with "" unescaped to ") or Token (anything else). An empty
 * tail decodes to a single Omitted parameter.
 *
 * @param [in] tail - parameter text following '='.
 * @param [in] size - length of 'tail'.
 * @param [out] params - decoded values, cleared first.
 * @return 0 on success.
 * @return -EINVAL if 'tail' is null and 'size' is not zero.
 * @return -EILSEQ if a quote is opened but never closed.
 */
int decode_parameters(
        const char *tail, size_t size, std::vector<Parameter> &params);

/** @overload */
int decode_parameters(
        const std::string &tail, std::vector<Parameter> &params);

/**
 * @brief Find the closing quote of a quoted region.
 *
 * A doubled quote ("") inside the region is an escaped quote and does not
 * close it.
 *
 * @param [in] data - text to search.
 * @param [in] size - length of 'data'.
 * @param [in] open - index of the opening quote.
 * @return index of the closing quote, or 'size' if the region is unterminated.
 */
size_t find_closing_quote(const char *data, size_t size, size_t open);

} // namespace at

#endif // NOVAAT_PARAMETER_H_
