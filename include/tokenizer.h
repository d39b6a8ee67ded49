/**
 * @file tokenizer.h
 * @brief AT command line tokenizer.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_TOKENIZER_H_
#define NOVAAT_TOKENIZER_H_

#include <cstddef>
#include <string>

#include "config.h"

namespace at {

/**
 * @brief What a line is, judged by its prefix.
 * @see Tokenizer::reset().
 */
enum class LineKind {
    blank, /**< Empty or whitespace only. */
    command, /**< Starts with 'AT' (any case). */
    repeat, /**< Starts with 'A/', repeat the last command line. */
    unsolicited, /**< Anything else, e.g. '+CREG: 1'. */
};

/** Type marker following a command name. */
enum class Marker {
    none, /**< No marker, execute. */
    query, /**< '?', read. */
    assign, /**< '=', set. */
    assign_query, /**< '=?', test. */
};

/** One command split out of a command line. */
struct Token {
    /** Case normalized command name. */
    std::string name;

    /** Marker found after the name. */
    Marker marker = Marker::none;

    /** Unparsed text following the marker. */
    std::string tail;

    /** V.250 basic command (E0, &F, S7?). */
    bool basic = false;

    /** The tail is a dial string and must not be decoded. */
    bool verbatim = false;

    /** Text of this command within the line, for diagnostics. */
    std::string text;
};

/**
 * @brief Splits an AT command line into commands.
 *
 * Commands are separated by ';' outside of quotes. Basic commands may also
 * follow each other directly (ATE0V1). The tokenizer keeps a pointer to the
 * line passed to reset(), which must outlive the calls to next().
 */
class Tokenizer {
public:
    /**
     * @brief Constructor.
     *
     * @param [in] config - dialect options.
     */
    explicit Tokenizer(const Config &config = Config());

    /**
     * @brief Start tokenizing a new line.
     *
     * Leading and trailing whitespace is ignored. For LineKind::command the
     * commands following the 'AT' prefix are available from next().
     *
     * @param [in] line - newline stripped line.
     * @param [in] size - length of 'line'.
     * @return the kind of line.
     */
    LineKind reset(const char *line, size_t size);

    /**
     * @brief Extract the next command.
     *
     * On a malformed command the tokenizer skips to the next ';' so the
     * remaining commands can still be read. If an unterminated quote hides
     * where the command ends the rest of the line is dropped.
     *
     * @param [out] token - the command.
     * @return 0 on success.
     * @return -ENODATA if there are no more commands.
     * @return -EBADMSG if the command is malformed.
     */
    int next(Token &token);

    /** True when every command in the line has been consumed. */
    inline bool done() const
    {
        return pos >= size;
    }

private:
    /** Scan a '+', '%' or '#' prefixed command. */
    int scan_extended(Token &token);

    /** Scan a single letter, '&' or '\' prefixed command. */
    int scan_basic(Token &token);

    /**
     * @brief Find the ';' ending the command starting at 'from'.
     *
     * @param [in] from - index to start searching.
     * @param [out] end - index of the separator or the line length.
     * @return 0 on success.
     * @return -EBADMSG if an unterminated quote hides a separator.
     */
    int find_end(size_t from, size_t &end) const;

    /** Skip whitespace in [from, end). */
    size_t skip_space(size_t from, size_t end) const;

    /** Copy [from, end) with surrounding whitespace removed. */
    std::string trimmed(size_t from, size_t end) const;

    /** Apply the configured case folding to a command name. */
    std::string normalize(const char *data, size_t size) const;

    /** True if 'c' is a configured dial command letter. */
    bool is_dial(char c) const;

    Config config;                  /**< Dialect options. */
    const char *line = nullptr;     /**< Line being tokenized. */
    size_t size = 0;                /**< Length of the line. */
    size_t pos = 0;                 /**< Read position. */
};

} // namespace at

#endif // NOVAAT_TOKENIZER_H_
