/**
 * @file tokenizer.cpp
 * @brief AT command line tokenizer.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cctype>
#include <cerrno>
#include <cstring>

#include "debug.h"
#include "parameter.h"
#include "tokenizer.h"

/** Characters allowed in an extended command name besides letters/digits. */
static constexpr const char *kNameSymbols = "!%-./:_";

static inline bool is_space(char c)
{
    return isspace(static_cast<unsigned char>(c)) != 0;
}

static inline bool is_alpha(char c)
{
    return isalpha(static_cast<unsigned char>(c)) != 0;
}

static inline bool is_digit(char c)
{
    return isdigit(static_cast<unsigned char>(c)) != 0;
}

static inline char to_upper(char c)
{
    return static_cast<char>(toupper(static_cast<unsigned char>(c)));
}

static inline bool is_name_char(char c)
{
    return isalnum(static_cast<unsigned char>(c))
            || (c != '\0' && strchr(kNameSymbols, c) != nullptr);
}

namespace at {

Tokenizer::Tokenizer(const Config &config) :
        config(config)
{
}

LineKind Tokenizer::reset(const char *data, size_t length)
{
    line = data;
    size = (data != nullptr) ? length : 0;
    pos = 0;

    while (pos < size && is_space(line[pos]))
        pos += 1;

    while (size > pos && is_space(line[size - 1]))
        size -= 1;

    if (pos >= size)
        return LineKind::blank;

    if ((size - pos) >= 2 && to_upper(line[pos]) == 'A') {
        if (to_upper(line[pos + 1]) == 'T') {
            pos += 2;
            return LineKind::command;
        }
        else if (line[pos + 1] == '/') {
            pos = size;
            return LineKind::repeat;
        }
    }

    pos = size;
    return LineKind::unsolicited;
}

int Tokenizer::next(Token &token)
{
    token = Token();

    // Skip separators and empty commands
    while (pos < size && (line[pos] == ';' || is_space(line[pos])))
        pos += 1;

    if (pos >= size)
        return -ENODATA;

    const size_t start = pos;
    const char c = line[pos];

    int result = -EBADMSG;
    if (c == '+' || c == '%' || c == '#')
        result = scan_extended(token);
    else if (c == '&' || c == '\\' || is_alpha(c))
        result = scan_basic(token);

    if (result < 0) {
        size_t end = size;
        if (find_end(start, end) < 0)
            end = size;

        token.text = trimmed(start, end);
        LOG_WARN("Malformed command '%s'\n", token.text.c_str());

        pos = end;
        return result;
    }

    token.text = trimmed(start, pos);
    return 0;
}

int Tokenizer::scan_extended(Token &token)
{
    // +CSQ=1,2
    // │   │
    // │   └ i
    // └ pos

    size_t i = pos + 1;
    while (i < size && is_name_char(line[i]))
        i += 1;

    if (i == pos + 1)
        return -EBADMSG;

    token.name = normalize(line + pos, i - pos);
    token.basic = false;

    size_t end = size;
    int result = find_end(i, end);
    if (result < 0)
        return result;

    size_t j = skip_space(i, end);
    if (j < end && line[j] == '=') {
        size_t k = skip_space(j + 1, end);
        if (k < end && line[k] == '?') {
            token.marker = Marker::assign_query;
            token.tail = trimmed(k + 1, end);
        }
        else {
            token.marker = Marker::assign;
            token.tail = std::string(line + j + 1, end - j - 1);
        }
    }
    else if (j < end && line[j] == '?') {
        token.marker = Marker::query;
        token.tail = trimmed(j + 1, end);
    }
    else {
        token.marker = Marker::none;
        token.tail = trimmed(j, end);
    }

    pos = end;
    return 0;
}

int Tokenizer::scan_basic(Token &token)
{
    size_t i = pos;

    if (line[i] == '&' || line[i] == '\\') {
        // &F, \N
        if ((i + 1) >= size || !is_alpha(line[i + 1]))
            return -EBADMSG;

        i += 2;
    }
    else {
        i += 1;
    }

    token.name = normalize(line + pos, i - pos);
    token.basic = true;

    if (to_upper(line[pos]) == 'S' && (i - pos) == 1) {
        // S-parameter number, S7
        const size_t first = i;
        while (i < size && is_digit(line[i]))
            i += 1;

        token.name.append(line + first, i - first);
    }

    if ((i - pos) == 1 && is_dial(line[pos])) {
        // The dial string runs to the end of the line
        token.verbatim = true;
        token.marker = Marker::none;
        token.tail = trimmed(i, size);
        pos = size;
        return 0;
    }

    size_t j = skip_space(i, size);
    if (j < size && line[j] == '=') {
        size_t k = skip_space(j + 1, size);
        if (k < size && line[k] == '?') {
            token.marker = Marker::assign_query;
            pos = k + 1;
        }
        else if (k < size && line[k] == '"') {
            token.marker = Marker::assign;

            size_t close = find_closing_quote(line, size, k);
            if (close >= size) {
                // Left for the decoder to reject
                token.tail = std::string(line + k, size - k);
                pos = size;
            }
            else {
                token.tail = std::string(line + k, close + 1 - k);
                pos = close + 1;
            }
        }
        else {
            token.marker = Marker::assign;

            size_t end = k;
            if (end < size && (line[end] == '+' || line[end] == '-'))
                end += 1;
            while (end < size && is_digit(line[end]))
                end += 1;

            // S7=abc, the value is neither a number nor a string
            if (end == k && k < size && line[k] != ';')
                return -EBADMSG;

            token.tail = std::string(line + k, end - k);
            pos = end;
        }
    }
    else if (j < size && line[j] == '?') {
        token.marker = Marker::query;
        pos = j + 1;
    }
    else {
        // Optional numeric value, E0
        size_t end = j;
        while (end < size && is_digit(line[end]))
            end += 1;

        token.marker = Marker::none;
        token.tail = std::string(line + j, end - j);
        pos = (end > j) ? end : i;
    }

    return 0;
}

int Tokenizer::find_end(size_t from, size_t &end) const
{
    size_t i = from;
    while (i < size && line[i] != ';') {
        if (line[i] == '"') {
            const size_t close = find_closing_quote(line, size, i);
            if (close >= size) {
                // Unterminated quote, only fatal if it hides a separator
                if (memchr(line + i, ';', size - i) != nullptr)
                    return -EBADMSG;

                i = size;
                break;
            }
            i = close;
        }
        i += 1;
    }

    end = (i < size) ? i : size;
    return 0;
}

size_t Tokenizer::skip_space(size_t from, size_t end) const
{
    while (from < end && is_space(line[from]))
        from += 1;

    return from;
}

std::string Tokenizer::trimmed(size_t from, size_t end) const
{
    from = skip_space(from, end);
    while (end > from && is_space(line[end - 1]))
        end -= 1;

    return std::string(line + from, end - from);
}

std::string Tokenizer::normalize(const char *data, size_t length) const
{
    std::string name(data, length);
    if (config.case_insensitive) {
        for (char &c : name)
            c = to_upper(c);
    }

    return name;
}

bool Tokenizer::is_dial(char c) const
{
    if (config.dial_commands == nullptr)
        return false;

    for (const char *p = config.dial_commands; *p != '\0'; ++p) {
        if (to_upper(*p) == to_upper(c))
            return true;
    }

    return false;
}

} // namespace at
