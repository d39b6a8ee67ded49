/**
 * @file dispatcher.cpp
 * @brief AT command dispatcher.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cerrno>
#include <cstring>
#include <exception>

#include "classifier.h"
#include "debug.h"
#include "dispatcher.h"
#include "parameter.h"

namespace at {

Dispatcher::Dispatcher(const Registry &registry, const Config &config) :
        registry(registry), cfg(config)
{
}

void Dispatcher::set_unsolicited_callback(unsolicited_cb_t func, void *user)
{
    unsolicited_cb = func;
    unsolicited_cb_user = user;
}

int Dispatcher::handle(const std::string &line, std::vector<Response> &responses)
{
    return handle(line.data(), line.size(), responses);
}

int Dispatcher::handle(
        const char *line, size_t size, std::vector<Response> &responses)
{
    responses.clear();

    if (line == nullptr)
        return -EINVAL;

    if (memchr(line, '\0', size) != nullptr
            || memchr(line, '\r', size) != nullptr
            || memchr(line, '\n', size) != nullptr) {
        LOG_ERROR("Line is not newline stripped text\n");
        return -EINVAL;
    }

    LOG_TRACE("<< %.*s\n", static_cast<int>(size), line);

    Tokenizer tokenizer(cfg);
    switch (tokenizer.reset(line, size)) {
    case LineKind::blank:
        return -ENODATA;
    case LineKind::unsolicited:
        LOG_VERBOSE("Unsolicited '%.*s'\n", static_cast<int>(size), line);
        emit_unsolicited(line, size);
        return -ENOMSG;
    case LineKind::repeat: {
        if (history.empty()) {
            LOG_WARN("Nothing to repeat\n");

            Response rsp;
            reject(Token(), -ENOENT, rsp);
            responses.push_back(rsp);
            return 0;
        }

        // 'run' may replace the history, work on a copy
        const std::string previous = history;
        if (tokenizer.reset(previous.data(), previous.size()) != LineKind::command)
            return -EINVAL;

        run(tokenizer, previous, responses);
        return 0;
    }
    case LineKind::command:
        break;
    }

    const std::string raw(line, size);
    if (run(tokenizer, raw, responses))
        history = raw;

    return 0;
}

bool Dispatcher::run(Tokenizer &tokenizer, const std::string &raw,
        std::vector<Response> &responses)
{
    bool dispatched = false;

    while (true) {
        Token token;
        const int result = tokenizer.next(token);
        if (result == -ENODATA)
            break;

        Response rsp;
        if (result < 0)
            reject(token, result, rsp);
        else if (dispatch(token, raw, rsp) == 0)
            dispatched = true;

        responses.push_back(rsp);
    }

    if (responses.empty()) {
        // Bare 'AT'
        Response rsp;
        rsp.complete();
        responses.push_back(rsp);
    }

    return dispatched;
}

int Dispatcher::dispatch(const Token &token, const std::string &raw, Response &rsp)
{
    Type type = Type::execute;
    int result = classify(token, cfg, type);
    if (result < 0)
        return reject(token, result, rsp);

    std::vector<Parameter> params;
    if (token.verbatim) {
        if (!token.tail.empty())
            params.push_back(Parameter::token(token.tail));
    }
    else if (type == Type::set || (type == Type::execute && !token.tail.empty())) {
        result = decode_parameters(token.tail, params);
        if (result < 0)
            return reject(token, result, rsp);
    }

    const Command cmd(token.name, type, params, raw);

    const handler_t *handler = registry.lookup(cmd.name());
    if (handler == nullptr)
        return reject(token, -ENOENT, rsp);

    handler_cb_t func = function_for(*handler, type);
    if (func == nullptr)
        return reject(token, -ENOTSUP, rsp);

    LOG_VERBOSE("Dispatch %s (%s, %u parameters)\n", cmd.name().c_str(),
            type_name(type), static_cast<unsigned>(params.size()));

    return invoke(func, handler->user, cmd, rsp);
}

int Dispatcher::invoke(
        handler_cb_t func, void *user, const Command &cmd, Response &rsp)
{
    int result = 0;

    try {
        result = func(cmd, rsp, user);
    }
    catch (const std::exception &e) {
        LOG_ERROR("%s handler threw: %s\n", cmd.name().c_str(), e.what());
        result = -EFAULT;
    }
    catch (...) {
        LOG_ERROR("%s handler threw an unknown exception\n", cmd.name().c_str());
        result = -EFAULT;
    }

    if (rsp.closed()) {
        // Handlers choose the status through their return value
        LOG_WARN("%s handler closed its response\n", cmd.name().c_str());
        return (rsp.status() == Status::error
                || rsp.status() == Status::cme_error) ? -EPROTO : 0;
    }

    if (result < 0) {
        LOG_WARN("%s failed (%d)\n", cmd.name().c_str(), result);
        rsp.fail(Cause::handler_failure, cfg.extended_errors);
        return result;
    }

    rsp.complete();
    return 0;
}

int Dispatcher::reject(const Token &token, int error, Response &rsp)
{
    const Cause cause = cause_of(error);

    LOG_WARN("Rejected '%s': %s\n", token.text.c_str(), cause_name(cause));

    // Parse and lookup failures never carry a CME code
    rsp.fail(cause, false);
    return error;
}

} // namespace at
