/**
 * @file registry.cpp
 * @brief AT command handler registry.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cctype>
#include <cerrno>
#include <cstring>

#include "debug.h"
#include "registry.h"

namespace at {

uint8_t capabilities(const handler_t &handler)
{
    uint8_t caps = 0;

    if (handler.test)
        caps |= kCanTest;

    if (handler.read)
        caps |= kCanRead;

    if (handler.set)
        caps |= kCanSet;

    if (handler.execute)
        caps |= kCanExecute;

    return caps;
}

handler_cb_t function_for(const handler_t &handler, Type type)
{
    switch (type) {
    case Type::test:
        return handler.test;
    case Type::read:
        return handler.read;
    case Type::set:
        return handler.set;
    case Type::execute:
        return handler.execute;
    }

    return nullptr;
}

bool Registry::is_valid_name(const char *name)
{
    if (name == nullptr || *name == '\0')
        return false;

    const unsigned char first = name[0];

    if (first == '+' || first == '%' || first == '#') {
        if (name[1] == '\0')
            return false;

        for (const char *p = name + 1; *p != '\0'; ++p) {
            if (!isalnum(static_cast<unsigned char>(*p))
                    && strchr("!%-./:_", *p) == nullptr)
                return false;
        }
        return true;
    }

    if (first == '&' || first == '\\')
        return isalpha(static_cast<unsigned char>(name[1])) && name[2] == '\0';

    if (!isalpha(first))
        return false;

    if (toupper(first) == 'S') {
        for (const char *p = name + 1; *p != '\0'; ++p) {
            if (!isdigit(static_cast<unsigned char>(*p)))
                return false;
        }
        return true;
    }

    return name[1] == '\0';
}

/** Returns 'name' in upper case, the form used for lookups. */
static std::string canonical(const char *name)
{
    std::string key(name);
    for (char &c : key)
        c = static_cast<char>(toupper(static_cast<unsigned char>(c)));

    return key;
}

int Registry::register_command(const char *name, const handler_t &handler)
{
    if (!is_valid_name(name) || capabilities(handler) == 0)
        return -EINVAL;

    const std::string key = canonical(name);
    if (handlers.count(key) > 0) {
        LOG_WARN("Handler for %s already registered\n", key.c_str());
        return -EEXIST;
    }

    handlers[key] = handler;

    LOG_INFO("Registered %s (0x%x)\n", key.c_str(), capabilities(handler));
    return 0;
}

int Registry::replace_command(const char *name, const handler_t &handler)
{
    if (!is_valid_name(name) || capabilities(handler) == 0)
        return -EINVAL;

    const std::string key = canonical(name);
    handlers[key] = handler;

    LOG_INFO("Replaced %s (0x%x)\n", key.c_str(), capabilities(handler));
    return 0;
}

void Registry::unregister_command(const char *name)
{
    if (name == nullptr)
        return;

    const std::string key = canonical(name);
    if (handlers.erase(key) > 0)
        LOG_INFO("Unregistered %s\n", key.c_str());
}

const handler_t *Registry::lookup(const std::string &name) const
{
    auto it = handlers.find(name);
    if (it == handlers.end())
        return nullptr;

    return &it->second;
}

} // namespace at
