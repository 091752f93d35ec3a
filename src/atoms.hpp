#pragma once

// C++ includes
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>

// Libraries
#include <xcb/xcb.h>

// Forward declaration
class Client;

class AtomNotFound : public std::out_of_range {
public:
    explicit AtomNotFound(const std::string &name);
};

// Either an atom id that is already known or the name of one still to be resolved
using AtomRef = std::variant<xcb_atom_t, std::string>;

/*
 * Read only cache of the atoms used by the bar.
 *
 * All InternAtom requests are sent when the cache is constructed, a reply is
 * only waited for the first time its atom is resolved.
 */
class AtomCache {
public:

    static const char *const names[];

    explicit AtomCache(Client &client);
    ~AtomCache();

    AtomCache(const AtomCache &) = delete;
    AtomCache &operator=(const AtomCache &) = delete;

    xcb_atom_t resolve(const std::string &name);
    xcb_atom_t resolve_ref(const AtomRef &ref);

    bool contains(const std::string &name) const;
    size_t size() const;

private:

    Client &__client;
    std::unordered_map<std::string, xcb_intern_atom_cookie_t> __cookies;
    std::unordered_map<std::string, xcb_atom_t> __atoms;

};
