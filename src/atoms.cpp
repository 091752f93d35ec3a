#include "atoms.hpp"

#include "client.hpp"
#include "common.hpp"

// C includes
#include <stdlib.h>
#include <string.h>

AtomNotFound::AtomNotFound(const std::string &name) : std::out_of_range(format("Atom '%s' is not known to the atom cache", name.c_str())) {}

const char *const AtomCache::names[] = {
    "_NET_WM_WINDOW_TYPE",
    "_NET_WM_WINDOW_TYPE_DOCK",
    "_NET_WM_DESKTOP",
    "_NET_WM_STRUT_PARTIAL",
    "_NET_WM_STRUT",
    "_NET_WM_STATE",
    "_NET_WM_STATE_ABOVE",
    "_NET_WM_STATE_STICKY",
    "_NET_WM_NAME",
    "_NET_WM_ICON_NAME",
    "_NET_WM_CLASS",
    "_NET_WM_WINDOW_OPACITY",
    "UTF8_STRING",
    nullptr,
};

AtomCache::AtomCache(Client &client) : __client(client) {
    for (const char *const *name = names; *name; name++) {
        __cookies.emplace(*name, xcb_intern_atom_unchecked(__client.connection(), 0, strlen(*name), *name));
    }

    tracef("Requested %zu atoms", __cookies.size());
}

AtomCache::~AtomCache() {
    for (const auto &[name, cookie] : __cookies) {
        if (!__atoms.count(name)) xcb_discard_reply(__client.connection(), cookie.sequence);
    }
}

xcb_atom_t AtomCache::resolve(const std::string &name) {
    if (auto atom = __atoms.find(name); atom != __atoms.end()) return atom->second;

    auto cookie = __cookies.find(name);
    if (cookie == __cookies.end()) throw AtomNotFound(name);

    xcb_intern_atom_reply_t *reply = xcb_intern_atom_reply(__client.connection(), cookie->second, nullptr);
    if (!reply) throw std::runtime_error(format("Failed to intern atom '%s'", name.c_str()));

    xcb_atom_t atom = reply->atom;
    free(reply);

    tracef("Resolved atom %s = %u", name.c_str(), atom);

    __atoms.emplace(name, atom);
    return atom;
}

xcb_atom_t AtomCache::resolve_ref(const AtomRef &ref) {
    if (const xcb_atom_t *atom = std::get_if<xcb_atom_t>(&ref)) return *atom;
    return resolve(std::get<std::string>(ref));
}

bool AtomCache::contains(const std::string &name) const {
    return __cookies.count(name) != 0;
}

size_t AtomCache::size() const {
    return __cookies.size();
}
