#include <gtest/gtest.h>

#include "atoms.hpp"
#include "client.hpp"

#include <cstdlib>
#include <cstring>
#include <memory>

class AtomCacheTest : public ::testing::Test {
protected:
    std::unique_ptr<Client> client;

    void SetUp() override {
        try {
            client = std::make_unique<Client>();
        } catch (const ConnectionError &e) {
            GTEST_SKIP() << "No X server available: " << e.what();
        }
    }
};

TEST_F(AtomCacheTest, KnowsTheFixedNames) {
    AtomCache atoms(*client);

    EXPECT_EQ(atoms.size(), 13u);
    EXPECT_TRUE(atoms.contains("_NET_WM_STRUT_PARTIAL"));
    EXPECT_TRUE(atoms.contains("UTF8_STRING"));
    EXPECT_FALSE(atoms.contains("_NET_WM_PID"));
}

TEST_F(AtomCacheTest, ResolvingTwiceGivesTheSameAtom) {
    AtomCache atoms(*client);

    xcb_atom_t first = atoms.resolve("_NET_WM_WINDOW_TYPE_DOCK");
    xcb_atom_t second = atoms.resolve("_NET_WM_WINDOW_TYPE_DOCK");

    EXPECT_NE(first, (xcb_atom_t) XCB_ATOM_NONE);
    EXPECT_EQ(first, second);
}

TEST_F(AtomCacheTest, AgreesWithTheServer) {
    AtomCache atoms(*client);

    const char *name = "_NET_WM_STATE_STICKY";
    xcb_intern_atom_reply_t *reply = xcb_intern_atom_reply(client->connection(), xcb_intern_atom(client->connection(), 0, strlen(name), name), nullptr);
    ASSERT_NE(reply, nullptr);

    EXPECT_EQ(atoms.resolve(name), reply->atom);
    free(reply);
}

TEST_F(AtomCacheTest, UnknownNameThrows) {
    AtomCache atoms(*client);

    EXPECT_THROW(atoms.resolve("_NET_WM_NOT_IN_THE_LIST"), AtomNotFound);
    EXPECT_THROW(atoms.resolve_ref(AtomRef(std::string("WM_HINTS"))), AtomNotFound);
}

TEST_F(AtomCacheTest, ResolvedIdsPassThrough) {
    AtomCache atoms(*client);

    EXPECT_EQ(atoms.resolve_ref(AtomRef((xcb_atom_t) XCB_ATOM_CARDINAL)), (xcb_atom_t) XCB_ATOM_CARDINAL);
    EXPECT_EQ(atoms.resolve_ref(AtomRef(std::string("UTF8_STRING"))), atoms.resolve("UTF8_STRING"));
}

TEST_F(AtomCacheTest, UnresolvedCookiesAreDiscarded) {
    {
        AtomCache atoms(*client);
        atoms.resolve("_NET_WM_NAME");
    }

    // The connection must still work once the pending replies were dropped
    AtomCache atoms(*client);
    EXPECT_NE(atoms.resolve("_NET_WM_DESKTOP"), (xcb_atom_t) XCB_ATOM_NONE);
}
