/**
 * @file test_session_registry.cpp
 * @brief Tests for slot id -> HostSession registration and lookup.
 */
#include "sfh_base.hpp"
#include "safeframe/host_session.hpp"
#include "safeframe/session_registry.hpp"
#include "test_framework/fake_slot.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

using namespace sfhost;
using namespace sfhost::safeframe;
using namespace sfhost::test;

class SessionRegistryTest : public ::testing::Test
{
  protected:
    std::unique_ptr<HostSession> make_session(const std::string &slot_id, FakeSlotElement &slot)
    {
        return std::make_unique<HostSession>(slot_id, slot, registry, tokens, config);
    }

    SessionRegistry  registry;
    FixedTokenSource tokens{{0.1, 0.2, 0.3, 0.4, 0.5, 0.6}};
    HostConfig       config;
    FakeSlotElement  slot_a;
    FakeSlotElement  slot_b;
};

TEST_F(SessionRegistryTest, SessionRegistersItselfOnConstruction)
{
    auto a = make_session("slot-a", slot_a);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find_session("slot-a"), a.get());
}

TEST_F(SessionRegistryTest, LookupIsKeyedBySlotId)
{
    auto a = make_session("slot-a", slot_a);
    auto b = make_session("slot-b", slot_b);

    EXPECT_EQ(registry.find_session("slot-a"), a.get());
    EXPECT_EQ(registry.find_session("slot-b"), b.get());
    EXPECT_EQ(registry.find_session("slot-c"), nullptr);
    EXPECT_EQ(registry.find_session(""), nullptr);

    auto slots = registry.list_slots();
    std::sort(slots.begin(), slots.end());
    EXPECT_EQ(slots, (std::vector<std::string>{"slot-a", "slot-b"}));
}

TEST_F(SessionRegistryTest, FirstRegistrationWins)
{
    auto first = make_session("slot-a", slot_a);
    auto second = make_session("slot-a", slot_b);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find_session("slot-a"), first.get());
    EXPECT_FALSE(registry.register_session(*second));
}

TEST_F(SessionRegistryTest, ReRegisteringSameSessionIsIdempotent)
{
    auto a = make_session("slot-a", slot_a);
    EXPECT_TRUE(registry.register_session(*a));
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(SessionRegistryTest, DestroyedSessionUnregisters)
{
    auto a = make_session("slot-a", slot_a);
    a.reset();
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.find_session("slot-a"), nullptr);
}

TEST_F(SessionRegistryTest, DestroyingLosingDuplicateKeepsOwner)
{
    auto first = make_session("slot-a", slot_a);
    auto second = make_session("slot-a", slot_b);
    second.reset();
    EXPECT_EQ(registry.find_session("slot-a"), first.get());
}

TEST_F(SessionRegistryTest, UnregisterRequiresMatchingSession)
{
    auto a = make_session("slot-a", slot_a);
    EXPECT_FALSE(registry.unregister_session("slot-a", nullptr));
    EXPECT_FALSE(registry.unregister_session("slot-x", a.get()));
    EXPECT_TRUE(registry.unregister_session("slot-a", a.get()));
    EXPECT_EQ(registry.size(), 0u);
}
