/**
 * @file test_host_session.cpp
 * @brief Tests for the HostSession state machine: handshake, queueing, geometry push.
 *
 * The session is driven directly here; routing is covered in test_message_router.cpp
 * and the resize flows in test_size_negotiator.cpp.
 */
#include "sfh_base.hpp"
#include "safeframe/host_session.hpp"
#include "safeframe/session_registry.hpp"
#include "test_framework/fake_slot.h"

#include <gtest/gtest.h>

using namespace sfhost;
using namespace sfhost::safeframe;
using namespace sfhost::test;
using json = nlohmann::json;

class HostSessionTest : public ::testing::Test
{
  protected:
    HostSessionTest() : session("slot-1", slot, registry, tokens, config) {}

    FakeFrameWindow &frame() { return slot.window; }

    SessionRegistry  registry;
    FixedTokenSource tokens{{0.125, 0.75}};
    HostConfig       config;
    FakeSlotElement  slot;
    HostSession      session;
};

// ============================================================================
// Construction and slot attributes
// ============================================================================

TEST_F(HostSessionTest, DrawsIdentityThenUid)
{
    EXPECT_DOUBLE_EQ(session.endpoint_identity(), 0.125);
    EXPECT_DOUBLE_EQ(session.uid(), 0.75);
    EXPECT_EQ(session.state(), SessionState::Registered);
    EXPECT_FALSE(session.channel().has_value());
    EXPECT_EQ(registry.find_session("slot-1"), &session);
}

TEST_F(HostSessionTest, NameAttributes)
{
    slot.fluid = true;
    const json attrs = session.name_attributes();

    EXPECT_DOUBLE_EQ(attrs.at("uid").get<double>(), 0.75);
    EXPECT_EQ(attrs.at("hostPeerName"), "https://publisher.example");
    EXPECT_EQ(attrs.at("sentinel"), "slot-1");
    EXPECT_EQ(attrs.at("reportCreativeGeometry"), true);
    EXPECT_EQ(attrs.at("isDifferentSourceWindow"), false);

    ASSERT_TRUE(attrs.at("initialGeometry").is_string());
    const json geometry = json::parse(attrs.at("initialGeometry").get<std::string>());
    EXPECT_EQ(geometry.at("frameCoords_b"), 350);
    EXPECT_EQ(geometry.at("styleZIndex"), "1");
    ASSERT_TRUE(session.current_geometry().has_value());
    EXPECT_EQ(serialize_geometry(*session.current_geometry()),
              attrs.at("initialGeometry").get<std::string>());

    const json permissions = json::parse(attrs.at("permissions").get<std::string>());
    EXPECT_EQ(permissions, (json{{"expandByOverlay", false},
                                 {"expandByPush", false},
                                 {"readCookie", false},
                                 {"writeCookie", false}}));

    const json metadata = json::parse(attrs.at("metadata").get<std::string>());
    EXPECT_EQ(metadata.at("shared").at("sf_ver"), "1-0-14");
    EXPECT_EQ(metadata.at("shared").at("ck_on"), 1);
    EXPECT_EQ(metadata.at("shared").at("flash_ver"), "26.0.0");
}

// ============================================================================
// Channel handshake
// ============================================================================

TEST_F(HostSessionTest, ConnectSendsConnectEnvelope)
{
    session.connect_messaging_channel("chan-1");

    EXPECT_EQ(session.state(), SessionState::ChannelEstablished);
    EXPECT_EQ(session.channel(), "chan-1");

    ASSERT_EQ(frame().posts.size(), 1u);
    EXPECT_EQ(frame().posts[0].target_origin, kTrustedOrigin);
    const json env = frame().posts[0].json();
    EXPECT_EQ(env.at("c"), "chan-1");
    EXPECT_EQ(env.at("e"), "slot-1");
    EXPECT_DOUBLE_EQ(env.at("i").get<double>(), 0.125);
    EXPECT_FALSE(env.contains("s"));
    EXPECT_EQ(env.at("p"), (json{{"message", "connect"}, {"c", "chan-1"}}));
}

TEST_F(HostSessionTest, ChannelIsSetOnlyOnce)
{
    session.connect_messaging_channel("chan-1");
    session.connect_messaging_channel("chan-2");

    EXPECT_EQ(session.channel(), "chan-1");
    EXPECT_EQ(frame().posts.size(), 1u);
    EXPECT_EQ(slot.observers_created, 1);
}

TEST_F(HostSessionTest, EmptyChannelIsIgnored)
{
    session.connect_messaging_channel("");
    EXPECT_EQ(session.state(), SessionState::Registered);
    EXPECT_TRUE(frame().posts.empty());

    session.connect_messaging_channel("chan-9");
    EXPECT_EQ(session.channel(), "chan-9");
}

TEST_F(HostSessionTest, MissingFrameAtConnectThrows)
{
    slot.frame_available = false;
    EXPECT_THROW(session.connect_messaging_channel("chan-1"), FrameUnavailableError);
    EXPECT_EQ(session.state(), SessionState::Registered);
    EXPECT_FALSE(session.channel().has_value());
}

TEST_F(HostSessionTest, SendBeforeChannelThrows)
{
    EXPECT_THROW(session.send_message(json::object().dump(), Service::ExpandResponse),
                 FrameUnavailableError);
    EXPECT_THROW(session.post_to_frame(json::object()), FrameUnavailableError);
}

TEST_F(HostSessionTest, FrameLostAfterConnectThrowsOnSend)
{
    session.connect_messaging_channel("chan-1");
    slot.frame_available = false;
    EXPECT_THROW(session.send_message(json::object().dump(), Service::ExpandResponse),
                 FrameUnavailableError);
}

// ============================================================================
// Queued standard messages
// ============================================================================

TEST_F(HostSessionTest, MessagesBeforeChannelAreQueuedThenReplayedInOrder)
{
    slot.resize_mode = FakeSlotElement::ResizeMode::Defer;

    session.process_message(json{{"initialHeight", 60}, {"initialWidth", 320}}, "register_done");
    session.process_message(json::object(), "collapse_request");

    EXPECT_EQ(session.pending_message_count(), 2u);
    EXPECT_FALSE(session.initial_size().has_value());
    EXPECT_TRUE(slot.attempts.empty());
    EXPECT_TRUE(frame().posts.empty());

    session.connect_messaging_channel("chan-1");

    EXPECT_EQ(session.pending_message_count(), 0u);
    ASSERT_TRUE(session.initial_size().has_value());
    EXPECT_EQ(*session.initial_size(), (FrameSize{60, 320}));
    // register_done ran first, so the collapse targets the reported size.
    ASSERT_EQ(slot.attempts.size(), 1u);
    EXPECT_EQ(slot.attempts[0].height, 60);
    EXPECT_EQ(slot.attempts[0].width, 320);
    // Only the connect envelope so far; the collapse response waits for the page.
    EXPECT_EQ(frame().posts.size(), 1u);
}

TEST_F(HostSessionTest, FrameLostDuringReplayClearsQueue)
{
    const json expand{{"expand_t", 0}, {"expand_b", 90}, {"expand_r", 728}, {"expand_l", 0}};
    session.process_message(expand, "expand_request");
    session.process_message(expand, "expand_request");
    ASSERT_EQ(session.pending_message_count(), 2u);

    // The frame goes away while the first replayed resize is being applied.
    slot.on_attempt = [this] { slot.frame_available = false; };

    EXPECT_THROW(session.connect_messaging_channel("chan-1"), FrameUnavailableError);
    EXPECT_EQ(session.pending_message_count(), 0u);
    EXPECT_EQ(slot.attempts.size(), 1u);
    EXPECT_EQ(session.state(), SessionState::ChannelEstablished);
}

TEST_F(HostSessionTest, PendingQueueIsBounded)
{
    for (size_t i = 0; i < HostSession::kMaxPendingMessages + 5; ++i)
        session.process_message(json::object(), "unknown_" + std::to_string(i));
    EXPECT_EQ(session.pending_message_count(), HostSession::kMaxPendingMessages);
}

TEST_F(HostSessionTest, UnknownServiceIsIgnored)
{
    session.connect_messaging_channel("chan-1");
    session.process_message(json{{"x", 1}}, "no_such_service");
    session.process_message(json::object(), "expand_response");

    EXPECT_EQ(frame().posts.size(), 1u);
    EXPECT_TRUE(slot.attempts.empty());
}

// ============================================================================
// register_done
// ============================================================================

TEST_F(HostSessionTest, RegisterDoneCapturedOnce)
{
    session.connect_messaging_channel("chan-1");
    session.process_message(json{{"initialHeight", 50}, {"initialWidth", 300}}, "register_done");
    session.process_message(json{{"initialHeight", 90}, {"initialWidth", 728}}, "register_done");

    ASSERT_TRUE(session.initial_size().has_value());
    EXPECT_EQ(*session.initial_size(), (FrameSize{50, 300}));
    EXPECT_EQ(frame().posts.size(), 1u);
}

TEST_F(HostSessionTest, RegisterDoneWithoutSizeIsIgnored)
{
    session.connect_messaging_channel("chan-1");
    session.process_message(json{{"initialHeight", 50}}, "register_done");
    EXPECT_FALSE(session.initial_size().has_value());
}

// ============================================================================
// Geometry push
// ============================================================================

TEST_F(HostSessionTest, VisibilityChangePushesGeometryUpdate)
{
    session.connect_messaging_channel("chan-1");

    IntersectionEntry moved;
    moved.root_bounds = Rect{0, 1000, 800, 0};
    moved.bounding_client_rect = Rect{700, 300, 900, 0};
    slot.observe(moved);

    const auto updates = frame().envelopes_for("geometry_update");
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].at("c"), "chan-1");
    ASSERT_TRUE(updates[0].at("p").is_string());

    const json payload = json::parse(updates[0].at("p").get<std::string>());
    EXPECT_DOUBLE_EQ(payload.at("uid").get<double>(), 0.75);
    const json geometry = json::parse(payload.at("newGeometry").get<std::string>());
    EXPECT_DOUBLE_EQ(geometry.at("xInView").get<double>(), 0.5);
    EXPECT_DOUBLE_EQ(geometry.at("yInView").get<double>(), 1.0);

    ASSERT_TRUE(session.current_geometry().has_value());
    EXPECT_EQ(session.current_geometry()->frame_coords, moved.bounding_client_rect);
}

TEST_F(HostSessionTest, NoGeometryPushBeforeChannel)
{
    slot.observe(slot.entry);
    EXPECT_EQ(slot.observers_created, 0);
    EXPECT_TRUE(frame().posts.empty());
}
