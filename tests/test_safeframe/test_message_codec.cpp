/**
 * @file test_message_codec.cpp
 * @brief Tests for envelope encoding, inbound classification and request decoding.
 */
#include "sfh_base.hpp"
#include "safeframe/message_codec.hpp"

#include <gtest/gtest.h>

using namespace sfhost::safeframe;
using json = nlohmann::json;

// ============================================================================
// Service names
// ============================================================================

TEST(MessageCodecTest, ServiceNamesMatchWire)
{
    const Service all[] = {Service::GeometryUpdate,  Service::CreativeGeometryUpdate,
                           Service::ExpandRequest,   Service::ExpandResponse,
                           Service::RegisterDone,    Service::CollapseRequest,
                           Service::CollapseResponse};
    for (Service s : all)
    {
        EXPECT_EQ(service_from_string(to_string(s)), s) << to_string(s);
    }
    EXPECT_STREQ(to_string(Service::CreativeGeometryUpdate), "creative_geometry_update");
    EXPECT_FALSE(service_from_string("resize_request").has_value());
}

// ============================================================================
// encode_envelope
// ============================================================================

TEST(MessageCodecTest, Encode_StandardEnvelope)
{
    Envelope env;
    env.channel = "chan-1";
    env.sentinel = "slot-1";
    env.endpoint_identity = 0.25;
    env.service = Service::ExpandResponse;
    env.payload = json{{"uid", 0.5}}.dump();

    const json j = json::parse(encode_envelope(env));
    EXPECT_EQ(j.at("c"), "chan-1");
    EXPECT_EQ(j.at("e"), "slot-1");
    EXPECT_EQ(j.at("i"), 0.25);
    EXPECT_EQ(j.at("s"), "expand_response");
    ASSERT_TRUE(j.at("p").is_string());
    EXPECT_EQ(json::parse(j.at("p").get<std::string>()).at("uid"), 0.5);
}

TEST(MessageCodecTest, Encode_ConnectOmitsService)
{
    Envelope env;
    env.channel = "chan-1";
    env.sentinel = "slot-1";
    env.payload = json{{"message", "connect"}, {"c", "chan-1"}};

    const json j = json::parse(encode_envelope(env));
    EXPECT_FALSE(j.contains("s"));
    ASSERT_TRUE(j.at("p").is_object());
    EXPECT_EQ(j.at("p").at("message"), "connect");
}

// ============================================================================
// decode_inbound
// ============================================================================

TEST(MessageCodecTest, Decode_SetupMessage)
{
    auto r = decode_inbound(R"({"c":"chan-7","e":"slot-3"})");
    ASSERT_TRUE(r.is_ok());
    const auto *setup = std::get_if<SetupMessage>(&r.content());
    ASSERT_NE(setup, nullptr);
    EXPECT_EQ(setup->sentinel, "slot-3");
    EXPECT_EQ(setup->channel, "chan-7");
}

TEST(MessageCodecTest, Decode_SetupWithoutChannel)
{
    auto r = decode_inbound(R"({"e":"slot-3"})");
    ASSERT_TRUE(r.is_ok());
    const auto *setup = std::get_if<SetupMessage>(&r.content());
    ASSERT_NE(setup, nullptr);
    EXPECT_TRUE(setup->channel.empty());
}

TEST(MessageCodecTest, Decode_StandardMessage)
{
    const json payload = {{"sentinel", "slot-3"}, {"expand_t", 0}, {"expand_b", 100}};
    const std::string data =
        json{{"c", "chan-7"}, {"s", "expand_request"}, {"p", payload.dump()}}.dump();

    auto r = decode_inbound(data);
    ASSERT_TRUE(r.is_ok());
    const auto *standard = std::get_if<StandardMessage>(&r.content());
    ASSERT_NE(standard, nullptr);
    EXPECT_EQ(standard->sentinel, "slot-3");
    EXPECT_EQ(standard->service, "expand_request");
    EXPECT_EQ(standard->payload, payload);
}

TEST(MessageCodecTest, Decode_EmptyTopLevelSentinelIsStandard)
{
    const std::string data =
        json{{"e", ""}, {"s", "register_done"}, {"p", R"({"sentinel":"slot-3"})"}}.dump();
    auto r = decode_inbound(data);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(std::holds_alternative<StandardMessage>(r.content()));
}

TEST(MessageCodecTest, Decode_Errors)
{
    EXPECT_EQ(decode_inbound("not json").error(), DecodeError::NotJson);
    EXPECT_EQ(decode_inbound("").error(), DecodeError::NotJson);
    EXPECT_EQ(decode_inbound("[1,2]").error(), DecodeError::NotObject);
    EXPECT_EQ(decode_inbound(R"("text")").error(), DecodeError::NotObject);
    EXPECT_EQ(decode_inbound(R"({"s":"x"})").error(), DecodeError::PayloadNotJson);
    EXPECT_EQ(decode_inbound(R"({"p":{"sentinel":"a"}})").error(), DecodeError::PayloadNotJson);
    EXPECT_EQ(decode_inbound(R"({"p":"{oops"})").error(), DecodeError::PayloadNotJson);
    EXPECT_EQ(decode_inbound(R"({"p":"[]"})").error(), DecodeError::PayloadNotJson);
    EXPECT_EQ(decode_inbound(R"({"p":"{}"})").error(), DecodeError::MissingSentinel);
    EXPECT_EQ(decode_inbound(R"({"p":"{\"sentinel\":7}"})").error(),
              DecodeError::MissingSentinel);
    EXPECT_EQ(decode_inbound(R"({"p":"{\"sentinel\":\"\"}"})").error(),
              DecodeError::MissingSentinel);
}

// ============================================================================
// decode_request
// ============================================================================

TEST(MessageCodecTest, Request_FluidHeightLeadingInteger)
{
    auto req = decode_request("creative_geometry_update", json{{"height", "120px"}});
    ASSERT_TRUE(std::holds_alternative<FluidResizeRequest>(req));
    EXPECT_EQ(std::get<FluidResizeRequest>(req).height, 120);

    req = decode_request("creative_geometry_update", json{{"height", 99.9}});
    EXPECT_EQ(std::get<FluidResizeRequest>(req).height, 99);

    req = decode_request("creative_geometry_update", json{{"height", "abc"}});
    EXPECT_FALSE(std::get<FluidResizeRequest>(req).height.has_value());

    req = decode_request("creative_geometry_update", json::object());
    EXPECT_FALSE(std::get<FluidResizeRequest>(req).height.has_value());
}

TEST(MessageCodecTest, Request_ExpandTargetSize)
{
    const auto req = decode_request(
        "expand_request",
        json{{"expand_t", 10}, {"expand_b", 110}, {"expand_l", 5}, {"expand_r", 205}});
    ASSERT_TRUE(std::holds_alternative<ExpandRequest>(req));
    const auto size = std::get<ExpandRequest>(req).target_size();
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(size->height, 100);
    EXPECT_EQ(size->width, 200);
}

TEST(MessageCodecTest, Request_ExpandMissingSide)
{
    const auto req =
        decode_request("expand_request", json{{"expand_t", 0}, {"expand_b", "100"}});
    EXPECT_FALSE(std::get<ExpandRequest>(req).target_size().has_value());
}

TEST(MessageCodecTest, Request_ExpandOutOfRangeHasNoTargetSize)
{
    auto req = decode_request(
        "expand_request",
        json{{"expand_t", 0}, {"expand_b", 5e9}, {"expand_l", 0}, {"expand_r", 300}});
    EXPECT_FALSE(std::get<ExpandRequest>(req).target_size().has_value());

    req = decode_request(
        "expand_request",
        json{{"expand_t", 0}, {"expand_b", 90}, {"expand_l", 3e9}, {"expand_r", -3e9}});
    EXPECT_FALSE(std::get<ExpandRequest>(req).target_size().has_value());
}

TEST(MessageCodecTest, Request_RegisterDone)
{
    const auto req =
        decode_request("register_done", json{{"initialHeight", 250}, {"initialWidth", "300"}});
    ASSERT_TRUE(std::holds_alternative<RegisterDone>(req));
    EXPECT_EQ(std::get<RegisterDone>(req).initial_height, 250);
    EXPECT_EQ(std::get<RegisterDone>(req).initial_width, 300);
}

TEST(MessageCodecTest, Request_CollapseAndUnhandled)
{
    EXPECT_TRUE(std::holds_alternative<CollapseRequest>(
        decode_request("collapse_request", json::object())));

    const auto unknown = decode_request("something_new", json::object());
    ASSERT_TRUE(std::holds_alternative<UnhandledService>(unknown));
    EXPECT_EQ(std::get<UnhandledService>(unknown).name, "something_new");

    // Host-to-creative services arriving inbound are not acted on.
    EXPECT_TRUE(std::holds_alternative<UnhandledService>(
        decode_request("expand_response", json::object())));
    EXPECT_TRUE(std::holds_alternative<UnhandledService>(
        decode_request("geometry_update", json::object())));
}
