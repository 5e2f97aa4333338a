#pragma once
/**
 * @file message_codec.hpp
 * @brief Wire envelope and service payload codec for the safeframe protocol.
 *
 * ## Envelope
 *
 * Every message is JSON text holding a flat object with short field names:
 *
 * | key | field                                                         |
 * |-----|---------------------------------------------------------------|
 * | c   | channel                                                       |
 * | e   | slot identifier (sentinel)                                    |
 * | i   | endpoint identity token                                       |
 * | p   | payload: JSON text for standard messages, object for connect  |
 * | s   | service name                                                  |
 *
 * Inbound, an envelope with a non-empty `e` is a channel setup (handshake)
 * message; any other envelope is a standard message whose sentinel travels
 * inside the payload.
 *
 * ## Services
 *
 * Standard payloads are decoded into the closed HostRequest variant, one
 * alternative per service the host acts on. A new alternative that the session
 * does not handle is a compile error at its std::visit call.
 */

#include "sfhost_export.h"
#include "safeframe/geometry.hpp"
#include "utils/result.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sfhost::safeframe
{

namespace fields
{
inline constexpr const char *kChannel = "c";
inline constexpr const char *kSentinel = "e";
inline constexpr const char *kEndpointIdentity = "i";
inline constexpr const char *kPayload = "p";
inline constexpr const char *kService = "s";
inline constexpr const char *kMessage = "message";
} // namespace fields

enum class Service
{
    GeometryUpdate,
    CreativeGeometryUpdate,
    ExpandRequest,
    ExpandResponse,
    RegisterDone,
    CollapseRequest,
    CollapseResponse,
};

SFHOST_EXPORT const char *to_string(Service service) noexcept;
SFHOST_EXPORT std::optional<Service> service_from_string(std::string_view name) noexcept;

/// Expected reasons for dropping an inbound message.
enum class DecodeError
{
    NotJson,         ///< Event data is not parseable JSON
    NotObject,       ///< Event data parsed but is not a JSON object
    PayloadNotJson,  ///< `p` missing, not a string, or not JSON text of an object
    MissingSentinel, ///< Payload carries no usable `sentinel`
};

SFHOST_EXPORT const char *to_string(DecodeError err) noexcept;

// ============================================================================
// Envelopes
// ============================================================================

/// Outbound envelope, posted to the creative's frame.
struct Envelope
{
    std::string            channel;
    std::string            sentinel;
    double                 endpoint_identity{0};
    std::optional<Service> service; ///< Omitted from the wire when unset (connect message)
    nlohmann::json         payload;
};

/// Channel setup message: the sentinel travels at the top level.
struct SetupMessage
{
    std::string sentinel;
    std::string channel; ///< Empty when the creative sent none
};

/// Any other message: service name plus the decoded payload object.
struct StandardMessage
{
    std::string    sentinel;
    std::string    service;
    nlohmann::json payload;
};

using InboundMessage = std::variant<SetupMessage, StandardMessage>;

SFHOST_EXPORT std::string encode_envelope(const Envelope &envelope);

/**
 * @brief Decodes raw event data into a setup or standard message.
 * @return DecodeError for anything that is not a well-formed safeframe message.
 */
[[nodiscard]] SFHOST_EXPORT Result<InboundMessage, DecodeError>
decode_inbound(std::string_view data);

// ============================================================================
// Service requests
// ============================================================================

/// `creative_geometry_update`: fluid creative asks for a new height.
struct FluidResizeRequest
{
    std::optional<int> height; ///< Leading integer of payload.height, if any
};

/// `expand_request`: rectangle whose extent is the requested size.
struct SFHOST_EXPORT ExpandRequest
{
    std::optional<double> expand_t;
    std::optional<double> expand_b;
    std::optional<double> expand_r;
    std::optional<double> expand_l;

    /// (expand_b - expand_t, expand_r - expand_l) rounded, or nullopt if a side is
    /// missing or an extent is not finite or outside the int range.
    std::optional<FrameSize> target_size() const;
};

/// `collapse_request`: return to the size reported in register_done.
struct CollapseRequest
{
};

/// `register_done`: creative finished rendering at its initial size.
struct RegisterDone
{
    std::optional<int> initial_height;
    std::optional<int> initial_width;
};

/// Any service the host does not act on, including host-to-creative names.
struct UnhandledService
{
    std::string name;
};

using HostRequest =
    std::variant<FluidResizeRequest, ExpandRequest, CollapseRequest, RegisterDone, UnhandledService>;

SFHOST_EXPORT HostRequest decode_request(std::string_view service, const nlohmann::json &payload);

} // namespace sfhost::safeframe
