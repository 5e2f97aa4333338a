#include "sfh_base.hpp"
#include "safeframe/message_codec.hpp"

#include <cmath>
#include <limits>

namespace sfhost::safeframe
{

namespace
{

/// Parses JSON text without throwing; returns a discarded value on failure.
nlohmann::json try_parse_json(std::string_view text)
{
    return nlohmann::json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
}

/// Reads an integer field the way a creative sends it: number or numeric string.
std::optional<int> read_int(const nlohmann::json &payload, const char *key)
{
    if (!payload.is_object() || !payload.contains(key))
        return std::nullopt;
    const auto &v = payload.at(key);
    if (v.is_number_integer())
    {
        const auto n = v.get<int64_t>();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max())
            return std::nullopt;
        return static_cast<int>(n);
    }
    if (v.is_number_float())
    {
        const double d = std::trunc(v.get<double>());
        if (!std::isfinite(d) || d < std::numeric_limits<int>::min() ||
            d > std::numeric_limits<int>::max())
            return std::nullopt;
        return static_cast<int>(d);
    }
    if (v.is_string())
        return format_tools::parse_leading_int(v.get_ref<const std::string &>());
    return std::nullopt;
}

/// Rounds a rectangle extent to int; nullopt if it is not finite or does not fit.
std::optional<int> extent_to_int(double extent)
{
    const double rounded = std::round(extent);
    if (!std::isfinite(rounded) || rounded < std::numeric_limits<int>::min() ||
        rounded > std::numeric_limits<int>::max())
        return std::nullopt;
    return static_cast<int>(rounded);
}

std::optional<double> read_number(const nlohmann::json &payload, const char *key)
{
    if (!payload.is_object() || !payload.contains(key))
        return std::nullopt;
    const auto &v = payload.at(key);
    if (!v.is_number())
        return std::nullopt;
    return v.get<double>();
}

} // namespace

// ============================================================================
// Names
// ============================================================================

const char *to_string(Service service) noexcept
{
    switch (service)
    {
    case Service::GeometryUpdate:         return "geometry_update";
    case Service::CreativeGeometryUpdate: return "creative_geometry_update";
    case Service::ExpandRequest:          return "expand_request";
    case Service::ExpandResponse:         return "expand_response";
    case Service::RegisterDone:           return "register_done";
    case Service::CollapseRequest:        return "collapse_request";
    case Service::CollapseResponse:       return "collapse_response";
    }
    return "unknown";
}

std::optional<Service> service_from_string(std::string_view name) noexcept
{
    if (name == "geometry_update")          return Service::GeometryUpdate;
    if (name == "creative_geometry_update") return Service::CreativeGeometryUpdate;
    if (name == "expand_request")           return Service::ExpandRequest;
    if (name == "expand_response")          return Service::ExpandResponse;
    if (name == "register_done")            return Service::RegisterDone;
    if (name == "collapse_request")         return Service::CollapseRequest;
    if (name == "collapse_response")        return Service::CollapseResponse;
    return std::nullopt;
}

const char *to_string(DecodeError err) noexcept
{
    switch (err)
    {
    case DecodeError::NotJson:         return "NotJson";
    case DecodeError::NotObject:       return "NotObject";
    case DecodeError::PayloadNotJson:  return "PayloadNotJson";
    case DecodeError::MissingSentinel: return "MissingSentinel";
    }
    return "Unknown";
}

// ============================================================================
// Envelopes
// ============================================================================

std::string encode_envelope(const Envelope &envelope)
{
    nlohmann::json message = nlohmann::json::object();
    message[fields::kChannel] = envelope.channel;
    message[fields::kPayload] = envelope.payload;
    if (envelope.service)
    {
        message[fields::kService] = to_string(*envelope.service);
    }
    message[fields::kSentinel] = envelope.sentinel;
    message[fields::kEndpointIdentity] = envelope.endpoint_identity;
    return message.dump();
}

Result<InboundMessage, DecodeError> decode_inbound(std::string_view data)
{
    using R = Result<InboundMessage, DecodeError>;

    const nlohmann::json message = try_parse_json(data);
    if (message.is_discarded())
        return R::error(DecodeError::NotJson);
    if (!message.is_object())
        return R::error(DecodeError::NotObject);

    // A non-empty top-level sentinel marks the channel setup message.
    const auto sentinel_it = message.find(fields::kSentinel);
    if (sentinel_it != message.end() && sentinel_it->is_string() &&
        !sentinel_it->get_ref<const std::string &>().empty())
    {
        SetupMessage setup;
        setup.sentinel = sentinel_it->get<std::string>();
        const auto channel_it = message.find(fields::kChannel);
        if (channel_it != message.end() && channel_it->is_string())
            setup.channel = channel_it->get<std::string>();
        return R::ok(InboundMessage{std::move(setup)});
    }

    const auto payload_it = message.find(fields::kPayload);
    if (payload_it == message.end() || !payload_it->is_string())
        return R::error(DecodeError::PayloadNotJson);

    nlohmann::json payload = try_parse_json(payload_it->get_ref<const std::string &>());
    if (payload.is_discarded() || !payload.is_object())
        return R::error(DecodeError::PayloadNotJson);

    const auto inner_sentinel = payload.find("sentinel");
    if (inner_sentinel == payload.end() || !inner_sentinel->is_string() ||
        inner_sentinel->get_ref<const std::string &>().empty())
        return R::error(DecodeError::MissingSentinel);

    StandardMessage standard;
    standard.sentinel = inner_sentinel->get<std::string>();
    const auto service_it = message.find(fields::kService);
    if (service_it != message.end() && service_it->is_string())
        standard.service = service_it->get<std::string>();
    standard.payload = std::move(payload);
    return R::ok(InboundMessage{std::move(standard)});
}

// ============================================================================
// Service requests
// ============================================================================

std::optional<FrameSize> ExpandRequest::target_size() const
{
    if (!expand_t || !expand_b || !expand_r || !expand_l)
        return std::nullopt;
    const auto height = extent_to_int(*expand_b - *expand_t);
    const auto width = extent_to_int(*expand_r - *expand_l);
    if (!height || !width)
        return std::nullopt;
    return FrameSize{*height, *width};
}

HostRequest decode_request(std::string_view service, const nlohmann::json &payload)
{
    const auto known = service_from_string(service);
    if (!known)
        return UnhandledService{std::string(service)};

    switch (*known)
    {
    case Service::CreativeGeometryUpdate:
        return FluidResizeRequest{read_int(payload, "height")};
    case Service::ExpandRequest:
        return ExpandRequest{read_number(payload, "expand_t"), read_number(payload, "expand_b"),
                             read_number(payload, "expand_r"), read_number(payload, "expand_l")};
    case Service::CollapseRequest:
        return CollapseRequest{};
    case Service::RegisterDone:
        return RegisterDone{read_int(payload, "initialHeight"), read_int(payload, "initialWidth")};
    case Service::GeometryUpdate:
    case Service::ExpandResponse:
    case Service::CollapseResponse:
        break;
    }
    return UnhandledService{std::string(service)};
}

} // namespace sfhost::safeframe
