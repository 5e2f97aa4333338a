#include "sfh_base.hpp"
#include "safeframe/host_session.hpp"
#include "safeframe/session_registry.hpp"

namespace sfhost::safeframe
{

namespace
{

template <class... Ts> struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

// ============================================================================
// Construction / registration
// ============================================================================

HostSession::HostSession(std::string slot_id, SlotElement &element, SessionRegistry &registry,
                         uid::TokenSource &tokens, const HostConfig &config)
    : m_slot_id(std::move(slot_id)), m_element(element), m_registry(registry), m_config(config),
      m_endpoint_identity(tokens.next_token()), m_uid(tokens.next_token()), m_negotiator(*this)
{
    if (!m_registry.register_session(*this))
    {
        LOGGER_WARN("HostSession: slot '{}' already has a host session; this one will not "
                    "receive messages",
                    m_slot_id);
    }
}

HostSession::~HostSession()
{
    m_registry.unregister_session(m_slot_id, this);
}

nlohmann::json HostSession::name_attributes()
{
    nlohmann::json attributes = nlohmann::json::object();
    attributes["uid"] = m_uid;
    attributes["hostPeerName"] = m_element.host_origin();
    attributes["initialGeometry"] = serialize_geometry(refresh_geometry());
    attributes["permissions"] = nlohmann::json{
        {"expandByOverlay", false},
        {"expandByPush", false},
        {"readCookie", false},
        {"writeCookie", false},
    }.dump();
    attributes["metadata"] = nlohmann::json{
        {"shared",
         {
             {"sf_ver", m_element.safeframe_version()},
             {"ck_on", m_config.cookie_on},
             {"flash_ver", m_config.flash_version},
         }},
    }.dump();
    attributes["reportCreativeGeometry"] = m_element.is_fluid();
    attributes["isDifferentSourceWindow"] = false;
    attributes["sentinel"] = m_slot_id;
    return attributes;
}

const Geometry &HostSession::refresh_geometry()
{
    m_current_geometry = translate_geometry(m_element.intersection_entry(), m_element.style_z_index());
    return *m_current_geometry;
}

// ============================================================================
// Channel setup
// ============================================================================

void HostSession::connect_messaging_channel(const std::string &channel)
{
    if (m_state == SessionState::ChannelEstablished)
    {
        LOGGER_DEBUG("HostSession: slot '{}' already on channel '{}'; ignoring setup for '{}'",
                     m_slot_id, *m_channel, channel);
        return;
    }
    if (channel.empty())
    {
        LOGGER_WARN("HostSession: slot '{}' received a setup message without a channel",
                    m_slot_id);
        return;
    }

    // The iframe does not exist when the session is created; by the time the
    // creative sends its first message it must.
    if (m_element.frame_window() == nullptr)
    {
        LOGGER_ERROR("HostSession: slot '{}' frame contentWindow unavailable at channel setup",
                     m_slot_id);
        throw FrameUnavailableError("Frame contentWindow unavailable.");
    }
    m_frame_bound = true;
    m_channel = channel;
    m_state = SessionState::ChannelEstablished;
    LOGGER_INFO("HostSession: slot '{}' connected on channel '{}'", m_slot_id, channel);

    setup_geometry();
    send_message(nlohmann::json{{fields::kMessage, "connect"}, {fields::kChannel, channel}},
                 std::nullopt);
    replay_pending();
}

void HostSession::setup_geometry()
{
    m_observer = m_element.create_visibility_observer();
    if (!m_observer)
    {
        LOGGER_WARN("HostSession: slot '{}' has no visibility observer; geometry updates disabled",
                    m_slot_id);
        return;
    }
    m_observer->start([this](const IntersectionEntry &entry) { send_geometry_update(entry); });
}

void HostSession::replay_pending()
{
    if (m_pending.empty())
        return;
    LOGGER_DEBUG("HostSession: slot '{}' replaying {} queued message(s)", m_slot_id,
                 m_pending.size());
    std::deque<std::pair<nlohmann::json, std::string>> queued;
    queued.swap(m_pending);
    while (!queued.empty())
    {
        auto [payload, service] = std::move(queued.front());
        queued.pop_front();
        try
        {
            dispatch(payload, service);
        }
        catch (const FrameUnavailableError &)
        {
            if (!queued.empty())
            {
                LOGGER_WARN("HostSession: slot '{}' frame lost during replay; dropping {} "
                            "queued message(s)",
                            m_slot_id, queued.size());
            }
            throw;
        }
    }
}

// ============================================================================
// Sending
// ============================================================================

FrameWindow &HostSession::require_frame()
{
    FrameWindow *frame = m_frame_bound ? m_element.frame_window() : nullptr;
    if (frame == nullptr)
    {
        LOGGER_ERROR("HostSession: slot '{}' frame contentWindow unavailable", m_slot_id);
        throw FrameUnavailableError("Frame contentWindow unavailable.");
    }
    return *frame;
}

void HostSession::send_message(nlohmann::json payload, std::optional<Service> service)
{
    FrameWindow &frame = require_frame();
    Envelope envelope;
    envelope.channel = m_channel.value_or(std::string{});
    envelope.sentinel = m_slot_id;
    envelope.endpoint_identity = m_endpoint_identity;
    envelope.service = service;
    envelope.payload = std::move(payload);
    frame.post_message(encode_envelope(envelope), m_config.trusted_origin);
}

void HostSession::post_to_frame(const nlohmann::json &message)
{
    require_frame().post_message(message.dump(), m_config.trusted_origin);
}

void HostSession::send_geometry_update(const IntersectionEntry &entry)
{
    m_current_geometry = translate_geometry(entry, m_element.style_z_index());
    const nlohmann::json payload{
        {"newGeometry", serialize_geometry(*m_current_geometry)},
        {"uid", m_uid},
    };
    send_message(payload.dump(), Service::GeometryUpdate);
}

// ============================================================================
// Inbound standard messages
// ============================================================================

void HostSession::process_message(const nlohmann::json &payload, const std::string &service)
{
    if (m_state != SessionState::ChannelEstablished)
    {
        if (m_pending.size() >= kMaxPendingMessages)
        {
            LOGGER_WARN("HostSession: slot '{}' pending queue full; dropping oldest '{}'",
                        m_slot_id, m_pending.front().second);
            m_pending.pop_front();
        }
        LOGGER_DEBUG("HostSession: slot '{}' queued '{}' until the channel is established",
                     m_slot_id, service);
        m_pending.emplace_back(payload, service);
        return;
    }
    dispatch(payload, service);
}

void HostSession::dispatch(const nlohmann::json &payload, const std::string &service)
{
    std::visit(Overloaded{
                   [this](const FluidResizeRequest &r) { m_negotiator.handle_fluid_resize(r); },
                   [this](const ExpandRequest &r) { m_negotiator.handle_expand(r); },
                   [this](const CollapseRequest &) { handle_collapse_request(); },
                   [this](const RegisterDone &r) { handle_register_done(r); },
                   [this](const UnhandledService &r)
                   {
                       LOGGER_TRACE("HostSession: slot '{}' ignoring service '{}'", m_slot_id,
                                    r.name);
                   },
               },
               decode_request(service, payload));
}

void HostSession::handle_register_done(const RegisterDone &request)
{
    if (m_initial_size)
    {
        LOGGER_DEBUG("HostSession: slot '{}' initial size already captured ({}x{})", m_slot_id,
                     m_initial_size->width, m_initial_size->height);
        return;
    }
    if (!request.initial_height || !request.initial_width)
    {
        LOGGER_WARN("HostSession: slot '{}' register_done without initialHeight/initialWidth",
                    m_slot_id);
        return;
    }
    m_initial_size = FrameSize{*request.initial_height, *request.initial_width};
    LOGGER_DEBUG("HostSession: slot '{}' initial size {}x{}", m_slot_id, m_initial_size->width,
                 m_initial_size->height);
}

void HostSession::handle_collapse_request()
{
    if (m_initial_size)
    {
        m_negotiator.handle_collapse(*m_initial_size);
        return;
    }
    // The creative never reported its size; fall back to the slot's layout size.
    const FrameSize fallback = m_element.initial_size();
    LOGGER_DEBUG("HostSession: slot '{}' collapse before register_done; using layout size {}x{}",
                 m_slot_id, fallback.width, fallback.height);
    m_negotiator.handle_collapse(fallback);
}

} // namespace sfhost::safeframe
