#pragma once
/**
 * @file host_session.hpp
 * @brief Per-slot safeframe host: handshake, geometry push and request dispatch.
 *
 * ## State machine
 *
 *   Constructed ──(ctor registers with SessionRegistry)──▶ Registered
 *   Registered  ──(first setup message, non-empty channel)──▶ ChannelEstablished
 *
 * There is no teardown state; a session lives as long as its slot.
 *
 * On entering ChannelEstablished the session binds the creative frame, starts
 * the slot's visibility observer (each change becomes a geometry_update
 * envelope), sends the connect message and then processes the standard
 * messages that arrived before the channel existed.
 *
 * The channel never changes once set; later setup messages are ignored.
 */

#include "sfhost_export.h"
#include "safeframe/geometry.hpp"
#include "safeframe/message_codec.hpp"
#include "safeframe/size_negotiator.hpp"
#include "safeframe/slot_element.hpp"
#include "utils/host_config.hpp"
#include "utils/uid_utils.hpp"

#include <nlohmann/json.hpp>

#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace sfhost::safeframe
{

class SessionRegistry;

enum class SessionState
{
    Registered,
    ChannelEstablished,
};

/**
 * @brief Raised when a message must go to the creative but its frame window is gone.
 *
 * This is a precondition failure of the embedding page: the iframe must exist by
 * the time the creative can talk to the host. It is not recoverable by the host.
 */
class SFHOST_EXPORT FrameUnavailableError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

class SFHOST_EXPORT HostSession
{
  public:
    /// Upper bound on standard messages held while the channel is not yet established.
    static constexpr size_t kMaxPendingMessages = 64;

    /**
     * @brief Create the host for one slot and register it in @p registry.
     *
     * @p element, @p registry, @p tokens and @p config must outlive the session.
     * The identity token and uid are drawn from @p tokens here.
     */
    HostSession(std::string slot_id, SlotElement &element, SessionRegistry &registry,
                uid::TokenSource &tokens, const HostConfig &config);
    ~HostSession();

    HostSession(const HostSession &) = delete;
    HostSession &operator=(const HostSession &) = delete;
    HostSession(HostSession &&) = delete;
    HostSession &operator=(HostSession &&) = delete;

    // ── Identity and state ────────────────────────────────────────────────────
    const std::string &slot_id() const noexcept { return m_slot_id; }
    const std::optional<std::string> &channel() const noexcept { return m_channel; }
    SessionState state() const noexcept { return m_state; }
    double endpoint_identity() const noexcept { return m_endpoint_identity; }
    double uid() const noexcept { return m_uid; }
    const std::optional<Geometry> &current_geometry() const noexcept { return m_current_geometry; }
    const std::optional<FrameSize> &initial_size() const noexcept { return m_initial_size; }
    size_t pending_message_count() const noexcept { return m_pending.size(); }

    SlotElement &element() noexcept { return m_element; }
    const HostConfig &config() const noexcept { return m_config; }

    /**
     * @brief Attributes handed to the creative in the iframe name at creation time.
     *
     * Computes (and caches) the current geometry for `initialGeometry`.
     */
    nlohmann::json name_attributes();

    /// Recomputes the geometry from the element's latest observation and caches it.
    const Geometry &refresh_geometry();

    // ── Protocol entry points ─────────────────────────────────────────────────

    /**
     * @brief Handle a channel setup message.
     * @throws FrameUnavailableError if the slot's frame window does not exist yet.
     */
    void connect_messaging_channel(const std::string &channel);

    /**
     * @brief Handle a standard message. Queued until the channel is established.
     * @throws FrameUnavailableError if a response must be sent and the frame is gone.
     */
    void process_message(const nlohmann::json &payload, const std::string &service);

    /// Visibility observer hook: caches the new geometry and pushes a geometry_update.
    void send_geometry_update(const IntersectionEntry &entry);

    /**
     * @brief Wrap @p payload in an envelope for this session and post it to the frame.
     * @throws FrameUnavailableError if the frame is not bound or its window is gone.
     */
    void send_message(nlohmann::json payload, std::optional<Service> service);

    /**
     * @brief Post a bare (non-envelope) JSON message to the frame.
     * @throws FrameUnavailableError as for send_message().
     */
    void post_to_frame(const nlohmann::json &message);

  private:
    FrameWindow &require_frame();
    void setup_geometry();
    void dispatch(const nlohmann::json &payload, const std::string &service);
    void replay_pending();

    void handle_register_done(const RegisterDone &request);
    void handle_collapse_request();

    std::string                m_slot_id;
    SlotElement               &m_element;
    SessionRegistry           &m_registry;
    const HostConfig          &m_config;

    SessionState               m_state{SessionState::Registered};
    std::optional<std::string> m_channel;
    bool                       m_frame_bound{false};

    double                     m_endpoint_identity;
    double                     m_uid;

    std::optional<Geometry>    m_current_geometry;
    std::optional<FrameSize>   m_initial_size;

    std::deque<std::pair<nlohmann::json, std::string>> m_pending;

    std::unique_ptr<VisibilityObserver> m_observer;
    SizeNegotiator                      m_negotiator;
};

} // namespace sfhost::safeframe
