#pragma once
/**
 * @file message_router.hpp
 * @brief Single page-wide "message" listener that demultiplexes safeframe traffic.
 *
 * One router exists per page session. Its constructor installs exactly one
 * listener on the MessageEventSource; every inbound event then goes through
 * dispatch():
 *
 *   1. origin must equal the trusted origin, data must be a JSON object;
 *   2. an envelope with a non-empty `e` is a channel setup for slot `e`;
 *   3. otherwise `p` is decoded and its `sentinel` names the slot.
 *
 * Events failing any check are dropped and counted. Unknown slot ids are logged
 * at warning level; everything else that is dropped is logged at debug level.
 */
#include "sfhost_export.h"
#include "safeframe/slot_element.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace sfhost::safeframe
{

class HostSession;
class SessionRegistry;
class MessageRouterImpl;

/// Counters of what happened to inbound events, for diagnostics and tests.
struct RouterStats
{
    uint64_t dispatched{0};          ///< Reached a session (setup or standard)
    uint64_t dropped_origin{0};      ///< Origin was not the trusted origin
    uint64_t dropped_malformed{0};   ///< Not a decodable safeframe message
    uint64_t dropped_unknown_slot{0};///< No session registered for the slot id
};

class SFHOST_EXPORT MessageRouter
{
  public:
    /**
     * @brief Installs the router's listener on @p events.
     *
     * @p registry must outlive the router. The listener stays installed on
     * @p events; once the router is destroyed it ignores further events.
     */
    MessageRouter(MessageEventSource &events, SessionRegistry &registry,
                  std::string trusted_origin);
    ~MessageRouter();

    MessageRouter(const MessageRouter &) = delete;
    MessageRouter &operator=(const MessageRouter &) = delete;

    /**
     * @brief Adds @p session to the registry. Idempotent for the same session.
     * @return false if a different session already owns the slot id.
     */
    bool register_session(HostSession &session);

    /**
     * @brief Route one inbound event.
     * @throws FrameUnavailableError propagated from the target session.
     */
    void dispatch(const MessageEvent &event);

    [[nodiscard]] const std::string &trusted_origin() const noexcept;
    [[nodiscard]] RouterStats stats() const noexcept;

  private:
    std::shared_ptr<MessageRouterImpl> pImpl;
};

} // namespace sfhost::safeframe
