#pragma once
/**
 * @file session_registry.hpp
 * @brief Registry mapping slot identifiers (sentinels) to host sessions.
 *
 * One registry exists per page session. It is created before the first slot,
 * handed to the MessageRouter and to every HostSession constructor, and lives
 * until the page goes away. Entries are never replaced: the first session
 * registered for a slot id keeps it.
 *
 * The registry does not own sessions. A HostSession removes its own entry when
 * destroyed, so a lookup never returns a dangling pointer.
 *
 * Single-threaded access only: all methods run on the page's event thread.
 */

#include "sfhost_export.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace sfhost::safeframe
{

class HostSession;

class SFHOST_EXPORT SessionRegistry
{
  public:
    SessionRegistry() = default;
    SessionRegistry(const SessionRegistry &) = delete;
    SessionRegistry &operator=(const SessionRegistry &) = delete;

    /**
     * @brief Register a session under its slot id.
     * @return true if the session is (now or already) the registered one for its slot;
     *         false if a different session already owns the slot id.
     */
    bool register_session(HostSession &session);

    /**
     * @brief Remove the entry for @p slot_id if it points at @p session.
     * @return true if an entry was removed.
     */
    bool unregister_session(const std::string &slot_id, const HostSession *session) noexcept;

    /**
     * @brief Look up the session for a slot.
     * @return nullptr if no session is registered under @p slot_id.
     */
    [[nodiscard]] HostSession *find_session(const std::string &slot_id) const noexcept;

    [[nodiscard]] std::vector<std::string> list_slots() const;
    [[nodiscard]] size_t size() const noexcept;

  private:
    std::unordered_map<std::string, HostSession *> m_sessions;
};

} // namespace sfhost::safeframe
