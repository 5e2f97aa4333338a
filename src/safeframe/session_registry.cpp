#include "sfh_base.hpp"
#include "safeframe/session_registry.hpp"
#include "safeframe/host_session.hpp"

namespace sfhost::safeframe
{

bool SessionRegistry::register_session(HostSession &session)
{
    const auto [pos, inserted] = m_sessions.emplace(session.slot_id(), &session);
    if (inserted)
    {
        LOGGER_DEBUG("SessionRegistry: registered slot '{}' ({} slots)", session.slot_id(),
                     m_sessions.size());
        return true;
    }
    // Existing entry wins; re-registering the same session is a no-op.
    return pos->second == &session;
}

bool SessionRegistry::unregister_session(const std::string &slot_id,
                                         const HostSession *session) noexcept
{
    auto pos = m_sessions.find(slot_id);
    if (pos == m_sessions.end() || pos->second != session)
    {
        return false;
    }
    m_sessions.erase(pos);
    return true;
}

HostSession *SessionRegistry::find_session(const std::string &slot_id) const noexcept
{
    auto pos = m_sessions.find(slot_id);
    return (pos != m_sessions.end()) ? pos->second : nullptr;
}

std::vector<std::string> SessionRegistry::list_slots() const
{
    std::vector<std::string> names;
    names.reserve(m_sessions.size());
    for (const auto &[name, _] : m_sessions)
    {
        names.push_back(name);
    }
    return names;
}

size_t SessionRegistry::size() const noexcept
{
    return m_sessions.size();
}

} // namespace sfhost::safeframe
