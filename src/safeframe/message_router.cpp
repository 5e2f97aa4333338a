#include "sfh_base.hpp"
#include "safeframe/message_router.hpp"
#include "safeframe/host_session.hpp"
#include "safeframe/message_codec.hpp"
#include "safeframe/session_registry.hpp"

namespace sfhost::safeframe
{

class MessageRouterImpl
{
  public:
    MessageRouterImpl(SessionRegistry &registry, std::string trusted_origin)
        : m_registry(registry), m_trusted_origin(std::move(trusted_origin))
    {
    }

    void dispatch(const MessageEvent &event);

    SessionRegistry &m_registry;
    std::string      m_trusted_origin;
    RouterStats      m_stats;

  private:
    HostSession *lookup(const std::string &slot_id);
};

HostSession *MessageRouterImpl::lookup(const std::string &slot_id)
{
    HostSession *session = m_registry.find_session(slot_id);
    if (session == nullptr)
    {
        ++m_stats.dropped_unknown_slot;
        LOGGER_WARN("MessageRouter: no host session for slot '{}'; message dropped", slot_id);
    }
    return session;
}

void MessageRouterImpl::dispatch(const MessageEvent &event)
{
    if (event.origin != m_trusted_origin)
    {
        ++m_stats.dropped_origin;
        LOGGER_DEBUG("MessageRouter: ignoring message from untrusted origin '{}'", event.origin);
        return;
    }

    auto decoded = decode_inbound(event.data);
    if (decoded.is_error())
    {
        ++m_stats.dropped_malformed;
        LOGGER_DEBUG("MessageRouter: dropping message: {}", to_string(decoded.error()));
        return;
    }

    const InboundMessage &message = decoded.content();
    if (const auto *setup = std::get_if<SetupMessage>(&message))
    {
        HostSession *session = lookup(setup->sentinel);
        if (session == nullptr)
            return;
        ++m_stats.dispatched;
        session->connect_messaging_channel(setup->channel);
        return;
    }

    const auto &standard = std::get<StandardMessage>(message);
    HostSession *session = lookup(standard.sentinel);
    if (session == nullptr)
        return;
    ++m_stats.dispatched;
    session->process_message(standard.payload, standard.service);
}

// ============================================================================
// MessageRouter
// ============================================================================

MessageRouter::MessageRouter(MessageEventSource &events, SessionRegistry &registry,
                             std::string trusted_origin)
    : pImpl(std::make_shared<MessageRouterImpl>(registry, std::move(trusted_origin)))
{
    std::weak_ptr<MessageRouterImpl> weak = pImpl;
    events.add_message_listener(
        [weak](const MessageEvent &event)
        {
            if (auto impl = weak.lock())
            {
                impl->dispatch(event);
            }
        });
    LOGGER_DEBUG("MessageRouter: listening for messages from '{}'", pImpl->m_trusted_origin);
}

MessageRouter::~MessageRouter() = default;

bool MessageRouter::register_session(HostSession &session)
{
    return pImpl->m_registry.register_session(session);
}

void MessageRouter::dispatch(const MessageEvent &event)
{
    pImpl->dispatch(event);
}

const std::string &MessageRouter::trusted_origin() const noexcept
{
    return pImpl->m_trusted_origin;
}

RouterStats MessageRouter::stats() const noexcept
{
    return pImpl->m_stats;
}

} // namespace sfhost::safeframe
