#pragma once
/**
 * @file size_negotiator.hpp
 * @brief Expand, collapse and fluid-resize flows for one host session.
 *
 * Every flow calls SlotElement::attempt_change_size and returns immediately;
 * the response is composed in the completion callback. Outcomes:
 *
 * | page result                    | response payload                                   |
 * |--------------------------------|----------------------------------------------------|
 * | resolved, size matches request | {uid, success:true,  newGeometry, expand_*, push}  |
 * | resolved, size differs         | {uid, success:false, newGeometry, expand_*, push}  |
 * | rejected                       | {uid, success:false}                               |
 *
 * Exactly one response is sent per expand/collapse request. Nothing is retried.
 * Overlapping requests are not sequenced: responses go out in the order the page
 * settles them.
 *
 * Fluid resizes never produce a response envelope. A malformed height or a
 * rejected resize collapses the slot instead.
 */

#include "sfhost_export.h"
#include "safeframe/message_codec.hpp"

#include <memory>

namespace sfhost::safeframe
{

class HostSession;

class SFHOST_EXPORT SizeNegotiator
{
  public:
    explicit SizeNegotiator(HostSession &session);
    ~SizeNegotiator();

    SizeNegotiator(const SizeNegotiator &) = delete;
    SizeNegotiator &operator=(const SizeNegotiator &) = delete;

    /**
     * @brief Ask the page for @p target and answer the creative with @p response_service.
     * @param response_service expand_response or collapse_response.
     */
    void request_resize(const FrameSize &target, Service response_service);

    void handle_expand(const ExpandRequest &request);

    /// Resizes to @p initial_size, the size captured from register_done.
    void handle_collapse(const FrameSize &initial_size);

    void handle_fluid_resize(const FluidResizeRequest &request);

  private:
    void on_resize_resolved(const FrameSize &target, Service response_service);
    void on_fluid_resized();
    void send_failure(Service response_service);

    HostSession &m_session;

    /// Expires when the negotiator is destroyed; callbacks check it before touching the session.
    std::shared_ptr<bool> m_alive;
};

} // namespace sfhost::safeframe
