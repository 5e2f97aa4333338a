#include "sfh_base.hpp"
#include "safeframe/size_negotiator.hpp"
#include "safeframe/host_session.hpp"

namespace sfhost::safeframe
{

SizeNegotiator::SizeNegotiator(HostSession &session)
    : m_session(session), m_alive(std::make_shared<bool>(true))
{
}

SizeNegotiator::~SizeNegotiator() = default;

// ============================================================================
// Expand / collapse
// ============================================================================

void SizeNegotiator::request_resize(const FrameSize &target, Service response_service)
{
    LOGGER_DEBUG("SizeNegotiator: slot '{}' requesting {}x{} for {}", m_session.slot_id(),
                 target.width, target.height, to_string(response_service));

    std::weak_ptr<bool> alive = m_alive;
    m_session.element().attempt_change_size(
        target.height, target.width,
        [this, alive, target, response_service](ResizeOutcome outcome)
        {
            if (alive.expired())
            {
                LOGGER_DEBUG("SizeNegotiator: resize settled after session teardown; dropped");
                return;
            }
            if (outcome == ResizeOutcome::Rejected)
            {
                LOGGER_INFO("SizeNegotiator: slot '{}' resize to {}x{} rejected by page",
                            m_session.slot_id(), target.width, target.height);
                send_failure(response_service);
                return;
            }
            on_resize_resolved(target, response_service);
        });
}

void SizeNegotiator::on_resize_resolved(const FrameSize &target, Service response_service)
{
    SlotElement &element = m_session.element();
    const FrameSize actual = element.current_size();
    const bool success = actual == target;
    if (success)
    {
        element.set_frame_size(actual);
    }
    else
    {
        LOGGER_INFO("SizeNegotiator: slot '{}' asked for {}x{} but element is {}x{}",
                    m_session.slot_id(), target.width, target.height, actual.width, actual.height);
        element.reset_pending_change_size();
    }

    const Geometry &geometry = m_session.refresh_geometry();
    const nlohmann::json response{
        {"uid", m_session.uid()},
        {"success", success},
        {"newGeometry", serialize_geometry(geometry)},
        {"expand_t", geometry.allowed_expansion.top},
        {"expand_b", geometry.allowed_expansion.bottom},
        {"expand_r", geometry.allowed_expansion.right},
        {"expand_l", geometry.allowed_expansion.left},
        {"push", true},
    };
    m_session.send_message(response.dump(), response_service);
}

void SizeNegotiator::send_failure(Service response_service)
{
    const nlohmann::json response{
        {"uid", m_session.uid()},
        {"success", false},
    };
    m_session.send_message(response.dump(), response_service);
}

void SizeNegotiator::handle_expand(const ExpandRequest &request)
{
    const auto target = request.target_size();
    if (!target)
    {
        LOGGER_WARN("SizeNegotiator: slot '{}' expand_request has a missing or out-of-range "
                    "expand_* side",
                    m_session.slot_id());
        send_failure(Service::ExpandResponse);
        return;
    }
    request_resize(*target, Service::ExpandResponse);
}

void SizeNegotiator::handle_collapse(const FrameSize &initial_size)
{
    request_resize(initial_size, Service::CollapseResponse);
}

// ============================================================================
// Fluid resize
// ============================================================================

void SizeNegotiator::handle_fluid_resize(const FluidResizeRequest &request)
{
    // Zero is treated like a missing height.
    if (!request.height || *request.height == 0)
    {
        LOGGER_WARN("SizeNegotiator: slot '{}' fluid resize without a usable height; collapsing",
                    m_session.slot_id());
        m_session.element().force_collapse();
        return;
    }

    LOGGER_DEBUG("SizeNegotiator: slot '{}' fluid resize to height {}", m_session.slot_id(),
                 *request.height);
    std::weak_ptr<bool> alive = m_alive;
    m_session.element().attempt_change_size(
        request.height, std::nullopt,
        [this, alive](ResizeOutcome outcome)
        {
            if (alive.expired())
                return;
            if (outcome == ResizeOutcome::Rejected)
            {
                LOGGER_INFO("SizeNegotiator: slot '{}' fluid resize rejected; collapsing",
                            m_session.slot_id());
                m_session.element().force_collapse();
                return;
            }
            on_fluid_resized();
        });
}

void SizeNegotiator::on_fluid_resized()
{
    SlotElement &element = m_session.element();
    if (auto url = element.fluid_impression_url())
    {
        element.clear_fluid_impression_url();
        element.fire_delayed_impressions(*url);
    }
    m_session.post_to_frame(nlohmann::json{
        {"message", "resize-complete"},
        {"c", m_session.config().resize_complete_channel},
    });
}

} // namespace sfhost::safeframe
