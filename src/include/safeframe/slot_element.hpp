#pragma once
/**
 * @file slot_element.hpp
 * @brief Interfaces the embedding page implements for the safeframe host.
 *
 * The host never creates or lays out the ad slot itself. It sees the page through
 * four seams:
 *
 *  - MessageEventSource  page-wide "message" event surface (one listener per router)
 *  - FrameWindow         the creative iframe's content window
 *  - VisibilityObserver  visibility-change notifications for one slot
 *  - SlotElement         the ad slot element: iframe, size, resize primitive
 *
 * All callbacks run on the page's event thread.
 */

#include "safeframe/geometry.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sfhost::safeframe
{

/// One inbound "message" event as delivered by the page.
struct MessageEvent
{
    std::string origin; ///< Origin of the sending window
    std::string data;   ///< Event data (JSON text for safeframe messages)
};

using MessageListener = std::function<void(const MessageEvent &)>;

class MessageEventSource
{
  public:
    virtual ~MessageEventSource() = default;

    /// Installs a listener that stays registered for the lifetime of the source.
    virtual void add_message_listener(MessageListener listener) = 0;
};

class FrameWindow
{
  public:
    virtual ~FrameWindow() = default;

    /// Posts JSON text to the frame, restricted to @p target_origin.
    virtual void post_message(const std::string &data, const std::string &target_origin) = 0;
};

using VisibilityCallback = std::function<void(const IntersectionEntry &)>;

class VisibilityObserver
{
  public:
    virtual ~VisibilityObserver() = default;

    /// Starts reporting changes; the observer stops when destroyed.
    virtual void start(VisibilityCallback on_change) = 0;
};

/// Outcome of the page's asynchronous resize primitive.
enum class ResizeOutcome
{
    Resolved, ///< The page applied (or claims to have applied) the change
    Rejected, ///< The page refused the change
};

using ResizeCallback = std::function<void(ResizeOutcome)>;

class SlotElement
{
  public:
    virtual ~SlotElement() = default;

    /// The creative frame's content window, or nullptr before the iframe exists.
    virtual FrameWindow *frame_window() = 0;

    /// Latest visibility observation for the slot.
    virtual IntersectionEntry intersection_entry() const = 0;

    /// Current `style.zIndex` of the slot element ("" when unset).
    virtual std::string style_z_index() const = 0;

    /// Current size of the slot element.
    virtual FrameSize current_size() const = 0;

    /// Size the slot was laid out with before any creative-initiated change.
    virtual FrameSize initial_size() const = 0;

    /// Resizes the iframe to mirror the slot element.
    virtual void set_frame_size(const FrameSize &size) = 0;

    /**
     * @brief Asks the page to resize the slot. Unset dimensions stay unchanged.
     *
     * Returns immediately; @p done runs exactly once when the page settles the request.
     */
    virtual void attempt_change_size(std::optional<int> height, std::optional<int> width,
                                     ResizeCallback done) = 0;

    /// Clears a pending resize the page queued but did not apply.
    virtual void reset_pending_change_size() = 0;

    /// Collapses the slot; used when a creative misbehaves.
    virtual void force_collapse() = 0;

    /// Creates the visibility observer that feeds geometry updates for this slot.
    virtual std::unique_ptr<VisibilityObserver> create_visibility_observer() = 0;

    // ── Fluid impressions ─────────────────────────────────────────────────────
    virtual std::optional<std::string> fluid_impression_url() const = 0;
    virtual void clear_fluid_impression_url() = 0;
    virtual void fire_delayed_impressions(const std::string &url) = 0;

    // ── Slot attributes exposed to the creative ───────────────────────────────
    virtual std::string host_origin() const = 0;
    virtual std::string safeframe_version() const = 0;
    virtual bool is_fluid() const = 0;
};

} // namespace sfhost::safeframe
