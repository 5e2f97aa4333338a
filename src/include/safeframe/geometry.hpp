#pragma once
/**
 * @file geometry.hpp
 * @brief Translation of visibility observations into safeframe geometry.
 *
 * The creative's client library reads its position through `$sf.ext.geom()`,
 * which is fed by the geometry objects built here. Field names on the wire:
 *
 *   windowCoords_{t,r,b,l}      root viewport rectangle
 *   frameCoords_{t,r,b,l}       slot element bounding rectangle
 *   styleZIndex                 slot element z-index style value
 *   allowedExpansion_{t,r,b,l}  equal to the viewport rectangle
 *   xInView                     fraction visible on the vertical (top/bottom) axis
 *   yInView                     fraction visible on the horizontal (left/right) axis
 */

#include "sfhost_export.h"

#include <nlohmann/json.hpp>

#include <string>

namespace sfhost::safeframe
{

struct Rect
{
    double top{0};
    double right{0};
    double bottom{0};
    double left{0};

    bool operator==(const Rect &) const = default;
};

/// Slot or frame dimensions in CSS pixels.
struct FrameSize
{
    int height{0};
    int width{0};

    bool operator==(const FrameSize &) const = default;
};

/// One visibility observation: the root viewport and the element's bounding rectangle.
struct IntersectionEntry
{
    Rect root_bounds;
    Rect bounding_client_rect;
};

struct Geometry
{
    Rect        window_coords;
    Rect        frame_coords;
    std::string style_z_index;
    Rect        allowed_expansion;
    double      x_in_view{0}; ///< From top/bottom
    double      y_in_view{0}; ///< From left/right

    bool operator==(const Geometry &) const = default;
};

/**
 * @brief Fraction of an element's extent on one axis that lies inside the viewport.
 *
 * Precondition: coordinates are relative to the viewport origin, so
 * @p viewport_start is 0 (as in an IntersectionObserver rootBounds). Only
 * @p viewport_end enters the computation. The result is clamped to [0, 1].
 * A degenerate element (element_end <= element_start) yields 0.
 */
SFHOST_EXPORT double view_fraction(double viewport_start, double viewport_end,
                                   double element_start, double element_end) noexcept;

/// Builds the creative-facing geometry for one observation.
SFHOST_EXPORT Geometry translate_geometry(const IntersectionEntry &entry,
                                          const std::string &style_z_index);

/// nlohmann::json ADL hook; produces the flat wire object described above.
SFHOST_EXPORT void to_json(nlohmann::json &j, const Geometry &g);

/// Geometry as JSON text, the form embedded in `newGeometry` and `initialGeometry`.
SFHOST_EXPORT std::string serialize_geometry(const Geometry &g);

} // namespace sfhost::safeframe
