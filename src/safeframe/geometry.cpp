#include "sfh_base.hpp"
#include "safeframe/geometry.hpp"

#include <algorithm>

namespace sfhost::safeframe
{

double view_fraction(double /*viewport_start*/, double viewport_end, double element_start,
                     double element_end) noexcept
{
    const double extent = element_end - element_start;
    if (!(extent > 0.0))
        return 0.0;

    // Element runs past the far edge: visible part is from its start to the edge.
    // Otherwise it ends inside the viewport and is visible up to its end.
    const double length_in_view =
        (element_end >= viewport_end) ? viewport_end - element_start : element_end;
    return std::clamp(length_in_view / extent, 0.0, 1.0);
}

Geometry translate_geometry(const IntersectionEntry &entry, const std::string &style_z_index)
{
    const Rect &root = entry.root_bounds;
    const Rect &box = entry.bounding_client_rect;

    Geometry g;
    g.window_coords = root;
    g.frame_coords = box;
    g.style_z_index = style_z_index;
    g.allowed_expansion = root;
    // Creatives read xInView from the vertical extent and yInView from the
    // horizontal one; the wire mapping is kept as deployed.
    g.x_in_view = view_fraction(root.top, root.bottom, box.top, box.bottom);
    g.y_in_view = view_fraction(root.left, root.right, box.left, box.right);
    return g;
}

void to_json(nlohmann::json &j, const Geometry &g)
{
    j = nlohmann::json{
        {"windowCoords_t", g.window_coords.top},
        {"windowCoords_r", g.window_coords.right},
        {"windowCoords_b", g.window_coords.bottom},
        {"windowCoords_l", g.window_coords.left},
        {"frameCoords_t", g.frame_coords.top},
        {"frameCoords_r", g.frame_coords.right},
        {"frameCoords_b", g.frame_coords.bottom},
        {"frameCoords_l", g.frame_coords.left},
        {"styleZIndex", g.style_z_index},
        {"allowedExpansion_t", g.allowed_expansion.top},
        {"allowedExpansion_r", g.allowed_expansion.right},
        {"allowedExpansion_b", g.allowed_expansion.bottom},
        {"allowedExpansion_l", g.allowed_expansion.left},
        {"xInView", g.x_in_view},
        {"yInView", g.y_in_view},
    };
}

std::string serialize_geometry(const Geometry &g)
{
    return nlohmann::json(g).dump();
}

} // namespace sfhost::safeframe
