#include <fleetcam/session/layout_planner.hpp>

#include <algorithm>
#include <cstdint>

namespace fleetcam::session {

namespace {

constexpr double kAspect = 16.0 / 9.0;

int ceilSqrt(int count) {
    int64_t root = 1;
    while (root * root < count) {
        ++root;
    }
    return static_cast<int>(root);
}

} // namespace

LayoutPlanner::LayoutPlanner(int max_columns, double gap)
    : max_columns_(std::max(max_columns, 1))
    , gap_(std::max(gap, 0.0)) {
}

LayoutSpec LayoutPlanner::plan(int count) const {
    if (count <= 0) {
        return arrange(count, 1);
    }
    return arrange(count, std::min(ceilSqrt(count), max_columns_));
}

LayoutSpec LayoutPlanner::plan(int count, int columns) const {
    return arrange(count, std::clamp(columns, 1, max_columns_));
}

LayoutSpec LayoutPlanner::plan(int count, const Viewport& viewport, std::optional<int> columns) const {
    LayoutSpec spec = columns ? plan(count, *columns) : plan(count);
    if (spec.rows == 0 || viewport.width <= 0.0 || viewport.height <= 0.0) {
        return spec;
    }

    double width = (viewport.width - gap_ * (spec.columns - 1)) / spec.columns;
    double height = width / kAspect;

    // Too tall for the viewport: size from the rows instead
    double total_height = height * spec.rows + gap_ * (spec.rows - 1);
    if (total_height > viewport.height) {
        height = (viewport.height - gap_ * (spec.rows - 1)) / spec.rows;
        width = height * kAspect;
    }

    spec.cell_width = std::max(width, 0.0);
    spec.cell_height = std::max(height, 0.0);
    return spec;
}

PipPlacement LayoutPlanner::clampPip(const PipPlacement& pip, const Viewport& viewport) {
    PipPlacement placed = pip;
    placed.width = std::min(pip.width, viewport.width);
    placed.height = std::min(pip.height, viewport.height);
    placed.x = std::max(0.0, std::min(viewport.width - placed.width, pip.x));
    placed.y = std::max(0.0, std::min(viewport.height - placed.height, pip.y));
    return placed;
}

LayoutSpec LayoutPlanner::arrange(int count, int columns) const {
    LayoutSpec spec;
    spec.columns = columns;
    spec.rows = count <= 0 ? 0 : count / columns + (count % columns != 0 ? 1 : 0);
    return spec;
}

} // namespace fleetcam::session
