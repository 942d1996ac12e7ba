#pragma once

#include <optional>

namespace fleetcam::session {

struct Viewport {
    double width = 0.0;
    double height = 0.0;
};

// Grid arrangement for a number of displayed sessions
struct LayoutSpec {
    int columns = 1;
    int rows = 0;
    double cell_width = 0.0;
    double cell_height = 0.0;
};

// Floating picture-in-picture window, top-left origin
struct PipPlacement {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
};

class LayoutPlanner {
public:
    static constexpr int kDefaultMaxColumns = 4;
    static constexpr double kDefaultGap = 8.0;

    explicit LayoutPlanner(int max_columns = kDefaultMaxColumns, double gap = kDefaultGap);

    // columns = min(ceil(sqrt(count)), maxColumns); count <= 0 gives one column
    LayoutSpec plan(int count) const;

    // Explicit column choice, clamped to 1..maxColumns
    LayoutSpec plan(int count, int columns) const;

    // As above plus the largest 16:9 cell that fits the viewport
    LayoutSpec plan(int count, const Viewport& viewport, std::optional<int> columns = std::nullopt) const;

    // Keep the window fully inside the viewport
    static PipPlacement clampPip(const PipPlacement& pip, const Viewport& viewport);

    int maxColumns() const { return max_columns_; }

private:
    LayoutSpec arrange(int count, int columns) const;

    int max_columns_;
    double gap_;
};

} // namespace fleetcam::session
