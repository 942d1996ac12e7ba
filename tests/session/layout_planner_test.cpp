#include <gtest/gtest.h>
#include <fleetcam/session/layout_planner.hpp>

#include <limits>

namespace fleetcam::session::test {

TEST(LayoutPlannerTest, SquareishGrid) {
    LayoutPlanner planner;

    auto expectGrid = [&](int count, int columns, int rows) {
        auto spec = planner.plan(count);
        EXPECT_EQ(spec.columns, columns) << "count " << count;
        EXPECT_EQ(spec.rows, rows) << "count " << count;
    };

    expectGrid(1, 1, 1);
    expectGrid(2, 2, 1);
    expectGrid(3, 2, 2);
    expectGrid(4, 2, 2);
    expectGrid(5, 3, 2);
    expectGrid(9, 3, 3);
    expectGrid(10, 4, 3);
    expectGrid(17, 4, 5);
}

TEST(LayoutPlannerTest, EmptyWall) {
    LayoutPlanner planner;

    auto none = planner.plan(0);
    EXPECT_EQ(none.columns, 1);
    EXPECT_EQ(none.rows, 0);

    auto negative = planner.plan(-3);
    EXPECT_EQ(negative.columns, 1);
    EXPECT_EQ(negative.rows, 0);
}

TEST(LayoutPlannerTest, ColumnOverrideIsClamped) {
    LayoutPlanner planner(4);

    EXPECT_EQ(planner.plan(6, 3).columns, 3);
    EXPECT_EQ(planner.plan(6, 3).rows, 2);
    EXPECT_EQ(planner.plan(6, 9).columns, 4);
    EXPECT_EQ(planner.plan(6, 0).columns, 1);
    EXPECT_EQ(planner.plan(6, 0).rows, 6);
}

TEST(LayoutPlannerTest, CustomMaxColumns) {
    LayoutPlanner planner(2);
    EXPECT_EQ(planner.maxColumns(), 2);

    auto spec = planner.plan(9);
    EXPECT_EQ(spec.columns, 2);
    EXPECT_EQ(spec.rows, 5);

    EXPECT_EQ(LayoutPlanner(0).maxColumns(), 1);
}

TEST(LayoutPlannerTest, HugeCountsDoNotOverflow) {
    LayoutPlanner planner;

    auto spec = planner.plan(std::numeric_limits<int>::max());
    EXPECT_EQ(spec.columns, 4);
    EXPECT_EQ(spec.rows, 536870912);

    auto single = planner.plan(std::numeric_limits<int>::max(), 1);
    EXPECT_EQ(single.columns, 1);
    EXPECT_EQ(single.rows, std::numeric_limits<int>::max());

    LayoutPlanner wide(std::numeric_limits<int>::max());
    auto square = wide.plan(std::numeric_limits<int>::max());
    EXPECT_EQ(square.columns, 46341);
    EXPECT_EQ(square.rows, 46341);
}

TEST(LayoutPlannerTest, CellFitsWidth) {
    LayoutPlanner planner(4, 0.0);

    auto spec = planner.plan(2, Viewport{1600, 900});
    EXPECT_EQ(spec.columns, 2);
    EXPECT_DOUBLE_EQ(spec.cell_width, 800.0);
    EXPECT_DOUBLE_EQ(spec.cell_height, 450.0);
}

TEST(LayoutPlannerTest, CellFitsHeightWhenGridIsTall) {
    LayoutPlanner planner;

    auto spec = planner.plan(4, Viewport{1920, 1080});
    EXPECT_EQ(spec.columns, 2);
    EXPECT_EQ(spec.rows, 2);
    EXPECT_DOUBLE_EQ(spec.cell_height, 536.0);
    EXPECT_NEAR(spec.cell_width, 536.0 * 16.0 / 9.0, 1e-9);

    double used = spec.cell_height * spec.rows + 8.0 * (spec.rows - 1);
    EXPECT_LE(used, 1080.0);
}

TEST(LayoutPlannerTest, ViewportWithColumnOverride) {
    LayoutPlanner planner(4, 0.0);

    auto spec = planner.plan(4, Viewport{1600, 2000}, 4);
    EXPECT_EQ(spec.columns, 4);
    EXPECT_EQ(spec.rows, 1);
    EXPECT_DOUBLE_EQ(spec.cell_width, 400.0);
    EXPECT_DOUBLE_EQ(spec.cell_height, 225.0);
}

TEST(LayoutPlannerTest, NoCellsWithoutViewportOrSessions) {
    LayoutPlanner planner;

    auto empty = planner.plan(0, Viewport{1920, 1080});
    EXPECT_DOUBLE_EQ(empty.cell_width, 0.0);

    auto hidden = planner.plan(3, Viewport{0, 0});
    EXPECT_EQ(hidden.columns, 2);
    EXPECT_DOUBLE_EQ(hidden.cell_width, 0.0);
}

TEST(LayoutPlannerTest, PipStaysInsideViewport) {
    Viewport viewport{1280, 720};

    auto inside = LayoutPlanner::clampPip({100, 100, 320, 180}, viewport);
    EXPECT_DOUBLE_EQ(inside.x, 100);
    EXPECT_DOUBLE_EQ(inside.y, 100);

    auto dragged = LayoutPlanner::clampPip({1200, 700, 320, 180}, viewport);
    EXPECT_DOUBLE_EQ(dragged.x, 960);
    EXPECT_DOUBLE_EQ(dragged.y, 540);

    auto negative = LayoutPlanner::clampPip({-50, -20, 320, 180}, viewport);
    EXPECT_DOUBLE_EQ(negative.x, 0);
    EXPECT_DOUBLE_EQ(negative.y, 0);
}

TEST(LayoutPlannerTest, OversizedPipShrinks) {
    auto placed = LayoutPlanner::clampPip({40, 40, 2000, 1000}, Viewport{1280, 720});
    EXPECT_DOUBLE_EQ(placed.width, 1280);
    EXPECT_DOUBLE_EQ(placed.height, 720);
    EXPECT_DOUBLE_EQ(placed.x, 0);
    EXPECT_DOUBLE_EQ(placed.y, 0);
}

} // namespace fleetcam::session::test
