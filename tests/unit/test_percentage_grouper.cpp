#include <gtest/gtest.h>
#include <numeric>
#include <strata/grouper.hpp>

using namespace strata;

// ─── Helpers ─────────────────────────────────────────────────────────────────

using Names = std::vector<std::string>;

static const Rect kBox{0.1f, 0.1f, 0.4f, 0.6f};

// Maxima 34.2, 7 and 100 round up to 40, 7 and 100.
static std::shared_ptr<DiagramContext> make_context()
{
    auto ctx = std::make_shared<DiagramContext>();
    ctx->data.set_index({0.0f, 1.0f, 2.0f});
    ctx->data.add_column("p", {34.2f, 10.0f, 0.0f});
    ctx->data.add_column("q", {7.0f, 1.0f, 0.0f});
    ctx->data.add_column("r", {100.0f, 50.0f, 0.0f});
    ctx->index_group = ctx->links.create_group("index");
    return ctx;
}

static std::unique_ptr<PercentageGrouper> make_percentage(std::shared_ptr<DiagramContext> ctx)
{
    return std::make_unique<PercentageGrouper>(
        std::move(ctx), "Pollen", kBox, Names{"p", "q", "r"},
        default_format(GrouperKind::Percentage, false));
}

// Checks width_i / total == range_i / sum(range_j) over the visible panels.
static void expect_proportional(const Grouper& g)
{
    auto  visible = g.visible_panels();
    float ranges  = 0.0f;
    float widths  = 0.0f;
    for (Panel* p : visible)
    {
        ranges += p->x_limits().range();
        widths += p->position().w;
    }
    EXPECT_NEAR(widths, g.bbox().w, 1e-5f);
    for (Panel* p : visible)
        EXPECT_NEAR(p->position().w / g.bbox().w, p->x_limits().range() / ranges, 1e-5f);
}

// ─── rounded_upper_limit ─────────────────────────────────────────────────────

TEST(RoundedUpperLimit, DecadeMultiples)
{
    EXPECT_NEAR(rounded_upper_limit(34.2f), 40.0f, 1e-4f);
    EXPECT_NEAR(rounded_upper_limit(3.7f), 4.0f, 1e-5f);
    EXPECT_NEAR(rounded_upper_limit(100.0f), 100.0f, 1e-3f);
    EXPECT_NEAR(rounded_upper_limit(7.0f), 7.0f, 1e-5f);
    EXPECT_NEAR(rounded_upper_limit(0.25f), 0.3f, 1e-5f);
    EXPECT_FLOAT_EQ(rounded_upper_limit(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(rounded_upper_limit(-3.0f), 0.0f);
}

// ─── Layout ──────────────────────────────────────────────────────────────────

TEST(PercentageGrouper, RoundedRanges)
{
    auto g = make_percentage(make_context());
    EXPECT_EQ(g->kind(), GrouperKind::Percentage);
    EXPECT_NEAR(g->panel_for("p")->x_limits().max, 40.0f, 1e-4f);
    EXPECT_FLOAT_EQ(g->panel_for("p")->x_limits().min, 0.0f);
    EXPECT_NEAR(g->panel_for("q")->x_limits().max, 7.0f, 1e-4f);
    EXPECT_TRUE(g->panel_for("p")->series()[0].draw == PlotKind::Area);
}

TEST(PercentageGrouper, WidthsProportionalToRanges)
{
    auto g = make_percentage(make_context());
    expect_proportional(*g);
    EXPECT_NEAR(g->panel_for("r")->position().w, kBox.w * 100.0f / 147.0f, 1e-5f);
}

TEST(PercentageGrouper, FloorRaisesSmallRanges)
{
    auto g     = make_percentage(make_context());
    int  calls = 0;
    g->set_on_change([&](Grouper&) { ++calls; });

    EXPECT_TRUE(g->apply_floor(20.0f));
    EXPECT_EQ(calls, 1);
    EXPECT_FLOAT_EQ(g->panel_for("q")->x_limits().min, 0.0f);
    EXPECT_FLOAT_EQ(g->panel_for("q")->x_limits().max, 20.0f);
    // larger ranges are never reduced
    EXPECT_NEAR(g->panel_for("r")->x_limits().max, 100.0f, 1e-3f);
    expect_proportional(*g);
    EXPECT_NEAR(g->panel_for("q")->position().w, kBox.w * 20.0f / 160.0f, 1e-5f);

    EXPECT_FALSE(g->apply_floor(20.0f));
    EXPECT_EQ(calls, 1);
}

TEST(PercentageGrouper, HideKeepsProportions)
{
    auto g = make_percentage(make_context());
    g->hide("r");
    expect_proportional(*g);
    EXPECT_NEAR(g->panel_for("p")->position().w, kBox.w * 40.0f / 47.0f, 1e-5f);
    EXPECT_NEAR(g->panel_for("q")->position().x1(), kBox.x1(), 1e-6f);
}

TEST(PercentageGrouper, ReorderKeepsProportions)
{
    auto g = make_percentage(make_context());
    g->reorder({"r", "q"});
    EXPECT_EQ(g->names(), (Names{"r", "q", "p"}));
    expect_proportional(*g);
    EXPECT_NEAR(g->panel_for("r")->position().x, kBox.x, 1e-6f);
}

TEST(PercentageGrouper, AllZeroRangesFallBackToEqualWidths)
{
    auto ctx = std::make_shared<DiagramContext>();
    ctx->data.add_column("z1", {0.0f, 0.0f});
    ctx->data.add_column("z2", {0.0f, 0.0f});
    FormatOverrides ov;
    ov.x_limits = AxisLimits{0.0f, 0.0f};
    auto g      = make_grouper(GrouperKind::Percentage, ctx, "Z", kBox, {"z1", "z2"}, false, ov);
    for (Panel* p : g->panels())
        EXPECT_NEAR(p->position().w, kBox.w / 2.0f, 1e-6f);
}

TEST(PercentageGrouper, ExplicitLimitsAreNotRounded)
{
    FormatOverrides ov;
    ov.x_limits = AxisLimits{0.0f, 35.0f};
    auto g      = make_grouper(GrouperKind::Percentage, make_context(), "Pollen", kBox,
                               {"p", "q"}, true, ov);
    ASSERT_EQ(g->kind(), GrouperKind::Percentage);
    for (Panel* p : g->panels())
    {
        EXPECT_FLOAT_EQ(p->x_limits().max, 35.0f);
        EXPECT_TRUE(p->series()[0].draw == PlotKind::Bar);
    }
}
