#include <gtest/gtest.h>
#include <strata/grouper.hpp>

using namespace strata;

// ─── Helpers ─────────────────────────────────────────────────────────────────

using Names = std::vector<std::string>;

static const Rect kBox{0.5f, 0.1f, 0.2f, 0.6f};

static std::shared_ptr<DiagramContext> make_context()
{
    auto ctx = std::make_shared<DiagramContext>();
    ctx->data.set_index({0.0f, 1.0f, 2.0f});
    ctx->data.add_column("d", {33.0f, 50.0f, 17.0f});
    ctx->data.add_column("e", {24.0f, 34.0f, 42.0f});
    ctx->data.add_column("f", {28.0f, 69.0f, 3.0f});
    ctx->index_group = ctx->links.create_group("index");
    return ctx;
}

static std::unique_ptr<Grouper> make_combined(GrouperKind kind)
{
    return make_grouper(kind, make_context(), "2", kBox, {"d", "e", "f"}, false);
}

static Names drawn(const Panel& p)
{
    Names result;
    for (const auto& s : p.series())
    {
        if (s.draw)
            result.push_back(s.variable);
    }
    return result;
}

// ─── AllInOne ────────────────────────────────────────────────────────────────

TEST(AllInOneGrouper, SinglePanel)
{
    auto g = make_combined(GrouperKind::AllInOne);
    EXPECT_EQ(g->kind(), GrouperKind::AllInOne);
    ASSERT_EQ(g->panel_count(), 1u);
    EXPECT_EQ(g->names(), (Names{"d", "e", "f"}));

    Panel* p = g->panels().front();
    EXPECT_EQ(p->variables(), (Names{"d", "e", "f"}));
    EXPECT_EQ(p->title(), "2");
    EXPECT_TRUE(p->format().legend);
    EXPECT_FLOAT_EQ(p->position().x, kBox.x);
    EXPECT_FLOAT_EQ(p->position().w, kBox.w);
}

TEST(AllInOneGrouper, XLimitsCoverAllSeries)
{
    auto   g = make_combined(GrouperKind::AllInOne);
    Panel* p = g->panels().front();
    EXPECT_FLOAT_EQ(p->x_limits().min, 3.0f);
    EXPECT_FLOAT_EQ(p->x_limits().max, 69.0f);
}

TEST(AllInOneGrouper, HideTogglesDrawingNotGeometry)
{
    auto   g     = make_combined(GrouperKind::AllInOne);
    Panel* p     = g->panels().front();
    Rect   box   = p->position();
    int    calls = 0;
    g->set_on_change([&](Grouper&) { ++calls; });

    g->hide("e");
    EXPECT_FALSE(g->is_visible("e"));
    EXPECT_TRUE(g->is_visible("d"));
    EXPECT_EQ(drawn(*p), (Names{"d", "f"}));
    EXPECT_TRUE(p->visible());
    EXPECT_FLOAT_EQ(p->position().w, box.w);
    EXPECT_FLOAT_EQ(p->position().x, box.x);

    g->hide("e");
    EXPECT_EQ(calls, 1);

    g->show("e");
    EXPECT_EQ(drawn(*p), (Names{"d", "e", "f"}));
    EXPECT_TRUE(p->series()[1].draw == PlotKind::Line);
    EXPECT_EQ(calls, 2);
}

TEST(AllInOneGrouper, UnknownNamesAreIgnored)
{
    auto g     = make_combined(GrouperKind::AllInOne);
    int  calls = 0;
    g->set_on_change([&](Grouper&) { ++calls; });
    g->hide("zzz");
    g->show("zzz");
    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(g->is_visible("zzz"));
}

TEST(AllInOneGrouper, ReorderPreservesVisibility)
{
    auto g = make_combined(GrouperKind::AllInOne);
    g->hide("d");
    g->reorder({"f", "zzz", "d"});

    Panel* p = g->panels().front();
    EXPECT_EQ(g->names(), (Names{"f", "d", "e"}));
    EXPECT_EQ(p->variables(), (Names{"f", "d", "e"}));
    EXPECT_FALSE(g->is_visible("d"));
    EXPECT_EQ(drawn(*p), (Names{"f", "e"}));
}

TEST(AllInOneGrouper, ResizeMovesThePanel)
{
    auto g = make_combined(GrouperKind::AllInOne);
    g->resize({0.0f, 0.0f, 0.5f, 0.5f});
    EXPECT_FLOAT_EQ(g->panels().front()->position().w, 0.5f);
}

TEST(AllInOneGrouper, NoGroupBar)
{
    auto g = make_combined(GrouperKind::AllInOne);
    g->group_plots(0.2f);
    EXPECT_FALSE(g->panels().front()->group_bar().has_value());
}

// ─── Stacked ─────────────────────────────────────────────────────────────────

TEST(StackedGrouper, CumulativeRange)
{
    auto g = make_combined(GrouperKind::Stacked);
    EXPECT_EQ(g->kind(), GrouperKind::Stacked);
    ASSERT_EQ(g->panel_count(), 1u);

    Panel* p = g->panels().front();
    // row sums are 85, 153 and 62
    EXPECT_FLOAT_EQ(p->x_limits().min, 0.0f);
    EXPECT_FLOAT_EQ(p->x_limits().max, 153.0f);
    for (const auto& s : p->series())
        EXPECT_TRUE(s.draw == PlotKind::Stacked);
}

TEST(StackedGrouper, SharesAllInOneBehaviour)
{
    auto g = make_combined(GrouperKind::Stacked);
    g->hide("f");
    g->reorder({"f"});
    EXPECT_EQ(g->names(), (Names{"f", "d", "e"}));
    EXPECT_FALSE(g->is_visible("f"));
    g->show("f");
    EXPECT_TRUE(g->panels().front()->series()[0].draw == PlotKind::Stacked);
}

TEST(StackedGrouper, ClosedPanel)
{
    auto ctx = make_context();
    auto g   = make_grouper(GrouperKind::Stacked, ctx, "2", kBox, {"d", "e"}, false);
    ctx->panels.clear();
    g->hide("d");
    g->reorder({"e"});
    g->resize(kBox);
    EXPECT_FALSE(g->is_visible("d"));
    EXPECT_EQ(g->names(), (Names{"e", "d"}));
}
