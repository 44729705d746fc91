#include <cmath>
#include <gtest/gtest.h>
#include <strata/group_bar.hpp>

using namespace strata;

// ─── Geometry ────────────────────────────────────────────────────────────────

TEST(GroupBarGeometry, SpansPanels)
{
    GroupBarAnnotator ann;
    FigureCanvas      canvas{1000, 500};
    Rect              a{0.1f, 0.1f, 0.2f, 0.5f};
    Rect              b{0.3f, 0.1f, 0.3f, 0.5f};

    auto bar = ann.compute(a, {a, b}, "Pollen", canvas);
    ASSERT_TRUE(bar.has_value());
    EXPECT_FLOAT_EQ(bar->x0, 0.1f);
    EXPECT_FLOAT_EQ(bar->x1, 0.6f);
    EXPECT_FLOAT_EQ(bar->top, 0.6f);
    EXPECT_EQ(bar->label, "Pollen");
    EXPECT_TRUE(bar->background);
}

TEST(GroupBarGeometry, OffsetGoesThroughPixels)
{
    GroupBarAnnotator ann(GroupBarStyle{45.0f, 0.2f, true});
    FigureCanvas      canvas{1000, 500};
    Rect              a{0.1f, 0.1f, 0.2f, 0.5f};

    auto bar = ann.compute(a, {a}, "g", canvas);
    ASSERT_TRUE(bar.has_value());
    // 0.2 * 0.5 figure = 0.1 figure = 50 px
    EXPECT_NEAR(bar->offset, 0.1f, 1e-6f);
    EXPECT_NEAR(bar->offset_px, 50.0f, 1e-3f);
    EXPECT_NEAR(bar->arm_px, 50.0f * std::sqrt(2.0f), 1e-3f);
    // horizontal run of 50 px on a 1000 px wide canvas
    EXPECT_NEAR(bar->shift, 0.05f, 1e-5f);
}

TEST(GroupBarGeometry, LabelAtMidpoint)
{
    GroupBarAnnotator ann(GroupBarStyle{90.0f, 0.2f, true});
    FigureCanvas      canvas{800, 600};
    Rect              a{0.2f, 0.1f, 0.2f, 0.5f};
    Rect              b{0.4f, 0.1f, 0.2f, 0.5f};

    auto bar = ann.compute(a, {a, b}, "g", canvas);
    ASSERT_TRUE(bar.has_value());
    EXPECT_FLOAT_EQ(bar->shift, 0.0f);
    EXPECT_NEAR(bar->label_pos.x, 0.4f, 1e-6f);
    EXPECT_NEAR(bar->label_pos.y, bar->top + bar->offset, 1e-6f);
}

TEST(GroupBarGeometry, VerticalConnectors)
{
    GroupBarAnnotator ann(GroupBarStyle{90.0f, 0.2f, true});
    FigureCanvas      canvas{800, 600};
    Rect              a{0.2f, 0.1f, 0.2f, 0.5f};

    auto bar = ann.compute(a, {a}, "g", canvas);
    ASSERT_TRUE(bar.has_value());
    ASSERT_EQ(bar->bracket.size(), 4u);
    EXPECT_FLOAT_EQ(bar->bracket[0].x, bar->bracket[1].x);
    EXPECT_FLOAT_EQ(bar->bracket[2].x, bar->bracket[3].x);
    EXPECT_FLOAT_EQ(bar->bracket[0].y, bar->top);
    EXPECT_FLOAT_EQ(bar->bracket[3].y, bar->top);
    EXPECT_NEAR(bar->arm_px, bar->offset_px, 1e-3f);
}

TEST(GroupBarGeometry, EmptySpan)
{
    GroupBarAnnotator ann;
    EXPECT_FALSE(ann.compute({}, {}, "g", {}).has_value());
}

TEST(GroupBarGeometry, CanvasResizeChangesPixelsNotFigureOffset)
{
    GroupBarAnnotator ann;
    Rect              a{0.1f, 0.1f, 0.2f, 0.5f};
    auto              small = ann.compute(a, {a}, "g", FigureCanvas{400, 300});
    auto              large = ann.compute(a, {a}, "g", FigureCanvas{800, 600});
    ASSERT_TRUE(small && large);
    EXPECT_NEAR(small->offset, large->offset, 1e-6f);
    EXPECT_NEAR(large->offset_px, 2.0f * small->offset_px, 1e-3f);
}

// ─── Attachment ──────────────────────────────────────────────────────────────

class GroupBarAttach : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        for (int i = 0; i < 3; ++i)
        {
            auto& p = panels.create("g");
            p.set_position({0.1f + 0.2f * static_cast<float>(i), 0.1f, 0.2f, 0.5f});
            ids.push_back(p.id());
        }
        share = links.create_group("g");
        links.set_members(share, ids);
    }

    PanelRegistry        panels;
    ScaleLinkManager     links;
    std::vector<PanelId> ids;
    ShareGroupId         share = 0;
    GroupBarAnnotator    ann;
};

TEST_F(GroupBarAttach, AttachesToAnchorOnly)
{
    ASSERT_TRUE(ann.annotate(panels, links, share, ids, "g", {}));
    ASSERT_TRUE(panels.get(ids[0])->group_bar().has_value());
    EXPECT_FALSE(panels.get(ids[1])->group_bar().has_value());
    EXPECT_FALSE(panels.get(ids[2])->group_bar().has_value());
    EXPECT_NEAR(panels.get(ids[0])->group_bar()->x1, 0.7f, 1e-6f);
}

TEST_F(GroupBarAttach, RepeatedAnnotationDoesNotAccumulate)
{
    ann.annotate(panels, links, share, ids, "g", {});
    links.set_members(share, {ids[1], ids[2]});
    ann.annotate(panels, links, share, ids, "g", {});

    EXPECT_FALSE(panels.get(ids[0])->group_bar().has_value());
    ASSERT_TRUE(panels.get(ids[1])->group_bar().has_value());
    EXPECT_NEAR(panels.get(ids[1])->group_bar()->x0, 0.3f, 1e-6f);
}

TEST_F(GroupBarAttach, HiddenMembersAreNotSpanned)
{
    panels.get(ids[2])->visible(false);
    ann.annotate(panels, links, share, ids, "g", {});
    EXPECT_NEAR(panels.get(ids[0])->group_bar()->x1, 0.5f, 1e-6f);
}

TEST_F(GroupBarAttach, ClosedAnchor)
{
    panels.remove(ids[0]);
    // the link manager still names the removed panel as anchor
    EXPECT_FALSE(ann.annotate(panels, links, share, ids, "g", {}));
}

TEST_F(GroupBarAttach, RemoveClearsLabelAndBracket)
{
    ann.annotate(panels, links, share, ids, "g", {});
    GroupBarAnnotator::remove(panels, ids);
    for (PanelId id : ids)
        EXPECT_FALSE(panels.get(id)->group_bar().has_value());
}
