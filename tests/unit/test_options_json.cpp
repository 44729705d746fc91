#include <filesystem>
#include <gtest/gtest.h>
#include <strata/options.hpp>

using namespace strata;

using Names = std::vector<std::string>;

static StratOptions make_options()
{
    StratOptions o;
    o.percentages           = {"Pollen"};
    o.exclude               = {"Pollen/Zea", "Charcoal"};
    o.percentage_basis      = {"Pollen", "Spores"};
    o.calculate_percentages = false;
    o.threshold             = 2.5f;
    o.summed                = {"Pollen"};
    o.sum_all_groups        = true;
    o.subgroups             = {{"Pollen", {"Trees", "Herbs"}}};
    o.all_in_one            = {"Chemistry"};
    o.stacked               = {"Diatoms"};
    o.use_bars              = {"Charcoal"};
    o.bars_for_all          = true;
    o.widths                = {{"Pollen", 0.6f}, {"Chemistry", 0.2f}};
    o.min_percentage        = 10.0f;
    o.trunc_height          = 0.25f;
    o.group_bar_angle       = 90.0f;
    o.bbox                  = Rect{0.05f, 0.1f, 0.9f, 0.8f};

    FormatOverrides fo;
    fo.plot               = PlotKind::Stacked;
    fo.title              = "Sum of \"%(name)s\"";
    fo.title_wrap         = 20;
    fo.legend             = false;
    fo.x_ticks            = std::vector<float>{0.0f, 50.0f};
    fo.x_limits           = AxisLimits{0.0f, 120.0f};
    o.formatoptions["Summed"] = fo;
    return o;
}

// ─── Round trip ──────────────────────────────────────────────────────────────

TEST(OptionsJson, RoundTrip)
{
    StratOptions in = make_options();
    StratOptions out;
    std::string  error;
    ASSERT_TRUE(deserialize_options(serialize_options(in), out, &error)) << error;

    EXPECT_EQ(out.percentages, in.percentages);
    EXPECT_EQ(out.exclude, in.exclude);
    EXPECT_EQ(out.percentage_basis, in.percentage_basis);
    EXPECT_FALSE(out.calculate_percentages);
    EXPECT_FLOAT_EQ(out.threshold, 2.5f);
    EXPECT_EQ(out.summed, in.summed);
    EXPECT_TRUE(out.sum_all_groups);
    EXPECT_EQ(out.subgroups.at("Pollen"), (Names{"Trees", "Herbs"}));
    EXPECT_EQ(out.all_in_one, in.all_in_one);
    EXPECT_EQ(out.stacked, in.stacked);
    EXPECT_EQ(out.use_bars, in.use_bars);
    EXPECT_TRUE(out.bars_for_all);
    EXPECT_FLOAT_EQ(out.widths.at("Pollen"), 0.6f);
    EXPECT_FLOAT_EQ(out.widths.at("Chemistry"), 0.2f);
    EXPECT_FLOAT_EQ(out.min_percentage, 10.0f);
    EXPECT_FLOAT_EQ(out.trunc_height, 0.25f);
    EXPECT_FLOAT_EQ(out.group_bar_angle, 90.0f);
    ASSERT_TRUE(out.bbox.has_value());
    EXPECT_FLOAT_EQ(out.bbox->w, 0.9f);

    ASSERT_EQ(out.formatoptions.count("Summed"), 1u);
    const auto& fo = out.formatoptions.at("Summed");
    EXPECT_TRUE(fo.plot == PlotKind::Stacked);
    EXPECT_EQ(fo.title.value_or(""), "Sum of \"%(name)s\"");
    EXPECT_EQ(fo.title_wrap.value_or(0), 20);
    EXPECT_TRUE(fo.legend == false);
    ASSERT_TRUE(fo.x_ticks.has_value());
    EXPECT_EQ(fo.x_ticks->size(), 2u);
    ASSERT_TRUE(fo.x_limits.has_value());
    EXPECT_FLOAT_EQ(fo.x_limits->max, 120.0f);
    EXPECT_FALSE(fo.group_bar_angle.has_value());
    EXPECT_FALSE(fo.y_ticks_visible.has_value());
}

TEST(OptionsJson, DefaultsRoundTrip)
{
    StratOptions out;
    out.threshold = 99.0f;
    ASSERT_TRUE(deserialize_options(serialize_options(StratOptions{}), out));
    EXPECT_FLOAT_EQ(out.threshold, 1.0f);
    EXPECT_FALSE(out.bbox.has_value());
    EXPECT_TRUE(out.formatoptions.empty());
    EXPECT_TRUE(out.calculate_percentages);
}

TEST(OptionsJson, SerializeIsStable)
{
    EXPECT_EQ(serialize_options(make_options()), serialize_options(make_options()));
}

// ─── Parsing ─────────────────────────────────────────────────────────────────

TEST(OptionsJson, PartialDocumentKeepsOtherFields)
{
    StratOptions o;
    o.threshold = 3.0f;
    ASSERT_TRUE(deserialize_options(R"({"percentages": ["Pollen"], "widths": {"Pollen": 0.5}})", o));
    EXPECT_EQ(o.percentages, (Names{"Pollen"}));
    EXPECT_FLOAT_EQ(o.widths.at("Pollen"), 0.5f);
    EXPECT_FLOAT_EQ(o.threshold, 3.0f);
}

TEST(OptionsJson, UnknownKeysAreIgnored)
{
    StratOptions o;
    ASSERT_TRUE(deserialize_options(
        R"({"colors": {"Pollen": "green"}, "stacked": ["Diatoms"],
            "formatoptions": {"Diatoms": {"plot": "stacked", "hatch": "//"}}})",
        o));
    EXPECT_EQ(o.stacked, (Names{"Diatoms"}));
    EXPECT_TRUE(o.formatoptions.at("Diatoms").plot == PlotKind::Stacked);
}

TEST(OptionsJson, NestedValuesDoNotShadowKeys)
{
    StratOptions o;
    ASSERT_TRUE(deserialize_options(
        R"({"formatoptions": {"x": {"title": "stacked"}}, "stacked": []})", o));
    EXPECT_TRUE(o.stacked.empty());
    EXPECT_EQ(o.formatoptions.at("x").title.value_or(""), "stacked");
}

TEST(OptionsJson, MalformedInputLeavesOptionsUntouched)
{
    StratOptions o;
    o.percentages = {"Pollen"};
    std::string error;

    EXPECT_FALSE(deserialize_options("", o, &error));
    EXPECT_FALSE(deserialize_options("[1, 2]", o, &error));
    EXPECT_FALSE(deserialize_options(R"({"percentages": ["Spores"], "threshold": )", o, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(o.percentages, (Names{"Pollen"}));
}

TEST(OptionsJson, WrongTypesAreRejected)
{
    StratOptions o;
    EXPECT_FALSE(deserialize_options(R"({"percentages": "Pollen"})", o));
    EXPECT_FALSE(deserialize_options(R"({"threshold": "high"})", o));
    EXPECT_FALSE(deserialize_options(R"({"bars_for_all": 1})", o));
    EXPECT_FALSE(deserialize_options(R"({"bbox": [0, 0, 1]})", o));
    EXPECT_FALSE(deserialize_options(R"({"formatoptions": {"g": {"plot": "scatter"}}})", o));
    EXPECT_FLOAT_EQ(o.threshold, 1.0f);
}

TEST(OptionsJson, FutureVersionIsRejected)
{
    StratOptions o;
    std::string  error;
    EXPECT_FALSE(deserialize_options(R"({"version": 2, "threshold": 5})", o, &error));
    EXPECT_NE(error.find("version"), std::string::npos);
    EXPECT_FLOAT_EQ(o.threshold, 1.0f);
}

// ─── Files ───────────────────────────────────────────────────────────────────

TEST(OptionsJson, SaveAndLoadFile)
{
    auto dir  = std::filesystem::temp_directory_path() / "strata_options_test";
    auto path = (dir / "nested" / "options.json").string();

    ASSERT_TRUE(save_options_file(path, make_options()));
    StratOptions loaded;
    std::string  error;
    ASSERT_TRUE(load_options_file(path, loaded, &error)) << error;
    EXPECT_EQ(loaded.all_in_one, (Names{"Chemistry"}));

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(OptionsJson, MissingFile)
{
    StratOptions o;
    std::string  error;
    EXPECT_FALSE(load_options_file("/nonexistent/strata/options.json", o, &error));
    EXPECT_FALSE(error.empty());
}
