#pragma once

#include <optional>
#include <strata/classifier.hpp>
#include <strata/format.hpp>
#include <strata/geometry.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata
{

// Options of one stratplot() call.
struct StratOptions
{
    // Classification
    std::vector<std::string> percentages;
    std::vector<std::string> exclude;
    std::vector<std::string> percentage_basis;
    bool                     calculate_percentages = true;
    float                    threshold             = 1.0f;   // percent
    std::vector<std::string> summed;
    bool                     sum_all_groups = false;
    SubgroupMap              subgroups;

    // Variants: all_in_one > stacked > percentages > default
    std::vector<std::string> all_in_one;
    std::vector<std::string> stacked;
    std::vector<std::string> use_bars;
    bool                     bars_for_all = false;

    // Geometry
    std::unordered_map<std::string, float> widths;   // fraction of the envelope width
    float                                  min_percentage  = 20.0f;
    float                                  trunc_height    = 0.3f;
    float                                  group_bar_angle = 45.0f;
    std::optional<Rect>                    bbox;

    std::unordered_map<std::string, FormatOverrides> formatoptions;

    ClassifierOptions classifier_options() const;
};

// JSON persistence. deserialize_options() leaves fields absent from the text
// untouched and returns false (with a message in `error`) on malformed input.
std::string serialize_options(const StratOptions& options);
bool        deserialize_options(const std::string& json, StratOptions& options, std::string* error = nullptr);
bool        save_options_file(const std::string& path, const StratOptions& options);
bool        load_options_file(const std::string& path, StratOptions& options, std::string* error = nullptr);

}   // namespace strata
