#pragma once

#include <functional>
#include <strata/table.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace strata
{

// Group key assigned by the default classifier.
inline constexpr const char* NOGROUP = "nogroup";

// Group receiving the synthesized row sums.
inline constexpr const char* SUMMED_GROUP = "Summed";

// Maps a column name to its group (or subgroup) key.
using ClassifyFn = std::function<std::string(const std::string&)>;

// group -> subgroup keys that belong to it
using SubgroupMap = std::unordered_map<std::string, std::vector<std::string>>;

// Puts every column into NOGROUP.
std::string no_grouper(const std::string& column);

struct ClassifierOptions
{
    std::vector<std::string> percentages;        // groups normalized to 100 per row
    std::vector<std::string> exclude;            // columns, groups or subgroups to drop
    std::vector<std::string> percentage_basis;   // denominator columns/groups; empty = the group
    bool                     calculate_percentages = true;
    float                    threshold             = 1.0f;   // percent
    std::vector<std::string> summed;                         // groups to sum up
    bool                     sum_all_groups = false;
    SubgroupMap              subgroups;
};

struct Classification
{
    // Copy of the input with normalized percentages and the summed columns.
    DataTable data;

    // Groups in first-occurrence order with their members in table order.
    std::vector<std::string>                                  group_order;
    std::unordered_map<std::string, std::vector<std::string>> groups;

    // Columns that survived exclusion and threshold filtering, in table order.
    std::vector<std::string> plot_vars;

    // Groups that received a synthesized sum column.
    std::vector<std::string> summed_groups;

    bool                            has_group(const std::string& group) const;
    const std::vector<std::string>& members(const std::string& group) const;
    std::vector<std::string>        plotted_members(const std::string& group) const;
    bool                            is_plotted(const std::string& column) const;

   private:
    friend Classification classify_columns(const DataTable&,
                                           const ClassifyFn&,
                                           const ClassifierOptions&);
    std::unordered_set<std::string> plotted_;
};

// Inverts group -> [subgroup] into subgroup -> group.
std::unordered_map<std::string, std::string> invert_subgroups(const SubgroupMap& subgroups);

// Rescales every row of `columns` so that it sums to 100. The denominator is
// the row sum over `basis` (or over `columns` when `basis` is empty).
// Rows with a zero denominator are set to 0. Unknown names are ignored.
void normalize_percentages(DataTable&                      table,
                           const std::vector<std::string>& columns,
                           const std::vector<std::string>& basis = {});

// Full classification pass: bucketing, subgroup remapping, percentage
// normalization, summed group synthesis, exclusion and threshold filtering.
Classification classify_columns(const DataTable&         table,
                                const ClassifyFn&        classify,
                                const ClassifierOptions& options);

}   // namespace strata
