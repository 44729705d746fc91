#include <algorithm>
#include <cmath>
#include <strata/classifier.hpp>
#include <strata/logger.hpp>

namespace strata
{

namespace
{

bool contains(const std::vector<std::string>& names, const std::string& name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

// Expands group names to their members; column names pass through.
std::vector<std::string> resolve_columns(const Classification&           result,
                                         const std::vector<std::string>& names)
{
    std::vector<std::string> columns;
    for (const auto& name : names)
    {
        if (result.has_group(name))
        {
            for (const auto& member : result.members(name))
            {
                if (!contains(columns, member))
                    columns.push_back(member);
            }
        }
        else if (result.data.has_column(name))
        {
            if (!contains(columns, name))
                columns.push_back(name);
        }
        else
        {
            STRATA_LOG_DEBUG("classify", "ignoring unknown column or group '{}'", name);
        }
    }
    return columns;
}

}   // namespace

// --- Classification ---

bool Classification::has_group(const std::string& group) const
{
    return groups.count(group) != 0;
}

const std::vector<std::string>& Classification::members(const std::string& group) const
{
    static const std::vector<std::string> empty;
    auto                                  it = groups.find(group);
    return it != groups.end() ? it->second : empty;
}

std::vector<std::string> Classification::plotted_members(const std::string& group) const
{
    std::vector<std::string> result;
    for (const auto& name : members(group))
    {
        if (is_plotted(name))
            result.push_back(name);
    }
    return result;
}

bool Classification::is_plotted(const std::string& column) const
{
    return plotted_.count(column) != 0;
}

// --- free functions ---

std::string no_grouper(const std::string& /*column*/)
{
    return NOGROUP;
}

std::unordered_map<std::string, std::string> invert_subgroups(const SubgroupMap& subgroups)
{
    std::unordered_map<std::string, std::string> result;
    for (const auto& [group, subs] : subgroups)
    {
        for (const auto& sub : subs)
            result[sub] = group;
    }
    return result;
}

void normalize_percentages(DataTable&                      table,
                           const std::vector<std::string>& columns,
                           const std::vector<std::string>& basis)
{
    std::vector<std::string> targets;
    for (const auto& name : columns)
    {
        if (table.has_column(name))
            targets.push_back(name);
    }
    if (targets.empty())
        return;

    // Denominators come from the values before any rescaling
    std::vector<float> denominators = table.row_sum(basis.empty() ? targets : basis);

    for (const auto& name : targets)
    {
        auto& values = table.column_mut(name);
        for (std::size_t i = 0; i < values.size(); ++i)
        {
            if (!std::isfinite(values[i]))
                continue;
            values[i] = denominators[i] != 0.0f ? values[i] / denominators[i] * 100.0f : 0.0f;
        }
    }
}

Classification classify_columns(const DataTable&         table,
                                const ClassifyFn&        classify,
                                const ClassifierOptions& options)
{
    Classification result;
    result.data = table;

    const ClassifyFn fn          = classify ? classify : ClassifyFn(no_grouper);
    auto             sub2group   = invert_subgroups(options.subgroups);

    // Bucket the columns, preserving first-occurrence order
    for (const auto& col : table.columns())
    {
        std::string key   = fn(col);
        std::string group = key;
        auto        it    = sub2group.find(key);
        if (it != sub2group.end())
            group = it->second;

        if (!result.has_group(group))
            result.group_order.push_back(group);
        result.groups[group].push_back(col);

        auto& info    = result.data.info(col);
        info.group    = group;
        info.subgroup = (group != key) ? key : std::string();
    }

    // Percentage pre-scaling; all denominators read the unscaled input
    if (options.calculate_percentages)
    {
        const DataTable          original = result.data;
        std::vector<std::string> basis    = resolve_columns(result, options.percentage_basis);
        for (const auto& group : options.percentages)
        {
            if (!result.has_group(group))
            {
                STRATA_LOG_DEBUG("classify", "percentage group '{}' does not exist", group);
                continue;
            }
            DataTable scratch = original;
            normalize_percentages(scratch, result.members(group), basis);
            for (const auto& col : result.members(group))
                result.data.column_mut(col) = scratch.column_mut(col);
        }
    }

    // Summed synthetic group
    std::vector<std::string> to_sum;
    if (options.sum_all_groups)
        to_sum = result.group_order;
    else
        to_sum = options.summed;
    for (const auto& group : to_sum)
    {
        if (!result.has_group(group) || group == SUMMED_GROUP)
            continue;
        if (result.data.has_column(group))
        {
            STRATA_LOG_WARN("classify",
                            "cannot sum group '{}': a column with that name exists",
                            group);
            continue;
        }
        result.data.add_column(group, result.data.row_sum(result.members(group)));
        auto& info     = result.data.info(group);
        info.group     = SUMMED_GROUP;
        info.long_name = "Sum of " + group;

        if (!result.has_group(SUMMED_GROUP))
            result.group_order.push_back(SUMMED_GROUP);
        result.groups[SUMMED_GROUP].push_back(group);
        result.summed_groups.push_back(group);
    }

    // Exclusion and threshold filtering
    for (const auto& col : result.data.columns())
    {
        const auto& info = result.data.info(col);
        if (contains(options.exclude, col) || contains(options.exclude, info.group)
            || (!info.subgroup.empty() && contains(options.exclude, info.subgroup)))
        {
            continue;
        }
        if (contains(options.percentages, info.group)
            && !(result.data.stats(col).max > options.threshold))
        {
            STRATA_LOG_DEBUG("classify",
                             "dropping '{}': never above {} percent",
                             col,
                             options.threshold);
            continue;
        }
        result.plot_vars.push_back(col);
        result.plotted_.insert(col);
    }

    STRATA_LOG_DEBUG("classify",
                     "{} columns in {} groups, {} plotted",
                     result.data.column_count(),
                     result.group_order.size(),
                     result.plot_vars.size());
    return result;
}

}   // namespace strata
