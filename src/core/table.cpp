#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <strata/table.hpp>

namespace strata
{

DataTable::DataTable(std::string index_name) : index_name_(std::move(index_name))
{
    if (index_name_.empty())
        index_name_ = "y";
}

void DataTable::set_index(std::vector<float> values)
{
    if (!order_.empty() && values.size() != index_.size())
    {
        throw std::invalid_argument("index length does not match existing columns");
    }
    index_ = std::move(values);
}

void DataTable::add_column(const std::string& name, std::vector<float> values)
{
    if (columns_.count(name))
    {
        throw std::invalid_argument("duplicate column: " + name);
    }
    if (order_.empty() && index_.empty())
    {
        // No index given yet: use the row number
        index_.resize(values.size());
        for (std::size_t i = 0; i < values.size(); ++i)
            index_[i] = static_cast<float>(i);
    }
    if (values.size() != index_.size())
    {
        throw std::invalid_argument("column " + name + " has " + std::to_string(values.size())
                                    + " rows, index has " + std::to_string(index_.size()));
    }
    order_.push_back(name);
    columns_[name].values = std::move(values);
}

bool DataTable::has_column(const std::string& name) const
{
    return columns_.count(name) != 0;
}

std::span<const float> DataTable::column(const std::string& name) const
{
    auto it = columns_.find(name);
    if (it == columns_.end())
        throw std::out_of_range("unknown column: " + name);
    return it->second.values;
}

std::vector<float>& DataTable::column_mut(const std::string& name)
{
    auto it = columns_.find(name);
    if (it == columns_.end())
        throw std::out_of_range("unknown column: " + name);
    return it->second.values;
}

ColumnInfo& DataTable::info(const std::string& name)
{
    auto it = columns_.find(name);
    if (it == columns_.end())
        throw std::out_of_range("unknown column: " + name);
    return it->second.info;
}

const ColumnInfo& DataTable::info(const std::string& name) const
{
    auto it = columns_.find(name);
    if (it == columns_.end())
        throw std::out_of_range("unknown column: " + name);
    return it->second.info;
}

ColumnStats DataTable::stats(const std::string& name) const
{
    ColumnStats result;
    double      sum   = 0.0;
    bool        first = true;
    for (float v : column(name))
    {
        if (!std::isfinite(v))
            continue;
        if (first)
        {
            result.min = result.max = v;
            first                   = false;
        }
        result.min = std::min(result.min, v);
        result.max = std::max(result.max, v);
        sum += v;
        ++result.count;
    }
    if (result.count > 0)
        result.mean = static_cast<float>(sum / static_cast<double>(result.count));
    return result;
}

std::vector<float> DataTable::row_sum(const std::vector<std::string>& names) const
{
    std::vector<float> sums(row_count(), 0.0f);
    for (const auto& name : names)
    {
        auto it = columns_.find(name);
        if (it == columns_.end())
            continue;
        const auto& values = it->second.values;
        for (std::size_t i = 0; i < sums.size(); ++i)
        {
            if (std::isfinite(values[i]))
                sums[i] += values[i];
        }
    }
    return sums;
}

}   // namespace strata
