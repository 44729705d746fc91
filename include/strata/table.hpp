#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata
{

struct ColumnStats
{
    float       mean  = 0.0f;
    float       min   = 0.0f;
    float       max   = 0.0f;
    std::size_t count = 0;   // number of finite values
};

// Per-column metadata attached during classification.
struct ColumnInfo
{
    std::string group;
    std::string subgroup;    // raw classifier key when it was remapped to `group`
    std::string long_name;   // set for synthesized columns
};

// A rectangular table: one ordered index (depth, age, ...) and any number of
// named float columns of the same length, kept in insertion order.
class DataTable
{
   public:
    DataTable() = default;
    explicit DataTable(std::string index_name);

    const std::string& index_name() const { return index_name_; }
    void               index_name(const std::string& name) { index_name_ = name; }

    // Replacing the index is only allowed while the table has no columns or
    // when the row count does not change.
    void                   set_index(std::vector<float> values);
    std::span<const float> index() const { return index_; }
    std::size_t            row_count() const { return index_.size(); }

    // Throws std::invalid_argument on a duplicate name or a length mismatch.
    void add_column(const std::string& name, std::vector<float> values);

    const std::vector<std::string>& columns() const { return order_; }
    std::size_t                     column_count() const { return order_.size(); }
    bool                            has_column(const std::string& name) const;

    // Throws std::out_of_range for unknown names.
    std::span<const float> column(const std::string& name) const;
    std::vector<float>&    column_mut(const std::string& name);

    ColumnInfo&       info(const std::string& name);
    const ColumnInfo& info(const std::string& name) const;

    // Statistics over the finite values of a column. Zeroed for an empty one.
    ColumnStats stats(const std::string& name) const;

    // Row-wise sum of the given columns. Unknown names are skipped.
    std::vector<float> row_sum(const std::vector<std::string>& names) const;

   private:
    struct Column
    {
        std::vector<float> values;
        ColumnInfo         info;
    };

    std::string                             index_name_ = "y";
    std::vector<float>                      index_;
    std::vector<std::string>                order_;
    std::unordered_map<std::string, Column> columns_;
};

}   // namespace strata
