#pragma once

#include <istream>
#include <strata/table.hpp>
#include <string>

namespace strata
{

// Result of reading a delimited text table.
// The first column becomes the index; its header (if any) the index name.
// Supports comma, semicolon and tab delimiters and double-quoted fields.
// Cells that are empty or not numeric are stored as NaN.
struct CsvTableResult
{
    DataTable   table;
    std::string error;   // Non-empty on failure

    bool ok() const { return error.empty(); }
};

CsvTableResult load_csv_table(const std::string& path);
CsvTableResult read_csv_table(std::istream& in);

}   // namespace strata
