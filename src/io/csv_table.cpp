#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <strata/csv_table.hpp>
#include <strata/logger.hpp>
#include <vector>

namespace strata
{

namespace
{

// Detect delimiter by scanning the first line.
char detect_delimiter(const std::string& line)
{
    int commas = 0, semicolons = 0, tabs = 0;
    for (char c : line)
    {
        if (c == ',')
            ++commas;
        else if (c == ';')
            ++semicolons;
        else if (c == '\t')
            ++tabs;
    }
    if (tabs > 0 && tabs >= commas && tabs >= semicolons)
        return '\t';
    if (semicolons > commas)
        return ';';
    return ',';
}

bool try_parse_float(const std::string& s, float& out)
{
    if (s.empty())
        return false;
    char* end = nullptr;
    float val = std::strtof(s.c_str(), &end);
    while (end && *end && std::isspace(static_cast<unsigned char>(*end)))
        ++end;
    if (end == s.c_str() || (end && *end != '\0'))
        return false;
    out = val;
    return true;
}

void trim(std::string& field)
{
    while (!field.empty() && std::isspace(static_cast<unsigned char>(field.front())))
        field.erase(field.begin());
    while (!field.empty() && std::isspace(static_cast<unsigned char>(field.back())))
        field.pop_back();
}

// Split a line by delimiter, respecting quoted fields.
std::vector<std::string> split_line(const std::string& line, char delim)
{
    std::vector<std::string> fields;
    std::string              field;
    bool                     in_quotes = false;

    for (char c : line)
    {
        if (c == '"')
        {
            in_quotes = !in_quotes;
        }
        else if (c == delim && !in_quotes)
        {
            trim(field);
            fields.push_back(field);
            field.clear();
        }
        else
        {
            field += c;
        }
    }
    trim(field);
    fields.push_back(field);

    return fields;
}

}   // namespace

CsvTableResult read_csv_table(std::istream& in)
{
    CsvTableResult result;

    std::vector<std::string> lines;
    std::string              line;
    while (std::getline(in, line))
    {
        // Strip trailing \r (Windows line endings)
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            lines.push_back(line);
    }

    if (lines.empty())
    {
        result.error = "Table is empty";
        return result;
    }

    char delim        = detect_delimiter(lines[0]);
    auto first_fields = split_line(lines[0], delim);
    if (first_fields.size() < 2)
    {
        result.error = "Expected an index column and at least one data column";
        return result;
    }

    // A header row contains at least one non-numeric field
    bool has_header = false;
    for (const auto& f : first_fields)
    {
        float dummy;
        if (!try_parse_float(f, dummy))
        {
            has_header = true;
            break;
        }
    }

    std::vector<std::string> headers;
    std::size_t              data_start = 0;
    if (has_header)
    {
        headers    = first_fields;
        data_start = 1;
    }
    else
    {
        headers.push_back("");
        for (std::size_t i = 1; i < first_fields.size(); ++i)
            headers.push_back("Column " + std::to_string(i));
    }

    const float                     nan = std::numeric_limits<float>::quiet_NaN();
    std::vector<std::vector<float>> columns(headers.size());
    for (std::size_t i = data_start; i < lines.size(); ++i)
    {
        auto fields = split_line(lines[i], delim);
        for (std::size_t c = 0; c < headers.size(); ++c)
        {
            float val = nan;
            if (c < fields.size() && !try_parse_float(fields[c], val))
                val = nan;
            columns[c].push_back(val);
        }
    }

    try
    {
        DataTable table(headers[0]);
        table.set_index(std::move(columns[0]));
        for (std::size_t c = 1; c < headers.size(); ++c)
            table.add_column(headers[c], std::move(columns[c]));
        result.table = std::move(table);
    }
    catch (const std::invalid_argument& e)
    {
        result.error = e.what();
    }

    STRATA_LOG_DEBUG("io",
                     "read table with {} rows and {} columns",
                     result.table.row_count(),
                     result.table.column_count());
    return result;
}

CsvTableResult load_csv_table(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        CsvTableResult result;
        result.error = "Cannot open file: " + path;
        return result;
    }
    return read_csv_table(file);
}

}   // namespace strata
