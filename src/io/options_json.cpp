#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <strata/logger.hpp>
#include <strata/options.hpp>

namespace strata
{

namespace
{

constexpr int OPTIONS_VERSION = 1;

// ─── Writing ─────────────────────────────────────────────────────────────────

std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

void write_string_list(std::ostringstream& os, const std::vector<std::string>& list)
{
    os << "[";
    for (size_t i = 0; i < list.size(); ++i)
    {
        if (i > 0)
            os << ", ";
        os << "\"" << escape_json(list[i]) << "\"";
    }
    os << "]";
}

void write_float_list(std::ostringstream& os, const std::vector<float>& list)
{
    os << "[";
    for (size_t i = 0; i < list.size(); ++i)
    {
        if (i > 0)
            os << ", ";
        os << list[i];
    }
    os << "]";
}

// Map keys are written sorted so that the output is stable.
template <typename Map>
std::vector<std::string> sorted_keys(const Map& m)
{
    std::vector<std::string> keys;
    for (const auto& [k, v] : m)
        keys.push_back(k);
    std::sort(keys.begin(), keys.end());
    return keys;
}

void write_overrides(std::ostringstream& os, const FormatOverrides& fo)
{
    std::vector<std::string> fields;
    auto                     field = [&](const std::string& key, const std::string& value)
    { fields.push_back("\"" + key + "\": " + value); };

    if (fo.plot)
        field("plot", std::string("\"") + to_string(*fo.plot) + "\"");
    if (fo.y_ticks_visible)
        field("y_ticks_visible", *fo.y_ticks_visible ? "true" : "false");
    if (fo.x_ticks)
    {
        std::ostringstream ticks;
        write_float_list(ticks, *fo.x_ticks);
        field("x_ticks", ticks.str());
    }
    if (fo.title)
        field("title", "\"" + escape_json(*fo.title) + "\"");
    if (fo.title_wrap)
        field("title_wrap", std::to_string(*fo.title_wrap));
    if (fo.legend)
        field("legend", *fo.legend ? "true" : "false");
    if (fo.group_bar_angle)
    {
        std::ostringstream v;
        v << *fo.group_bar_angle;
        field("group_bar_angle", v.str());
    }
    if (fo.x_limits)
    {
        std::ostringstream v;
        write_float_list(v, {fo.x_limits->min, fo.x_limits->max});
        field("x_limits", v.str());
    }

    os << "{";
    for (size_t i = 0; i < fields.size(); ++i)
    {
        if (i > 0)
            os << ", ";
        os << fields[i];
    }
    os << "}";
}

// ─── Reading ─────────────────────────────────────────────────────────────────
// Values are kept as raw JSON text and decoded on demand.

using Members = std::map<std::string, std::string>;

size_t skip_ws(const std::string& s, size_t pos)
{
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t' || s[pos] == '\n' || s[pos] == '\r'))
        ++pos;
    return pos;
}

// End (one past) of the string literal starting at `pos` (which is a quote).
size_t string_end(const std::string& s, size_t pos)
{
    for (size_t i = pos + 1; i < s.size(); ++i)
    {
        if (s[i] == '\\')
            ++i;
        else if (s[i] == '"')
            return i + 1;
    }
    return std::string::npos;
}

// End (one past) of the value starting at `pos`.
size_t value_end(const std::string& s, size_t pos)
{
    if (pos >= s.size())
        return std::string::npos;
    if (s[pos] == '"')
        return string_end(s, pos);
    if (s[pos] == '{' || s[pos] == '[')
    {
        int depth = 0;
        for (size_t i = pos; i < s.size(); ++i)
        {
            if (s[i] == '"')
            {
                i = string_end(s, i);
                if (i == std::string::npos)
                    return i;
                --i;
            }
            else if (s[i] == '{' || s[i] == '[')
                ++depth;
            else if (s[i] == '}' || s[i] == ']')
            {
                if (--depth == 0)
                    return i + 1;
            }
        }
        return std::string::npos;
    }
    size_t end = pos;
    while (end < s.size() && s[end] != ',' && s[end] != '}' && s[end] != ']'
           && s[end] != ' ' && s[end] != '\n' && s[end] != '\r' && s[end] != '\t')
        ++end;
    return end == pos ? std::string::npos : end;
}

std::string unescape(const std::string& raw)
{
    // raw includes the surrounding quotes
    std::string out;
    for (size_t i = 1; i + 1 < raw.size(); ++i)
    {
        char c = raw[i];
        if (c == '\\' && i + 2 < raw.size())
        {
            char n = raw[++i];
            switch (n)
            {
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                default:
                    out += n;
                    break;
            }
        }
        else
        {
            out += c;
        }
    }
    return out;
}

bool parse_object(const std::string& json, Members& out, std::string& error)
{
    size_t pos = skip_ws(json, 0);
    if (pos >= json.size() || json[pos] != '{')
    {
        error = "expected '{'";
        return false;
    }
    pos = skip_ws(json, pos + 1);
    if (pos < json.size() && json[pos] == '}')
        return true;

    while (pos < json.size())
    {
        if (json[pos] != '"')
        {
            error = "expected key at offset " + std::to_string(pos);
            return false;
        }
        size_t key_end = string_end(json, pos);
        if (key_end == std::string::npos)
        {
            error = "unterminated key";
            return false;
        }
        std::string key = unescape(json.substr(pos, key_end - pos));

        pos = skip_ws(json, key_end);
        if (pos >= json.size() || json[pos] != ':')
        {
            error = "expected ':' after \"" + key + "\"";
            return false;
        }
        pos          = skip_ws(json, pos + 1);
        size_t v_end = value_end(json, pos);
        if (v_end == std::string::npos)
        {
            error = "bad value for \"" + key + "\"";
            return false;
        }
        out[key] = json.substr(pos, v_end - pos);

        pos = skip_ws(json, v_end);
        if (pos < json.size() && json[pos] == ',')
        {
            pos = skip_ws(json, pos + 1);
            continue;
        }
        if (pos < json.size() && json[pos] == '}')
            return true;
        error = "expected ',' or '}' after \"" + key + "\"";
        return false;
    }
    error = "unterminated object";
    return false;
}

bool parse_array(const std::string& json, std::vector<std::string>& out)
{
    size_t pos = skip_ws(json, 0);
    if (pos >= json.size() || json[pos] != '[')
        return false;
    pos = skip_ws(json, pos + 1);
    if (pos < json.size() && json[pos] == ']')
        return true;

    while (pos < json.size())
    {
        size_t end = value_end(json, pos);
        if (end == std::string::npos)
            return false;
        out.push_back(json.substr(pos, end - pos));
        pos = skip_ws(json, end);
        if (pos < json.size() && json[pos] == ',')
        {
            pos = skip_ws(json, pos + 1);
            continue;
        }
        return pos < json.size() && json[pos] == ']';
    }
    return false;
}

bool decode_string(const std::string& raw, std::string& out)
{
    if (raw.size() < 2 || raw.front() != '"')
        return false;
    out = unescape(raw);
    return true;
}

bool decode_number(const std::string& raw, float& out)
{
    char* end = nullptr;
    float v   = std::strtof(raw.c_str(), &end);
    if (end == raw.c_str() || *end != '\0')
        return false;
    out = v;
    return true;
}

bool decode_bool(const std::string& raw, bool& out)
{
    if (raw == "true")
        out = true;
    else if (raw == "false")
        out = false;
    else
        return false;
    return true;
}

bool decode_string_list(const std::string& raw, std::vector<std::string>& out)
{
    std::vector<std::string> items;
    if (!parse_array(raw, items))
        return false;
    std::vector<std::string> result;
    for (const auto& item : items)
    {
        std::string s;
        if (!decode_string(item, s))
            return false;
        result.push_back(std::move(s));
    }
    out = std::move(result);
    return true;
}

bool decode_float_list(const std::string& raw, std::vector<float>& out)
{
    std::vector<std::string> items;
    if (!parse_array(raw, items))
        return false;
    std::vector<float> result;
    for (const auto& item : items)
    {
        float v = 0.0f;
        if (!decode_number(item, v))
            return false;
        result.push_back(v);
    }
    out = std::move(result);
    return true;
}

bool decode_overrides(const std::string& raw, FormatOverrides& fo, std::string& error)
{
    Members m;
    if (!parse_object(raw, m, error))
        return false;

    for (const auto& [key, value] : m)
    {
        bool ok = true;
        if (key == "plot")
        {
            std::string s;
            ok = decode_string(value, s);
            if (ok)
            {
                fo.plot = plot_kind_from_string(s);
                ok      = fo.plot.has_value();
            }
        }
        else if (key == "y_ticks_visible" || key == "legend")
        {
            bool b = false;
            ok     = decode_bool(value, b);
            (key == "legend" ? fo.legend : fo.y_ticks_visible) = b;
        }
        else if (key == "x_ticks")
        {
            std::vector<float> ticks;
            ok         = decode_float_list(value, ticks);
            fo.x_ticks = ticks;
        }
        else if (key == "title")
        {
            std::string s;
            ok       = decode_string(value, s);
            fo.title = s;
        }
        else if (key == "title_wrap")
        {
            float v       = 0.0f;
            ok            = decode_number(value, v);
            fo.title_wrap = static_cast<int>(v);
        }
        else if (key == "group_bar_angle")
        {
            float v            = 0.0f;
            ok                 = decode_number(value, v);
            fo.group_bar_angle = v;
        }
        else if (key == "x_limits")
        {
            std::vector<float> lim;
            ok = decode_float_list(value, lim) && lim.size() == 2;
            if (ok)
                fo.x_limits = AxisLimits{lim[0], lim[1]};
        }
        else
        {
            STRATA_LOG_DEBUG("config", "Ignoring unknown format option '{}'", key);
        }

        if (!ok)
        {
            error = "bad format option \"" + key + "\"";
            return false;
        }
    }
    return true;
}

}   // anonymous namespace

// ─── Public API ──────────────────────────────────────────────────────────────

std::string serialize_options(const StratOptions& o)
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << OPTIONS_VERSION << ",\n";

    auto list = [&](const char* key, const std::vector<std::string>& v)
    {
        os << "  \"" << key << "\": ";
        write_string_list(os, v);
        os << ",\n";
    };
    auto number = [&](const char* key, float v) { os << "  \"" << key << "\": " << v << ",\n"; };
    auto flag   = [&](const char* key, bool v)
    { os << "  \"" << key << "\": " << (v ? "true" : "false") << ",\n"; };

    list("percentages", o.percentages);
    list("exclude", o.exclude);
    list("percentage_basis", o.percentage_basis);
    flag("calculate_percentages", o.calculate_percentages);
    number("threshold", o.threshold);
    list("summed", o.summed);
    flag("sum_all_groups", o.sum_all_groups);
    list("all_in_one", o.all_in_one);
    list("stacked", o.stacked);
    list("use_bars", o.use_bars);
    flag("bars_for_all", o.bars_for_all);
    number("min_percentage", o.min_percentage);
    number("trunc_height", o.trunc_height);
    number("group_bar_angle", o.group_bar_angle);

    if (o.bbox)
    {
        os << "  \"bbox\": ";
        write_float_list(os, {o.bbox->x, o.bbox->y, o.bbox->w, o.bbox->h});
        os << ",\n";
    }

    os << "  \"subgroups\": {";
    auto sg_keys = sorted_keys(o.subgroups);
    for (size_t i = 0; i < sg_keys.size(); ++i)
    {
        os << (i > 0 ? ", " : "") << "\"" << escape_json(sg_keys[i]) << "\": ";
        write_string_list(os, o.subgroups.at(sg_keys[i]));
    }
    os << "},\n";

    os << "  \"widths\": {";
    auto w_keys = sorted_keys(o.widths);
    for (size_t i = 0; i < w_keys.size(); ++i)
        os << (i > 0 ? ", " : "") << "\"" << escape_json(w_keys[i]) << "\": " << o.widths.at(w_keys[i]);
    os << "},\n";

    os << "  \"formatoptions\": {";
    auto f_keys = sorted_keys(o.formatoptions);
    for (size_t i = 0; i < f_keys.size(); ++i)
    {
        os << (i > 0 ? ",\n    " : "\n    ") << "\"" << escape_json(f_keys[i]) << "\": ";
        write_overrides(os, o.formatoptions.at(f_keys[i]));
    }
    os << (f_keys.empty() ? "}\n" : "\n  }\n");

    os << "}\n";
    return os.str();
}

bool deserialize_options(const std::string& json, StratOptions& o, std::string* error)
{
    std::string err;
    auto        fail = [&](const std::string& msg)
    {
        STRATA_LOG_ERROR("config", "Invalid options: {}", msg);
        if (error)
            *error = msg;
        return false;
    };

    Members m;
    if (json.empty())
        return fail("empty document");
    if (!parse_object(json, m, err))
        return fail(err);

    auto ver = m.find("version");
    if (ver != m.end())
    {
        float v = 0.0f;
        if (!decode_number(ver->second, v))
            return fail("bad version");
        if (static_cast<int>(v) > OPTIONS_VERSION)
            return fail("unsupported version " + ver->second);
    }

    // Decode into a copy so that a failure leaves `o` untouched.
    StratOptions out = o;

    std::map<std::string, std::vector<std::string>*> lists = {
        {"percentages", &out.percentages},
        {"exclude", &out.exclude},
        {"percentage_basis", &out.percentage_basis},
        {"summed", &out.summed},
        {"all_in_one", &out.all_in_one},
        {"stacked", &out.stacked},
        {"use_bars", &out.use_bars},
    };
    std::map<std::string, bool*> flags = {
        {"calculate_percentages", &out.calculate_percentages},
        {"sum_all_groups", &out.sum_all_groups},
        {"bars_for_all", &out.bars_for_all},
    };
    std::map<std::string, float*> numbers = {
        {"threshold", &out.threshold},
        {"min_percentage", &out.min_percentage},
        {"trunc_height", &out.trunc_height},
        {"group_bar_angle", &out.group_bar_angle},
    };

    for (const auto& [key, value] : m)
    {
        if (key == "version")
            continue;

        if (auto it = lists.find(key); it != lists.end())
        {
            if (!decode_string_list(value, *it->second))
                return fail("\"" + key + "\" must be a list of strings");
        }
        else if (auto fit = flags.find(key); fit != flags.end())
        {
            if (!decode_bool(value, *fit->second))
                return fail("\"" + key + "\" must be true or false");
        }
        else if (auto nit = numbers.find(key); nit != numbers.end())
        {
            if (!decode_number(value, *nit->second))
                return fail("\"" + key + "\" must be a number");
        }
        else if (key == "bbox")
        {
            std::vector<float> box;
            if (!decode_float_list(value, box) || box.size() != 4)
                return fail("\"bbox\" must be [x, y, width, height]");
            out.bbox = Rect{box[0], box[1], box[2], box[3]};
        }
        else if (key == "subgroups")
        {
            Members sg;
            if (!parse_object(value, sg, err))
                return fail("subgroups: " + err);
            out.subgroups.clear();
            for (const auto& [group, raw] : sg)
            {
                if (!decode_string_list(raw, out.subgroups[group]))
                    return fail("subgroups of \"" + group + "\" must be a list of strings");
            }
        }
        else if (key == "widths")
        {
            Members w;
            if (!parse_object(value, w, err))
                return fail("widths: " + err);
            out.widths.clear();
            for (const auto& [group, raw] : w)
            {
                float v = 0.0f;
                if (!decode_number(raw, v))
                    return fail("width of \"" + group + "\" must be a number");
                out.widths[group] = v;
            }
        }
        else if (key == "formatoptions")
        {
            Members f;
            if (!parse_object(value, f, err))
                return fail("formatoptions: " + err);
            out.formatoptions.clear();
            for (const auto& [group, raw] : f)
            {
                if (!decode_overrides(raw, out.formatoptions[group], err))
                    return fail("formatoptions of \"" + group + "\": " + err);
            }
        }
        else
        {
            STRATA_LOG_DEBUG("config", "Ignoring unknown option '{}'", key);
        }
    }

    o = std::move(out);
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool save_options_file(const std::string& path, const StratOptions& options)
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);

    std::ofstream f(path);
    if (!f.is_open())
    {
        STRATA_LOG_ERROR("config", "Cannot write options file '{}'", path);
        return false;
    }
    f << serialize_options(options);
    return f.good();
}

bool load_options_file(const std::string& path, StratOptions& options, std::string* error)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        if (error)
            *error = "Cannot open file: " + path;
        STRATA_LOG_ERROR("config", "Cannot open options file '{}'", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    STRATA_LOG_INFO("config", "Loading options from '{}'", path);
    return deserialize_options(json, options, error);
}

}   // namespace strata
