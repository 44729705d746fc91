// Lays out a pollen diagram from a CSV file and prints the resulting panels.
//
//   strata_pollen [--log trace.log] data.csv [options.json]
//
// Columns named "Group/Taxon" are grouped by the part before the slash.

#include <cstdio>
#include <strata/strata.hpp>
#include <string>
#include <vector>

using namespace strata;

namespace
{

class TextRenderer : public PanelRenderer
{
   public:
    void begin_frame(const FigureCanvas& canvas) override
    {
        std::printf("canvas %ux%u\n", canvas.width, canvas.height);
    }

    void draw_panel(const PanelView& view) override
    {
        const Panel& p = *view.panel;
        const Rect&  r = p.position();
        std::printf("[%u] %-12s %-20s x=%.3f w=%.3f xlim=[%g, %g]%s\n",
                    p.id(),
                    p.group().c_str(),
                    p.title().c_str(),
                    r.x,
                    r.w,
                    p.x_limits().min,
                    p.x_limits().max,
                    p.format().y_ticks_visible ? " (index axis)" : "");

        for (const auto& s : view.series)
        {
            PlotKind kind = s.entry->draw.value_or(PlotKind::Line);
            std::printf("      %s: %s, %zu rows%s\n",
                        s.entry->variable.c_str(),
                        to_string(kind),
                        s.values.size(),
                        s.entry->draw ? "" : " (hidden)");
        }
        if (const auto& bar = p.group_bar())
            std::printf("      group bar '%s' [%.3f, %.3f] at %.3f\n",
                        bar->label.c_str(), bar->x0, bar->x1, bar->top + bar->offset);
    }
};

std::string taxon_group(const std::string& column)
{
    auto slash = column.find('/');
    if (slash == std::string::npos)
        return NOGROUP;
    return column.substr(0, slash);
}

}   // anonymous namespace

int main(int argc, char** argv)
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--log" && i + 1 < argc)
        {
            // Debug trace goes to the file instead of the console
            Logger::instance().set_level(LogLevel::Debug);
            Logger::instance().clear_sinks();
            Logger::instance().add_sink(sinks::file_sink(argv[++i]));
            continue;
        }
        args.push_back(std::move(arg));
    }

    if (args.empty())
    {
        std::fprintf(stderr, "usage: %s [--log file] data.csv [options.json]\n", argv[0]);
        return 1;
    }

    auto csv = load_csv_table(args[0]);
    if (!csv.ok())
    {
        STRATA_LOG_ERROR("io", "Failed to load '{}': {}", args[0], csv.error);
        return 1;
    }

    StratOptions options;
    if (args.size() > 1)
    {
        std::string error;
        if (!load_options_file(args[1], options, &error))
        {
            STRATA_LOG_ERROR("config", "Failed to load '{}': {}", args[1], error);
            return 1;
        }
    }

    try
    {
        auto diagram = stratplot(csv.table, taxon_group, options);

        TextRenderer renderer;
        diagram->draw(renderer);
        std::printf("%zu groups, %zu panels\n", diagram->groupers().size(),
                    diagram->panels().size());
    }
    catch (const std::exception& e)
    {
        STRATA_LOG_CRITICAL("stratplot", "Layout failed: {}", e.what());
        return 1;
    }
    return 0;
}
