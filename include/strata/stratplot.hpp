#pragma once

#include <functional>
#include <memory>
#include <span>
#include <strata/classifier.hpp>
#include <strata/geometry.hpp>
#include <strata/grouper.hpp>
#include <strata/options.hpp>
#include <strata/panel.hpp>
#include <string>
#include <vector>

namespace strata
{

struct SeriesView
{
    const SeriesEntry*     entry = nullptr;
    std::span<const float> values;
};

// What a renderer gets for one panel.
struct PanelView
{
    const Panel*            panel = nullptr;
    std::span<const float>  index;
    std::vector<SeriesView> series;
    std::vector<PanelId>    share_partners;
};

// Drawing backend. The engine never draws itself.
class PanelRenderer
{
   public:
    virtual ~PanelRenderer() = default;

    virtual void begin_frame(const FigureCanvas& /*canvas*/) {}
    virtual void draw_panel(const PanelView& view) = 0;
    virtual void end_frame() {}
};

// A laid out stratigraphic diagram: the groupers in classification order and
// the panels they own.
class StratDiagram
{
    // Only stratplot() can name this, so only it can construct a diagram.
    struct ConstructKey
    {
        explicit ConstructKey() = default;
    };

   public:
    using ChangeCallback = std::function<void(const StratDiagram&)>;

    StratDiagram(ConstructKey, std::shared_ptr<DiagramContext> ctx, const Rect& envelope);
    ~StratDiagram();

    StratDiagram(const StratDiagram&)            = delete;
    StratDiagram& operator=(const StratDiagram&) = delete;

    const std::vector<std::unique_ptr<Grouper>>& groupers() const { return groupers_; }
    Grouper*                                     grouper(const std::string& group) const;

    // All panels across groups, left to right in group order.
    std::vector<Panel*> panels() const;

    const DataTable&        data() const { return ctx_->data; }
    const ScaleLinkManager& links() const { return ctx_->links; }
    const FigureCanvas&     canvas() const { return ctx_->canvas; }
    const Rect&             envelope() const { return envelope_; }

    // ── Batching ─────────────────────────────────────────────────────
    // Change notifications raised inside a batch are collapsed into one,
    // delivered when the outermost batch ends.

    void begin_batch();
    void end_batch();
    bool batching() const { return batch_depth_ > 0; }

    class BatchGuard
    {
       public:
        explicit BatchGuard(StratDiagram& diagram) : diagram_(diagram) { diagram_.begin_batch(); }
        ~BatchGuard() { diagram_.end_batch(); }

        BatchGuard(const BatchGuard&)            = delete;
        BatchGuard& operator=(const BatchGuard&) = delete;

       private:
        StratDiagram& diagram_;
    };

    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

    // Host notification that the drawing surface changed size.
    void notify_resize(uint32_t width_px, uint32_t height_px);

    // Destroys every panel. Groupers stay valid and treat panels as removed.
    void close();
    bool closed() const { return closed_; }

    void draw(PanelRenderer& renderer) const;

   private:
    friend std::unique_ptr<StratDiagram> stratplot(const DataTable&    table,
                                                   const ClassifyFn&   classify,
                                                   const StratOptions& options,
                                                   const FigureCanvas& canvas);

    void handle_change();
    void update_dividers();

    std::shared_ptr<DiagramContext>       ctx_;
    Rect                                  envelope_;
    std::vector<std::unique_ptr<Grouper>> groupers_;
    ChangeCallback                        on_change_;
    int                                   batch_depth_ = 0;
    bool                                  pending_     = false;
    bool                                  closed_      = false;
};

// Variant of `group` given the option lists.
GrouperKind resolve_kind(const std::string& group, const StratOptions& options);

// Width fraction of `group`: options.widths when present, else an equal
// share among the groups that are not percentage groups.
float resolve_width(const std::string&              group,
                    const std::vector<std::string>& groups,
                    const StratOptions&             options);

// Classifies the table and lays out one grouper per non-empty group.
std::unique_ptr<StratDiagram> stratplot(const DataTable&    table,
                                        const ClassifyFn&   classify = {},
                                        const StratOptions& options  = {},
                                        const FigureCanvas& canvas   = {});

}   // namespace strata
