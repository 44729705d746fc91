#pragma once

#include <strata/classifier.hpp>
#include <strata/csv_table.hpp>
#include <strata/format.hpp>
#include <strata/geometry.hpp>
#include <strata/group_bar.hpp>
#include <strata/grouper.hpp>
#include <strata/logger.hpp>
#include <strata/options.hpp>
#include <strata/panel.hpp>
#include <strata/scale_link.hpp>
#include <strata/stratplot.hpp>
#include <strata/table.hpp>

// ─── Quick start ─────────────────────────────────────────────────────────────
//
//   auto csv = strata::load_csv_table("pollen.csv");
//   strata::StratOptions opts;
//   opts.percentages = {"Pollen"};
//   auto diagram = strata::stratplot(csv.table, classify, opts);
//   diagram->draw(renderer);
//
// The engine computes geometry only; `renderer` is any PanelRenderer.
