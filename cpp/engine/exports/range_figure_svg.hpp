#pragma once
/*
================================================================================
Fragment 4.4.02 — Engine: Range MC Figure (SVG, 2x2 panels)
FILE: cpp/engine/exports/range_figure_svg.hpp

Panels:
  [0,0] histogram of Range_km with dashed reference lines at the two
        thresholds (the x axis is widened to include both)
  [0,1] Range vs pack energy density
  [1,0] Range vs harvest power
  [1,1] Range vs SiC gain

Self-contained SVG 1.1 text; no fonts or scripts referenced.
================================================================================
*/

#include "engine/mc/range_mc.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace aeroforge {

struct FigureOptions {
  int width_px = 1200;
  int height_px = 800;
  std::size_t histogram_bins = 50;
  std::string title = "AeroForge Al-ion + SiC System Analysis";
};

struct Histogram {
  double lo = 0.0;
  double hi = 0.0;
  std::vector<std::size_t> counts;
};

// Equal-width bins over [min,max] of the finite samples. A zero-width span is
// widened to +/-0.5 so every sample lands in a bin. Max goes in the last bin.
Histogram build_histogram(const std::vector<double>& xs, std::size_t bins);

std::string range_figure_svg(const mc::RangeMcResult& r, const FigureOptions& opt = FigureOptions());

bool write_range_figure_svg_file(const mc::RangeMcResult& r,
                                 const std::string& file_path,
                                 const FigureOptions& opt = FigureOptions());

}  // namespace aeroforge
