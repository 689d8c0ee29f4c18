/*
================================================================================
Fragment 4.4.02 — Engine: Range MC Figure Implementation
FILE: cpp/engine/exports/range_figure_svg.cpp
================================================================================
*/

#include "range_figure_svg.hpp"

#include "engine/exports/range_report_csv.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace aeroforge {

namespace {

struct Panel {
  double x = 0.0;   // plot area, px
  double y = 0.0;
  double w = 0.0;
  double h = 0.0;
  double x_lo = 0.0;
  double x_hi = 1.0;
  double y_lo = 0.0;
  double y_hi = 1.0;

  double px(double v) const { return x + (v - x_lo) / (x_hi - x_lo) * w; }
  double py(double v) const { return y + h - (v - y_lo) / (y_hi - y_lo) * h; }
};

std::string esc_xml(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default:  out.push_back(c);
    }
  }
  return out;
}

std::string fmt_tick(double v) {
  std::ostringstream os;
  os << std::setprecision(4) << v;
  return os.str();
}

std::string fmt_km(double v) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(0) << v << " km";
  return os.str();
}

// Finite span of xs, widened when degenerate.
void span_of(const std::vector<double>& xs, double* lo, double* hi) {
  double a = 0.0;
  double b = 0.0;
  bool any = false;
  for (double x : xs) {
    if (!std::isfinite(x)) continue;
    if (!any) { a = b = x; any = true; continue; }
    a = std::min(a, x);
    b = std::max(b, x);
  }
  if (!(b > a)) { a -= 0.5; b += 0.5; }
  *lo = a;
  *hi = b;
}

void draw_axes(std::ostringstream& os, const Panel& p,
               const std::string& title, const std::string& xlabel, const std::string& ylabel) {
  os << std::fixed << std::setprecision(2);
  os << "<rect x=\"" << p.x << "\" y=\"" << p.y << "\" width=\"" << p.w << "\" height=\"" << p.h
     << "\" fill=\"white\" stroke=\"black\"/>\n";

  constexpr int kTicks = 5;
  for (int i = 0; i <= kTicks; ++i) {
    const double t = static_cast<double>(i) / kTicks;
    const double xv = p.x_lo + t * (p.x_hi - p.x_lo);
    const double yv = p.y_lo + t * (p.y_hi - p.y_lo);
    const double gx = p.px(xv);
    const double gy = p.py(yv);
    os << "<line x1=\"" << gx << "\" y1=\"" << p.y << "\" x2=\"" << gx << "\" y2=\"" << p.y + p.h
       << "\" stroke=\"#dddddd\"/>\n";
    os << "<line x1=\"" << p.x << "\" y1=\"" << gy << "\" x2=\"" << p.x + p.w << "\" y2=\"" << gy
       << "\" stroke=\"#dddddd\"/>\n";
    os << "<text x=\"" << gx << "\" y=\"" << p.y + p.h + 14 << "\" font-size=\"10\" text-anchor=\"middle\">"
       << fmt_tick(xv) << "</text>\n";
    os << "<text x=\"" << p.x - 4 << "\" y=\"" << gy + 3 << "\" font-size=\"10\" text-anchor=\"end\">"
       << fmt_tick(yv) << "</text>\n";
  }

  os << "<text x=\"" << p.x + p.w / 2 << "\" y=\"" << p.y - 8
     << "\" font-size=\"13\" font-weight=\"bold\" text-anchor=\"middle\">" << esc_xml(title) << "</text>\n";
  os << "<text x=\"" << p.x + p.w / 2 << "\" y=\"" << p.y + p.h + 32
     << "\" font-size=\"11\" text-anchor=\"middle\">" << esc_xml(xlabel) << "</text>\n";
  os << "<text x=\"" << p.x - 46 << "\" y=\"" << p.y + p.h / 2
     << "\" font-size=\"11\" text-anchor=\"middle\" transform=\"rotate(-90 " << p.x - 46 << " "
     << p.y + p.h / 2 << ")\">" << esc_xml(ylabel) << "</text>\n";
}

Panel make_panel(int col, int row, const FigureOptions& opt) {
  const double cell_w = opt.width_px / 2.0;
  const double cell_h = (opt.height_px - 40.0) / 2.0;
  Panel p;
  p.x = col * cell_w + 70.0;
  p.y = 40.0 + row * cell_h + 30.0;
  p.w = cell_w - 100.0;
  p.h = cell_h - 80.0;
  return p;
}

void draw_histogram(std::ostringstream& os, const mc::RangeMcResult& r, const FigureOptions& opt) {
  const auto ranges = r.ranges();
  const Histogram hist = build_histogram(ranges, opt.histogram_bins);
  const std::size_t peak = hist.counts.empty() ? 1 : *std::max_element(hist.counts.begin(), hist.counts.end());

  const double thresholds[2] = {r.summary.threshold_1_km, r.summary.threshold_2_km};

  // Bins cover the data; the axis also spans both targets so their lines show.
  Panel p = make_panel(0, 0, opt);
  p.x_lo = std::min({hist.lo, thresholds[0], thresholds[1]});
  p.x_hi = std::max({hist.hi, thresholds[0], thresholds[1]});
  p.y_lo = 0.0;
  p.y_hi = static_cast<double>(std::max<std::size_t>(peak, 1));

  std::ostringstream title;
  title << std::fixed << std::setprecision(0)
        << "Range Distribution (mean=" << r.summary.mean << " km, std=" << r.summary.stddev << " km)";

  draw_axes(os, p, title.str(), "Range (km)", "Frequency");

  const double bin_km = (hist.hi - hist.lo) / static_cast<double>(hist.counts.size());
  for (std::size_t i = 0; i < hist.counts.size(); ++i) {
    const double left = p.px(hist.lo + bin_km * static_cast<double>(i));
    const double right = p.px(hist.lo + bin_km * static_cast<double>(i + 1));
    const double top = p.py(static_cast<double>(hist.counts[i]));
    os << "<rect x=\"" << left << "\" y=\"" << top << "\" width=\"" << std::max(right - left, 0.5)
       << "\" height=\"" << (p.y + p.h - top) << "\" fill=\"#4d99e6\" stroke=\"black\" stroke-width=\"0.5\"/>\n";
  }

  const char* colors[2] = {"red", "green"};
  for (int k = 0; k < 2; ++k) {
    const double t = thresholds[k];
    const double gx = p.px(t);
    os << "<line x1=\"" << gx << "\" y1=\"" << p.y << "\" x2=\"" << gx << "\" y2=\"" << p.y + p.h
       << "\" stroke=\"" << colors[k] << "\" stroke-width=\"2\" stroke-dasharray=\"8,4\"/>\n";
    os << "<text x=\"" << gx + 4 << "\" y=\"" << p.y + 14 << "\" font-size=\"10\" fill=\"" << colors[k] << "\">"
       << fmt_km(t) << " target</text>\n";
  }
}

void draw_scatter(std::ostringstream& os, const mc::RangeMcResult& r, const FigureOptions& opt,
                  int col, int row, range::ParamField field, const std::string& title) {
  const auto xs = r.column(field);
  const auto ys = r.ranges();

  Panel p = make_panel(col, row, opt);
  span_of(xs, &p.x_lo, &p.x_hi);
  span_of(ys, &p.y_lo, &p.y_hi);

  draw_axes(os, p, title, range::field_label(field), "Range (km)");

  for (std::size_t i = 0; i < xs.size() && i < ys.size(); ++i) {
    if (!std::isfinite(xs[i]) || !std::isfinite(ys[i])) continue;
    os << "<circle cx=\"" << p.px(xs[i]) << "\" cy=\"" << p.py(ys[i])
       << "\" r=\"2.5\" fill=\"#1f77b4\" fill-opacity=\"0.6\"/>\n";
  }
}

} // namespace

Histogram build_histogram(const std::vector<double>& xs, std::size_t bins) {
  Histogram h;
  const std::size_t nb = std::max<std::size_t>(bins, 1);
  h.counts.assign(nb, 0);
  span_of(xs, &h.lo, &h.hi);

  const double width = (h.hi - h.lo) / static_cast<double>(nb);
  for (double x : xs) {
    if (!std::isfinite(x)) continue;
    auto idx = static_cast<std::size_t>((x - h.lo) / width);
    if (idx >= nb) idx = nb - 1;
    ++h.counts[idx];
  }
  return h;
}

std::string range_figure_svg(const mc::RangeMcResult& r, const FigureOptions& opt) {
  std::ostringstream os;
  os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  os << "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\" width=\"" << opt.width_px
     << "\" height=\"" << opt.height_px << "\" font-family=\"sans-serif\">\n";
  os << "<rect width=\"100%\" height=\"100%\" fill=\"white\"/>\n";
  os << "<text x=\"" << opt.width_px / 2 << "\" y=\"26\" font-size=\"18\" font-weight=\"bold\" "
     << "text-anchor=\"middle\">" << esc_xml(opt.title) << "</text>\n";

  draw_histogram(os, r, opt);
  draw_scatter(os, r, opt, 1, 0, range::ParamField::PackEnergyDensity, "Range vs Battery Density");
  draw_scatter(os, r, opt, 0, 1, range::ParamField::HarvestPower, "Range vs Energy Harvesting");
  draw_scatter(os, r, opt, 1, 1, range::ParamField::SicGain, "Range vs SiC Enhancement");

  os << "</svg>\n";
  return os.str();
}

bool write_range_figure_svg_file(const mc::RangeMcResult& r,
                                 const std::string& file_path,
                                 const FigureOptions& opt) {
  return write_text_file(file_path, range_figure_svg(r, opt));
}

}  // namespace aeroforge
