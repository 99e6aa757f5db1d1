#pragma once

#include <string>
#include <vector>

#include "model.hpp"

namespace exospec {

struct SvgStyle {
    double width = 860.0;
    double height = 520.0;
    double page_pad = 18.0;
    double header_h = 40.0;
    double axis_pad_left = 82.0;
    double axis_pad_bottom = 52.0;
    double font_size = 12.0;
    double title_font_size = 15.0;
    double marker_r = 3.5;
    double line_w = 1.2;
    std::string bg = "#ffffff";
    std::string fg = "#111111";
    std::string grid = "#dddddd";
    std::string unbinned_color = "#0072B2";
    std::string binned_color = "#D55E00";
};

struct SpectrumPlot {
    std::string title;
    std::string y_label;
    // wavelengths in m, drawn in um
    DepthResult unbinned;
    DepthResult binned;
};

// Evenly spaced tick values at 1, 2 or 5 times a power of ten.
std::vector<double> nice_ticks(double lo, double hi, int max_ticks = 6);

std::string build_spectrum_svg(const SpectrumPlot& plot,
                               const SvgStyle& st = SvgStyle());

void save_graph_to_file(const std::string& graph_string,
                        const std::string& filename);

}  // namespace exospec
