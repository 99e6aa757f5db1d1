#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "spectrum_plot.hpp"

namespace exospec {

static std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            case '\n':
            case '\r':
            case '\t':
                out.push_back(' ');
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    return out;
}

static std::string format_tick(double value) {
    std::ostringstream os;
    os << std::setprecision(4) << value;
    return os.str();
}

static void svg_rect(std::ostringstream& os, double x, double y, double w,
                     double h, const std::string& fill,
                     const std::string& stroke, double sw) {
    os << "<rect x=\"" << x << "\" y=\"" << y << "\" width=\"" << w
       << "\" height=\"" << h << "\" fill=\"" << fill << "\" stroke=\""
       << stroke << "\" stroke-width=\"" << sw << "\" />\n";
}

static void svg_line(std::ostringstream& os, double x1, double y1, double x2,
                     double y2, const std::string& stroke, double sw) {
    os << "<line x1=\"" << x1 << "\" y1=\"" << y1 << "\" x2=\"" << x2
       << "\" y2=\"" << y2 << "\" stroke=\"" << stroke << "\" stroke-width=\""
       << sw << "\" />\n";
}

static void svg_text(std::ostringstream& os, double x, double y,
                     const std::string& text, const std::string& fill,
                     double font_size, const std::string& anchor = "start",
                     const std::string& weight = "normal") {
    os << "<text x=\"" << x << "\" y=\"" << y << "\" fill=\"" << fill
       << "\" font-size=\"" << font_size
       << "\" font-family=\"Helvetica\" text-anchor=\"" << anchor
       << "\" font-weight=\"" << weight << "\">" << xml_escape(text)
       << "</text>\n";
}

namespace {

struct Range {
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();

    void add(double v) {
        if (!std::isfinite(v)) return;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }
    bool empty() const {
        return lo > hi;
    }
    void widen() {
        if (empty()) {
            lo = 0.0;
            hi = 1.0;
        } else if (lo == hi) {
            double pad = lo == 0.0 ? 1.0 : 0.05 * std::fabs(lo);
            lo -= pad;
            hi += pad;
        }
    }
};

}  // namespace

std::vector<double> nice_ticks(double lo, double hi, int max_ticks) {
    if (!(hi > lo) || max_ticks < 1) return {lo};
    const double raw_step = (hi - lo) / max_ticks;
    const double magnitude = std::pow(10.0, std::floor(std::log10(raw_step)));
    const double normalized = raw_step / magnitude;
    double step;
    if (normalized <= 1.0) {
        step = magnitude;
    } else if (normalized <= 2.0) {
        step = 2 * magnitude;
    } else if (normalized <= 5.0) {
        step = 5 * magnitude;
    } else {
        step = 10 * magnitude;
    }
    const double first = std::ceil(lo / step - 1e-9) * step;
    std::vector<double> ticks;
    for (int i = 0;; ++i) {
        double tick = first + i * step;
        if (tick > hi + 1e-9 * step) break;
        // avoid printing -0 or 1e-17 for the zero tick
        if (std::fabs(tick) < 1e-9 * step) tick = 0.0;
        ticks.push_back(tick);
    }
    return ticks;
}

std::string build_spectrum_svg(const SpectrumPlot& plot, const SvgStyle& st) {
    const double um = 1e6;
    Range x_range;
    Range y_range;
    for (const DepthResult* series : {&plot.unbinned, &plot.binned}) {
        if (series->wavelengths.size() != series->values.size()) {
            throw std::invalid_argument(
                "Spectrum wavelengths and values differ in length");
        }
        for (size_t i = 0; i < series->values.size(); ++i) {
            if (!std::isfinite(series->values[i])) continue;
            x_range.add(series->wavelengths[i] * um);
            y_range.add(series->values[i]);
        }
    }
    x_range.widen();
    y_range.widen();

    const double plot_x = st.page_pad + st.axis_pad_left;
    const double plot_y = st.page_pad + st.header_h;
    const double plot_w = st.width - plot_x - st.page_pad;
    const double plot_h = st.height - plot_y - st.page_pad - st.axis_pad_bottom;
    auto to_x = [&](double wavelength) {
        return plot_x
               + (wavelength * um - x_range.lo) / (x_range.hi - x_range.lo)
                     * plot_w;
    };
    auto to_y = [&](double value) {
        return plot_y + plot_h
               - (value - y_range.lo) / (y_range.hi - y_range.lo) * plot_h;
    };

    std::ostringstream os;
    os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    os << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << st.width
       << "\" height=\"" << st.height << "\" viewBox=\"0 0 " << st.width << " "
       << st.height << "\">\n";
    svg_rect(os, 0, 0, st.width, st.height, st.bg, "none", 0);
    svg_text(os, st.page_pad, st.page_pad + 16, plot.title, st.fg,
             st.title_font_size, "start", "bold");

    for (double tick : nice_ticks(x_range.lo, x_range.hi)) {
        double x = plot_x + (tick - x_range.lo) / (x_range.hi - x_range.lo)
                                * plot_w;
        svg_line(os, x, plot_y, x, plot_y + plot_h, st.grid, 1.0);
        svg_text(os, x, plot_y + plot_h + 18, format_tick(tick), st.fg,
                 st.font_size, "middle");
    }
    for (double tick : nice_ticks(y_range.lo, y_range.hi)) {
        double y = to_y(tick);
        svg_line(os, plot_x, y, plot_x + plot_w, y, st.grid, 1.0);
        svg_text(os, plot_x - 6, y + 4, format_tick(tick), st.fg, st.font_size,
                 "end");
    }
    svg_rect(os, plot_x, plot_y, plot_w, plot_h, "none", st.fg, 1.0);
    svg_text(os, plot_x + plot_w / 2, st.height - st.page_pad - 6,
             "Wavelength (um)", st.fg, st.font_size, "middle");
    const double y_label_x = st.page_pad + 12;
    const double y_label_y = plot_y + plot_h / 2;
    os << "<g transform=\"rotate(-90 " << y_label_x << " " << y_label_y
       << ")\">\n";
    svg_text(os, y_label_x, y_label_y, plot.y_label, st.fg, st.font_size,
             "middle");
    os << "</g>\n";

    if (!plot.unbinned.values.empty()) {
        os << "<polyline fill=\"none\" stroke=\"" << st.unbinned_color
           << "\" stroke-width=\"" << st.line_w << "\" points=\"";
        bool first = true;
        for (size_t i = 0; i < plot.unbinned.values.size(); ++i) {
            if (!std::isfinite(plot.unbinned.values[i])) continue;
            if (!first) os << " ";
            first = false;
            os << to_x(plot.unbinned.wavelengths[i]) << ","
               << to_y(plot.unbinned.values[i]);
        }
        os << "\" />\n";
    }
    for (size_t i = 0; i < plot.binned.values.size(); ++i) {
        if (!std::isfinite(plot.binned.values[i])) continue;
        os << "<circle cx=\"" << to_x(plot.binned.wavelengths[i])
           << "\" cy=\"" << to_y(plot.binned.values[i]) << "\" r=\""
           << st.marker_r << "\" fill=\"" << st.binned_color << "\" />\n";
    }

    double lx = plot_x + plot_w - 150;
    double ly = st.page_pad;
    svg_line(os, lx, ly + 8, lx + 20, ly + 8, st.unbinned_color, 2.0);
    svg_text(os, lx + 26, ly + 12, "unbinned", st.fg, st.font_size);
    os << "<circle cx=\"" << lx + 90 << "\" cy=\"" << ly + 8 << "\" r=\""
       << st.marker_r << "\" fill=\"" << st.binned_color << "\" />\n";
    svg_text(os, lx + 98, ly + 12, "binned", st.fg, st.font_size);
    os << "</svg>\n";
    return os.str();
}

void save_graph_to_file(const std::string& graph_string,
                        const std::string& filename) {
    std::ofstream out(filename);
    if (!out) {
        throw std::runtime_error("Cannot write " + filename);
    }
    out << graph_string;
    out.close();
}

}  // namespace exospec
