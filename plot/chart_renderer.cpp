#include "chart_renderer.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

namespace logplot::plot
{

namespace
{

constexpr int kGutter = 10;
constexpr std::array<char, 4> kGlyphs{'*', '+', '.', '#'};
// #2d8ff3 #fc585e #1aaf54 #e05fba #e37529 #f65394
constexpr std::array<int, 6> kPalette{33, 203, 35, 170, 166, 205};

std::string center(const std::string& text, int width)
{
    if (static_cast<int>(text.size()) >= width)
        return text.substr(0, static_cast<std::size_t>(std::max(width, 0)));
    const int left = (width - static_cast<int>(text.size())) / 2;
    return std::string(left, ' ') + text +
           std::string(width - left - static_cast<int>(text.size()), ' ');
}

std::string rightAlign(const std::string& text, int width)
{
    if (static_cast<int>(text.size()) >= width)
        return text.substr(0, static_cast<std::size_t>(std::max(width, 0)));
    return std::string(width - static_cast<int>(text.size()), ' ') + text;
}

} // namespace

SeriesStyle styleFor(std::size_t seriesId)
{
    SeriesStyle s;
    s.glyph = kGlyphs[(seriesId / kPalette.size()) % kGlyphs.size()];
    s.color = kPalette[seriesId % kPalette.size()];
    return s;
}

std::string formatValue(double v)
{
    if (!std::isfinite(v))
        return "-";
    std::ostringstream oss;
    oss << std::setprecision(4) << v;
    return oss.str();
}

ChartRenderer::ChartRenderer(double margin, double rescaleSpeed, bool color) :
    xScale(margin, rescaleSpeed), yScale(margin, rescaleSpeed), color(color)
{}

void ChartRenderer::setSeries(std::vector<series::SeriesBinding> bindings,
                              std::string label)
{
    series = std::move(bindings);
    xLabel = std::move(label);
}

void ChartRenderer::reset()
{
    series.clear();
    xLabel = "Sample";
    xScale.reset();
    yScale.reset();
}

std::string ChartRenderer::paint(const std::string& text, int c) const
{
    if (!color || c < 0)
        return text;
    return "\033[38;5;" + std::to_string(c) + "m" + text + "\033[0m";
}

std::vector<std::string> ChartRenderer::render(const window::WindowBuffer& buf,
                                               const FrameStatus& status,
                                               int width, int height)
{
    width = std::max(width, kMinWidth);
    height = std::max(height, kMinHeight);

    const int legendRows = std::max<int>(1, static_cast<int>(series.size()));
    const int plotW = width - kGutter - 1;
    // title, x axis, x ticks, x label, legend, status
    const int plotH = std::max(3, height - (4 + legendRows + 1));

    const auto b = buf.bounds();
    if (b.valid)
    {
        xScale.update(b.xMin, b.xMax);
        yScale.update(b.yMin, b.yMax);
    }
    const auto xr = xScale.range();
    const auto yr = yScale.range();

    std::vector<std::string> cells(plotH, std::string(plotW, ' '));
    std::vector<std::vector<int>> tint(plotH, std::vector<int>(plotW, -1));

    auto toCol = [&](double x) {
        return static_cast<int>(
            std::lround((x - xr.lo) / (xr.hi - xr.lo) * (plotW - 1)));
    };
    auto toRow = [&](double y) {
        return plotH - 1 -
               static_cast<int>(
                   std::lround((y - yr.lo) / (yr.hi - yr.lo) * (plotH - 1)));
    };
    auto setCell = [&](int c, int r, char g, int col) {
        if (c < 0 || c >= plotW || r < 0 || r >= plotH)
            return;
        cells[r][c] = g;
        tint[r][c] = col;
    };
    // Bresenham between consecutive samples.
    auto drawLine = [&](int c0, int r0, int c1, int r1, char g, int col) {
        const int dc = std::abs(c1 - c0);
        const int dr = -std::abs(r1 - r0);
        const int sc = c0 < c1 ? 1 : -1;
        const int sr = r0 < r1 ? 1 : -1;
        int err = dc + dr;
        for (;;)
        {
            setCell(c0, r0, g, col);
            if (c0 == c1 && r0 == r1)
                break;
            const int e2 = 2 * err;
            if (e2 >= dr)
            {
                err += dr;
                c0 += sc;
            }
            if (e2 <= dc)
            {
                err += dc;
                r0 += sr;
            }
        }
    };

    if (xr.valid && yr.valid)
    {
        for (const auto& s : series)
        {
            const auto style = styleFor(s.id);
            bool havePrev = false;
            int pc = 0;
            int pr = 0;
            for (const auto& p : buf.snapshot(s.id))
            {
                if (!std::isfinite(p.x) || !std::isfinite(p.y))
                {
                    havePrev = false;
                    continue;
                }
                const int c = toCol(p.x);
                const int r = toRow(p.y);
                if (havePrev)
                    drawLine(pc, pr, c, r, style.glyph, style.color);
                else
                    setCell(c, r, style.glyph, style.color);
                havePrev = true;
                pc = c;
                pr = r;
            }
            // Newest sample.
            if (havePrev)
                setCell(pc, pr, 'o', style.color);
        }
    }

    std::vector<std::string> out;
    out.reserve(static_cast<std::size_t>(height));

    const std::string title = center("Log Visualizer", plotW + 1);
    out.push_back(std::string("Value").append(kGutter - 5, ' ') +
                  (color ? "\033[1m" + title + "\033[0m" : title));

    for (int r = 0; r < plotH; ++r)
    {
        std::string label;
        if (yr.valid)
        {
            if (r == 0)
                label = formatValue(yr.hi);
            else if (r == plotH - 1)
                label = formatValue(yr.lo);
            else if (r == plotH / 2)
                label = formatValue((yr.lo + yr.hi) / 2.0);
        }
        std::string line = rightAlign(label, kGutter - 1) + " |";
        int run = -1;
        std::string pending;
        for (int c = 0; c < plotW; ++c)
        {
            if (tint[r][c] != run)
            {
                line += paint(pending, run);
                pending.clear();
                run = tint[r][c];
            }
            pending.push_back(cells[r][c]);
        }
        line += paint(pending, run);
        out.push_back(std::move(line));
    }

    out.push_back(std::string(kGutter, ' ') + "+" + std::string(plotW, '-'));

    std::string ticks(plotW, ' ');
    if (xr.valid)
    {
        const std::string lo = formatValue(xr.lo);
        const std::string hi = formatValue(xr.hi);
        const std::string mid = formatValue((xr.lo + xr.hi) / 2.0);
        ticks.replace(0, std::min(lo.size(), ticks.size()), lo, 0,
                      std::min(lo.size(), ticks.size()));
        const int midPos = (plotW - static_cast<int>(mid.size())) / 2;
        if (midPos > static_cast<int>(lo.size()) &&
            midPos + mid.size() + hi.size() < ticks.size())
            ticks.replace(static_cast<std::size_t>(midPos), mid.size(), mid);
        if (hi.size() + lo.size() < ticks.size())
            ticks.replace(ticks.size() - hi.size(), hi.size(), hi);
    }
    out.push_back(std::string(kGutter + 1, ' ') + ticks);
    out.push_back(std::string(kGutter + 1, ' ') + center(xLabel, plotW));

    if (series.empty())
        out.push_back("  (waiting for data)");
    for (const auto& s : series)
    {
        const auto style = styleFor(s.id);
        const auto ws = buf.stats(s.id);
        std::string entry = "  " + paint(std::string(2, style.glyph) + "o",
                                         style.color) +
                            " " + s.label;
        entry += ws.n > 0 ? "  last=" + formatValue(ws.last) : "  (no data)";
        out.push_back(std::move(entry));
    }

    std::string footer = "[" + status.state + "] " + status.file +
                         "  lines=" + std::to_string(status.linesRead) +
                         "  skipped=" + std::to_string(status.skipped);
    if (!status.note.empty())
        footer += "  | " + status.note;
    if (static_cast<int>(footer.size()) > width)
        footer.resize(static_cast<std::size_t>(width));
    out.push_back(std::move(footer));

    return out;
}

} // namespace logplot::plot
