#pragma once

#include "../series/series_router.hpp"
#include "../window/sliding_window.hpp"
#include "axis_scaler.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace logplot::plot
{

// Trace appearance, cycling styles (outer) over the palette (inner).
struct SeriesStyle
{
    char glyph{'*'};
    int color{33}; // ANSI 256-colour index
};

SeriesStyle styleFor(std::size_t seriesId);

// Footer contents.
struct FrameStatus
{
    std::string state;
    std::string file;
    std::size_t linesRead{0};
    std::size_t skipped{0};
    std::string note;
};

// Rasterizes the current windows into text lines for a ChartSurface.
class ChartRenderer
{
  public:
    static constexpr int kMinWidth = 32;
    static constexpr int kMinHeight = 12;

    ChartRenderer(double margin, double rescaleSpeed, bool color);

    void setSeries(std::vector<series::SeriesBinding> bindings,
                   std::string xLabel);

    // Back to the empty chart: no series, axes unscaled.
    void reset();

    std::vector<std::string> render(const window::WindowBuffer& buf,
                                    const FrameStatus& status, int width,
                                    int height);

    AxisRange xRange() const
    {
        return xScale.range();
    }

    AxisRange yRange() const
    {
        return yScale.range();
    }

  private:
    std::string paint(const std::string& text, int color) const;

    AxisScaler xScale;
    AxisScaler yScale;
    bool color;
    std::vector<series::SeriesBinding> series;
    std::string xLabel{"Sample"};
};

// Compact number for axis ticks and the legend.
std::string formatValue(double v);

} // namespace logplot::plot
