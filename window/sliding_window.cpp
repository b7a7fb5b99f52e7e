#include "sliding_window.hpp"

#include "../core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace logplot::window
{

SlidingWindow::SlidingWindow(std::size_t capacity) : cap(capacity)
{
    if (cap == 0)
        throw ConfigError("max-samples must be a positive integer");
}

void SlidingWindow::push(double x, double y)
{
    while (buf.size() >= cap)
        buf.pop_front();
    buf.push_back({x, y});
}

std::vector<Point> SlidingWindow::snapshot() const
{
    return std::vector<Point>(buf.begin(), buf.end());
}

WindowStats SlidingWindow::stats() const
{
    WindowStats ws;
    double sumY = 0.0;
    for (const auto& p : buf)
    {
        if (!std::isfinite(p.x) || !std::isfinite(p.y))
            continue;
        if (ws.n == 0)
        {
            ws.xMin = ws.xMax = p.x;
            ws.yMin = ws.yMax = p.y;
        }
        else
        {
            ws.xMin = std::min(ws.xMin, p.x);
            ws.xMax = std::max(ws.xMax, p.x);
            ws.yMin = std::min(ws.yMin, p.y);
            ws.yMax = std::max(ws.yMax, p.y);
        }
        sumY += p.y;
        ws.last = p.y;
        ++ws.n;
    }
    if (ws.n > 0)
        ws.mean = sumY / ws.n;
    return ws;
}

WindowBuffer::WindowBuffer(std::size_t capacity) : cap(capacity)
{
    if (cap == 0)
        throw ConfigError("max-samples must be a positive integer");
}

void WindowBuffer::push(std::size_t series, double x, double y)
{
    auto it = windows.find(series);
    if (it == windows.end())
        it = windows.emplace(series, SlidingWindow(cap)).first;
    it->second.push(x, y);
}

std::vector<Point> WindowBuffer::snapshot(std::size_t series) const
{
    auto it = windows.find(series);
    if (it == windows.end())
        return {};
    return it->second.snapshot();
}

WindowStats WindowBuffer::stats(std::size_t series) const
{
    auto it = windows.find(series);
    if (it == windows.end())
        return WindowStats{};
    return it->second.stats();
}

Bounds WindowBuffer::bounds() const
{
    Bounds b;
    for (const auto& [id, w] : windows)
    {
        (void)id;
        const auto ws = w.stats();
        if (ws.n == 0)
            continue;
        if (!b.valid)
        {
            b = {true, ws.xMin, ws.xMax, ws.yMin, ws.yMax};
            continue;
        }
        b.xMin = std::min(b.xMin, ws.xMin);
        b.xMax = std::max(b.xMax, ws.xMax);
        b.yMin = std::min(b.yMin, ws.yMin);
        b.yMax = std::max(b.yMax, ws.yMax);
    }
    return b;
}

} // namespace logplot::window
