#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <vector>

namespace logplot::window
{

struct Point
{
    double x{0.0};
    double y{0.0};
};

inline bool operator==(const Point& a, const Point& b)
{
    return a.x == b.x && a.y == b.y;
}

// Window statistics (legend and axis scaling).
struct WindowStats
{
    int n{0};
    double xMin{0.0};
    double xMax{0.0};
    double yMin{0.0};
    double yMax{0.0};
    double mean{0.0}; // mean(y)
    double last{0.0}; // newest y
};

// Data extent across every series; valid is false while all are empty.
struct Bounds
{
    bool valid{false};
    double xMin{0.0};
    double xMax{0.0};
    double yMin{0.0};
    double yMax{0.0};
};

// Fixed-capacity FIFO of (x, y) samples. Eviction follows arrival order,
// not x order.
class SlidingWindow
{
  public:
    // Throws ConfigError for capacity 0.
    explicit SlidingWindow(std::size_t capacity);

    // Amortized O(1); drops the OLDEST sample when full.
    void push(double x, double y);

    // Oldest -> newest copy of the current contents.
    std::vector<Point> snapshot() const;

    WindowStats stats() const;

    std::size_t size() const
    {
        return buf.size();
    }

    std::size_t capacity() const
    {
        return cap;
    }

    void reset()
    {
        buf.clear();
    }

  private:
    std::size_t cap;
    std::deque<Point> buf;
};

// Per-series windows keyed by series id, all with the same capacity.
class WindowBuffer
{
  public:
    explicit WindowBuffer(std::size_t capacity);

    void push(std::size_t series, double x, double y);

    // Unknown series -> empty.
    std::vector<Point> snapshot(std::size_t series) const;
    WindowStats stats(std::size_t series) const;

    Bounds bounds() const;

    std::size_t seriesCount() const
    {
        return windows.size();
    }

    std::size_t capacity() const
    {
        return cap;
    }

    void reset()
    {
        windows.clear();
    }

  private:
    std::size_t cap;
    std::map<std::size_t, SlidingWindow> windows;
};

} // namespace logplot::window
