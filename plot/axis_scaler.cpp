#include "axis_scaler.hpp"

#include <algorithm>
#include <cmath>

namespace logplot::plot
{

AxisScaler::AxisScaler(double margin, double rescaleSpeed) :
    margin(std::max(0.0, margin)),
    speed(rescaleSpeed > 0.0 ? std::min(rescaleSpeed, 1.0) : 1.0)
{}

AxisRange AxisScaler::update(double dataMin, double dataMax)
{
    if (!std::isfinite(dataMin) || !std::isfinite(dataMax) ||
        dataMax < dataMin)
        return cur;

    double lo = 0.0;
    double hi = 0.0;
    const double span = dataMax - dataMin;
    if (span <= 0.0)
    {
        // Flat data: widen so the trace sits mid-axis.
        lo = dataMin - 0.5;
        hi = dataMax + 0.5;
    }
    else
    {
        lo = dataMin - span * margin;
        hi = dataMax + span * margin;
    }

    if (!cur.valid)
    {
        cur = {true, lo, hi};
        return cur;
    }

    if (lo < cur.lo)
        cur.lo = lo;
    if (hi > cur.hi)
        cur.hi = hi;

    const double width = hi - lo;
    if (cur.lo < lo && (lo - cur.lo) > kHysteresis * width)
        cur.lo += (lo - cur.lo) * speed;
    if (cur.hi > hi && (cur.hi - hi) > kHysteresis * width)
        cur.hi -= (cur.hi - hi) * speed;

    return cur;
}

} // namespace logplot::plot
