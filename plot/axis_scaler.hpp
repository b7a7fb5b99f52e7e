#pragma once

namespace logplot::plot
{

struct AxisRange
{
    bool valid{false};
    double lo{0.0};
    double hi{1.0};
};

// Auto-scaling for one axis. The range snaps outward as soon as data
// leaves it and eases back inward once the slack exceeds kHysteresis of
// the target width.
class AxisScaler
{
  public:
    static constexpr double kHysteresis = 0.2;

    // margin: fraction of the data span added on both sides.
    // rescaleSpeed: fraction of the gap closed per update, in (0, 1].
    AxisScaler(double margin, double rescaleSpeed);

    AxisRange update(double dataMin, double dataMax);

    AxisRange range() const
    {
        return cur;
    }

    void reset()
    {
        cur = AxisRange{};
    }

  private:
    double margin;
    double speed;
    AxisRange cur;
};

} // namespace logplot::plot
