#pragma once

#include "../config/config.hpp"
#include "../core/line_source.hpp"
#include "../core/logging.hpp"
#include "../parse/row_parser.hpp"
#include "../plot/chart_renderer.hpp"
#include "../plot/chart_surface.hpp"
#include "../series/series_router.hpp"
#include "../window/sliding_window.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace logplot::app
{

enum class State
{
    Idle,      // no file yet, or no schema yet
    Streaming, // schema resolved, data flowing
    Stalled,   // no new rows for a while; chart stays as is
    Terminated
};

const char* toString(State s);

// Process exit codes.
inline constexpr int kExitOk = 0;
inline constexpr int kExitResource = 1;
inline constexpr int kExitConfig = 2;

// Drives the pipeline on a fixed cadence:
//   poll -> parse -> route -> buffer -> redraw
// once per tick, all on the io_context thread.
class RenderLoop
{
  public:
    // cfg must have passed validate().
    RenderLoop(boost::asio::io_context& io, const Config& cfg,
               plot::ChartSurface& surface, log::Diagnostics& diag);

    // Open the surface and schedule the first tick. Returns false (and
    // terminates) when the surface cannot be created.
    bool start();

    // Route SIGINT/SIGTERM to stop().
    void watchSignals();

    // Cooperative cancel, honoured at the next tick boundary.
    void stop();

    // One full pass. Public so callers can step the loop by hand.
    void tick();

    State state() const
    {
        return current;
    }

    int exitCode() const
    {
        return exitStatus;
    }

    const window::WindowBuffer& buffer() const
    {
        return windows;
    }

    const series::SeriesRouter& seriesRouter() const
    {
        return router;
    }

    const parse::RowParser& rowParser() const
    {
        return parser;
    }

  private:
    void schedule();
    void onTimer(const boost::system::error_code& ec);
    bool ingest(const std::string& line);
    void beginCapture();
    void redraw();
    void terminate(int code, const std::string& msg);

    boost::asio::io_context& io;
    boost::asio::steady_timer timer;
    std::optional<boost::asio::signal_set> signals;
    Config cfg;
    plot::ChartSurface& surface;
    log::Diagnostics& diag;

    source::LineSource lines;
    series::SeriesRouter router;
    parse::RowParser parser;
    window::WindowBuffer windows;
    plot::ChartRenderer renderer;

    State current{State::Idle};
    int exitStatus{kExitOk};
    bool stopRequested{false};
    bool everOpened{false};
    int idleTicks{0};
    std::size_t linesRead{0};
    std::uint64_t seenCapture{0};
    std::chrono::steady_clock::time_point startedAt;
    std::chrono::steady_clock::time_point nextTick;
};

} // namespace logplot::app
