#include "render_loop.hpp"

#include "../core/errors.hpp"
#include "../core/time_utils.hpp"

#include <csignal>

namespace logplot::app
{

const char* toString(State s)
{
    switch (s)
    {
        case State::Idle:
            return "waiting";
        case State::Streaming:
            return "streaming";
        case State::Stalled:
            return "stalled";
        case State::Terminated:
            return "stopped";
    }
    return "unknown";
}

RenderLoop::RenderLoop(boost::asio::io_context& io, const Config& cfg,
                       plot::ChartSurface& surface, log::Diagnostics& diag) :
    io(io), timer(io), cfg(cfg), surface(surface), diag(diag),
    lines(cfg.logPath, &diag), router(cfg.xSelectors, cfg.ySelectors),
    parser(
        [this](const parse::Schema& schema) {
            const auto& bound = router.resolve(schema);
            renderer.setSeries(bound, router.xAxisLabel());
            return router.requiredColumns();
        },
        &diag),
    windows(static_cast<std::size_t>(cfg.maxSamples)),
    renderer(cfg.limMargin, cfg.rescaleSpeed, cfg.color),
    startedAt(std::chrono::steady_clock::now()), nextTick(startedAt)
{}

bool RenderLoop::start()
{
    if (!surface.open())
    {
        terminate(kExitResource, "Cannot create render surface");
        return false;
    }
    diag.setConsole(!surface.ownsTerminal());
    startedAt = std::chrono::steady_clock::now();
    nextTick = startedAt;
    schedule();
    return true;
}

void RenderLoop::watchSignals()
{
    signals.emplace(io, SIGINT, SIGTERM);
    signals->async_wait(
        [this](const boost::system::error_code& ec, int /*signo*/) {
            if (!ec)
                stop();
        });
}

void RenderLoop::stop()
{
    stopRequested = true;
    timer.cancel();
}

void RenderLoop::schedule()
{
    timer.expires_at(nextTick);
    timer.async_wait(
        [this](const boost::system::error_code& ec) { onTimer(ec); });
}

void RenderLoop::onTimer(const boost::system::error_code& ec)
{
    if (ec == boost::asio::error::operation_aborted)
    {
        if (stopRequested && current != State::Terminated)
            terminate(kExitOk, {});
        return;
    }

    tick();
    if (current == State::Terminated)
        return;

    const auto now = std::chrono::steady_clock::now();
    nextTick += timeutil::fromSeconds(cfg.tickIntervalSec);
    if (nextTick < now)
        nextTick = now; // behind: no catch-up burst
    schedule();
}

bool RenderLoop::ingest(const std::string& line)
{
    ++linesRead;
    auto res = parser.parse(line);
    if (res.status != parse::Status::Record)
        return false;
    for (const auto& s : router.route(res.record))
        windows.push(s.series, s.x, s.y);
    return true;
}

void RenderLoop::tick()
{
    if (current == State::Terminated)
        return;
    if (stopRequested)
    {
        terminate(kExitOk, {});
        return;
    }

    const auto fresh = lines.poll();
    if (!lines.isOpen())
    {
        if (!everOpened && cfg.fileTimeoutSec > 0.0 &&
            timeutil::secondsSince(startedAt) > cfg.fileTimeoutSec)
        {
            terminate(kExitResource,
                      "Timeout reached, no log file found: " + cfg.logPath);
            return;
        }
        redraw();
        return;
    }
    everOpened = true;

    if (lines.capture() != seenCapture)
    {
        if (seenCapture != 0)
            beginCapture();
        seenCapture = lines.capture();
    }

    bool gotRecord = false;
    try
    {
        for (const auto& line : fresh)
            gotRecord = ingest(line) || gotRecord;
    }
    catch (const ConfigError& e)
    {
        terminate(kExitConfig, std::string("Config error: ") + e.what());
        return;
    }

    if (gotRecord)
    {
        idleTicks = 0;
        current = State::Streaming;
    }
    else if (router.resolved())
    {
        if (current == State::Idle)
            current = State::Streaming;
        else if (++idleTicks >= cfg.stallTicks)
            current = State::Stalled;
    }

    redraw();
}

// The file was truncated or replaced: everything learned from the previous
// capture (schema, bindings, sample index, windows, axes) is dropped.
void RenderLoop::beginCapture()
{
    parser.reset();
    router.reset();
    windows.reset();
    renderer.reset();
    linesRead = 0;
    idleTicks = 0;
    current = State::Idle;
}

void RenderLoop::redraw()
{
    plot::FrameStatus st;
    st.state = toString(current);
    st.file = cfg.logPath;
    st.linesRead = linesRead;
    st.skipped = parser.skipped();
    st.note = diag.last();
    surface.draw(
        renderer.render(windows, st, surface.width(), surface.height()));
}

void RenderLoop::terminate(int code, const std::string& msg)
{
    current = State::Terminated;
    exitStatus = code;
    timer.cancel();
    if (signals)
    {
        boost::system::error_code ignored;
        signals->cancel(ignored);
    }
    lines.close();
    // Leave the chart screen first so the message stays visible.
    surface.close();
    diag.setConsole(true);
    if (!msg.empty())
        log::info(msg);
}

} // namespace logplot::app
