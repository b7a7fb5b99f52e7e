#include "app/render_loop.hpp"
#include "config/cmdline.hpp"
#include "config/config.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "plot/chart_surface.hpp"

#include <boost/asio/io_context.hpp>

#include <unistd.h>

#include <exception>
#include <iostream>
#include <optional>

int main(int argc, char** argv)
{
    logplot::Config cfg;
    try
    {
        const auto opts = logplot::cmdline::parse(argc, argv);
        if (opts.help)
        {
            logplot::cmdline::printUsage(std::cout);
            return 0;
        }
        cfg = logplot::cmdline::buildConfig(opts);
        logplot::validate(cfg);
    }
    catch (const logplot::ConfigError& e)
    {
        std::cerr << "[logplot] Config error: " << e.what() << "\n";
        std::cerr << "[logplot] Try 'logplot --help'.\n";
        return logplot::app::kExitConfig;
    }

    std::cerr << "[logplot] Log file: " << cfg.logPath << "\n";
    std::cerr << "[logplot] Waiting for log file...\n";

    logplot::log::Diagnostics diag(cfg.diagnostics, cfg.diagnosticsLog);
    logplot::plot::TerminalSurface surface(std::cout, STDOUT_FILENO,
                                           cfg.width, cfg.height);

    boost::asio::io_context io;
    std::optional<logplot::app::RenderLoop> loop;
    try
    {
        loop.emplace(io, cfg, surface, diag);
    }
    catch (const logplot::ConfigError& e)
    {
        std::cerr << "[logplot] Config error: " << e.what() << "\n";
        return logplot::app::kExitConfig;
    }

    loop->watchSignals();
    if (!loop->start())
        return loop->exitCode();

    try
    {
        io.run();
    }
    catch (const std::exception& e)
    {
        surface.close();
        std::cerr << "[logplot] fatal: " << e.what() << "\n";
        return logplot::app::kExitResource;
    }

    return loop->exitCode();
}
