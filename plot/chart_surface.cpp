#include "chart_surface.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <ostream>

namespace logplot::plot
{

TerminalSurface::TerminalSurface(std::ostream& out, int fd, int fixedWidth,
                                 int fixedHeight) :
    out(out), fd(fd), fixedWidth(fixedWidth), fixedHeight(fixedHeight)
{}

TerminalSurface::~TerminalSurface()
{
    close();
}

bool TerminalSurface::open()
{
    if (opened)
        return true;
    if (!out.good())
        return false;

    tty = fd >= 0 && ::isatty(fd) == 1;
    if (tty)
    {
        // Alternate screen, hide cursor.
        out << "\033[?1049h\033[?25l" << std::flush;
    }
    opened = out.good();
    return opened;
}

void TerminalSurface::draw(const std::vector<std::string>& lines)
{
    if (!opened)
        return;
    if (tty)
    {
        out << "\033[H";
        for (const auto& l : lines)
            out << l << "\033[K\n";
        out << "\033[J";
    }
    else
    {
        for (const auto& l : lines)
            out << l << "\n";
        out << "\n";
    }
    out.flush();
}

void TerminalSurface::close()
{
    if (!opened)
        return;
    if (tty)
        out << "\033[?25h\033[?1049l";
    out.flush();
    opened = false;
}

bool TerminalSurface::querySize(int& cols, int& rows) const
{
    if (!tty)
        return false;
    struct winsize ws
    {};
    if (::ioctl(fd, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0 || ws.ws_row == 0)
        return false;
    cols = ws.ws_col;
    rows = ws.ws_row;
    return true;
}

int TerminalSurface::width() const
{
    if (fixedWidth > 0)
        return fixedWidth;
    int cols = 0;
    int rows = 0;
    return querySize(cols, rows) ? cols : kDefaultWidth;
}

int TerminalSurface::height() const
{
    if (fixedHeight > 0)
        return fixedHeight;
    int cols = 0;
    int rows = 0;
    // Keep the last row free so the frame does not scroll.
    return querySize(cols, rows) ? rows - 1 : kDefaultHeight;
}

} // namespace logplot::plot
