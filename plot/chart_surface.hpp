#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace logplot::plot
{

// Where rendered frames go. One draw() per tick.
class ChartSurface
{
  public:
    virtual ~ChartSurface() = default;

    // False when the surface cannot be created (fatal resource error).
    virtual bool open() = 0;
    virtual void draw(const std::vector<std::string>& lines) = 0;
    virtual void close() = 0;

    virtual int width() const = 0;
    virtual int height() const = 0;

    // True while the surface holds the whole terminal, so nothing else
    // may write to it.
    virtual bool ownsTerminal() const
    {
        return false;
    }
};

// ANSI terminal: alternate screen and hidden cursor while open. When the
// stream is not a terminal, frames are written one after another.
class TerminalSurface : public ChartSurface
{
  public:
    static constexpr int kDefaultWidth = 100;
    static constexpr int kDefaultHeight = 30;

    // fixedWidth/fixedHeight of 0 follow the terminal size.
    TerminalSurface(std::ostream& out, int fd, int fixedWidth = 0,
                    int fixedHeight = 0);
    ~TerminalSurface() override;

    bool open() override;
    void draw(const std::vector<std::string>& lines) override;
    void close() override;

    int width() const override;
    int height() const override;

    bool ownsTerminal() const override
    {
        return tty && opened;
    }

  private:
    bool querySize(int& cols, int& rows) const;

    std::ostream& out;
    int fd;
    int fixedWidth;
    int fixedHeight;
    bool tty{false};
    bool opened{false};
};

} // namespace logplot::plot
