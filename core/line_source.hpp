#pragma once

#include "logging.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include <sys/types.h>

namespace logplot::source
{

// Tails an append-only text file written by another process.
//
// Only newline-terminated lines are returned. The read offset always sits
// at the end of the last complete line handed out, so a line that is still
// being written is picked up whole by a later poll. No locking is needed
// against the writer.
//
// A file that is truncated, or removed and created again under the same
// path, starts a new capture: it is reopened and read from the top.
class LineSource
{
  public:
    // Upper bound on bytes consumed by one poll().
    static constexpr std::size_t kMaxChunkBytes = 1 << 20;

    explicit LineSource(std::string path,
                        log::Diagnostics* diag = nullptr);

    // Newly completed lines since the last call (possibly none). Never
    // blocks; a missing file yields an empty result.
    std::vector<std::string> poll();

    bool isOpen() const
    {
        return in.is_open();
    }

    std::uintmax_t offset() const
    {
        return readOffset;
    }

    const std::string& path() const
    {
        return filePath;
    }

    // Bumped every time a file is opened, so 0 until the first open.
    // A change between two polls means the returned lines belong to a
    // new capture.
    std::uint64_t capture() const
    {
        return captureCount;
    }

    void close();

  private:
    bool tryOpen();
    bool reopen(const std::string& why);

    std::string filePath;
    std::ifstream in;
    // Identity of the open file, compared against the path on every poll.
    dev_t fileDev{};
    ino_t fileIno{};
    std::uint64_t captureCount{0};
    std::uintmax_t readOffset{0};
    bool discarding{false}; // inside an over-long line
    log::Diagnostics* diag;
};

} // namespace logplot::source
