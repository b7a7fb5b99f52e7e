#include "line_source.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <utility>

namespace logplot::source
{

LineSource::LineSource(std::string path, log::Diagnostics* diag) :
    filePath(std::move(path)), diag(diag)
{}

bool LineSource::tryOpen()
{
    struct stat st{};
    if (::stat(filePath.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
        return false;

    in.clear();
    in.open(filePath, std::ios::in | std::ios::binary);
    if (!in.is_open())
        return false;

    fileDev = st.st_dev;
    fileIno = st.st_ino;
    readOffset = 0;
    discarding = false;
    ++captureCount;
    if (diag)
        diag->note("Opened log file: " + filePath);
    return true;
}

bool LineSource::reopen(const std::string& why)
{
    if (diag)
        diag->note(why + ": " + filePath);
    close();
    return tryOpen();
}

void LineSource::close()
{
    if (in.is_open())
        in.close();
    in.clear();
}

std::vector<std::string> LineSource::poll()
{
    std::vector<std::string> lines;
    if (!in.is_open() && !tryOpen())
        return lines;

    struct stat st{};
    if (::stat(filePath.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        // Removed underneath us; wait for it to come back.
        if (diag)
            diag->note("Log file disappeared: " + filePath);
        close();
        return lines;
    }

    // The stream still reads the old file after a delete-and-recreate.
    if (st.st_dev != fileDev || st.st_ino != fileIno)
    {
        if (!reopen("Log file replaced, starting a new capture"))
            return lines;
        st = {};
        if (::stat(filePath.c_str(), &st) != 0)
            return lines;
    }

    const auto size = static_cast<std::uintmax_t>(st.st_size);
    if (size < readOffset)
    {
        if (!reopen("Log file truncated, starting a new capture"))
            return lines;
    }
    if (size == readOffset)
        return lines;

    const std::size_t want = static_cast<std::size_t>(
        std::min<std::uintmax_t>(size - readOffset, kMaxChunkBytes));
    std::string chunk(want, '\0');

    in.clear();
    in.seekg(static_cast<std::streamoff>(readOffset));
    in.read(&chunk[0], static_cast<std::streamsize>(want));
    const auto got = static_cast<std::size_t>(std::max<std::streamsize>(
        in.gcount(), 0));
    chunk.resize(got);
    in.clear();

    std::size_t start = 0;
    for (;;)
    {
        const auto nl = chunk.find('\n', start);
        if (nl == std::string::npos)
            break;
        if (discarding)
        {
            // Tail of an over-long line.
            discarding = false;
        }
        else
        {
            std::string line = chunk.substr(start, nl - start);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            lines.push_back(std::move(line));
        }
        start = nl + 1;
    }
    readOffset += start;

    if (start == 0 && got == kMaxChunkBytes)
    {
        if (diag)
            diag->once("overlong", "Dropping line longer than " +
                                       std::to_string(kMaxChunkBytes) +
                                       " bytes");
        discarding = true;
        readOffset += got;
    }

    return lines;
}

} // namespace logplot::source
