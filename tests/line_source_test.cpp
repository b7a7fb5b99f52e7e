#include "core/line_source.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

using logplot::source::LineSource;
using logplot::test::TempDir;
using logplot::test::append;
using Lines = std::vector<std::string>;

TEST(LineSource, MissingFileIsNotAnError)
{
    TempDir tmp;
    LineSource src(tmp.file("absent.txt"));
    EXPECT_TRUE(src.poll().empty());
    EXPECT_FALSE(src.isOpen());
    EXPECT_EQ(src.offset(), 0u);
}

TEST(LineSource, PicksUpFileCreatedLater)
{
    TempDir tmp;
    const auto path = tmp.file("log.txt");
    LineSource src(path);
    EXPECT_TRUE(src.poll().empty());

    append(path, "1,2\n");
    EXPECT_EQ(src.poll(), Lines{"1,2"});
    EXPECT_TRUE(src.isOpen());
}

TEST(LineSource, ReturnsEachLineOnce)
{
    TempDir tmp;
    const auto path = tmp.file("log.txt");
    append(path, "a\nb\n");
    LineSource src(path);

    EXPECT_EQ(src.poll(), (Lines{"a", "b"}));
    EXPECT_TRUE(src.poll().empty());

    append(path, "c\n");
    append(path, "d\n");
    EXPECT_EQ(src.poll(), (Lines{"c", "d"}));
    EXPECT_TRUE(src.poll().empty());
    EXPECT_EQ(src.offset(), 8u);
}

TEST(LineSource, PartialLineWaitsForNewline)
{
    TempDir tmp;
    const auto path = tmp.file("log.txt");
    LineSource src(path);

    append(path, "1.5,2");
    EXPECT_TRUE(src.poll().empty());
    EXPECT_EQ(src.offset(), 0u);

    append(path, "5.25");
    EXPECT_TRUE(src.poll().empty());

    append(path, "\n3,4");
    EXPECT_EQ(src.poll(), Lines{"1.5,25.25"});
    EXPECT_EQ(src.offset(), 10u);

    append(path, "\n");
    EXPECT_EQ(src.poll(), Lines{"3,4"});
}

TEST(LineSource, OffsetNeverMovesBackwardWhileAppending)
{
    TempDir tmp;
    const auto path = tmp.file("log.txt");
    LineSource src(path);

    Lines written;
    Lines seen;
    std::uintmax_t last = 0;
    for (int i = 0; i < 50; ++i)
    {
        const std::string line = std::to_string(i) + "," + std::to_string(i * i);
        written.push_back(line);
        // Split every line across two writes.
        const auto half = line.size() / 2;
        append(path, line.substr(0, half));
        for (auto& l : src.poll())
            seen.push_back(l);
        EXPECT_GE(src.offset(), last);
        last = src.offset();

        append(path, line.substr(half) + "\n");
        for (auto& l : src.poll())
            seen.push_back(l);
        EXPECT_GE(src.offset(), last);
        last = src.offset();
    }
    EXPECT_EQ(seen, written);
}

TEST(LineSource, StripsCarriageReturn)
{
    TempDir tmp;
    const auto path = tmp.file("log.txt");
    append(path, "x,y\r\n1,2\r\n");
    LineSource src(path);
    EXPECT_EQ(src.poll(), (Lines{"x,y", "1,2"}));
}

TEST(LineSource, TruncationRestartsFromBeginning)
{
    TempDir tmp;
    const auto path = tmp.file("log.txt");
    append(path, "1,1\n2,2\n3,3\n");
    LineSource src(path);
    EXPECT_EQ(src.poll().size(), 3u);

    const auto before = src.capture();
    std::filesystem::resize_file(path, 0);
    append(path, "9,9\n");
    EXPECT_EQ(src.poll(), Lines{"9,9"});
    EXPECT_EQ(src.offset(), 4u);
    EXPECT_EQ(src.capture(), before + 1);
}

TEST(LineSource, ReplacedFileIsReadFromTheNewFile)
{
    TempDir tmp;
    const auto path = tmp.file("log.txt");
    append(path, "1,1\n2,2\n3,3\n");
    LineSource src(path);
    EXPECT_EQ(src.poll().size(), 3u);
    EXPECT_EQ(src.capture(), 1u);

    // Deleted and recreated between two polls.
    std::filesystem::remove(path);
    append(path, "9,9\n");
    EXPECT_EQ(src.poll(), Lines{"9,9"});
    EXPECT_EQ(src.capture(), 2u);
    EXPECT_TRUE(src.poll().empty());

    // Same again with a replacement larger than what was already read.
    std::filesystem::remove(path);
    append(path, "4,4\n5,5\n6,6\n7,7\n8,8\n");
    EXPECT_EQ(src.poll(), (Lines{"4,4", "5,5", "6,6", "7,7", "8,8"}));
    EXPECT_EQ(src.capture(), 3u);
}

TEST(LineSource, RemovedFileClosesUntilItReturns)
{
    TempDir tmp;
    const auto path = tmp.file("log.txt");
    append(path, "1\n");
    LineSource src(path);
    EXPECT_EQ(src.poll(), Lines{"1"});

    std::filesystem::remove(path);
    EXPECT_TRUE(src.poll().empty());
    EXPECT_FALSE(src.isOpen());

    append(path, "2\n");
    EXPECT_EQ(src.poll(), Lines{"2"});
    EXPECT_EQ(src.capture(), 2u);
}

TEST(LineSource, CloseReleasesAndReopens)
{
    TempDir tmp;
    const auto path = tmp.file("log.txt");
    append(path, "1\n");
    LineSource src(path);
    EXPECT_EQ(src.poll(), Lines{"1"});

    src.close();
    EXPECT_FALSE(src.isOpen());

    // Reopening starts a new capture from the top.
    EXPECT_EQ(src.poll(), Lines{"1"});
}

TEST(LineSource, DropsOverlongLine)
{
    TempDir tmp;
    const auto path = tmp.file("log.txt");
    logplot::log::Diagnostics diag(false, "");
    LineSource src(path, &diag);

    append(path, std::string(LineSource::kMaxChunkBytes + 10, 'x'));
    EXPECT_TRUE(src.poll().empty());

    EXPECT_EQ(src.offset(), LineSource::kMaxChunkBytes);

    // The rest of the long line is dropped; the next line comes through.
    append(path, "yyy\n1,2\n");
    EXPECT_EQ(src.poll(), Lines{"1,2"});
    EXPECT_TRUE(src.poll().empty());
}
