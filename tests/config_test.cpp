#include "config/cmdline.hpp"
#include "config/config.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace logplot;
using logplot::test::TempDir;

namespace
{

cmdline::Options parseArgs(std::vector<std::string> args)
{
    std::vector<const char*> argv{"logplot"};
    for (const auto& a : args)
        argv.push_back(a.c_str());
    return cmdline::parse(static_cast<int>(argv.size()), argv.data());
}

void writeFile(const std::string& path, const std::string& text)
{
    std::ofstream f(path, std::ios::trunc);
    f << text;
}

} // namespace

TEST(CommandLine, Defaults)
{
    const auto cfg = cmdline::buildConfig(parseArgs({"-f", "log.txt"}));
    EXPECT_EQ(cfg.logPath, "log.txt");
    EXPECT_EQ(cfg.maxSamples, 100);
    EXPECT_DOUBLE_EQ(cfg.tickIntervalSec, 0.05);
    EXPECT_DOUBLE_EQ(cfg.fileTimeoutSec, 10.0);
    EXPECT_TRUE(cfg.xSelectors.empty());
    EXPECT_TRUE(cfg.ySelectors.empty());
    EXPECT_TRUE(cfg.color);
    EXPECT_TRUE(cfg.diagnostics);
    EXPECT_NO_THROW(validate(cfg));
}

TEST(CommandLine, LongOptionsWithEquals)
{
    const auto cfg = cmdline::buildConfig(parseArgs(
        {"--file=logging/log_demo.txt", "--max-samples=250", "--sleep=0.2",
         "--timeout=0", "--no-color", "-q"}));
    EXPECT_EQ(cfg.logPath, "logging/log_demo.txt");
    EXPECT_EQ(cfg.maxSamples, 250);
    EXPECT_DOUBLE_EQ(cfg.tickIntervalSec, 0.2);
    EXPECT_DOUBLE_EQ(cfg.fileTimeoutSec, 0.0);
    EXPECT_FALSE(cfg.color);
    EXPECT_FALSE(cfg.diagnostics);
}

TEST(CommandLine, MultiValueSelectors)
{
    const auto cfg = cmdline::buildConfig(
        parseArgs({"-x", "0", "-y", "1", "-1", "temp", "-n", "5", "-f", "a"}));
    ASSERT_EQ(cfg.xSelectors.size(), 1u);
    ASSERT_EQ(cfg.ySelectors.size(), 3u);
    EXPECT_EQ(std::get<series::ColumnIndex>(cfg.ySelectors[1]).value, -1);
    EXPECT_EQ(std::get<series::ColumnName>(cfg.ySelectors[2]).value, "temp");
    EXPECT_EQ(cfg.maxSamples, 5);

    const auto cfg2 =
        cmdline::buildConfig(parseArgs({"-f", "a", "--y-cols", "a,b"}));
    EXPECT_EQ(cfg2.ySelectors.size(), 2u);
}

TEST(CommandLine, Errors)
{
    EXPECT_THROW(parseArgs({"--bogus"}), ConfigError);
    EXPECT_THROW(parseArgs({"-n", "many"}), ConfigError);
    EXPECT_THROW(parseArgs({"-f"}), ConfigError);
    EXPECT_THROW(parseArgs({"-y", "-n", "3"}), ConfigError);
    EXPECT_TRUE(parseArgs({"--help"}).help);
}

TEST(CommandLine, UsageMentionsRequiredFile)
{
    std::ostringstream os;
    cmdline::printUsage(os);
    EXPECT_NE(os.str().find("--file"), std::string::npos);
}

TEST(Validate, RejectsBadValues)
{
    Config cfg;
    EXPECT_THROW(validate(cfg), ConfigError); // no file

    cfg.logPath = "log.txt";
    cfg.maxSamples = 0;
    EXPECT_THROW(validate(cfg), ConfigError);
    cfg.maxSamples = -2;
    EXPECT_THROW(validate(cfg), ConfigError);
    cfg.maxSamples = 10;

    cfg.tickIntervalSec = 0.0;
    EXPECT_THROW(validate(cfg), ConfigError);
    cfg.tickIntervalSec = 0.05;

    cfg.rescaleSpeed = 1.5;
    EXPECT_THROW(validate(cfg), ConfigError);
    cfg.rescaleSpeed = 0.1;

    cfg.xSelectors = series::parseSelectorList({"0,1"});
    cfg.ySelectors = series::parseSelectorList({"2,3,4"});
    EXPECT_THROW(validate(cfg), ConfigError);

    cfg.ySelectors = series::parseSelectorList({"2,3"});
    EXPECT_NO_THROW(validate(cfg));
}

TEST(Validate, MessageNamesOption)
{
    Config cfg;
    cfg.logPath = "log.txt";
    cfg.maxSamples = 0;
    try
    {
        validate(cfg);
        FAIL() << "expected ConfigError";
    }
    catch (const ConfigError& e)
    {
        EXPECT_NE(std::string(e.what()).find("max-samples"),
                  std::string::npos);
    }
}

TEST(JsonConfig, LoadsSectionsAndCliOverrides)
{
    TempDir tmp;
    const auto path = tmp.file("logplot.json");
    writeFile(path, R"({
        "basic settings": [{"file": "from-json.txt", "maxsamples": 42,
                            "sleep": 0.1, "stallticks": 7}],
        "series": {"xcols": 0, "ycols": ["a", 2]},
        "display": {"color": false, "width": 80, "limmargin": 0.1},
        "diagnostics": {"enable": false, "log": "/tmp/diag.log"}
    })");

    auto cfg = loadConfigFromJsonFile(path);
    EXPECT_EQ(cfg.logPath, "from-json.txt");
    EXPECT_EQ(cfg.maxSamples, 42);
    EXPECT_EQ(cfg.stallTicks, 7);
    EXPECT_DOUBLE_EQ(cfg.tickIntervalSec, 0.1);
    ASSERT_EQ(cfg.xSelectors.size(), 1u);
    ASSERT_EQ(cfg.ySelectors.size(), 2u);
    EXPECT_EQ(std::get<series::ColumnName>(cfg.ySelectors[0]).value, "a");
    EXPECT_EQ(std::get<series::ColumnIndex>(cfg.ySelectors[1]).value, 2);
    EXPECT_FALSE(cfg.color);
    EXPECT_EQ(cfg.width, 80);
    EXPECT_DOUBLE_EQ(cfg.limMargin, 0.1);
    EXPECT_FALSE(cfg.diagnostics);
    EXPECT_EQ(cfg.diagnosticsLog, "/tmp/diag.log");
    // Untouched keys keep defaults.
    EXPECT_DOUBLE_EQ(cfg.fileTimeoutSec, 10.0);

    const auto merged = cmdline::buildConfig(
        parseArgs({"-c", path, "-n", "7", "-f", "cli.txt"}));
    EXPECT_EQ(merged.logPath, "cli.txt");
    EXPECT_EQ(merged.maxSamples, 7);
    EXPECT_EQ(merged.stallTicks, 7);
}

TEST(JsonConfig, Errors)
{
    TempDir tmp;
    EXPECT_THROW(loadConfigFromJsonFile(tmp.file("missing.json")),
                 ConfigError);

    const auto bad = tmp.file("bad.json");
    writeFile(bad, "{ not json");
    EXPECT_THROW(loadConfigFromJsonFile(bad), ConfigError);

    const auto wrongType = tmp.file("type.json");
    writeFile(wrongType, R"({"basic settings": {"maxsamples": "lots"}})");
    EXPECT_THROW(loadConfigFromJsonFile(wrongType), ConfigError);

    const auto badSel = tmp.file("sel.json");
    writeFile(badSel, R"({"series": {"ycols": [1.5]}})");
    EXPECT_THROW(loadConfigFromJsonFile(badSel), ConfigError);
}
