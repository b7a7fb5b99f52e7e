#include "config.hpp"

#include "../core/errors.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>

namespace j = nlohmann;

namespace logplot
{

// Sections may be given as an object or, as in older files, as an array
// holding one object.
static const j::json* section(const j::json& root, const char* key)
{
    auto it = root.find(key);
    if (it == root.end())
        return nullptr;
    if (it->is_array())
    {
        if (it->empty())
            return nullptr;
        return &it->at(0);
    }
    if (!it->is_object())
        throw ConfigError(std::string("config: '") + key +
                          "' must be an object");
    return &*it;
}

static series::Selector readSelector(const j::json& v, const char* key)
{
    if (v.is_number_integer())
        return series::ColumnIndex{v.get<long>()};
    if (v.is_string())
        return series::parseSelector(v.get<std::string>());
    throw ConfigError(std::string("config: '") + key +
                      "' entries must be column names or indices");
}

static void readSelectors(const j::json& obj, const char* key,
                          std::vector<series::Selector>& out)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return;
    out.clear();
    if (it->is_array())
    {
        for (const auto& v : *it)
            out.push_back(readSelector(v, key));
    }
    else if (it->is_string())
    {
        out = series::parseSelectorList({it->get<std::string>()});
    }
    else
    {
        out.push_back(readSelector(*it, key));
    }
}

Config loadConfigFromJsonFile(const std::string& jsonPath, Config out)
{
    std::ifstream ifs(jsonPath);
    if (!ifs.good())
    {
        throw ConfigError("Cannot open config file: " + jsonPath);
    }

    try
    {
        j::json root = j::json::parse(ifs);
        if (!root.is_object())
            throw ConfigError("config: top level must be an object");

        // ===== basic settings =====
        if (const auto* basic = section(root, "basic settings"))
        {
            out.logPath = basic->value("file", out.logPath);
            out.tickIntervalSec = basic->value("sleep", out.tickIntervalSec);
            out.maxSamples = basic->value("maxsamples", out.maxSamples);
            out.fileTimeoutSec = basic->value("timeout", out.fileTimeoutSec);
            out.stallTicks = basic->value("stallticks", out.stallTicks);
        }

        // ===== series =====
        if (const auto* s = section(root, "series"))
        {
            readSelectors(*s, "xcols", out.xSelectors);
            readSelectors(*s, "ycols", out.ySelectors);
        }

        // ===== display =====
        if (const auto* d = section(root, "display"))
        {
            out.color = d->value("color", out.color);
            out.width = d->value("width", out.width);
            out.height = d->value("height", out.height);
            out.rescaleSpeed = d->value("rescalespeed", out.rescaleSpeed);
            out.limMargin = d->value("limmargin", out.limMargin);
        }

        // ===== diagnostics =====
        if (const auto* g = section(root, "diagnostics"))
        {
            out.diagnostics = g->value("enable", out.diagnostics);
            out.diagnosticsLog = g->value("log", out.diagnosticsLog);
        }
    }
    catch (const j::json::exception& e)
    {
        throw ConfigError("config " + jsonPath + ": " + e.what());
    }

    return out;
}

void validate(const Config& cfg)
{
    if (cfg.logPath.empty())
        throw ConfigError("file: a log file path is required (--file)");
    if (cfg.maxSamples <= 0)
        throw ConfigError("max-samples: must be a positive integer, got " +
                          std::to_string(cfg.maxSamples));
    if (!(cfg.tickIntervalSec > 0.0) || !std::isfinite(cfg.tickIntervalSec))
        throw ConfigError("sleep: tick interval must be positive");
    if (cfg.fileTimeoutSec < 0.0 || !std::isfinite(cfg.fileTimeoutSec))
        throw ConfigError("timeout: must be zero or positive");
    if (cfg.stallTicks <= 0)
        throw ConfigError("stall-ticks: must be a positive integer");
    if (!(cfg.rescaleSpeed > 0.0) || cfg.rescaleSpeed > 1.0)
        throw ConfigError("rescalespeed: must be in (0, 1]");
    if (cfg.limMargin < 0.0)
        throw ConfigError("limmargin: must not be negative");
    if (cfg.width < 0 || cfg.height < 0)
        throw ConfigError("width/height: must not be negative");

    series::validateSelectors(cfg.xSelectors, cfg.ySelectors);
}

} // namespace logplot
