/*
 * BinSight - Binary Content Analysis Toolkit
 * Copyright (C) 2026 BinSight Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include "AnalysisConfig.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

namespace BinSight {
namespace Config {

namespace {

using Json = nlohmann::json;

constexpr const char* kLogCategory = "Config";

bool Fail(ConfigError* err, std::string key, std::string message) {
    if (err) {
        err->key = std::move(key);
        err->message = std::move(message);
    }
    return false;
}

struct NestingTooDeep : std::runtime_error {
    NestingTooDeep() : std::runtime_error("configuration nesting too deep") {}
};

/// Parser callback rejecting containers nested deeper than MAX_CONFIG_DEPTH
bool LimitDepth(int depth, Json::parse_event_t event, Json&) {
    if ((event == Json::parse_event_t::object_start || event == Json::parse_event_t::array_start) &&
        static_cast<size_t>(depth) >= ConfigConstants::MAX_CONFIG_DEPTH) {
        throw NestingTooDeep();
    }
    return true;
}

void WarnUnknownKeys(const Json& obj, const std::string& section,
                     std::initializer_list<std::string_view> known) {
    for (const auto& item : obj.items()) {
        const std::string& key = item.key();
        if (std::find(known.begin(), known.end(), key) == known.end()) {
            BS_LOG_WARN(kLogCategory, "ignoring unknown configuration key '%s.%s'",
                        section.c_str(), key.c_str());
        }
    }
}

bool ReadBool(const Json& obj, const char* key, const std::string& section, bool& dst, ConfigError* err) {
    const auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_boolean()) {
        return Fail(err, section + "." + key, "expected a boolean");
    }
    dst = it->get<bool>();
    return true;
}

template <typename T>
bool ReadUnsigned(const Json& obj, const char* key, const std::string& section, T& dst, ConfigError* err) {
    const auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_number_unsigned()) {
        return Fail(err, section + "." + key, "expected a non-negative integer");
    }
    dst = static_cast<T>(it->get<uint64_t>());
    return true;
}

bool ReadString(const Json& obj, const char* key, const std::string& section, std::string& dst, ConfigError* err) {
    const auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_string()) {
        return Fail(err, section + "." + key, "expected a string");
    }
    dst = it->get<std::string>();
    return true;
}

bool ReadLevel(const Json& obj, const char* key, const std::string& section,
               Utils::LogLevel& dst, ConfigError* err) {
    std::string name;
    if (!obj.contains(key)) return true;
    if (!ReadString(obj, key, section, name, err)) return false;
    if (!Utils::LogLevelFromString(name, dst)) {
        return Fail(err, section + "." + key, "unknown log level '" + name + "'");
    }
    return true;
}

bool ApplyLogging(const Json& j, Utils::LoggerConfig& cfg, ConfigError* err) {
    const std::string section = "logging";
    if (!j.is_object()) {
        return Fail(err, section, "expected an object");
    }

    WarnUnknownKeys(j, section, { "level", "flushLevel", "toConsole", "toFile", "async", "jsonLines",
                                  "useUtcTime", "logDirectory", "baseFileName", "maxFileSizeBytes",
                                  "maxFileCount", "maxQueueSize" });

    return ReadLevel(j, "level", section, cfg.minimalLevel, err) &&
           ReadLevel(j, "flushLevel", section, cfg.flushLevel, err) &&
           ReadBool(j, "toConsole", section, cfg.toConsole, err) &&
           ReadBool(j, "toFile", section, cfg.toFile, err) &&
           ReadBool(j, "async", section, cfg.async, err) &&
           ReadBool(j, "jsonLines", section, cfg.jsonLines, err) &&
           ReadBool(j, "useUtcTime", section, cfg.useUtcTime, err) &&
           ReadString(j, "logDirectory", section, cfg.logDirectory, err) &&
           ReadString(j, "baseFileName", section, cfg.baseFileName, err) &&
           ReadUnsigned(j, "maxFileSizeBytes", section, cfg.maxFileSizeBytes, err) &&
           ReadUnsigned(j, "maxFileCount", section, cfg.maxFileCount, err) &&
           ReadUnsigned(j, "maxQueueSize", section, cfg.maxQueueSize, err);
}

bool ApplyFuzzy(const Json& j, ContentAnalysis::FuzzyFingerprintConfig& cfg, ConfigError* err) {
    const std::string section = "fuzzy";
    if (!j.is_object()) {
        return Fail(err, section, "expected an object");
    }

    WarnUnknownKeys(j, section, { "minInputSize", "maxInputSize" });

    uint64_t minSize = cfg.minInputSize;
    uint64_t maxSize = cfg.maxInputSize;
    if (!ReadUnsigned(j, "minInputSize", section, minSize, err) ||
        !ReadUnsigned(j, "maxInputSize", section, maxSize, err)) {
        return false;
    }

    if (maxSize > ContentAnalysis::kMaxProviderInputSize) {
        return Fail(err, "fuzzy.maxInputSize",
                    "exceeds the provider limit of " + std::to_string(ContentAnalysis::kMaxProviderInputSize));
    }
    if (minSize > maxSize) {
        return Fail(err, "fuzzy.minInputSize", "greater than fuzzy.maxInputSize");
    }

    cfg.minInputSize = static_cast<size_t>(minSize);
    cfg.maxInputSize = static_cast<size_t>(maxSize);
    return true;
}

} // namespace

bool ParseAnalysisConfig(std::string_view jsonText, AnalysisConfig& out, ConfigError* err) {
    if (err) err->Clear();

    Json root;
    try {
        root = Json::parse(jsonText.begin(), jsonText.end(), LimitDepth);
    }
    catch (const NestingTooDeep& ex) {
        return Fail(err, "", ex.what());
    }
    catch (const Json::parse_error& ex) {
        return Fail(err, "", std::string("invalid JSON: ") + ex.what());
    }

    if (!root.is_object()) {
        return Fail(err, "", "configuration root must be an object");
    }

    AnalysisConfig next = out;

    for (const auto& [key, value] : root.items()) {
        if (key == "logging") {
            if (!ApplyLogging(value, next.logging, err)) return false;
        }
        else if (key == "fuzzy") {
            if (!ApplyFuzzy(value, next.fuzzy, err)) return false;
        }
        else {
            BS_LOG_WARN(kLogCategory, "ignoring unknown configuration section '%s'", key.c_str());
        }
    }

    out = std::move(next);
    return true;
}

bool LoadAnalysisConfig(const std::filesystem::path& path, AnalysisConfig& out, ConfigError* err) {
    if (err) err->Clear();

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Fail(err, "", "cannot stat '" + path.string() + "': " + ec.message());
    }
    if (size > ConfigConstants::MAX_CONFIG_FILE_SIZE) {
        return Fail(err, "", "configuration file too large (" + std::to_string(size) + " bytes)");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Fail(err, "", "cannot open '" + path.string() + "'");
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Fail(err, "", "read error on '" + path.string() + "'");
    }

    if (!ParseAnalysisConfig(buffer.str(), out, err)) {
        BS_LOG_ERROR(kLogCategory, "failed to load %s: %s",
                     path.string().c_str(), err ? err->message.c_str() : "invalid configuration");
        return false;
    }

    BS_LOG_INFO(kLogCategory, "loaded configuration from %s", path.string().c_str());
    return true;
}

}  // namespace Config
}  // namespace BinSight
