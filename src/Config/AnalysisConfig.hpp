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
/**
 * ============================================================================
 * BinSight - Analysis Configuration
 * ============================================================================
 *
 * @file AnalysisConfig.hpp
 * @brief Typed settings for the analysis library, loadable from JSON
 *
 * Document layout (every key optional, absent keys keep their defaults):
 * @code
 *   {
 *     "logging": {
 *       "level": "info",            // trace|debug|info|warn|error|fatal
 *       "flushLevel": "error",
 *       "toConsole": true,
 *       "toFile": false,
 *       "async": true,
 *       "jsonLines": false,
 *       "logDirectory": "logs",
 *       "baseFileName": "BinSight",
 *       "maxFileSizeBytes": 10485760,
 *       "maxFileCount": 10
 *     },
 *     "fuzzy": {
 *       "minInputSize": 1,
 *       "maxInputSize": 268435456
 *     }
 *   }
 * @endcode
 * ============================================================================
 */

#pragma once

#include "../ContentAnalysis/FuzzyFingerprint.hpp"
#include "../Utils/Logger.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace BinSight {
namespace Config {

namespace ConfigConstants {

    /// Configuration files larger than this are rejected (1MB)
    inline constexpr size_t MAX_CONFIG_FILE_SIZE = 1024 * 1024;

    /// Maximum JSON nesting accepted in a configuration document
    inline constexpr size_t MAX_CONFIG_DEPTH = 16;

}  // namespace ConfigConstants

struct AnalysisConfig {
    Utils::LoggerConfig logging{};
    ContentAnalysis::FuzzyFingerprintConfig fuzzy{};
};

struct ConfigError {
    std::string message;
    std::string key;        ///< Offending key path, e.g. "logging.level"

    [[nodiscard]] bool HasError() const noexcept { return !message.empty(); }
    void Clear() noexcept { message.clear(); key.clear(); }
};

/**
 * @brief Apply a JSON document on top of @p out.
 *
 * @p out is only modified when the whole document is valid.
 *
 * @return false on parse errors, type mismatches, unknown log levels or
 *         limits out of range; details in @p err
 */
[[nodiscard]] bool ParseAnalysisConfig(std::string_view jsonText,
                                       AnalysisConfig& out,
                                       ConfigError* err = nullptr);

/**
 * @brief Read and apply a JSON configuration file.
 */
[[nodiscard]] bool LoadAnalysisConfig(const std::filesystem::path& path,
                                      AnalysisConfig& out,
                                      ConfigError* err = nullptr);

}  // namespace Config
}  // namespace BinSight
