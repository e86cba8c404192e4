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

#include "FuzzyFingerprint.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace BinSight::ContentAnalysis {

    namespace {

        constexpr const char* kLogCategory = "FuzzyFingerprint";

        std::optional<std::string> Unavailable(FingerprintError* err, int status, std::string cause) {
            if (err) {
                err->code = FingerprintErrorCode::FingerprintUnavailable;
                err->providerStatus = status;
                err->cause = std::move(cause);
            }
            return std::nullopt;
        }

    } // namespace

    const char* FingerprintErrorCodeToString(FingerprintErrorCode code) noexcept {
        switch (code) {
        case FingerprintErrorCode::None:                   return "None";
        case FingerprintErrorCode::FingerprintUnavailable: return "FingerprintUnavailable";
        }
        return "Unknown";
    }

    FuzzyFingerprintAdapter::FuzzyFingerprintAdapter(std::shared_ptr<const IFuzzyHashProvider> provider,
                                                     FuzzyFingerprintConfig config)
        : m_provider(std::move(provider))
        , m_config(config) {
        if (!m_provider) {
            throw std::invalid_argument("FuzzyFingerprintAdapter requires a provider");
        }
        m_config.maxInputSize = std::min(m_config.maxInputSize, kMaxProviderInputSize);
    }

    std::optional<std::string> FuzzyFingerprintAdapter::Fingerprint(std::span<const uint8_t> data,
                                                                     FingerprintError* err) const {
        if (err) {
            err->Clear();
        }

        if (data.size() < m_config.minInputSize) {
            BS_LOG_DEBUG(kLogCategory, "input too small for a fuzzy digest (%zu < %zu bytes)",
                         data.size(), m_config.minInputSize);
            return Unavailable(err, 0, data.empty()
                ? std::string("input is empty")
                : "input smaller than " + std::to_string(m_config.minInputSize) + " bytes");
        }

        if (data.size() > m_config.maxInputSize) {
            BS_LOG_DEBUG(kLogCategory, "input too large for a fuzzy digest (%zu > %zu bytes)",
                         data.size(), m_config.maxInputSize);
            return Unavailable(err, 0,
                "input larger than " + std::to_string(m_config.maxInputSize) + " bytes");
        }

        std::string digest;
        int status = 0;
        std::string cause;
        bool ok = false;

        try {
            ok = m_provider->Hash(data, digest, status, cause);
        }
        catch (const std::exception& ex) {
            BS_LOG_WARN(kLogCategory, "%.*s provider threw: %s",
                        static_cast<int>(m_provider->Name().size()), m_provider->Name().data(), ex.what());
            return Unavailable(err, status, std::string("provider exception: ") + ex.what());
        }

        if (!ok) {
            BS_LOG_WARN(kLogCategory, "%.*s provider failed (status %d): %s",
                        static_cast<int>(m_provider->Name().size()), m_provider->Name().data(),
                        status, cause.c_str());
            return Unavailable(err, status, cause.empty() ? std::string("provider failed") : std::move(cause));
        }

        if (digest.empty()) {
            BS_LOG_WARN(kLogCategory, "%.*s provider returned an empty digest",
                        static_cast<int>(m_provider->Name().size()), m_provider->Name().data());
            return Unavailable(err, status, "provider returned an empty digest");
        }

        return digest;
    }

} // namespace BinSight::ContentAnalysis
