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
 * BinSight - Fuzzy Fingerprint Adapter
 * ============================================================================
 *
 * @file FuzzyFingerprint.hpp
 * @brief Similarity fingerprints through an injected CTPH provider
 *
 * The piecewise hashing itself lives behind IFuzzyHashProvider; the
 * production provider is SsdeepProvider (libfuzzy). The adapter hands the
 * caller's buffer to the provider without copying it and turns every
 * failure into FingerprintErrorCode::FingerprintUnavailable with the
 * provider's cause attached.
 *
 * Usage:
 * @code
 *   FuzzyFingerprintAdapter adapter(std::make_shared<SsdeepProvider>());
 *
 *   FingerprintError err;
 *   auto digest = adapter.Fingerprint(fileData, &err);
 *   if (!digest) {
 *       // unknown, not a property of the content: err.cause says why
 *   }
 * @endcode
 *
 * Empty input is always FingerprintUnavailable ("input is empty"): with the
 * default minimum input size the provider is never called for it.
 *
 * Thread Safety:
 *   Fingerprint() is const and may be called concurrently as long as the
 *   provider's Hash() is thread-safe (SsdeepProvider is).
 * ============================================================================
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace BinSight::ContentAnalysis {

    /// Largest buffer a provider can take (libfuzzy uses a 32-bit length)
    inline constexpr size_t kMaxProviderInputSize = std::numeric_limits<uint32_t>::max();

    /// Default cap on fingerprinted input (256MB)
    inline constexpr size_t kDefaultFuzzyMaxInputSize = 256ULL * 1024ULL * 1024ULL;

    enum class FingerprintErrorCode : uint8_t {
        None = 0,
        FingerprintUnavailable      ///< The provider could not produce a digest
    };

    [[nodiscard]] const char* FingerprintErrorCodeToString(FingerprintErrorCode code) noexcept;

    /**
     * @brief Failure details for Fingerprint().
     *
     * providerStatus is the provider's own return code, 0 when the adapter
     * rejected the input before calling the provider.
     */
    struct FingerprintError {
        FingerprintErrorCode code = FingerprintErrorCode::None;
        int providerStatus = 0;
        std::string cause;

        [[nodiscard]] bool HasError() const noexcept { return code != FingerprintErrorCode::None; }
        void Clear() noexcept { code = FingerprintErrorCode::None; providerStatus = 0; cause.clear(); }
    };

    /**
     * @brief Narrow interface to a similarity-hash implementation.
     */
    class IFuzzyHashProvider {
    public:
        virtual ~IFuzzyHashProvider() = default;

        /// Short provider name used in log messages
        [[nodiscard]] virtual std::string_view Name() const noexcept = 0;

        /**
         * @brief Hash @p data.
         *
         * @param data Input buffer, passed through from the caller
         * @param digest Output digest on success
         * @param status Provider return code on failure
         * @param cause Failure description on failure
         * @return true on success
         */
        [[nodiscard]] virtual bool Hash(std::span<const uint8_t> data,
                                        std::string& digest,
                                        int& status,
                                        std::string& cause) const = 0;
    };

    /// Input-shape limits enforced before the provider is called
    struct FuzzyFingerprintConfig {
        /// Buffers shorter than this are unavailable (0 lets empty input through)
        size_t minInputSize = 1;

        /// Buffers longer than this are unavailable; clamped to kMaxProviderInputSize
        size_t maxInputSize = kDefaultFuzzyMaxInputSize;
    };

    class FuzzyFingerprintAdapter {
    public:
        /**
         * @param provider Similarity-hash implementation (must not be null)
         * @param config Input-shape limits
         * @throws std::invalid_argument if @p provider is null
         */
        explicit FuzzyFingerprintAdapter(std::shared_ptr<const IFuzzyHashProvider> provider,
                                         FuzzyFingerprintConfig config = {});

        /**
         * @brief Compute the similarity fingerprint of @p data.
         *
         * @param data Input buffer; never copied
         * @param err Optional failure details
         * @return Digest string, or std::nullopt with err->code ==
         *         FingerprintUnavailable
         */
        [[nodiscard]] std::optional<std::string> Fingerprint(std::span<const uint8_t> data,
                                                             FingerprintError* err = nullptr) const;

        [[nodiscard]] const FuzzyFingerprintConfig& GetConfig() const noexcept { return m_config; }

        [[nodiscard]] const IFuzzyHashProvider& GetProvider() const noexcept { return *m_provider; }

    private:
        std::shared_ptr<const IFuzzyHashProvider> m_provider;
        FuzzyFingerprintConfig m_config;
    };

} // namespace BinSight::ContentAnalysis
