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
#pragma once
/**
 * @file HashUtils.hpp
 * @brief Cryptographic hashing utilities for BinSight.
 *
 * Provides:
 * - MD5, SHA-1 and SHA-256 digests
 * - Streaming hash computation for large data
 * - Hex encoding/decoding utilities
 * - Constant-time digest comparison
 *
 * Implementation uses the OpenSSL EVP digest API.
 *
 * @note SHA-1 and MD5 are provided for sample identification only - they
 *       match the identifiers used by malware repositories, not for security.
 * @warning Thread-safe for independent Hasher instances.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Opaque OpenSSL context, keeps <openssl/evp.h> out of the public header
struct evp_md_ctx_st;

namespace BinSight {
	namespace Utils {
		namespace HashUtils {

			// ============================================================================
			// Limits
			// ============================================================================

			/// Largest digest produced by any supported algorithm (SHA-256)
			inline constexpr size_t MAX_DIGEST_SIZE = 32;

			// ============================================================================
			// Types and Enumerations
			// ============================================================================

			/**
			 * @brief Supported hash algorithms.
			 */
			enum class Algorithm : uint8_t {
				SHA1,       ///< SHA-1 (160-bit)
				SHA256,     ///< SHA-256 (256-bit)
				MD5         ///< MD5 (128-bit)
			};

			/**
			 * @brief Error information for hash operations.
			 *
			 * Carries the OpenSSL error queue code (ERR_get_error) and a message.
			 */
			struct Error {
				unsigned long opensslError = 0;   ///< OpenSSL error code (0 = none)
				std::string message;              ///< Failure description

				/// @brief Check if an error occurred
				[[nodiscard]] bool hasError() const noexcept {
					return opensslError != 0 || !message.empty();
				}

				/// @brief Clear error state
				void clear() noexcept {
					opensslError = 0;
					message.clear();
				}
			};

			// ============================================================================
			// Hex Encoding
			// ============================================================================

			/**
			 * @brief Convert binary data to lowercase hexadecimal string.
			 * @param data Input binary data
			 * @param len Length of input data
			 * @return Lowercase hex string
			 */
			[[nodiscard]] std::string ToHexLower(const uint8_t* data, size_t len);

			[[nodiscard]] inline std::string ToHexLower(const std::vector<uint8_t>& v) {
				return ToHexLower(v.data(), v.size());
			}

			// ============================================================================
			// Algorithm Information
			// ============================================================================

			/**
			 * @brief Get digest size for an algorithm.
			 * @return Digest size in bytes (16, 20 or 32)
			 */
			[[nodiscard]] size_t DigestSize(Algorithm alg) noexcept;

			// ============================================================================
			// Streaming Hasher Class
			// ============================================================================

			/**
			 * @brief Streaming cryptographic hash computation.
			 *
			 * Usage:
			 * @code
			 *   Hasher h(Algorithm::SHA256);
			 *   if (!h.Init()) return false;
			 *   if (!h.Update(data1, len1)) return false;
			 *   if (!h.Update(data2, len2)) return false;
			 *   std::vector<uint8_t> digest;
			 *   if (!h.Final(digest)) return false;
			 * @endcode
			 *
			 * @note Non-copyable, move-only. Each instance maintains its own state.
			 */
			class Hasher {
			public:
				/**
				 * @brief Construct hasher for specified algorithm.
				 * @param alg Hash algorithm to use (default: SHA256)
				 */
				explicit Hasher(Algorithm alg = Algorithm::SHA256) noexcept;

				/// @brief Destructor - releases the OpenSSL context
				~Hasher();

				// Non-copyable
				Hasher(const Hasher&) = delete;
				Hasher& operator=(const Hasher&) = delete;

				// Move operations
				Hasher(Hasher&& other) noexcept;
				Hasher& operator=(Hasher&& other) noexcept;

				/**
				 * @brief Initialize hasher for new computation.
				 *
				 * Must be called before Update(). Can be called again to reset.
				 */
				[[nodiscard]] bool Init(Error* err = nullptr) noexcept;

				/**
				 * @brief Feed data into the hash computation.
				 *
				 * A zero-length update is valid; @p data may then be null.
				 */
				[[nodiscard]] bool Update(const void* data, size_t len, Error* err = nullptr) noexcept;

				/**
				 * @brief Finalize hash and retrieve digest.
				 *
				 * The hasher can be reused by calling Init() again.
				 */
				[[nodiscard]] bool Final(std::vector<uint8_t>& out, Error* err = nullptr) noexcept;

				/**
				 * @brief Finalize hash and retrieve as lowercase hex string.
				 * @param outHex Output hex string
				 * @param err Optional error output
				 */
				[[nodiscard]] bool FinalHex(std::string& outHex, Error* err = nullptr) noexcept;

				/// @brief Get digest size for current algorithm
				[[nodiscard]] size_t GetDigestSize() const noexcept { return m_hashLen; }

				/// @brief Get current algorithm
				[[nodiscard]] Algorithm GetAlgorithm() const noexcept { return m_alg; }

				/// @brief Check if hasher is initialized and ready for Update()
				[[nodiscard]] bool IsInitialized() const noexcept { return m_inited; }

			private:
				evp_md_ctx_st* m_ctx = nullptr;     ///< OpenSSL digest context
				Algorithm m_alg;                    ///< Selected algorithm
				size_t m_hashLen = 0;               ///< Digest size in bytes
				bool m_inited = false;              ///< Initialization state

				/// @brief Reset and release internal state
				void resetState() noexcept;
			};

			// ============================================================================
			// One-Shot Hash Functions
			// ============================================================================

			/**
			 * @brief Hash @p data with a single update and return lowercase hex.
			 */
			[[nodiscard]] bool ComputeHex(Algorithm alg, const void* data, size_t len,
			                              std::string& outHex, Error* err = nullptr) noexcept;

		}  // namespace HashUtils
	}  // namespace Utils
}  // namespace BinSight
