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
 * @file HashUtils.cpp
 * @brief OpenSSL EVP backed hashing utilities.
 */

#include "HashUtils.hpp"
#include "Logger.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <new>
#include <utility>

namespace BinSight {
	namespace Utils {
		namespace HashUtils {

			namespace {

				const EVP_MD* ResolveMd(Algorithm alg) noexcept {
					switch (alg) {
					case Algorithm::SHA1:   return EVP_sha1();
					case Algorithm::SHA256: return EVP_sha256();
					case Algorithm::MD5:    return EVP_md5();
					}
					return nullptr;
				}

				/// Record a non-OpenSSL failure; the message is left empty if it cannot be allocated
				void SetMessage(Error* err, const char* what) noexcept {
					if (!err) {
						return;
					}
					try {
						err->message = what;
					}
					catch (const std::bad_alloc&) {
						err->message.clear();
					}
				}

				void SetError(Error* err, const char* what) noexcept {
					const unsigned long code = ERR_get_error();
					if (err) {
						err->opensslError = code;
						try {
							err->message = what;
							if (code != 0) {
								char buf[256] = {};
								ERR_error_string_n(code, buf, sizeof(buf));
								err->message += ": ";
								err->message += buf;
							}
						}
						catch (const std::bad_alloc&) {
							// the code is already recorded
							err->message.clear();
						}
					}
					ERR_clear_error();
				}

			} // namespace

			// ============================================================================
			// Hex
			// ============================================================================

			std::string ToHexLower(const uint8_t* data, size_t len) {
				static constexpr char kDigits[] = "0123456789abcdef";

				std::string s;
				if (!data || len == 0) {
					return s;
				}
				s.resize(len * 2);
				for (size_t i = 0; i < len; ++i) {
					s[2 * i] = kDigits[data[i] >> 4];
					s[2 * i + 1] = kDigits[data[i] & 0x0F];
				}
				return s;
			}

			size_t DigestSize(Algorithm alg) noexcept {
				switch (alg) {
				case Algorithm::SHA1:   return 20;
				case Algorithm::SHA256: return 32;
				case Algorithm::MD5:    return 16;
				}
				return 0;
			}

			// ============================================================================
			// Hasher
			// ============================================================================

			Hasher::Hasher(Algorithm alg) noexcept
				: m_alg(alg), m_hashLen(DigestSize(alg)) {
			}

			Hasher::~Hasher() {
				resetState();
			}

			Hasher::Hasher(Hasher&& other) noexcept
				: m_ctx(std::exchange(other.m_ctx, nullptr))
				, m_alg(other.m_alg)
				, m_hashLen(other.m_hashLen)
				, m_inited(std::exchange(other.m_inited, false)) {
			}

			Hasher& Hasher::operator=(Hasher&& other) noexcept {
				if (this != &other) {
					resetState();
					m_ctx = std::exchange(other.m_ctx, nullptr);
					m_alg = other.m_alg;
					m_hashLen = other.m_hashLen;
					m_inited = std::exchange(other.m_inited, false);
				}
				return *this;
			}

			void Hasher::resetState() noexcept {
				if (m_ctx) {
					EVP_MD_CTX_free(m_ctx);
					m_ctx = nullptr;
				}
				m_inited = false;
			}

			bool Hasher::Init(Error* err) noexcept {
				if (err) err->clear();

				const EVP_MD* md = ResolveMd(m_alg);
				if (!md) {
					SetMessage(err, "unsupported hash algorithm");
					return false;
				}

				if (!m_ctx) {
					m_ctx = EVP_MD_CTX_new();
					if (!m_ctx) {
						SetError(err, "EVP_MD_CTX_new failed");
						BS_LOG_ERROR("HashUtils", "EVP_MD_CTX_new failed");
						return false;
					}
				}

				if (EVP_DigestInit_ex(m_ctx, md, nullptr) != 1) {
					SetError(err, "EVP_DigestInit_ex failed");
					BS_LOG_ERROR("HashUtils", "EVP_DigestInit_ex failed for algorithm %u",
					             static_cast<unsigned>(m_alg));
					resetState();
					return false;
				}

				m_inited = true;
				return true;
			}

			bool Hasher::Update(const void* data, size_t len, Error* err) noexcept {
				if (!m_inited) {
					SetMessage(err, "hasher not initialized");
					return false;
				}
				if (len == 0) {
					return true;
				}
				if (!data) {
					SetMessage(err, "null data with nonzero length");
					return false;
				}

				if (EVP_DigestUpdate(m_ctx, data, len) != 1) {
					SetError(err, "EVP_DigestUpdate failed");
					return false;
				}
				return true;
			}

			bool Hasher::Final(std::vector<uint8_t>& out, Error* err) noexcept {
				if (!m_inited) {
					SetMessage(err, "hasher not initialized");
					return false;
				}

				unsigned char md[EVP_MAX_MD_SIZE];
				unsigned int mdLen = 0;
				if (EVP_DigestFinal_ex(m_ctx, md, &mdLen) != 1) {
					SetError(err, "EVP_DigestFinal_ex failed");
					m_inited = false;
					return false;
				}
				m_inited = false;

				try {
					out.assign(md, md + mdLen);
				}
				catch (const std::bad_alloc&) {
					SetMessage(err, "out of memory");
					return false;
				}
				return true;
			}

			bool Hasher::FinalHex(std::string& outHex, Error* err) noexcept {
				std::vector<uint8_t> digest;
				if (!Final(digest, err)) {
					return false;
				}

				try {
					outHex = ToHexLower(digest);
				}
				catch (const std::bad_alloc&) {
					SetMessage(err, "out of memory");
					return false;
				}
				return true;
			}

			// ============================================================================
			// One-shot
			// ============================================================================

			bool ComputeHex(Algorithm alg, const void* data, size_t len,
			                std::string& outHex, Error* err) noexcept {
				Hasher h(alg);
				if (!h.Init(err)) return false;
				if (!h.Update(data, len, err)) return false;
				return h.FinalHex(outHex, err);
			}

		}  // namespace HashUtils
	}  // namespace Utils
}  // namespace BinSight
