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
 * @file Logger.hpp
 * @brief Thread-safe asynchronous logging system for BinSight.
 *
 * Provides:
 * - Asynchronous logging with configurable back-pressure policies
 * - Console and rotating file output
 * - JSON Lines output format support
 * - Source location tracking (file, line, function)
 * - Scoped logging with timing measurements
 * - Thread-safe singleton pattern
 *
 * @note Thread-safe for all public methods.
 * @warning Nothing is written until Initialize() has been called. The
 *          analysis primitives log through the macros below, so an embedding
 *          application that never initializes the logger gets no output.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace BinSight {
	namespace Utils {

		// ============================================================================
		// Log Levels
		// ============================================================================

		/**
		 * @brief Severity levels for log messages.
		 *
		 * Ordered from least to most severe. Messages below the configured
		 * minimum level are discarded.
		 */
		enum class LogLevel : uint8_t {
			Trace = 0,  ///< Verbose debugging information
			Debug,      ///< Debug-level information
			Info,       ///< Informational messages
			Warn,       ///< Warning conditions
			Error,      ///< Error conditions
			Fatal       ///< Fatal/critical errors
		};

		/// @brief Upper-case level name ("TRACE" .. "FATAL")
		[[nodiscard]] const char* LogLevelToString(LogLevel level) noexcept;

		/**
		 * @brief Parse a level name (case-insensitive, "warning" accepted for Warn).
		 * @return true if @p name was recognized
		 */
		[[nodiscard]] bool LogLevelFromString(const std::string& name, LogLevel& out) noexcept;

		// ============================================================================
		// Configuration
		// ============================================================================

		/**
		 * @brief Configuration options for the Logger.
		 */
		struct LoggerConfig {
			/// Maximum queue size for async logging
			size_t maxQueueSize = 1000;

			/// Policy when queue is full
			enum class BackPressurePolicy {
				Block,       ///< Block until space available
				DropOldest,  ///< Drop oldest messages
				DropNewest   ///< Drop newest messages
			} bpPolicy = BackPressurePolicy::DropOldest;

			bool async = true;              ///< Enable asynchronous logging
			bool toConsole = true;          ///< Output to stderr
			bool toFile = false;            ///< Output to rotating log file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool useUtcTime = true;         ///< Use UTC timestamps
			bool includeSrcLocation = true; ///< Include source file/line/function
			bool includeProcThreadId = true;///< Include process/thread IDs

			std::string logDirectory = "logs";           ///< Log file directory
			std::string baseFileName = "BinSight";       ///< Base log file name
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
			size_t maxFileCount = 10;                    ///< Max rotated files to keep

			LogLevel minimalLevel = LogLevel::Info;      ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;       ///< Level that triggers flush
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Thread-safe singleton logger with async support.
		 *
		 * Usage:
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.toFile = true;
		 *   cfg.logDirectory = "logs";
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   BS_LOG_INFO("MyCategory", "Hello %s", "World");
		 *   BS_LOG_ERROR("MyCategory", "Error code: %d", 42);
		 *
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 *
		 * @note Call ShutDown() before application exit to flush pending logs.
		 */
		class Logger {
		public:
			/**
			 * @brief Get the singleton Logger instance.
			 * @return Reference to the global Logger instance
			 */
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize the logger with configuration.
			 *
			 * Calling it again re-applies the configuration: pending messages
			 * are drained and the worker is restarted.
			 *
			 * @param cfg Logger configuration
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Shut down the logger and flush pending messages.
			 *
			 * Stops the async worker thread and writes remaining messages.
			 */
			void ShutDown();

			/// @brief Check if logger is initialized.
			[[nodiscard]] bool IsInitialized() const noexcept;

			/// @brief Set the minimum log level.
			void setMinimalLevel(LogLevel level) noexcept;

			/// @brief Check if a log level is enabled.
			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a printf-style formatted message with source location.
			 */
			void LogEx(LogLevel level,
			           const char* category,
			           const char* file,
			           int line,
			           const char* function,
			           const char* format, ...);

			/**
			 * @brief Log a pre-formatted message.
			 */
			void LogMessage(LogLevel level,
			                const char* category,
			                const std::string& message,
			                const char* file = nullptr,
			                int line = 0,
			                const char* function = nullptr);

			/**
			 * @brief Wait until queued messages are written, then flush the sinks.
			 */
			void Flush();

			/**
			 * @brief Format a message with va_list.
			 * @param fmt printf-style format string
			 * @param args Variable arguments
			 * @return Formatted string
			 */
			[[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

			/**
			 * @brief RAII scope logger for function entry/exit timing.
			 */
			class Scope {
			public:
				Scope(const char* category,
				      const char* file,
				      int line,
				      const char* function,
				      const char* messageOnEnter = "Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				// Non-copyable, non-movable
				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				const char* m_category;
				const char* m_file;
				const char* m_function;
				int m_line;
				std::chrono::steady_clock::time_point m_start;
				LogLevel m_level;
			};

			// Non-copyable singleton
			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger();
			~Logger();

			// ========================================================================
			// Internal Types
			// ========================================================================

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::string category;
				std::string message;
				std::string file;
				std::string function;
				int line = 0;
				uint32_t pid = 0;
				uint64_t tid = 0;
				std::chrono::system_clock::time_point ts{};
			};

			// ========================================================================
			// Internal Methods
			// ========================================================================

			void WorkerLoop();
			/// @return false when no worker is running; @p item is then left intact for a synchronous write
			[[nodiscard]] bool Enqueue(LogItem&& item);
			void Write(const LogItem& item);

			void WriteConsole(const std::string& line);
			void WriteFile(const std::string& line);

			[[nodiscard]] std::string FormatPlain(const LogItem& item) const;
			[[nodiscard]] std::string FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::string EscapeJson(const std::string& s);
			[[nodiscard]] std::string FormatTimestamp(std::chrono::system_clock::time_point ts) const;

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			void CloseLogFile() noexcept;
			[[nodiscard]] std::string BaseLogPath() const;
			[[nodiscard]] std::string RotatedLogPath(size_t index) const;

			void StopWorker();

			// ========================================================================
			// Member Variables
			// ========================================================================

			/// Initialization state
			std::atomic<bool> m_initialized{ false };

			/// Current minimum log level
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			/// Serializes Initialize() and ShutDown(); guards m_worker
			std::mutex m_lifecycleMutex;

			/// Async worker thread
			std::thread m_worker;

			/// Logger configuration
			LoggerConfig m_cfg{};

			/// Mutex protecting configuration and sinks
			mutable std::mutex m_cfgMutex;

			/// Sinks accept writes (guarded by m_cfgMutex)
			bool m_sinksOpen{ false };

			/// Log file handle
			std::FILE* m_file{ nullptr };

			/// Current log file size
			uint64_t m_currentSize{ 0 };

			/// Mutex protecting the queue state below
			mutable std::mutex m_queueMutex;

			/// Signals producers, the worker and Flush()
			std::condition_variable m_queueCv;

			/// Log message queue for async mode
			std::deque<LogItem> m_queue;

			/// Queue limits copied from m_cfg at Initialize()
			size_t m_queueLimit{ 1 };
			LoggerConfig::BackPressurePolicy m_bpPolicy{ LoggerConfig::BackPressurePolicy::DropOldest };

			/// Worker is accepting items
			bool m_async{ false };

			/// Stop request for the worker
			bool m_stop{ false };

			/// Worker is writing an item it already dequeued
			bool m_writing{ false };
		};

	}  // namespace Utils
}  // namespace BinSight

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// Usage:
//   BS_LOG_INFO("Category", "Message with %d format", value);
//   BS_LOG_ERROR("Category", "Error occurred: %s", errorMsg);
//   BS_LOG_SCOPE("Category");  // Logs function entry/exit with timing
//
// ═══════════════════════════════════════════════════════════════════════════

#define BS_LOG_AT_LEVEL_(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::BinSight::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at TRACE level
#define BS_LOG_TRACE(category, fmt, ...) \
    BS_LOG_AT_LEVEL_(::BinSight::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)

/// @brief Log at DEBUG level
#define BS_LOG_DEBUG(category, fmt, ...) \
    BS_LOG_AT_LEVEL_(::BinSight::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)

/// @brief Log at INFO level
#define BS_LOG_INFO(category, fmt, ...) \
    BS_LOG_AT_LEVEL_(::BinSight::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)

/// @brief Log at WARN level
#define BS_LOG_WARN(category, fmt, ...) \
    BS_LOG_AT_LEVEL_(::BinSight::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)

/// @brief Log at ERROR level
#define BS_LOG_ERROR(category, fmt, ...) \
    BS_LOG_AT_LEVEL_(::BinSight::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)

/// @brief Log at FATAL level
#define BS_LOG_FATAL(category, fmt, ...) \
    BS_LOG_AT_LEVEL_(::BinSight::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

#define BS_LOG_CONCAT_INNER_(a, b) a##b
#define BS_LOG_CONCAT_(a, b) BS_LOG_CONCAT_INNER_(a, b)

/// @brief RAII scope logger - logs function entry and exit with timing
#define BS_LOG_SCOPE(category) \
    ::BinSight::Utils::Logger::Scope BS_LOG_CONCAT_(_bs_scope_obj_, __LINE__)( \
        (category), __FILE__, __LINE__, __func__)
