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
 * @file Logger.cpp
 * @brief Logger implementation: async queue, console/file sinks, rotation.
 */

#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <functional>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace BinSight {
	namespace Utils {

		namespace fs = std::filesystem;

		// ============================================================================
		// Level helpers
		// ============================================================================

		const char* LogLevelToString(LogLevel level) noexcept {
			switch (level) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			}
			return "UNKNOWN";
		}

		bool LogLevelFromString(const std::string& name, LogLevel& out) noexcept {
			std::string lower;
			lower.reserve(name.size());
			for (char c : name) {
				lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
			}

			if (lower == "trace") { out = LogLevel::Trace; return true; }
			if (lower == "debug") { out = LogLevel::Debug; return true; }
			if (lower == "info")  { out = LogLevel::Info;  return true; }
			if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
			if (lower == "error") { out = LogLevel::Error; return true; }
			if (lower == "fatal") { out = LogLevel::Fatal; return true; }
			return false;
		}

		// ============================================================================
		// Lifecycle
		// ============================================================================

		Logger& Logger::Instance() {
			static Logger instance;
			return instance;
		}

		Logger::Logger() = default;

		Logger::~Logger() {
			ShutDown();
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

			StopWorker();

			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				CloseLogFile();
				m_cfg = cfg;
				if (m_cfg.maxQueueSize == 0) {
					m_cfg.maxQueueSize = 1;
				}
				m_sinksOpen = true;
				m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
			}

			if (cfg.async) {
				{
					std::lock_guard<std::mutex> lock(m_queueMutex);
					m_queueLimit = std::max<size_t>(cfg.maxQueueSize, 1);
					m_bpPolicy = cfg.bpPolicy;
					m_stop = false;
				}
				m_worker = std::thread(&Logger::WorkerLoop, this);

				std::lock_guard<std::mutex> lock(m_queueMutex);
				m_async = true;
			}

			m_initialized.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

			if (!m_initialized.exchange(false, std::memory_order_acq_rel)) {
				return;
			}

			StopWorker();

			std::lock_guard<std::mutex> lock(m_cfgMutex);
			CloseLogFile();
			m_sinksOpen = false;
		}

		bool Logger::IsInitialized() const noexcept {
			return m_initialized.load(std::memory_order_acquire);
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level, std::memory_order_release);
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			return static_cast<uint8_t>(level) >=
			       static_cast<uint8_t>(m_minLevel.load(std::memory_order_acquire));
		}

		// ============================================================================
		// Logging entry points
		// ============================================================================

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) {
				return {};
			}

			va_list copy;
			va_copy(copy, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
			va_end(copy);

			if (needed <= 0) {
				return {};
			}

			std::vector<char> buf(static_cast<size_t>(needed) + 1);
			std::vsnprintf(buf.data(), buf.size(), fmt, args);
			return std::string(buf.data(), static_cast<size_t>(needed));
		}

		void Logger::LogEx(LogLevel level,
		                   const char* category,
		                   const char* file,
		                   int line,
		                   const char* function,
		                   const char* format, ...) {
			if (!IsInitialized() || !IsEnabled(level)) {
				return;
			}

			va_list args;
			va_start(args, format);
			std::string message = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, message, file, line, function);
		}

		void Logger::LogMessage(LogLevel level,
		                        const char* category,
		                        const std::string& message,
		                        const char* file,
		                        int line,
		                        const char* function) {
			if (!IsInitialized() || !IsEnabled(level)) {
				return;
			}

			LogItem item;
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.file = file ? file : "";
			item.function = function ? function : "";
			item.line = line;
			item.pid = static_cast<uint32_t>(::getpid());
			item.tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
			item.ts = std::chrono::system_clock::now();

			if (!Enqueue(std::move(item))) {
				Write(item);
			}
		}

		void Logger::Flush() {
			{
				std::unique_lock<std::mutex> lock(m_queueMutex);
				m_queueCv.wait(lock, [this] {
					return !m_async || (m_queue.empty() && !m_writing);
				});
			}

			std::lock_guard<std::mutex> lock(m_cfgMutex);
			if (m_file) {
				std::fflush(m_file);
			}
			std::fflush(stderr);
		}

		// ============================================================================
		// Queue
		// ============================================================================

		bool Logger::Enqueue(LogItem&& item) {
			std::unique_lock<std::mutex> lock(m_queueMutex);
			if (!m_async) {
				return false;
			}

			if (m_queue.size() >= m_queueLimit) {
				switch (m_bpPolicy) {
				case LoggerConfig::BackPressurePolicy::Block:
					m_queueCv.wait(lock, [this] {
						return !m_async || m_queue.size() < m_queueLimit;
					});
					if (!m_async) {
						return false;
					}
					break;
				case LoggerConfig::BackPressurePolicy::DropOldest:
					m_queue.pop_front();
					break;
				case LoggerConfig::BackPressurePolicy::DropNewest:
					return true;
				}
			}

			m_queue.push_back(std::move(item));
			lock.unlock();
			m_queueCv.notify_all();
			return true;
		}

		void Logger::WorkerLoop() {
			std::unique_lock<std::mutex> lock(m_queueMutex);
			for (;;) {
				m_queueCv.wait(lock, [this] {
					return m_stop || !m_queue.empty();
				});

				if (m_queue.empty()) {
					return;  // stop requested and queue drained
				}

				LogItem item = std::move(m_queue.front());
				m_queue.pop_front();
				m_writing = true;
				lock.unlock();
				m_queueCv.notify_all();

				Write(item);

				lock.lock();
				m_writing = false;
				m_queueCv.notify_all();
			}
		}

		void Logger::StopWorker() {
			{
				std::lock_guard<std::mutex> lock(m_queueMutex);
				m_async = false;
				m_stop = true;
			}
			m_queueCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}

			// producers switched to synchronous writes once m_async was cleared
			std::deque<LogItem> leftover;
			{
				std::lock_guard<std::mutex> lock(m_queueMutex);
				leftover.swap(m_queue);
				m_stop = false;
			}
			for (const auto& item : leftover) {
				Write(item);
			}
		}

		// ============================================================================
		// Sinks
		// ============================================================================

		void Logger::Write(const LogItem& item) {
			std::lock_guard<std::mutex> lock(m_cfgMutex);
			if (!m_sinksOpen) {
				return;
			}

			const std::string line = m_cfg.jsonLines ? FormatAsJson(item) : FormatPlain(item);

			if (m_cfg.toConsole) {
				WriteConsole(line);
			}
			if (m_cfg.toFile) {
				WriteFile(line);
			}

			if (static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(m_cfg.flushLevel)) {
				if (m_file) {
					std::fflush(m_file);
				}
				std::fflush(stderr);
			}
		}

		void Logger::WriteConsole(const std::string& line) {
			std::fwrite(line.data(), 1, line.size(), stderr);
			std::fputc('\n', stderr);
		}

		void Logger::WriteFile(const std::string& line) {
			OpenLogFileIfNeeded();
			if (!m_file) {
				return;
			}

			RotateIfNeeded(line.size() + 1);
			if (!m_file) {
				return;
			}

			const size_t written = std::fwrite(line.data(), 1, line.size(), m_file);
			std::fputc('\n', m_file);
			m_currentSize += written + 1;
		}

		// ============================================================================
		// Formatting
		// ============================================================================

		std::string Logger::FormatTimestamp(std::chrono::system_clock::time_point ts) const {
			const auto sinceEpoch = ts.time_since_epoch();
			const std::time_t secs = static_cast<std::time_t>(
				std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch).count());
			const long millis = static_cast<long>(
				std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count() % 1000);

			std::tm tmv{};
			if (m_cfg.useUtcTime) {
				::gmtime_r(&secs, &tmv);
			}
			else {
				::localtime_r(&secs, &tmv);
			}

			char buf[40] = {};
			const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmv);
			std::snprintf(buf + n, sizeof(buf) - n, ".%03ld%s", millis, m_cfg.useUtcTime ? "Z" : "");
			return buf;
		}

		std::string Logger::FormatPlain(const LogItem& item) const {
			std::string out;
			out.reserve(item.message.size() + 96);

			out += '[';
			out += FormatTimestamp(item.ts);
			out += "] [";
			out += LogLevelToString(item.level);
			out += ']';

			if (m_cfg.includeProcThreadId) {
				out += " [";
				out += std::to_string(item.pid);
				out += ':';
				out += std::to_string(item.tid);
				out += ']';
			}

			if (!item.category.empty()) {
				out += " [";
				out += item.category;
				out += ']';
			}

			out += ' ';
			out += item.message;

			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				out += " (";
				out += fs::path(item.file).filename().string();
				out += ':';
				out += std::to_string(item.line);
				if (!item.function.empty()) {
					out += ' ';
					out += item.function;
				}
				out += ')';
			}

			return out;
		}

		std::string Logger::EscapeJson(const std::string& s) {
			std::string out;
			out.reserve(s.size() + 8);

			for (char c : s) {
				switch (c) {
				case '"':  out += "\\\""; break;
				case '\\': out += "\\\\"; break;
				case '\b': out += "\\b"; break;
				case '\f': out += "\\f"; break;
				case '\n': out += "\\n"; break;
				case '\r': out += "\\r"; break;
				case '\t': out += "\\t"; break;
				default:
					if (static_cast<unsigned char>(c) < 0x20) {
						char esc[8];
						std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
						out += esc;
					}
					else {
						out += c;
					}
				}
			}
			return out;
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			std::string out = "{\"ts\":\"";
			out += FormatTimestamp(item.ts);
			out += "\",\"level\":\"";
			out += LogLevelToString(item.level);
			out += "\",\"category\":\"";
			out += EscapeJson(item.category);
			out += "\",\"message\":\"";
			out += EscapeJson(item.message);
			out += '"';

			if (m_cfg.includeProcThreadId) {
				out += ",\"pid\":";
				out += std::to_string(item.pid);
				out += ",\"tid\":";
				out += std::to_string(item.tid);
			}

			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				out += ",\"file\":\"";
				out += EscapeJson(item.file);
				out += "\",\"line\":";
				out += std::to_string(item.line);
				out += ",\"function\":\"";
				out += EscapeJson(item.function);
				out += '"';
			}

			out += '}';
			return out;
		}

		// ============================================================================
		// File management
		// ============================================================================

		std::string Logger::BaseLogPath() const {
			return (fs::path(m_cfg.logDirectory) / (m_cfg.baseFileName + ".log")).string();
		}

		std::string Logger::RotatedLogPath(size_t index) const {
			return (fs::path(m_cfg.logDirectory) /
			        (m_cfg.baseFileName + "." + std::to_string(index) + ".log")).string();
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file) {
				return;
			}

			std::error_code ec;
			if (!m_cfg.logDirectory.empty()) {
				fs::create_directories(m_cfg.logDirectory, ec);
				if (ec) {
					std::fprintf(stderr, "[BinSight] cannot create log directory '%s': %s\n",
					             m_cfg.logDirectory.c_str(), ec.message().c_str());
					return;
				}
			}

			const std::string path = BaseLogPath();
			m_file = std::fopen(path.c_str(), "ab");
			if (!m_file) {
				std::fprintf(stderr, "[BinSight] cannot open log file '%s'\n", path.c_str());
				return;
			}

			const auto size = fs::file_size(path, ec);
			m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (m_cfg.maxFileSizeBytes == 0) {
				return;
			}
			if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) {
				return;
			}
			PerformRotation();
		}

		void Logger::PerformRotation() {
			CloseLogFile();

			std::error_code ec;
			if (m_cfg.maxFileCount == 0) {
				fs::remove(BaseLogPath(), ec);
			}
			else {
				fs::remove(RotatedLogPath(m_cfg.maxFileCount), ec);
				for (size_t i = m_cfg.maxFileCount; i > 1; --i) {
					const std::string from = RotatedLogPath(i - 1);
					if (fs::exists(from, ec)) {
						fs::rename(from, RotatedLogPath(i), ec);
					}
				}
				fs::rename(BaseLogPath(), RotatedLogPath(1), ec);
			}

			OpenLogFileIfNeeded();
		}

		void Logger::CloseLogFile() noexcept {
			if (m_file) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}
			m_currentSize = 0;
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const char* category,
		                     const char* file,
		                     int line,
		                     const char* function,
		                     const char* messageOnEnter,
		                     LogLevel level)
			: m_category(category)
			, m_file(file)
			, m_function(function)
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level) {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category, messageOnEnter ? messageOnEnter : "Enter",
				              m_file, m_line, m_function);
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (!lg.IsInitialized() || !lg.IsEnabled(m_level)) {
				return;
			}

			const auto elapsed = std::chrono::steady_clock::now() - m_start;
			const double ms = std::chrono::duration<double, std::milli>(elapsed).count();

			char buf[64];
			std::snprintf(buf, sizeof(buf), "Exit (%.3f ms)", ms);
			lg.LogMessage(m_level, m_category, buf, m_file, m_line, m_function);
		}

	}  // namespace Utils
}  // namespace BinSight
