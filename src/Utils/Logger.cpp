/*
 * AddonKit - Addon configuration, storage and signalling runtime
 * Copyright (C) 2026 AddonKit Authors
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
#include "Logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <vector>

namespace AddonKit {
	namespace Utils {

		namespace fs = std::filesystem;

		// ============================================================================
		// Level helpers
		// ============================================================================

		bool ParseLogLevel(const std::string& name, LogLevel& out) noexcept {
			std::string lower(name);
			std::transform(lower.begin(), lower.end(), lower.begin(),
				[](unsigned char c) { return static_cast<char>(std::tolower(c)); });

			if (lower == "trace") { out = LogLevel::Trace; return true; }
			if (lower == "debug") { out = LogLevel::Debug; return true; }
			if (lower == "info")  { out = LogLevel::Info;  return true; }
			if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
			if (lower == "error") { out = LogLevel::Error; return true; }
			if (lower == "fatal") { out = LogLevel::Fatal; return true; }
			return false;
		}

		const char* LogLevelName(LogLevel level) noexcept {
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

		// ============================================================================
		// Lifecycle
		// ============================================================================

		Logger& Logger::Instance() {
			static Logger instance;
			return instance;
		}

		Logger::~Logger() {
			ShutDown();
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			if (m_initialized.load(std::memory_order_acquire)) {
				ShutDown();
			}

			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				m_cfg = cfg;
			}
			m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
			m_written.store(0, std::memory_order_release);
			m_stop.store(false, std::memory_order_release);

			if (cfg.toFile) {
				std::lock_guard<std::mutex> lock(m_writeMutex);
				OpenLogFileIfNeeded();
			}

			if (cfg.async) {
				m_worker = std::thread(&Logger::WorkerLoop, this);
			}

			m_initialized.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			if (!m_initialized.exchange(false, std::memory_order_acq_rel)) {
				return;
			}

			{
				std::lock_guard<std::mutex> lock(m_queueMutex);
				m_stop.store(true, std::memory_order_release);
			}
			m_queueCv.notify_all();
			m_spaceCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}

			// Drain anything the worker did not get to
			std::deque<LogItem> remaining;
			{
				std::lock_guard<std::mutex> lock(m_queueMutex);
				remaining.swap(m_queue);
			}
			for (const auto& item : remaining) {
				Write(item);
			}

			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (m_file.is_open()) {
				m_file.flush();
				m_file.close();
			}
			m_currentSize = 0;
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

		uint64_t Logger::WrittenCount() const noexcept {
			return m_written.load(std::memory_order_acquire);
		}

		// ============================================================================
		// Logging entry points
		// ============================================================================

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) return std::string();

			va_list copy;
			va_copy(copy, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
			va_end(copy);

			if (needed <= 0) return std::string();

			std::vector<char> buffer(static_cast<size_t>(needed) + 1);
			std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
			return std::string(buffer.data(), static_cast<size_t>(needed));
		}

		void Logger::LogEx(LogLevel level,
		                   const char* category,
		                   const char* file,
		                   int line,
		                   const char* function,
		                   const char* format, ...) {
			if (!IsEnabled(level)) return;

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
			if (!IsInitialized() || !IsEnabled(level)) return;

			LogItem item;
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.file = file ? file : "";
			item.function = function ? function : "";
			item.line = line;
			item.tsMillis = NowMillisUTC();

			bool async = false;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				async = m_cfg.async;
			}

			if (async) {
				Enqueue(std::move(item));
			}
			else {
				Write(item);
			}
		}

		void Logger::Flush() {
			{
				std::unique_lock<std::mutex> lock(m_queueMutex);
				m_spaceCv.wait(lock, [this] {
					return m_queue.empty() || m_stop.load(std::memory_order_acquire) || !m_worker.joinable();
				});
			}
			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (m_file.is_open()) m_file.flush();
			std::cerr.flush();
		}

		// ============================================================================
		// Async queue
		// ============================================================================

		void Logger::Enqueue(LogItem&& item) {
			std::unique_lock<std::mutex> lock(m_queueMutex);

			size_t maxSize = 0;
			LoggerConfig::BackPressurePolicy policy;
			{
				std::lock_guard<std::mutex> cfgLock(m_cfgMutex);
				maxSize = m_cfg.maxQueueSize;
				policy = m_cfg.bpPolicy;
			}

			if (maxSize > 0 && m_queue.size() >= maxSize) {
				switch (policy) {
				case LoggerConfig::BackPressurePolicy::Block:
					m_spaceCv.wait(lock, [this, maxSize] {
						return m_queue.size() < maxSize || m_stop.load(std::memory_order_acquire);
					});
					break;
				case LoggerConfig::BackPressurePolicy::DropOldest:
					m_queue.pop_front();
					break;
				case LoggerConfig::BackPressurePolicy::DropNewest:
					return;
				}
			}

			m_queue.push_back(std::move(item));
			lock.unlock();
			m_queueCv.notify_one();
		}

		void Logger::WorkerLoop() {
			for (;;) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lock(m_queueMutex);
					m_queueCv.wait(lock, [this] {
						return !m_queue.empty() || m_stop.load(std::memory_order_acquire);
					});
					if (m_queue.empty()) {
						return;
					}
					item = std::move(m_queue.front());
					m_queue.pop_front();
				}
				m_spaceCv.notify_all();
				Write(item);
			}
		}

		// ============================================================================
		// Output
		// ============================================================================

		void Logger::Write(const LogItem& item) {
			LoggerConfig cfg;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				cfg = m_cfg;
			}

			const std::string line = cfg.jsonLines ? FormatAsJson(item) : FormatPlain(item);

			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (cfg.toConsole) {
				WriteConsole(line);
			}
			if (cfg.toFile) {
				WriteFile(line);
				if (static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(cfg.flushLevel) && m_file.is_open()) {
					m_file.flush();
				}
			}
			m_written.fetch_add(1, std::memory_order_acq_rel);
		}

		void Logger::WriteConsole(const std::string& line) {
			std::cerr << line << '\n';
		}

		void Logger::WriteFile(const std::string& line) {
			RotateIfNeeded(line.size() + 1);
			OpenLogFileIfNeeded();
			if (!m_file.is_open()) return;

			m_file << line << '\n';
			m_currentSize += line.size() + 1;
		}

		std::string Logger::FormatPlain(const LogItem& item) const {
			std::string out;
			out.reserve(item.message.size() + 96);
			out += FormatIso8601UTC(item.tsMillis);
			out += " [";
			out += LogLevelName(item.level);
			out += "] [";
			out += item.category;
			out += "] ";
			out += item.message;

			bool withLocation = false;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				withLocation = m_cfg.includeSrcLocation;
			}
			if (withLocation && !item.file.empty()) {
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

		std::string Logger::FormatAsJson(const LogItem& item) const {
			nlohmann::json j;
			j["ts"] = FormatIso8601UTC(item.tsMillis);
			j["level"] = LogLevelName(item.level);
			j["category"] = item.category;
			j["message"] = item.message;
			if (!item.file.empty()) {
				j["file"] = fs::path(item.file).filename().string();
				j["line"] = item.line;
				j["function"] = item.function;
			}
			return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
		}

		// ============================================================================
		// Files and rotation
		// ============================================================================

		std::string Logger::BaseLogPath() const {
			return (fs::path(m_cfg.logDirectory) / (m_cfg.baseFileName + ".log")).string();
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file.is_open()) return;

			std::error_code ec;
			fs::create_directories(m_cfg.logDirectory, ec);
			if (ec) {
				std::cerr << "[Logger] cannot create log directory " << m_cfg.logDirectory
					<< ": " << ec.message() << '\n';
				return;
			}

			const std::string path = BaseLogPath();
			m_file.open(path, std::ios::out | std::ios::app);
			if (!m_file.is_open()) {
				std::cerr << "[Logger] cannot open log file " << path << '\n';
				return;
			}
			m_currentSize = fs::exists(path, ec) ? static_cast<uint64_t>(fs::file_size(path, ec)) : 0;
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (m_cfg.maxFileSizeBytes == 0 || m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) {
				return;
			}

			if (m_file.is_open()) {
				m_file.flush();
				m_file.close();
			}

			// addonkit.log -> addonkit.1.log -> ... -> addonkit.N.log (oldest dropped)
			const fs::path dir(m_cfg.logDirectory);
			std::error_code ec;
			const size_t keep = std::max<size_t>(m_cfg.maxFileCount, 1);
			fs::remove(dir / (m_cfg.baseFileName + "." + std::to_string(keep) + ".log"), ec);
			for (size_t i = keep; i > 1; --i) {
				const fs::path from = dir / (m_cfg.baseFileName + "." + std::to_string(i - 1) + ".log");
				const fs::path to = dir / (m_cfg.baseFileName + "." + std::to_string(i) + ".log");
				if (fs::exists(from, ec)) fs::rename(from, to, ec);
			}
			fs::rename(BaseLogPath(), dir / (m_cfg.baseFileName + ".1.log"), ec);

			m_currentSize = 0;
		}

		// ============================================================================
		// Time
		// ============================================================================

		uint64_t Logger::NowMillisUTC() {
			using namespace std::chrono;
			return static_cast<uint64_t>(
				duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
		}

		std::string Logger::FormatIso8601UTC(uint64_t millis) {
			const std::time_t secs = static_cast<std::time_t>(millis / 1000);
			std::tm tmUtc{};
#ifdef _WIN32
			gmtime_s(&tmUtc, &secs);
#else
			gmtime_r(&secs, &tmUtc);
#endif
			char buf[32];
			std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
				tmUtc.tm_year + 1900, tmUtc.tm_mon + 1, tmUtc.tm_mday,
				tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec,
				static_cast<unsigned>(millis % 1000));
			return buf;
		}

	}  // namespace Utils
}  // namespace AddonKit
