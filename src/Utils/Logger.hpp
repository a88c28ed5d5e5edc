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
#pragma once
/**
 * @file Logger.hpp
 * @brief Process-wide logging facility for AddonKit.
 *
 * Provides:
 * - Synchronous or asynchronous logging with configurable back-pressure policies
 * - Console (stderr) and file output
 * - Size-based log rotation
 * - JSON Lines output format support
 * - Source location tracking (file, line, function)
 *
 * @note Thread-safe for all public methods.
 * @warning Call Initialize() before logging; the macros are no-ops until then.
 */

#include <atomic>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

namespace AddonKit {
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

		/// @brief Parse "trace", "debug", ... (case-insensitive). Returns false on unknown names.
		[[nodiscard]] bool ParseLogLevel(const std::string& name, LogLevel& out) noexcept;

		[[nodiscard]] const char* LogLevelName(LogLevel level) noexcept;

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

			bool async = false;             ///< Enable asynchronous logging
			bool toConsole = true;          ///< Output to stderr
			bool toFile = false;            ///< Output to file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool includeSrcLocation = true; ///< Include source file/line/function

			std::string logDirectory = "logs";        ///< Log file directory
			std::string baseFileName = "addonkit";    ///< Base log file name
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
			size_t maxFileCount = 5;                  ///< Max rotated files to keep

			LogLevel minimalLevel = LogLevel::Info;   ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;    ///< Level that triggers flush
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Singleton logger with optional async worker.
		 *
		 * Usage:
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.toFile = true;
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   AK_LOG_INFO("Directory", "Opened %s", name.c_str());
		 *
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 */
		class Logger {
		public:
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize (or re-initialize) the logger with configuration.
			 *
			 * Re-initializing flushes and stops the previous configuration first.
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Stop the async worker and flush pending messages.
			 */
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			void setMinimalLevel(LogLevel level) noexcept;

			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a printf-style message with source location.
			 */
			void LogEx(LogLevel level,
			           const char* category,
			           const char* file,
			           int line,
			           const char* function,
			           const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
				__attribute__((format(printf, 7, 8)))
#endif
				;

			/**
			 * @brief Log a pre-formatted message.
			 */
			void LogMessage(LogLevel level,
			                const char* category,
			                const std::string& message,
			                const char* file = nullptr,
			                int line = 0,
			                const char* function = nullptr);

			void Flush();

			/// @brief Number of messages written since Initialize (all targets).
			[[nodiscard]] uint64_t WrittenCount() const noexcept;

			[[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger() = default;
			~Logger();

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::string category;
				std::string message;
				std::string file;
				std::string function;
				int line = 0;
				uint64_t tsMillis = 0;
			};

			void WorkerLoop();
			void Enqueue(LogItem&& item);
			void Write(const LogItem& item);

			void WriteConsole(const std::string& line);
			void WriteFile(const std::string& line);

			[[nodiscard]] std::string FormatPlain(const LogItem& item) const;
			[[nodiscard]] std::string FormatAsJson(const LogItem& item) const;

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			[[nodiscard]] std::string BaseLogPath() const;

			[[nodiscard]] static uint64_t NowMillisUTC();
			[[nodiscard]] static std::string FormatIso8601UTC(uint64_t millis);

			std::atomic<bool> m_initialized{ false };
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };
			std::atomic<uint64_t> m_written{ 0 };

			LoggerConfig m_cfg{};
			mutable std::mutex m_cfgMutex;

			/// Serializes writes to console and file
			std::mutex m_writeMutex;
			std::ofstream m_file;
			uint64_t m_currentSize{ 0 };

			std::deque<LogItem> m_queue;
			std::mutex m_queueMutex;
			std::condition_variable m_queueCv;
			std::condition_variable m_spaceCv;
			std::thread m_worker;
			std::atomic<bool> m_stop{ false };
		};

	}  // namespace Utils
}  // namespace AddonKit

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// Usage:
//   AK_LOG_INFO("Category", "Message with %d format", value);
//   AK_LOG_ERROR("Category", "Error occurred: %s", what.c_str());
//
// ═══════════════════════════════════════════════════════════════════════════

#define AK_LOG_AT(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::AddonKit::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

#define AK_LOG_TRACE(category, fmt, ...) AK_LOG_AT(::AddonKit::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)
#define AK_LOG_DEBUG(category, fmt, ...) AK_LOG_AT(::AddonKit::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)
#define AK_LOG_INFO(category, fmt, ...)  AK_LOG_AT(::AddonKit::Utils::LogLevel::Info,  category, fmt, ##__VA_ARGS__)
#define AK_LOG_WARN(category, fmt, ...)  AK_LOG_AT(::AddonKit::Utils::LogLevel::Warn,  category, fmt, ##__VA_ARGS__)
#define AK_LOG_ERROR(category, fmt, ...) AK_LOG_AT(::AddonKit::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)
#define AK_LOG_FATAL(category, fmt, ...) AK_LOG_AT(::AddonKit::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)
