/*
 * SuffixTrie - Domain Suffix Matching Library
 * Copyright (C) 2026 ShadowStrike Security
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
 * @brief Thread-safe asynchronous logging system for SuffixTrie.
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
 * @note Logging macros are no-ops until Initialize() has been called, so library
 *       code can log unconditionally without forcing a logging setup on callers.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace SuffixTrie {
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

		/// @brief Upper-case level name ("TRACE" ... "FATAL")
		[[nodiscard]] const char* LogLevelToString(LogLevel level) noexcept;

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
			bool toConsole = true;          ///< Output to console (stderr)
			bool toFile = false;            ///< Output to file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool useUtcTime = true;         ///< Use UTC timestamps
			bool includeSrcLocation = true; ///< Include source file/line/function
			bool includeProcThreadId = true;///< Include process/thread IDs

			std::string logDirectory = "logs";           ///< Log file directory
			std::string baseFileName = "SuffixTrie";     ///< Base log file name
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
		 *   ST_LOG_INFO("MyCategory", "Hello %s", "World");
		 *   ST_LOG_ERROR("MyCategory", "Error code: %d", 42);
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
			 */
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize the logger with configuration.
			 *
			 * Calling Initialize() on an initialized logger shuts it down first
			 * (pending messages are written) and then applies the new config.
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Shut down the logger and flush pending messages.
			 *
			 * Stops the async worker thread and writes remaining messages.
			 */
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			void setMinimalLevel(LogLevel level) noexcept;

			/**
			 * @brief Check if a log level is enabled.
			 */
			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a printf-style formatted message with source location.
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

			/**
			 * @brief Flush all pending log messages.
			 *
			 * In async mode, blocks until the worker has drained the queue.
			 */
			void Flush();

			/// @brief Path of the file currently written (empty if file output is off)
			[[nodiscard]] std::string CurrentLogFile() const;

			/// @brief Number of messages discarded by the back-pressure policy
			[[nodiscard]] uint64_t DroppedCount() const noexcept { return m_dropped.load(std::memory_order_relaxed); }

			/**
			 * @brief Format a message with va_list.
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
				std::chrono::system_clock::time_point timestamp{};
			};

			// ========================================================================
			// Internal Methods
			// ========================================================================

			/// @brief ShutDown body; caller holds m_lifecycleMutex
			void ShutDownLocked();

			/// @brief Snapshot of the active configuration
			[[nodiscard]] std::shared_ptr<const LoggerConfig> CurrentConfig() const;

			void WorkerLoop();
			void Enqueue(LogItem&& item, const LoggerConfig& cfg);
			void Write(const LogItem& item);

			void WriteConsole(const std::string& line);
			void WriteFile(const LoggerConfig& cfg, const std::string& line, bool flush);

			[[nodiscard]] static std::string FormatPlain(const LoggerConfig& cfg, const LogItem& item);
			[[nodiscard]] static std::string FormatAsJson(const LoggerConfig& cfg, const LogItem& item);
			[[nodiscard]] static std::string FormatTimestamp(const LoggerConfig& cfg, std::chrono::system_clock::time_point tp);

			void OpenLogFileIfNeeded(const LoggerConfig& cfg);
			void RotateIfNeeded(const LoggerConfig& cfg, size_t nextWriteBytes);
			void PerformRotation(const LoggerConfig& cfg);
			[[nodiscard]] static std::string BaseLogPath(const LoggerConfig& cfg);

			// ========================================================================
			// Member Variables
			// ========================================================================

			/// Flag indicating logger is accepting messages
			std::atomic<bool> m_accepting{ false };

			/// Initialization state
			std::atomic<bool> m_initialized{ false };

			/// Current minimum log level
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			/// Messages dropped by back-pressure
			std::atomic<uint64_t> m_dropped{ 0 };

			/// Active configuration; replaced whole by Initialize()
			std::shared_ptr<const LoggerConfig> m_cfg;
			mutable std::mutex m_cfgMutex;

			/// Serializes Initialize()/ShutDown()
			std::mutex m_lifecycleMutex;

			/// Guards the output sinks
			mutable std::mutex m_outputMutex;

			/// Log message queue for async mode
			std::deque<LogItem> m_queue;

			/// Items taken off the queue but not yet written
			size_t m_inFlight = 0;

			mutable std::mutex m_queueMutex;
			std::condition_variable m_queueCv;
			std::condition_variable m_spaceCv;
			std::condition_variable m_drainedCv;

			std::thread m_worker;
			bool m_stop = false;

			/// Set while an async worker drains m_queue
			bool m_workerActive = false;

			/// Cleared by ShutDown() so late writers cannot reopen the file
			bool m_sinksOpen = false;

			std::ofstream m_file;
			uint64_t m_currentSize = 0;
			std::string m_actualLogPath;
		};

	}  // namespace Utils
}  // namespace SuffixTrie

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// Usage:
//   ST_LOG_INFO("Category", "Message with %d format", value);
//   ST_LOG_ERROR("Category", "Error occurred: %s", errorMsg);
//   ST_LOG_SCOPE("Category");  // Logs function entry/exit with timing
//
// ═══════════════════════════════════════════════════════════════════════════

#define ST_LOG_AT_LEVEL_(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::SuffixTrie::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at TRACE level
#define ST_LOG_TRACE(category, fmt, ...) \
    ST_LOG_AT_LEVEL_(::SuffixTrie::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)

/// @brief Log at DEBUG level
#define ST_LOG_DEBUG(category, fmt, ...) \
    ST_LOG_AT_LEVEL_(::SuffixTrie::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)

/// @brief Log at INFO level
#define ST_LOG_INFO(category, fmt, ...) \
    ST_LOG_AT_LEVEL_(::SuffixTrie::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)

/// @brief Log at WARN level
#define ST_LOG_WARN(category, fmt, ...) \
    ST_LOG_AT_LEVEL_(::SuffixTrie::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)

/// @brief Log at ERROR level
#define ST_LOG_ERROR(category, fmt, ...) \
    ST_LOG_AT_LEVEL_(::SuffixTrie::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)

/// @brief Log at FATAL level
#define ST_LOG_FATAL(category, fmt, ...) \
    ST_LOG_AT_LEVEL_(::SuffixTrie::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

#define ST_LOG_CONCAT_INNER_(a, b) a##b
#define ST_LOG_CONCAT_(a, b) ST_LOG_CONCAT_INNER_(a, b)

/// @brief RAII scope logger - logs function entry and exit with timing
#define ST_LOG_SCOPE(category) \
    ::SuffixTrie::Utils::Logger::Scope ST_LOG_CONCAT_(_st_scope_obj_, __LINE__)( \
        (category), __FILE__, __LINE__, __func__)
