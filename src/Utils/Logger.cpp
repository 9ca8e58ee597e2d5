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
#include "Logger.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <functional>
#include <vector>

#include <nlohmann/json.hpp>

#ifdef _WIN32
#  include <process.h>
#else
#  include <unistd.h>
#endif

namespace SuffixTrie {
	namespace Utils {

		namespace {

			uint32_t CurrentProcessId() noexcept {
#ifdef _WIN32
				return static_cast<uint32_t>(::_getpid());
#else
				return static_cast<uint32_t>(::getpid());
#endif
			}

			uint64_t CurrentThreadId() noexcept {
				return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
			}

			const char* BaseName(const char* path) noexcept {
				if (!path) return "";
				const char* base = path;
				for (const char* p = path; *p; ++p) {
					if (*p == '/' || *p == '\\') base = p + 1;
				}
				return base;
			}

		}  // namespace

		const char* LogLevelToString(LogLevel level) noexcept {
			switch (level) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			default:              return "UNKNOWN";
			}
		}

		// ============================================================================
		// Lifecycle
		// ============================================================================

		Logger& Logger::Instance() {
			static Logger instance;
			return instance;
		}

		Logger::Logger()
			: m_cfg(std::make_shared<const LoggerConfig>()) {
		}

		Logger::~Logger() {
			ShutDown();
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
			ShutDownLocked();

			auto next = std::make_shared<const LoggerConfig>(cfg);
			{
				// Config and file sink change together under the output lock
				std::lock_guard<std::mutex> out(m_outputMutex);
				{
					std::lock_guard<std::mutex> c(m_cfgMutex);
					m_cfg = next;
				}
				m_currentSize = 0;
				m_actualLogPath.clear();
				m_sinksOpen = true;
				if (next->toFile) {
					OpenLogFileIfNeeded(*next);
				}
			}

			m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
			m_dropped.store(0, std::memory_order_relaxed);

			{
				std::lock_guard<std::mutex> q(m_queueMutex);
				m_queue.clear();
				m_inFlight = 0;
				m_stop = false;
				m_workerActive = cfg.async;
			}
			m_spaceCv.notify_all();

			if (cfg.async) {
				m_worker = std::thread(&Logger::WorkerLoop, this);
			}

			m_accepting.store(true, std::memory_order_release);
			m_initialized.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
			ShutDownLocked();
		}

		void Logger::ShutDownLocked() {
			if (!m_initialized.load(std::memory_order_acquire)) {
				return;
			}

			m_accepting.store(false, std::memory_order_release);

			{
				std::lock_guard<std::mutex> q(m_queueMutex);
				m_stop = true;
			}
			if (m_worker.joinable()) {
				m_queueCv.notify_all();
				m_spaceCv.notify_all();
				m_worker.join();
			}

			{
				std::lock_guard<std::mutex> out(m_outputMutex);
				m_sinksOpen = false;
				std::fflush(stderr);
				if (m_file.is_open()) {
					m_file.flush();
					m_file.close();
				}
			}

			m_initialized.store(false, std::memory_order_release);
		}

		bool Logger::IsInitialized() const noexcept {
			return m_initialized.load(std::memory_order_acquire);
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level, std::memory_order_release);
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			return static_cast<uint8_t>(level) >= static_cast<uint8_t>(m_minLevel.load(std::memory_order_acquire));
		}

		std::shared_ptr<const LoggerConfig> Logger::CurrentConfig() const {
			std::lock_guard<std::mutex> c(m_cfgMutex);
			return m_cfg;
		}

		std::string Logger::CurrentLogFile() const {
			std::lock_guard<std::mutex> out(m_outputMutex);
			return m_actualLogPath;
		}

		// ============================================================================
		// Logging entry points
		// ============================================================================

		void Logger::LogEx(LogLevel level,
		                   const char* category,
		                   const char* file,
		                   int line,
		                   const char* function,
		                   const char* format, ...) {
			if (!IsEnabled(level) || !m_accepting.load(std::memory_order_acquire)) {
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
			if (!IsEnabled(level) || !m_accepting.load(std::memory_order_acquire)) {
				return;
			}

			LogItem item;
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.file = BaseName(file);
			item.function = function ? function : "";
			item.line = line;
			item.pid = CurrentProcessId();
			item.tid = CurrentThreadId();
			item.timestamp = std::chrono::system_clock::now();

			const auto cfg = CurrentConfig();
			if (cfg->async) {
				Enqueue(std::move(item), *cfg);
			}
			else {
				Write(item);
			}
		}

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

			std::vector<char> buffer(static_cast<size_t>(needed) + 1);
			std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
			return std::string(buffer.data(), static_cast<size_t>(needed));
		}

		// ============================================================================
		// Async queue
		// ============================================================================

		void Logger::Enqueue(LogItem&& item, const LoggerConfig& cfg) {
			{
				std::unique_lock<std::mutex> lock(m_queueMutex);
				if (m_stop) {
					return;
				}
				if (!m_workerActive) {
					// Re-initialized to sync mode after cfg was taken
					lock.unlock();
					Write(item);
					return;
				}

				if (m_queue.size() >= cfg.maxQueueSize) {
					switch (cfg.bpPolicy) {
					case LoggerConfig::BackPressurePolicy::Block:
						m_spaceCv.wait(lock, [this, &cfg] { return m_stop || m_queue.size() < cfg.maxQueueSize; });
						if (m_stop) {
							return;
						}
						break;
					case LoggerConfig::BackPressurePolicy::DropOldest:
						if (!m_queue.empty()) {
							m_queue.pop_front();
						}
						m_dropped.fetch_add(1, std::memory_order_relaxed);
						break;
					case LoggerConfig::BackPressurePolicy::DropNewest:
						m_dropped.fetch_add(1, std::memory_order_relaxed);
						return;
					}
				}

				m_queue.push_back(std::move(item));
			}
			m_queueCv.notify_one();
		}

		void Logger::WorkerLoop() {
			for (;;) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lock(m_queueMutex);
					m_queueCv.wait(lock, [this] { return m_stop || !m_queue.empty(); });
					if (m_queue.empty()) {
						// m_stop set and nothing left to write
						m_drainedCv.notify_all();
						return;
					}
					item = std::move(m_queue.front());
					m_queue.pop_front();
					++m_inFlight;
				}
				m_spaceCv.notify_one();

				Write(item);

				{
					std::lock_guard<std::mutex> lock(m_queueMutex);
					--m_inFlight;
					if (m_queue.empty() && m_inFlight == 0) {
						m_drainedCv.notify_all();
					}
				}
			}
		}

		void Logger::Flush() {
			if (!m_initialized.load(std::memory_order_acquire)) {
				return;
			}

			{
				std::unique_lock<std::mutex> lock(m_queueMutex);
				if (m_workerActive) {
					m_drainedCv.wait(lock, [this] { return m_stop || (m_queue.empty() && m_inFlight == 0); });
				}
			}

			std::lock_guard<std::mutex> out(m_outputMutex);
			std::fflush(stderr);
			if (m_file.is_open()) {
				m_file.flush();
			}
		}

		// ============================================================================
		// Formatting
		// ============================================================================

		std::string Logger::FormatTimestamp(const LoggerConfig& cfg, std::chrono::system_clock::time_point tp) {
			const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
			const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
			const std::time_t t = std::chrono::system_clock::to_time_t(tp);

			std::tm tmv{};
#ifdef _WIN32
			if (cfg.useUtcTime) gmtime_s(&tmv, &t); else localtime_s(&tmv, &t);
#else
			if (cfg.useUtcTime) gmtime_r(&t, &tmv); else localtime_r(&t, &tmv);
#endif

			char buf[40] = {};
			std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03d%s",
				tmv.tm_year + 1900, tmv.tm_mon + 1, tmv.tm_mday,
				tmv.tm_hour, tmv.tm_min, tmv.tm_sec,
				static_cast<int>(ms), cfg.useUtcTime ? "Z" : "");
			return buf;
		}

		std::string Logger::FormatPlain(const LoggerConfig& cfg, const LogItem& item) {
			std::string line;
			line.reserve(item.message.size() + 96);

			line += '[';
			line += FormatTimestamp(cfg, item.timestamp);
			line += "] [";
			line += LogLevelToString(item.level);
			line += ']';

			if (cfg.includeProcThreadId) {
				line += " [";
				line += std::to_string(item.pid);
				line += ':';
				line += std::to_string(item.tid);
				line += ']';
			}

			if (!item.category.empty()) {
				line += " [";
				line += item.category;
				line += ']';
			}

			line += ' ';
			line += item.message;

			if (cfg.includeSrcLocation && !item.file.empty()) {
				line += " (";
				line += item.file;
				line += ':';
				line += std::to_string(item.line);
				if (!item.function.empty()) {
					line += ' ';
					line += item.function;
				}
				line += ')';
			}
			return line;
		}

		std::string Logger::FormatAsJson(const LoggerConfig& cfg, const LogItem& item) {
			nlohmann::json j;
			j["ts"] = FormatTimestamp(cfg, item.timestamp);
			j["level"] = LogLevelToString(item.level);
			j["category"] = item.category;
			j["message"] = item.message;
			if (cfg.includeProcThreadId) {
				j["pid"] = item.pid;
				j["tid"] = item.tid;
			}
			if (cfg.includeSrcLocation && !item.file.empty()) {
				j["file"] = item.file;
				j["line"] = item.line;
				j["function"] = item.function;
			}
			// Invalid UTF-8 in caller-provided text must not throw out of the logger
			return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
		}

		// ============================================================================
		// Sinks
		// ============================================================================

		void Logger::Write(const LogItem& item) {
			// Initialize publishes under m_outputMutex, so cfg matches the open file
			std::lock_guard<std::mutex> out(m_outputMutex);
			if (!m_sinksOpen) {
				return;
			}
			const auto cfg = CurrentConfig();

			const std::string line = cfg->jsonLines ? FormatAsJson(*cfg, item) : FormatPlain(*cfg, item);
			const bool flush = static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(cfg->flushLevel);

			if (cfg->toConsole) {
				WriteConsole(line);
				if (flush) std::fflush(stderr);
			}
			if (cfg->toFile) {
				WriteFile(*cfg, line, flush);
			}
		}

		void Logger::WriteConsole(const std::string& line) {
			std::fputs(line.c_str(), stderr);
			std::fputc('\n', stderr);
		}

		void Logger::WriteFile(const LoggerConfig& cfg, const std::string& line, bool flush) {
			OpenLogFileIfNeeded(cfg);
			if (!m_file.is_open()) {
				return;
			}

			RotateIfNeeded(cfg, line.size() + 1);
			if (!m_file.is_open()) {
				return;
			}

			m_file << line << '\n';
			m_currentSize += line.size() + 1;
			if (flush) {
				m_file.flush();
			}
		}

		std::string Logger::BaseLogPath(const LoggerConfig& cfg) {
			std::filesystem::path p(cfg.logDirectory);
			p /= cfg.baseFileName + ".log";
			return p.string();
		}

		void Logger::OpenLogFileIfNeeded(const LoggerConfig& cfg) {
			if (m_file.is_open()) {
				return;
			}

			std::error_code ec;
			if (!cfg.logDirectory.empty()) {
				std::filesystem::create_directories(cfg.logDirectory, ec);
				if (ec) {
					std::fprintf(stderr, "SuffixTrie logger: cannot create log directory '%s': %s\n",
						cfg.logDirectory.c_str(), ec.message().c_str());
					return;
				}
			}

			m_actualLogPath = BaseLogPath(cfg);
			m_file.open(m_actualLogPath, std::ios::out | std::ios::app | std::ios::binary);
			if (!m_file.is_open()) {
				std::fprintf(stderr, "SuffixTrie logger: cannot open log file '%s'\n", m_actualLogPath.c_str());
				return;
			}

			const auto size = std::filesystem::file_size(m_actualLogPath, ec);
			m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
		}

		void Logger::RotateIfNeeded(const LoggerConfig& cfg, size_t nextWriteBytes) {
			if (cfg.maxFileSizeBytes == 0) {
				return;
			}
			if (m_currentSize == 0 || m_currentSize + nextWriteBytes <= cfg.maxFileSizeBytes) {
				return;
			}
			PerformRotation(cfg);
		}

		void Logger::PerformRotation(const LoggerConfig& cfg) {
			m_file.flush();
			m_file.close();

			const std::string base = BaseLogPath(cfg);
			std::error_code ec;

			if (cfg.maxFileCount == 0) {
				std::filesystem::remove(base, ec);
			}
			else {
				// base.log.N is the oldest kept file
				std::filesystem::remove(base + "." + std::to_string(cfg.maxFileCount), ec);
				for (size_t i = cfg.maxFileCount; i > 1; --i) {
					const std::string from = base + "." + std::to_string(i - 1);
					if (std::filesystem::exists(from, ec)) {
						std::filesystem::rename(from, base + "." + std::to_string(i), ec);
					}
				}
				std::filesystem::rename(base, base + ".1", ec);
				if (ec) {
					std::fprintf(stderr, "SuffixTrie logger: rotation failed: %s\n", ec.message().c_str());
				}
			}

			m_currentSize = 0;
			OpenLogFileIfNeeded(cfg);
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
				lg.LogMessage(m_level, m_category, messageOnEnter ? messageOnEnter : "Enter", m_file, m_line, m_function);
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
					std::chrono::steady_clock::now() - m_start).count();
				lg.LogMessage(m_level, m_category, "Exit (" + std::to_string(us) + " us)", m_file, m_line, m_function);
			}
		}

	}  // namespace Utils
}  // namespace SuffixTrie
