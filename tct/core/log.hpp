#pragma once

#include <array>
#include <mutex>
#include <chrono>
#include <cstdio>
#include <cstddef>
#include <cstdint>
#include <cstdarg>
#include <string_view>


namespace tct::log {


static constexpr size_t LOG_RING_CAPACITY = 256;
static constexpr size_t LOG_TEXT_CAPACITY = 1024;


enum class LogLevel : uint8_t
{
	fatal = 0,
	error,
	warn,
	info,
	debug,
	trace,
	count
};


enum class LogCategory : uint8_t
{
	core    = 0,
	story   = 1,
	plan    = 2,
	extrude = 3,
	table   = 4,
	host    = 5,
	count
};


inline constexpr size_t level_count    = static_cast<size_t>(LogLevel::count);
inline constexpr size_t category_count = static_cast<size_t>(LogCategory::count);


struct LogEntry
{
	uint64_t    sequence {0};
	double      seconds  {0.0};
	LogLevel    level    {LogLevel::info};
	LogCategory category {LogCategory::core};
	char        text[LOG_TEXT_CAPACITY];
};


/* messages seen per category and level, filtered or not */
using LogTally = std::array<std::array<uint32_t, level_count>, category_count>;


namespace detail {


	struct Sink
	{
		LogLevel level     {LogLevel::info};
		FILE*    file      {nullptr};
		bool     is_stderr {true};

		std::chrono::steady_clock::time_point started {std::chrono::steady_clock::now()};

		std::array<LogEntry, LOG_RING_CAPACITY> ring {};
		uint64_t next_sequence {0};
		uint64_t ring_first    {0};

		LogTally tally {};

		std::mutex guard;
	};


	inline Sink& sink()
	{
		static Sink log_sink;
		return log_sink;
	}


	inline void close_file(Sink& log_sink)
	{
		if (!log_sink.file)
			return;

		std::fflush(log_sink.file);
		std::fclose(log_sink.file);
		log_sink.file = nullptr;
	}
}


inline const char* category_name(LogCategory category)
{
	static constexpr const char* names[category_count] = {"core", "story", "plan", "extrude", "table", "host"};

	const size_t index = static_cast<size_t>(category);
	return index < category_count ? names[index] : "core";
}


inline const char* level_name(LogLevel level)
{
	static constexpr const char* names[level_count] = {"FATAL", "ERROR", "WARN", "INFO", "DEBUG", "TRACE"};

	const size_t index = static_cast<size_t>(level);
	return index < level_count ? names[index] : "UNKNOWN";
}


// case-insensitive, so a run file may say "debug"
inline bool level_from_name(std::string_view name, LogLevel& out_level)
{
	for (size_t index = 0; index < level_count; ++index) {
		const std::string_view candidate = level_name(static_cast<LogLevel>(index));
		if (candidate.size() != name.size())
			continue;

		size_t matched = 0;
		while (matched < name.size()) {
			char ch = name[matched];
			if (ch >= 'a' && ch <= 'z')
				ch = static_cast<char>(ch - 'a' + 'A');
			if (ch != candidate[matched])
				break;
			++matched;
		}

		if (matched == name.size()) {
			out_level = static_cast<LogLevel>(index);
			return true;
		}
	}
	return false;
}


inline void initialize(LogLevel level)
{
	detail::Sink& log_sink = detail::sink();
	std::lock_guard<std::mutex> lock(log_sink.guard);

	log_sink.level   = level;
	log_sink.started = std::chrono::steady_clock::now();
	log_sink.tally   = {};
}


inline void shutdown()
{
	detail::Sink& log_sink = detail::sink();
	std::lock_guard<std::mutex> lock(log_sink.guard);

	detail::close_file(log_sink);
}


inline void set_level(LogLevel level)
{
	detail::Sink& log_sink = detail::sink();
	std::lock_guard<std::mutex> lock(log_sink.guard);

	log_sink.level = level;
}


inline void enable_stderr(bool enabled)
{
	detail::Sink& log_sink = detail::sink();
	std::lock_guard<std::mutex> lock(log_sink.guard);

	log_sink.is_stderr = enabled;
}


// truncates an existing file; the previous file, if any, is closed first
inline bool open_file(const char* path)
{
	detail::Sink& log_sink = detail::sink();
	std::lock_guard<std::mutex> lock(log_sink.guard);

	detail::close_file(log_sink);
	log_sink.file = std::fopen(path, "w");
	return log_sink.file != nullptr;
}


inline void ring_clear()
{
	detail::Sink& log_sink = detail::sink();
	std::lock_guard<std::mutex> lock(log_sink.guard);

	log_sink.ring_first = log_sink.next_sequence;
}


/* oldest first; returns how many entries were copied */
inline size_t copy_ring_entries(LogEntry* destination, size_t max_entries)
{
	if (!destination || max_entries == 0)
		return 0;

	detail::Sink& log_sink = detail::sink();
	std::lock_guard<std::mutex> lock(log_sink.guard);

	const uint64_t written = log_sink.next_sequence;

	uint64_t first = log_sink.ring_first;
	if (written - first > LOG_RING_CAPACITY)
		first = written - LOG_RING_CAPACITY;
	if (written - first > max_entries)
		first = written - max_entries;

	size_t entry_count = 0;
	for (uint64_t sequence = first; sequence < written; ++sequence) {
		destination[entry_count++] = log_sink.ring[sequence % LOG_RING_CAPACITY];
	}
	return entry_count;
}


inline LogTally tally()
{
	detail::Sink& log_sink = detail::sink();
	std::lock_guard<std::mutex> lock(log_sink.guard);

	return log_sink.tally;
}


inline void write(LogLevel level, LogCategory category, const char* fmt, ...)
{
	detail::Sink& log_sink = detail::sink();

	thread_local char msg_buffer[LOG_TEXT_CAPACITY];

	va_list args;
	va_start(args, fmt);
	std::vsnprintf(msg_buffer, sizeof(msg_buffer), fmt, args);
	va_end(args);

	std::lock_guard<std::mutex> lock(log_sink.guard);

	const size_t level_index    = static_cast<size_t>(level);
	const size_t category_index = static_cast<size_t>(category);
	if (level_index < level_count && category_index < category_count) {
		++log_sink.tally[category_index][level_index];
	}

	if (static_cast<int>(level) > static_cast<int>(log_sink.level))
		return;

	const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - log_sink.started;

	LogEntry& entry = log_sink.ring[log_sink.next_sequence % LOG_RING_CAPACITY];
	entry.sequence = log_sink.next_sequence++;
	entry.seconds  = elapsed.count();
	entry.level    = level;
	entry.category = category;

	std::snprintf(entry.text, sizeof(entry.text), "[%s][%s]%s", level_name(level), category_name(category), msg_buffer);

	if (log_sink.is_stderr)
		std::fprintf(stderr, "%9.3f %s\n", entry.seconds, entry.text);
	if (log_sink.file)
		std::fprintf(log_sink.file, "%9.3f %s\n", entry.seconds, entry.text);
}

} // tct::log


#define TCT_LOG(level, category, fmt, ...) \
	::tct::log::write(level, category, fmt, ##__VA_ARGS__)

#define TCT_FATAL(category, fmt, ...) TCT_LOG(::tct::log::LogLevel::fatal, category, fmt, ##__VA_ARGS__)
#define TCT_ERROR(category, fmt, ...) TCT_LOG(::tct::log::LogLevel::error, category, fmt, ##__VA_ARGS__)
#define TCT_WARN(category, fmt, ...)  TCT_LOG(::tct::log::LogLevel::warn,  category, fmt, ##__VA_ARGS__)
#define TCT_INFO(category, fmt, ...)  TCT_LOG(::tct::log::LogLevel::info,  category, fmt, ##__VA_ARGS__)
#define TCT_DEBUG(category, fmt, ...) TCT_LOG(::tct::log::LogLevel::debug, category, fmt, ##__VA_ARGS__)
#define TCT_TRACE(category, fmt, ...) TCT_LOG(::tct::log::LogLevel::trace, category, fmt, ##__VA_ARGS__)
