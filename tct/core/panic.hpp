#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstddef>

#include "log.hpp"


namespace tct::fail {


/* ring entries replayed under a panic banner */
inline constexpr size_t panic_tail_count = 8;


namespace {


	inline void print_banner(const char* title)
	{
		std::fprintf(stderr, "\n---- tecton %s ", title);
		for (int i = 0; i < 48; ++i)
			std::fputc('-', stderr);
		std::fputc('\n', stderr);
	}


	// the last few messages usually name the story or section being processed
	inline void print_log_tail()
	{
		static log::LogEntry tail_entries[panic_tail_count];

		const size_t entry_count = log::copy_ring_entries(tail_entries, panic_tail_count);
		if (entry_count == 0)
			return;

		std::fprintf(stderr, "  last messages:\n");
		for (size_t i = 0; i < entry_count; ++i) {
			std::fprintf(stderr, "  %9.3f %s\n", tail_entries[i].seconds, tail_entries[i].text);
		}
	}
}


[[noreturn]] inline void panic(const char* message, const char* file, int line)
{
	print_banner("panic");
	std::fprintf(stderr, "  reason   %s\n", message ? message : "(none)");
	std::fprintf(stderr, "  where    %s:%d\n", file, line);
	print_log_tail();
	print_banner("abort");
	std::fflush(stderr);

	TCT_FATAL(log::LogCategory::core, "[panic] %s [%s:%d]", message ? message : "(none)", file, line);
	log::shutdown();

	std::abort();
}


} // tct::fail


#define TCT_PANIC(message) \
	::tct::fail::panic(message, __FILE__, __LINE__)


#ifndef NDEBUG

#define TCT_ASSERT(expr) \
	do { \
		if (!(expr)) \
			::tct::fail::panic("assertion failed: " #expr, __FILE__, __LINE__); \
	} while (0)

#define TCT_ASSERT_MSG(expr, message) \
	do { \
		if (!(expr)) \
			::tct::fail::panic(message, __FILE__, __LINE__); \
	} while (0)

#else

#define TCT_ASSERT(expr) ((void)0)
#define TCT_ASSERT_MSG(expr, message) ((void)0)

#endif
