#pragma once

#include <string>
#include <cstdint>
#include <cstdarg>
#include <cstdio>


namespace tct {


enum class FaultKind : uint8_t
{
	none = 0,
	empty_story_list,
	invalid_story,
	document_read,
	table_read,
	config_read,
	unknown_level,
	host_status
};


struct Fault
{
	FaultKind   kind    {FaultKind::none};
	int32_t     status  {0};
	std::string context;
};


inline const char* fault_name(FaultKind kind)
{
	switch (kind) {
	case FaultKind::none:             return "none";
	case FaultKind::empty_story_list: return "EmptyStoryListError";
	case FaultKind::invalid_story:    return "InvalidStoryError";
	case FaultKind::document_read:    return "DocumentReadError";
	case FaultKind::table_read:       return "TableReadError";
	case FaultKind::config_read:      return "ConfigReadError";
	case FaultKind::unknown_level:    return "UnknownLevelError";
	case FaultKind::host_status:      return "HostStatusError";
	}
	return "UnknownError";
}


inline bool raise(Fault& out_fault, FaultKind kind, int32_t status, const char* fmt, ...)
{
	char context_buffer[512];

	va_list args;
	va_start(args, fmt);
	std::vsnprintf(context_buffer, sizeof(context_buffer), fmt, args);
	va_end(args);

	out_fault.kind    = kind;
	out_fault.status  = status;
	out_fault.context = context_buffer;

	return false;
}


/* prefix the context of a fault raised deeper down with the caller's entity */
inline bool wrap(Fault& fault, const char* prefix)
{
	fault.context = std::string {prefix} + ": " + fault.context;
	return false;
}

} // tct
