#pragma once

#include <string>
#include <cstdint>
#include <optional>

#include "mtp_memory.hpp"


namespace tct::sty {


inline constexpr const char* no_similar_story = "None";


struct Story
{
	std::string level;
	double      height {0.0};

	bool        is_master     {false};
	std::string similar_to    {no_similar_story};
	bool        splice_above  {false};
	double      splice_height {0.0};

	std::optional<uint32_t> color;

	// per-story workflow only
	std::string plan_path;
};


enum class StoryOrder : uint8_t
{
	bottom_up = 0,
	top_down  = 1
};


using StorySeq = mtp::vault<Story, mtp::default_set>;


} // tct::sty
