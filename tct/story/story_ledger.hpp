#pragma once

#include <span>
#include <cstdint>
#include <optional>
#include <string_view>

#include "mtp_memory.hpp"

#include "fault.hpp"
#include "color.hpp"
#include "story_data.hpp"
#include "level_registry.hpp"


namespace tct::sty {


enum class ElevationUse : uint8_t
{
	floor   = 0,
	ceiling = 1
};


struct ElevationKey
{
	double   elevation   {0.0};
	uint32_t story_index {0};
};


/*
 * Cumulative story boundaries in story input units.
 * elevations[0] is the base, elevations[i + 1] the ceiling of story i.
 * base_keys and top_keys are sorted by elevation (heights are positive).
 */
struct ElevationFrame
{
	mtp::vault<double,       mtp::default_set> elevations;
	mtp::vault<ElevationKey, mtp::default_set> base_keys;
	mtp::vault<ElevationKey, mtp::default_set> top_keys;

	LevelRegistry levels;

	void clear()
	{
		elevations.clear();
		base_keys.clear();
		top_keys.clear();
		levels.clear();
	}

	[[nodiscard]] size_t story_count() const
	{
		return base_keys.size();
	}

	[[nodiscard]] double floor_at(uint32_t story_index) const
	{
		return elevations[story_index];
	}

	[[nodiscard]] double ceiling_at(uint32_t story_index) const
	{
		return elevations[story_index + 1];
	}

	[[nodiscard]] std::string_view level_at(uint32_t story_index) const
	{
		return levels.name(LevelId {story_index});
	}
};


[[nodiscard]] bool build_frame(
	std::span<const Story> stories,
	double                 base_elevation,
	ElevationFrame&        out_frame,
	Fault&                 out_fault
);

[[nodiscard]] std::optional<double> floor_of(const ElevationFrame& frame, std::string_view level);

[[nodiscard]] std::optional<double> ceiling_of(const ElevationFrame& frame, std::string_view level);

/*
 * exact or near (elevation_epsilon) key on the use's map, then on the other map,
 * then the nearest floor label; empty only for an empty frame
 */
[[nodiscard]] std::optional<uint32_t> story_at_elevation(const ElevationFrame& frame, double elevation, ElevationUse use);

[[nodiscard]] std::optional<std::string_view> level_at_elevation(const ElevationFrame& frame, double elevation, ElevationUse use);


void to_bottom_up(StorySeq& stories, StoryOrder order);

// leaves stories that already carry a color untouched
void assign_colors(StorySeq& stories, const ColorAssigner& assigner);


} // tct::sty
