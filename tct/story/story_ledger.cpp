#include "story_ledger.hpp"

#include <cmath>
#include <algorithm>

#include "log.hpp"
#include "math.hpp"


namespace tct::sty {


namespace {


	[[nodiscard]] const ElevationKey* find_key(
		const mtp::vault<ElevationKey, mtp::default_set>& keys,
		double                                             elevation
	)
	{
		if (keys.empty())
			return nullptr;

		auto it = std::lower_bound(keys.begin(), keys.end(), elevation, [](const ElevationKey& key, double value)
		{
			return key.elevation < value;
		});

		if (it != keys.end() && it->elevation == elevation)
			return &(*it);

		const ElevationKey* nearest_key = nullptr;
		double nearest_distance = math::elevation_epsilon;

		if (it != keys.end()) {
			const double distance = std::abs(it->elevation - elevation);
			if (distance <= nearest_distance) {
				nearest_key      = &(*it);
				nearest_distance = distance;
			}
		}
		if (it != keys.begin()) {
			auto it_prev = it - 1;
			const double distance = std::abs(it_prev->elevation - elevation);
			if (distance <= nearest_distance) {
				nearest_key = &(*it_prev);
			}
		}

		return nearest_key;
	}


	// floor key closest to the elevation, regardless of distance; lower key wins a tie
	[[nodiscard]] const ElevationKey* nearest_floor_key(const ElevationFrame& frame, double elevation)
	{
		const ElevationKey* nearest_key = nullptr;
		double nearest_distance = 0.0;

		for (const ElevationKey& key : frame.base_keys) {
			const double distance = std::abs(key.elevation - elevation);
			if (!nearest_key || distance < nearest_distance) {
				nearest_key      = &key;
				nearest_distance = distance;
			}
		}
		return nearest_key;
	}
}


bool build_frame(
	std::span<const Story> stories,
	double                 base_elevation,
	ElevationFrame&        out_frame,
	Fault&                 out_fault
)
{
	out_frame.clear();

	if (stories.empty()) {
		TCT_ERROR(
			log::LogCategory::story,
			"[story_ledger][build_frame] empty story list"
		);
		return raise(out_fault, FaultKind::empty_story_list, 0, "story list is empty");
	}

	LevelRegistry::NameMap seen_levels = mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>();
	seen_levels.reserve(stories.size());

	for (uint32_t i = 0; i < stories.size(); ++i) {
		const Story& story = stories[i];

		if (story.level.empty()) {
			return raise(out_fault, FaultKind::invalid_story, 0, "story %u has no level name", i);
		}
		if (!std::isfinite(story.height) || story.height <= 0.0) {
			return raise(out_fault, FaultKind::invalid_story, 0, "level %s height %g is not positive", story.level.c_str(), story.height);
		}
		if (seen_levels.find(story.level) != seen_levels.end()) {
			return raise(out_fault, FaultKind::invalid_story, 0, "level %s is listed twice", story.level.c_str());
		}
		seen_levels[story.level] = i;
	}

	out_frame.elevations.reserve(stories.size() + 1);
	out_frame.base_keys.reserve(stories.size());
	out_frame.top_keys.reserve(stories.size());

	double story_base_elevation = base_elevation;
	out_frame.elevations.emplace_back(story_base_elevation);

	for (uint32_t i = 0; i < stories.size(); ++i) {
		const double story_top_elevation = story_base_elevation + stories[i].height;

		out_frame.elevations.emplace_back(story_top_elevation);
		out_frame.base_keys.emplace_back(ElevationKey {.elevation = story_base_elevation, .story_index = i});
		out_frame.top_keys.emplace_back(ElevationKey {.elevation = story_top_elevation, .story_index = i});

		story_base_elevation = story_top_elevation;
	}

	out_frame.levels.rebuild(stories);

	TCT_DEBUG(
		log::LogCategory::story,
		"[story_ledger][build_frame] ok [stories %zu][base %g][top %g]",
		out_frame.story_count(),
		out_frame.elevations[0],
		out_frame.elevations[out_frame.story_count()]
	);

	return true;
}


std::optional<double> floor_of(const ElevationFrame& frame, std::string_view level)
{
	auto level_id = frame.levels.find(level);
	if (!level_id)
		return std::nullopt;

	return frame.floor_at(level_id->value);
}


std::optional<double> ceiling_of(const ElevationFrame& frame, std::string_view level)
{
	auto level_id = frame.levels.find(level);
	if (!level_id)
		return std::nullopt;

	return frame.ceiling_at(level_id->value);
}


std::optional<uint32_t> story_at_elevation(const ElevationFrame& frame, double elevation, ElevationUse use)
{
	const auto& primary_keys   = use == ElevationUse::floor ? frame.base_keys : frame.top_keys;
	const auto& secondary_keys = use == ElevationUse::floor ? frame.top_keys  : frame.base_keys;

	if (const ElevationKey* key = find_key(primary_keys, elevation))
		return key->story_index;

	if (const ElevationKey* key = find_key(secondary_keys, elevation))
		return key->story_index;

	if (const ElevationKey* key = nearest_floor_key(frame, elevation))
		return key->story_index;

	return std::nullopt;
}


std::optional<std::string_view> level_at_elevation(const ElevationFrame& frame, double elevation, ElevationUse use)
{
	auto story_index = story_at_elevation(frame, elevation, use);
	if (!story_index)
		return std::nullopt;

	return frame.level_at(*story_index);
}


void to_bottom_up(StorySeq& stories, StoryOrder order)
{
	if (order == StoryOrder::top_down) {
		std::reverse(stories.begin(), stories.end());
	}
}


void assign_colors(StorySeq& stories, const ColorAssigner& assigner)
{
	TCT_ASSERT_MSG(assigner, "[assign_colors] assigner == null");

	for (uint32_t i = 0; i < stories.size(); ++i) {
		Story& story = stories[i];
		if (!story.color) {
			story.color = assigner(story.level, i) & rgb_mask;
		}
	}
}


} // tct::sty
