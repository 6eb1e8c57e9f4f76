#pragma once

#include <string>
#include <cstdint>
#include <string_view>

#include "log.hpp"
#include "fault.hpp"
#include "story_data.hpp"
#include "table_io.hpp"
#include "unit_config.hpp"
#include "extruder.hpp"
#include "plan_layers.hpp"
#include "model_builder.hpp"


namespace tct {


enum class PlanMode : uint8_t
{
	shared    = 0,
	per_story = 1
};


struct RunConfig
{
	unit::UnitSystem units          {unit::UnitSystem::us};
	double           base_elevation {0.0};

	ext::Strategy   strategy    {ext::Strategy::story_scoped};
	PlanMode        plan_mode   {PlanMode::shared};
	sty::StoryOrder story_order {sty::StoryOrder::top_down};

	tbl::TablePaths tables;
	std::string     plan_path;

	ext::LayerNames   layers;
	hst::LoadPatterns loads;

	uint64_t color_seed       {0};
	bool     is_strict_levels {false};

	log::LogLevel log_level {log::LogLevel::info};
	std::string   log_file;

	std::string transcript_path {"tecton_transcript.toml"};
};


// paths inside the file are taken as written, relative to the working directory
[[nodiscard]] bool read_run_config(const char* file_path, RunConfig& out_config, Fault& out_fault);

[[nodiscard]] bool parse_run_config(std::string_view text, const char* source_name, RunConfig& out_config, Fault& out_fault);


} // tct
