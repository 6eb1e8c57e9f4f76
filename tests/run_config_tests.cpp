/*
Run configuration tests.
*/
#include "test_common.hpp"

#include "run_config.hpp"


using namespace tct;


static int test_defaults()
{
	RunConfig config;
	Fault fault;

	EXPECT(parse_run_config(
		"plan = \"plan.dxf\"\n"
		"[tables]\n"
		"story = \"story.csv\"\n",
		"defaults.toml", config, fault), "minimal config parses");

	EXPECT(config.units == unit::UnitSystem::us, "US by default");
	EXPECT(config.strategy == ext::Strategy::story_scoped, "story scoped by default");
	EXPECT(config.plan_mode == PlanMode::shared, "shared plan by default");
	EXPECT(config.story_order == sty::StoryOrder::top_down, "top down by default");
	EXPECT(config.layers.rect_columns == "REC COLS", "default rect layer");
	EXPECT(config.layers.beams_y == "CB Y", "default beam Y layer");
	EXPECT(config.layers.is_slab_closed_only, "closed slabs only by default");
	EXPECT(config.loads.dead == "Dead" && config.loads.live == "Live", "default load patterns");
	EXPECT(config.transcript_path == "tecton_transcript.toml", "default transcript path");
	EXPECT(config.tables.slab.empty(), "unlisted tables skipped");
	return 0;
}


static int test_full_config()
{
	RunConfig config;
	Fault fault;

	EXPECT(parse_run_config(
		"units = \"Metric\"\n"
		"base_elevation = 2\n"
		"strategy = \"whole_building_then_reconcile\"\n"
		"story_order = \"bottom_up\"\n"
		"plan = \"tower.dxf\"\n"
		"color_seed = 7\n"
		"strict_levels = true\n"
		"transcript = \"out/tower.toml\"\n"
		"[tables]\n"
		"story = \"story.csv\"\n"
		"material = \"material.csv\"\n"
		"slab = \"slab.csv\"\n"
		"[layers]\n"
		"walls_x = \"S-WALL-X\"\n"
		"slabs_closed_only = false\n"
		"[loads]\n"
		"dead = \"SDL\"\n"
		"[log]\n"
		"level = \"debug\"\n"
		"file = \"tecton.log\"\n",
		"tower.toml", config, fault), "full config parses");

	EXPECT(config.units == unit::UnitSystem::metric, "metric units");
	EXPECT(test::near(config.base_elevation, 2.0), "integer base elevation accepted");
	EXPECT(config.strategy == ext::Strategy::whole_building_then_reconcile, "reconcile strategy");
	EXPECT(config.story_order == sty::StoryOrder::bottom_up, "bottom up order");
	EXPECT(config.color_seed == 7, "color seed");
	EXPECT(config.is_strict_levels, "strict levels");
	EXPECT(config.tables.concrete == "material.csv", "material table");
	EXPECT(config.layers.walls_x == "S-WALL-X", "renamed layer");
	EXPECT(config.layers.walls == "WALL", "other layers keep defaults");
	EXPECT(!config.layers.is_slab_closed_only, "open slabs allowed");
	EXPECT(config.loads.dead == "SDL" && config.loads.live == "Live", "dead pattern renamed");
	EXPECT(config.log_level == log::LogLevel::debug, "log level");
	EXPECT(config.log_file == "tecton.log", "log file");
	return 0;
}


static int test_rejections()
{
	{
		RunConfig config;
		Fault fault;
		EXPECT(!parse_run_config("plan = \"plan.dxf\"\n", "no_story.toml", config, fault), "story table required");
		EXPECT(fault.kind == FaultKind::config_read, "config fault kind");
		EXPECT(fault.context.find("tables.story") != std::string::npos, "fault names the key");
	}
	{
		RunConfig config;
		Fault fault;
		EXPECT(!parse_run_config("[tables]\nstory = \"story.csv\"\n", "no_plan.toml", config, fault), "shared mode needs a plan");
	}
	{
		RunConfig config;
		Fault fault;
		EXPECT(!parse_run_config(
			"plan_mode = \"per_story\"\n"
			"strategy = \"whole_building_then_reconcile\"\n"
			"[tables]\nstory = \"story.csv\"\n",
			"per_story.toml", config, fault), "per story drawings need story scoped");
	}
	{
		RunConfig config;
		Fault fault;
		EXPECT(!parse_run_config("units = \"imperial\"\nplan = \"p.dxf\"\n[tables]\nstory = \"s.csv\"\n", "units.toml", config, fault), "unknown units");
		EXPECT(fault.context.find("imperial") != std::string::npos, "fault names the value");
	}
	{
		RunConfig config;
		Fault fault;
		EXPECT(!parse_run_config("base_elevation = \"low\"\n", "type.toml", config, fault), "wrong value type");
		EXPECT(fault.context.find("base_elevation") != std::string::npos, "type fault names the key");
	}
	{
		RunConfig config;
		Fault fault;
		EXPECT(!parse_run_config("plan = \n", "broken.toml", config, fault), "syntax error");
		EXPECT(fault.context.find("broken.toml:1") != std::string::npos, "syntax fault names the line");
	}
	return 0;
}


static int test_per_story_without_shared_plan()
{
	RunConfig config;
	Fault fault;

	EXPECT(parse_run_config(
		"plan_mode = \"per_story\"\n"
		"[tables]\n"
		"story = \"story.csv\"\n",
		"per_story.toml", config, fault), "per story mode needs no shared plan");
	EXPECT(config.plan_mode == PlanMode::per_story, "per story mode");
	EXPECT(config.plan_path.empty(), "no shared plan");
	return 0;
}


int main()
{
	test::init();

	if (test_defaults() != 0) return 1;
	if (test_full_config() != 0) return 1;
	if (test_rejections() != 0) return 1;
	if (test_per_story_without_shared_plan() != 0) return 1;
	return 0;
}
