#include "run_config.hpp"

#define TOML_HEADER_ONLY 1
#define TOML_EXCEPTIONS 0
#define TOML_ENABLE_FORMATTERS 1

#include <toml++/toml.hpp>

#include "file_io.hpp"


namespace tct {


namespace {


	struct ConfigReader
	{
		const char* source_name;
		Fault&      fault;

		[[nodiscard]] bool text(const toml::table& table, const char* key, std::string& out_value)
		{
			const toml::node* node = table.get(key);
			if (!node)
				return true;

			auto value_opt = node->value<std::string>();
			if (!value_opt)
				return raise(fault, FaultKind::config_read, 0, "%s: %s must be a string", source_name, key);

			out_value = *value_opt;
			return true;
		}

		[[nodiscard]] bool real(const toml::table& table, const char* key, double& out_value)
		{
			const toml::node* node = table.get(key);
			if (!node)
				return true;

			// integers are accepted where a real is expected
			auto value_opt = node->value<double>();
			if (!value_opt)
				return raise(fault, FaultKind::config_read, 0, "%s: %s must be a number", source_name, key);

			out_value = *value_opt;
			return true;
		}

		[[nodiscard]] bool flag(const toml::table& table, const char* key, bool& out_value)
		{
			const toml::node* node = table.get(key);
			if (!node)
				return true;

			auto value_opt = node->value<bool>();
			if (!value_opt)
				return raise(fault, FaultKind::config_read, 0, "%s: %s must be true or false", source_name, key);

			out_value = *value_opt;
			return true;
		}

		[[nodiscard]] bool seed(const toml::table& table, const char* key, uint64_t& out_value)
		{
			const toml::node* node = table.get(key);
			if (!node)
				return true;

			auto value_opt = node->value<int64_t>();
			if (!value_opt || *value_opt < 0)
				return raise(fault, FaultKind::config_read, 0, "%s: %s must be a non-negative integer", source_name, key);

			out_value = static_cast<uint64_t>(*value_opt);
			return true;
		}

		[[nodiscard]] bool bad_choice(const char* key, const std::string& value)
		{
			return raise(fault, FaultKind::config_read, 0, "%s: %s has unknown value '%s'", source_name, key, value.c_str());
		}
	};


	[[nodiscard]] bool plan_mode_from_name(std::string_view name, PlanMode& out_mode)
	{
		if (name == "shared") {
			out_mode = PlanMode::shared;
			return true;
		}
		if (name == "per_story") {
			out_mode = PlanMode::per_story;
			return true;
		}
		return false;
	}


	[[nodiscard]] bool story_order_from_name(std::string_view name, sty::StoryOrder& out_order)
	{
		if (name == "top_down") {
			out_order = sty::StoryOrder::top_down;
			return true;
		}
		if (name == "bottom_up") {
			out_order = sty::StoryOrder::bottom_up;
			return true;
		}
		return false;
	}
}


bool parse_run_config(std::string_view text, const char* source_name, RunConfig& out_config, Fault& out_fault)
{
	TCT_ASSERT_MSG(source_name, "source_name == null");

	auto parse_result = toml::parse(text, std::string_view {source_name});
	if (!parse_result) {
		auto error_description = parse_result.error().description();
		const auto& error_begin = parse_result.error().source().begin;
		TCT_ERROR(
			log::LogCategory::core,
			"[run_config][parse_run_config] toml parse fail [path %s][line %u][err %.*s]",
			source_name,
			static_cast<unsigned>(error_begin.line),
			static_cast<int>(error_description.size()),
			error_description.data()
		);
		return raise(
			out_fault,
			FaultKind::config_read,
			0,
			"%s:%u: %.*s",
			source_name,
			static_cast<unsigned>(error_begin.line),
			static_cast<int>(error_description.size()),
			error_description.data()
		);
	}

	const toml::table& root_table = parse_result.table();

	RunConfig config;
	ConfigReader reader {source_name, out_fault};

	{
		std::string units_name = unit::unit_system_name(config.units);
		if (!reader.text(root_table, "units", units_name))
			return false;
		if (!unit::unit_system_from_name(units_name, config.units))
			return reader.bad_choice("units", units_name);
	}

	if (!reader.real(root_table, "base_elevation", config.base_elevation))
		return false;

	{
		std::string strategy_name = ext::strategy_name(config.strategy);
		if (!reader.text(root_table, "strategy", strategy_name))
			return false;
		if (!ext::strategy_from_name(strategy_name, config.strategy))
			return reader.bad_choice("strategy", strategy_name);
	}

	{
		std::string plan_mode_name = "shared";
		if (!reader.text(root_table, "plan_mode", plan_mode_name))
			return false;
		if (!plan_mode_from_name(plan_mode_name, config.plan_mode))
			return reader.bad_choice("plan_mode", plan_mode_name);
	}

	{
		std::string story_order_name = "top_down";
		if (!reader.text(root_table, "story_order", story_order_name))
			return false;
		if (!story_order_from_name(story_order_name, config.story_order))
			return reader.bad_choice("story_order", story_order_name);
	}

	if (!reader.text(root_table, "plan", config.plan_path))
		return false;
	if (!reader.seed(root_table, "color_seed", config.color_seed))
		return false;
	if (!reader.flag(root_table, "strict_levels", config.is_strict_levels))
		return false;
	if (!reader.text(root_table, "transcript", config.transcript_path))
		return false;

	if (const toml::table* tables_table = root_table["tables"].as_table()) {
		tbl::TablePaths& paths = config.tables;
		const bool is_ok =
			reader.text(*tables_table, "story",       paths.story) &&
			reader.text(*tables_table, "material",    paths.concrete) &&
			reader.text(*tables_table, "rect_column", paths.rect_column) &&
			reader.text(*tables_table, "circ_column", paths.circ_column) &&
			reader.text(*tables_table, "wall",        paths.wall) &&
			reader.text(*tables_table, "beam",        paths.beam) &&
			reader.text(*tables_table, "slab",        paths.slab);
		if (!is_ok)
			return false;
	}

	if (const toml::table* layers_table = root_table["layers"].as_table()) {
		ext::LayerNames& layers = config.layers;
		const bool is_ok =
			reader.text(*layers_table, "rect_columns",      layers.rect_columns) &&
			reader.text(*layers_table, "circ_columns",      layers.circ_columns) &&
			reader.text(*layers_table, "walls",             layers.walls) &&
			reader.text(*layers_table, "walls_x",           layers.walls_x) &&
			reader.text(*layers_table, "walls_y",           layers.walls_y) &&
			reader.text(*layers_table, "beams",             layers.beams) &&
			reader.text(*layers_table, "beams_x",           layers.beams_x) &&
			reader.text(*layers_table, "beams_y",           layers.beams_y) &&
			reader.text(*layers_table, "slabs",             layers.slabs) &&
			reader.flag(*layers_table, "slabs_closed_only", layers.is_slab_closed_only);
		if (!is_ok)
			return false;
	}

	if (const toml::table* loads_table = root_table["loads"].as_table()) {
		const bool is_ok =
			reader.text(*loads_table, "dead", config.loads.dead) &&
			reader.text(*loads_table, "live", config.loads.live);
		if (!is_ok)
			return false;
	}

	if (const toml::table* log_table = root_table["log"].as_table()) {
		std::string level_name = log::level_name(config.log_level);
		if (!reader.text(*log_table, "level", level_name))
			return false;
		if (!log::level_from_name(level_name, config.log_level))
			return reader.bad_choice("log.level", level_name);
		if (!reader.text(*log_table, "file", config.log_file))
			return false;
	}

	if (config.tables.story.empty())
		return raise(out_fault, FaultKind::config_read, 0, "%s: tables.story is required", source_name);

	if (config.plan_mode == PlanMode::shared && config.plan_path.empty())
		return raise(out_fault, FaultKind::config_read, 0, "%s: plan is required with plan_mode shared", source_name);

	if (config.plan_mode == PlanMode::per_story && config.strategy != ext::Strategy::story_scoped)
		return raise(out_fault, FaultKind::config_read, 0, "%s: plan_mode per_story needs strategy story_scoped", source_name);

	out_config = std::move(config);

	TCT_INFO(
		log::LogCategory::core,
		"[run_config][parse_run_config] ok [path %s][units %s][strategy %s][plan_mode %s]",
		source_name,
		unit::unit_system_name(out_config.units),
		ext::strategy_name(out_config.strategy),
		out_config.plan_mode == PlanMode::shared ? "shared" : "per_story"
	);

	return true;
}


bool read_run_config(const char* file_path, RunConfig& out_config, Fault& out_fault)
{
	TCT_ASSERT_MSG(file_path, "file_path == null");

	auto text_opt = io::read_text_file(file_path, log::LogCategory::core);
	if (!text_opt)
		return raise(out_fault, FaultKind::config_read, 0, "%s: not a readable file", file_path);

	return parse_run_config(*text_opt, file_path, out_config, out_fault);
}


} // tct
