#pragma once

#include <cstdint>
#include <string_view>


namespace tct::unit {


enum class UnitSystem : uint8_t
{
	us     = 0,
	metric = 1
};


struct UnitConfig
{
	UnitSystem system;

	int32_t host_unit_code;

	const char* length_unit;
	const char* force_unit;
	const char* temp_unit;
	const char* story_input_unit;

	double length_to_model;
	double force_to_model;
};


/* lb-in-F, story input in feet */
inline constexpr UnitConfig us_units {
	.system           = UnitSystem::us,
	.host_unit_code   = 1,
	.length_unit      = "in",
	.force_unit       = "lb",
	.temp_unit        = "F",
	.story_input_unit = "ft",
	.length_to_model  = 12.0,
	.force_to_model   = 1.0
};

/* N-mm-C, story input in meters */
inline constexpr UnitConfig metric_units {
	.system           = UnitSystem::metric,
	.host_unit_code   = 9,
	.length_unit      = "mm",
	.force_unit       = "N",
	.temp_unit        = "C",
	.story_input_unit = "m",
	.length_to_model  = 1000.0,
	.force_to_model   = 1.0
};

inline constexpr double psf_per_psi = 144.0;


[[nodiscard]] const UnitConfig& config_for(UnitSystem system);

[[nodiscard]] bool unit_system_from_name(std::string_view name, UnitSystem& out_system);

[[nodiscard]] const char* unit_system_name(UnitSystem system);


[[nodiscard]] double to_model_length(double length, const UnitConfig& config);

[[nodiscard]] double to_model_load(double load, const UnitConfig& config, bool from_area);

void log_unit_info(const UnitConfig& config);


} // tct::unit
