#include "unit_config.hpp"

#include "log.hpp"


namespace tct::unit {


const UnitConfig& config_for(UnitSystem system)
{
	return system == UnitSystem::us ? us_units : metric_units;
}


bool unit_system_from_name(std::string_view name, UnitSystem& out_system)
{
	if (name == "US" || name == "us") {
		out_system = UnitSystem::us;
		return true;
	}
	if (name == "Metric" || name == "metric" || name == "METRIC") {
		out_system = UnitSystem::metric;
		return true;
	}
	return false;
}


const char* unit_system_name(UnitSystem system)
{
	return system == UnitSystem::us ? "US" : "Metric";
}


double to_model_length(double length, const UnitConfig& config)
{
	return length * config.length_to_model;
}


double to_model_load(double load, const UnitConfig& config, bool from_area)
{
	if (config.system == UnitSystem::us) {
		// psf -> psi
		if (from_area)
			return load / psf_per_psi;
		return load * config.force_to_model;
	}

	// metric loads arrive already in N/mm2
	return load * config.force_to_model;
}


void log_unit_info(const UnitConfig& config)
{
	TCT_INFO(
		log::LogCategory::core,
		"[units] system %s [length %s][force %s][temp %s][story input %s][host code %d]",
		unit_system_name(config.system),
		config.length_unit,
		config.force_unit,
		config.temp_unit,
		config.story_input_unit,
		config.host_unit_code
	);
}


} // tct::unit
