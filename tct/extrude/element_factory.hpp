#pragma once

#include <string>
#include <string_view>

#include "math.hpp"
#include "mtp_memory.hpp"
#include "unit_config.hpp"
#include "plan_data.hpp"
#include "element_data.hpp"


namespace tct::ext {


/*
 * Finalizes element geometry into an ElementSet.
 * Inputs are story input units (ft / m) and input loads (psf / N/mm2);
 * this is the only place they are converted to model units.
 */
class ElementFactory
{
public:

	ElementFactory(const unit::UnitConfig& units, ElementSet& out_elements);

	void column(const dvec2& plan, double z_bottom, double z_top, std::string_view section, std::string_view level);

	void wall(const dvec2& start, const dvec2& end, double z_bottom, double z_top, std::string_view section, std::string_view level);

	void beam(const dvec2& start, const dvec2& end, double z, std::string_view section, std::string_view level);

	// closing vertex equal to the first one is dropped
	void slab(const pln::Polyline3& outline, double z, std::string_view section, std::string_view level, double sdl, double live);

	[[nodiscard]] const unit::UnitConfig& units() const
	{
		return m_units;
	}

private:

	using CounterMap = decltype(mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>());

	[[nodiscard]] dvec3 to_model(const dvec2& plan, double z) const;

	[[nodiscard]] std::string next_name(CounterMap& counters, char prefix, std::string_view level);

private:

	const unit::UnitConfig& m_units;

	ElementSet& m_elements;

	CounterMap m_column_counters {mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>()};
	CounterMap m_wall_counters   {mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>()};
	CounterMap m_beam_counters   {mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>()};
	CounterMap m_slab_counters   {mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>()};
};


} // tct::ext
