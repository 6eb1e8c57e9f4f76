#pragma once

#include <span>
#include <cstdint>
#include <string_view>

#include "mtp_memory.hpp"

#include "story_ledger.hpp"
#include "unit_config.hpp"
#include "plan_data.hpp"
#include "plan_layers.hpp"
#include "section_index.hpp"
#include "element_data.hpp"
#include "element_factory.hpp"


namespace tct::ext {


enum class Strategy : uint8_t
{
	story_scoped                  = 0,
	whole_building_then_reconcile = 1
};


[[nodiscard]] bool strategy_from_name(std::string_view name, Strategy& out_strategy);

[[nodiscard]] const char* strategy_name(Strategy strategy);


struct ExtrudeStats
{
	uint32_t defaulted_sections {0};
	uint32_t unlabeled_segments {0};
};


/*
 * Turns plan primitives into 3D elements, either band by band against the
 * elevation frame or blind through the height list followed by reconciliation.
 * Everything passed in is borrowed and must outlive the extruder.
 */
class Extruder
{
public:

	Extruder(
		const sty::ElevationFrame& frame,
		std::span<const sty::Story> stories,
		const SectionIndex&        sections,
		const unit::UnitConfig&    units,
		const LayerNames&          layers,
		Strategy                   strategy
	);

	// one drawing shared by every story
	void extrude_building(const pln::PlanDoc& doc, ElementSet& out_elements);

	// one story's own drawing, story_scoped only
	void extrude_story(const pln::PlanDoc& doc, uint32_t story_index, ElementSet& out_elements);

	[[nodiscard]] Strategy strategy() const
	{
		return m_strategy;
	}

	[[nodiscard]] const ExtrudeStats& stats() const
	{
		return m_stats;
	}

private:

	void extrude_band(const PlanLayerSet& layer_set, uint32_t story_index, ElementFactory& factory);

	void reconcile(const PlanLayerSet& layer_set, ElementFactory& factory);

private:

	const sty::ElevationFrame&  m_frame;
	std::span<const sty::Story> m_stories;
	const SectionIndex&         m_sections;
	const unit::UnitConfig&     m_units;
	const LayerNames&           m_layers;

	Strategy     m_strategy;
	ExtrudeStats m_stats;
};


} // tct::ext
