#include "extruder.hpp"

#include "log.hpp"
#include "math.hpp"
#include "reconciler.hpp"


namespace tct::ext {


namespace {


	[[nodiscard]] bool is_default(std::string_view section)
	{
		return section == default_section;
	}
}


bool strategy_from_name(std::string_view name, Strategy& out_strategy)
{
	if (name == "story_scoped") {
		out_strategy = Strategy::story_scoped;
		return true;
	}
	if (name == "whole_building_then_reconcile") {
		out_strategy = Strategy::whole_building_then_reconcile;
		return true;
	}
	return false;
}


const char* strategy_name(Strategy strategy)
{
	switch (strategy) {
	case Strategy::story_scoped:                  return "story_scoped";
	case Strategy::whole_building_then_reconcile: return "whole_building_then_reconcile";
	}
	return "unknown";
}


Extruder::Extruder(
	const sty::ElevationFrame&  frame,
	std::span<const sty::Story> stories,
	const SectionIndex&         sections,
	const unit::UnitConfig&     units,
	const LayerNames&           layers,
	Strategy                    strategy
)
	: m_frame    {frame}
	, m_stories  {stories}
	, m_sections {sections}
	, m_units    {units}
	, m_layers   {layers}
	, m_strategy {strategy}
{
	TCT_ASSERT_MSG(m_stories.size() == m_frame.story_count(), "[Extruder] stories and frame disagree");
}


void Extruder::extrude_building(const pln::PlanDoc& doc, ElementSet& out_elements)
{
	TCT_INFO(
		log::LogCategory::extrude,
		"[extruder][extrude_building] begin... [strategy %s][stories %zu]",
		strategy_name(m_strategy),
		m_frame.story_count()
	);

	const PlanLayerSet layer_set = collect_layers(doc, m_layers);

	ElementFactory factory {m_units, out_elements};

	if (m_strategy == Strategy::whole_building_then_reconcile) {
		reconcile(layer_set, factory);
	}
	else {
		for (uint32_t story_index = 0; story_index < m_frame.story_count(); ++story_index) {
			extrude_band(layer_set, story_index, factory);
		}
	}

	TCT_INFO(
		log::LogCategory::extrude,
		"[extruder][extrude_building] ok [columns %zu][walls %zu][beams %zu][slabs %zu][defaulted %u]",
		out_elements.columns.size(),
		out_elements.walls.size(),
		out_elements.beams.size(),
		out_elements.slabs.size(),
		m_stats.defaulted_sections
	);
}


void Extruder::extrude_story(const pln::PlanDoc& doc, uint32_t story_index, ElementSet& out_elements)
{
	TCT_ASSERT_MSG(m_strategy == Strategy::story_scoped, "[Extruder::extrude_story] per-story drawings need story_scoped");
	TCT_ASSERT_MSG(story_index < m_frame.story_count(), "[Extruder::extrude_story] story_index out of range");

	TCT_INFO(
		log::LogCategory::extrude,
		"[extruder][extrude_story] begin... [level %.*s][path %s]",
		static_cast<int>(m_frame.level_at(story_index).size()),
		m_frame.level_at(story_index).data(),
		doc.path.c_str()
	);

	const PlanLayerSet layer_set = collect_layers(doc, m_layers);

	ElementFactory factory {m_units, out_elements};
	extrude_band(layer_set, story_index, factory);
}


void Extruder::extrude_band(const PlanLayerSet& layer_set, uint32_t story_index, ElementFactory& factory)
{
	const sty::LevelId     level_id {story_index};
	const std::string_view level = m_frame.level_at(story_index);

	const double z_bottom = m_frame.floor_at(story_index);
	const double z_top    = m_frame.ceiling_at(story_index);

	uint32_t defaulted = 0;

	for (const dvec3& point : layer_set.rect_points) {
		const std::string_view section = m_sections.column_section(level_id, ColumnShape::rect);
		defaulted += is_default(section);
		factory.column(math::drop(point), z_bottom, z_top, section, level);
	}

	for (const dvec3& point : layer_set.circ_points) {
		const std::string_view section = m_sections.column_section(level_id, ColumnShape::circ);
		defaulted += is_default(section);
		factory.column(math::drop(point), z_bottom, z_top, section, level);
	}

	for (const DirectedSegment& wall : layer_set.walls) {
		const std::string_view section = m_sections.wall_section(level_id, wall.direction);
		defaulted += is_default(section);
		factory.wall(math::drop(wall.segment.start), math::drop(wall.segment.end), z_bottom, z_top, section, level);
	}

	for (const DirectedSegment& beam : layer_set.beams) {
		const std::string_view section = m_sections.beam_section(level_id, beam.direction);
		defaulted += is_default(section);
		factory.beam(math::drop(beam.segment.start), math::drop(beam.segment.end), z_top, section, level);
	}

	const tbl::Slab* slab_record = m_sections.slab_record(level_id);
	for (const pln::Polyline3& outline : layer_set.slabs) {
		if (slab_record) {
			factory.slab(outline, z_top, slab_record->name, level, slab_record->sdl, slab_record->live);
		}
		else {
			++defaulted;
			factory.slab(outline, z_top, default_section, level, 0.0, 0.0);
		}
	}

	m_stats.defaulted_sections += defaulted;

	if (defaulted > 0) {
		TCT_DEBUG(
			log::LogCategory::extrude,
			"[extruder][extrude_band] primitives without a section record [level %.*s][count %u]",
			static_cast<int>(level.size()),
			level.data(),
			defaulted
		);
	}
}


void Extruder::reconcile(const PlanLayerSet& layer_set, ElementFactory& factory)
{
	mtp::vault<double, mtp::default_set> heights;
	heights.reserve(m_stories.size());
	for (const sty::Story& story : m_stories) {
		heights.emplace_back(story.height);
	}

	const auto spans = walk_heights(std::span<const double> {heights.data(), heights.size()}, m_frame.floor_at(0));

	Reconciler reconciler {m_frame, m_sections};
	reconciler.run(layer_set, std::span<const BlindSpan> {spans.data(), spans.size()}, factory);

	m_stats.unlabeled_segments += reconciler.unlabeled_count();
}


} // tct::ext
