#include "pipeline.hpp"

#include <span>

#include "log.hpp"
#include "color.hpp"
#include "plan_io.hpp"
#include "table_io.hpp"


namespace tct {


Pipeline::Pipeline(const RunConfig& config)
	: m_config {config}
{
}


bool Pipeline::load(Fault& out_fault)
{
	TCT_INFO(
		log::LogCategory::core,
		"[pipeline][load] begin... [story table %s]",
		m_config.tables.story.c_str()
	);

	m_is_loaded = false;

	if (!tbl::read_story_table(m_config.tables.story.c_str(), m_stories, out_fault))
		return false;

	if (!tbl::read_section_tables(m_config.tables, m_tables, out_fault))
		return false;

	sty::to_bottom_up(m_stories, m_config.story_order);
	sty::assign_colors(m_stories, make_seeded_colors(m_config.color_seed));

	const std::span<const sty::Story> story_span {m_stories.data(), m_stories.size()};

	if (!sty::build_frame(story_span, m_config.base_elevation, m_frame, out_fault))
		return false;

	if (!m_sections.rebuild(m_tables, m_frame.levels, m_config.is_strict_levels, out_fault))
		return false;

	m_is_loaded = true;

	TCT_INFO(
		log::LogCategory::core,
		"[pipeline][load] ok [stories %zu][base %g][top %g %s]",
		m_frame.story_count(),
		m_frame.elevations[0],
		m_frame.elevations[m_frame.story_count()],
		unit::config_for(m_config.units).story_input_unit
	);

	return true;
}


bool Pipeline::extrude(Fault& out_fault)
{
	TCT_ASSERT_MSG(m_is_loaded, "[Pipeline::extrude] load first");

	const std::span<const sty::Story> story_span {m_stories.data(), m_stories.size()};

	ext::Extruder extruder {
		m_frame,
		story_span,
		m_sections,
		unit::config_for(m_config.units),
		m_config.layers,
		m_config.strategy
	};

	if (m_config.plan_mode == PlanMode::shared) {
		pln::PlanDoc plan_doc;
		if (!pln::read_plan(m_config.plan_path.c_str(), plan_doc, out_fault))
			return false;

		extruder.extrude_building(plan_doc, m_elements);
	}
	else {
		for (uint32_t story_index = 0; story_index < m_stories.size(); ++story_index) {
			const sty::Story& story = m_stories[story_index];

			const std::string& plan_path = story.plan_path.empty() ? m_config.plan_path : story.plan_path;
			if (plan_path.empty()) {
				return raise(out_fault, FaultKind::document_read, 0, "level %s has no plan drawing", story.level.c_str());
			}

			pln::PlanDoc plan_doc;
			if (!pln::read_plan(plan_path.c_str(), plan_doc, out_fault))
				return wrap(out_fault, story.level.c_str());

			extruder.extrude_story(plan_doc, story_index, m_elements);
		}
	}

	m_extrude_stats = extruder.stats();
	return true;
}


bool Pipeline::build(hst::ModelHost& host, Fault& out_fault)
{
	TCT_ASSERT_MSG(m_is_loaded, "[Pipeline::build] load first");

	hst::ModelBuilder builder {host, unit::config_for(m_config.units), m_config.loads};

	const std::span<const sty::Story> story_span {m_stories.data(), m_stories.size()};

	const bool is_ok = builder.build(story_span, m_config.base_elevation, m_tables, m_elements, out_fault);
	m_report = builder.report();
	return is_ok;
}


bool Pipeline::run(hst::ModelHost& host, Fault& out_fault)
{
	return load(out_fault) && extrude(out_fault) && build(host, out_fault);
}


} // tct
