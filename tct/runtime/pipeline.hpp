#pragma once

#include "fault.hpp"
#include "story_data.hpp"
#include "story_ledger.hpp"
#include "table_data.hpp"
#include "section_index.hpp"
#include "element_data.hpp"
#include "extruder.hpp"
#include "model_host.hpp"
#include "model_builder.hpp"
#include "run_config.hpp"


namespace tct {


/*
 * One run: tables -> stories -> frame -> plans -> elements -> host.
 * The section index points into m_tables, so a pipeline stays where it was built.
 */
class Pipeline
{
public:

	explicit Pipeline(const RunConfig& config);

	Pipeline(const Pipeline&) = delete;
	Pipeline& operator=(const Pipeline&) = delete;

	// tables, story order, colors, frame and section index
	[[nodiscard]] bool load(Fault& out_fault);

	[[nodiscard]] bool extrude(Fault& out_fault);

	[[nodiscard]] bool build(hst::ModelHost& host, Fault& out_fault);

	[[nodiscard]] bool run(hst::ModelHost& host, Fault& out_fault);

	[[nodiscard]] const sty::StorySeq& stories() const
	{
		return m_stories;
	}

	[[nodiscard]] const sty::ElevationFrame& frame() const
	{
		return m_frame;
	}

	[[nodiscard]] const tbl::SectionTables& tables() const
	{
		return m_tables;
	}

	[[nodiscard]] const ext::ElementSet& elements() const
	{
		return m_elements;
	}

	[[nodiscard]] const ext::ExtrudeStats& extrude_stats() const
	{
		return m_extrude_stats;
	}

	[[nodiscard]] const hst::BuildReport& report() const
	{
		return m_report;
	}

private:

	const RunConfig& m_config;

	sty::StorySeq       m_stories;
	tbl::SectionTables  m_tables;
	sty::ElevationFrame m_frame;
	ext::SectionIndex   m_sections;
	ext::ElementSet     m_elements;

	ext::ExtrudeStats m_extrude_stats;
	hst::BuildReport  m_report;

	bool m_is_loaded {false};
};


} // tct
