#pragma once

#include <span>
#include <string>
#include <cstdint>

#include "fault.hpp"
#include "story_data.hpp"
#include "table_data.hpp"
#include "unit_config.hpp"
#include "element_data.hpp"
#include "model_host.hpp"


namespace tct::hst {


struct LoadPatterns
{
	std::string dead {"Dead"};
	std::string live {"Live"};
};


struct ElementCount
{
	uint32_t created {0};
	uint32_t failed  {0};
};


struct BuildReport
{
	uint32_t stories          {0};
	uint32_t materials        {0};
	uint32_t frame_sections   {0};
	uint32_t area_sections    {0};
	uint32_t skipped_sections {0};

	ElementCount columns;
	ElementCount walls;
	ElementCount beams;
	ElementCount slabs;

	uint32_t loads_assigned {0};
	uint32_t loads_failed   {0};

	[[nodiscard]] uint32_t failed_elements() const
	{
		return columns.failed + walls.failed + beams.failed + slabs.failed;
	}
};


/*
 * Pushes a run into a ModelHost.
 * Definitions fail fast on the first non-zero status; element creation
 * counts failures and carries on.
 */
class ModelBuilder
{
public:

	ModelBuilder(ModelHost& host, const unit::UnitConfig& units, const LoadPatterns& patterns);

	[[nodiscard]] bool define_units(Fault& out_fault);

	// stories bottom-up in input units; converted here
	[[nodiscard]] bool define_stories(std::span<const sty::Story> stories, double base_elevation, Fault& out_fault);

	[[nodiscard]] bool define_materials(std::span<const tbl::Concrete> concretes, Fault& out_fault);

	[[nodiscard]] bool define_frame_sections(const tbl::SectionTables& tables, Fault& out_fault);

	[[nodiscard]] bool define_area_sections(const tbl::SectionTables& tables, Fault& out_fault);

	void create_elements(const ext::ElementSet& elements);

	// all of the above in order, stopping at the first fatal fault
	[[nodiscard]] bool build(
		std::span<const sty::Story> stories,
		double                      base_elevation,
		const tbl::SectionTables&   tables,
		const ext::ElementSet&      elements,
		Fault&                      out_fault
	);

	[[nodiscard]] const BuildReport& report() const
	{
		return m_report;
	}

private:

	[[nodiscard]] bool check(int32_t status, const char* call, std::string_view entity, Fault& out_fault);

	void assign_slab_load(std::string_view area_name, std::string_view slab_name, std::string_view pattern, double value);

private:

	ModelHost&              m_host;
	const unit::UnitConfig& m_units;
	const LoadPatterns&     m_patterns;

	BuildReport m_report;
};


} // tct::hst
