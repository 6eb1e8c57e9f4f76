#pragma once

#include <cstdint>
#include <string_view>

#include "mtp_memory.hpp"

#include "fault.hpp"
#include "table_data.hpp"
#include "level_registry.hpp"


namespace tct::ext {


enum class Direction : uint8_t
{
	none = 0,
	x    = 1,
	y    = 2
};


enum class ColumnShape : uint8_t
{
	rect = 0,
	circ = 1
};


/*
 * Section records grouped by story through the level registry.
 * Holds indices into the tables it was built from; those must outlive it.
 */
class SectionIndex
{
public:

	// records on unknown levels are dropped with a warning, or fail when strict
	[[nodiscard]] bool rebuild(
		const tbl::SectionTables&  tables,
		const sty::LevelRegistry&  levels,
		bool                       is_strict,
		Fault&                     out_fault
	);

	[[nodiscard]] std::string_view column_section(sty::LevelId level_id, ColumnShape preferred) const;

	[[nodiscard]] std::string_view wall_section(sty::LevelId level_id, Direction direction) const;

	[[nodiscard]] std::string_view beam_section(sty::LevelId level_id, Direction direction) const;

	[[nodiscard]] const tbl::Slab* slab_record(sty::LevelId level_id) const;

private:

	struct LevelSections
	{
		mtp::vault<uint32_t, mtp::default_set> rect_columns;
		mtp::vault<uint32_t, mtp::default_set> circ_columns;
		mtp::vault<uint32_t, mtp::default_set> walls;
		mtp::vault<uint32_t, mtp::default_set> beams;
		mtp::vault<uint32_t, mtp::default_set> slabs;
	};

	[[nodiscard]] const LevelSections* find(sty::LevelId level_id) const;

private:

	const tbl::SectionTables* m_tables {nullptr};

	mtp::vault<LevelSections, mtp::default_set> m_levels;
};


// "X" / "Y" anywhere in the section name, case-insensitive
[[nodiscard]] bool name_has_direction(std::string_view section_name, Direction direction);


} // tct::ext
