#include "section_index.hpp"

#include <cctype>

#include "log.hpp"
#include "element_data.hpp"


namespace tct::ext {


namespace {


	template<typename Record>
	[[nodiscard]] bool index_records(
		const mtp::vault<Record, mtp::default_set>& records,
		const char*                                 table_name,
		const sty::LevelRegistry&                   levels,
		bool                                        is_strict,
		auto&&                                      slot_for,
		Fault&                                      out_fault
	)
	{
		for (uint32_t record_index = 0; record_index < records.size(); ++record_index) {
			const Record& record = records[record_index];

			const auto level_id = levels.find(record.level);
			if (!level_id) {
				if (is_strict) {
					TCT_ERROR(
						log::LogCategory::extrude,
						"[section_index][rebuild] unknown level [table %s][level %s][section %s]",
						table_name,
						record.level.c_str(),
						record.name.c_str()
					);
					return raise(
						out_fault,
						FaultKind::unknown_level,
						0,
						"%s: section %s references unknown level %s",
						table_name,
						record.name.c_str(),
						record.level.c_str()
					);
				}

				TCT_WARN(
					log::LogCategory::extrude,
					"[section_index][rebuild] unknown level ignored [table %s][level %s][section %s]",
					table_name,
					record.level.c_str(),
					record.name.c_str()
				);
				continue;
			}

			slot_for(*level_id).emplace_back(record_index);
		}
		return true;
	}


	template<typename Record>
	[[nodiscard]] std::string_view resolve_directional(
		const mtp::vault<uint32_t, mtp::default_set>& candidates,
		const mtp::vault<Record, mtp::default_set>&   records,
		Direction                                     direction
	)
	{
		if (candidates.empty())
			return default_section;

		if (candidates.size() == 1 || direction == Direction::none)
			return records[candidates[0]].name;

		for (uint32_t record_index : candidates) {
			const Record& record = records[record_index];
			if (name_has_direction(record.name, direction))
				return record.name;
		}

		return default_section;
	}
}


bool name_has_direction(std::string_view section_name, Direction direction)
{
	char tag = 0;
	switch (direction) {
	case Direction::x: tag = 'X'; break;
	case Direction::y: tag = 'Y'; break;
	default:
		return false;
	}

	for (char c : section_name) {
		if (std::toupper(static_cast<unsigned char>(c)) == tag)
			return true;
	}
	return false;
}


bool SectionIndex::rebuild(
	const tbl::SectionTables&  tables,
	const sty::LevelRegistry&  levels,
	bool                       is_strict,
	Fault&                     out_fault
)
{
	m_tables = &tables;

	m_levels.clear();
	m_levels.resize(levels.size());

	auto& level_sections = m_levels;

	const bool is_ok =
		index_records(tables.rect_columns, "rect_column", levels, is_strict,
			[&](sty::LevelId id) -> auto& { return level_sections[id.value].rect_columns; }, out_fault) &&
		index_records(tables.circ_columns, "circ_column", levels, is_strict,
			[&](sty::LevelId id) -> auto& { return level_sections[id.value].circ_columns; }, out_fault) &&
		index_records(tables.walls, "wall", levels, is_strict,
			[&](sty::LevelId id) -> auto& { return level_sections[id.value].walls; }, out_fault) &&
		index_records(tables.beams, "beam", levels, is_strict,
			[&](sty::LevelId id) -> auto& { return level_sections[id.value].beams; }, out_fault) &&
		index_records(tables.slabs, "slab", levels, is_strict,
			[&](sty::LevelId id) -> auto& { return level_sections[id.value].slabs; }, out_fault);

	if (!is_ok) {
		m_levels.clear();
		m_tables = nullptr;
		return false;
	}

	TCT_DEBUG(
		log::LogCategory::extrude,
		"[section_index][rebuild] ok [levels %zu][rect %zu][circ %zu][walls %zu][beams %zu][slabs %zu]",
		m_levels.size(),
		tables.rect_columns.size(),
		tables.circ_columns.size(),
		tables.walls.size(),
		tables.beams.size(),
		tables.slabs.size()
	);

	return true;
}


const SectionIndex::LevelSections* SectionIndex::find(sty::LevelId level_id) const
{
	if (!m_tables || !level_id.valid() || level_id.value >= m_levels.size())
		return nullptr;

	return &m_levels[level_id.value];
}


std::string_view SectionIndex::column_section(sty::LevelId level_id, ColumnShape preferred) const
{
	const LevelSections* sections = find(level_id);
	if (!sections)
		return default_section;

	const auto& rect = sections->rect_columns;
	const auto& circ = sections->circ_columns;

	if (preferred == ColumnShape::circ) {
		if (!circ.empty())
			return m_tables->circ_columns[circ[0]].name;
		if (!rect.empty())
			return m_tables->rect_columns[rect[0]].name;
	}
	else {
		if (!rect.empty())
			return m_tables->rect_columns[rect[0]].name;
		if (!circ.empty())
			return m_tables->circ_columns[circ[0]].name;
	}

	return default_section;
}


std::string_view SectionIndex::wall_section(sty::LevelId level_id, Direction direction) const
{
	const LevelSections* sections = find(level_id);
	if (!sections)
		return default_section;

	return resolve_directional(sections->walls, m_tables->walls, direction);
}


std::string_view SectionIndex::beam_section(sty::LevelId level_id, Direction direction) const
{
	const LevelSections* sections = find(level_id);
	if (!sections)
		return default_section;

	return resolve_directional(sections->beams, m_tables->beams, direction);
}


const tbl::Slab* SectionIndex::slab_record(sty::LevelId level_id) const
{
	const LevelSections* sections = find(level_id);
	if (!sections || sections->slabs.empty())
		return nullptr;

	return &m_tables->slabs[sections->slabs[0]];
}


} // tct::ext
