#pragma once

#include <string>
#include <cstdint>
#include <string_view>

#include "mtp_memory.hpp"

#include "fault.hpp"
#include "story_data.hpp"
#include "table_data.hpp"


namespace tct::tbl {


/* every sheet export starts with a title row and a column header row */
inline constexpr uint32_t header_row_count = 2;


struct CsvRow
{
	uint32_t line {0};

	mtp::vault<std::string, mtp::default_set> cells;
};


struct TablePaths
{
	std::string story;
	std::string concrete;
	std::string rect_column;
	std::string circ_column;
	std::string wall;
	std::string beam;
	std::string slab;
};


// splits one CSV document; quoted cells may hold commas and doubled quotes
void split_csv(std::string_view text, mtp::vault<CsvRow, mtp::default_set>& out_rows);

// drops the header rows and everything from the first row with a blank key cell
[[nodiscard]] bool read_csv_table(
	const char*                            file_path,
	mtp::vault<CsvRow, mtp::default_set>&  out_rows,
	Fault&                                 out_fault
);


[[nodiscard]] bool read_story_table(const char* file_path, sty::StorySeq& out_stories, Fault& out_fault);

[[nodiscard]] bool read_concrete_table(const char* file_path, mtp::vault<Concrete, mtp::default_set>& out_concretes, Fault& out_fault);

[[nodiscard]] bool read_rect_column_table(const char* file_path, mtp::vault<RectColumn, mtp::default_set>& out_columns, Fault& out_fault);

[[nodiscard]] bool read_circ_column_table(const char* file_path, mtp::vault<CircColumn, mtp::default_set>& out_columns, Fault& out_fault);

[[nodiscard]] bool read_wall_table(const char* file_path, mtp::vault<Wall, mtp::default_set>& out_walls, Fault& out_fault);

[[nodiscard]] bool read_beam_table(const char* file_path, mtp::vault<CouplingBeam, mtp::default_set>& out_beams, Fault& out_fault);

[[nodiscard]] bool read_slab_table(const char* file_path, mtp::vault<Slab, mtp::default_set>& out_slabs, Fault& out_fault);


// empty paths are skipped and leave the matching table empty
[[nodiscard]] bool read_section_tables(const TablePaths& paths, SectionTables& out_tables, Fault& out_fault);


} // tct::tbl
