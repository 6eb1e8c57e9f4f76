#include "table_io.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <charconv>
#include <system_error>

#include "log.hpp"
#include "file_io.hpp"


namespace tct::tbl {


namespace {


	[[nodiscard]] std::string_view trim(std::string_view text)
	{
		constexpr std::string_view blank = " \t\r\n";

		const size_t first = text.find_first_not_of(blank);
		if (first == std::string_view::npos)
			return {};

		const size_t last = text.find_last_not_of(blank);
		return text.substr(first, last - first + 1);
	}


	[[nodiscard]] bool is_blank_row(const CsvRow& row)
	{
		for (const std::string& cell : row.cells) {
			if (!cell.empty())
				return false;
		}
		return true;
	}


	/* typed access to one row, reporting the file, line and column on failure */
	class RowCursor
	{
	public:

		RowCursor(const char* file_path, const CsvRow& row, Fault& fault)
			: m_file_path {file_path}
			, m_row       {row}
			, m_fault     {fault}
		{
		}

		[[nodiscard]] bool text(uint32_t column, std::string& out_text, bool is_required = true) const
		{
			const std::string* cell = find(column);
			if (!cell) {
				return is_required ? missing(column) : true;
			}
			out_text = *cell;
			return true;
		}

		[[nodiscard]] bool real(uint32_t column, double& out_value, bool is_required = true) const
		{
			const std::string* cell = find(column);
			if (!cell) {
				return is_required ? missing(column) : true;
			}

			double value {};
			auto result = std::from_chars(cell->data(), cell->data() + cell->size(), value);
			if (result.ec != std::errc {} || result.ptr != cell->data() + cell->size()) {
				return raise(
					m_fault,
					FaultKind::table_read,
					0,
					"%s line %u column %u: '%s' is not a number",
					m_file_path,
					m_row.line,
					column + 1,
					cell->c_str()
				);
			}
			out_value = value;
			return true;
		}

		// integer cells typed in a workbook often arrive as "12.0"
		[[nodiscard]] bool integer(uint32_t column, int32_t& out_value, bool is_required = true) const
		{
			double value = static_cast<double>(out_value);
			if (!real(column, value, is_required))
				return false;

			constexpr double lowest  = static_cast<double>(std::numeric_limits<int32_t>::min());
			constexpr double highest = static_cast<double>(std::numeric_limits<int32_t>::max());

			if (!std::isfinite(value) || value < lowest || value > highest) {
				return raise(
					m_fault,
					FaultKind::table_read,
					0,
					"%s line %u column %u: '%s' is out of integer range",
					m_file_path,
					m_row.line,
					column + 1,
					find(column)->c_str()
				);
			}

			out_value = static_cast<int32_t>(value);
			return true;
		}

		[[nodiscard]] bool flag(uint32_t column, bool& out_value) const
		{
			const std::string* cell = find(column);
			if (!cell)
				return true;

			const std::string_view value = *cell;
			if (value == "1" || value == "Yes" || value == "yes" || value == "TRUE" || value == "True" || value == "true") {
				out_value = true;
				return true;
			}
			if (value == "0" || value == "No" || value == "no" || value == "FALSE" || value == "False" || value == "false") {
				out_value = false;
				return true;
			}
			return raise(
				m_fault,
				FaultKind::table_read,
				0,
				"%s line %u column %u: '%s' is not a yes/no value",
				m_file_path,
				m_row.line,
				column + 1,
				cell->c_str()
			);
		}

		[[nodiscard]] bool color(uint32_t column, std::optional<uint32_t>& out_color) const
		{
			const std::string* cell = find(column);
			if (!cell)
				return true;

			std::string_view value = *cell;
			int base = 10;
			if (value.starts_with("#")) {
				value.remove_prefix(1);
				base = 16;
			}
			else if (value.starts_with("0x") || value.starts_with("0X")) {
				value.remove_prefix(2);
				base = 16;
			}

			uint32_t color_value {};
			auto result = std::from_chars(value.data(), value.data() + value.size(), color_value, base);
			if (result.ec != std::errc {} || result.ptr != value.data() + value.size()) {
				return raise(
					m_fault,
					FaultKind::table_read,
					0,
					"%s line %u column %u: '%s' is not a color",
					m_file_path,
					m_row.line,
					column + 1,
					cell->c_str()
				);
			}
			out_color = color_value & 0xFFFFFFu;
			return true;
		}

		[[nodiscard]] bool has(uint32_t column) const
		{
			return find(column) != nullptr;
		}

	private:

		[[nodiscard]] const std::string* find(uint32_t column) const
		{
			if (column >= m_row.cells.size())
				return nullptr;

			const std::string& cell = m_row.cells[column];
			return cell.empty() ? nullptr : &cell;
		}

		[[nodiscard]] bool missing(uint32_t column) const
		{
			return raise(
				m_fault,
				FaultKind::table_read,
				0,
				"%s line %u column %u: required value is blank",
				m_file_path,
				m_row.line,
				column + 1
			);
		}

	private:

		const char*   m_file_path;
		const CsvRow& m_row;
		Fault&        m_fault;
	};


	template <typename Record, typename ParseRow>
	[[nodiscard]] bool read_records(
		const char*                            file_path,
		const char*                            table_name,
		mtp::vault<Record, mtp::default_set>&  out_records,
		Fault&                                 out_fault,
		ParseRow&&                             parse_row
	)
	{
		mtp::vault<CsvRow, mtp::default_set> rows;
		if (!read_csv_table(file_path, rows, out_fault))
			return false;

		out_records.clear();
		out_records.reserve(rows.size());

		for (const CsvRow& row : rows) {
			RowCursor cursor {file_path, row, out_fault};
			if (!parse_row(cursor, out_records)) {
				TCT_ERROR(
					log::LogCategory::table,
					"[table_io][%s] row fail [path %s][line %u][err %s]",
					table_name,
					file_path,
					row.line,
					out_fault.context.c_str()
				);
				return false;
			}
		}

		TCT_INFO(
			log::LogCategory::table,
			"[table_io][%s] ok [path %s][records %zu]",
			table_name,
			file_path,
			out_records.size()
		);

		return true;
	}
}


void split_csv(std::string_view text, mtp::vault<CsvRow, mtp::default_set>& out_rows)
{
	if (text.size() >= 3 &&
		static_cast<unsigned char>(text[0]) == 0xEF &&
		static_cast<unsigned char>(text[1]) == 0xBB &&
		static_cast<unsigned char>(text[2]) == 0xBF) {
		text.remove_prefix(3);
	}

	uint32_t line_number = 1;
	size_t   cursor      = 0;

	while (cursor < text.size()) {
		CsvRow& row = out_rows.emplace_back();
		row.line = line_number;

		std::string cell;
		bool is_quoted   = false;
		bool was_quoted  = false;
		bool is_row_done = false;

		while (cursor < text.size() && !is_row_done) {
			const char ch = text[cursor++];

			if (is_quoted) {
				if (ch == '"') {
					if (cursor < text.size() && text[cursor] == '"') {
						cell.push_back('"');
						++cursor;
					}
					else {
						is_quoted = false;
					}
				}
				else {
					if (ch == '\n')
						++line_number;
					cell.push_back(ch);
				}
				continue;
			}

			switch (ch) {
			case '"':
				if (trim(cell).empty())
					cell.clear();
				is_quoted  = true;
				was_quoted = true;
				break;
			case ',':
				row.cells.emplace_back(was_quoted ? cell : std::string {trim(cell)});
				cell.clear();
				was_quoted = false;
				break;
			case '\r':
				break;
			case '\n':
				is_row_done = true;
				++line_number;
				break;
			default:
				cell.push_back(ch);
				break;
			}
		}

		row.cells.emplace_back(was_quoted ? cell : std::string {trim(cell)});
	}
}


bool read_csv_table(
	const char*                            file_path,
	mtp::vault<CsvRow, mtp::default_set>&  out_rows,
	Fault&                                 out_fault
)
{
	auto text_opt = io::read_text_file(file_path, log::LogCategory::table);
	if (!text_opt) {
		return raise(out_fault, FaultKind::table_read, 0, "%s: cannot read file", file_path);
	}

	mtp::vault<CsvRow, mtp::default_set> all_rows;
	split_csv(*text_opt, all_rows);

	out_rows.clear();

	for (uint32_t row_index = header_row_count; row_index < all_rows.size(); ++row_index) {
		CsvRow& row = all_rows[row_index];

		if (row.cells.empty() || row.cells[0].empty()) {
			if (!is_blank_row(row)) {
				TCT_DEBUG(
					log::LogCategory::table,
					"[table_io][read_csv_table] blank key ends table [path %s][line %u]",
					file_path,
					row.line
				);
			}
			break;
		}

		out_rows.emplace_back(std::move(row));
	}

	return true;
}


bool read_story_table(const char* file_path, sty::StorySeq& out_stories, Fault& out_fault)
{
	/* Level | Height | IsMaster | SimilarTo | SpliceAbove | SpliceHeight | Color | Plan */
	return read_records(file_path, "read_story_table", out_stories, out_fault,
		[](const RowCursor& cursor, sty::StorySeq& stories)
		{
			sty::Story story {};

			if (!cursor.text(0, story.level))               return false;
			if (!cursor.real(1, story.height))              return false;
			if (!cursor.flag(2, story.is_master))           return false;
			if (!cursor.text(3, story.similar_to, false))   return false;
			if (!cursor.flag(4, story.splice_above))        return false;
			if (!cursor.real(5, story.splice_height, false)) return false;
			if (!cursor.color(6, story.color))              return false;
			if (!cursor.text(7, story.plan_path, false))    return false;

			stories.emplace_back(std::move(story));
			return true;
		}
	);
}


bool read_concrete_table(const char* file_path, mtp::vault<Concrete, mtp::default_set>& out_concretes, Fault& out_fault)
{
	/* Name | f'c | Ec | Poisson | Thermal | UnitWeight */
	return read_records(file_path, "read_concrete_table", out_concretes, out_fault,
		[](const RowCursor& cursor, mtp::vault<Concrete, mtp::default_set>& concretes)
		{
			Concrete concrete {};

			if (!cursor.text(0, concrete.name))                return false;
			if (!cursor.real(1, concrete.fc))                  return false;
			if (!cursor.real(2, concrete.ec))                  return false;
			if (!cursor.real(3, concrete.poisson, false))      return false;
			if (!cursor.real(4, concrete.thermal, false))      return false;
			if (!cursor.real(5, concrete.unit_weight, false))  return false;

			concretes.emplace_back(std::move(concrete));
			return true;
		}
	);
}


bool read_rect_column_table(const char* file_path, mtp::vault<RectColumn, mtp::default_set>& out_columns, Fault& out_fault)
{
	/*
	 * Level | Material | f'c | Name | b | h | Cover | Bars2 | Bars3 | LongBar | TieBar | TieSpacing
	 *       | TieLegs2 | TieLegs3 | LongBarMat | ConfineMat
	 * f'c is informational, the material row carries it
	 */
	return read_records(file_path, "read_rect_column_table", out_columns, out_fault,
		[](const RowCursor& cursor, mtp::vault<RectColumn, mtp::default_set>& columns)
		{
			RectColumn column {};

			if (!cursor.text(0, column.level))                  return false;
			if (!cursor.text(1, column.material))               return false;
			if (!cursor.text(3, column.name))                   return false;
			if (!cursor.real(4, column.b))                      return false;
			if (!cursor.real(5, column.h))                      return false;
			if (!cursor.real(6, column.cover, false))           return false;
			if (!cursor.integer(7, column.bars_2dir, false))    return false;
			if (!cursor.integer(8, column.bars_3dir, false))    return false;
			if (!cursor.text(9, column.long_bar_size, false))   return false;
			if (!cursor.text(10, column.tie_bar_size, false))   return false;
			if (!cursor.real(11, column.tie_spacing, false))    return false;
			if (!cursor.integer(12, column.tie_legs_2dir, false)) return false;
			if (!cursor.integer(13, column.tie_legs_3dir, false)) return false;
			if (!cursor.text(14, column.long_bar_mat, false))   return false;
			if (!cursor.text(15, column.confine_mat, false))    return false;

			columns.emplace_back(std::move(column));
			return true;
		}
	);
}


bool read_circ_column_table(const char* file_path, mtp::vault<CircColumn, mtp::default_set>& out_columns, Fault& out_fault)
{
	/*
	 * Level | Material | f'c | Name | Diameter | Cover | Bars | LongBar | TieBar | TieSpacing
	 *       | Confinement | LongBarMat | ConfineMat
	 */
	return read_records(file_path, "read_circ_column_table", out_columns, out_fault,
		[](const RowCursor& cursor, mtp::vault<CircColumn, mtp::default_set>& columns)
		{
			CircColumn column {};

			if (!cursor.text(0, column.level))                 return false;
			if (!cursor.text(1, column.material))              return false;
			if (!cursor.text(3, column.name))                  return false;
			if (!cursor.real(4, column.diameter))              return false;
			if (!cursor.real(5, column.cover, false))          return false;
			if (!cursor.integer(6, column.bar_count, false))   return false;
			if (!cursor.text(7, column.long_bar_size, false))  return false;
			if (!cursor.text(8, column.tie_bar_size, false))   return false;
			if (!cursor.real(9, column.tie_spacing, false))    return false;

			std::string confinement;
			if (!cursor.text(10, confinement, false))          return false;
			if (confinement == "spiral" || confinement == "Spiral" || confinement == "2") {
				column.confinement = Confinement::spiral;
			}

			if (!cursor.text(11, column.long_bar_mat, false))  return false;
			if (!cursor.text(12, column.confine_mat, false))   return false;

			columns.emplace_back(std::move(column));
			return true;
		}
	);
}


bool read_wall_table(const char* file_path, mtp::vault<Wall, mtp::default_set>& out_walls, Fault& out_fault)
{
	/*
	 * Level | Material | f'c | NameX | ThkX | NameY | ThkY | PropType | ShellType
	 * one record per named direction; the optional type codes apply to both
	 */
	return read_records(file_path, "read_wall_table", out_walls, out_fault,
		[](const RowCursor& cursor, mtp::vault<Wall, mtp::default_set>& walls)
		{
			Wall wall_base {};

			if (!cursor.text(0, wall_base.level))    return false;
			if (!cursor.text(1, wall_base.material)) return false;
			if (!cursor.integer(7, wall_base.prop_type, false))  return false;
			if (!cursor.integer(8, wall_base.shell_type, false)) return false;

			static constexpr uint32_t name_columns[2] = {3, 5};

			for (uint32_t name_column : name_columns) {
				if (!cursor.has(name_column))
					continue;

				Wall wall = wall_base;
				if (!cursor.text(name_column, wall.name))          return false;
				if (!cursor.real(name_column + 1, wall.thickness)) return false;

				walls.emplace_back(std::move(wall));
			}
			return true;
		}
	);
}


bool read_beam_table(const char* file_path, mtp::vault<CouplingBeam, mtp::default_set>& out_beams, Fault& out_fault)
{
	/* Level | Material | f'c | NameX | bX | hX | NameY | bY | hY; one record per named direction */
	return read_records(file_path, "read_beam_table", out_beams, out_fault,
		[](const RowCursor& cursor, mtp::vault<CouplingBeam, mtp::default_set>& beams)
		{
			CouplingBeam beam_base {};

			if (!cursor.text(0, beam_base.level))    return false;
			if (!cursor.text(1, beam_base.material)) return false;

			static constexpr uint32_t name_columns[2] = {3, 6};

			for (uint32_t name_column : name_columns) {
				if (!cursor.has(name_column))
					continue;

				CouplingBeam beam = beam_base;
				if (!cursor.text(name_column, beam.name))  return false;
				if (!cursor.real(name_column + 1, beam.b)) return false;
				if (!cursor.real(name_column + 2, beam.h)) return false;

				beams.emplace_back(std::move(beam));
			}
			return true;
		}
	);
}


bool read_slab_table(const char* file_path, mtp::vault<Slab, mtp::default_set>& out_slabs, Fault& out_fault)
{
	/* Level | Material | f'c | Name | Thickness | SDL | Live | PropType | ShellType */
	return read_records(file_path, "read_slab_table", out_slabs, out_fault,
		[](const RowCursor& cursor, mtp::vault<Slab, mtp::default_set>& slabs)
		{
			Slab slab {};

			if (!cursor.text(0, slab.level))        return false;
			if (!cursor.text(1, slab.material))     return false;
			if (!cursor.text(3, slab.name))         return false;
			if (!cursor.real(4, slab.thickness))    return false;
			if (!cursor.real(5, slab.sdl, false))   return false;
			if (!cursor.real(6, slab.live, false))  return false;
			if (!cursor.integer(7, slab.prop_type, false))  return false;
			if (!cursor.integer(8, slab.shell_type, false)) return false;

			slabs.emplace_back(std::move(slab));
			return true;
		}
	);
}


bool read_section_tables(const TablePaths& paths, SectionTables& out_tables, Fault& out_fault)
{
	if (!paths.concrete.empty() && !read_concrete_table(paths.concrete.c_str(), out_tables.concretes, out_fault))
		return false;
	if (!paths.rect_column.empty() && !read_rect_column_table(paths.rect_column.c_str(), out_tables.rect_columns, out_fault))
		return false;
	if (!paths.circ_column.empty() && !read_circ_column_table(paths.circ_column.c_str(), out_tables.circ_columns, out_fault))
		return false;
	if (!paths.wall.empty() && !read_wall_table(paths.wall.c_str(), out_tables.walls, out_fault))
		return false;
	if (!paths.beam.empty() && !read_beam_table(paths.beam.c_str(), out_tables.beams, out_fault))
		return false;
	if (!paths.slab.empty() && !read_slab_table(paths.slab.c_str(), out_tables.slabs, out_fault))
		return false;

	return true;
}


} // tct::tbl
