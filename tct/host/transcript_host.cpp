#include "transcript_host.hpp"

#include <cstdio>
#include <sstream>

#include "log.hpp"
#include "file_io.hpp"
#include "element_data.hpp"


namespace tct::hst {


namespace {


	[[nodiscard]] toml::array to_toml_point(const dvec3& point)
	{
		return toml::array {point.x, point.y, point.z};
	}


	[[nodiscard]] std::string next_object_name(char prefix, uint32_t& counter)
	{
		++counter;

		char name_buffer[16];
		std::snprintf(name_buffer, sizeof(name_buffer), "%c%u", prefix, counter);
		return name_buffer;
	}


	// thin, thick, membrane, plate thin, plate thick, layered
	[[nodiscard]] bool is_shell_type(int32_t shell_type)
	{
		return shell_type >= 1 && shell_type <= 6;
	}
}


TranscriptHost::TranscriptHost()
{
	// the application ships a default frame and shell property
	insert(m_frame_sections, ext::default_section);
	insert(m_area_sections,  ext::default_section);
}


bool TranscriptHost::contains(const NameSet& names, std::string_view name)
{
	return names.find(std::string {name}) != names.end();
}


void TranscriptHost::insert(NameSet& names, std::string_view name)
{
	names[std::string {name}] = static_cast<uint32_t>(names.size());
}


toml::table& TranscriptHost::record(std::string_view op)
{
	m_calls.push_back(toml::table {});

	toml::table& call_table = *m_calls.back().as_table();
	call_table.insert_or_assign("op", std::string {op});
	return call_table;
}


int32_t TranscriptHost::reject(std::string_view op, std::string_view name, const char* reason)
{
	TCT_DEBUG(
		log::LogCategory::host,
		"[transcript_host][%.*s] rejected [name %.*s][reason %s]",
		static_cast<int>(op.size()),
		op.data(),
		static_cast<int>(name.size()),
		name.data(),
		reason
	);
	return host_rejected;
}


int32_t TranscriptHost::set_present_units(int32_t unit_code)
{
	if (unit_code != 1 && unit_code != 9)
		return reject("set_present_units", "units", "unsupported unit code");

	m_unit_code = unit_code;

	toml::table& call_table = record("set_present_units");
	call_table.insert_or_assign("unit_code", static_cast<int64_t>(unit_code));
	return host_ok;
}


int32_t TranscriptHost::set_stories(double base_elevation, std::span<const StoryRow> stories)
{
	if (stories.empty())
		return reject("set_stories", "story table", "no stories");

	toml::array story_array;
	for (const StoryRow& story : stories) {
		if (story.height <= 0.0)
			return reject("set_stories", story.level, "height not positive");

		story_array.push_back(toml::table {
			{"name",          std::string {story.level}},
			{"height",        story.height},
			{"is_master",     story.is_master},
			{"similar_to",    std::string {story.similar_to}},
			{"splice_above",  story.splice_above},
			{"splice_height", story.splice_height},
			{"color",         static_cast<int64_t>(story.color)}
		});
	}

	toml::table& call_table = record("set_stories");
	call_table.insert_or_assign("base_elevation", base_elevation);
	call_table.insert_or_assign("stories", std::move(story_array));
	return host_ok;
}


int32_t TranscriptHost::set_material(std::string_view name, MaterialType type)
{
	if (name.empty())
		return reject("set_material", name, "empty name");

	insert(m_materials, name);

	toml::table& call_table = record("set_material");
	call_table.insert_or_assign("name", std::string {name});
	call_table.insert_or_assign("type", static_cast<int64_t>(type));
	return host_ok;
}


int32_t TranscriptHost::set_isotropic(std::string_view name, double modulus, double poisson, double thermal)
{
	if (!contains(m_materials, name))
		return reject("set_isotropic", name, "unknown material");

	toml::table& call_table = record("set_isotropic");
	call_table.insert_or_assign("name",    std::string {name});
	call_table.insert_or_assign("modulus", modulus);
	call_table.insert_or_assign("poisson", poisson);
	call_table.insert_or_assign("thermal", thermal);
	return host_ok;
}


int32_t TranscriptHost::set_unit_weight(std::string_view name, double unit_weight)
{
	if (!contains(m_materials, name))
		return reject("set_unit_weight", name, "unknown material");

	toml::table& call_table = record("set_unit_weight");
	call_table.insert_or_assign("name",        std::string {name});
	call_table.insert_or_assign("unit_weight", unit_weight);
	return host_ok;
}


int32_t TranscriptHost::set_concrete(std::string_view name, double fc)
{
	if (!contains(m_materials, name))
		return reject("set_concrete", name, "unknown material");
	if (fc <= 0.0)
		return reject("set_concrete", name, "fc not positive");

	toml::table& call_table = record("set_concrete");
	call_table.insert_or_assign("name", std::string {name});
	call_table.insert_or_assign("fc",   fc);
	return host_ok;
}


int32_t TranscriptHost::set_rectangle(std::string_view name, std::string_view material, double depth, double width)
{
	if (!contains(m_materials, material))
		return reject("set_rectangle", name, "unknown material");
	if (depth <= 0.0 || width <= 0.0)
		return reject("set_rectangle", name, "dimension not positive");

	insert(m_frame_sections, name);

	toml::table& call_table = record("set_rectangle");
	call_table.insert_or_assign("name",     std::string {name});
	call_table.insert_or_assign("material", std::string {material});
	call_table.insert_or_assign("depth",    depth);
	call_table.insert_or_assign("width",    width);
	return host_ok;
}


int32_t TranscriptHost::set_circle(std::string_view name, std::string_view material, double diameter)
{
	if (!contains(m_materials, material))
		return reject("set_circle", name, "unknown material");
	if (diameter <= 0.0)
		return reject("set_circle", name, "diameter not positive");

	insert(m_frame_sections, name);

	toml::table& call_table = record("set_circle");
	call_table.insert_or_assign("name",     std::string {name});
	call_table.insert_or_assign("material", std::string {material});
	call_table.insert_or_assign("diameter", diameter);
	return host_ok;
}


int32_t TranscriptHost::set_column_rebar(const ColumnRebar& rebar)
{
	if (!contains(m_frame_sections, rebar.section))
		return reject("set_column_rebar", rebar.section, "unknown section");

	toml::table& call_table = record("set_column_rebar");
	call_table.insert_or_assign("name",          std::string {rebar.section});
	call_table.insert_or_assign("long_bar_mat",  std::string {rebar.long_bar_mat});
	call_table.insert_or_assign("confine_mat",   std::string {rebar.confine_mat});
	call_table.insert_or_assign("pattern",       static_cast<int64_t>(rebar.pattern));
	call_table.insert_or_assign("confine_type",  static_cast<int64_t>(rebar.confine_type));
	call_table.insert_or_assign("cover",         rebar.cover);
	call_table.insert_or_assign("circular_bars", static_cast<int64_t>(rebar.circular_bars));
	call_table.insert_or_assign("bars_3dir",     static_cast<int64_t>(rebar.bars_3dir));
	call_table.insert_or_assign("bars_2dir",     static_cast<int64_t>(rebar.bars_2dir));
	call_table.insert_or_assign("long_bar_size", std::string {rebar.long_bar_size});
	call_table.insert_or_assign("tie_bar_size",  std::string {rebar.tie_bar_size});
	call_table.insert_or_assign("tie_spacing",   rebar.tie_spacing);
	call_table.insert_or_assign("tie_legs_2dir", static_cast<int64_t>(rebar.tie_legs_2dir));
	call_table.insert_or_assign("tie_legs_3dir", static_cast<int64_t>(rebar.tie_legs_3dir));
	call_table.insert_or_assign("is_designed",   rebar.is_designed);
	return host_ok;
}


int32_t TranscriptHost::set_beam_rebar(const BeamRebar& rebar)
{
	if (!contains(m_frame_sections, rebar.section))
		return reject("set_beam_rebar", rebar.section, "unknown section");

	toml::table& call_table = record("set_beam_rebar");
	call_table.insert_or_assign("name",           std::string {rebar.section});
	call_table.insert_or_assign("long_bar_mat",   std::string {rebar.long_bar_mat});
	call_table.insert_or_assign("tie_bar_mat",    std::string {rebar.tie_bar_mat});
	call_table.insert_or_assign("cover_top",      rebar.cover_top);
	call_table.insert_or_assign("cover_bot",      rebar.cover_bot);
	call_table.insert_or_assign("top_left_area",  rebar.top_left_area);
	call_table.insert_or_assign("top_right_area", rebar.top_right_area);
	call_table.insert_or_assign("bot_left_area",  rebar.bot_left_area);
	call_table.insert_or_assign("bot_right_area", rebar.bot_right_area);
	return host_ok;
}


int32_t TranscriptHost::set_wall(
	std::string_view name,
	int32_t          prop_type,
	int32_t          shell_type,
	std::string_view material,
	double           thickness
)
{
	if (prop_type < 1 || prop_type > 2)
		return reject("set_wall", name, "unknown wall property type");
	if (!is_shell_type(shell_type))
		return reject("set_wall", name, "unknown shell type");
	if (!contains(m_materials, material))
		return reject("set_wall", name, "unknown material");
	if (thickness <= 0.0)
		return reject("set_wall", name, "thickness not positive");

	insert(m_area_sections, name);

	toml::table& call_table = record("set_wall");
	call_table.insert_or_assign("name",       std::string {name});
	call_table.insert_or_assign("prop_type",  static_cast<int64_t>(prop_type));
	call_table.insert_or_assign("shell_type", static_cast<int64_t>(shell_type));
	call_table.insert_or_assign("material",   std::string {material});
	call_table.insert_or_assign("thickness",  thickness);
	return host_ok;
}


int32_t TranscriptHost::set_slab(
	std::string_view name,
	int32_t          prop_type,
	int32_t          shell_type,
	std::string_view material,
	double           thickness
)
{
	if (prop_type < 0 || prop_type > 6)
		return reject("set_slab", name, "unknown slab type");
	if (!is_shell_type(shell_type))
		return reject("set_slab", name, "unknown shell type");
	if (!contains(m_materials, material))
		return reject("set_slab", name, "unknown material");
	if (thickness <= 0.0)
		return reject("set_slab", name, "thickness not positive");

	insert(m_area_sections, name);

	toml::table& call_table = record("set_slab");
	call_table.insert_or_assign("name",       std::string {name});
	call_table.insert_or_assign("prop_type",  static_cast<int64_t>(prop_type));
	call_table.insert_or_assign("shell_type", static_cast<int64_t>(shell_type));
	call_table.insert_or_assign("material",   std::string {material});
	call_table.insert_or_assign("thickness",  thickness);
	return host_ok;
}


int32_t TranscriptHost::add_frame(
	const dvec3&     point_i,
	const dvec3&     point_j,
	std::string_view section,
	std::string_view user_name,
	std::string&     out_name
)
{
	if (!contains(m_frame_sections, section))
		return reject("add_frame", user_name, "unknown section");

	out_name = user_name.empty() ? next_object_name('F', m_frame_counter) : std::string {user_name};

	toml::table& call_table = record("add_frame");
	call_table.insert_or_assign("name",    out_name);
	call_table.insert_or_assign("section", std::string {section});
	call_table.insert_or_assign("i",       to_toml_point(point_i));
	call_table.insert_or_assign("j",       to_toml_point(point_j));
	return host_ok;
}


int32_t TranscriptHost::add_area(
	std::span<const dvec3> vertices,
	std::string_view       section,
	std::string_view       user_name,
	std::string&           out_name
)
{
	if (vertices.size() < 3)
		return reject("add_area", user_name, "fewer than three vertices");
	if (!contains(m_area_sections, section))
		return reject("add_area", user_name, "unknown section");

	out_name = user_name.empty() ? next_object_name('A', m_area_counter) : std::string {user_name};
	insert(m_areas, out_name);

	toml::array point_array;
	for (const dvec3& vertex : vertices) {
		point_array.push_back(to_toml_point(vertex));
	}

	toml::table& call_table = record("add_area");
	call_table.insert_or_assign("name",     out_name);
	call_table.insert_or_assign("section",  std::string {section});
	call_table.insert_or_assign("vertices", std::move(point_array));
	return host_ok;
}


int32_t TranscriptHost::set_area_load(std::string_view area_name, std::string_view pattern, double value)
{
	if (!contains(m_areas, area_name))
		return reject("set_area_load", area_name, "unknown area");
	if (pattern.empty())
		return reject("set_area_load", area_name, "empty pattern");

	// gravity direction, replacing, global axes
	toml::table& call_table = record("set_area_load");
	call_table.insert_or_assign("name",      std::string {area_name});
	call_table.insert_or_assign("pattern",   std::string {pattern});
	call_table.insert_or_assign("value",     value);
	call_table.insert_or_assign("direction", static_cast<int64_t>(10));
	call_table.insert_or_assign("replace",   true);
	call_table.insert_or_assign("csys",      "Global");
	return host_ok;
}


int32_t TranscriptHost::frame_section_names(NameList& out_names)
{
	out_names.clear();
	out_names.reserve(m_frame_sections.size());
	for (const auto& [name, index] : m_frame_sections) {
		out_names.emplace_back(name);
	}
	return host_ok;
}


int32_t TranscriptHost::area_section_names(NameList& out_names)
{
	out_names.clear();
	out_names.reserve(m_area_sections.size());
	for (const auto& [name, index] : m_area_sections) {
		out_names.emplace_back(name);
	}
	return host_ok;
}


std::string TranscriptHost::to_toml() const
{
	toml::table root_table;
	root_table.insert_or_assign("unit_code", static_cast<int64_t>(m_unit_code));
	root_table.insert_or_assign("call",      m_calls);

	std::ostringstream stream;
	stream << toml::toml_formatter {root_table};
	return stream.str();
}


bool TranscriptHost::write(const char* file_path) const
{
	TCT_ASSERT_MSG(file_path, "file_path == null");

	if (!io::write_text_file(file_path, to_toml(), log::LogCategory::host))
		return false;

	TCT_INFO(
		log::LogCategory::host,
		"[transcript_host][write] ok [path %s][calls %zu]",
		file_path,
		m_calls.size()
	);

	return true;
}


} // tct::hst
