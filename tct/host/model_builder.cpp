#include "model_builder.hpp"

#include "log.hpp"


namespace tct::hst {


namespace {


	using NameSet = decltype(mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>());


	[[nodiscard]] NameSet make_name_set(const NameList& names)
	{
		NameSet name_set = mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>();
		name_set.reserve(names.size());

		for (uint32_t i = 0; i < names.size(); ++i) {
			name_set[names[i]] = i;
		}
		return name_set;
	}


	// true the first time a name is seen and the host does not already know it
	[[nodiscard]] bool claim_name(NameSet& known_names, const std::string& name, uint32_t& skipped_count)
	{
		if (known_names.find(name) != known_names.end()) {
			++skipped_count;
			return false;
		}
		known_names[name] = static_cast<uint32_t>(known_names.size());
		return true;
	}
}


ModelBuilder::ModelBuilder(ModelHost& host, const unit::UnitConfig& units, const LoadPatterns& patterns)
	: m_host     {host}
	, m_units    {units}
	, m_patterns {patterns}
{
}


bool ModelBuilder::check(int32_t status, const char* call, std::string_view entity, Fault& out_fault)
{
	if (status == host_ok)
		return true;

	TCT_ERROR(
		log::LogCategory::host,
		"[model_builder][%s] host call failed [entity %.*s][status %d]",
		call,
		static_cast<int>(entity.size()),
		entity.data(),
		status
	);

	return raise(
		out_fault,
		FaultKind::host_status,
		status,
		"%s failed for %.*s with status %d",
		call,
		static_cast<int>(entity.size()),
		entity.data(),
		status
	);
}


bool ModelBuilder::define_units(Fault& out_fault)
{
	const int32_t status = m_host.set_present_units(m_units.host_unit_code);
	if (!check(status, "set_present_units", unit::unit_system_name(m_units.system), out_fault))
		return false;

	unit::log_unit_info(m_units);
	return true;
}


bool ModelBuilder::define_stories(std::span<const sty::Story> stories, double base_elevation, Fault& out_fault)
{
	mtp::vault<StoryRow, mtp::default_set> story_rows;
	story_rows.reserve(stories.size());

	for (const sty::Story& story : stories) {
		story_rows.emplace_back(StoryRow {
			.level         = story.level,
			.height        = unit::to_model_length(story.height, m_units),
			.is_master     = story.is_master,
			.similar_to    = story.similar_to,
			.splice_above  = story.splice_above,
			.splice_height = unit::to_model_length(story.splice_height, m_units),
			.color         = story.color.value_or(0u)
		});
	}

	const double model_base = unit::to_model_length(base_elevation, m_units);

	const int32_t status = m_host.set_stories(model_base, std::span<const StoryRow> {story_rows.data(), story_rows.size()});
	if (!check(status, "set_stories", "story table", out_fault))
		return false;

	m_report.stories = static_cast<uint32_t>(stories.size());

	TCT_INFO(
		log::LogCategory::host,
		"[model_builder][define_stories] ok [stories %u][base %g %s]",
		m_report.stories,
		model_base,
		m_units.length_unit
	);

	return true;
}


bool ModelBuilder::define_materials(std::span<const tbl::Concrete> concretes, Fault& out_fault)
{
	NameSet defined_names = mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>();
	uint32_t duplicate_count = 0;

	for (const tbl::Concrete& concrete : concretes) {
		if (!claim_name(defined_names, concrete.name, duplicate_count))
			continue;

		if (!check(m_host.set_material(concrete.name, MaterialType::concrete), "set_material", concrete.name, out_fault))
			return false;

		if (!check(m_host.set_isotropic(concrete.name, concrete.ec, concrete.poisson, concrete.thermal), "set_isotropic", concrete.name, out_fault))
			return false;

		if (concrete.unit_weight > 0.0) {
			if (!check(m_host.set_unit_weight(concrete.name, concrete.unit_weight), "set_unit_weight", concrete.name, out_fault))
				return false;
		}

		if (!check(m_host.set_concrete(concrete.name, concrete.fc), "set_concrete", concrete.name, out_fault))
			return false;

		++m_report.materials;
	}

	TCT_INFO(
		log::LogCategory::host,
		"[model_builder][define_materials] ok [materials %u][duplicates %u]",
		m_report.materials,
		duplicate_count
	);

	return true;
}


bool ModelBuilder::define_frame_sections(const tbl::SectionTables& tables, Fault& out_fault)
{
	NameList existing_names;
	if (!check(m_host.frame_section_names(existing_names), "frame_section_names", "frame sections", out_fault))
		return false;

	NameSet known_names = make_name_set(existing_names);

	uint32_t defined_count = 0;
	uint32_t skipped_count = 0;

	for (const tbl::RectColumn& column : tables.rect_columns) {
		if (!claim_name(known_names, column.name, skipped_count))
			continue;

		if (!check(m_host.set_rectangle(column.name, column.material, column.b, column.h), "set_rectangle", column.name, out_fault))
			return false;

		const ColumnRebar rebar {
			.section       = column.name,
			.long_bar_mat  = column.long_bar_mat,
			.confine_mat   = column.confine_mat,
			.pattern       = 1,
			.confine_type  = static_cast<int32_t>(tbl::Confinement::ties),
			.cover         = column.cover,
			.circular_bars = 0,
			.bars_3dir     = column.bars_3dir,
			.bars_2dir     = column.bars_2dir,
			.long_bar_size = column.long_bar_size,
			.tie_bar_size  = column.tie_bar_size,
			.tie_spacing   = column.tie_spacing,
			.tie_legs_2dir = column.tie_legs_2dir,
			.tie_legs_3dir = column.tie_legs_3dir,
			.is_designed   = false
		};
		if (!check(m_host.set_column_rebar(rebar), "set_column_rebar", column.name, out_fault))
			return false;

		++defined_count;
	}

	for (const tbl::CircColumn& column : tables.circ_columns) {
		if (!claim_name(known_names, column.name, skipped_count))
			continue;

		if (!check(m_host.set_circle(column.name, column.material, column.diameter), "set_circle", column.name, out_fault))
			return false;

		const ColumnRebar rebar {
			.section       = column.name,
			.long_bar_mat  = column.long_bar_mat,
			.confine_mat   = column.confine_mat,
			.pattern       = 2,
			.confine_type  = static_cast<int32_t>(column.confinement),
			.cover         = column.cover,
			.circular_bars = column.bar_count,
			.bars_3dir     = 0,
			.bars_2dir     = 0,
			.long_bar_size = column.long_bar_size,
			.tie_bar_size  = column.tie_bar_size,
			.tie_spacing   = column.tie_spacing,
			.tie_legs_2dir = 0,
			.tie_legs_3dir = 0,
			.is_designed   = false
		};
		if (!check(m_host.set_column_rebar(rebar), "set_column_rebar", column.name, out_fault))
			return false;

		++defined_count;
	}

	for (const tbl::CouplingBeam& beam : tables.beams) {
		if (!claim_name(known_names, beam.name, skipped_count))
			continue;

		// depth first, then width
		if (!check(m_host.set_rectangle(beam.name, beam.material, beam.h, beam.b), "set_rectangle", beam.name, out_fault))
			return false;

		const BeamRebar rebar {
			.section      = beam.name,
			.long_bar_mat = beam.long_bar_mat,
			.tie_bar_mat  = beam.tie_bar_mat,
			.cover_top    = beam.cover_top,
			.cover_bot    = beam.cover_bot
		};
		if (!check(m_host.set_beam_rebar(rebar), "set_beam_rebar", beam.name, out_fault))
			return false;

		++defined_count;
	}

	m_report.frame_sections   += defined_count;
	m_report.skipped_sections += skipped_count;

	TCT_INFO(
		log::LogCategory::host,
		"[model_builder][define_frame_sections] ok [defined %u][skipped %u]",
		defined_count,
		skipped_count
	);

	return true;
}


bool ModelBuilder::define_area_sections(const tbl::SectionTables& tables, Fault& out_fault)
{
	NameList existing_names;
	if (!check(m_host.area_section_names(existing_names), "area_section_names", "area sections", out_fault))
		return false;

	NameSet known_names = make_name_set(existing_names);

	uint32_t defined_count = 0;
	uint32_t skipped_count = 0;

	for (const tbl::Wall& wall : tables.walls) {
		if (!claim_name(known_names, wall.name, skipped_count))
			continue;

		const int32_t status = m_host.set_wall(wall.name, wall.prop_type, wall.shell_type, wall.material, wall.thickness);
		if (!check(status, "set_wall", wall.name, out_fault))
			return false;

		++defined_count;
	}

	for (const tbl::Slab& slab : tables.slabs) {
		if (!claim_name(known_names, slab.name, skipped_count))
			continue;

		const int32_t status = m_host.set_slab(slab.name, slab.prop_type, slab.shell_type, slab.material, slab.thickness);
		if (!check(status, "set_slab", slab.name, out_fault))
			return false;

		++defined_count;
	}

	m_report.area_sections    += defined_count;
	m_report.skipped_sections += skipped_count;

	TCT_INFO(
		log::LogCategory::host,
		"[model_builder][define_area_sections] ok [defined %u][skipped %u]",
		defined_count,
		skipped_count
	);

	return true;
}


void ModelBuilder::assign_slab_load(std::string_view area_name, std::string_view slab_name, std::string_view pattern, double value)
{
	if (value == 0.0)
		return;

	const int32_t status = m_host.set_area_load(area_name, pattern, value);
	if (status != host_ok) {
		++m_report.loads_failed;
		TCT_WARN(
			log::LogCategory::host,
			"[model_builder][assign_slab_load] load failed [slab %.*s][pattern %.*s][status %d]",
			static_cast<int>(slab_name.size()),
			slab_name.data(),
			static_cast<int>(pattern.size()),
			pattern.data(),
			status
		);
		return;
	}
	++m_report.loads_assigned;
}


void ModelBuilder::create_elements(const ext::ElementSet& elements)
{
	TCT_INFO(
		log::LogCategory::host,
		"[model_builder][create_elements] begin... [columns %zu][walls %zu][beams %zu][slabs %zu]",
		elements.columns.size(),
		elements.walls.size(),
		elements.beams.size(),
		elements.slabs.size()
	);

	std::string assigned_name;

	auto count = [](ElementCount& element_count, int32_t status, const char* kind, const std::string& user_name, const std::string& section)
	{
		if (status == host_ok) {
			++element_count.created;
			return true;
		}
		++element_count.failed;
		TCT_WARN(
			log::LogCategory::host,
			"[model_builder][create_elements] %s failed [name %s][section %s][status %d]",
			kind,
			user_name.c_str(),
			section.c_str(),
			status
		);
		return false;
	};

	for (const ext::ColumnGeom& column : elements.columns) {
		assigned_name.clear();
		const int32_t status = m_host.add_frame(column.start, column.end, column.section, column.user_name, assigned_name);
		count(m_report.columns, status, "column", column.user_name, column.section);
	}

	for (const ext::WallGeom& wall : elements.walls) {
		assigned_name.clear();
		const int32_t status = m_host.add_area(std::span<const dvec3> {wall.vertices}, wall.section, wall.user_name, assigned_name);
		count(m_report.walls, status, "wall", wall.user_name, wall.section);
	}

	for (const ext::BeamGeom& beam : elements.beams) {
		assigned_name.clear();
		const int32_t status = m_host.add_frame(beam.start, beam.end, beam.section, beam.user_name, assigned_name);
		count(m_report.beams, status, "beam", beam.user_name, beam.section);
	}

	for (const ext::SlabGeom& slab : elements.slabs) {
		assigned_name.clear();
		const std::span<const dvec3> vertices {slab.vertices.data(), slab.vertices.size()};
		const int32_t status = m_host.add_area(vertices, slab.section, slab.user_name, assigned_name);
		if (!count(m_report.slabs, status, "slab", slab.user_name, slab.section))
			continue;

		const std::string_view area_name = assigned_name.empty() ? std::string_view {slab.user_name} : std::string_view {assigned_name};

		assign_slab_load(area_name, slab.user_name, m_patterns.dead, slab.sdl);
		assign_slab_load(area_name, slab.user_name, m_patterns.live, slab.live);
	}

	TCT_INFO(
		log::LogCategory::host,
		"[model_builder][create_elements] ok [columns %u/%u][walls %u/%u][beams %u/%u][slabs %u/%u][loads %u][load failures %u]",
		m_report.columns.created, m_report.columns.created + m_report.columns.failed,
		m_report.walls.created,   m_report.walls.created   + m_report.walls.failed,
		m_report.beams.created,   m_report.beams.created   + m_report.beams.failed,
		m_report.slabs.created,   m_report.slabs.created   + m_report.slabs.failed,
		m_report.loads_assigned,
		m_report.loads_failed
	);
}


bool ModelBuilder::build(
	std::span<const sty::Story> stories,
	double                      base_elevation,
	const tbl::SectionTables&   tables,
	const ext::ElementSet&      elements,
	Fault&                      out_fault
)
{
	if (!define_units(out_fault))
		return false;
	if (!define_stories(stories, base_elevation, out_fault))
		return false;

	const std::span<const tbl::Concrete> concretes {tables.concretes.data(), tables.concretes.size()};
	if (!define_materials(concretes, out_fault))
		return false;
	if (!define_frame_sections(tables, out_fault))
		return false;
	if (!define_area_sections(tables, out_fault))
		return false;

	create_elements(elements);
	return true;
}


} // tct::hst
