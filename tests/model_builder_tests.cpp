/*
Model builder tests against a scripted host.
*/
#include "test_common.hpp"

#include "model_builder.hpp"


using namespace tct;


/* records call names and fails the calls it is told to fail */
class ScriptedHost : public hst::ModelHost
{
public:

	std::string fail_op;
	std::string fail_name;
	int32_t     fail_status {7};

	mtp::vault<std::string, mtp::default_set> ops;
	mtp::vault<std::string, mtp::default_set> loads;
	hst::NameList existing_frame_sections;

	double   story_base {0.0};
	double   first_height {0.0};
	int32_t  unit_code {0};
	uint32_t rebar_pattern {0};

	int32_t wall_types[2] {-1, -1};
	int32_t slab_types[2] {-1, -1};

	int32_t set_present_units(int32_t code) override
	{
		unit_code = code;
		return status("set_present_units", "");
	}

	int32_t set_stories(double base_elevation, std::span<const hst::StoryRow> stories) override
	{
		story_base   = base_elevation;
		first_height = stories.empty() ? 0.0 : stories[0].height;
		return status("set_stories", stories.empty() ? "" : stories[0].level);
	}

	int32_t set_material(std::string_view name, hst::MaterialType) override
	{ return status("set_material", name); }

	int32_t set_isotropic(std::string_view name, double, double, double) override
	{ return status("set_isotropic", name); }

	int32_t set_unit_weight(std::string_view name, double) override
	{ return status("set_unit_weight", name); }

	int32_t set_concrete(std::string_view name, double) override
	{ return status("set_concrete", name); }

	int32_t set_rectangle(std::string_view name, std::string_view, double, double) override
	{ return status("set_rectangle", name); }

	int32_t set_circle(std::string_view name, std::string_view, double) override
	{ return status("set_circle", name); }

	int32_t set_column_rebar(const hst::ColumnRebar& rebar) override
	{
		rebar_pattern = static_cast<uint32_t>(rebar.pattern);
		return status("set_column_rebar", rebar.section);
	}

	int32_t set_beam_rebar(const hst::BeamRebar& rebar) override
	{ return status("set_beam_rebar", rebar.section); }

	int32_t set_wall(std::string_view name, int32_t prop_type, int32_t shell_type, std::string_view, double) override
	{
		wall_types[0] = prop_type;
		wall_types[1] = shell_type;
		return status("set_wall", name);
	}

	int32_t set_slab(std::string_view name, int32_t prop_type, int32_t shell_type, std::string_view, double) override
	{
		slab_types[0] = prop_type;
		slab_types[1] = shell_type;
		return status("set_slab", name);
	}

	int32_t add_frame(const dvec3&, const dvec3&, std::string_view, std::string_view user_name, std::string& out_name) override
	{
		out_name = std::string {"host_"} + std::string {user_name};
		return status("add_frame", user_name);
	}

	int32_t add_area(std::span<const dvec3>, std::string_view, std::string_view user_name, std::string& out_name) override
	{
		out_name = std::string {"host_"} + std::string {user_name};
		return status("add_area", user_name);
	}

	int32_t set_area_load(std::string_view area_name, std::string_view pattern, double) override
	{
		loads.emplace_back(std::string {area_name} + "/" + std::string {pattern});
		return status("set_area_load", area_name);
	}

	int32_t frame_section_names(hst::NameList& out_names) override
	{
		for (const std::string& name : existing_frame_sections) {
			out_names.emplace_back(name);
		}
		return status("frame_section_names", "");
	}

	int32_t area_section_names(hst::NameList&) override
	{ return status("area_section_names", ""); }

	[[nodiscard]] size_t count(std::string_view op) const
	{
		size_t op_count = 0;
		for (const std::string& recorded : ops) {
			op_count += (recorded == op);
		}
		return op_count;
	}

private:

	int32_t status(std::string_view op, std::string_view name)
	{
		ops.emplace_back(op);
		if (op == fail_op && (fail_name.empty() || name == fail_name))
			return fail_status;
		return hst::host_ok;
	}
};


static void fill_tables(tbl::SectionTables& tables)
{
	tbl::Concrete& concrete = tables.concretes.emplace_back();
	concrete.name = "C5000";
	concrete.fc   = 5000.0;
	concrete.ec   = 4030000.0;

	tbl::Concrete& duplicate = tables.concretes.emplace_back();
	duplicate.name = "C5000";

	tbl::RectColumn& rect = tables.rect_columns.emplace_back();
	rect.name     = "C24";
	rect.material = "C5000";
	rect.b        = 24.0;
	rect.h        = 24.0;

	tbl::RectColumn& repeated = tables.rect_columns.emplace_back();
	repeated.name     = "C24";
	repeated.material = "C5000";
	repeated.level    = "L2";

	tbl::CircColumn& circ = tables.circ_columns.emplace_back();
	circ.name     = "D30";
	circ.material = "C5000";
	circ.diameter = 30.0;

	tbl::Wall& wall = tables.walls.emplace_back();
	wall.name      = "W12";
	wall.material  = "C5000";
	wall.thickness = 12.0;

	tbl::Slab& slab = tables.slabs.emplace_back();
	slab.name       = "S8";
	slab.material   = "C5000";
	slab.thickness  = 8.0;
	slab.prop_type  = 3;
	slab.shell_type = 2;
}


static void fill_elements(ext::ElementSet& elements)
{
	ext::ColumnGeom& column = elements.columns.emplace_back();
	column.start     = dvec3 {0.0, 0.0, 0.0};
	column.end       = dvec3 {0.0, 0.0, 120.0};
	column.section   = "C24";
	column.level     = "L1";
	column.user_name = "C1_L1";

	ext::WallGeom& wall = elements.walls.emplace_back();
	wall.vertices  = {dvec3 {0.0, 0.0, 0.0}, dvec3 {120.0, 0.0, 0.0}, dvec3 {120.0, 0.0, 120.0}, dvec3 {0.0, 0.0, 120.0}};
	wall.section   = "W12";
	wall.level     = "L1";
	wall.user_name = "W1_L1";

	ext::SlabGeom& slab = elements.slabs.emplace_back();
	slab.vertices.emplace_back(dvec3 {0.0,   0.0,   120.0});
	slab.vertices.emplace_back(dvec3 {240.0, 0.0,   120.0});
	slab.vertices.emplace_back(dvec3 {240.0, 240.0, 120.0});
	slab.section   = "S8";
	slab.level     = "L1";
	slab.user_name = "S1_L1";
	slab.sdl       = 20.0 / 144.0;
	slab.live      = 0.0;
}


static sty::StorySeq one_story()
{
	sty::StorySeq stories;
	sty::Story& story = stories.emplace_back();
	story.level  = "L1";
	story.height = 10.0;
	return stories;
}


static int test_full_build()
{
	ScriptedHost host;
	host.existing_frame_sections.emplace_back("D30");

	tbl::SectionTables tables;
	fill_tables(tables);

	ext::ElementSet elements;
	fill_elements(elements);

	auto stories = one_story();

	const hst::LoadPatterns patterns;
	hst::ModelBuilder builder {host, unit::us_units, patterns};

	Fault fault;
	EXPECT(builder.build(std::span<const sty::Story> {stories.data(), stories.size()}, 2.0, tables, elements, fault), "build succeeds");

	EXPECT(host.unit_code == 1, "US unit code sent");
	EXPECT(test::near(host.story_base, 24.0), "base converted to inches");
	EXPECT(test::near(host.first_height, 120.0), "height converted to inches");
	EXPECT(host.ops[0] == "set_present_units", "units first");
	EXPECT(host.ops[1] == "set_stories", "stories second");

	const hst::BuildReport& report = builder.report();
	EXPECT(report.materials == 1, "duplicate material defined once");
	EXPECT(host.count("set_concrete") == 1, "one concrete call");
	EXPECT(host.count("set_unit_weight") == 0, "zero unit weight not sent");
	EXPECT(report.frame_sections == 1, "only the new rect section defined");
	EXPECT(report.skipped_sections == 2, "repeat and existing names skipped");
	EXPECT(host.count("set_circle") == 0, "existing circle left alone");
	EXPECT(host.rebar_pattern == 1, "rect rebar pattern");
	EXPECT(report.area_sections == 2, "wall and slab sections");
	EXPECT(host.wall_types[0] == 1 && host.wall_types[1] == 1, "wall sent as specified thin shell");
	EXPECT(host.slab_types[0] == 3 && host.slab_types[1] == 2, "slab types passed through");

	EXPECT(report.columns.created == 1 && report.walls.created == 1 && report.slabs.created == 1, "elements created");
	EXPECT(report.failed_elements() == 0, "no failed elements");

	EXPECT(host.loads.size() == 1, "zero live load skipped");
	EXPECT(host.loads[0] == "host_S1_L1/Dead", "dead load on the assigned area name");
	EXPECT(report.loads_assigned == 1, "one load assigned");
	return 0;
}


static int test_fatal_section_status()
{
	ScriptedHost host;
	host.fail_op     = "set_rectangle";
	host.fail_name   = "C24";
	host.fail_status = 42;

	tbl::SectionTables tables;
	fill_tables(tables);

	const hst::LoadPatterns patterns;
	hst::ModelBuilder builder {host, unit::us_units, patterns};

	Fault fault;
	EXPECT(!builder.define_frame_sections(tables, fault), "section failure is fatal");
	EXPECT(fault.kind == FaultKind::host_status, "host status fault kind");
	EXPECT(fault.status == 42, "status carried");
	EXPECT(fault.context.find("C24") != std::string::npos, "fault names the section");
	EXPECT(fault.context.find("set_rectangle") != std::string::npos, "fault names the call");
	EXPECT(host.count("set_column_rebar") == 0, "stopped before rebar");
	return 0;
}


static int test_fatal_story_status()
{
	ScriptedHost host;
	host.fail_op = "set_stories";

	tbl::SectionTables tables;
	fill_tables(tables);

	ext::ElementSet elements;
	auto stories = one_story();

	const hst::LoadPatterns patterns;
	hst::ModelBuilder builder {host, unit::metric_units, patterns};

	Fault fault;
	EXPECT(!builder.build(std::span<const sty::Story> {stories.data(), stories.size()}, 0.0, tables, elements, fault), "story failure stops the build");
	EXPECT(fault.kind == FaultKind::host_status && fault.status == 7, "story fault");
	EXPECT(host.count("set_material") == 0, "nothing defined after the failure");
	EXPECT(std::string_view {fault_name(fault.kind)} == "HostStatusError", "host fault name");
	return 0;
}


static int test_element_failures_counted()
{
	ScriptedHost host;
	host.fail_op   = "add_area";
	host.fail_name = "S1_L1";

	ext::ElementSet elements;
	fill_elements(elements);

	const hst::LoadPatterns patterns {.dead = "SDL", .live = "LL"};
	hst::ModelBuilder builder {host, unit::us_units, patterns};

	log::ring_clear();
	builder.create_elements(elements);

	const hst::BuildReport& report = builder.report();
	EXPECT(report.columns.created == 1, "column still created");
	EXPECT(report.walls.created == 1, "wall still created");
	EXPECT(report.slabs.failed == 1, "slab failure counted");
	EXPECT(report.failed_elements() == 1, "one failed element");
	EXPECT(host.loads.empty(), "no load on a failed slab");
	EXPECT(test::count_logged(log::LogLevel::warn, "slab failed") == 1, "slab failure warned");
	return 0;
}


static int test_load_patterns()
{
	ScriptedHost host;

	ext::ElementSet elements;
	fill_elements(elements);
	elements.slabs[0].live = 40.0 / 144.0;

	const hst::LoadPatterns patterns {.dead = "SDL", .live = "LL"};
	hst::ModelBuilder builder {host, unit::us_units, patterns};
	builder.create_elements(elements);

	EXPECT(host.loads.size() == 2, "dead and live loads");
	EXPECT(host.loads[0] == "host_S1_L1/SDL", "configured dead pattern");
	EXPECT(host.loads[1] == "host_S1_L1/LL", "configured live pattern");
	return 0;
}


int main()
{
	test::init();

	if (test_full_build() != 0) return 1;
	if (test_fatal_section_status() != 0) return 1;
	if (test_fatal_story_status() != 0) return 1;
	if (test_element_failures_counted() != 0) return 1;
	if (test_load_patterns() != 0) return 1;
	return 0;
}
