/*
Extrusion engine tests: story bands, section resolution, unit finalization.
*/
#include "test_common.hpp"

#include "extruder.hpp"
#include "story_ledger.hpp"
#include "section_index.hpp"


using namespace tct;


struct Building
{
	sty::StorySeq       stories;
	sty::ElevationFrame frame;
	tbl::SectionTables  tables;
	ext::SectionIndex   sections;
	ext::LayerNames     layers;

	std::span<const sty::Story> story_span() const
	{
		return std::span<const sty::Story> {stories.data(), stories.size()};
	}
};


static void add_story(Building& building, const char* level, double height)
{
	sty::Story& story = building.stories.emplace_back();
	story.level  = level;
	story.height = height;
}


static void add_rect(Building& building, const char* level, const char* name)
{
	tbl::RectColumn& column = building.tables.rect_columns.emplace_back();
	column.level    = level;
	column.material = "C5000";
	column.name     = name;
	column.b        = 24.0;
	column.h        = 24.0;
}


static void add_circ(Building& building, const char* level, const char* name)
{
	tbl::CircColumn& column = building.tables.circ_columns.emplace_back();
	column.level    = level;
	column.material = "C5000";
	column.name     = name;
	column.diameter = 30.0;
}


static void add_wall(Building& building, const char* level, const char* name)
{
	tbl::Wall& wall = building.tables.walls.emplace_back();
	wall.level     = level;
	wall.material  = "C5000";
	wall.name      = name;
	wall.thickness = 12.0;
}


static void add_slab(Building& building, const char* level, const char* name, double sdl, double live)
{
	tbl::Slab& slab = building.tables.slabs.emplace_back();
	slab.level     = level;
	slab.material  = "C5000";
	slab.name      = name;
	slab.thickness = 8.0;
	slab.sdl       = sdl;
	slab.live      = live;
}


static bool prepare(Building& building, bool is_strict = false)
{
	Fault fault;
	if (!sty::build_frame(building.story_span(), 0.0, building.frame, fault))
		return false;
	return building.sections.rebuild(building.tables, building.frame.levels, is_strict, fault);
}


static void add_square(pln::PlanDoc& doc, const char* layer, double size, bool repeat_first)
{
	pln::PlanPolyline& outline = doc.polylines.emplace_back();
	outline.layer  = layer;
	outline.closed = true;
	outline.vertices.emplace_back(dvec3 {0.0,  0.0,  0.0});
	outline.vertices.emplace_back(dvec3 {size, 0.0,  0.0});
	outline.vertices.emplace_back(dvec3 {size, size, 0.0});
	outline.vertices.emplace_back(dvec3 {0.0,  size, 0.0});
	if (repeat_first) {
		outline.vertices.emplace_back(dvec3 {0.0, 0.0, 0.0});
	}
}


static int test_three_story_columns()
{
	Building building;
	add_story(building, "L1", 10.0);
	add_story(building, "L2", 10.0);
	add_story(building, "L3", 10.0);
	add_rect(building, "L1", "C24-L1");
	add_rect(building, "L2", "C24-L2");
	EXPECT(prepare(building), "building prepared");

	pln::PlanDoc doc;
	doc.points.emplace_back(pln::PlanPoint {.layer = "REC COLS", .location = dvec3 {1.0, 2.0, 0.0}});

	ext::Extruder extruder {building.frame, building.story_span(), building.sections, unit::us_units, building.layers, ext::Strategy::story_scoped};

	ext::ElementSet elements;
	extruder.extrude_building(doc, elements);

	EXPECT(elements.columns.size() == 3, "one column per story");

	const char* sections[] = {"C24-L1", "C24-L2", "Default"};
	const char* names[]    = {"C1_L1", "C1_L2", "C1_L3"};
	for (uint32_t i = 0; i < 3; ++i) {
		const ext::ColumnGeom& column = elements.columns[i];
		EXPECT(test::near(column.start, dvec3 {12.0, 24.0, 120.0 * i}), "column start in inches");
		EXPECT(test::near(column.end, dvec3 {12.0, 24.0, 120.0 * (i + 1)}), "column end in inches");
		EXPECT(column.section == sections[i], "column section by story");
		EXPECT(column.user_name == names[i], "column user name");
	}
	EXPECT(extruder.stats().defaulted_sections == 1, "one default section");
	return 0;
}


static int test_slab_scenario()
{
	Building building;
	add_story(building, "L1", 10.0);
	add_slab(building, "L1", "S8", 20.0, 40.0);
	EXPECT(prepare(building), "building prepared");

	pln::PlanDoc doc;
	add_square(doc, "SLAB", 20.0, false);

	ext::Extruder extruder {building.frame, building.story_span(), building.sections, unit::us_units, building.layers, ext::Strategy::story_scoped};

	ext::ElementSet elements;
	extruder.extrude_building(doc, elements);

	EXPECT(elements.slabs.size() == 1, "one slab");
	const ext::SlabGeom& slab = elements.slabs[0];
	EXPECT(slab.vertices.size() == 4, "four vertices");
	for (const dvec3& vertex : slab.vertices) {
		EXPECT(test::near(vertex.z, 120.0), "slab at the ceiling");
	}
	EXPECT(test::near(slab.vertices[2], dvec3 {240.0, 240.0, 120.0}), "slab plan in inches");
	EXPECT(test::near(slab.sdl, 20.0 / 144.0), "sdl in psi");
	EXPECT(test::near(slab.live, 40.0 / 144.0), "live in psi");
	EXPECT(slab.section == "S8", "slab section");
	EXPECT(slab.user_name == "S1_L1", "slab user name");
	return 0;
}


static int test_unmatched_slab()
{
	Building building;
	add_story(building, "L1", 3.0);
	EXPECT(prepare(building), "building prepared");

	pln::PlanDoc doc;
	add_square(doc, "SLAB", 6.0, true);

	ext::Extruder extruder {building.frame, building.story_span(), building.sections, unit::metric_units, building.layers, ext::Strategy::story_scoped};

	ext::ElementSet elements;
	extruder.extrude_building(doc, elements);

	EXPECT(elements.slabs.size() == 1, "one slab");
	EXPECT(elements.slabs[0].vertices.size() == 4, "repeated closing vertex dropped");
	EXPECT(elements.slabs[0].section == "Default", "sentinel section");
	EXPECT(elements.slabs[0].sdl == 0.0 && elements.slabs[0].live == 0.0, "zero load when unmatched");
	EXPECT(test::near(elements.slabs[0].vertices[0].z, 3000.0), "metric ceiling in mm");
	return 0;
}


static int test_metric_slab_load()
{
	Building building;
	add_story(building, "L1", 3.0);
	add_slab(building, "L1", "S200", 0.0015, 0.002);
	EXPECT(prepare(building), "building prepared");

	pln::PlanDoc doc;
	add_square(doc, "SLAB", 6.0, true);

	ext::Extruder extruder {building.frame, building.story_span(), building.sections, unit::metric_units, building.layers, ext::Strategy::story_scoped};

	ext::ElementSet elements;
	extruder.extrude_building(doc, elements);

	EXPECT(elements.slabs.size() == 1, "one slab");
	EXPECT(elements.slabs[0].section == "S200", "slab section matched");
	EXPECT(test::near(elements.slabs[0].sdl, 0.0015), "metric sdl already in N/mm2");
	EXPECT(test::near(elements.slabs[0].live, 0.002), "metric live already in N/mm2");
	return 0;
}


static int test_wall_winding()
{
	Building building;
	add_story(building, "L1", 10.0);
	add_wall(building, "L1", "W12X");
	add_wall(building, "L1", "W16Y");
	EXPECT(prepare(building), "building prepared");

	pln::PlanDoc doc;
	doc.lines.emplace_back(pln::PlanLine {.layer = "WALL X", .segment = {dvec3 {0.0, 0.0, 0.0}, dvec3 {10.0, 0.0, 0.0}}});
	doc.lines.emplace_back(pln::PlanLine {.layer = "WALL Y", .segment = {dvec3 {0.0, 0.0, 0.0}, dvec3 {0.0, 10.0, 0.0}}});
	doc.lines.emplace_back(pln::PlanLine {.layer = "WALL X", .segment = {dvec3 {5.0, 5.0, 0.0}, dvec3 {5.0, 5.0, 0.0}}});

	ext::Extruder extruder {building.frame, building.story_span(), building.sections, unit::us_units, building.layers, ext::Strategy::story_scoped};

	ext::ElementSet elements;
	extruder.extrude_building(doc, elements);

	EXPECT(elements.walls.size() == 2, "zero-length wall dropped");

	const ext::WallGeom& wall = elements.walls[0];
	EXPECT(test::near(wall.vertices[0], dvec3 {0.0,   0.0, 0.0}),   "start bottom");
	EXPECT(test::near(wall.vertices[1], dvec3 {120.0, 0.0, 0.0}),   "end bottom");
	EXPECT(test::near(wall.vertices[2], dvec3 {120.0, 0.0, 120.0}), "end top");
	EXPECT(test::near(wall.vertices[3], dvec3 {0.0,   0.0, 120.0}), "start top");
	EXPECT(wall.section == "W12X", "X wall section");
	EXPECT(elements.walls[1].section == "W16Y", "Y wall section");
	EXPECT(elements.walls[1].user_name == "W2_L1", "wall counter per level");
	return 0;
}


static int test_beams_at_ceiling()
{
	Building building;
	add_story(building, "L1", 10.0);
	add_story(building, "L2", 12.0);

	tbl::CouplingBeam& beam_record = building.tables.beams.emplace_back();
	beam_record.level = "L2";
	beam_record.name  = "CB16x30";
	EXPECT(prepare(building), "building prepared");

	pln::PlanDoc doc;
	doc.lines.emplace_back(pln::PlanLine {.layer = "CB", .segment = {dvec3 {0.0, 0.0, 0.0}, dvec3 {4.0, 0.0, 0.0}}});

	ext::Extruder extruder {building.frame, building.story_span(), building.sections, unit::us_units, building.layers, ext::Strategy::story_scoped};

	ext::ElementSet elements;
	extruder.extrude_building(doc, elements);

	EXPECT(elements.beams.size() == 2, "one beam per story");
	EXPECT(test::near(elements.beams[0].start.z, 120.0) && test::near(elements.beams[0].end.z, 120.0), "first beam at first ceiling");
	EXPECT(test::near(elements.beams[1].start.z, 264.0), "second beam at second ceiling");
	EXPECT(elements.beams[0].section == "Default", "no record on L1");
	EXPECT(elements.beams[1].section == "CB16x30", "single record on L2");
	return 0;
}


static int test_section_resolution()
{
	Building building;
	add_story(building, "L1", 10.0);
	add_rect(building, "L1", "C24");
	add_circ(building, "L1", "D30");
	add_wall(building, "L1", "WA");
	add_wall(building, "L1", "WB");
	EXPECT(prepare(building), "building prepared");

	const sty::LevelId level_id {0};

	EXPECT(building.sections.column_section(level_id, ext::ColumnShape::rect) == "C24", "rect preferred on rect layer");
	EXPECT(building.sections.column_section(level_id, ext::ColumnShape::circ) == "D30", "circ preferred on circ layer");
	EXPECT(building.sections.wall_section(level_id, ext::Direction::x) == "Default", "no directional match");
	EXPECT(building.sections.wall_section(level_id, ext::Direction::none) == "WA", "undirected takes the first");
	EXPECT(building.sections.wall_section(sty::LevelId {}, ext::Direction::x) == "Default", "invalid level");

	EXPECT(ext::name_has_direction("cb-x1", ext::Direction::x), "direction match ignores case");
	EXPECT(!ext::name_has_direction("CB-1", ext::Direction::y), "no Y in name");
	return 0;
}


static int test_unknown_levels()
{
	{
		Building building;
		add_story(building, "L1", 10.0);
		add_rect(building, "L9", "C24");

		log::ring_clear();
		EXPECT(prepare(building, false), "lenient index builds");
		EXPECT(test::count_logged(log::LogLevel::warn, "unknown level ignored") == 1, "unknown level warned");
		EXPECT(building.sections.column_section(sty::LevelId {0}, ext::ColumnShape::rect) == "Default", "ignored record never matches");
	}
	{
		Building building;
		add_story(building, "L1", 10.0);
		add_rect(building, "L9", "C24");

		Fault fault;
		EXPECT(sty::build_frame(building.story_span(), 0.0, building.frame, fault), "frame builds");
		EXPECT(!building.sections.rebuild(building.tables, building.frame.levels, true, fault), "strict index fails");
		EXPECT(fault.kind == FaultKind::unknown_level, "unknown level fault kind");
		EXPECT(fault.context.find("L9") != std::string::npos, "fault names the level");
		EXPECT(fault.context.find("rect_column") != std::string::npos, "fault names the table");
	}
	return 0;
}


static int test_story_scoped_drawing()
{
	Building building;
	add_story(building, "L1", 10.0);
	add_story(building, "L2", 10.0);
	add_rect(building, "L2", "C24");
	EXPECT(prepare(building), "building prepared");

	pln::PlanDoc doc;
	doc.points.emplace_back(pln::PlanPoint {.layer = "REC COLS", .location = dvec3 {0.0, 0.0, 0.0}});
	doc.points.emplace_back(pln::PlanPoint {.layer = "REC COLS", .location = dvec3 {5.0, 0.0, 0.0}});

	ext::Extruder extruder {building.frame, building.story_span(), building.sections, unit::us_units, building.layers, ext::Strategy::story_scoped};

	ext::ElementSet elements;
	extruder.extrude_story(doc, 1, elements);

	EXPECT(elements.columns.size() == 2, "only the requested band");
	EXPECT(test::near(elements.columns[0].start.z, 120.0), "band floor");
	EXPECT(elements.columns[1].user_name == "C2_L2", "level suffix");
	EXPECT(elements.columns[1].section == "C24", "band section");
	return 0;
}


static int test_strategies_agree()
{
	Building building;
	add_story(building, "L1", 12.0);
	add_story(building, "L2", 10.0);
	add_rect(building, "L1", "C30");
	add_circ(building, "L2", "D24");
	add_wall(building, "L2", "W10");
	add_slab(building, "L1", "S8", 15.0, 50.0);
	EXPECT(prepare(building), "building prepared");

	pln::PlanDoc doc;
	doc.points.emplace_back(pln::PlanPoint {.layer = "REC COLS", .location = dvec3 {0.0, 0.0, 0.0}});
	doc.lines.emplace_back(pln::PlanLine {.layer = "WALL", .segment = {dvec3 {0.0, 0.0, 0.0}, dvec3 {8.0, 0.0, 0.0}}});
	add_square(doc, "SLAB", 8.0, false);

	ext::ElementSet scoped;
	ext::ElementSet reconciled;

	ext::Extruder scoped_extruder {building.frame, building.story_span(), building.sections, unit::us_units, building.layers, ext::Strategy::story_scoped};
	ext::Extruder blind_extruder {building.frame, building.story_span(), building.sections, unit::us_units, building.layers, ext::Strategy::whole_building_then_reconcile};

	scoped_extruder.extrude_building(doc, scoped);
	blind_extruder.extrude_building(doc, reconciled);

	EXPECT(scoped.columns.size() == reconciled.columns.size(), "same column count");
	EXPECT(scoped.walls.size() == reconciled.walls.size(), "same wall count");
	EXPECT(scoped.slabs.size() == reconciled.slabs.size(), "same slab count");

	for (uint32_t i = 0; i < scoped.columns.size(); ++i) {
		EXPECT(scoped.columns[i].section == reconciled.columns[i].section, "same column sections");
		EXPECT(scoped.columns[i].level == reconciled.columns[i].level, "same column levels");
		EXPECT(test::near(scoped.columns[i].end, reconciled.columns[i].end), "same column geometry");
	}
	for (uint32_t i = 0; i < scoped.slabs.size(); ++i) {
		EXPECT(scoped.slabs[i].section == reconciled.slabs[i].section, "same slab sections");
		EXPECT(test::near(scoped.slabs[i].sdl, reconciled.slabs[i].sdl), "same slab loads");
	}
	EXPECT(blind_extruder.stats().unlabeled_segments == 0, "every segment labeled");
	return 0;
}


int main()
{
	test::init();

	if (test_three_story_columns() != 0) return 1;
	if (test_slab_scenario() != 0) return 1;
	if (test_unmatched_slab() != 0) return 1;
	if (test_metric_slab_load() != 0) return 1;
	if (test_wall_winding() != 0) return 1;
	if (test_beams_at_ceiling() != 0) return 1;
	if (test_section_resolution() != 0) return 1;
	if (test_unknown_levels() != 0) return 1;
	if (test_story_scoped_drawing() != 0) return 1;
	if (test_strategies_agree() != 0) return 1;
	return 0;
}
