/*
Transcript host tests: reference checks and the written call list.
*/
#include "test_common.hpp"

#include "transcript_host.hpp"


using namespace tct;


static int test_reference_checks()
{
	hst::TranscriptHost host;
	std::string name;

	EXPECT(host.set_present_units(3) == hst::host_rejected, "unsupported unit code rejected");
	EXPECT(host.set_present_units(1) == hst::host_ok, "US unit code accepted");

	EXPECT(host.set_concrete("C5000", 5000.0) == hst::host_rejected, "unknown material rejected");
	EXPECT(host.set_material("C5000", hst::MaterialType::concrete) == hst::host_ok, "material added");
	EXPECT(host.set_concrete("C5000", 5000.0) == hst::host_ok, "known material accepted");

	EXPECT(host.set_rectangle("C24", "C4000", 24.0, 24.0) == hst::host_rejected, "section on unknown material rejected");
	EXPECT(host.set_rectangle("C24", "C5000", 0.0, 24.0) == hst::host_rejected, "zero depth rejected");
	EXPECT(host.set_rectangle("C24", "C5000", 24.0, 24.0) == hst::host_ok, "rectangle added");

	hst::ColumnRebar rebar;
	rebar.section = "C30";
	EXPECT(host.set_column_rebar(rebar) == hst::host_rejected, "rebar on unknown section rejected");
	rebar.section = "C24";
	EXPECT(host.set_column_rebar(rebar) == hst::host_ok, "rebar on known section accepted");

	EXPECT(host.add_frame(dvec3 {0.0}, dvec3 {0.0, 0.0, 120.0}, "C30", "C1_L1", name) == hst::host_rejected, "frame on unknown section rejected");
	EXPECT(host.add_frame(dvec3 {0.0}, dvec3 {0.0, 0.0, 120.0}, "Default", "", name) == hst::host_ok, "default section always known");
	EXPECT(name == "F1", "generated frame name");

	const dvec3 two_points[] = {dvec3 {0.0}, dvec3 {1.0, 0.0, 0.0}};
	EXPECT(host.add_area(std::span<const dvec3> {two_points}, "Default", "S1_L1", name) == hst::host_rejected, "two vertices rejected");

	EXPECT(host.set_area_load("S1_L1", "Dead", 0.1) == hst::host_rejected, "load on unknown area rejected");
	return 0;
}


static int test_section_names()
{
	hst::TranscriptHost host;
	EXPECT(host.set_material("C5000", hst::MaterialType::concrete) == hst::host_ok, "material added");
	EXPECT(host.set_wall("W10", 3, 1, "C5000", 10.0) == hst::host_rejected, "unknown wall property type rejected");
	EXPECT(host.set_wall("W11", 1, 7, "C5000", 11.0) == hst::host_rejected, "unknown shell type rejected");
	EXPECT(host.set_wall("W12", 1, 1, "C5000", 12.0) == hst::host_ok, "wall added");

	hst::NameList frame_names;
	hst::NameList area_names;
	EXPECT(host.frame_section_names(frame_names) == hst::host_ok, "frame names listed");
	EXPECT(host.area_section_names(area_names) == hst::host_ok, "area names listed");

	EXPECT(frame_names.size() == 1 && frame_names[0] == "Default", "default frame section only");
	EXPECT(area_names.size() == 2, "default and wall area sections");
	return 0;
}


static int test_transcript_text()
{
	hst::TranscriptHost host;
	std::string name;

	EXPECT(host.set_present_units(9) == hst::host_ok, "metric unit code");
	EXPECT(host.set_material("C30", hst::MaterialType::concrete) == hst::host_ok, "material");
	EXPECT(host.set_slab("S200", 3, 2, "C30", 200.0) == hst::host_ok, "slab section");

	const dvec3 outline[] = {dvec3 {0.0, 0.0, 3000.0}, dvec3 {6000.0, 0.0, 3000.0}, dvec3 {6000.0, 6000.0, 3000.0}};
	EXPECT(host.add_area(std::span<const dvec3> {outline}, "S200", "S1_L1", name) == hst::host_ok, "area added");
	EXPECT(name == "S1_L1", "user name kept");
	EXPECT(host.set_area_load(name, "Dead", 0.002) == hst::host_ok, "load on known area");
	EXPECT(host.call_count() == 5, "five calls recorded");

	const std::string text = host.to_toml();

	auto parse_result = toml::parse(text);
	EXPECT(static_cast<bool>(parse_result), "transcript is valid toml");

	const toml::table& root_table = parse_result.table();
	EXPECT(root_table["unit_code"].value_or(int64_t {0}) == 9, "unit code at the root");

	const toml::array* call_array = root_table["call"].as_array();
	EXPECT(call_array && call_array->size() == 5, "call array kept");

	const toml::table* load_call = (*call_array)[4].as_table();
	EXPECT(load_call, "load call is a table");
	EXPECT((*load_call)["op"].value_or(std::string {}) == "set_area_load", "load op name");
	EXPECT((*load_call)["direction"].value_or(int64_t {0}) == 10, "gravity direction");
	EXPECT((*load_call)["csys"].value_or(std::string {}) == "Global", "global axes");

	const toml::table* slab_call = (*call_array)[2].as_table();
	EXPECT(slab_call && (*slab_call)["op"].value_or(std::string {}) == "set_slab", "slab op name");
	EXPECT((*slab_call)["prop_type"].value_or(int64_t {-1}) == 3, "slab property type recorded");
	EXPECT((*slab_call)["shell_type"].value_or(int64_t {-1}) == 2, "slab shell type recorded");

	const toml::table* area_call = (*call_array)[3].as_table();
	const toml::array* vertex_array = area_call ? (*area_call)["vertices"].as_array() : nullptr;
	EXPECT(vertex_array && vertex_array->size() == 3, "area vertices kept");
	return 0;
}


static int test_write()
{
	hst::TranscriptHost host;
	EXPECT(host.set_present_units(1) == hst::host_ok, "unit code");

	const std::string path = test::temp_path("transcript.toml");
	EXPECT(host.write(path.c_str()), "transcript written");

	auto text_opt = io::read_text_file(path.c_str(), log::LogCategory::host);
	EXPECT(text_opt && text_opt->find("set_present_units") != std::string::npos, "written text has the call");
	return 0;
}


int main()
{
	test::init();

	if (test_reference_checks() != 0) return 1;
	if (test_section_names() != 0) return 1;
	if (test_transcript_text() != 0) return 1;
	if (test_write() != 0) return 1;
	return 0;
}
