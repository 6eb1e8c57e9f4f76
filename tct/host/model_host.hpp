#pragma once

#include <span>
#include <string>
#include <cstdint>
#include <string_view>

#include "math.hpp"
#include "mtp_memory.hpp"


namespace tct::hst {


/* every host call returns a status, 0 = success */
inline constexpr int32_t host_ok = 0;


enum class MaterialType : int32_t
{
	steel    = 1,
	concrete = 2,
	rebar    = 6
};


/* one story row in model units, bottom-up */
struct StoryRow
{
	std::string_view level;
	double           height {0.0};
	bool             is_master {false};
	std::string_view similar_to;
	bool             splice_above {false};
	double           splice_height {0.0};
	uint32_t         color {0};
};


struct ColumnRebar
{
	std::string_view section;
	std::string_view long_bar_mat;
	std::string_view confine_mat;

	int32_t pattern      {1};	// 1 rectangular, 2 circular
	int32_t confine_type {1};	// 1 ties, 2 spiral

	double  cover         {0.0};
	int32_t circular_bars {0};
	int32_t bars_3dir     {0};
	int32_t bars_2dir     {0};

	std::string_view long_bar_size;
	std::string_view tie_bar_size;

	double  tie_spacing   {0.0};
	int32_t tie_legs_2dir {0};
	int32_t tie_legs_3dir {0};

	bool is_designed {false};
};


struct BeamRebar
{
	std::string_view section;
	std::string_view long_bar_mat;
	std::string_view tie_bar_mat;

	double cover_top {0.0};
	double cover_bot {0.0};

	double top_left_area  {0.0};
	double top_right_area {0.0};
	double bot_left_area  {0.0};
	double bot_right_area {0.0};
};


using NameList = mtp::vault<std::string, mtp::default_set>;


/*
 * The structural-analysis application as seen by the builder.
 * Names passed in are only valid for the duration of the call.
 */
class ModelHost
{
public:

	virtual ~ModelHost() = default;

	virtual int32_t set_present_units(int32_t unit_code) = 0;

	virtual int32_t set_stories(double base_elevation, std::span<const StoryRow> stories) = 0;

	virtual int32_t set_material(std::string_view name, MaterialType type) = 0;
	virtual int32_t set_isotropic(std::string_view name, double modulus, double poisson, double thermal) = 0;
	virtual int32_t set_unit_weight(std::string_view name, double unit_weight) = 0;
	virtual int32_t set_concrete(std::string_view name, double fc) = 0;

	virtual int32_t set_rectangle(std::string_view name, std::string_view material, double depth, double width) = 0;
	virtual int32_t set_circle(std::string_view name, std::string_view material, double diameter) = 0;
	virtual int32_t set_column_rebar(const ColumnRebar& rebar) = 0;
	virtual int32_t set_beam_rebar(const BeamRebar& rebar) = 0;

	virtual int32_t set_wall(
		std::string_view name,
		int32_t          prop_type,
		int32_t          shell_type,
		std::string_view material,
		double           thickness
	) = 0;

	virtual int32_t set_slab(
		std::string_view name,
		int32_t          prop_type,
		int32_t          shell_type,
		std::string_view material,
		double           thickness
	) = 0;

	virtual int32_t add_frame(
		const dvec3&     point_i,
		const dvec3&     point_j,
		std::string_view section,
		std::string_view user_name,
		std::string&     out_name
	) = 0;

	virtual int32_t add_area(
		std::span<const dvec3> vertices,
		std::string_view       section,
		std::string_view       user_name,
		std::string&           out_name
	) = 0;

	// uniform gravity load on an area object, model force per area
	virtual int32_t set_area_load(std::string_view area_name, std::string_view pattern, double value) = 0;

	virtual int32_t frame_section_names(NameList& out_names) = 0;
	virtual int32_t area_section_names(NameList& out_names) = 0;
};


} // tct::hst
