#pragma once

#include <string>
#include <cstdint>

#include "mtp_memory.hpp"


namespace tct::tbl {


/* section dimensions are in model units (in / mm) as entered in the workbook */


struct Concrete
{
	std::string name;

	double fc          {0.0};
	double ec          {0.0};
	double poisson     {0.2};
	double thermal     {5.5e-6};
	double unit_weight {0.0};
};


struct RectColumn
{
	std::string level;
	std::string material;
	std::string name;

	double b {0.0};
	double h {0.0};

	double  cover         {1.5};
	int32_t bars_2dir     {3};
	int32_t bars_3dir     {3};
	std::string long_bar_size {"#9"};
	std::string tie_bar_size  {"#4"};
	double  tie_spacing   {6.0};
	int32_t tie_legs_2dir {2};
	int32_t tie_legs_3dir {2};

	std::string long_bar_mat {"A615Gr60"};
	std::string confine_mat  {"A615Gr60"};
};


enum class Confinement : uint8_t
{
	ties   = 1,
	spiral = 2
};


struct CircColumn
{
	std::string level;
	std::string material;
	std::string name;

	double diameter {0.0};

	double      cover       {1.5};
	int32_t     bar_count   {8};
	std::string long_bar_size {"#9"};
	std::string tie_bar_size  {"#4"};
	double      tie_spacing {6.0};
	Confinement confinement {Confinement::ties};

	std::string long_bar_mat {"A615Gr60"};
	std::string confine_mat  {"A615Gr60"};
};


/* shell behavior: 1 thin, 2 thick, 3 membrane, 4 plate thin, 5 plate thick, 6 layered */
inline constexpr int32_t shell_thin = 1;


struct Wall
{
	std::string level;
	std::string material;
	std::string name;

	double thickness {0.0};

	int32_t prop_type  {1};	// 1 specified, 2 auto select list
	int32_t shell_type {shell_thin};
};


struct CouplingBeam
{
	std::string level;
	std::string material;
	std::string name;

	double b {0.0};
	double h {0.0};

	double cover_top {2.5};
	double cover_bot {2.5};

	std::string long_bar_mat {"A615Gr60"};
	std::string tie_bar_mat  {"A615Gr60"};
};


struct Slab
{
	std::string level;
	std::string material;
	std::string name;

	double thickness {0.0};
	double sdl       {0.0};
	double live      {0.0};

	int32_t prop_type  {0};	// 0 slab, 1 drop, 2 stiff, 3 ribbed, 4 waffle, 5 mat, 6 footing
	int32_t shell_type {shell_thin};
};


struct SectionTables
{
	mtp::vault<Concrete,     mtp::default_set> concretes;
	mtp::vault<RectColumn,   mtp::default_set> rect_columns;
	mtp::vault<CircColumn,   mtp::default_set> circ_columns;
	mtp::vault<Wall,         mtp::default_set> walls;
	mtp::vault<CouplingBeam, mtp::default_set> beams;
	mtp::vault<Slab,         mtp::default_set> slabs;
};


} // tct::tbl
