#pragma once

#include <string>

#include "mtp_memory.hpp"

#include "plan_data.hpp"
#include "section_index.hpp"


namespace tct::ext {


struct LayerNames
{
	std::string rect_columns {"REC COLS"};
	std::string circ_columns {"CIR COLS"};

	std::string walls   {"WALL"};
	std::string walls_x {"WALL X"};
	std::string walls_y {"WALL Y"};

	std::string beams   {"CB"};
	std::string beams_x {"CB X"};
	std::string beams_y {"CB Y"};

	std::string slabs {"SLAB"};

	bool is_slab_closed_only {true};
};


struct DirectedSegment
{
	pln::Segment3 segment;
	Direction     direction {Direction::none};
};


/* plan primitives grouped by the element kind they extrude into */
struct PlanLayerSet
{
	mtp::vault<dvec3, mtp::default_set> rect_points;
	mtp::vault<dvec3, mtp::default_set> circ_points;

	mtp::vault<DirectedSegment, mtp::default_set> walls;
	mtp::vault<DirectedSegment, mtp::default_set> beams;

	mtp::vault<pln::Polyline3, mtp::default_set> slabs;
};


// zero-length segments are dropped
[[nodiscard]] PlanLayerSet collect_layers(const pln::PlanDoc& doc, const LayerNames& layers);


} // tct::ext
