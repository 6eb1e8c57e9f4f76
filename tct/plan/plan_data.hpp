#pragma once

#include <string>

#include "math.hpp"
#include "mtp_memory.hpp"


namespace tct::pln {


using Polyline3 = mtp::vault<dvec3, mtp::default_set>;


struct Segment3
{
	dvec3 start;
	dvec3 end;
};


struct PlanPoint
{
	std::string layer;
	dvec3       location;
};


struct PlanLine
{
	std::string layer;
	Segment3    segment;
};


struct PlanPolyline
{
	std::string layer;
	bool        closed {false};
	Polyline3   vertices;
};


/* model-space entities of one drawing, in drawing units (story input units) */
struct PlanDoc
{
	std::string path;

	mtp::vault<PlanPoint,    mtp::default_set> points;
	mtp::vault<PlanLine,     mtp::default_set> lines;
	mtp::vault<PlanPolyline, mtp::default_set> polylines;
};


} // tct::pln
