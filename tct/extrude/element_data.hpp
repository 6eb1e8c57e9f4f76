#pragma once

#include <array>
#include <string>

#include "math.hpp"
#include "mtp_memory.hpp"


namespace tct::ext {


/* section assigned when no record matches the element's story */
inline constexpr const char* default_section = "Default";

/* level tag of an element whose story could not be recovered */
inline constexpr const char* unknown_level = "NA";


/* all geometry below is in model units (in / mm), loads in model force per area */


struct ColumnGeom
{
	dvec3 start;
	dvec3 end;

	std::string section;
	std::string level;
	std::string user_name;
};


struct BeamGeom
{
	dvec3 start;
	dvec3 end;

	std::string section;
	std::string level;
	std::string user_name;
};


struct WallGeom
{
	// start-bottom, end-bottom, end-top, start-top
	std::array<dvec3, 4> vertices;

	std::string section;
	std::string level;
	std::string user_name;
};


struct SlabGeom
{
	mtp::vault<dvec3, mtp::default_set> vertices;

	std::string section;
	std::string level;
	std::string user_name;

	double sdl  {0.0};
	double live {0.0};
};


struct ElementSet
{
	mtp::vault<ColumnGeom, mtp::default_set> columns;
	mtp::vault<BeamGeom,   mtp::default_set> beams;
	mtp::vault<WallGeom,   mtp::default_set> walls;
	mtp::vault<SlabGeom,   mtp::default_set> slabs;
};


} // tct::ext
