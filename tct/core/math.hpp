#pragma once

#define GLM_FORCE_RADIANS

#include <glm/glm.hpp>

#include "panic.hpp"


namespace tct {


using dvec2 = glm::dvec2;
using dvec3 = glm::dvec3;

} // tct


namespace tct::math {


/* elevation lookups, story input units */
inline constexpr double elevation_epsilon = 1e-3;

inline constexpr double length_epsilon    = 1e-9;


[[nodiscard]] inline dvec2 drop(const dvec3& point)
{
	return dvec2 {point.x, point.y};
}


[[nodiscard]] inline bool is_degenerate(const dvec2& start, const dvec2& end)
{
	return glm::length(end - start) <= length_epsilon;
}

} // tct::math
