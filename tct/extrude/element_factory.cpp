#include "element_factory.hpp"

#include <cstdio>

#include "log.hpp"


namespace tct::ext {


ElementFactory::ElementFactory(const unit::UnitConfig& units, ElementSet& out_elements)
	: m_units    {units}
	, m_elements {out_elements}
{
}


dvec3 ElementFactory::to_model(const dvec2& plan, double z) const
{
	return dvec3 {
		unit::to_model_length(plan.x, m_units),
		unit::to_model_length(plan.y, m_units),
		unit::to_model_length(z, m_units)
	};
}


std::string ElementFactory::next_name(CounterMap& counters, char prefix, std::string_view level)
{
	uint32_t& counter = counters[std::string {level}];
	++counter;

	char number_buffer[16];
	std::snprintf(number_buffer, sizeof(number_buffer), "%u", counter);

	std::string name;
	name.reserve(level.size() + 12);
	name += prefix;
	name += number_buffer;
	name += '_';
	name += level;
	return name;
}


void ElementFactory::column(const dvec2& plan, double z_bottom, double z_top, std::string_view section, std::string_view level)
{
	ColumnGeom& column = m_elements.columns.emplace_back();

	column.start     = to_model(plan, z_bottom);
	column.end       = to_model(plan, z_top);
	column.section   = section;
	column.level     = level;
	column.user_name = next_name(m_column_counters, 'C', level);
}


void ElementFactory::wall(const dvec2& start, const dvec2& end, double z_bottom, double z_top, std::string_view section, std::string_view level)
{
	WallGeom& wall = m_elements.walls.emplace_back();

	wall.vertices[0] = to_model(start, z_bottom);
	wall.vertices[1] = to_model(end,   z_bottom);
	wall.vertices[2] = to_model(end,   z_top);
	wall.vertices[3] = to_model(start, z_top);
	wall.section     = section;
	wall.level       = level;
	wall.user_name   = next_name(m_wall_counters, 'W', level);
}


void ElementFactory::beam(const dvec2& start, const dvec2& end, double z, std::string_view section, std::string_view level)
{
	BeamGeom& beam = m_elements.beams.emplace_back();

	beam.start     = to_model(start, z);
	beam.end       = to_model(end,   z);
	beam.section   = section;
	beam.level     = level;
	beam.user_name = next_name(m_beam_counters, 'B', level);
}


void ElementFactory::slab(const pln::Polyline3& outline, double z, std::string_view section, std::string_view level, double sdl, double live)
{
	size_t vertex_count = outline.size();
	if (vertex_count > 1 && glm::length(math::drop(outline[0]) - math::drop(outline[vertex_count - 1])) <= math::length_epsilon) {
		--vertex_count;
	}

	if (vertex_count < 3) {
		TCT_WARN(
			log::LogCategory::extrude,
			"[element_factory][slab] outline skipped, too few vertices [level %.*s][vertices %zu]",
			static_cast<int>(level.size()),
			level.data(),
			vertex_count
		);
		return;
	}

	SlabGeom& slab = m_elements.slabs.emplace_back();

	slab.vertices.reserve(vertex_count);
	for (size_t i = 0; i < vertex_count; ++i) {
		slab.vertices.emplace_back(to_model(math::drop(outline[i]), z));
	}

	slab.section   = section;
	slab.level     = level;
	slab.user_name = next_name(m_slab_counters, 'S', level);
	slab.sdl       = unit::to_model_load(sdl,  m_units, true);
	slab.live      = unit::to_model_load(live, m_units, true);
}


} // tct::ext
