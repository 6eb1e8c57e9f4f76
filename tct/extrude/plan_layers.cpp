#include "plan_layers.hpp"

#include "log.hpp"
#include "math.hpp"
#include "plan_io.hpp"


namespace tct::ext {


namespace {


	void append_segments(
		const pln::PlanDoc&                            doc,
		const std::string&                             layer,
		Direction                                      direction,
		mtp::vault<DirectedSegment, mtp::default_set>& out_segments
	)
	{
		if (layer.empty())
			return;

		size_t degenerate_count = 0;

		for (const pln::Segment3& segment : pln::lines_on_layer(doc, layer)) {
			if (math::is_degenerate(math::drop(segment.start), math::drop(segment.end))) {
				++degenerate_count;
				continue;
			}
			out_segments.emplace_back(DirectedSegment {.segment = segment, .direction = direction});
		}

		if (degenerate_count > 0) {
			TCT_WARN(
				log::LogCategory::extrude,
				"[plan_layers][append_segments] zero-length lines dropped [layer %s][count %zu]",
				layer.c_str(),
				degenerate_count
			);
		}
	}
}


PlanLayerSet collect_layers(const pln::PlanDoc& doc, const LayerNames& layers)
{
	PlanLayerSet layer_set;

	layer_set.rect_points = pln::points_on_layer(doc, layers.rect_columns);
	layer_set.circ_points = pln::points_on_layer(doc, layers.circ_columns);

	append_segments(doc, layers.walls,   Direction::none, layer_set.walls);
	append_segments(doc, layers.walls_x, Direction::x,    layer_set.walls);
	append_segments(doc, layers.walls_y, Direction::y,    layer_set.walls);

	append_segments(doc, layers.beams,   Direction::none, layer_set.beams);
	append_segments(doc, layers.beams_x, Direction::x,    layer_set.beams);
	append_segments(doc, layers.beams_y, Direction::y,    layer_set.beams);

	layer_set.slabs = pln::polygons_on_layer(doc, layers.slabs, layers.is_slab_closed_only);

	TCT_INFO(
		log::LogCategory::extrude,
		"[plan_layers][collect_layers] ok [path %s][rect %zu][circ %zu][walls %zu][beams %zu][slabs %zu]",
		doc.path.c_str(),
		layer_set.rect_points.size(),
		layer_set.circ_points.size(),
		layer_set.walls.size(),
		layer_set.beams.size(),
		layer_set.slabs.size()
	);

	return layer_set;
}


} // tct::ext
