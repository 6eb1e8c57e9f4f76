#include "reconciler.hpp"

#include "log.hpp"
#include "math.hpp"


namespace tct::ext {


namespace {


	[[nodiscard]] const char* kind_name(ElementKind kind)
	{
		switch (kind) {
		case ElementKind::column: return "column";
		case ElementKind::wall:   return "wall";
		case ElementKind::beam:   return "beam";
		case ElementKind::slab:   return "slab";
		}
		return "element";
	}
}


mtp::vault<BlindSpan, mtp::default_set> walk_heights(std::span<const double> heights, double base_elevation)
{
	mtp::vault<BlindSpan, mtp::default_set> spans;
	spans.reserve(heights.size());

	double z_bottom = base_elevation;
	for (double height : heights) {
		const double z_top = z_bottom + height;
		spans.emplace_back(BlindSpan {.z_bottom = z_bottom, .z_top = z_top});
		z_bottom = z_top;
	}
	return spans;
}


Reconciler::Reconciler(const sty::ElevationFrame& frame, const SectionIndex& sections)
	: m_frame    {frame}
	, m_sections {sections}
{
}


std::optional<uint32_t> Reconciler::recover_story(const BlindSpan& span, ElementKind kind) const
{
	switch (kind) {
	case ElementKind::column:
	case ElementKind::wall:
		return sty::story_at_elevation(m_frame, span.z_bottom, sty::ElevationUse::floor);
	case ElementKind::beam:
	case ElementKind::slab:
		return sty::story_at_elevation(m_frame, span.z_top, sty::ElevationUse::ceiling);
	}
	return std::nullopt;
}


std::optional<uint32_t> Reconciler::label(const BlindSpan& span, ElementKind kind)
{
	auto story_index = recover_story(span, kind);
	if (!story_index) {
		++m_unlabeled_count;
		TCT_WARN(
			log::LogCategory::extrude,
			"[reconciler][label] no story for %s segment, section %s [bottom %g][top %g]",
			kind_name(kind),
			default_section,
			span.z_bottom,
			span.z_top
		);
	}
	return story_index;
}


void Reconciler::run(const PlanLayerSet& layer_set, std::span<const BlindSpan> spans, ElementFactory& factory)
{
	TCT_INFO(
		log::LogCategory::extrude,
		"[reconciler][run] begin... [spans %zu]",
		spans.size()
	);

	m_unlabeled_count = 0;

	auto column_pass = [&](const mtp::vault<dvec3, mtp::default_set>& points, ColumnShape shape)
	{
		for (const dvec3& point : points) {
			for (const BlindSpan& span : spans) {
				auto story_index = label(span, ElementKind::column);

				std::string_view section = default_section;
				std::string_view level   = unknown_level;
				if (story_index) {
					section = m_sections.column_section(sty::LevelId {*story_index}, shape);
					level   = m_frame.level_at(*story_index);
				}
				factory.column(math::drop(point), span.z_bottom, span.z_top, section, level);
			}
		}
	};

	column_pass(layer_set.rect_points, ColumnShape::rect);
	column_pass(layer_set.circ_points, ColumnShape::circ);

	for (const DirectedSegment& wall : layer_set.walls) {
		for (const BlindSpan& span : spans) {
			auto story_index = label(span, ElementKind::wall);

			std::string_view section = default_section;
			std::string_view level   = unknown_level;
			if (story_index) {
				section = m_sections.wall_section(sty::LevelId {*story_index}, wall.direction);
				level   = m_frame.level_at(*story_index);
			}
			factory.wall(
				math::drop(wall.segment.start),
				math::drop(wall.segment.end),
				span.z_bottom,
				span.z_top,
				section,
				level
			);
		}
	}

	for (const DirectedSegment& beam : layer_set.beams) {
		for (const BlindSpan& span : spans) {
			auto story_index = label(span, ElementKind::beam);

			std::string_view section = default_section;
			std::string_view level   = unknown_level;
			if (story_index) {
				section = m_sections.beam_section(sty::LevelId {*story_index}, beam.direction);
				level   = m_frame.level_at(*story_index);
			}
			factory.beam(math::drop(beam.segment.start), math::drop(beam.segment.end), span.z_top, section, level);
		}
	}

	for (const pln::Polyline3& outline : layer_set.slabs) {
		for (const BlindSpan& span : spans) {
			auto story_index = label(span, ElementKind::slab);

			const tbl::Slab* slab_record = nullptr;
			std::string_view level = unknown_level;
			if (story_index) {
				slab_record = m_sections.slab_record(sty::LevelId {*story_index});
				level       = m_frame.level_at(*story_index);
			}

			if (slab_record) {
				factory.slab(outline, span.z_top, slab_record->name, level, slab_record->sdl, slab_record->live);
			}
			else {
				factory.slab(outline, span.z_top, default_section, level, 0.0, 0.0);
			}
		}
	}

	TCT_INFO(
		log::LogCategory::extrude,
		"[reconciler][run] ok [unlabeled %u]",
		m_unlabeled_count
	);
}


} // tct::ext
