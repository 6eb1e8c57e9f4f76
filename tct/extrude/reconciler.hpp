#pragma once

#include <span>
#include <cstdint>
#include <optional>

#include "mtp_memory.hpp"

#include "story_ledger.hpp"
#include "plan_layers.hpp"
#include "section_index.hpp"
#include "element_factory.hpp"


namespace tct::ext {


/* one story's vertical extent from a walk over the height list, input units */
struct BlindSpan
{
	double z_bottom {0.0};
	double z_top    {0.0};
};


enum class ElementKind : uint8_t
{
	column = 0,
	wall   = 1,
	beam   = 2,
	slab   = 3
};


[[nodiscard]] mtp::vault<BlindSpan, mtp::default_set> walk_heights(std::span<const double> heights, double base_elevation);


/*
 * Whole-building extrusion. Every primitive is carried through every span
 * without regard to the section tables, then each segment is labeled back
 * onto a story through the elevation frame.
 */
class Reconciler
{
public:

	Reconciler(const sty::ElevationFrame& frame, const SectionIndex& sections);

	// columns and walls by bottom elevation on the floor map, beams and slabs by top elevation on the ceiling map
	[[nodiscard]] std::optional<uint32_t> recover_story(const BlindSpan& span, ElementKind kind) const;

	void run(const PlanLayerSet& layer_set, std::span<const BlindSpan> spans, ElementFactory& factory);

	[[nodiscard]] uint32_t unlabeled_count() const
	{
		return m_unlabeled_count;
	}

private:

	[[nodiscard]] std::optional<uint32_t> label(const BlindSpan& span, ElementKind kind);

private:

	const sty::ElevationFrame& m_frame;
	const SectionIndex&        m_sections;

	uint32_t m_unlabeled_count {0};
};


} // tct::ext
