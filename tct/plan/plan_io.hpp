#pragma once

#include <string_view>

#include "mtp_memory.hpp"

#include "fault.hpp"
#include "plan_data.hpp"


namespace tct::pln {


// unreadable or corrupt drawings fail with FaultKind::document_read
[[nodiscard]] bool read_plan(const char* file_path, PlanDoc& out_doc, Fault& out_fault);


/* layer names match exactly; an unknown layer yields an empty result */

[[nodiscard]] mtp::vault<dvec3, mtp::default_set> points_on_layer(const PlanDoc& doc, std::string_view layer);

[[nodiscard]] mtp::vault<Segment3, mtp::default_set> lines_on_layer(const PlanDoc& doc, std::string_view layer);

[[nodiscard]] mtp::vault<Polyline3, mtp::default_set> polygons_on_layer(const PlanDoc& doc, std::string_view layer, bool closed_only);


} // tct::pln
