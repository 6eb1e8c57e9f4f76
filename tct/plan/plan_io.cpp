#include "plan_io.hpp"

#include <cstdio>

#include "libdxfrw.h"
#include "drw_interface.h"

#include "log.hpp"


namespace tct::pln {


namespace {


	static constexpr int polyline_closed_flag   = 0x01;
	static constexpr int polyline_mesh_flag     = 0x10;
	static constexpr int polyline_polyface_flag = 0x40;


	[[nodiscard]] dvec3 to_dvec3(const DRW_Coord& coord)
	{
		return dvec3 {coord.x, coord.y, coord.z};
	}


	/* collects model-space POINT / LINE / LWPOLYLINE / POLYLINE; everything else is ignored */
	class PlanCollector : public DRW_Interface
	{
	public:

		explicit PlanCollector(PlanDoc& plan_doc)
			: m_plan_doc {plan_doc}
		{
		}

		[[nodiscard]] size_t skipped_block_entities() const
		{
			return m_skipped_block_entities;
		}

		void addHeader(const DRW_Header* /*data*/) override {}
		void addLType(const DRW_LType& /*data*/) override {}
		void addLayer(const DRW_Layer& /*data*/) override {}
		void addDimStyle(const DRW_Dimstyle& /*data*/) override {}
		void addVport(const DRW_Vport& /*data*/) override {}
		void addView(const DRW_View& /*data*/) override {}
		void addUCS(const DRW_UCS& /*data*/) override {}
		void addTextStyle(const DRW_Textstyle& /*data*/) override {}
		void addAppId(const DRW_AppId& /*data*/) override {}

		void addBlock(const DRW_Block& /*data*/) override
		{
			m_is_in_block = true;
		}

		void setBlock(const int /*handle*/) override {}

		void endBlock() override
		{
			m_is_in_block = false;
		}

		void addPoint(const DRW_Point& data) override
		{
			if (skip_in_block())
				return;

			m_plan_doc.points.emplace_back(PlanPoint {
				.layer    = data.layer,
				.location = to_dvec3(data.basePoint)
			});
		}

		void addLine(const DRW_Line& data) override
		{
			if (skip_in_block())
				return;

			m_plan_doc.lines.emplace_back(PlanLine {
				.layer   = data.layer,
				.segment = Segment3 {
					.start = to_dvec3(data.basePoint),
					.end   = to_dvec3(data.secPoint)
				}
			});
		}

		void addLWPolyline(const DRW_LWPolyline& data) override
		{
			if (skip_in_block())
				return;

			PlanPolyline& polyline = m_plan_doc.polylines.emplace_back();
			polyline.layer  = data.layer;
			polyline.closed = (data.flags & polyline_closed_flag) != 0;

			polyline.vertices.reserve(data.vertlist.size());
			for (const auto& vertex : data.vertlist) {
				// lightweight polylines are planar, z stays at the drawing datum
				polyline.vertices.emplace_back(dvec3 {vertex->x, vertex->y, 0.0});
			}
		}

		void addPolyline(const DRW_Polyline& data) override
		{
			if (skip_in_block())
				return;

			if ((data.flags & (polyline_mesh_flag | polyline_polyface_flag)) != 0) {
				TCT_DEBUG(
					log::LogCategory::plan,
					"[plan_io][addPolyline] mesh polyline skipped [layer %s][flags %d]",
					data.layer.c_str(),
					data.flags
				);
				return;
			}

			PlanPolyline& polyline = m_plan_doc.polylines.emplace_back();
			polyline.layer  = data.layer;
			polyline.closed = (data.flags & polyline_closed_flag) != 0;

			polyline.vertices.reserve(data.vertlist.size());
			for (const auto& vertex : data.vertlist) {
				polyline.vertices.emplace_back(to_dvec3(vertex->basePoint));
			}
		}

		void addRay(const DRW_Ray& /*data*/) override {}
		void addXline(const DRW_Xline& /*data*/) override {}
		void addArc(const DRW_Arc& /*data*/) override {}
		void addCircle(const DRW_Circle& /*data*/) override {}
		void addEllipse(const DRW_Ellipse& /*data*/) override {}
		void addSpline(const DRW_Spline* /*data*/) override {}
		void addKnot(const DRW_Entity& /*data*/) override {}
		void addInsert(const DRW_Insert& /*data*/) override {}
		void addTrace(const DRW_Trace& /*data*/) override {}
		void add3dFace(const DRW_3Dface& /*data*/) override {}
		void addSolid(const DRW_Solid& /*data*/) override {}
		void addMText(const DRW_MText& /*data*/) override {}
		void addText(const DRW_Text& /*data*/) override {}
		void addTolerance(const DRW_Tolerance& /*tol*/) override {}
		void addDimAlign(const DRW_DimAligned* /*data*/) override {}
		void addDimLinear(const DRW_DimLinear* /*data*/) override {}
		void addDimRadial(const DRW_DimRadial* /*data*/) override {}
		void addDimDiametric(const DRW_DimDiametric* /*data*/) override {}
		void addDimAngular(const DRW_DimAngular* /*data*/) override {}
		void addDimAngular3P(const DRW_DimAngular3p* /*data*/) override {}
		void addDimOrdinate(const DRW_DimOrdinate* /*data*/) override {}
		void addLeader(const DRW_Leader* /*data*/) override {}
		void addHatch(const DRW_Hatch* /*data*/) override {}
		void addViewport(const DRW_Viewport& /*data*/) override {}
		void addImage(const DRW_Image* /*data*/) override {}
		void linkImage(const DRW_ImageDef* /*data*/) override {}
		void addComment(const char* /*comment*/) override {}
		void addPlotSettings(const DRW_PlotSettings* /*data*/) override {}

		/* read only */
		void writeHeader(DRW_Header& /*data*/) override {}
		void writeBlocks() override {}
		void writeBlockRecords() override {}
		void writeEntities() override {}
		void writeLTypes() override {}
		void writeLayers() override {}
		void writeTextstyles() override {}
		void writeVports() override {}
		void writeDimstyles() override {}
		void writeObjects() override {}
		void writeAppId() override {}
		void writeViews() override {}
		void writeUCSs() override {}

	private:

		[[nodiscard]] bool skip_in_block()
		{
			if (m_is_in_block) {
				++m_skipped_block_entities;
				return true;
			}
			return false;
		}

	private:

		PlanDoc& m_plan_doc;

		bool   m_is_in_block            {false};
		size_t m_skipped_block_entities {0};
	};
}


bool read_plan(const char* file_path, PlanDoc& out_doc, Fault& out_fault)
{
	TCT_ASSERT_MSG(file_path, "file_path == null");

	TCT_INFO(
		log::LogCategory::plan,
		"[plan_io][read_plan] begin... [path %s]",
		file_path
	);

	out_doc = PlanDoc {};
	out_doc.path = file_path;

	FILE* file_handle = std::fopen(file_path, "rb");
	if (!file_handle) {
		TCT_ERROR(
			log::LogCategory::plan,
			"[plan_io][read_plan] fopen fail [path %s]",
			file_path
		);
		return raise(out_fault, FaultKind::document_read, 0, "%s: not a readable file", file_path);
	}
	std::fclose(file_handle);

	PlanCollector collector {out_doc};

	dxfRW dxf_reader {file_path};
	if (!dxf_reader.read(&collector, false)) {
		TCT_ERROR(
			log::LogCategory::plan,
			"[plan_io][read_plan] dxf parse fail [path %s]",
			file_path
		);
		out_doc = PlanDoc {};
		return raise(out_fault, FaultKind::document_read, 0, "%s: invalid or corrupt DXF file", file_path);
	}

	if (collector.skipped_block_entities() > 0) {
		TCT_DEBUG(
			log::LogCategory::plan,
			"[plan_io][read_plan] block entities skipped [path %s][count %zu]",
			file_path,
			collector.skipped_block_entities()
		);
	}

	TCT_INFO(
		log::LogCategory::plan,
		"[plan_io][read_plan] ok [path %s][points %zu][lines %zu][polylines %zu]",
		file_path,
		out_doc.points.size(),
		out_doc.lines.size(),
		out_doc.polylines.size()
	);

	return true;
}


mtp::vault<dvec3, mtp::default_set> points_on_layer(const PlanDoc& doc, std::string_view layer)
{
	mtp::vault<dvec3, mtp::default_set> points;

	for (const PlanPoint& point : doc.points) {
		if (point.layer == layer) {
			points.emplace_back(point.location);
		}
	}
	return points;
}


mtp::vault<Segment3, mtp::default_set> lines_on_layer(const PlanDoc& doc, std::string_view layer)
{
	mtp::vault<Segment3, mtp::default_set> segments;

	for (const PlanLine& line : doc.lines) {
		if (line.layer == layer) {
			segments.emplace_back(line.segment);
		}
	}
	return segments;
}


mtp::vault<Polyline3, mtp::default_set> polygons_on_layer(const PlanDoc& doc, std::string_view layer, bool closed_only)
{
	mtp::vault<Polyline3, mtp::default_set> polygons;

	for (const PlanPolyline& polyline : doc.polylines) {
		if (polyline.layer != layer)
			continue;
		if (closed_only && !polyline.closed)
			continue;

		Polyline3& vertices = polygons.emplace_back();
		vertices.reserve(polyline.vertices.size());
		for (const dvec3& vertex : polyline.vertices) {
			vertices.emplace_back(vertex);
		}
	}
	return polygons;
}


} // tct::pln
