#pragma once

#include <string>
#include <cstdint>
#include <string_view>

#define TOML_HEADER_ONLY 1
#define TOML_EXCEPTIONS 0
#define TOML_ENABLE_FORMATTERS 1

#include <toml++/toml.hpp>

#include "mtp_memory.hpp"
#include "model_host.hpp"


namespace tct::hst {


inline constexpr int32_t host_rejected = 1;


/*
 * ModelHost that records every call as a TOML table, in call order, for a
 * bridge process to replay against the analysis application.
 * It checks the references the application would check: materials and
 * sections must exist, areas need three vertices, loads need an area.
 */
class TranscriptHost : public ModelHost
{
public:

	TranscriptHost();

	int32_t set_present_units(int32_t unit_code) override;

	int32_t set_stories(double base_elevation, std::span<const StoryRow> stories) override;

	int32_t set_material(std::string_view name, MaterialType type) override;
	int32_t set_isotropic(std::string_view name, double modulus, double poisson, double thermal) override;
	int32_t set_unit_weight(std::string_view name, double unit_weight) override;
	int32_t set_concrete(std::string_view name, double fc) override;

	int32_t set_rectangle(std::string_view name, std::string_view material, double depth, double width) override;
	int32_t set_circle(std::string_view name, std::string_view material, double diameter) override;
	int32_t set_column_rebar(const ColumnRebar& rebar) override;
	int32_t set_beam_rebar(const BeamRebar& rebar) override;

	int32_t set_wall(
		std::string_view name,
		int32_t          prop_type,
		int32_t          shell_type,
		std::string_view material,
		double           thickness
	) override;

	int32_t set_slab(
		std::string_view name,
		int32_t          prop_type,
		int32_t          shell_type,
		std::string_view material,
		double           thickness
	) override;

	int32_t add_frame(
		const dvec3&     point_i,
		const dvec3&     point_j,
		std::string_view section,
		std::string_view user_name,
		std::string&     out_name
	) override;

	int32_t add_area(
		std::span<const dvec3> vertices,
		std::string_view       section,
		std::string_view       user_name,
		std::string&           out_name
	) override;

	int32_t set_area_load(std::string_view area_name, std::string_view pattern, double value) override;

	int32_t frame_section_names(NameList& out_names) override;
	int32_t area_section_names(NameList& out_names) override;

	[[nodiscard]] size_t call_count() const
	{
		return m_calls.size();
	}

	[[nodiscard]] const toml::array& calls() const
	{
		return m_calls;
	}

	[[nodiscard]] std::string to_toml() const;

	[[nodiscard]] bool write(const char* file_path) const;

private:

	using NameSet = decltype(mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>());

	toml::table& record(std::string_view op);

	[[nodiscard]] static bool contains(const NameSet& names, std::string_view name);

	static void insert(NameSet& names, std::string_view name);

	[[nodiscard]] int32_t reject(std::string_view op, std::string_view name, const char* reason);

private:

	toml::array m_calls;

	int32_t m_unit_code {0};

	NameSet m_materials      {mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>()};
	NameSet m_frame_sections {mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>()};
	NameSet m_area_sections  {mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>()};
	NameSet m_areas          {mtp::make_unordered_map<std::string, uint32_t, mtp::default_set>()};

	uint32_t m_frame_counter {0};
	uint32_t m_area_counter  {0};
};


} // tct::hst
