#include <cstdio>
#include <cstring>

#include "mtp_memory.hpp"

#include "log.hpp"
#include "fault.hpp"
#include "pipeline.hpp"
#include "run_config.hpp"
#include "transcript_host.hpp"


namespace {


	constexpr int exit_ok    = 0;
	constexpr int exit_fault = 1;
	constexpr int exit_usage = 2;


	void print_usage(const char* program)
	{
		std::fprintf(stderr, "usage: %s <run.toml>\n", program);
	}


	int report_fault(const tct::Fault& fault)
	{
		TCT_FATAL(
			tct::log::LogCategory::core,
			"[entry] %s [status %d] %s",
			tct::fault_name(fault.kind),
			fault.status,
			fault.context.c_str()
		);
		return exit_fault;
	}


	void print_summary(const tct::Pipeline& pipeline)
	{
		const tct::hst::BuildReport& report = pipeline.report();
		const tct::ext::ExtrudeStats& stats = pipeline.extrude_stats();

		std::printf("stories          %u\n", report.stories);
		std::printf("materials        %u\n", report.materials);
		std::printf("frame sections   %u (skipped %u)\n", report.frame_sections, report.skipped_sections);
		std::printf("area sections    %u\n", report.area_sections);
		std::printf("columns          %u created, %u failed\n", report.columns.created, report.columns.failed);
		std::printf("walls            %u created, %u failed\n", report.walls.created, report.walls.failed);
		std::printf("beams            %u created, %u failed\n", report.beams.created, report.beams.failed);
		std::printf("slabs            %u created, %u failed\n", report.slabs.created, report.slabs.failed);
		std::printf("slab loads       %u assigned, %u failed\n", report.loads_assigned, report.loads_failed);
		std::printf("default sections %u, unlabeled segments %u\n", stats.defaulted_sections, stats.unlabeled_segments);

		const tct::log::LogTally tally = tct::log::tally();
		for (size_t category = 0; category < tct::log::category_count; ++category) {
			const uint32_t warn_count  = tally[category][static_cast<size_t>(tct::log::LogLevel::warn)];
			const uint32_t error_count = tally[category][static_cast<size_t>(tct::log::LogLevel::error)];
			if (warn_count == 0 && error_count == 0)
				continue;

			std::printf(
				"%-16s %u warnings, %u errors\n",
				tct::log::category_name(static_cast<tct::log::LogCategory>(category)),
				warn_count,
				error_count
			);
		}
	}


	int run(const char* config_path)
	{
		tct::Fault fault;

		tct::RunConfig config;
		if (!tct::read_run_config(config_path, config, fault))
			return report_fault(fault);

		tct::log::set_level(config.log_level);
		if (!config.log_file.empty() && !tct::log::open_file(config.log_file.c_str())) {
			TCT_WARN(
				tct::log::LogCategory::core,
				"[entry] log file not opened, stderr only [path %s]",
				config.log_file.c_str()
			);
		}

		tct::Pipeline pipeline {config};
		tct::hst::TranscriptHost host;

		if (!pipeline.run(host, fault))
			return report_fault(fault);

		if (!host.write(config.transcript_path.c_str())) {
			return report_fault(tct::Fault {
				.kind    = tct::FaultKind::host_status,
				.status  = tct::hst::host_rejected,
				.context = "transcript not written: " + config.transcript_path
			});
		}

		print_summary(pipeline);
		return exit_ok;
	}
}


int main(int argc, char** argv)
{
	if (argc != 2 || std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
		print_usage(argc > 0 ? argv[0] : "tecton");
		return exit_usage;
	}

	mtp::init_tls<mtp::default_set>();
	tct::log::initialize(tct::log::LogLevel::info);

	const int exit_code = run(argv[1]);

	tct::log::shutdown();
	mtp::get_tls_allocator<mtp::default_set>().reset();

	return exit_code;
}
