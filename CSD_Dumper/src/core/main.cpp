// ==============================
// CSD Dumper - Entry Point
// ==============================

#include "codegen/csharp_renderer.hpp"
#include "codegen/python_script_writer.hpp"
#include "core/command_line.hpp"
#include "core/csd_log.h"
#include "model/listing_analyzer.hpp"
#include "model/model_builder.hpp"
#include "paths/filesystem_probe.hpp"
#include "run/run_orchestrator.hpp"

#include <cstdio>

using namespace CSD;

int main(int argc, char* argv[]) {
    Cli::PrintBanner(stdout);

    auto parsed = Cli::ParseCommandLine(argc, argv);
    if (!parsed) {
        fprintf(stderr, "%s\n\n", parsed.detail.c_str());
        Cli::PrintUsage(stderr);
        return Run::EXIT_FAILED;
    }

    const Cli::CommandLine& cmd = parsed.value;
    if (cmd.show_help) {
        Cli::PrintUsage(stdout);
        return Run::EXIT_OK;
    }
    if (cmd.show_version) {
        return Run::EXIT_OK;
    }

    if (!cmd.log_file.empty() && !csd_log_open_file(cmd.log_file)) {
        LOG_WARN("Could not open log file %s, logging to console only", cmd.log_file.c_str());
    }

    LOG_INFO("=== Dump ===");
    LOG_INFO("Binary: %s", cmd.binary_file.c_str());
    LOG_INFO("Metadata: %s", cmd.metadata_file.c_str());
    LOG_INFO("Layout: %s, sort: %s%s", Layout::ToString(cmd.options.layout), Layout::ToString(cmd.options.sort),
             cmd.options.create_solution ? " (solution)" : "");

    Model::ListingAnalyzer analyzer;
    Model::DefaultModelBuilder model_builder;
    Codegen::CSharpRenderer source_renderer;
    Codegen::PythonScriptWriter script_renderer;
    Paths::DiskProbe probe;

    Run::RunOrchestrator orchestrator({ analyzer, model_builder, source_renderer, script_renderer, probe });
    int exit_code = orchestrator.Run(cmd.binary_file, cmd.metadata_file, cmd.options);

    const Run::RunReport& report = orchestrator.GetLastReport();
    if (exit_code == Run::EXIT_OK) {
        LOG_INFO("=== Done: %zu image(s), %zu file(s) written ===",
                 report.images_completed, source_renderer.GetGeneratedFiles().size());
    } else {
        LOG_ERROR("=== Failed: %s %s (%zu of %zu image(s) completed) ===",
                  to_string(report.status), report.detail.c_str(),
                  report.images_completed, report.images_found);
    }

    csd_log_close_file();
    return exit_code;
}
