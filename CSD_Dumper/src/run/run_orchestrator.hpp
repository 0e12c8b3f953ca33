#pragma once
#include "codegen/source_renderer.hpp"
#include "core/benchmark.hpp"
#include "core/csd_status.hpp"
#include "layout/dump_options.hpp"
#include "layout/layout_dispatch.hpp"
#include "model/analyzer.hpp"
#include "paths/filesystem_probe.hpp"

#include <string>
#include <utility>

// ============================================================================
// Run Orchestrator
// ============================================================================
// One dump run, strictly sequential:
//   1. binary, then metadata must exist
//   2. solution mode: resolve + probe the toolchain paths
//   3. analyze once, then per image in discovery order:
//      build model -> plan paths -> dispatch C# layout -> write script
// A failing image stops the run; artifacts of earlier images are kept.

namespace CSD {
namespace Run {

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_FAILED = 1,
};

// Files whose presence marks a usable toolchain install
constexpr const char* TOOLCHAIN_MARKER_FILE = "Editor/Data/Managed/UnityEditor.dll";
constexpr const char* TOOLCHAIN_ASSEMBLIES_MARKER_FILE = "UnityEngine.UI.dll";

struct Collaborators {
    Model::Analyzer& analyzer;
    Model::ModelBuilder& model_builder;
    Codegen::SourceRenderer& source_renderer;
    Codegen::ScriptRenderer& script_renderer;
    const Paths::FilesystemProbe& probe;
};

struct RunReport {
    Status status = Status::OK;
    std::string detail;                 // Missing path, failing image, ...
    size_t images_found = 0;
    size_t images_completed = 0;
    Layout::ToolchainPaths toolchain;   // Resolved paths (solution mode only)
};

class RunOrchestrator {
public:
    explicit RunOrchestrator(const Collaborators& collaborators,
                             Benchmark::Sink timing_sink = &Benchmark::LogSink)
        : m_collaborators(collaborators), m_timing_sink(std::move(timing_sink)) {}

    int Run(const std::string& binary_file, const std::string& metadata_file,
            const Layout::DumpOptions& options);

    /// Outcome of the last Run() call.
    const RunReport& GetLastReport() const { return m_report; }

private:
    Result<Layout::ToolchainPaths> ResolveToolchain(const Layout::DumpOptions& options);
    Result<std::string> ResolveAndProbe(const std::string& configured, const char* marker_file,
                                        const char* description);
    int Fail(Status status, const std::string& detail);

    Collaborators m_collaborators;
    Benchmark::Sink m_timing_sink;
    RunReport m_report;
};

} // namespace Run
} // namespace CSD
