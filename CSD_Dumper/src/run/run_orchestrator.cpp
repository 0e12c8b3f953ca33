#include "run_orchestrator.hpp"
#include "core/csd_log.h"
#include "paths/artifact_path.hpp"
#include "paths/wildcard_path.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace CSD {
namespace Run {

int RunOrchestrator::Fail(Status status, const std::string& detail) {
    m_report.status = status;
    m_report.detail = detail;
    return EXIT_FAILED;
}

Result<std::string> RunOrchestrator::ResolveAndProbe(const std::string& configured, const char* marker_file,
                                                     const char* description) {
    std::string absolute = configured;
    std::error_code ec;
    auto full = std::filesystem::absolute(configured, ec);
    if (!ec) absolute = full.string();

    auto resolved = Paths::ResolveWildcardPath(absolute, m_collaborators.probe);
    if (!resolved) {
        return resolved;
    }

    const std::string& path = resolved.value;
    if (!m_collaborators.probe.DirectoryExists(path)) {
        LOG_ERROR("%s path %s does not exist", description, path.c_str());
        return Result<std::string>::Fail(Status::InputNotFound, path);
    }

    std::string marker = (std::filesystem::path(path) / marker_file).string();
    if (!m_collaborators.probe.FileExists(marker)) {
        LOG_ERROR("No %s found at %s (missing %s)", description, path.c_str(), marker_file);
        return Result<std::string>::Fail(Status::InputNotFound, marker);
    }
    return resolved;
}

Result<Layout::ToolchainPaths> RunOrchestrator::ResolveToolchain(const Layout::DumpOptions& options) {
    Layout::ToolchainPaths toolchain;

    auto root = ResolveAndProbe(options.toolchain_root, TOOLCHAIN_MARKER_FILE, "Unity editor");
    if (!root) return Result<Layout::ToolchainPaths>::Fail(root.status, root.detail);
    toolchain.root = root.value;

    auto assemblies = ResolveAndProbe(options.toolchain_assemblies_root, TOOLCHAIN_ASSEMBLIES_MARKER_FILE,
                                      "Unity assemblies");
    if (!assemblies) return Result<Layout::ToolchainPaths>::Fail(assemblies.status, assemblies.detail);
    toolchain.assemblies_root = assemblies.value;

    LOG_INFO("Using Unity editor at %s", toolchain.root.c_str());
    LOG_INFO("Using Unity assemblies at %s", toolchain.assemblies_root.c_str());
    return Result<Layout::ToolchainPaths>::Ok(toolchain);
}

int RunOrchestrator::Run(const std::string& binary_file, const std::string& metadata_file,
                         const Layout::DumpOptions& options) {
    m_report = RunReport{};

    // ---- Check inputs ----
    if (!m_collaborators.probe.FileExists(binary_file)) {
        LOG_ERROR("File %s does not exist", binary_file.c_str());
        return Fail(Status::InputNotFound, binary_file);
    }
    if (!m_collaborators.probe.FileExists(metadata_file)) {
        LOG_ERROR("File %s does not exist", metadata_file.c_str());
        return Fail(Status::InputNotFound, metadata_file);
    }

    // ---- Solution mode needs toolchain references ----
    if (options.create_solution) {
        auto toolchain = ResolveToolchain(options);
        if (!toolchain) return Fail(toolchain.status, toolchain.detail);
        m_report.toolchain = toolchain.value;
    }

    // ---- Analyze ----
    auto images = Benchmark::Measure("Analyze IL2CPP data", [&] {
        return m_collaborators.analyzer.LoadFromFile(binary_file, metadata_file);
    }, m_timing_sink);

    if (!images || images->empty()) {
        LOG_ERROR("Analysis of %s / %s produced no images", binary_file.c_str(), metadata_file.c_str());
        return Fail(Status::AnalysisFailure, metadata_file);
    }
    m_report.images_found = images->size();

    // ---- Per image, in discovery order ----
    for (size_t image_index = 0; image_index < images->size(); ++image_index) {
        const Model::Image& image = (*images)[image_index];

        Model::TypeModel model = Benchmark::Measure("Create type model", [&] {
            return m_collaborators.model_builder.BuildModel(image);
        }, m_timing_sink);

        const std::string cs_out = Paths::PlanArtifactPath(options.output_base_path, image_index);
        const std::string script_out = Paths::PlanArtifactPath(options.script_output_path, image_index);

        auto dispatched = Benchmark::Measure("Generate C# code", [&] {
            return Layout::Dispatch(image, model, options, cs_out,
                                    m_collaborators.source_renderer, m_report.toolchain);
        }, m_timing_sink);
        if (!dispatched) {
            LOG_ERROR("Image %zu (%s): C# output failed: %s %s", image_index, image.name.c_str(),
                      to_string(dispatched.status), dispatched.detail.c_str());
            return Fail(dispatched.status, dispatched.detail);
        }

        auto scripted = Benchmark::Measure("Generate Python script", [&] {
            return m_collaborators.script_renderer.WriteScriptToFile(model, script_out);
        }, m_timing_sink);
        if (!scripted) {
            LOG_ERROR("Image %zu (%s): script output failed: %s %s", image_index, image.name.c_str(),
                      to_string(scripted.status), scripted.detail.c_str());
            return Fail(scripted.status, scripted.detail);
        }

        LOG_INFO("Image %zu (%s): %zu types -> %s, %s", image_index, image.name.c_str(),
                 model.types.size(), cs_out.c_str(), script_out.c_str());
        m_report.images_completed++;
    }

    return EXIT_OK;
}

} // namespace Run
} // namespace CSD
