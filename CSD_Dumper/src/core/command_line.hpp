#pragma once
#include "core/csd_status.hpp"
#include "layout/dump_options.hpp"

#include <cstdio>
#include <string>

// ============================================================================
// Command Line
// ============================================================================

#ifndef CSD_VERSION
#define CSD_VERSION "0.0.0"
#endif

namespace CSD {
namespace Cli {

struct CommandLine {
    std::string binary_file = "libil2cpp.so";
    std::string metadata_file = "global-metadata.dat";
    std::string log_file;               // Empty: console only
    Layout::DumpOptions options;
    bool show_help = false;
    bool show_version = false;
};

/// Parse argv (argv[0] is skipped). Unknown flags, missing values and
/// unknown layout/sort names fail with Status::InvalidArguments; `detail`
/// holds the message for the user.
Result<CommandLine> ParseCommandLine(int argc, const char* const argv[]);

/// $HOME/Unity/Hub/Editor/*
std::string DefaultToolchainRoot();

/// <root>/Editor/Data/Resources/PackageManager/ProjectTemplates/libcache/com.unity.template.3d-*/ScriptAssemblies
std::string DefaultToolchainAssembliesRoot(const std::string& toolchain_root);

void PrintBanner(FILE* out);
void PrintUsage(FILE* out);

} // namespace Cli
} // namespace CSD
