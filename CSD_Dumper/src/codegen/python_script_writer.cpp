#include "python_script_writer.hpp"
#include "core/csd_log.h"

#include <filesystem>
#include <fstream>

namespace CSD {
namespace Codegen {

static std::string PythonStringLiteral(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += "\"";
    return out;
}

Result<void> PythonScriptWriter::WriteScriptToFile(const Model::TypeModel& model, const std::string& path) {
    std::filesystem::path script_path(path);
    if (script_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(script_path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Failed to create directory %s: %s",
                      script_path.parent_path().string().c_str(), ec.message().c_str());
            return Result<void>::Fail(Status::WriteFailed, script_path.parent_path().string());
        }
    }

    std::ofstream out(script_path);
    if (!out.is_open()) {
        LOG_ERROR("Failed to write: %s", path.c_str());
        return Result<void>::Fail(Status::WriteFailed, path);
    }

    out << "# Generated by CSD Dumper\n";
    out << "# Image: " << model.image_name << "\n\n";
    out << "image_name = " << PythonStringLiteral(model.image_name) << "\n\n";
    out << "types = [\n";
    for (const auto& type : model.types) {
        out << "    (" << type.index << ", " << PythonStringLiteral(type.FullName()) << "),\n";
    }
    out << "]\n";

    out.close();
    if (out.fail()) {
        LOG_ERROR("Failed to write: %s", path.c_str());
        return Result<void>::Fail(Status::WriteFailed, path);
    }
    return Result<void>::Ok();
}

} // namespace Codegen
} // namespace CSD
