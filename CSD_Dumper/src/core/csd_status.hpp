#pragma once

// ==============================
// csd_status.hpp
// ==============================
// Status codes and Result<T> carriers shared by every CSD module.
// `detail` names the offending path or value when there is one.

#include <cstdint>
#include <string>
#include <utility>

namespace CSD {

enum class Status : uint32_t {
	OK = 0,

	// Inputs / toolchain
	InputNotFound,
	UnsupportedInput,
	InvalidArguments,

	// Analysis
	AnalysisFailure,

	// Dispatch / rendering
	UnsupportedCombination,
	WriteFailed,
};

template <typename T>
struct Result {
	Status      status{ Status::OK };
	T           value{};
	std::string detail;
	explicit operator bool() const { return status == Status::OK; }

	static Result Ok(T v) { Result r; r.value = std::move(v); return r; }
	static Result Fail(Status s, std::string d) { Result r; r.status = s; r.detail = std::move(d); return r; }
};

template <>
struct Result<void> {
	Status      status{ Status::OK };
	std::string detail;
	explicit operator bool() const { return status == Status::OK; }

	static Result Ok() { return Result{}; }
	static Result Fail(Status s, std::string d) { Result r; r.status = s; r.detail = std::move(d); return r; }
};

inline const char* to_string(Status s) {
	switch (s) {
	case Status::OK: return "OK";
	case Status::InputNotFound: return "InputNotFound";
	case Status::UnsupportedInput: return "UnsupportedInput";
	case Status::InvalidArguments: return "InvalidArguments";
	case Status::AnalysisFailure: return "AnalysisFailure";
	case Status::UnsupportedCombination: return "UnsupportedCombination";
	case Status::WriteFailed: return "WriteFailed";
	default: return "Unknown";
	}
}

} // namespace CSD
