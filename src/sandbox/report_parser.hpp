#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace lrunbox::sandbox {

enum class ExceedLimit {
    kNone,
    kTime,
    kMemory,
    kOutput
};

const char* ToString(ExceedLimit limit);

// How the EXCEED field is classified. kExact accepts only the spellings lrun
// uses (CPU_TIME, REAL_TIME, TIME, MEMORY, OUTPUT), kSubstring accepts any
// value mentioning TIME, OUTPUT or MEMORY. Both ignore case.
enum class ExceedMatch {
    kSubstring,
    kExact
};

// What lrun writes on its report descriptor once the program is done.
struct Report {
    std::uint64_t memory = 0;   // peak memory, bytes
    double cpu_time = 0.0;      // seconds
    ExceedLimit exceed = ExceedLimit::kNone;
    int exit_code = 0;
    std::optional<int> signal;  // set only when the program was signaled
};

// Parses "KEY VALUE" lines. Missing or garbled numbers read as 0, an EXCEED
// value that matches no limit throws utils::DecodeError.
Report ParseReport(const std::string& text, ExceedMatch match = ExceedMatch::kSubstring);

ExceedLimit ParseExceed(const std::string& value, ExceedMatch match = ExceedMatch::kSubstring);

}  // namespace lrunbox::sandbox
