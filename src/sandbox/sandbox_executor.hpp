#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "options/option_set.hpp"
#include "sandbox/report_parser.hpp"

namespace lrunbox::sandbox {

struct ExecResult {
    std::uint64_t memory = 0;
    double cpu_time = 0.0;
    ExceedLimit exceed = ExceedLimit::kNone;
    int exit_code = 0;
    std::optional<int> signal;
    // Captured stdout and stderr, unset when the options redirect them to a
    // file owned by the caller.
    std::optional<std::string> output;
    std::optional<std::string> error;

    // Terminated by a signal.
    bool Crashed() const { return signal.has_value(); }
    bool Clean() const { return exit_code == 0 && !Crashed(); }
};

// Runs one program under lrun and waits for it.
//
// Keys of the option set that lrun does not know are used here:
//   stdin     file to read from (default: closed)
//   stdout    file to write to (default: captured in a temporary file)
//   stderr    same as stdout
//   truncate  how many bytes of each capture to keep
class SandboxExecutor {
public:
    static constexpr const char* kDefaultBinary = "lrun";
    static constexpr int kReportFd = 3;

    SandboxExecutor() = default;
    explicit SandboxExecutor(config::LrunConfig config);

    const config::LrunConfig& config() const { return config_; }

    // Whether lrun can be found. Never throws.
    bool Available() const;

    // Absolute path of lrun. Throws utils::NotAvailable.
    std::string LrunPath() const;

    // A string command is split into words like a POSIX shell would split it.
    // Throws utils::ArgumentError for an empty command, utils::NotAvailable,
    // utils::InvocationFailure when lrun itself fails and utils::DecodeError
    // for a report that cannot be understood.
    ExecResult Run(const std::string& command, const options::OptionSet& options) const;
    ExecResult Run(const std::vector<std::string>& command, const options::OptionSet& options) const;

    // lrun arguments (without lrun itself) for command under options.
    static std::vector<std::string> BuildArguments(const std::vector<std::string>& command,
                                                   const options::OptionSet& options);
    static std::vector<std::string> SplitCommand(const std::string& command);

private:
    config::LrunConfig config_;
};

}  // namespace lrunbox::sandbox
