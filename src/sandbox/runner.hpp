#pragma once

#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "options/option_registry.hpp"
#include "options/option_set.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace lrunbox::sandbox {

// Runs many programs with the same lrun options.
//
// A Runner never changes; Where() and the per-option helpers return a new
// Runner with the merged options:
//
//   auto runner = Runner().MaxCpuTime(1).Tmpfs({{"/tmp", 1 << 20}}).Chdir("/tmp");
//   runner.MaxCpuTime(nullptr).options();   // max_cpu_time removed
//   runner.Env({{"A", "Hello"}}).Run(std::vector<std::string>{"sh", "-c", "echo $A"});
class Runner {
public:
    Runner() = default;
    explicit Runner(options::OptionSet options, SandboxExecutor executor = SandboxExecutor());
    // Throws utils::TypeMismatch if options is not a mapping.
    explicit Runner(const options::Json& options);

    // Starts from config.defaults and runs lrun as config.lrun describes.
    static Runner FromConfig(const config::Config& config);

    const options::OptionSet& options() const { return options_; }
    const SandboxExecutor& executor() const { return executor_; }

    // Throws utils::TypeMismatch if partial is not a mapping.
    Runner Where(const options::Json& partial) const;

#define LRUNBOX_DECLARE_ACCESSOR(name, accessor, cardinality) \
    Runner accessor(const options::Json& value) const;
    LRUNBOX_OPTION_LIST(LRUNBOX_DECLARE_ACCESSOR)
#undef LRUNBOX_DECLARE_ACCESSOR

    Runner Stdin(const options::Json& path) const;
    Runner Stdout(const options::Json& path) const;
    Runner Stderr(const options::Json& path) const;

    ExecResult Run(const std::string& command) const;
    ExecResult Run(const std::vector<std::string>& command) const;

private:
    options::OptionSet options_;
    SandboxExecutor executor_;
};

}  // namespace lrunbox::sandbox
