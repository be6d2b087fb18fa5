#include "sandbox/runner.hpp"

#include <utility>

#include "utils/errors.hpp"

namespace lrunbox::sandbox {

Runner::Runner(options::OptionSet options, SandboxExecutor executor)
    : options_(std::move(options)), executor_(std::move(executor)) {}

Runner::Runner(const options::Json& options)
    : options_(options::OptionSet::FromJson(options)) {}

Runner Runner::FromConfig(const config::Config& config) {
    return Runner(config.defaults, SandboxExecutor(config.lrun));
}

Runner Runner::Where(const options::Json& partial) const {
    if (!partial.is_object()) {
        throw utils::TypeMismatch(std::string("expect options to be a mapping, got ") + partial.type_name());
    }
    return Runner(options::Merge(options_, partial), executor_);
}

#define LRUNBOX_DEFINE_ACCESSOR(name, accessor, cardinality)       \
    Runner Runner::accessor(const options::Json& value) const {   \
        return Where(options::Json::object({{#name, value}}));    \
    }
LRUNBOX_OPTION_LIST(LRUNBOX_DEFINE_ACCESSOR)
#undef LRUNBOX_DEFINE_ACCESSOR

Runner Runner::Stdin(const options::Json& path) const {
    return Where(options::Json::object({{"stdin", path}}));
}

Runner Runner::Stdout(const options::Json& path) const {
    return Where(options::Json::object({{"stdout", path}}));
}

Runner Runner::Stderr(const options::Json& path) const {
    return Where(options::Json::object({{"stderr", path}}));
}

ExecResult Runner::Run(const std::string& command) const {
    return executor_.Run(command, options_);
}

ExecResult Runner::Run(const std::vector<std::string>& command) const {
    return executor_.Run(command, options_);
}

}  // namespace lrunbox::sandbox
