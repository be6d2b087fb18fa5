#include "options/option_registry.hpp"

#include <algorithm>
#include <iterator>

namespace lrunbox::options {
namespace {

#define LRUNBOX_OPTION_INFO(name, accessor, cardinality) {#name, Cardinality::cardinality},

constexpr OptionInfo kOptions[] = {
    LRUNBOX_OPTION_LIST(LRUNBOX_OPTION_INFO)
};

#undef LRUNBOX_OPTION_INFO

}  // namespace

const OptionInfo* RegisteredOptions() {
    return kOptions;
}

std::size_t RegisteredOptionCount() {
    return std::size(kOptions);
}

Cardinality GetCardinality(std::string_view name) {
    const auto it = std::find_if(std::begin(kOptions), std::end(kOptions), [&](const OptionInfo& info) {
        return name == info.name;
    });
    return it == std::end(kOptions) ? Cardinality::kUnknown : it->cardinality;
}

bool IsRegistered(std::string_view name) {
    return GetCardinality(name) != Cardinality::kUnknown;
}

std::string FlagName(std::string_view name) {
    std::string flag = "--";
    flag.reserve(name.size() + 2);
    for (const char c : name) {
        flag.push_back(c == '_' ? '-' : c);
    }
    return flag;
}

const char* ToString(Cardinality cardinality) {
    switch (cardinality) {
        case Cardinality::kSingle: return "single";
        case Cardinality::kMulti: return "multi";
        case Cardinality::kUnknown: return "unknown";
    }
    return "unknown";
}

}  // namespace lrunbox::options
