#include "options/argument_expander.hpp"

#include "options/option_registry.hpp"
#include "utils/errors.hpp"

namespace lrunbox::options {
namespace {

void ExpandMultiElement(const std::string& flag, const std::string& key, const Json& element,
                        std::vector<std::string>& arguments) {
    if (element.is_null()) {
        throw utils::ArgumentError("option " + key + " has a null value");
    }
    arguments.push_back(flag);
    if (!element.is_array()) {
        arguments.push_back(ScalarToString(element));
        return;
    }
    for (const auto& component : element) {
        if (component.is_structured() || component.is_null()) {
            throw utils::ArgumentError("option " + key + " has a nested value: " + element.dump());
        }
        arguments.push_back(ScalarToString(component));
    }
}

}  // namespace

std::string ScalarToString(const Json& value) {
    switch (value.type()) {
        case Json::value_t::string:
            return value.get<std::string>();
        case Json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float:
            return value.dump();
        case Json::value_t::null:
            return std::string();
        default:
            throw utils::ArgumentError(std::string("expect a scalar option value, got ") + value.type_name());
    }
}

std::vector<std::string> ExpandOptions(const Json& options) {
    if (!options.is_object()) {
        throw utils::ArgumentError(std::string("expect options to be a mapping, got ") + options.type_name());
    }

    std::vector<std::string> arguments;
    for (const auto& item : options.items()) {
        const auto& key = item.key();
        const auto& value = item.value();
        const auto cardinality = GetCardinality(key);
        if (cardinality == Cardinality::kUnknown) {
            continue;
        }
        const auto flag = FlagName(key);
        if (cardinality == Cardinality::kMulti) {
            if (!value.is_array()) {
                throw utils::ArgumentError("option " + key + " should hold a list, got " + value.dump());
            }
            for (const auto& element : value) {
                if (element.is_object()) {
                    throw utils::ArgumentError("option " + key + " has a nested value: " + element.dump());
                }
                ExpandMultiElement(flag, key, element, arguments);
            }
            continue;
        }
        if (value.is_structured() || value.is_null()) {
            throw utils::ArgumentError("option " + key + " takes a single value, got " + value.dump());
        }
        arguments.push_back(flag);
        arguments.push_back(ScalarToString(value));
    }
    return arguments;
}

std::vector<std::string> ExpandOptions(const OptionSet& options) {
    return ExpandOptions(options.json());
}

}  // namespace lrunbox::options
