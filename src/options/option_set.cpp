#include "options/option_set.hpp"

#include <utility>

#include "options/option_registry.hpp"
#include "utils/errors.hpp"

namespace lrunbox::options {
namespace {

// scalar -> [scalar], {k: v, ...} -> [[k, v], ...], array -> itself
Json NormalizeMulti(const Json& value) {
    if (value.is_array()) {
        return value;
    }
    if (value.is_object()) {
        Json pairs = Json::array();
        for (const auto& item : value.items()) {
            pairs.push_back(Json::array({item.key(), item.value()}));
        }
        return pairs;
    }
    return Json::array({value});
}

void ApplyPartial(Json& result, const Json& partial) {
    for (const auto& item : partial.items()) {
        const auto& key = item.key();
        const auto& value = item.value();
        if (value.is_null()) {
            result.erase(key);
            continue;
        }
        if (GetCardinality(key) == Cardinality::kMulti) {
            auto& slot = result[key];
            if (!slot.is_array()) {
                slot = Json::array();
            }
            for (const auto& element : NormalizeMulti(value)) {
                slot.push_back(element);
            }
        } else {
            result[key] = value;
        }
    }
}

}  // namespace

OptionSet OptionSet::FromJson(const Json& json) {
    if (!json.is_object()) {
        throw utils::TypeMismatch(
            std::string("options should be a mapping, got ") + json.type_name());
    }
    return Merge(std::vector<Json>{json});
}

OptionSet Merge(const std::vector<Json>& partials) {
    for (std::size_t i = 0; i < partials.size(); ++i) {
        const auto& partial = partials[i];
        if (!partial.is_null() && !partial.is_object()) {
            throw utils::TypeMismatch(
                "options should be a mapping: argument " + std::to_string(i + 1) +
                " is " + partial.type_name());
        }
    }

    Json result = Json::object();
    for (const auto& partial : partials) {
        if (partial.is_null()) {
            continue;
        }
        ApplyPartial(result, partial);
    }
    return OptionSet(std::move(result));
}

OptionSet Merge(const OptionSet& base, const Json& partial) {
    return Merge(std::vector<Json>{base.json(), partial});
}

OptionSet Merge(const OptionSet& base, const OptionSet& overlay) {
    return Merge(std::vector<Json>{base.json(), overlay.json()});
}

}  // namespace lrunbox::options
