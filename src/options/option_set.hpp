#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"

namespace lrunbox::options {

// Insertion ordered so that expanded command lines are reproducible.
using Json = nlohmann::ordered_json;

// A normalized option mapping, ready to be expanded into lrun arguments.
//
// Keys are unique and keep the order in which they first appeared. Multi
// options always hold an array whose elements are scalars or 2-element
// arrays (env NAME VALUE, bindfs SRC DST, ...). A null value is never
// stored: null means "delete" while merging.
class OptionSet {
public:
    OptionSet() : data_(Json::object()) {}

    // Normalizes a single mapping, as Merge({json}) does.
    // Throws utils::TypeMismatch if json is not an object.
    static OptionSet FromJson(const Json& json);

    const Json& json() const { return data_; }
    bool empty() const { return data_.empty(); }
    std::size_t size() const { return data_.size(); }
    bool contains(const std::string& key) const { return data_.contains(key); }

    // Throws nlohmann::json::out_of_range for a missing key.
    const Json& at(const std::string& key) const { return data_.at(key); }

    std::string Dump() const { return data_.dump(); }

    friend bool operator==(const OptionSet& lhs, const OptionSet& rhs) { return lhs.data_ == rhs.data_; }
    friend bool operator!=(const OptionSet& lhs, const OptionSet& rhs) { return !(lhs == rhs); }

private:
    explicit OptionSet(Json data) : data_(std::move(data)) {}

    friend OptionSet Merge(const std::vector<Json>& partials);

    Json data_;
};

// Folds partial option mappings left to right:
//  - null partials are skipped;
//  - a null value removes the key;
//  - multi options append (scalar -> one element, object -> list of pairs);
//  - anything else overwrites.
// Throws utils::TypeMismatch naming the first partial that is neither null
// nor an object.
OptionSet Merge(const std::vector<Json>& partials);
OptionSet Merge(const OptionSet& base, const Json& partial);
OptionSet Merge(const OptionSet& base, const OptionSet& overlay);

}  // namespace lrunbox::options
