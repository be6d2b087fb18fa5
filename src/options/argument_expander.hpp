#pragma once

#include <string>
#include <vector>

#include "options/option_set.hpp"

namespace lrunbox::options {

// Renders the lrun flags for every registered key, in option order.
// Unregistered keys (stdin, stdout, truncate, ...) produce nothing.
//
//   {"chdir": "/tmp", "bindfs": [["/a", "/b"]], "fd": [2, 3]}
//   -> --chdir /tmp --bindfs /a /b --fd 2 --fd 3
//
// Throws utils::ArgumentError if options is not a well-formed option set.
std::vector<std::string> ExpandOptions(const Json& options);
std::vector<std::string> ExpandOptions(const OptionSet& options);

// String form of a scalar option value: strings verbatim, booleans as
// true/false, numbers in their shortest decimal form.
std::string ScalarToString(const Json& value);

}  // namespace lrunbox::options
