#pragma once

#include <cstddef>
#include <string>

#include "options/option_set.hpp"
#include "utils/logging.hpp"

namespace lrunbox::config {

struct LrunConfig {
    std::string binary = "lrun";
    // Explicit location of lrun. Empty means search PATH for `binary`.
    std::string path;
    // Bytes kept from captured stdout and stderr unless the options say
    // otherwise with "truncate".
    std::size_t truncate = 4096;
    // Where capture files go. Empty means the system temporary directory.
    std::string temp_dir;
    bool exact_exceed_match = false;
};

struct Config {
    LrunConfig lrun;
    utils::LogConfig logging;
    // Options every Runner built from this config starts with.
    options::OptionSet defaults;
};

}  // namespace lrunbox::config
