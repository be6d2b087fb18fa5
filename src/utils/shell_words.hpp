#pragma once

#include <string>
#include <vector>

namespace lrunbox::utils {

// Splits a command line into words the way a POSIX shell does, without any
// expansion: whitespace separates words, single quotes are literal, double
// quotes allow \\ \" \$ \` escapes, a backslash outside quotes escapes the
// next character. Throws ArgumentError on an unmatched quote.
//
//   SplitShellWords("sh -c 'echo \"$A\"'") -> {"sh", "-c", "echo \"$A\""}
std::vector<std::string> SplitShellWords(const std::string& line);

}  // namespace lrunbox::utils
