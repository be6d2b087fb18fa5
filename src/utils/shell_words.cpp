#include "utils/shell_words.hpp"

#include <cctype>
#include <cstring>

#include "utils/errors.hpp"

namespace lrunbox::utils {
namespace {

bool IsBlank(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::vector<std::string> SplitShellWords(const std::string& line) {
    std::vector<std::string> words;
    std::string word;
    bool in_word = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (IsBlank(c)) {
            if (in_word) {
                words.push_back(word);
                word.clear();
                in_word = false;
            }
            continue;
        }

        in_word = true;
        if (c == '\\') {
            if (i + 1 < line.size()) {
                ++i;
                // backslash-newline continues the line
                if (line[i] != '\n') {
                    word.push_back(line[i]);
                }
            } else {
                word.push_back(c);
            }
        } else if (c == '\'') {
            const auto end = line.find('\'', i + 1);
            if (end == std::string::npos) {
                throw ArgumentError("unmatched single quote: " + line);
            }
            word.append(line, i + 1, end - i - 1);
            i = end;
        } else if (c == '"') {
            ++i;
            while (i < line.size() && line[i] != '"') {
                if (line[i] == '\\' && i + 1 < line.size() && std::strchr("\\\"$`\n", line[i + 1]) != nullptr) {
                    ++i;
                }
                word.push_back(line[i]);
                ++i;
            }
            if (i >= line.size()) {
                throw ArgumentError("unmatched double quote: " + line);
            }
        } else {
            word.push_back(c);
        }
    }

    if (in_word) {
        words.push_back(word);
    }
    return words;
}

}  // namespace lrunbox::utils
