#include "sandbox/report_parser.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <boost/algorithm/string/predicate.hpp>

#include "utils/errors.hpp"

namespace lrunbox::sandbox {
namespace {

using Fields = std::unordered_map<std::string, std::string>;

Fields SplitLines(const std::string& text) {
    Fields fields;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        const auto space = line.find(' ');
        if (space == std::string::npos) {
            fields[line] = std::string();
        } else {
            fields[line.substr(0, space)] = line.substr(space + 1);
        }
    }
    return fields;
}

const std::string* Find(const Fields& fields, const char* key) {
    const auto it = fields.find(key);
    return it == fields.end() ? nullptr : &it->second;
}

long long ParseInteger(const Fields& fields, const char* key) {
    const auto* value = Find(fields, key);
    if (value == nullptr) {
        return 0;
    }
    try {
        return std::stoll(*value);
    } catch (const std::invalid_argument&) {
        return 0;
    } catch (const std::out_of_range&) {
        return 0;
    }
}

double ParseReal(const Fields& fields, const char* key) {
    const auto* value = Find(fields, key);
    if (value == nullptr) {
        return 0.0;
    }
    try {
        return std::stod(*value);
    } catch (const std::invalid_argument&) {
        return 0.0;
    } catch (const std::out_of_range&) {
        return 0.0;
    }
}

// Spellings lrun uses for each limit.
const char* const kTimeNames[] = {"CPU_TIME", "REAL_TIME", "TIME"};
const char* const kOutputNames[] = {"OUTPUT"};
const char* const kMemoryNames[] = {"MEMORY"};

template <std::size_t N>
bool Matches(const std::string& value, const char* const (&names)[N], ExceedMatch match) {
    if (match == ExceedMatch::kSubstring) {
        // The last spelling is the bare word every other one contains.
        return boost::algorithm::icontains(value, names[N - 1]);
    }
    return std::any_of(std::begin(names), std::end(names), [&](const char* name) {
        return boost::algorithm::iequals(value, name);
    });
}

}  // namespace

const char* ToString(ExceedLimit limit) {
    switch (limit) {
        case ExceedLimit::kNone: return "none";
        case ExceedLimit::kTime: return "time";
        case ExceedLimit::kMemory: return "memory";
        case ExceedLimit::kOutput: return "output";
    }
    return "none";
}

ExceedLimit ParseExceed(const std::string& value, ExceedMatch match) {
    if (value == "none") {
        return ExceedLimit::kNone;
    }
    if (Matches(value, kTimeNames, match)) {
        return ExceedLimit::kTime;
    }
    if (Matches(value, kOutputNames, match)) {
        return ExceedLimit::kOutput;
    }
    if (Matches(value, kMemoryNames, match)) {
        return ExceedLimit::kMemory;
    }
    throw utils::DecodeError("unexpected EXCEED returned by lrun: '" + value + "'");
}

Report ParseReport(const std::string& text, ExceedMatch match) {
    const auto fields = SplitLines(text);

    Report report;
    const auto memory = ParseInteger(fields, "MEMORY");
    report.memory = memory > 0 ? static_cast<std::uint64_t>(memory) : 0;
    report.cpu_time = std::max(0.0, ParseReal(fields, "CPUTIME"));
    report.exit_code = static_cast<int>(ParseInteger(fields, "EXITCODE"));
    if (ParseInteger(fields, "SIGNALED") != 0) {
        report.signal = static_cast<int>(ParseInteger(fields, "TERMSIG"));
    }

    const auto* exceed = Find(fields, "EXCEED");
    if (exceed == nullptr) {
        throw utils::DecodeError("lrun report has no EXCEED field");
    }
    report.exceed = ParseExceed(*exceed, match);
    return report;
}

}  // namespace lrunbox::sandbox
