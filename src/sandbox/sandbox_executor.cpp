#include "sandbox/sandbox_executor.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/posix.hpp>
#else
#include <boost/process.hpp>
#include <boost/process/posix.hpp>
#endif

#include <boost/algorithm/string/join.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "options/argument_expander.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include "utils/shell_words.hpp"

namespace lrunbox::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

using options::OptionSet;
using utils::ArgumentError;
using utils::InvocationFailure;

class ScopedFd {
public:
    explicit ScopedFd(int fd = -1) : fd_(fd) {}
    ~ScopedFd() { Reset(); }

    ScopedFd(ScopedFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    ScopedFd& operator=(ScopedFd&& other) noexcept {
        if (this != &other) {
            Reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }

    void Reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

// A capture file that exists for the duration of one run.
class TempFile {
public:
    TempFile(const std::filesystem::path& dir, const std::string& suffix) {
        const auto pattern = (dir / ("lrunbox." + std::to_string(::getpid()) + "." + suffix + ".XXXXXX")).string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        const int fd = ::mkstemp(buffer.data());
        if (fd < 0) {
            throw InvocationFailure(
                "cannot create temporary file " + pattern + ": " + std::strerror(errno), std::string());
        }
        ::close(fd);
        path_ = buffer.data();
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

struct ReportPipe {
    ScopedFd read_end;
    ScopedFd write_end;
};

ReportPipe OpenReportPipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw InvocationFailure(std::string("pipe2() failed: ") + std::strerror(errno), std::string());
    }
    ReportPipe pipe{ScopedFd(fds[0]), ScopedFd(fds[1])};

    // dup2() onto itself keeps FD_CLOEXEC and lrun would never see the pipe.
    if (pipe.write_end.get() == SandboxExecutor::kReportFd) {
        const int moved = ::fcntl(pipe.write_end.get(), F_DUPFD_CLOEXEC, SandboxExecutor::kReportFd + 1);
        if (moved < 0) {
            throw InvocationFailure(std::string("fcntl() failed: ") + std::strerror(errno), std::string());
        }
        pipe.write_end.Reset(moved);
    }
    return pipe;
}

std::string ReadAll(int fd) {
    std::string data;
    char buffer[4096];
    while (true) {
        const auto count = ::read(fd, buffer, sizeof(buffer));
        if (count > 0) {
            data.append(buffer, static_cast<std::size_t>(count));
            continue;
        }
        if (count == 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        throw InvocationFailure(std::string("cannot read lrun report: ") + std::strerror(errno), std::string());
    }
    return data;
}

std::string ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::string();
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    return stream.str();
}

std::string ReadCapture(const std::string& path, std::size_t limit) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::string();
    }
    // limit may be far larger than the file, so grow with what is read.
    std::string data;
    char buffer[4096];
    while (data.size() < limit && input) {
        const auto wanted = std::min(sizeof(buffer), limit - data.size());
        input.read(buffer, static_cast<std::streamsize>(wanted));
        data.append(buffer, static_cast<std::size_t>(input.gcount()));
    }
    return data;
}

std::optional<std::string> PathOption(const OptionSet& options, const char* key) {
    if (!options.contains(key)) {
        return std::nullopt;
    }
    const auto& value = options.at(key);
    if (!value.is_string() || value.get<std::string>().empty()) {
        throw ArgumentError(std::string(key) + " should be a file path, got " + value.dump());
    }
    return value.get<std::string>();
}

std::size_t TruncateOption(const OptionSet& options, std::size_t fallback) {
    if (!options.contains("truncate")) {
        return fallback;
    }
    const auto& value = options.at("truncate");
    if (value.is_number_unsigned()) {
        return value.get<std::size_t>();
    }
    if (value.is_number_integer() && value.get<long long>() >= 0) {
        return static_cast<std::size_t>(value.get<long long>());
    }
    throw ArgumentError("truncate should be a non-negative integer, got " + value.dump());
}

std::filesystem::path TempDirectory(const config::LrunConfig& config) {
    if (!config.temp_dir.empty()) {
        return config.temp_dir;
    }
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw InvocationFailure("cannot find a temporary directory: " + ec.message(), std::string());
    }
    return dir;
}

std::string SearchPath(const std::string& binary) {
    const auto found = bp::search_path(binary);
    return found.empty() ? std::string() : found.string();
}

// PATH is scanned once per process for the default binary.
const std::string& DefaultLrunPath() {
    static const std::string path = SearchPath(SandboxExecutor::kDefaultBinary);
    return path;
}

bool IsExecutableFile(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::string Locate(const config::LrunConfig& config) {
    if (!config.path.empty()) {
        return IsExecutableFile(config.path) ? config.path : std::string();
    }
    if (config.binary == SandboxExecutor::kDefaultBinary) {
        return DefaultLrunPath();
    }
    return SearchPath(config.binary);
}

bp::child Spawn(const std::string& lrun_path,
                const std::vector<std::string>& arguments,
                const std::optional<std::string>& stdin_path,
                const std::string& stdout_path,
                const std::string& stderr_path,
                int report_fd) {
    if (stdin_path) {
        return bp::child(
            bp::exe = lrun_path,
            bp::args = arguments,
            bp::std_in < *stdin_path,
            bp::std_out > stdout_path,
            bp::std_err > stderr_path,
            bp::posix::fd.bind(SandboxExecutor::kReportFd, report_fd));
    }
    return bp::child(
        bp::exe = lrun_path,
        bp::args = arguments,
        bp::std_in.close(),
        bp::std_out > stdout_path,
        bp::std_err > stderr_path,
        bp::posix::fd.bind(SandboxExecutor::kReportFd, report_fd));
}

std::string DescribeStatus(int status) {
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    if (WIFEXITED(status)) {
        return "exit status " + std::to_string(WEXITSTATUS(status));
    }
    return "wait status " + std::to_string(status);
}

}  // namespace

SandboxExecutor::SandboxExecutor(config::LrunConfig config)
    : config_(std::move(config)) {}

bool SandboxExecutor::Available() const {
    return !Locate(config_).empty();
}

std::string SandboxExecutor::LrunPath() const {
    auto path = Locate(config_);
    if (path.empty()) {
        const auto& name = config_.path.empty() ? config_.binary : config_.path;
        throw utils::NotAvailable(name + " not found in PATH. Please install lrun first.");
    }
    return path;
}

std::vector<std::string> SandboxExecutor::SplitCommand(const std::string& command) {
    return utils::SplitShellWords(command);
}

std::vector<std::string> SandboxExecutor::BuildArguments(const std::vector<std::string>& command,
                                                         const OptionSet& options) {
    auto arguments = options::ExpandOptions(options);
    arguments.insert(arguments.end(), command.begin(), command.end());
    return arguments;
}

ExecResult SandboxExecutor::Run(const std::string& command, const OptionSet& options) const {
    const auto tokens = SplitCommand(command);
    if (tokens.empty()) {
        throw ArgumentError("command should not be empty");
    }
    return Run(tokens, options);
}

ExecResult SandboxExecutor::Run(const std::vector<std::string>& command, const OptionSet& options) const {
    if (command.empty()) {
        throw ArgumentError("command should not be empty");
    }

    const auto lrun_path = LrunPath();
    const auto arguments = BuildArguments(command, options);
    const auto stdin_path = PathOption(options, "stdin");
    const auto stdout_path = PathOption(options, "stdout");
    const auto stderr_path = PathOption(options, "stderr");
    const auto truncate = TruncateOption(options, config_.truncate);

    std::optional<TempFile> temp_out;
    std::optional<TempFile> temp_err;
    if (!stdout_path || !stderr_path) {
        const auto temp_dir = TempDirectory(config_);
        if (!stdout_path) {
            temp_out.emplace(temp_dir, "out");
        }
        if (!stderr_path) {
            temp_err.emplace(temp_dir, "err");
        }
    }
    const auto& out_target = stdout_path ? *stdout_path : temp_out->path();
    const auto& err_target = stderr_path ? *stderr_path : temp_err->path();
    auto read_stderr = [&]() {
        return temp_err ? ReadFile(temp_err->path()) : std::string();
    };

    utils::LogLine(utils::LogLevel::kDebug, "lrun")
        << lrun_path << " " << boost::algorithm::join(arguments, " ");

    auto pipe = OpenReportPipe();
    bp::child child;
    try {
        child = Spawn(lrun_path, arguments, stdin_path, out_target, err_target, pipe.write_end.get());
    } catch (const bp::process_error& ex) {
        utils::LogLine(utils::LogLevel::kError, "lrun") << "failed to start " << lrun_path << ": " << ex.what();
        throw InvocationFailure("failed to start " + lrun_path + ": " + ex.what(), read_stderr());
    }

    // From here on lrun holds the only write end; EOF means it is done
    // reporting, which may happen before or after it exits.
    pipe.write_end.Reset();
    const auto report = ReadAll(pipe.read_end.get());

    int status = 0;
    try {
        child.wait();
        status = child.native_exit_code();
    } catch (const bp::process_error& ex) {
        throw InvocationFailure(std::string("cannot wait for lrun: ") + ex.what(), read_stderr());
    }
    utils::LogLine(utils::LogLevel::kDebug, "lrun") << DescribeStatus(status) << ", report:\n" << report;

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const auto stderr_text = read_stderr();
        utils::LogLine(utils::LogLevel::kError, "lrun") << "lrun exits abnormally: " << DescribeStatus(status);
        throw InvocationFailure("lrun exits abnormally: " + DescribeStatus(status), stderr_text);
    }

    const auto match = config_.exact_exceed_match ? ExceedMatch::kExact : ExceedMatch::kSubstring;
    const auto parsed = ParseReport(report, match);

    ExecResult result;
    result.memory = parsed.memory;
    result.cpu_time = parsed.cpu_time;
    result.exceed = parsed.exceed;
    result.exit_code = parsed.exit_code;
    result.signal = parsed.signal;
    if (temp_out) {
        result.output = ReadCapture(temp_out->path(), truncate);
    }
    if (temp_err) {
        result.error = ReadCapture(temp_err->path(), truncate);
    }
    return result;
}

}  // namespace lrunbox::sandbox
