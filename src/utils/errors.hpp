#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace lrunbox::utils {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed command or option set.
class ArgumentError : public Error {
public:
    using Error::Error;
};

// A value that should be an option mapping is not one.
class TypeMismatch : public Error {
public:
    using Error::Error;
};

// The lrun binary could not be located.
class NotAvailable : public Error {
public:
    using Error::Error;
};

// lrun itself failed: it could not be spawned, exited non-zero or was
// killed by a signal. The sandboxed program's own outcome never ends up here.
class InvocationFailure : public Error {
public:
    InvocationFailure(const std::string& message, std::string stderr_output)
        : Error(stderr_output.empty() ? message : message + ". " + stderr_output),
          stderr_output_(std::move(stderr_output)) {}

    const std::string& stderr_output() const { return stderr_output_; }

private:
    std::string stderr_output_;
};

// The lrun report contains something we cannot interpret.
class DecodeError : public Error {
public:
    using Error::Error;
};

}  // namespace lrunbox::utils
