#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace mcopt {

// Raised for any caller input the engine refuses to price with.
// parameter() names the offending field ("sigma", "numSteps", "method", ...).
class InvalidParameter : public std::invalid_argument {
public:
    InvalidParameter(std::string parameter, const std::string& message)
        : std::invalid_argument(parameter + ": " + message),
          parameter_(std::move(parameter)) {}

    const std::string& parameter() const noexcept { return parameter_; }

private:
    std::string parameter_;
};

} // namespace mcopt
