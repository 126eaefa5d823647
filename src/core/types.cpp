#include "libmcopt/core/types.hpp"
#include "libmcopt/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace mcopt {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void require_positive(const char* name, double value) {
    if (!(std::isfinite(value) && value > 0.0)) {
        std::ostringstream msg;
        msg << "must be positive and finite, got " << value;
        throw InvalidParameter(name, msg.str());
    }
}

void require_finite(const char* name, double value) {
    if (!std::isfinite(value)) {
        std::ostringstream msg;
        msg << "must be finite, got " << value;
        throw InvalidParameter(name, msg.str());
    }
}

void require_positive(const char* name, int value) {
    if (value <= 0) {
        throw InvalidParameter(name, "must be a positive integer, got " + std::to_string(value));
    }
}

} // namespace

Method parse_method(const std::string& name) {
    if (name == "standard") return Method::Standard;
    if (name == "antithetic") return Method::Antithetic;
    if (name == "control_variate") return Method::ControlVariate;
    throw InvalidParameter("method", "unrecognized variance reduction method '" + name +
                                     "' (expected standard, antithetic or control_variate)");
}

std::string to_string(Method method) {
    switch (method) {
        case Method::Standard:       return "standard";
        case Method::Antithetic:     return "antithetic";
        case Method::ControlVariate: return "control_variate";
    }
    throw InvalidParameter("method", "unrecognized method value");
}

OptionType parse_option_type(const std::string& name) {
    const std::string s = lower(name);
    if (s == "call") return OptionType::Call;
    if (s == "put") return OptionType::Put;
    throw InvalidParameter("option_type", "unrecognized option type '" + name +
                                          "' (expected call or put)");
}

std::string to_string(OptionType type) {
    switch (type) {
        case OptionType::Call: return "call";
        case OptionType::Put:  return "put";
    }
    throw InvalidParameter("option_type", "unrecognized option type value");
}

void validate(const ModelParameters& params) {
    require_positive("S0", params.S0);
    require_positive("K", params.K);
    require_positive("T", params.T);
    require_positive("sigma", params.sigma);
    require_finite("r", params.r);
    require_finite("q", params.q);
    // d1/d2 divide by this; tiny sigma and T can still underflow it.
    if (!(params.sigma * std::sqrt(params.T) > 0.0)) {
        throw InvalidParameter("sigma", "sigma * sqrt(T) underflows to zero");
    }
}

void validate(const SimulationConfig& cfg) {
    require_positive("numSimulations", cfg.num_simulations);
    require_positive("numSteps", cfg.num_steps);
    switch (cfg.method) {
        case Method::Standard:
        case Method::Antithetic:
        case Method::ControlVariate:
            return;
    }
    throw InvalidParameter("method", "unrecognized method value");
}

} // namespace mcopt
