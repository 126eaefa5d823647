#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "libmcopt/core/errors.hpp"
#include "libmcopt/core/types.hpp"
#include "libmcopt/math/statistics.hpp"
#include "libmcopt/mc/convergence.hpp"
#include "libmcopt/mc/gbm.hpp"
#include "libmcopt/models/black_scholes.hpp"

#include <optional>
#include <string>

namespace py = pybind11;

namespace {

mcopt::SimulationConfig make_config(int num_simulations, int num_steps, const std::string& method,
                                    std::optional<std::uint64_t> seed) {
    mcopt::SimulationConfig cfg;
    cfg.num_simulations = num_simulations;
    cfg.num_steps = num_steps;
    cfg.method = mcopt::parse_method(method);
    cfg.seed = seed;
    return cfg;
}

} // namespace

PYBIND11_MODULE(mcoptpy, m) {
    m.doc() = "European option pricing: Black-Scholes and Monte Carlo with variance reduction";

    py::register_exception<mcopt::InvalidParameter>(m, "InvalidParameter", PyExc_ValueError);

    // --- Inputs ---
    py::class_<mcopt::ModelParameters>(m, "ModelParameters")
        .def(py::init<double,double,double,double,double,double>(),
            py::arg("S0"), py::arg("K"), py::arg("T"), py::arg("r"),
            py::arg("sigma"), py::arg("q") = 0.0)
        .def_readonly("S0",    &mcopt::ModelParameters::S0)
        .def_readonly("K",     &mcopt::ModelParameters::K)
        .def_readonly("T",     &mcopt::ModelParameters::T)
        .def_readonly("r",     &mcopt::ModelParameters::r)
        .def_readonly("sigma", &mcopt::ModelParameters::sigma)
        .def_readonly("q",     &mcopt::ModelParameters::q)
        .def("__repr__", [](const mcopt::ModelParameters& p) {
            return "ModelParameters{S0=" + std::to_string(p.S0) +
                ", K=" + std::to_string(p.K) +
                ", T=" + std::to_string(p.T) +
                ", r=" + std::to_string(p.r) +
                ", sigma=" + std::to_string(p.sigma) +
                ", q=" + std::to_string(p.q) + "}";
        });

    py::class_<mcopt::SimulationConfig>(m, "SimulationConfig")
        .def(py::init(&make_config),
            py::arg("num_simulations") = mcopt::DEFAULT_NUM_SIMULATIONS,
            py::arg("num_steps") = mcopt::DEFAULT_NUM_STEPS,
            py::arg("method") = "standard",
            py::arg("seed") = py::none())
        .def_readwrite("num_simulations", &mcopt::SimulationConfig::num_simulations)
        .def_readwrite("num_steps", &mcopt::SimulationConfig::num_steps)
        .def_property("method",
            [](const mcopt::SimulationConfig& c) { return mcopt::to_string(c.method); },
            [](mcopt::SimulationConfig& c, const std::string& s) { c.method = mcopt::parse_method(s); })
        .def_readwrite("seed", &mcopt::SimulationConfig::seed);

    // --- Results ---
    py::class_<mcopt::bs::Prices>(m, "AnalyticPrices")
        .def_readonly("call_price", &mcopt::bs::Prices::call)
        .def_readonly("put_price",  &mcopt::bs::Prices::put);

    py::class_<mcopt::mc::Estimate>(m, "Estimate")
        .def_readonly("price",  &mcopt::mc::Estimate::price)
        .def_readonly("stderr", &mcopt::mc::Estimate::std_err);

    py::class_<mcopt::mc::EstimationResult>(m, "EstimationResult")
        .def_readonly("call_price",  &mcopt::mc::EstimationResult::call_price)
        .def_readonly("call_stderr", &mcopt::mc::EstimationResult::call_std_err)
        .def_readonly("put_price",   &mcopt::mc::EstimationResult::put_price)
        .def_readonly("put_stderr",  &mcopt::mc::EstimationResult::put_std_err)
        .def_readonly("steps",       &mcopt::mc::EstimationResult::steps)
        .def_property_readonly("paths", [](const mcopt::mc::EstimationResult& r) {
            // rows = sampled paths, cols = steps
            const py::ssize_t rows = static_cast<py::ssize_t>(r.paths.size());
            const py::ssize_t cols = rows ? static_cast<py::ssize_t>(r.paths.front().size()) : 0;
            py::array_t<double> out({rows, cols});
            auto view = out.mutable_unchecked<2>();
            for (py::ssize_t i = 0; i < rows; ++i) {
                for (py::ssize_t j = 0; j < cols; ++j) {
                    view(i, j) = r.paths[i][j];
                }
            }
            return out;
        });

    py::class_<mcopt::mc::ConvergenceResult>(m, "ConvergenceResult")
        .def_readonly("x",       &mcopt::mc::ConvergenceResult::simulations)
        .def_readonly("y",       &mcopt::mc::ConvergenceResult::mc_call)
        .def_readonly("bs_line", &mcopt::mc::ConvergenceResult::analytic_call);

    // --- Operations ---
    m.def("price_analytical",
        &mcopt::bs::price_analytical,
        "Dividend-adjusted Black-Scholes call and put",
        py::arg("params"));

    m.def("simulate",
        [](const mcopt::ModelParameters& params, const mcopt::SimulationConfig& cfg) {
            py::gil_scoped_release release;
            return mcopt::mc::simulate(params, cfg);
        },
        "Monte Carlo call/put with standard errors and a path subsample",
        py::arg("params"), py::arg("config") = mcopt::SimulationConfig{});

    m.def("price_option",
        [](const mcopt::ModelParameters& params, const std::string& option_type,
           const mcopt::SimulationConfig& cfg) {
            const mcopt::OptionType type = mcopt::parse_option_type(option_type);
            py::gil_scoped_release release;
            return mcopt::mc::price_option(params, type, cfg);
        },
        "Monte Carlo price of a single leg ('call' or 'put')",
        py::arg("params"), py::arg("option_type"),
        py::arg("config") = mcopt::SimulationConfig{});

    m.def("analyze_convergence",
        [](const mcopt::ModelParameters& params, const std::string& method,
           std::optional<std::uint64_t> seed) {
            mcopt::mc::ConvergenceConfig cfg;
            cfg.seed = seed;
            const mcopt::Method meth = mcopt::parse_method(method);
            py::gil_scoped_release release;
            return mcopt::mc::analyze_convergence(params, meth, cfg);
        },
        "MC call price over a 100..10000 simulation ladder vs Black-Scholes",
        py::arg("params"), py::arg("method") = "standard", py::arg("seed") = py::none());

    m.def("historical_volatility",
        &mcopt::stats::historical_volatility,
        "Annualized volatility of log returns of a close series",
        py::arg("closes"), py::arg("periods_per_year") = mcopt::TRADING_DAYS_PER_YEAR);
}
