#include "libmcopt/core/errors.hpp"
#include "libmcopt/mc/convergence.hpp"

#include <iomanip>
#include <iostream>
#include <string>

// Usage: mcopt_convergence [method] [seed]
int main(int argc, char** argv) {
    const std::string method = argc > 1 ? argv[1] : "standard";
    const mcopt::ModelParameters params{100.0, 100.0, 1.0, 0.05, 0.2, 0.0};

    try {
        mcopt::mc::ConvergenceConfig cfg;
        if (argc > 2) {
            cfg.seed = std::stoull(argv[2]);
        }
        const auto res = mcopt::mc::analyze_convergence(params, method, cfg);

        std::cout << "Convergence (" << method << "), Black-Scholes call = "
                  << std::fixed << std::setprecision(4) << res.analytic_call.front() << "\n";
        std::cout << std::setw(8) << "paths" << std::setw(12) << "MC call" << std::setw(12) << "error" << "\n";
        for (std::size_t i = 0; i < res.simulations.size(); ++i) {
            std::cout << std::setw(8) << res.simulations[i]
                      << std::setw(12) << res.mc_call[i]
                      << std::setw(12) << res.mc_call[i] - res.analytic_call[i] << "\n";
        }
    } catch (const mcopt::InvalidParameter& e) {
        std::cerr << "Invalid parameter " << e.parameter() << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
