#include "libmcopt/core/errors.hpp"
#include "libmcopt/core/types.hpp"
#include "libmcopt/mc/gbm.hpp"
#include "libmcopt/models/black_scholes.hpp"
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>

namespace {

template <class T>
T prompt(const std::string& label) {
    T value;
    while (true) {
        std::cout << label;
        if (std::cin >> value) return value;
        std::cout << "Please input a number.\n";
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }
}

void print_row(const std::string& method, const std::string& type, double price, double se) {
    std::cout << std::left << std::setw(20) << method << " | "
              << std::setw(10) << type << " | "
              << std::right << std::setw(10) << std::fixed << std::setprecision(4) << price << " | ";
    if (se < 0.0) {
        std::cout << std::setw(10) << "N/A" << "\n";
    } else {
        std::cout << std::setw(10) << se << "\n";
    }
}

} // namespace

int main() {
    mcopt::ModelParameters params{100.0, 100.0, 1.0, 0.05, 0.2, 0.0};
    mcopt::SimulationConfig cfg;
    cfg.num_simulations = 100000;
    char test;

    while (true) {
        std::cout << "Input your own specs? y/n ";
        if (std::cin >> test && (test == 'y' || test == 'n')) break;
        std::cout << "Please enter 'y' or 'n'.\n";
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }

    if (test == 'y') {
        params.S0 = prompt<double>("Enter current underlying price: ");
        params.K = prompt<double>("Enter option strike price: ");
        params.T = prompt<double>("Enter time to expiration, days: ") / 365.0;
        params.r = prompt<double>("Enter current risk-free rate: ");
        params.sigma = prompt<double>("Enter volatility: ");
        params.q = prompt<double>("Enter dividend yield (0 if none): ");
        cfg.num_simulations = prompt<int>("Number of paths: ");
        cfg.num_steps = prompt<int>("Number of steps: ");
    }

    try {
        const auto bs = mcopt::bs::price_analytical(params);

        std::cout << "Pricing European options with S0=" << params.S0 << ", K=" << params.K
                  << ", T=" << params.T << ", r=" << params.r << ", sigma=" << params.sigma
                  << ", q=" << params.q << "\n";
        std::cout << std::string(60, '-') << "\n";
        std::cout << std::left << std::setw(20) << "Method" << " | " << std::setw(10) << "Type"
                  << " | " << std::setw(10) << "Price" << " | " << "Std Error\n";
        std::cout << std::string(60, '-') << "\n";
        print_row("Black-Scholes", "Call", bs.call, -1.0);
        print_row("Black-Scholes", "Put", bs.put, -1.0);

        for (auto method : {mcopt::Method::Standard, mcopt::Method::Antithetic,
                            mcopt::Method::ControlVariate}) {
            cfg.method = method;
            const auto mc = mcopt::mc::simulate(params, cfg);
            print_row("MC " + mcopt::to_string(method), "Call", mc.call_price, mc.call_std_err);
            print_row("MC " + mcopt::to_string(method), "Put", mc.put_price, mc.put_std_err);
        }
        std::cout << std::string(60, '-') << "\n";
    } catch (const mcopt::InvalidParameter& e) {
        std::cerr << "Invalid parameter " << e.parameter() << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
