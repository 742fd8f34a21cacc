/// @file src/main.cpp
/// @brief BRI CLI entry point.
///
/// Usage:
///   bri --interpolate <linear|nearest> <csv_file> <x>...
///                                      Interpolate (x,value) CSV data at each x
///   bri --simulate <sigma> <drift> <seed> <t>...
///                                      Sample a Brownian path seeded at (0, 0)
///   bri --help                         Print usage

#include "bri/brownian_process.hpp"
#include "bri/data_loader.hpp"
#include "bri/interpolator.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  bri --interpolate <linear|nearest> <csv_file> <x>...\n"
        "  bri --simulate <sigma> <drift> <seed> <t>...\n"
        "  bri --help\n"
        "\n"
        "CSV format (header required):\n"
        "  x,value\n"
    );
}

/// Parse argv[first..argc) as finite doubles. nullopt on the first bad one.
std::optional<std::vector<double>> parse_numbers(int argc, char* argv[], int first) {
    std::vector<double> out;
    for (int i = first; i < argc; ++i) {
        auto v = bri::core::DataLoader::parse_double(argv[i]);
        if (!v) {
            fmt::print(stderr, "Error: '{}' is not a finite number\n", argv[i]);
            return std::nullopt;
        }
        out.push_back(*v);
    }
    return out;
}

/// Returns 0 on success, 1 on error.
int run_interpolate(const std::string& kind_name,
                    const std::string& filepath,
                    const std::vector<double>& queries) {
    const auto kind = bri::interp::parseInterpolationKind(kind_name);
    if (!kind) {
        fmt::print(stderr, "Error: unknown interpolation kind '{}'\n", kind_name);
        return 1;
    }

    auto rows = bri::core::DataLoader::load_csv(filepath);
    if (!rows) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }

    auto interp = bri::interp::makeInterpolator(*kind);
    for (const auto& row : *rows) {
        interp->insert(row.key, row.value);
    }
    fmt::print(stderr, "Loaded {} points from '{}' ({} interpolation)\n",
               interp->size(), filepath, bri::interp::to_string(*kind));

    fmt::print("x,value\n");
    for (double x : queries) {
        if (auto v = interp->getInterpolatedVal(x)) {
            fmt::print("{},{}\n", x, *v);
        } else {
            fmt::print("{},\n", x);
        }
    }
    return 0;
}

/// Returns 0 on success, 1 on error.
int run_simulate(double sigma, double drift, double seed, std::vector<double> times) {
    if (seed < 0.0) {
        fmt::print(stderr, "Error: seed must be >= 0\n");
        return 1;
    }
    bri::brownian::BrownianProcess process(
        bri::brownian::ProcessConfig{.sigma = sigma, .drift = drift},
        nullptr,
        std::make_shared<bri::brownian::NormalSampler>(static_cast<std::uint64_t>(seed)));

    // Same ascending order getValues uses, printed step by step.
    std::stable_sort(times.begin(), times.end());

    fmt::print("t,mean,stddev,sample\n");
    for (double t : times) {
        const auto distr  = process.getPossibleValueDistr(t);
        const double value = process.getValue(t);
        fmt::print("{},{},{},{}\n", t, distr.mean, distr.stddev, value);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    try {
        if (mode == "--interpolate") {
            if (argc < 5) {
                fmt::print(stderr, "Error: --interpolate requires a kind, a CSV file and at least one x\n");
                print_usage();
                return 1;
            }
            auto queries = parse_numbers(argc, argv, 4);
            if (!queries) {
                return 1;
            }
            return run_interpolate(argv[2], argv[3], *queries);
        }

        if (mode == "--simulate") {
            if (argc < 6) {
                fmt::print(stderr, "Error: --simulate requires sigma, drift, seed and at least one t\n");
                print_usage();
                return 1;
            }
            auto numbers = parse_numbers(argc, argv, 2);
            if (!numbers) {
                return 1;
            }
            std::vector<double> times(numbers->begin() + 3, numbers->end());
            return run_simulate((*numbers)[0], (*numbers)[1], (*numbers)[2], std::move(times));
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
