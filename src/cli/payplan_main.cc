// SPDX-License-Identifier: MIT
/// @file payplan_main.cc
/// @brief Command-line front end: evaluate plans from a JSON config or the built-in examples
///
/// Usage:
///   payplan [-h|--help] [-v|--version] [-m|--markdown] [CONFIG_FILE]

#include "payplan/config/plan_config.hpp"
#include "payplan/plan/plan_evaluation.hpp"
#include "payplan/report/report_renderer.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#ifndef PAYPLAN_VERSION_STRING
#define PAYPLAN_VERSION_STRING "1.1.0"
#endif

using namespace payplan;

namespace {

constexpr std::string_view kHelpText = R"(
payplan - fixed-fee installment plan analyzer

Usage:
  payplan [OPTIONS] [CONFIG_FILE]

Options:
  -h, --help          Show this help message and exit
  -v, --version       Show version information
  -m, --markdown      Output results in Markdown format

Arguments:
  CONFIG_FILE         Path to JSON configuration file with payment plan data
                      If not provided, runs with the built-in examples

Configuration File Format:
  {
    "regular_apr": 27.0,
    "payment_plans": [
      {
        "purchase_amount": 1196.00,
        "num_payments": 18,
        "monthly_payment": 80.73,
        "monthly_fee": 14.28
      }
    ]
  }

Examples:
  payplan                    # Run with the built-in examples
  payplan config.json        # Run with a custom config
  payplan -m                 # Built-in examples in Markdown format
  payplan -m config.json     # Custom config in Markdown format

For every plan the report shows the equivalent APR of the fixed fees, the cost
of the same payments on a regular APR account, and the last month in which
paying the fixed fee is still cheaper than regular interest.
)";

struct CliOptions {
    bool help = false;
    bool version = false;
    bool markdown = false;
    std::optional<std::string> config_path;
    std::optional<std::string> unknown_flag;
};

CliOptions parse_args(int argc, char** argv) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-v" || arg == "--version") {
            options.version = true;
        } else if (arg == "-m" || arg == "--markdown") {
            options.markdown = true;
        } else if (arg.starts_with("-")) {
            options.unknown_flag = std::string(arg);
        } else if (!options.config_path) {
            options.config_path = std::string(arg);
        }
    }
    return options;
}

}  // namespace

int main(int argc, char** argv) {
    const CliOptions options = parse_args(argc, argv);

    if (options.help) {
        std::cout << kHelpText;
        return 0;
    }
    if (options.version) {
        std::cout << "payplan v" << PAYPLAN_VERSION_STRING << "\n";
        return 0;
    }
    if (options.unknown_flag) {
        std::cerr << "Unknown option " << *options.unknown_flag << "\n"
                  << "Use -h for help.\n";
        return 1;
    }

    std::cout << "payplan - fixed-fee installment plan analyzer\n"
              << std::string(50, '=') << "\n";

    PlanConfig config;
    if (options.config_path) {
        auto loaded = load_plan_config(*options.config_path);
        if (!loaded) {
            std::cerr << render_error(loaded.error()) << "\n"
                      << "Use -h for help.\n";
            return 1;
        }
        std::cout << "Loading configuration from " << *options.config_path << "\n";
        config = std::move(*loaded);
    } else {
        std::cout << "Running with default examples...\n";
        config = default_plan_config();
    }
    if (options.markdown) {
        std::cout << "Output format: Markdown\n";
    }

    const BatchEvaluation batch = evaluate_plans(config.payment_plans, config.regular_apr);
    std::cout << render_report(batch,
                               config.regular_apr,
                               options.markdown ? ReportFormat::Markdown : ReportFormat::Console);

    // Per-plan failures are part of the report; they do not fail the run
    return 0;
}
