/*
 * @Description:
 * @Author: Chao Ning
 * @Date: 2025-04-06 10:12:45
 * @LastEditTime: 2025-04-14 17:20:31
 * @LastEditors: Chao Ning
 */

#include <iostream>
#include <spdlog/spdlog.h>

#include "cli_options.hpp"
#include "../utils/string_utils.hpp"
#include "../utils/report_utils.hpp"


void add_common_options(CLI::App& app, CommonCliOptions& opts){
    app.add_option("--data", opts.data_file,
        "Path to the input data file (required).\n"
        "  - The first line is the header; fields are separated by spaces, tabs, commas or semicolons.")
        ->required();

    app.add_option("--out", opts.out_file,
        "Prefix of the report file; the report is written to <out>.txt.");

    app.add_option("--digits", opts.digits,
        "Number of significant digits in the report.")
        ->capture_default_str();

    app.add_flag("--quiet", opts.quiet,
        "Disable progress messages.");

    app.add_option("--missing-data", opts.missing_in_data_vec,
        "List of missing value indicators.\n"
        "  - Default: {NA, Na, na, NAN, NaN, nan, -NAN, -NaN, -nan, <NA>, <na>, N/A, n/a}.\n"
        "  - Customize with space-separated values (e.g., --missing-data . -999 \"?\").")
        ->expected(-1);
}


void add_trial_options(CLI::App& app, TrialCliOptions& opts){
    app.add_option("--env", opts.columns.env, "Environment column (required).")->required();
    app.add_option("--gen", opts.columns.gen, "Genotype column (required).")->required();
    app.add_option("--rep", opts.columns.rep, "Replicate column (required).")->required();
    app.add_option("--block", opts.columns.block,
        "Block column. Selects the alpha-lattice design; without it the randomized complete block design is used.");
    app.add_option("--trait", opts.trait_vec,
        "List of traits (required).\n"
        "  - Supports multiple values (e.g., --trait GY HM).\n"
        "  - Use ':' to specify a range (e.g., --trait GY:NKE).\n"
        "  - Invalid or duplicate values will cause an error.")
        ->expected(-1)->required();
}


void set_log_level(bool quiet){
    if(quiet){
        spdlog::set_level(spdlog::level::warn);
    }else{
        spdlog::set_level(spdlog::level::info);
    }
}


void log_common_options(const CommonCliOptions& opts){
    spdlog::info("=== Parsed Arguments ===");
    spdlog::info("Input Data File: {}", opts.data_file);
    spdlog::info("Output File: {}", opts.out_file.empty() ? "Not Provided" : opts.out_file + ".txt");
    spdlog::info("Digits: {}", opts.digits);
    spdlog::info("Missing Data Indicators: {}", join_string(opts.missing_in_data_vec, ", "));
}


void write_report(const CommonCliOptions& opts, const std::function<void(std::ostream&)>& writer){
    writer(std::cout);
    if(!opts.out_file.empty()){
        export_report(opts.out_file, writer);
    }
}
