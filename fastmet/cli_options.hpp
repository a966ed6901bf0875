/*
 * @Description: Command-line options shared by the analyses
 * @Author: Chao Ning
 * @Date: 2025-04-06 10:12:45
 * @LastEditTime: 2025-04-14 17:20:31
 * @LastEditors: Chao Ning
 */
#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <functional>
#include <CLI/CLI.hpp>

#include "../utils/met_data.hpp"


struct CommonCliOptions{
    std::string data_file;
    std::string out_file;
    int digits = 4;
    bool quiet = false;
    std::vector<std::string> missing_in_data_vec = default_missing_tokens();
};


struct TrialCliOptions{
    TrialColumns columns;
    std::vector<std::string> trait_vec;
};


void add_common_options(CLI::App& app, CommonCliOptions& opts);

void add_trial_options(CLI::App& app, TrialCliOptions& opts);

// --quiet keeps warnings and errors only
void set_log_level(bool quiet);

void log_common_options(const CommonCliOptions& opts);

/**
 * @brief print the report to stdout and, with --out, to <out>.txt
 */
void write_report(const CommonCliOptions& opts, const std::function<void(std::ostream&)>& writer);
