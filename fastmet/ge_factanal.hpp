/*
 * @Description: Environmental stratification by factor analysis of the GE means
 * @Author: Chao Ning
 * @Date: 2025-04-08 14:33:19
 * @LastEditTime: 2025-04-14 19:45:02
 * @LastEditors: Chao Ning
 */
#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <Eigen/Dense>

#include "../utils/met_data.hpp"
#include "../utils/impute.hpp"
#include "../utils/factor_analysis.hpp"

using std::string;
using std::vector;
using Eigen::MatrixXd;
using Eigen::VectorXd;


struct GEFactanalOptions{
    double mineval = 1.0;
    bool verbose = true;
    bool impute_missing = true;
    ImputeOptions impute;
    ProgressCallback progress = log_progress;
};


struct EnvStratRow{
    string env;
    string factor;
    double mean;
    double min;
    double max;
    double cv;
};


struct GEFactanalResult{
    string trait;
    vector<string> env_levels, gen_levels;
    MatrixXd ge_means;        // genotypes x environments
    FactorAnalysis fa;        // environments are the variables
    double communality_mean = 0;
    MatrixXd scores;          // genotype scores
    vector<EnvStratRow> env_strat;
    bool imputed = false;
    string warning;
};


GEFactanalResult ge_factanal(const TrialTrait& trial, const GEFactanalOptions& options = GEFactanalOptions());

vector<GEFactanalResult> ge_factanal(const METData& data, const TrialColumns& columns, const vector<string>& trait_vec,
                                     const GEFactanalOptions& options = GEFactanalOptions());

void print_ge_factanal(std::ostream& os, const vector<GEFactanalResult>& result_vec, int digits = 4);


class GEFactanal{
public:
    GEFactanal();
    ~GEFactanal();
    int run(int argc, char* argv[]);
};
