/*
 * @Description: Stability indices: Fox's top-third criterion and Shukla's stability variance
 * @Author: Chao Ning
 * @Date: 2025-04-07 15:40:03
 * @LastEditTime: 2025-04-14 18:31:27
 * @LastEditors: Chao Ning
 */
#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <Eigen/Dense>

#include "../utils/met_data.hpp"

using std::string;
using std::vector;
using Eigen::MatrixXd;
using Eigen::VectorXd;


struct StabilityOptions{
    bool verbose = true;
    ProgressCallback progress = log_progress;
};


struct FoxResult{
    string trait;
    vector<string> gen;
    VectorXd y;      // mean of all observations of the genotype
    VectorXd top;    // environments where the genotype ranks among the first three
};


struct ShuklaResult{
    string trait;
    vector<string> gen;
    VectorXd y;
    VectorXd shukla_var;
    VectorXd r_mean;
    VectorXd r_shukla_var;
    VectorXd ssi_shukla_var;
};


/**
 * @brief Fox's TOP: genotypes are ranked within each environment by their mean (decreasing,
 *        average rank for ties) and TOP counts the environments with rank <= 3
 */
FoxResult fox(const TrialTrait& trial);

vector<FoxResult> fox(const METData& data, const TrialColumns& columns, const vector<string>& trait_vec,
                      const StabilityOptions& options = StabilityOptions());


/**
 * @brief Shukla's stability variance with Kang's rank-sum (rank of -mean + rank of the variance).
 *
 * @param trial needs at least three genotypes and two environments, std::domain_error otherwise
 * @return ShuklaResult
 */
ShuklaResult shukla(const TrialTrait& trial);

vector<ShuklaResult> shukla(const METData& data, const TrialColumns& columns, const vector<string>& trait_vec,
                            const StabilityOptions& options = StabilityOptions());


void print_fox(std::ostream& os, const vector<FoxResult>& result_vec, int digits = 3);

void print_shukla(std::ostream& os, const vector<ShuklaResult>& result_vec, int digits = 3);


class Stability{
public:
    Stability();
    ~Stability();
    int run_fox(int argc, char* argv[]);
    int run_shukla(int argc, char* argv[]);
};
