/*
 * @Description: Additive main effects and multiplicative interaction (AMMI) model
 * @Author: Chao Ning
 * @Date: 2025-04-05 14:02:36
 * @LastEditTime: 2025-04-14 16:48:09
 * @LastEditors: Chao Ning
 */
#pragma once

#include <string>
#include <vector>
#include <ostream>

#include <Eigen/Core>
#include <Eigen/Dense>

#include "../utils/met_data.hpp"
#include "../utils/linear_model.hpp"
#include "../utils/impute.hpp"

using std::string;
using std::vector;
using Eigen::MatrixXd;
using Eigen::VectorXd;


struct AmmiOptions{
    bool verbose = true;
    bool impute_missing = true;     // fill missing GE cells, otherwise fail
    ImputeOptions impute;
    ProgressCallback progress = log_progress;
};


// ANOVA row with the share of the interaction explained by a principal component (NaN elsewhere)
struct AmmiTableRow{
    string source;
    double df;
    double ss;
    double ms;
    double f;
    double p;
    double proportion;
    double accumulated;
};


struct MeansGxERow{
    string env;
    string gen;
    double y;
    double envPC1;
    double genPC1;
    double nominal;
};


// per-observation diagnostics of the fitted model
struct AmmiAugment{
    vector<string> env, gen, rep, block, factors;
    VectorXd y, hat, sigma, fitted, resid, stdres, se_fit;
};


struct AmmiResult{
    string trait;
    bool has_block = false;
    long long num_gen = 0, num_env = 0, num_rep = 0, minimo = 0;
    vector<string> gen_levels, env_levels;

    vector<AmmiTableRow> anova;
    vector<AmmiTableRow> pca;
    double mse = 0, dfe = 0, probint = 0;

    MatrixXd ge_means;              // genotypes x environments, imputed when unbalanced
    MatrixXd interaction;           // residual of the additive model on ge_means
    VectorXd singular_values;
    MatrixXd U, V;                  // first minimo singular vectors
    MatrixXd gen_score, env_score;  // U * d^0.5, V * d^0.5
    VectorXd gen_mean, env_mean;

    vector<MeansGxERow> means_gxe;
    AmmiAugment augment;

    bool imputed = false;
    string warning;
};


struct AmmiPrediction{
    string trait;
    int naxis = 0;
    vector<string> env, gen;
    VectorXd y, residual, ypred, res_ammi, ypred_ammi, ammi0;
};


/**
 * @brief residual of the additive model Y ~ ENV + GEN on a complete two-way table
 */
MatrixXd additive_residual(const MatrixXd& ge_mat);


/**
 * @brief AMMI analysis of one trait
 *
 * @param trial factors and response of the trait
 * @param options
 * @return AmmiResult
 */
AmmiResult performs_ammi(const TrialTrait& trial, const AmmiOptions& options = AmmiOptions());

vector<AmmiResult> performs_ammi(const METData& data, const TrialColumns& columns, const vector<string>& trait_vec,
                                 const AmmiOptions& options = AmmiOptions());


/**
 * @brief Cell means predicted with the first naxis interaction axes.
 *
 * @param result fitted AMMI model
 * @param naxis 1 <= naxis <= minimo; the additive prediction is always returned as AMMI0
 * @return AmmiPrediction rows ordered by environment, then genotype
 */
AmmiPrediction predict_ammi(const AmmiResult& result, int naxis);

vector<AmmiPrediction> predict_ammi(const vector<AmmiResult>& result_vec, const vector<int>& naxis_vec);


void print_ammi(std::ostream& os, const vector<AmmiResult>& result_vec, int digits = 4);

void print_ammi_prediction(std::ostream& os, const vector<AmmiPrediction>& pred_vec, int digits = 4);


class AMMI{
public:
    AMMI();
    ~AMMI();
    int run(int argc, char* argv[]);
};
