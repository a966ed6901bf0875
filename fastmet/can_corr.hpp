/*
 * @Description: Canonical correlation analysis between two groups of variables
 * @Author: Chao Ning
 * @Date: 2025-04-10 15:20:08
 * @LastEditTime: 2025-04-15 16:48:55
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


struct CanCorrOptions{
    string use = "cor";          // cor or cov
    string test = "Bartlett";    // Bartlett or Rao
    double prob = 0.05;
    bool center = true;
    bool stdscores = false;
    bool collinearity = true;
    bool verbose = true;
};


struct CollinearityDiag{
    double cor_det;
    VectorXd eigenvalues;
    double condition_number;     // largest / smallest eigenvalue
    VectorXd vif;
    double max_abs_cor;          // NaN for a single variable
    string max_pair;
};

CollinearityDiag collinearity_diag(const MatrixXd& mat, const vector<string>& name_vec);


struct CanCorrTestRow{
    string pair;
    double variance;
    double percent;
    double cum_percent;
    double corr;
    double lambda;
    double stat;        // chi-square (Bartlett) or F (Rao)
    double df1;
    double df2;         // Rao only
    double p;
};


struct CanCorrResult{
    string group;       // level of the 'by' factor, empty otherwise
    string test;
    long long n = 0;
    vector<string> fg_names, sg_names, row_labels;
    MatrixXd S11, S22, S12;
    VectorXd corr;
    MatrixXd coef_fg, coef_sg;
    MatrixXd loads_fg, loads_sg;
    MatrixXd score_fg, score_sg;
    MatrixXd crossload_fg, crossload_sg;
    vector<CanCorrTestRow> sigtest;
    long long num_significant = 0;   // pairs with p < prob
    bool has_collinearity = false;
    CollinearityDiag colin_fg, colin_sg;
};


/**
 * @brief Canonical correlation analysis.
 *
 * @param FG first group, rows are observations (p columns)
 * @param SG second group (q >= p columns)
 * @param fg_names
 * @param sg_names
 * @param options
 * @return CanCorrResult
 */
CanCorrResult can_corr(const MatrixXd& FG, const MatrixXd& SG, const vector<string>& fg_names, const vector<string>& sg_names,
                       const CanCorrOptions& options = CanCorrOptions());

/**
 * @brief Canonical correlation from a data table, one analysis per level of 'by' when given.
 * With 'means_by' the rows are averaged by that factor first and the scores are labelled by its levels.
 */
vector<CanCorrResult> can_corr_by(const METData& data, const vector<string>& fg_vec, const vector<string>& sg_vec,
                                  const string& by = "", const string& means_by = "",
                                  const CanCorrOptions& options = CanCorrOptions());

void print_can_corr(std::ostream& os, const vector<CanCorrResult>& result_vec, int digits = 4);


class CanCorr{
public:
    CanCorr();
    ~CanCorr();
    int run(int argc, char* argv[]);
};
