/*
 * @Description: Linear and partial correlation coefficients
 * @Author: Chao Ning
 * @Date: 2025-04-11 10:05:31
 * @LastEditTime: 2025-04-15 17:30:12
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


struct LpcorPair{
    string pair;      // "V1 x V2"
    double linear;
    double partial;
    double t;
    double p;
};


struct LpcorResult{
    string group;
    long long n = 0;
    vector<string> names;
    MatrixXd linear_mat;
    MatrixXd partial_mat;
    vector<LpcorPair> pairs;   // V1 x V2, V1 x V3, ..., V2 x V3, ...
};


/**
 * @brief Linear and partial correlations from a correlation matrix.
 *
 * @param cormat correlation matrix
 * @param n sample size used to compute the correlations
 * @param names variable names
 * @return LpcorResult. The tests are NA when n is not larger than the number of variables.
 */
LpcorResult lpcor_cor(const MatrixXd& cormat, long long n, const vector<string>& names);

/**
 * @brief Correlation matrix of the columns of X.
 *
 * @param method "pearson", "spearman" (Pearson correlation of the ranks, ties averaged)
 * or "kendall" (tau-b)
 */
MatrixXd cor_by_method(const MatrixXd& X, const string& method);

/**
 * @brief Linear and partial correlations of the columns of X (rows are observations).
 */
LpcorResult lpcor(const MatrixXd& X, const vector<string>& names, const string& method = "pearson");

/**
 * @brief lpcor from a data table. Rows with missing values are removed with a warning;
 * with 'by' one result per level of that column.
 */
vector<LpcorResult> lpcor_by(const METData& data, const vector<string>& var_vec, const string& by = "", bool verbose = true,
                             const string& method = "pearson");

void print_lpcor(std::ostream& os, const vector<LpcorResult>& result_vec, int digits = 3);


class Lpcor{
public:
    Lpcor();
    ~Lpcor();
    int run(int argc, char* argv[]);
};
