/*
 * @Description: Factor analysis by principal components with varimax rotation
 * @Author: Chao Ning
 * @Date: 2025-04-08 10:26:50
 * @LastEditTime: 2025-04-14 19:10:36
 * @LastEditors: Chao Ning
 */
#pragma once

#include <vector>
#include <Eigen/Dense>


struct FactorAnalysis{
    Eigen::MatrixXd cormat;
    Eigen::VectorXd eigenvalues;        // decreasing
    Eigen::VectorXd variance;           // percent of the trace
    Eigen::VectorXd cumulative;
    long long num_factors = 0;
    Eigen::MatrixXd initial_loadings;   // eigenvector * sqrt(eigenvalue)
    Eigen::MatrixXd loadings;           // after varimax
    Eigen::VectorXd communality;
    Eigen::VectorXd uniqueness;
    Eigen::MatrixXd canonical_loadings; // pinv(R) * loadings
    Eigen::MatrixXd partial;            // anti-image correlations, pinv(R) diagonal kept
    double kmo = 0;
    Eigen::VectorXd msa;
    std::vector<long long> factor_of;   // factor with the largest absolute loading of each variable
};


/**
 * @brief Factor analysis of a correlation matrix.
 *
 * Factors with eigenvalue >= mineval are retained (at least one). Loadings of more than one factor
 * are rotated by varimax.
 *
 * @param cormat correlation matrix
 * @param mineval minimum eigenvalue of a retained factor
 * @return FactorAnalysis
 */
FactorAnalysis factor_analysis(const Eigen::MatrixXd& cormat, double mineval = 1.0);

/**
 * @brief variable indices ordered by their factor, then by position
 */
std::vector<long long> factor_order(const FactorAnalysis& fa);

/**
 * @brief columns divided by their standard deviation, not centered
 */
Eigen::MatrixXd scale_by_sd(const Eigen::MatrixXd& mat);
