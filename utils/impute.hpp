/*
 * @Description: Imputation of missing cells in a two-way (genotype x environment) table
 * @Author: Chao Ning
 * @Date: 2025-04-03 15:48:26
 * @LastEditTime: 2025-04-13 21:17:05
 * @LastEditors: Chao Ning
 */
#pragma once

#include <string>
#include <Eigen/Dense>


struct ImputeOptions{
    std::string algorithm = "EM-SVD";  // EM-SVD, EM-AMMI or colmeans
    int naxis = 1;
    double tol = 1.0e-10;
    int max_iter = 1000;
};


struct ImputeResult{
    Eigen::MatrixXd mat;
    long long num_missing = 0;
    int iterations = 0;
    bool converged = true;
    double change = 0;
};


/**
 * @brief Fill the NaN cells of a two-way table.
 *
 * EM-SVD starts from the column means and iterates a rank-naxis SVD reconstruction of the whole
 * table; EM-AMMI starts from the additive estimates and iterates the additive effects plus a
 * rank-naxis SVD of the interaction; colmeans fills with the column means.
 * Iteration stops when the largest absolute change of the imputed cells is below tol.
 *
 * @param mat table with NaN for missing cells
 * @param options
 * @return ImputeResult
 */
ImputeResult impute_ge_matrix(const Eigen::MatrixXd& mat, const ImputeOptions& options = ImputeOptions());

void check_impute_options(const ImputeOptions& options);
