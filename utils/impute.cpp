/*
 * @Description:
 * @Author: Chao Ning
 * @Date: 2025-04-03 15:48:26
 * @LastEditTime: 2025-04-13 21:17:05
 * @LastEditors: Chao Ning
 */

#include <cmath>
#include <algorithm>
#include <vector>
#include <stdexcept>
#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include "impute.hpp"

using Eigen::MatrixXd;
using Eigen::VectorXd;
using Eigen::BDCSVD;


void check_impute_options(const ImputeOptions& options){
    if(options.algorithm != "EM-SVD" && options.algorithm != "EM-AMMI" && options.algorithm != "colmeans"){
        spdlog::error("Invalid imputation algorithm: {}. Use EM-SVD, EM-AMMI or colmeans", options.algorithm);
        throw std::invalid_argument("Invalid imputation algorithm: " + options.algorithm);
    }
    if(options.naxis < 1){
        spdlog::error("The number of axes for imputation must be at least 1");
        throw std::invalid_argument("Invalid number of axes for imputation");
    }
    if(options.tol <= 0 || options.max_iter < 1){
        spdlog::error("The imputation tolerance must be positive and the maximum iterations at least 1");
        throw std::invalid_argument("Invalid imputation convergence settings");
    }
}


static MatrixXd low_rank(const MatrixXd& mat, int naxis){
    BDCSVD<MatrixXd> svd(mat, Eigen::ComputeThinU | Eigen::ComputeThinV);
    return svd.matrixU().leftCols(naxis) * svd.singularValues().head(naxis).asDiagonal()
            * svd.matrixV().leftCols(naxis).transpose();
}


static MatrixXd additive_fit(const MatrixXd& mat){
    VectorXd row_mean = mat.rowwise().mean();
    Eigen::RowVectorXd col_mean = mat.colwise().mean();
    double grand = mat.mean();
    MatrixXd fit(mat.rows(), mat.cols());
    for(long long i = 0; i < mat.rows(); i++){
        for(long long j = 0; j < mat.cols(); j++){
            fit(i, j) = row_mean(i) + col_mean(j) - grand;
        }
    }
    return fit;
}


ImputeResult impute_ge_matrix(const MatrixXd& mat, const ImputeOptions& options){
    check_impute_options(options);
    long long nrow = mat.rows(), ncol = mat.cols();

    std::vector<std::pair<long long, long long>> missing_vec;
    VectorXd col_sum = VectorXd::Zero(ncol), col_count = VectorXd::Zero(ncol);
    VectorXd row_sum = VectorXd::Zero(nrow), row_count = VectorXd::Zero(nrow);
    for(long long i = 0; i < nrow; i++){
        for(long long j = 0; j < ncol; j++){
            if(std::isnan(mat(i, j))){
                missing_vec.push_back({i, j});
            }else{
                col_sum(j) += mat(i, j);
                col_count(j) += 1;
                row_sum(i) += mat(i, j);
                row_count(i) += 1;
            }
        }
    }

    ImputeResult result;
    result.mat = mat;
    result.num_missing = missing_vec.size();
    if(missing_vec.empty()) return result;

    for(long long j = 0; j < ncol; j++){
        if(col_count(j) == 0){
            spdlog::error("Column {} of the table has no observed cell and cannot be imputed", j + 1);
            throw std::runtime_error("A column of the table is entirely missing");
        }
    }
    for(long long i = 0; i < nrow; i++){
        if(row_count(i) == 0){
            spdlog::error("Row {} of the table has no observed cell and cannot be imputed", i + 1);
            throw std::runtime_error("A row of the table is entirely missing");
        }
    }
    if(options.algorithm != "colmeans" && options.naxis >= std::min(nrow, ncol)){
        spdlog::error("The number of axes for imputation ({}) must be smaller than min(rows, columns) = {}",
                      options.naxis, std::min(nrow, ncol));
        throw std::invalid_argument("Too many axes for imputation");
    }

    VectorXd col_mean = col_sum.array() / col_count.array();
    VectorXd row_mean = row_sum.array() / row_count.array();
    double grand = col_sum.sum() / col_count.sum();

    MatrixXd& X = result.mat;
    for(const auto& cell:missing_vec){
        if(options.algorithm == "EM-AMMI"){
            X(cell.first, cell.second) = row_mean(cell.first) + col_mean(cell.second) - grand;
        }else{
            X(cell.first, cell.second) = col_mean(cell.second);
        }
    }
    if(options.algorithm == "colmeans"){
        result.iterations = 0;
        result.converged = true;
        return result;
    }

    result.converged = false;
    for(int iter = 1; iter <= options.max_iter; iter++){
        MatrixXd X_new;
        if(options.algorithm == "EM-SVD"){
            X_new = low_rank(X, options.naxis);
        }else{
            MatrixXd additive = additive_fit(X);
            X_new = additive + low_rank(X - additive, options.naxis);
        }
        double change = 0;
        for(const auto& cell:missing_vec){
            double diff = std::fabs(X_new(cell.first, cell.second) - X(cell.first, cell.second));
            if(diff > change) change = diff;
            X(cell.first, cell.second) = X_new(cell.first, cell.second);
        }
        result.iterations = iter;
        result.change = change;
        if(change < options.tol){
            result.converged = true;
            break;
        }
    }
    if(!result.converged){
        spdlog::warn("Imputation did not converge after {} iterations (maximum change {})", result.iterations, result.change);
    }
    return result;
}
