/*
 * @Description:
 * @Author: Chao Ning
 * @Date: 2025-04-08 10:26:50
 * @LastEditTime: 2025-04-14 19:10:36
 * @LastEditors: Chao Ning
 */

#include <cmath>
#include <Eigen/Dense>

#include "factor_analysis.hpp"
#include "EigenMatrix_utils.hpp"

using Eigen::MatrixXd;
using Eigen::VectorXd;


FactorAnalysis factor_analysis(const MatrixXd& cormat, double mineval){
    FactorAnalysis fa;
    fa.cormat = cormat;
    long long p = cormat.rows();

    MatrixXd eigenvecs;
    sym_eigen_desc(cormat, fa.eigenvalues, eigenvecs);
    double trace = fa.eigenvalues.sum();
    fa.variance = fa.eigenvalues / trace * 100;
    fa.cumulative = fa.variance;
    for(long long i = 1; i < p; i++){
        fa.cumulative(i) += fa.cumulative(i - 1);
    }

    fa.num_factors = 0;
    for(long long i = 0; i < p; i++){
        if(fa.eigenvalues(i) >= mineval) fa.num_factors++;
    }
    if(fa.num_factors < 1) fa.num_factors = 1;
    long long k = fa.num_factors;

    VectorXd sqrt_val = fa.eigenvalues.head(k).cwiseMax(0.0).cwiseSqrt();
    fa.initial_loadings = eigenvecs.leftCols(k) * sqrt_val.asDiagonal();
    fa.loadings = k > 1 ? varimax(fa.initial_loadings) : fa.initial_loadings;
    fa.communality = fa.loadings.rowwise().squaredNorm();
    fa.uniqueness = VectorXd::Ones(p) - fa.communality;

    MatrixXd cor_inv = pinv_svd(cormat);
    fa.canonical_loadings = cor_inv * fa.loadings;

    // anti-image correlations
    fa.partial = cor_inv;
    for(long long j = 0; j < p; j++){
        for(long long i = 0; i < p; i++){
            if(i == j) continue;
            fa.partial(i, j) = -cor_inv(i, j) / std::sqrt(cor_inv(i, i) * cor_inv(j, j));
        }
    }
    double r2_sum = 0, p2_sum = 0;
    fa.msa.resize(p);
    for(long long i = 0; i < p; i++){
        double r2_row = 0, p2_row = 0;
        for(long long j = 0; j < p; j++){
            if(i == j) continue;
            r2_row += cormat(i, j) * cormat(i, j);
            p2_row += fa.partial(i, j) * fa.partial(i, j);
        }
        fa.msa(i) = r2_row / (r2_row + p2_row);
        r2_sum += r2_row;
        p2_sum += p2_row;
    }
    fa.kmo = r2_sum / (r2_sum + p2_sum);

    fa.factor_of.resize(p);
    for(long long i = 0; i < p; i++){
        Eigen::Index idx;
        fa.loadings.row(i).cwiseAbs().maxCoeff(&idx);
        fa.factor_of[i] = idx;
    }
    return fa;
}


std::vector<long long> factor_order(const FactorAnalysis& fa){
    std::vector<long long> order_vec;
    for(long long f = 0; f < fa.num_factors; f++){
        for(long long i = 0; i < (long long)fa.factor_of.size(); i++){
            if(fa.factor_of[i] == f) order_vec.push_back(i);
        }
    }
    return order_vec;
}


MatrixXd scale_by_sd(const MatrixXd& mat){
    MatrixXd out = mat;
    mat_row_elementwise_dot_vec(out, col_sd(mat).cwiseInverse());
    return out;
}
