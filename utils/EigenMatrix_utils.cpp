/*
 * @Descripttion:
 * @version:
 * @Author: Chao Ning
 * @Date: 2022-06-22 21:08:46
 * @LastEditors: Chao Ning
 * @LastEditTime: 2025-04-13 16:40:29
 */


#include <iostream>
#include <cassert>
#include <cmath>
#include <algorithm>
#include <Eigen/Core>
#include <Eigen/Eigen>
#include <Eigen/Dense>

#include "EigenMatrix_utils.hpp"


using namespace Eigen;
using namespace std;


void mat_col_elementwise_dot_vec(Eigen::MatrixXd& mat, const Eigen::VectorXd& vec) {
    assert(mat.rows() == vec.size() && "Vector size must match the number of matrix rows!");
    mat.array().colwise() *= vec.array();
}


void mat_row_elementwise_dot_vec(Eigen::MatrixXd& mat, const Eigen::VectorXd& vec) {
    assert(mat.cols() == vec.size() && "Vector size must match the number of matrix columns!");
    mat.array().rowwise() *= vec.transpose().array();
}


VectorXd col_sd(const MatrixXd& mat){
    long long n = mat.rows();
    VectorXd sd_Vec = VectorXd::Zero(mat.cols());
    if(n < 2) return VectorXd::Constant(mat.cols(), std::nan(""));
    RowVectorXd mean_Vec = mat.colwise().mean();
    MatrixXd centered = mat.rowwise() - mean_Vec;
    sd_Vec = (centered.array().square().colwise().sum() / (n - 1)).sqrt().transpose();
    return sd_Vec;
}


MatrixXd cross_cov(const MatrixXd& X, const MatrixXd& Y){
    assert(X.rows() == Y.rows() && "X and Y must have the same number of rows!");
    long long n = X.rows();
    MatrixXd Xc = X.rowwise() - X.colwise().mean();
    MatrixXd Yc = Y.rowwise() - Y.colwise().mean();
    return Xc.transpose() * Yc / (n - 1);
}


MatrixXd cov_mat(const MatrixXd& mat){
    return cross_cov(mat, mat);
}


MatrixXd cross_cor(const MatrixXd& X, const MatrixXd& Y){
    MatrixXd cov = cross_cov(X, Y);
    VectorXd sdX = col_sd(X);
    VectorXd sdY = col_sd(Y);
    for(long long i = 0; i < cov.rows(); i++){
        for(long long j = 0; j < cov.cols(); j++){
            cov(i, j) /= sdX(i) * sdY(j);
        }
    }
    return cov;
}


MatrixXd cor_mat(const MatrixXd& mat){
    MatrixXd cor = cross_cor(mat, mat);
    cor.diagonal().setOnes();
    return cor;
}


MatrixXd pinv_svd(const MatrixXd& A, double tolerance){
    JacobiSVD<MatrixXd> svd(A, ComputeThinU | ComputeThinV);
    VectorXd d = svd.singularValues();
    if(d.size() == 0) return MatrixXd::Zero(A.cols(), A.rows());
    double cut = std::max(tolerance * d(0), 0.0);
    VectorXd d_inv = VectorXd::Zero(d.size());
    for(long long i = 0; i < d.size(); i++){
        if(d(i) > cut) d_inv(i) = 1.0 / d(i);
    }
    return svd.matrixV() * d_inv.asDiagonal() * svd.matrixU().transpose();
}


void sym_eigen_desc(const MatrixXd& A, VectorXd& eigenvals, MatrixXd& eigenvecs){
    SelfAdjointEigenSolver<MatrixXd> eigensolver(A);
    // ascending in Eigen
    eigenvals = eigensolver.eigenvalues().reverse();
    eigenvecs = eigensolver.eigenvectors().rowwise().reverse();
}


MatrixXd inv_sqrt_sym(const MatrixXd& A){
    VectorXd eigenvals;
    MatrixXd eigenvecs;
    sym_eigen_desc(A, eigenvals, eigenvecs);
    VectorXd d = eigenvals.array().sqrt().inverse();
    return eigenvecs * d.asDiagonal() * eigenvecs.transpose();
}


MatrixXd varimax(const MatrixXd& loadings, bool normalize, double eps, int max_iter){
    long long nc = loadings.cols();
    if(nc < 2) return loadings;

    MatrixXd x = loadings;
    long long p = x.rows();
    VectorXd sc = VectorXd::Ones(p);
    if(normalize){
        sc = x.rowwise().norm();
        for(long long i = 0; i < p; i++){
            if(sc(i) == 0) sc(i) = 1;
        }
        mat_col_elementwise_dot_vec(x, sc.cwiseInverse());
    }

    MatrixXd TT = MatrixXd::Identity(nc, nc);
    double d = 0;
    for(int iter = 0; iter < max_iter; iter++){
        MatrixXd z = x * TT;
        VectorXd col_sq = z.array().square().colwise().sum().transpose();
        MatrixXd B = x.transpose() * (z.array().cube().matrix() - z * col_sq.asDiagonal() / p);
        JacobiSVD<MatrixXd> svd(B, ComputeFullU | ComputeFullV);
        TT = svd.matrixU() * svd.matrixV().transpose();
        double dpast = d;
        d = svd.singularValues().sum();
        if(d < dpast * (1 + eps)) break;
    }

    MatrixXd z = x * TT;
    if(normalize){
        mat_col_elementwise_dot_vec(z, sc);
    }
    return z;
}
