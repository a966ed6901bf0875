/*
 * @Descripttion: Dense matrix helpers: scaling, covariance/correlation, generalized inverse,
 *                symmetric eigen-decomposition and varimax rotation
 * @version:
 * @Author: Chao Ning
 * @Date: 2022-06-22 21:08:46
 * @LastEditors: Chao Ning
 * @LastEditTime: 2025-04-13 16:02:11
 */
#pragma once
#include <iostream>
#include <vector>
#include <Eigen/Core>
#include <Eigen/Eigen>
#include <Eigen/Dense>


void mat_col_elementwise_dot_vec(Eigen::MatrixXd& mat, const Eigen::VectorXd& vec);

void mat_row_elementwise_dot_vec(Eigen::MatrixXd& mat, const Eigen::VectorXd& vec);


/**
 * @brief sample standard deviation (n - 1) of each column
 */
Eigen::VectorXd col_sd(const Eigen::MatrixXd& mat);

Eigen::MatrixXd cov_mat(const Eigen::MatrixXd& mat);

Eigen::MatrixXd cor_mat(const Eigen::MatrixXd& mat);

/**
 * @brief covariance between the columns of X (rows of the result) and the columns of Y
 */
Eigen::MatrixXd cross_cov(const Eigen::MatrixXd& X, const Eigen::MatrixXd& Y);

Eigen::MatrixXd cross_cor(const Eigen::MatrixXd& X, const Eigen::MatrixXd& Y);


/**
 * @brief Moore-Penrose inverse from the SVD. Singular values below tolerance * d_max are dropped.
 *
 * @param A
 * @param tolerance relative tolerance
 * @return Eigen::MatrixXd
 */
Eigen::MatrixXd pinv_svd(const Eigen::MatrixXd& A, double tolerance = 2.220446e-16);


/**
 * @brief eigen-decomposition of a symmetric matrix, eigenvalues in decreasing order
 *
 * @param A symmetric matrix
 * @param eigenvals decreasing eigenvalues
 * @param eigenvecs eigenvectors in columns, same order as eigenvals
 */
void sym_eigen_desc(const Eigen::MatrixXd& A, Eigen::VectorXd& eigenvals, Eigen::MatrixXd& eigenvecs);


/**
 * @brief A^{-1/2} of a symmetric positive definite matrix
 */
Eigen::MatrixXd inv_sqrt_sym(const Eigen::MatrixXd& A);


/**
 * @brief Varimax rotation of a loading matrix (Kaiser, 1958)
 *
 * @param loadings variables in rows, factors in columns
 * @param normalize apply Kaiser normalization to the rows before rotation
 * @param eps relative tolerance on the criterion
 * @param max_iter maximum number of iterations
 * @return Eigen::MatrixXd rotated loadings; returned unchanged with fewer than two factors
 */
Eigen::MatrixXd varimax(const Eigen::MatrixXd& loadings, bool normalize = true, double eps = 1.0e-5, int max_iter = 1000);
