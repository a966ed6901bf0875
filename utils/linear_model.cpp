/*
 * @Description:
 * @Author: Chao Ning
 * @Date: 2025-04-02 10:21:07
 * @LastEditTime: 2025-04-14 11:03:52
 * @LastEditors: Chao Ning
 */

#include <map>
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <Eigen/Dense>
#include <gsl/gsl_cdf.h>
#include <spdlog/spdlog.h>

#include "linear_model.hpp"

using std::map;
using Eigen::ColPivHouseholderQR;
using Eigen::HouseholderQR;


const AnovaRow* find_anova_row(const vector<AnovaRow>& table, const string& source){
    for(const auto& row:table){
        if(row.source == source) return &row;
    }
    return nullptr;
}


double f_test_pvalue(double f, double df1, double df2){
    if(std::isnan(f) || df1 <= 0 || df2 <= 0) return std::nan("");
    if(std::isinf(f)) return 0.0;
    return gsl_cdf_fdist_Q(f, df1, df2);
}


LinearModel::LinearModel(const VectorXd& y){
    m_y = y;
    m_rank = 0;
    m_df_residual = 0;
    m_deviance = 0;
    m_fitted = false;
}


void LinearModel::add_term(const string& name, const FactorColumn& factor){
    this->add_term(name, vector<const FactorColumn*>{&factor});
}


/**
 * @brief add a main effect (one factor) or an interaction (several factors).
 *        Each observed level combination becomes one indicator column.
 */
void LinearModel::add_term(const string& name, const vector<const FactorColumn*>& factor_vec){
    long long nrow = m_y.size();
    map<vector<long long>, long long> cell_map;
    vector<long long> cell_vec(nrow);
    for(long long i = 0; i < nrow; i++){
        vector<long long> key;
        for(auto factor:factor_vec){
            if((long long)factor->index.size() != nrow){
                spdlog::error("Term {} has {} records, the response has {}", name, factor->index.size(), nrow);
                throw std::invalid_argument("Factor and response differ in length");
            }
            key.push_back(factor->index[i]);
        }
        auto it = cell_map.find(key);
        if(it == cell_map.end()){
            long long k = cell_map.size();
            cell_map[key] = k;
            cell_vec[i] = k;
        }else{
            cell_vec[i] = it->second;
        }
    }

    MatrixXd mat = MatrixXd::Zero(nrow, cell_map.size());
    for(long long j = 0; j < nrow; j++){
        mat(j, cell_vec[j]) = 1.0;
    }
    m_term_name_vec.push_back(name);
    m_term_mat_vec.push_back(mat);
    m_fitted = false;
}


/**
 * @brief orthonormal basis of the column space of x. The columns kept are the first rank
 *        pivots of a column-pivoting QR with relative tolerance 1e-7.
 */
static MatrixXd column_space_basis(const MatrixXd& x){
    ColPivHouseholderQR<MatrixXd> qr;
    qr.setThreshold(1.0e-7);
    qr.compute(x);
    long long rank = qr.rank();
    MatrixXd x_full_rank(x.rows(), rank);
    for(long long j = 0; j < rank; j++){
        x_full_rank.col(j) = x.col(qr.colsPermutation().indices()(j));
    }
    HouseholderQR<MatrixXd> qr_thin(x_full_rank);
    return qr_thin.householderQ() * MatrixXd::Identity(x.rows(), rank);
}


void LinearModel::fit(){
    long long nrow = m_y.size();
    MatrixXd xmat = MatrixXd::Ones(nrow, 1);

    // projection of y on the column space of x
    MatrixXd Q;
    auto rss_rank = [this, &Q](const MatrixXd& x, long long& rank, VectorXd& fitted){
        Q = column_space_basis(x);
        rank = Q.cols();
        fitted = Q * (Q.transpose() * m_y);
        return (m_y - fitted).squaredNorm();
    };

    long long rank_prev;
    VectorXd fitted_Vec;
    double rss_prev = rss_rank(xmat, rank_prev, fitted_Vec);

    vector<AnovaRow> term_row_vec;
    for(long long i = 0; i < (long long)m_term_mat_vec.size(); i++){
        long long ncol = xmat.cols();
        xmat.conservativeResize(nrow, ncol + m_term_mat_vec[i].cols());
        xmat.rightCols(m_term_mat_vec[i].cols()) = m_term_mat_vec[i];
        long long rank_curr;
        double rss_curr = rss_rank(xmat, rank_curr, fitted_Vec);
        long long df = rank_curr - rank_prev;
        if(df > 0){
            AnovaRow row;
            row.source = m_term_name_vec[i];
            row.df = df;
            row.ss = std::max(rss_prev - rss_curr, 0.0);
            row.ms = row.ss / row.df;
            term_row_vec.push_back(row);
        }
        rank_prev = rank_curr;
        rss_prev = rss_curr;
    }

    m_rank = rank_prev;
    m_deviance = rss_prev;
    m_df_residual = nrow - m_rank;
    m_fitted_Vec = fitted_Vec;
    m_resid_Vec = m_y - fitted_Vec;
    m_hat_Vec = Q.rowwise().squaredNorm();

    double mse = this->mse();
    for(auto& row:term_row_vec){
        row.f = row.ms / mse;
        row.p = f_test_pvalue(row.f, row.df, m_df_residual);
    }
    AnovaRow residual_row = {"Residuals", m_df_residual, m_deviance, mse, std::nan(""), std::nan("")};
    term_row_vec.push_back(residual_row);
    m_anova_vec = term_row_vec;
    m_fitted = true;
}


vector<AnovaRow> LinearModel::anova() const {
    if(!m_fitted){
        spdlog::error("The linear model has not been fitted");
        throw std::logic_error("LinearModel::anova called before fit");
    }
    return m_anova_vec;
}


double LinearModel::mse() const {
    if(m_df_residual <= 0) return std::nan("");
    return m_deviance / m_df_residual;
}


/**
 * @brief leave-one-out residual standard deviation
 */
VectorXd LinearModel::sigma() const {
    long long n = m_y.size();
    VectorXd sigma_Vec(n);
    double df = m_df_residual - 1;
    for(long long i = 0; i < n; i++){
        if(df <= 0){
            sigma_Vec(i) = std::nan("");
            continue;
        }
        double h = m_hat_Vec(i);
        double drop = (1 - h > 1.0e-10) ? m_resid_Vec(i) * m_resid_Vec(i) / (1 - h) : 0.0;
        sigma_Vec(i) = std::sqrt(std::max(m_deviance - drop, 0.0) / df);
    }
    return sigma_Vec;
}


VectorXd LinearModel::stdres() const {
    long long n = m_y.size();
    double s = std::sqrt(this->mse());
    VectorXd stdres_Vec(n);
    for(long long i = 0; i < n; i++){
        double h = m_hat_Vec(i);
        if(1 - h > 1.0e-10){
            stdres_Vec(i) = m_resid_Vec(i) / (s * std::sqrt(1 - h));
        }else{
            stdres_Vec(i) = std::nan("");
        }
    }
    return stdres_Vec;
}


VectorXd LinearModel::se_fit() const {
    return m_hat_Vec.array().sqrt() * std::sqrt(this->mse());
}
