/*
 * @Description: Fixed-effects linear model on factor terms with sequential (Type I) ANOVA
 * @Author: Chao Ning
 * @Date: 2025-04-02 10:21:07
 * @LastEditTime: 2025-04-14 11:03:52
 * @LastEditors: Chao Ning
 */
#pragma once

#include <string>
#include <vector>
#include <Eigen/Core>
#include <Eigen/Dense>

#include "met_data.hpp"

using std::string;
using std::vector;
using Eigen::MatrixXd;
using Eigen::VectorXd;


struct AnovaRow{
    string source;
    double df;
    double ss;
    double ms;
    double f;
    double p;
};

// row of the table with the given source, nullptr for an aliased or absent term
const AnovaRow* find_anova_row(const vector<AnovaRow>& table, const string& source);

double f_test_pvalue(double f, double df1, double df2);


class LinearModel{
    public:
        explicit LinearModel(const VectorXd& y);

        void add_term(const string& name, const FactorColumn& factor);
        void add_term(const string& name, const vector<const FactorColumn*>& factor_vec);

        /**
         * @brief Fit the terms in the order they were added.
         *
         * The sum of squares of a term is the drop of the residual sum of squares when it enters,
         * its degrees of freedom the gain in rank; terms that add no rank are left out of the table.
         */
        void fit();

        vector<AnovaRow> anova() const;

        const VectorXd& fitted() const { return m_fitted_Vec; }
        const VectorXd& residuals() const { return m_resid_Vec; }
        const VectorXd& hat() const { return m_hat_Vec; }
        VectorXd sigma() const;
        VectorXd stdres() const;
        VectorXd se_fit() const;

        long long rank() const { return m_rank; }
        double df_residual() const { return m_df_residual; }
        double mse() const;

    private:
        VectorXd m_y;
        vector<string> m_term_name_vec;
        vector<MatrixXd> m_term_mat_vec;

        vector<AnovaRow> m_anova_vec;
        VectorXd m_fitted_Vec, m_resid_Vec, m_hat_Vec;
        long long m_rank;
        double m_df_residual, m_deviance;
        bool m_fitted;
};
