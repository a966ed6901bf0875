// linear_model_test.cpp: sequential ANOVA of factor models

#include <gtest/gtest.h>

#include "utils/linear_model.hpp"
#include "utils/met_data.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

Eigen::VectorXd vec(std::initializer_list<double> values) {
    Eigen::VectorXd v(values.size());
    long long i = 0;
    for (double x : values) v(i++) = x;
    return v;
}

}  // namespace

TEST(LinearModelTest, OneWayAnova) {
    FactorColumn group = make_factor({"A", "A", "A", "B", "B", "B"});
    LinearModel model(vec({1, 2, 3, 4, 5, 6}));
    model.add_term("GROUP", group);
    model.fit();

    std::vector<AnovaRow> table = model.anova();
    ASSERT_EQ(table.size(), 2u);
    ASSERT_NE(find_anova_row(table, "GROUP"), nullptr);
    const AnovaRow& row = *find_anova_row(table, "GROUP");
    EXPECT_DOUBLE_EQ(row.df, 1);
    EXPECT_NEAR(row.ss, 13.5, 1e-10);
    EXPECT_NEAR(row.f, 13.5, 1e-10);
    EXPECT_GT(row.p, 0.0);
    EXPECT_LT(row.p, 0.05);

    ASSERT_NE(find_anova_row(table, "Residuals"), nullptr);
    const AnovaRow& residual = *find_anova_row(table, "Residuals");
    EXPECT_DOUBLE_EQ(residual.df, 4);
    EXPECT_NEAR(residual.ss, 4.0, 1e-10);
    EXPECT_NEAR(model.mse(), 1.0, 1e-10);
}

TEST(LinearModelTest, FittedValuesAndLeverage) {
    FactorColumn group = make_factor({"A", "A", "A", "B", "B", "B"});
    LinearModel model(vec({1, 2, 3, 4, 5, 6}));
    model.add_term("GROUP", group);
    model.fit();
    EXPECT_EQ(model.rank(), 2);
    EXPECT_NEAR(model.fitted()(0), 2.0, 1e-10);
    EXPECT_NEAR(model.fitted()(5), 5.0, 1e-10);
    EXPECT_NEAR(model.residuals()(2), 1.0, 1e-10);
    for (long long i = 0; i < 6; ++i) {
        EXPECT_NEAR(model.hat()(i), 1.0 / 3.0, 1e-10);
    }
    EXPECT_NEAR(model.se_fit()(0), std::sqrt(1.0 / 3.0), 1e-10);
}

TEST(LinearModelTest, AliasedTermIsLeftOut) {
    FactorColumn a = make_factor({"x", "x", "y", "y"});
    FactorColumn b = make_factor({"p", "p", "q", "q"});
    LinearModel model(vec({1, 2, 5, 7}));
    model.add_term("A", a);
    model.add_term("B", b);
    model.fit();
    std::vector<AnovaRow> table = model.anova();
    EXPECT_EQ(table.size(), 2u);
    EXPECT_EQ(find_anova_row(table, "B"), nullptr);
}

TEST(LinearModelTest, AnovaBeforeFitIsAnError) {
    LinearModel model(vec({1, 2, 3}));
    EXPECT_THROW(model.anova(), std::logic_error);
}

TEST(FTestTest, UpperTailProbability) {
    EXPECT_NEAR(f_test_pvalue(1.0, 1, 1), 0.5, 1e-10);
    EXPECT_TRUE(std::isnan(f_test_pvalue(std::nan(""), 1, 4)));
    EXPECT_TRUE(std::isnan(f_test_pvalue(2.0, 1, 0)));
    EXPECT_DOUBLE_EQ(f_test_pvalue(INFINITY, 2, 3), 0.0);
}

TEST(LinearModelTest, OverparameterizedTwoWayFitIsLeastSquares) {
    // 3 x 2 crossed factors, 2 observations per cell; intercept plus every indicator column
    std::vector<std::string> a_vec, b_vec;
    Eigen::VectorXd y(12);
    const double values[12] = {3, 5, 8, 9, 4, 4, 10, 13, 6, 7, 15, 14};
    for (int i = 0; i < 12; ++i) {
        a_vec.push_back("a" + std::to_string(i / 4));
        b_vec.push_back("b" + std::to_string((i / 2) % 2));
        y(i) = values[i];
    }
    FactorColumn a = make_factor(a_vec);
    FactorColumn b = make_factor(b_vec);
    LinearModel model(y);
    model.add_term("A", a);
    model.add_term("B", b);
    model.fit();
    EXPECT_EQ(model.rank(), 4);

    // balanced additive fit: mean of A level + mean of B level - grand mean
    Eigen::VectorXd a_mean = mean_by_level(a, y);
    Eigen::VectorXd b_mean = mean_by_level(b, y);
    double grand = y.mean();
    double rss = 0, ss_a = 0;
    for (int i = 0; i < 12; ++i) {
        double expected = a_mean(a.index[i]) + b_mean(b.index[i]) - grand;
        EXPECT_NEAR(model.fitted()(i), expected, 1e-10);
        rss += (y(i) - expected) * (y(i) - expected);
    }
    for (long long k = 0; k < 3; ++k) ss_a += 4 * (a_mean(k) - grand) * (a_mean(k) - grand);

    std::vector<AnovaRow> table = model.anova();
    ASSERT_NE(find_anova_row(table, "A"), nullptr);
    EXPECT_NEAR(find_anova_row(table, "A")->ss, ss_a, 1e-10);
    EXPECT_DOUBLE_EQ(find_anova_row(table, "A")->df, 2);
    EXPECT_NEAR(find_anova_row(table, "Residuals")->ss, rss, 1e-10);
    EXPECT_DOUBLE_EQ(model.df_residual(), 8);
    // leverages of a full-rank projection sum to the rank
    EXPECT_NEAR(model.hat().sum(), 4.0, 1e-10);
}
