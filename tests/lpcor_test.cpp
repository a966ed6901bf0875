// lpcor_test.cpp: linear and partial correlations with their t tests

#include <gtest/gtest.h>

#include "fastmet/lpcor.hpp"
#include "test_helpers.hpp"
#include "utils/someCommonFun.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using Eigen::MatrixXd;

namespace {

MatrixXd three_var_cor() {
    MatrixXd R(3, 3);
    R << 1.0, 0.5, 0.4,
         0.5, 1.0, 0.3,
         0.4, 0.3, 1.0;
    return R;
}

double partial_given_third(double rxy, double rxz, double ryz) {
    return (rxy - rxz * ryz) / std::sqrt((1 - rxz * rxz) * (1 - ryz * ryz));
}

}  // namespace

TEST(LpcorTest, PairsInColumnOrder) {
    LpcorResult result = lpcor_cor(three_var_cor(), 20, {"A", "B", "C"});
    ASSERT_EQ(result.pairs.size(), 3u);
    EXPECT_EQ(result.pairs[0].pair, "A x B");
    EXPECT_EQ(result.pairs[1].pair, "A x C");
    EXPECT_EQ(result.pairs[2].pair, "B x C");
    EXPECT_DOUBLE_EQ(result.pairs[1].linear, 0.4);
}

TEST(LpcorTest, PartialCorrelationOfThreeVariables) {
    LpcorResult result = lpcor_cor(three_var_cor(), 20, {"A", "B", "C"});
    EXPECT_NEAR(result.pairs[0].partial, partial_given_third(0.5, 0.4, 0.3), 1e-10);
    EXPECT_NEAR(result.pairs[1].partial, partial_given_third(0.4, 0.5, 0.3), 1e-10);
    EXPECT_NEAR(result.pairs[2].partial, partial_given_third(0.3, 0.5, 0.4), 1e-10);
    for (long long i = 0; i < 3; ++i) {
        EXPECT_DOUBLE_EQ(result.partial_mat(i, i), 1.0);
    }
    EXPECT_NEAR(result.partial_mat(0, 1), result.partial_mat(1, 0), 1e-12);
}

TEST(LpcorTest, TestStatisticAndProbability) {
    LpcorResult result = lpcor_cor(three_var_cor(), 20, {"A", "B", "C"});
    for (const auto& row : result.pairs) {
        double expected_t = row.partial / std::sqrt(1 - row.partial * row.partial) * std::sqrt(17.0);
        EXPECT_NEAR(row.t, expected_t, 1e-10);
        EXPECT_GT(row.p, 0.0);
        EXPECT_LT(row.p, 1.0);
    }
    // a larger partial correlation is more significant
    EXPECT_LT(result.pairs[0].p, result.pairs[2].p);
}

TEST(LpcorTest, NoTestsWithoutResidualDegreesOfFreedom) {
    LpcorResult result = lpcor_cor(three_var_cor(), 3, {"A", "B", "C"});
    for (const auto& row : result.pairs) {
        EXPECT_TRUE(std::isnan(row.t));
        EXPECT_TRUE(std::isnan(row.p));
        EXPECT_FALSE(std::isnan(row.partial));
    }
    std::ostringstream os;
    print_lpcor(os, {result});
    EXPECT_NE(os.str().find("NA"), std::string::npos);
}

TEST(LpcorTest, InvalidMatrices) {
    EXPECT_THROW(lpcor_cor(MatrixXd::Identity(3, 2), 20, {"A", "B", "C"}), std::invalid_argument);
    EXPECT_THROW(lpcor_cor(three_var_cor(), 20, {"A", "B"}), std::invalid_argument);
    EXPECT_THROW(lpcor_cor(MatrixXd::Identity(1, 1), 20, {"A"}), std::invalid_argument);
    EXPECT_THROW(lpcor_cor(three_var_cor(), 0, {"A", "B", "C"}), std::invalid_argument);
    EXPECT_THROW(lpcor(test_helpers::pseudo_random(2, 3), {"A", "B", "C"}), std::domain_error);
}

TEST(LpcorTest, RawDataUsesSampleSize) {
    MatrixXd X = test_helpers::pseudo_random(15, 3, 23);
    X.col(1) += X.col(0);
    LpcorResult result = lpcor(X, {"A", "B", "C"});
    EXPECT_EQ(result.n, 15);
    EXPECT_GT(result.pairs[0].linear, 0.3);
    double expected_t = result.pairs[0].partial / std::sqrt(1 - std::pow(result.pairs[0].partial, 2)) * std::sqrt(12.0);
    EXPECT_NEAR(result.pairs[0].t, expected_t, 1e-10);
}

TEST(LpcorByTest, OneResultPerGroup) {
    METData data = test_helpers::make_trial_data(4, 3, 2);
    std::vector<LpcorResult> result_vec = lpcor_by(data, {"REP", "GY", "HM"}, "ENV", false);
    ASSERT_EQ(result_vec.size(), 3u);
    EXPECT_EQ(result_vec[0].group, "E1");
    EXPECT_EQ(result_vec[2].group, "E3");
    EXPECT_EQ(result_vec[1].n, 8);
    EXPECT_EQ(result_vec[1].pairs.size(), 3u);

    std::ostringstream os;
    print_lpcor(os, result_vec);
    EXPECT_EQ(os.str().find("Group"), 0u);
    EXPECT_NE(os.str().find("REP x GY"), std::string::npos);
}

TEST(LpcorByTest, WholeTableWithoutGrouping) {
    METData data = test_helpers::make_trial_data(4, 3, 2);
    std::vector<LpcorResult> result_vec = lpcor_by(data, {"GY:HM"}, "", false);
    ASSERT_EQ(result_vec.size(), 1u);
    EXPECT_EQ(result_vec[0].n, 24);
    EXPECT_TRUE(result_vec[0].group.empty());
    ASSERT_EQ(result_vec[0].pairs.size(), 1u);
    // with two variables the partial correlation is the linear one
    EXPECT_NEAR(result_vec[0].pairs[0].partial, result_vec[0].pairs[0].linear, 1e-10);
}

TEST(CorByMethodTest, RankCorrelationsOfSmallSample) {
    MatrixXd X(5, 2);
    X << 1, 3,
         2, 1,
         3, 2,
         4, 5,
         5, 4;
    // squared rank differences sum to 8: 1 - 6 * 8 / (5 * 24)
    EXPECT_NEAR(cor_by_method(X, "spearman")(0, 1), 0.6, 1e-12);
    // 7 concordant and 3 discordant pairs out of 10
    EXPECT_NEAR(cor_by_method(X, "kendall")(0, 1), 0.4, 1e-12);
    EXPECT_NEAR(cor_by_method(X, "kendall")(1, 0), 0.4, 1e-12);
    EXPECT_DOUBLE_EQ(cor_by_method(X, "kendall")(0, 0), 1.0);
}

TEST(CorByMethodTest, KendallTauBCorrectsForTies) {
    MatrixXd X(4, 2);
    X << 1, 1,
         2, 2,
         2, 3,
         3, 4;
    // 5 concordant pairs, one pair tied in the first column only
    EXPECT_NEAR(cor_by_method(X, "kendall")(0, 1), 5.0 / std::sqrt(5.0 * 6.0), 1e-12);
}

TEST(CorByMethodTest, SpearmanIsPearsonOfAverageRanks) {
    MatrixXd X = test_helpers::pseudo_random(12, 3, 5);
    X(4, 0) = X(7, 0);  // a tie
    X.col(2) = X.col(0).array().exp();
    MatrixXd rank_mat(12, 3);
    for (long long j = 0; j < 3; ++j) rank_mat.col(j) = rank_average(X.col(j));
    EXPECT_DOUBLE_EQ(rank_mat(4, 0), rank_mat(7, 0));

    MatrixXd spearman = cor_by_method(X, "spearman");
    EXPECT_TRUE(spearman.isApprox(cor_by_method(rank_mat, "pearson"), 1e-12));
    // a monotone transform keeps the ranks
    EXPECT_NEAR(spearman(0, 2), 1.0, 1e-12);
    EXPECT_NEAR(cor_by_method(X, "kendall")(0, 2), 1.0, 1e-12);
    EXPECT_LT(cor_by_method(X, "pearson")(0, 2), 1.0 - 1e-6);
}

TEST(CorByMethodTest, UnknownMethodIsRejected) {
    MatrixXd X = test_helpers::pseudo_random(6, 2);
    EXPECT_THROW(cor_by_method(X, "pearsn"), std::invalid_argument);
    EXPECT_THROW(lpcor(X, {"A", "B"}, "Spearman"), std::invalid_argument);
}

TEST(LpcorByTest, RankMethodsFeedThePartialCorrelations) {
    METData data = test_helpers::make_trial_data(4, 3, 2);
    std::vector<LpcorResult> pearson_vec = lpcor_by(data, {"GY", "HM"}, "", false);
    std::vector<LpcorResult> kendall_vec = lpcor_by(data, {"GY", "HM"}, "", false, "kendall");
    ASSERT_EQ(kendall_vec.size(), 1u);
    MatrixXd X = select_numeric(data, {"GY", "HM"}, {}).values;
    EXPECT_NEAR(kendall_vec[0].pairs[0].linear, cor_by_method(X, "kendall")(0, 1), 1e-12);
    EXPECT_NEAR(kendall_vec[0].pairs[0].partial, kendall_vec[0].pairs[0].linear, 1e-10);
    EXPECT_NEAR(pearson_vec[0].pairs[0].linear, cor_by_method(X, "pearson")(0, 1), 1e-12);
    EXPECT_EQ(kendall_vec[0].n, 24);
}
