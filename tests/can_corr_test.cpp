// can_corr_test.cpp: canonical correlations and their significance tests

#include <gtest/gtest.h>

#include "fastmet/can_corr.hpp"
#include "utils/EigenMatrix_utils.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using Eigen::MatrixXd;

namespace {

CanCorrOptions quiet_options() {
    CanCorrOptions options;
    options.verbose = false;
    return options;
}

// SG shares part of its signal with FG
void make_groups(MatrixXd& FG, MatrixXd& SG) {
    MatrixXd noise = test_helpers::pseudo_random(30, 5, 41);
    FG = noise.leftCols(2);
    SG.resize(30, 3);
    SG.col(0) = FG.col(0) + 0.5 * noise.col(2);
    SG.col(1) = FG.col(1) - FG.col(0) + noise.col(3);
    SG.col(2) = noise.col(4);
}

}  // namespace

TEST(CanCorrTest, CorrelationsAreOrderedInUnitInterval) {
    MatrixXd FG, SG;
    make_groups(FG, SG);
    CanCorrResult result = can_corr(FG, SG, {"X1", "X2"}, {"Y1", "Y2", "Y3"}, quiet_options());
    ASSERT_EQ(result.corr.size(), 2);
    EXPECT_GE(result.corr(0), result.corr(1));
    for (long long i = 0; i < result.corr.size(); ++i) {
        EXPECT_GE(result.corr(i), 0.0);
        EXPECT_LE(result.corr(i), 1.0);
    }
}

TEST(CanCorrTest, CanonicalVariatesReachTheCorrelation) {
    MatrixXd FG, SG;
    make_groups(FG, SG);
    CanCorrOptions options = quiet_options();
    options.use = "cov";
    CanCorrResult result = can_corr(FG, SG, {"X1", "X2"}, {"Y1", "Y2", "Y3"}, options);
    MatrixXd u = result.score_fg.col(0);
    MatrixXd v = result.score_sg.col(0);
    EXPECT_NEAR(cross_cor(u, v)(0, 0), result.corr(0), 1e-8);
}

TEST(CanCorrTest, BartlettLambdaAndDegreesOfFreedom) {
    MatrixXd FG, SG;
    make_groups(FG, SG);
    CanCorrResult result = can_corr(FG, SG, {"X1", "X2"}, {"Y1", "Y2", "Y3"}, quiet_options());
    ASSERT_EQ(result.sigtest.size(), 2u);
    const CanCorrTestRow& first = result.sigtest[0];
    EXPECT_GT(first.lambda, 0.0);
    EXPECT_LE(first.lambda, 1.0);
    EXPECT_NEAR(first.lambda, (1 - std::pow(result.corr(0), 2)) * (1 - std::pow(result.corr(1), 2)), 1e-12);
    EXPECT_DOUBLE_EQ(first.df1, 6);
    EXPECT_DOUBLE_EQ(result.sigtest[1].df1, 2);
    EXPECT_NEAR(first.stat, -((30 - 1) - (2 + 3 + 1) / 2.0) * std::log(first.lambda), 1e-10);
    EXPECT_LT(first.p, 0.05);
    EXPECT_NEAR(result.sigtest[1].cum_percent, 100.0, 1e-8);
}

TEST(CanCorrTest, RaoTestHasTwoDegreesOfFreedom) {
    MatrixXd FG, SG;
    make_groups(FG, SG);
    CanCorrOptions options = quiet_options();
    options.test = "Rao";
    CanCorrResult result = can_corr(FG, SG, {"X1", "X2"}, {"Y1", "Y2", "Y3"}, options);
    const CanCorrTestRow& first = result.sigtest[0];
    EXPECT_DOUBLE_EQ(first.df1, 6);
    // p = 2, q = 3: s = sqrt((4 * 9 - 4) / (4 + 9 - 5)) = 2
    double t = 29 - (2 + 3 + 1) / 2.0;
    EXPECT_NEAR(first.df2, 1 + t * 2 - 3, 1e-12);
    EXPECT_GE(first.p, 0.0);
    EXPECT_LE(first.p, 1.0);
}

TEST(CanCorrTest, IdenticalGroupsAreFullyCorrelated) {
    MatrixXd X = test_helpers::pseudo_random(25, 2, 5);
    CanCorrResult result = can_corr(X, X, {"A", "B"}, {"A2", "B2"}, quiet_options());
    EXPECT_NEAR(result.corr(0), 1.0, 1e-8);
    EXPECT_LT(result.sigtest[0].p, 1e-10);
}

TEST(CanCorrTest, CovarianceGivesSameCorrelations) {
    MatrixXd FG, SG;
    make_groups(FG, SG);
    CanCorrOptions options = quiet_options();
    options.use = "cov";
    CanCorrResult by_cov = can_corr(FG, SG, {"X1", "X2"}, {"Y1", "Y2", "Y3"}, options);
    CanCorrResult by_cor = can_corr(FG, SG, {"X1", "X2"}, {"Y1", "Y2", "Y3"}, quiet_options());
    EXPECT_TRUE(by_cov.corr.isApprox(by_cor.corr, 1e-8));
}

TEST(CanCorrTest, CollinearityDiagnostics) {
    MatrixXd FG, SG;
    make_groups(FG, SG);
    CanCorrResult result = can_corr(FG, SG, {"X1", "X2"}, {"Y1", "Y2", "Y3"}, quiet_options());
    ASSERT_TRUE(result.has_collinearity);
    EXPECT_GT(result.colin_sg.cor_det, 0.0);
    EXPECT_GE(result.colin_sg.condition_number, 1.0);
    EXPECT_EQ(result.colin_sg.vif.size(), 3);
    EXPECT_GE(result.colin_sg.vif.minCoeff(), 1.0 - 1e-10);
}

TEST(CanCorrTest, InvalidArguments) {
    MatrixXd FG, SG;
    make_groups(FG, SG);
    std::vector<std::string> fg{"X1", "X2"}, sg{"Y1", "Y2", "Y3"};
    EXPECT_THROW(can_corr(SG, FG, sg, fg, quiet_options()), std::invalid_argument);
    EXPECT_THROW(can_corr(FG.topRows(10), SG, fg, sg, quiet_options()), std::invalid_argument);
    CanCorrOptions bad_test = quiet_options();
    bad_test.test = "Wilks";
    EXPECT_THROW(can_corr(FG, SG, fg, sg, bad_test), std::invalid_argument);
    CanCorrOptions bad_prob = quiet_options();
    bad_prob.prob = 0;
    EXPECT_THROW(can_corr(FG, SG, fg, sg, bad_prob), std::invalid_argument);
}

TEST(CanCorrByTest, OneAnalysisPerLevel) {
    MatrixXd FG, SG;
    make_groups(FG, SG);
    MatrixXd all(30, 5);
    all << FG, SG;
    METData numeric = test_helpers::make_numeric_data({"X1", "X2", "Y1", "Y2", "Y3"}, all);
    std::vector<std::string> site;
    for (int i = 0; i < 30; ++i) site.push_back(i < 15 ? "S1" : "S2");
    std::vector<std::string> head = numeric.get_head();
    std::vector<std::vector<std::string>> columns;
    for (long long j = 0; j < 5; ++j) {
        std::vector<std::string> col;
        numeric.get_given_column(j, col);
        columns.push_back(col);
    }
    head.push_back("SITE");
    columns.push_back(site);
    METData data;
    data.from_columns(head, columns);

    std::vector<CanCorrResult> result_vec = can_corr_by(data, {"X1:X2"}, {"Y1:Y3"}, "SITE", "", quiet_options());
    ASSERT_EQ(result_vec.size(), 2u);
    EXPECT_EQ(result_vec[0].group, "S1");
    EXPECT_EQ(result_vec[1].n, 15);

    std::ostringstream os;
    print_can_corr(os, result_vec);
    EXPECT_NE(os.str().find("Correlation of the canonical pairs and hypothesis testing"), std::string::npos);
}
