// impute_test.cpp: filling missing genotype x environment cells

#include <gtest/gtest.h>

#include "utils/impute.hpp"

#include <cmath>
#include <stdexcept>

using Eigen::MatrixXd;

namespace {

MatrixXd rank_one() {
    MatrixXd mat(4, 3);
    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 3; ++j) {
            mat(i, j) = (i + 1.0) * (j == 0 ? 2.0 : (j == 1 ? 3.0 : 5.0));
        }
    }
    return mat;
}

}  // namespace

TEST(ImputeTest, CompleteMatrixIsReturnedUnchanged) {
    ImputeResult result = impute_ge_matrix(rank_one());
    EXPECT_EQ(result.num_missing, 0);
    EXPECT_TRUE(result.mat.isApprox(rank_one()));
}

TEST(ImputeTest, ColumnMeansFillWithoutIteration) {
    MatrixXd mat = rank_one();
    mat(3, 2) = std::nan("");
    ImputeOptions options;
    options.algorithm = "colmeans";
    ImputeResult result = impute_ge_matrix(mat, options);
    EXPECT_EQ(result.num_missing, 1);
    EXPECT_EQ(result.iterations, 0);
    EXPECT_NEAR(result.mat(3, 2), (5.0 + 10.0 + 15.0) / 3.0, 1e-12);
}

TEST(ImputeTest, EmSvdRecoversRankOneCell) {
    MatrixXd mat = rank_one();
    mat(3, 2) = std::nan("");
    ImputeResult result = impute_ge_matrix(mat);
    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(result.mat(3, 2), 20.0, 1e-4);
    EXPECT_DOUBLE_EQ(result.mat(0, 0), 2.0);
}

TEST(ImputeTest, EmptyRowOrColumnCannotBeImputed) {
    MatrixXd mat = rank_one();
    mat.row(1).setConstant(std::nan(""));
    EXPECT_THROW(impute_ge_matrix(mat), std::runtime_error);
}

TEST(ImputeTest, InvalidOptionsAreRejected) {
    MatrixXd mat = rank_one();
    mat(0, 0) = std::nan("");
    ImputeOptions bad_algorithm;
    bad_algorithm.algorithm = "median";
    EXPECT_THROW(impute_ge_matrix(mat, bad_algorithm), std::invalid_argument);

    ImputeOptions too_many_axes;
    too_many_axes.naxis = 3;
    EXPECT_THROW(impute_ge_matrix(mat, too_many_axes), std::invalid_argument);
}
