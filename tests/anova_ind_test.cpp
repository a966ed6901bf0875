// anova_ind_test.cpp: within-environment analysis of variance

#include <gtest/gtest.h>

#include "fastmet/anova_ind.hpp"
#include "utils/linear_model.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

using test_helpers::make_trial;

TEST(AnovaIndTest, OneRowPerEnvironment) {
    AnovaIndResult result = anova_ind(make_trial("GY"));
    ASSERT_EQ(result.individual.size(), 3u);
    EXPECT_EQ(result.individual[0].env, "E1");
    EXPECT_EQ(result.individual[2].env, "E3");
    EXPECT_FALSE(result.has_block);
}

TEST(AnovaIndTest, CompleteBlockDegreesOfFreedom) {
    AnovaIndResult result = anova_ind(make_trial("GY"));
    for (const auto& row : result.individual) {
        EXPECT_DOUBLE_EQ(row.dfg, 3);
        EXPECT_DOUBLE_EQ(row.dfr, 1);
        EXPECT_DOUBLE_EQ(row.dfe, 3);
        EXPECT_TRUE(std::isnan(row.dfib));
    }
}

TEST(AnovaIndTest, ResidualMeanSquareOfKnownLayout) {
    // the replicate offset grows with the genotype index, leaving 0.1 of residual SS per environment
    AnovaIndResult result = anova_ind(make_trial("GY"));
    for (const auto& row : result.individual) {
        EXPECT_NEAR(row.mse, 0.1 / 3.0, 1e-6);
    }
    EXPECT_NEAR(result.msr_ratio, 1.0, 1e-4);
}

TEST(AnovaIndTest, DerivedStatistics) {
    AnovaIndResult result = anova_ind(make_trial("GY"));
    for (const auto& row : result.individual) {
        EXPECT_NEAR(row.cv, std::sqrt(row.mse) / row.mean * 100, 1e-10);
        EXPECT_NEAR(row.h2, (row.msg - row.mse) / row.msg, 1e-10);
        if (row.h2 < 0) {
            EXPECT_DOUBLE_EQ(row.as, 0.0);
        } else {
            EXPECT_NEAR(row.as, std::sqrt(row.h2), 1e-10);
        }
        EXPECT_GT(row.fcg, 1.0);
    }
}

TEST(AnovaIndTest, ReportHeaderForCompleteBlocks) {
    std::vector<AnovaIndResult> result_vec{anova_ind(make_trial("GY"))};
    std::ostringstream os;
    print_anova_ind(os, result_vec);
    EXPECT_NE(os.str().find("DFB"), std::string::npos);
    EXPECT_EQ(os.str().find("DFIB_R"), std::string::npos);
    EXPECT_NE(os.str().find("MSRratio"), std::string::npos);
}

TEST(AnovaIndTest, LatticeSeparatesIncompleteBlocks) {
    AnovaIndResult result = anova_ind(test_helpers::make_lattice_trial());
    EXPECT_TRUE(result.has_block);
    ASSERT_EQ(result.individual.size(), 3u);
    for (const auto& row : result.individual) {
        EXPECT_DOUBLE_EQ(row.dfg, 3);
        EXPECT_DOUBLE_EQ(row.dfr, 1);
        EXPECT_DOUBLE_EQ(row.dfib, 2);
        EXPECT_DOUBLE_EQ(row.dfe, 1);
        EXPECT_NEAR(row.msr, 2.0, 1e-8);
        EXPECT_NEAR(row.msib, 1.0, 1e-8);
        EXPECT_NEAR(row.mse, 8.0, 1e-8);
        EXPECT_NEAR(row.fcr, 0.25, 1e-8);
        EXPECT_NEAR(row.fcib, 0.125, 1e-8);
        EXPECT_NEAR(row.pfib, f_test_pvalue(0.125, 2, 1), 1e-10);
    }
    EXPECT_NEAR(result.msr_ratio, 1.0, 1e-8);
}

TEST(AnovaIndTest, LatticeGenotypeMeanSquareOfFirstEnvironment) {
    // genotype means 11, 13.6, 15.2 and 16.3 over 2 plots each
    const AnovaIndRow row = anova_ind(test_helpers::make_lattice_trial()).individual[0];
    EXPECT_NEAR(row.mean, 14.025, 1e-10);
    EXPECT_NEAR(row.msg, 31.775 / 3, 1e-8);
    EXPECT_NEAR(row.fcg, 31.775 / 3 / 8, 1e-8);
    EXPECT_NEAR(row.h2, (31.775 / 3 - 8) / (31.775 / 3), 1e-8);
    EXPECT_NEAR(row.cv, std::sqrt(8.0) / 14.025 * 100, 1e-8);
}

TEST(AnovaIndTest, ReportHeaderForLattice) {
    std::vector<AnovaIndResult> result_vec{anova_ind(test_helpers::make_lattice_trial())};
    std::ostringstream os;
    print_anova_ind(os, result_vec);
    EXPECT_NE(os.str().find("DFCR"), std::string::npos);
    EXPECT_NE(os.str().find("DFIB_R"), std::string::npos);
    EXPECT_NE(os.str().find("PFIB_R"), std::string::npos);
    EXPECT_EQ(os.str().find("DFB "), std::string::npos);
}
