// met_data_test.cpp: table loading, trait selection and GE means

#include <gtest/gtest.h>

#include "utils/met_data.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using test_helpers::make_trial_data;
using test_helpers::trial_columns;

TEST(METDataTest, ReadsWhitespaceAndCommaSeparatedFile) {
    std::string file = ::testing::TempDir() + "met_data_test.txt";
    {
        std::ofstream out(file);
        out << "# comment line\n\nENV,GEN,REP,GY\nE1,G1,1,2.5\nE1 G2 1 NA\n";
    }
    METData data;
    data.read(file);
    EXPECT_EQ(data.get_num_records(), 2);
    EXPECT_EQ(data.get_head(), (std::vector<std::string>{"ENV", "GEN", "REP", "GY"}));
    Eigen::VectorXd gy;
    data.get_given_column(data.find_column("GY"), gy);
    EXPECT_DOUBLE_EQ(gy(0), 2.5);
    EXPECT_TRUE(std::isnan(gy(1)));
    std::remove(file.c_str());
}

TEST(METDataTest, ReadRejectsRaggedRows) {
    std::string file = ::testing::TempDir() + "met_data_ragged.txt";
    {
        std::ofstream out(file);
        out << "ENV GEN GY\nE1 G1\n";
    }
    METData data;
    EXPECT_THROW(data.read(file), std::runtime_error);
    std::remove(file.c_str());
}

TEST(METDataTest, UnknownColumnIsConfigurationError) {
    METData data = make_trial_data();
    EXPECT_THROW(data.find_columns({"GY", "YIELD"}), std::invalid_argument);
}

TEST(SelectTraitsTest, ExpandsRangesAndRejectsDesignColumns) {
    METData data = make_trial_data();
    EXPECT_EQ(select_traits(data, trial_columns(), {"GY:HM"}), (std::vector<std::string>{"GY", "HM"}));
    EXPECT_THROW(select_traits(data, trial_columns(), {"GEN"}), std::invalid_argument);
    TrialColumns no_rep = trial_columns();
    no_rep.rep.clear();
    EXPECT_THROW(select_traits(data, no_rep, {"GY"}), std::invalid_argument);
    EXPECT_NO_THROW(select_traits(data, no_rep, {"GY"}, false));
}

TEST(BuildTrialTraitTest, FactorsAreSortedAndRecordsComplete) {
    TrialTrait trial = test_helpers::make_trial("GY");
    EXPECT_EQ(trial.num_records(), 24);
    EXPECT_EQ(trial.env.levels, (std::vector<std::string>{"E1", "E2", "E3"}));
    EXPECT_EQ(trial.gen.levels, (std::vector<std::string>{"G1", "G2", "G3", "G4"}));
    EXPECT_EQ(trial.rep.num_levels(), 2);
}

TEST(BuildTrialTraitTest, DropsMissingRows) {
    METData data;
    data.from_columns({"ENV", "GEN", "REP", "GY"},
                      {{"E1", "E1", "E2", "E2"}, {"G1", "G2", "G1", "G2"}, {"1", "1", "1", "1"}, {"1.0", "NA", "2.0", "3.0"}});
    TrialTrait trial = build_trial_trait(data, trial_columns(), "GY");
    EXPECT_EQ(trial.num_records(), 3);
    EXPECT_EQ(trial.record_vec, (std::vector<long long>{1, 3, 4}));

    Eigen::MatrixXd means = ge_means(trial);
    EXPECT_DOUBLE_EQ(means(0, 0), 1.0);
    EXPECT_TRUE(std::isnan(means(1, 0)));
    EXPECT_EQ(num_missing_cells(means), 1);
}

TEST(BuildTrialTraitTest, NonNumericAndDuplicatedRecordsAreErrors) {
    METData text;
    text.from_columns({"ENV", "GEN", "REP", "GY"}, {{"E1", "E1"}, {"G1", "G2"}, {"1", "1"}, {"1.0", "high"}});
    EXPECT_THROW(build_trial_trait(text, trial_columns(), "GY"), std::runtime_error);

    METData duplicated;
    duplicated.from_columns({"ENV", "GEN", "REP", "GY"}, {{"E1", "E1"}, {"G1", "G1"}, {"1", "1"}, {"1.0", "2.0"}});
    EXPECT_THROW(build_trial_trait(duplicated, trial_columns(), "GY"), std::runtime_error);
}

TEST(NumericTableTest, AverageAndSplitByKey) {
    METData data;
    data.from_columns({"GEN", "SITE", "A", "B"},
                      {{"G2", "G1", "G2", "G1"}, {"S1", "S1", "S2", "S2"}, {"1", "2", "3", "NA"}, {"10", "20", "30", "40"}});
    NumericTable table = select_numeric(data, {"A:B"}, {"GEN", "SITE"});
    ASSERT_EQ(table.values.rows(), 3);

    NumericTable means = average_by(table, 0);
    EXPECT_EQ(means.row_labels, (std::vector<std::string>{"G1", "G2"}));
    EXPECT_DOUBLE_EQ(means.values(0, 0), 2.0);
    EXPECT_DOUBLE_EQ(means.values(1, 0), 2.0);
    EXPECT_DOUBLE_EQ(means.values(1, 1), 20.0);

    std::vector<std::string> level_vec;
    std::vector<NumericTable> table_vec = split_by(table, 1, level_vec);
    EXPECT_EQ(level_vec, (std::vector<std::string>{"S1", "S2"}));
    ASSERT_EQ(table_vec.size(), 2u);
    EXPECT_EQ(table_vec[0].values.rows(), 2);
    EXPECT_EQ(table_vec[1].values.rows(), 1);
    EXPECT_DOUBLE_EQ(table_vec[1].values(0, 1), 30.0);
}

TEST(NumericTableTest, GroupingColumnCannotBeAVariable) {
    METData data = make_trial_data();
    EXPECT_THROW(select_numeric(data, {"GY"}, {"GY"}), std::invalid_argument);
}
