// report_test.cpp: plain-text tables and report files

#include <gtest/gtest.h>

#include "utils/report_utils.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

TEST(WriteTableTest, ColumnsAreRightAligned) {
    std::ostringstream os;
    write_table(os, {"Name", "Value"}, {{"alpha", "1"}, {"b", "22.5"}});
    EXPECT_EQ(os.str(),
              " Name  Value\n"
              "alpha      1\n"
              "    b   22.5\n");
}

TEST(WriteTableTest, HeaderOnly) {
    std::ostringstream os;
    write_table(os, {"A", "BB"}, {});
    EXPECT_EQ(os.str(), "A  BB\n");
}

TEST(WriteMatrixTest, LabelsAndMissingValues) {
    Eigen::MatrixXd mat(2, 2);
    mat << 1.5, std::nan(""), 0.25, 3;
    std::ostringstream os;
    write_matrix(os, mat, "ENV", {"E1", "E2"}, {"G1", "G2"}, 3);
    EXPECT_EQ(os.str(),
              "ENV    G1  G2\n"
              " E1   1.5  NA\n"
              " E2  0.25   3\n");
}

TEST(FormatValuesTest, SignificantDigits) {
    Eigen::VectorXd Vec(3);
    Vec << 3.14159, std::numeric_limits<double>::infinity(), 1200;
    std::vector<std::string> out = format_values(Vec, 3);
    EXPECT_EQ(out, (std::vector<std::string>{"3.14", "Inf", "1.2e+03"}));
}

TEST(WriteSectionTest, TitleBetweenRules) {
    std::ostringstream os;
    write_section(os, "Analysis of variance");
    std::string text = os.str();
    std::string rule(75, '-');
    EXPECT_EQ(text, rule + "\nAnalysis of variance\n" + rule + "\n");
}

TEST(ExportReportTest, WritesTextFile) {
    std::string out_file = ::testing::TempDir() + "fastmet_report_test";
    export_report(out_file, [](std::ostream& os) { os << "report body\n"; });
    std::ifstream fin(out_file + ".txt");
    ASSERT_TRUE(fin.is_open());
    std::string line;
    std::getline(fin, line);
    EXPECT_EQ(line, "report body");
    fin.close();
    std::remove((out_file + ".txt").c_str());
}

TEST(ExportReportTest, UnwritablePathThrows) {
    EXPECT_THROW(export_report("/nonexistent_dir_for_fastmet/report", [](std::ostream& os) { os << "x"; }),
                 std::runtime_error);
}
