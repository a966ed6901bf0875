/*
 * @Description: Plain-text report helpers shared by the analyses
 * @Author: Chao Ning
 * @Date: 2025-04-04 09:30:12
 * @LastEditTime: 2025-04-13 22:05:41
 * @LastEditors: Chao Ning
 */
#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <functional>
#include <Eigen/Dense>


/**
 * @brief write a table with right-aligned columns separated by two spaces
 */
void write_table(std::ostream& os, const std::vector<std::string>& head_vec,
                 const std::vector<std::vector<std::string>>& row_vec);

/**
 * @brief write a numeric matrix with row and column labels, NaN as NA
 */
void write_matrix(std::ostream& os, const Eigen::MatrixXd& mat, const std::string& corner,
                  const std::vector<std::string>& row_name_vec, const std::vector<std::string>& col_name_vec, int digits);

std::vector<std::string> format_values(const Eigen::VectorXd& Vec, int digits);

void write_section(std::ostream& os, const std::string& title);

/**
 * @brief write the report produced by writer to <out_file>.txt
 */
void export_report(const std::string& out_file, const std::function<void(std::ostream&)>& writer);
