/*
 * @Description: String helpers for reading tables and writing reports
 * @Author: Chao Ning
 * @Date: 2025-01-29 14:18:58
 * @LastEditTime: 2025-04-15 18:31:05
 * @LastEditors: Chao Ning
 */
#pragma once

#include <vector>
#include <string>


/**
 * @brief Normalize one line of a data file in place: tab, comma and semicolon become spaces,
 * everything after comment_str is dropped and the line is trimmed.
 */
void process_line(std::string &line, const std::string comment_str = "#");


std::string join_string(const std::vector<std::string> &str_vec, const std::string &split_str = " ");


// throws std::runtime_error for text that is not a finite number
double string_to_double(const std::string &str);

/**
 * @brief Parse a double without raising
 *
 * @param str input string
 * @param value parsed value, untouched on failure
 * @return true if the whole string is a finite number
 */
bool try_string_to_double(const std::string &str, double &value);


bool is_nan(const std::string &str, const std::vector<std::string> &nan_vec);


// significant digits, NaN as "NA"
std::string double_to_string_sig(double value, int digits = 4);
