/*
 * @Description:
 * @Author: Chao Ning
 * @Date: 2025-04-04 09:30:12
 * @LastEditTime: 2025-04-13 22:05:41
 * @LastEditors: Chao Ning
 */

#include <fstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "report_utils.hpp"
#include "string_utils.hpp"

using std::string;
using std::vector;


void write_table(std::ostream& os, const vector<string>& head_vec, const vector<vector<string>>& row_vec){
    vector<size_t> width_vec(head_vec.size());
    for(size_t j = 0; j < head_vec.size(); j++){
        width_vec[j] = head_vec[j].size();
    }
    for(const auto& row:row_vec){
        for(size_t j = 0; j < row.size() && j < width_vec.size(); j++){
            width_vec[j] = std::max(width_vec[j], row[j].size());
        }
    }

    for(size_t j = 0; j < head_vec.size(); j++){
        if(j > 0) os << "  ";
        os << std::setw(width_vec[j]) << head_vec[j];
    }
    os << "\n";
    for(const auto& row:row_vec){
        for(size_t j = 0; j < row.size() && j < width_vec.size(); j++){
            if(j > 0) os << "  ";
            os << std::setw(width_vec[j]) << row[j];
        }
        os << "\n";
    }
}


vector<string> format_values(const Eigen::VectorXd& Vec, int digits){
    vector<string> out(Vec.size());
    for(long long i = 0; i < Vec.size(); i++){
        out[i] = double_to_string_sig(Vec(i), digits);
    }
    return out;
}


void write_matrix(std::ostream& os, const Eigen::MatrixXd& mat, const string& corner,
                  const vector<string>& row_name_vec, const vector<string>& col_name_vec, int digits){
    vector<string> head_vec = {corner};
    head_vec.insert(head_vec.end(), col_name_vec.begin(), col_name_vec.end());
    vector<vector<string>> row_vec;
    for(long long i = 0; i < mat.rows(); i++){
        vector<string> row = {row_name_vec[i]};
        vector<string> tmp = format_values(mat.row(i).transpose(), digits);
        row.insert(row.end(), tmp.begin(), tmp.end());
        row_vec.push_back(row);
    }
    write_table(os, head_vec, row_vec);
}


void write_section(std::ostream& os, const string& title){
    os << "---------------------------------------------------------------------------\n"
       << title << "\n"
       << "---------------------------------------------------------------------------\n";
}


void export_report(const string& out_file, const std::function<void(std::ostream&)>& writer){
    string file_name = out_file + ".txt";
    std::ofstream fout(file_name);
    if(!fout.is_open()){
        spdlog::error("Fail to open the output file: {}", file_name);
        throw std::runtime_error("Fail to open the output file: " + file_name);
    }
    writer(fout);
    fout.close();
    spdlog::info("The report is written to {}", file_name);
}
