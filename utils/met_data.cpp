/*
 * @Descripttion:
 * @version:
 * @Author: Chao Ning
 * @Date: 2022-07-06 11:03:03
 * @LastEditors: Chao Ning
 * @LastEditTime: 2025-04-14 09:40:18
 */


#include <iostream>
#include <fstream>
#include <set>
#include <vector>
#include <algorithm>
#include <iterator>
#include <map>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include <boost/algorithm/string.hpp>

#include "met_data.hpp"
#include "iterator_utils.hpp"
#include "string_utils.hpp"
#include "EigenMatrix_utils.hpp"


using std::map;
using std::set;
using std::ifstream;
using std::to_string;


vector<string> default_missing_tokens(){
    return {"NA", "Na", "na", "NAN", "NaN", "nan", "-NAN", "-NaN", "-nan", "<NA>", "<na>", "N/A", "n/a"};
}


METData::METData(){
    m_missing_in_data_vec = default_missing_tokens();
}


void METData::read_full(const string& data_file, vector<vector<string>>& data_vec){
    ifstream fin(data_file);
    if(!fin.is_open()) {
        spdlog::error("Fail to open the data file: {}", data_file);
        throw std::runtime_error("Fail to open the data file: " + data_file);
    }

    // head line, comment and empty lines before it are skipped
    string one_line;
    m_head_column_vec.clear(); // ! class member
    while(getline(fin, one_line)){
        process_line(one_line);
        if(!one_line.empty()) break;
    }
    if(one_line.empty()){
        spdlog::error("Head line is empty or missing in the data file: {}", data_file);
        throw std::runtime_error("Empty data file: " + data_file);
    }
    boost::split(m_head_column_vec, one_line, boost::is_any_of(" "), boost::token_compress_on);
    long long num_col_head = m_head_column_vec.size();
    string duplicated_name;
    if(is_duplicated(m_head_column_vec, duplicated_name)){
        spdlog::error("Duplicated column name in the head line: {}", duplicated_name);
        throw std::runtime_error("Duplicated column names in the data file: " + data_file);
    }

    // read
    data_vec.clear();
    data_vec.resize(num_col_head);
    m_record_vec.clear();
    long long ith_line = 0;
    while (getline(fin, one_line)) {
        ith_line++;
        process_line(one_line);
        if(one_line.empty()) continue;
        vector<string> tmp_vec;
        boost::split(tmp_vec, one_line, boost::is_any_of(" "), boost::token_compress_on);
        if((long long)tmp_vec.size() != num_col_head){ // locate line with different columns compared with head lines.
            spdlog::error("Check record {}: {}, it has {} columns while the head line has {}",
                ith_line, one_line, tmp_vec.size(), num_col_head);
            throw std::runtime_error("Wrong number of columns in record " + to_string(ith_line));
        }
        for(long long i = 0; i < num_col_head; i++){
            data_vec[i].push_back(tmp_vec[i]);
        }
        m_record_vec.push_back(ith_line);
    }
    fin.close();
}


/**
 * @brief read the trial table
 *
 * @param data_file text file, the first non-comment line is the header
 * @param missing_in_data_vec tokens treated as missing values
 */
void METData::read(const string& data_file, const vector<string>& missing_in_data_vec){
    m_missing_in_data_vec = missing_in_data_vec;
    m_data_vec.clear(); // ! class member
    METData::read_full(data_file, m_data_vec);
    spdlog::info("Read {} records and {} columns from {}", m_record_vec.size(), m_head_column_vec.size(), data_file);
}


void METData::from_columns(const vector<string>& head_vec, const vector<vector<string>>& column_vec,
                           const vector<string>& missing_in_data_vec){
    if(head_vec.size() != column_vec.size()){
        spdlog::error("{} column names are given for {} columns", head_vec.size(), column_vec.size());
        throw std::invalid_argument("Column names and columns differ in number");
    }
    string duplicated_name;
    if(is_duplicated(head_vec, duplicated_name)){
        spdlog::error("Duplicated column name: {}", duplicated_name);
        throw std::invalid_argument("Duplicated column names");
    }
    long long nrows = column_vec.empty() ? 0 : column_vec[0].size();
    for(long long i = 0; i < (long long)column_vec.size(); i++){
        if((long long)column_vec[i].size() != nrows){
            spdlog::error("Column {} has {} values, expected {}", head_vec[i], column_vec[i].size(), nrows);
            throw std::invalid_argument("Columns differ in length");
        }
    }
    m_head_column_vec = head_vec;
    m_data_vec = column_vec;
    m_missing_in_data_vec = missing_in_data_vec;
    m_record_vec.resize(nrows);
    for(long long i = 0; i < nrows; i++){
        m_record_vec[i] = i + 1;
    }
}


long long METData::find_column(const string& name) const {
    return find_columns({name})[0];
}


vector<long long> METData::find_columns(const vector<string>& name_vec) const {
    vector<string> strNoFound_vec;
    vector<long long> index_vec = find_index(m_head_column_vec, name_vec, strNoFound_vec);
    if(!strNoFound_vec.empty()){
        spdlog::error("Column names not found in the header: {}", join_string(strNoFound_vec, ", "));
        throw std::invalid_argument("Column names not found: " + join_string(strNoFound_vec, ", "));
    }
    return index_vec;
}


/**
 * @brief rows (0-based) without missing values in the given columns
 */
vector<long long> METData::index_keep_deleteNA(const vector<long long>& col_used_vec) const {
    vector<long long> index_keep_vec(m_record_vec.size());
    for(long long i = 0; i < (long long)index_keep_vec.size(); i++){
        index_keep_vec[i] = i;
    }
    for(auto col:col_used_vec){
        const vector<string>& tmp_vec = m_data_vec[col];
        vector<long long> tmp_index_keep_vec;
        for(long long k = 0; k < (long long)tmp_vec.size(); k++){
            if(!is_missing(tmp_vec[k])){
                tmp_index_keep_vec.push_back(k);
            }
        }
        index_keep_vec = set_intersection_(index_keep_vec, tmp_index_keep_vec);
    }
    return index_keep_vec;
}


bool METData::is_missing(const string& val) const {
    return val.empty() || is_nan(val, m_missing_in_data_vec);
}


void METData::get_given_column(long long columnNo, vector<string>& vec) const {
    vec = m_data_vec[columnNo];
}


void METData::get_given_column(long long columnNo, VectorXd& Vec) const {
    const vector<string>& tmp_vec = m_data_vec[columnNo];
    Vec.resize(tmp_vec.size());
    for(long long i = 0; i < (long long)tmp_vec.size(); i++){
        if(is_missing(tmp_vec[i])){
            Vec(i) = std::nan("");
        }else if(!try_string_to_double(tmp_vec[i], Vec(i))){
            spdlog::error("Non-numeric value '{}' in column {}, record {}", tmp_vec[i], m_head_column_vec[columnNo], m_record_vec[i]);
            throw std::runtime_error("Non-numeric value in column " + m_head_column_vec[columnNo]);
        }
    }
}


/**
 * @brief numeric matrix of the given columns restricted to the given rows
 */
void METData::get_given_columns_double(const vector<long long>& column_vec, const vector<long long>& row_vec, MatrixXd& Mat) const {
    long long nrows = row_vec.size();
    long long ncols = column_vec.size();
    Mat = MatrixXd::Zero(nrows, ncols);
    for(long long i = 0; i < ncols; i++){
        VectorXd tmp_Vec;
        this->get_given_column(column_vec[i], tmp_Vec);
        for(long long j = 0; j < nrows; j++){
            Mat(j, i) = tmp_Vec(row_vec[j]);
        }
    }
}


const vector<string>& METData::get_head() const {
    return m_head_column_vec;
}


const vector<long long>& METData::get_record_number() const {
    return m_record_vec;
}


long long METData::get_num_records() const {
    return m_record_vec.size();
}


FactorColumn make_factor(const vector<string>& vec){
    return make_factor(vec, vector_unique(vec));
}


FactorColumn make_factor(const vector<string>& vec, const vector<string>& levels){
    FactorColumn factor;
    factor.levels = levels;
    map<string, long long> level_map;
    long long val = 0;
    for(const auto& tmp_val:levels){
        level_map[tmp_val] = val++;
    }
    factor.index.resize(vec.size());
    for(long long i = 0; i < (long long)vec.size(); i++){
        auto it = level_map.find(vec[i]);
        if(it == level_map.end()){
            spdlog::error("Level {} is not in the factor levels", vec[i]);
            throw std::invalid_argument("Unknown factor level: " + vec[i]);
        }
        factor.index[i] = it->second;
    }
    return factor;
}


TrialTrait build_trial_trait(const METData& data, const TrialColumns& columns, const string& trait){
    bool has_rep = !columns.rep.empty();
    vector<string> factor_name_vec = {columns.env, columns.gen};
    if(has_rep) factor_name_vec.push_back(columns.rep);
    if(columns.has_block()) factor_name_vec.push_back(columns.block);
    vector<long long> factor_index_vec = data.find_columns(factor_name_vec);
    long long trait_index = data.find_column(trait);

    vector<long long> col_used_vec = factor_index_vec;
    col_used_vec.push_back(trait_index);
    vector<long long> row_vec = data.index_keep_deleteNA(col_used_vec);
    long long num_removed = data.get_num_records() - (long long)row_vec.size();
    if(num_removed > 0){
        spdlog::warn("Trait {}: {} rows with missing values were removed", trait, num_removed);
    }
    if(row_vec.empty()){
        spdlog::error("Trait {} has no complete record", trait);
        throw std::runtime_error("No complete record for trait " + trait);
    }

    TrialTrait trial;
    trial.trait = trait;
    trial.has_block = columns.has_block();
    vector<string> tmp_vec;
    data.get_given_column(factor_index_vec[0], tmp_vec);
    trial.env = make_factor(subset_vec(tmp_vec, row_vec));
    data.get_given_column(factor_index_vec[1], tmp_vec);
    trial.gen = make_factor(subset_vec(tmp_vec, row_vec));
    if(has_rep){
        data.get_given_column(factor_index_vec[2], tmp_vec);
        trial.rep = make_factor(subset_vec(tmp_vec, row_vec));
    }else{
        trial.rep = make_factor(vector<string>(row_vec.size(), "1"));
    }
    if(trial.has_block){
        data.get_given_column(factor_index_vec[3], tmp_vec);
        trial.block = make_factor(subset_vec(tmp_vec, row_vec));
    }

    vector<string> y_vec;
    data.get_given_column(trait_index, y_vec);
    const vector<long long>& record_vec = data.get_record_number();
    trial.y.resize(row_vec.size());
    trial.record_vec.resize(row_vec.size());
    for(long long i = 0; i < (long long)row_vec.size(); i++){
        const string& val = y_vec[row_vec[i]];
        trial.record_vec[i] = record_vec[row_vec[i]];
        if(!try_string_to_double(val, trial.y(i))){
            spdlog::error("Trait {}: non-numeric value '{}' in record {}", trait, val, trial.record_vec[i]);
            throw std::runtime_error("Non-numeric value '" + val + "' in trait " + trait);
        }
    }

    // Environment x Genotype x Replicate[x Block] must be unique
    if(!has_rep) return trial;
    set<string> key_set;
    for(long long i = 0; i < trial.num_records(); i++){
        string key = "ENV=" + trial.env.label(i) + ", GEN=" + trial.gen.label(i) + ", REP=" + trial.rep.label(i);
        if(trial.has_block) key += ", BLOCK=" + trial.block.label(i);
        if(!key_set.insert(key).second){
            spdlog::error("Trait {}: duplicated record for {} (record {})", trait, key, trial.record_vec[i]);
            throw std::runtime_error("Duplicated key in trait " + trait + ": " + key);
        }
    }
    return trial;
}


vector<string> select_traits(const METData& data, const TrialColumns& columns, const vector<string>& trait_vec, bool require_rep){
    if(columns.env.empty() || columns.gen.empty() || (require_rep && columns.rep.empty())){
        spdlog::error("The environment, genotype{} columns are required", require_rep ? " and replicate" : "");
        throw std::invalid_argument("Missing design columns");
    }
    if(columns.has_block() && columns.rep.empty()){
        spdlog::error("A block column needs the replicate column");
        throw std::invalid_argument("Block column without replicate column");
    }
    vector<string> factor_name_vec = {columns.env, columns.gen};
    if(!columns.rep.empty()) factor_name_vec.push_back(columns.rep);
    if(columns.has_block()) factor_name_vec.push_back(columns.block);
    data.find_columns(factor_name_vec);

    vector<string> expanded_vec = expand_variable_ranges(trait_vec, data.get_head());
    if(expanded_vec.empty()){
        spdlog::error("No trait is given");
        throw std::invalid_argument("No trait is given");
    }
    for(const auto& tmp:expanded_vec){
        if(std::find(factor_name_vec.begin(), factor_name_vec.end(), tmp) != factor_name_vec.end()){
            spdlog::error("Design column {} cannot be analyzed as a trait", tmp);
            throw std::invalid_argument("Design column used as a trait: " + tmp);
        }
    }
    return expanded_vec;
}


MatrixXd ge_means(const TrialTrait& trial){
    long long num_gen = trial.gen.num_levels();
    long long num_env = trial.env.num_levels();
    MatrixXd sum_mat = MatrixXd::Zero(num_gen, num_env);
    MatrixXd count_mat = MatrixXd::Zero(num_gen, num_env);
    for(long long i = 0; i < trial.num_records(); i++){
        sum_mat(trial.gen.index[i], trial.env.index[i]) += trial.y(i);
        count_mat(trial.gen.index[i], trial.env.index[i]) += 1;
    }
    MatrixXd mean_mat(num_gen, num_env);
    for(long long i = 0; i < num_gen; i++){
        for(long long j = 0; j < num_env; j++){
            mean_mat(i, j) = count_mat(i, j) > 0 ? sum_mat(i, j) / count_mat(i, j) : std::nan("");
        }
    }
    return mean_mat;
}


VectorXd mean_by_level(const FactorColumn& factor, const VectorXd& y){
    VectorXd sum_Vec = VectorXd::Zero(factor.num_levels());
    VectorXd count_Vec = VectorXd::Zero(factor.num_levels());
    for(long long i = 0; i < y.size(); i++){
        sum_Vec(factor.index[i]) += y(i);
        count_Vec(factor.index[i]) += 1;
    }
    return sum_Vec.array() / count_Vec.array();
}


long long num_missing_cells(const MatrixXd& mat){
    long long num = 0;
    for(long long i = 0; i < mat.size(); i++){
        if(std::isnan(mat.data()[i])) num++;
    }
    return num;
}


NumericTable select_numeric(const METData& data, const vector<string>& var_vec, const vector<string>& key_col_vec){
    NumericTable table;
    table.var_names = expand_variable_ranges(var_vec, data.get_head());
    if(table.var_names.empty()){
        spdlog::error("No variable is given");
        throw std::invalid_argument("No variable is given");
    }
    for(const auto& tmp:key_col_vec){
        if(std::find(table.var_names.begin(), table.var_names.end(), tmp) != table.var_names.end()){
            spdlog::error("Column {} is used both as a variable and as a grouping factor", tmp);
            throw std::invalid_argument("Grouping column used as a variable: " + tmp);
        }
    }
    vector<long long> var_index_vec = data.find_columns(table.var_names);
    vector<long long> key_index_vec = data.find_columns(key_col_vec);

    vector<long long> col_used_vec = var_index_vec;
    col_used_vec.insert(col_used_vec.end(), key_index_vec.begin(), key_index_vec.end());
    vector<long long> row_vec = data.index_keep_deleteNA(col_used_vec);
    long long num_removed = data.get_num_records() - (long long)row_vec.size();
    if(num_removed > 0){
        spdlog::warn("{} rows with missing values were removed", num_removed);
    }
    if(row_vec.empty()){
        spdlog::error("No complete record in the selected columns");
        throw std::runtime_error("No complete record in the selected columns");
    }
    data.get_given_columns_double(var_index_vec, row_vec, table.values);
    for(auto col:key_index_vec){
        vector<string> tmp_vec;
        data.get_given_column(col, tmp_vec);
        table.keys.push_back(subset_vec(tmp_vec, row_vec));
    }
    return table;
}


NumericTable subset_rows(const NumericTable& table, const vector<long long>& row_vec){
    NumericTable out;
    out.var_names = table.var_names;
    out.values.resize(row_vec.size(), table.values.cols());
    for(long long i = 0; i < (long long)row_vec.size(); i++){
        out.values.row(i) = table.values.row(row_vec[i]);
    }
    for(const auto& key:table.keys){
        out.keys.push_back(subset_vec(key, row_vec));
    }
    if(!table.row_labels.empty()){
        out.row_labels = subset_vec(table.row_labels, row_vec);
    }
    return out;
}


NumericTable average_by(const NumericTable& table, long long ikey){
    FactorColumn factor = make_factor(table.keys.at(ikey));
    NumericTable out;
    out.var_names = table.var_names;
    out.row_labels = factor.levels;
    out.values = MatrixXd::Zero(factor.num_levels(), table.values.cols());
    VectorXd count_Vec = VectorXd::Zero(factor.num_levels());
    for(long long i = 0; i < table.values.rows(); i++){
        out.values.row(factor.index[i]) += table.values.row(i);
        count_Vec(factor.index[i]) += 1;
    }
    mat_col_elementwise_dot_vec(out.values, count_Vec.cwiseInverse());
    return out;
}


vector<NumericTable> split_by(const NumericTable& table, long long ikey, vector<string>& level_vec){
    FactorColumn factor = make_factor(table.keys.at(ikey));
    level_vec = factor.levels;
    vector<vector<long long>> row_group_vec(factor.num_levels());
    for(long long i = 0; i < (long long)factor.index.size(); i++){
        row_group_vec[factor.index[i]].push_back(i);
    }
    vector<NumericTable> table_vec;
    for(const auto& row_vec:row_group_vec){
        table_vec.push_back(subset_rows(table, row_vec));
    }
    return table_vec;
}


void log_progress(long long ith, long long total, const string& trait){
    spdlog::info("Evaluating trait {} ({}/{})", trait, ith, total);
}
