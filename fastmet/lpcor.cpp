/*
 * @Description:
 * @Author: Chao Ning
 * @Date: 2025-04-11 10:05:31
 * @LastEditTime: 2025-04-15 17:30:12
 * @LastEditors: Chao Ning
 */

#include <cmath>
#include <string>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <gsl/gsl_cdf.h>
#include <CLI/CLI.hpp>  // Include CLI11

#include "lpcor.hpp"
#include "cli_options.hpp"
#include "../utils/EigenMatrix_utils.hpp"
#include "../utils/someCommonFun.hpp"
#include "../utils/string_utils.hpp"
#include "../utils/report_utils.hpp"


Lpcor::Lpcor(){
}

Lpcor::~Lpcor(){
}


LpcorResult lpcor_cor(const MatrixXd& cormat, long long n, const vector<string>& names){
    long long nvar = cormat.rows();
    if(cormat.cols() != nvar || (long long)names.size() != nvar){
        spdlog::error("The correlation matrix must be square with one name per variable");
        throw std::invalid_argument("Invalid correlation matrix");
    }
    if(nvar < 2){
        spdlog::error("At least two variables are required, {} given", nvar);
        throw std::invalid_argument("At least two variables are required");
    }
    if(n < 1){
        spdlog::error("The sample size used to compute the correlations must be given");
        throw std::invalid_argument("Invalid sample size");
    }
    long long df = n - nvar;
    if(df < 0){
        spdlog::warn("The number of variables ({}) is higher than the number of individuals ({}). "
                     "Hypothesis testing will not be made", nvar, n);
    }

    LpcorResult result;
    result.n = n;
    result.names = names;
    result.linear_mat = cormat;
    MatrixXd P = pinv_svd(cormat);
    result.partial_mat = MatrixXd::Identity(nvar, nvar);
    for(long long j = 0; j < nvar; j++){
        for(long long i = 0; i < nvar; i++){
            if(i != j) result.partial_mat(i, j) = -P(i, j) / std::sqrt(P(i, i) * P(j, j));
        }
    }

    for(long long i = 0; i < nvar; i++){
        for(long long j = i + 1; j < nvar; j++){
            LpcorPair row;
            row.pair = names[i] + " x " + names[j];
            row.linear = cormat(i, j);
            row.partial = result.partial_mat(i, j);
            if(df > 0){
                row.t = row.partial / std::sqrt(1 - row.partial * row.partial) * std::sqrt((double)df);
                if(std::isnan(row.t)){
                    row.p = std::nan("");
                }else{
                    row.p = std::isinf(row.t) ? 0.0 : 2 * gsl_cdf_tdist_Q(std::fabs(row.t), df);
                }
            }else{
                row.t = std::nan("");
                row.p = std::nan("");
            }
            result.pairs.push_back(row);
        }
    }
    return result;
}


static double kendall_tau_b(const Eigen::VectorXd& x, const Eigen::VectorXd& y){
    long long n = x.size();
    double concordant = 0, discordant = 0, tie_x = 0, tie_y = 0;
    for(long long i = 0; i < n; i++){
        for(long long j = i + 1; j < n; j++){
            double dx = x(j) - x(i), dy = y(j) - y(i);
            if(dx == 0) tie_x++;
            if(dy == 0) tie_y++;
            if(dx * dy > 0){
                concordant++;
            }else if(dx * dy < 0){
                discordant++;
            }
        }
    }
    double n0 = n * (n - 1) / 2.0;
    double denom = std::sqrt((n0 - tie_x) * (n0 - tie_y));
    if(denom == 0) return std::nan("");
    return (concordant - discordant) / denom;
}


MatrixXd cor_by_method(const MatrixXd& X, const string& method){
    if(method == "pearson"){
        return cor_mat(X);
    }
    if(method == "spearman"){
        MatrixXd rank_mat(X.rows(), X.cols());
        for(long long j = 0; j < X.cols(); j++){
            rank_mat.col(j) = rank_average(X.col(j));
        }
        return cor_mat(rank_mat);
    }
    if(method == "kendall"){
        MatrixXd cormat = MatrixXd::Identity(X.cols(), X.cols());
        for(long long i = 0; i < X.cols(); i++){
            for(long long j = i + 1; j < X.cols(); j++){
                cormat(i, j) = cormat(j, i) = kendall_tau_b(X.col(i), X.col(j));
            }
        }
        return cormat;
    }
    spdlog::error("Unknown correlation method '{}'; use pearson, spearman or kendall", method);
    throw std::invalid_argument("Invalid correlation method");
}


LpcorResult lpcor(const MatrixXd& X, const vector<string>& names, const string& method){
    if(X.rows() < 3){
        spdlog::error("At least three observations are required, {} given", X.rows());
        throw std::domain_error("Too few observations for the correlations");
    }
    return lpcor_cor(cor_by_method(X, method), X.rows(), names);
}


vector<LpcorResult> lpcor_by(const METData& data, const vector<string>& var_vec, const string& by, bool verbose,
                             const string& method){
    vector<string> key_vec;
    if(!by.empty()) key_vec.push_back(by);
    NumericTable table = select_numeric(data, var_vec, key_vec);

    vector<string> level_vec{""};
    vector<NumericTable> table_vec{table};
    if(!by.empty()){
        table_vec = split_by(table, 0, level_vec);
    }
    vector<LpcorResult> result_vec;
    for(long long i = 0; i < (long long)table_vec.size(); i++){
        if(verbose && !by.empty()){
            spdlog::info("Linear and partial correlations for {} = {} ({}/{})", by, level_vec[i], i + 1, table_vec.size());
        }
        LpcorResult result = lpcor(table_vec[i].values, table_vec[i].var_names, method);
        result.group = level_vec[i];
        result_vec.push_back(result);
    }
    return result_vec;
}


void print_lpcor(std::ostream& os, const vector<LpcorResult>& result_vec, int digits){
    vector<vector<string>> row_vec;
    bool has_group = !result_vec.empty() && !result_vec[0].group.empty();
    for(const auto& result:result_vec){
        for(const auto& row:result.pairs){
            vector<string> tmp_vec;
            if(has_group) tmp_vec.push_back(result.group);
            tmp_vec.push_back(row.pair);
            tmp_vec.push_back(double_to_string_sig(row.linear, digits));
            tmp_vec.push_back(double_to_string_sig(row.partial, digits));
            tmp_vec.push_back(double_to_string_sig(row.t, digits));
            tmp_vec.push_back(double_to_string_sig(row.p, digits));
            row_vec.push_back(tmp_vec);
        }
    }
    vector<string> head_vec;
    if(has_group) head_vec.push_back("Group");
    head_vec.insert(head_vec.end(), {"Pairs", "linear", "partial", "t", "prob"});
    write_table(os, head_vec, row_vec);
}


int Lpcor::run(int argc, char* argv[]) {
    CLI::App app{"lpcor - Linear and partial correlation coefficients"};

    app.description(R"(
    Quick Start:
        fastmet --lpcor --data data_file --vars PH:NKE --by ENV --out lpcor_out
    )");

    CommonCliOptions common;
    common.digits = 3;
    vector<string> var_vec;
    string by;
    string method = "pearson";

    bool lpcor_flag = false;
    app.add_flag("--lpcor", lpcor_flag, "Linear and partial correlations");
    add_common_options(app, common);

    app.add_option("--vars", var_vec, "Numeric variables. 'A:C' ranges are allowed.")
        ->expected(-1)
        ->required();

    app.add_option("--by", by, "One analysis per level of this column.");

    app.add_option("--method", method, "Correlation coefficient: pearson, spearman or kendall. Default: pearson")
        ->check(CLI::IsMember({"pearson", "spearman", "kendall"}));

    // Parse command-line arguments
    CLI11_PARSE(app, argc, argv);

    set_log_level(common.quiet);
    log_common_options(common);
    spdlog::info("Variables: {}", join_string(var_vec, " "));
    if(!by.empty()) spdlog::info("By: {}", by);
    spdlog::info("Method: {}", method);
    spdlog::info("========================");

    METData data;
    data.read(common.data_file, common.missing_in_data_vec);
    vector<LpcorResult> result_vec = lpcor_by(data, var_vec, by, !common.quiet, method);

    write_report(common, [&](std::ostream& os){
        print_lpcor(os, result_vec, common.digits);
    });
    return 0;
}
