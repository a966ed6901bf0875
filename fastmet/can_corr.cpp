/*
 * @Description:
 * @Author: Chao Ning
 * @Date: 2025-04-10 15:20:08
 * @LastEditTime: 2025-04-15 16:48:55
 * @LastEditors: Chao Ning
 */

#include <cmath>
#include <string>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <gsl/gsl_cdf.h>
#include <CLI/CLI.hpp>  // Include CLI11

#include "can_corr.hpp"
#include "cli_options.hpp"
#include "../utils/EigenMatrix_utils.hpp"
#include "../utils/linear_model.hpp"
#include "../utils/iterator_utils.hpp"
#include "../utils/string_utils.hpp"
#include "../utils/report_utils.hpp"

using std::to_string;


CanCorr::CanCorr(){
}

CanCorr::~CanCorr(){
}


CollinearityDiag collinearity_diag(const MatrixXd& mat, const vector<string>& name_vec){
    CollinearityDiag diag;
    MatrixXd R = cor_mat(mat);
    MatrixXd eigenvecs;
    sym_eigen_desc(R, diag.eigenvalues, eigenvecs);
    diag.cor_det = R.determinant();
    diag.condition_number = diag.eigenvalues(0) / diag.eigenvalues(diag.eigenvalues.size() - 1);
    diag.vif = pinv_svd(R).diagonal();
    diag.max_abs_cor = std::nan("");
    for(long long j = 0; j < R.cols(); j++){
        for(long long i = j + 1; i < R.rows(); i++){
            if(std::isnan(diag.max_abs_cor) || std::fabs(R(i, j)) > diag.max_abs_cor){
                diag.max_abs_cor = std::fabs(R(i, j));
                diag.max_pair = name_vec[i] + " x " + name_vec[j];
            }
        }
    }
    return diag;
}


static MatrixXd center_columns(const MatrixXd& mat){
    return mat.rowwise() - mat.colwise().mean();
}


CanCorrResult can_corr(const MatrixXd& FG, const MatrixXd& SG, const vector<string>& fg_names, const vector<string>& sg_names,
                       const CanCorrOptions& options){
    if(FG.rows() != SG.rows()){
        spdlog::error("The number of observations of FG ({}) should be equal to SG ({})", FG.rows(), SG.rows());
        throw std::invalid_argument("FG and SG have different numbers of rows");
    }
    if(FG.cols() > SG.cols()){
        spdlog::error("The number of variables in FG ({}) should be lesser than or equal to SG ({})", FG.cols(), SG.cols());
        throw std::invalid_argument("FG has more variables than SG");
    }
    if(FG.cols() < 1 || (long long)fg_names.size() != FG.cols() || (long long)sg_names.size() != SG.cols()){
        spdlog::error("The variable names do not match the groups");
        throw std::invalid_argument("Variable names do not match the groups");
    }
    if(options.use != "cor" && options.use != "cov"){
        spdlog::error("The argument 'use' is incorrect, it should be 'cor' or 'cov'");
        throw std::invalid_argument("Invalid value of use: " + options.use);
    }
    if(options.test != "Bartlett" && options.test != "Rao"){
        spdlog::error("The argument 'test' is incorrect, it should be 'Bartlett' or 'Rao'");
        throw std::invalid_argument("Invalid value of test: " + options.test);
    }
    if(!(options.prob > 0 && options.prob <= 1)){
        spdlog::error("The argument 'prob' should be in (0, 1], {} given", options.prob);
        throw std::invalid_argument("Invalid value of prob");
    }
    long long n = FG.rows();
    long long p = FG.cols();
    long long q = SG.cols();
    if(n < 3){
        spdlog::error("The canonical correlation needs at least three observations, {} given", n);
        throw std::domain_error("Too few observations for the canonical correlation");
    }

    CanCorrResult result;
    result.test = options.test;
    result.n = n;
    result.fg_names = fg_names;
    result.sg_names = sg_names;
    bool use_cor = options.use == "cor";
    result.S11 = use_cor ? cor_mat(FG) : cov_mat(FG);
    result.S22 = use_cor ? cor_mat(SG) : cov_mat(SG);
    result.S12 = use_cor ? cross_cor(FG, SG) : cross_cov(FG, SG);
    MatrixXd S21 = result.S12.transpose();

    VectorXd eigenvals;
    MatrixXd eigenvecs;
    sym_eigen_desc(result.S11, eigenvals, eigenvecs);
    if(!(eigenvals(p - 1) > 0)){
        spdlog::error("The (correlation/covariance) matrix of FG is singular");
        throw std::domain_error("Singular FG matrix");
    }
    MatrixXd S11_12 = inv_sqrt_sym(result.S11);
    MatrixXd S22_inv = pinv_svd(result.S22);
    MatrixXd M = S11_12 * result.S12 * S22_inv * S21 * S11_12;
    M = (M + M.transpose()) / 2;
    VectorXd rho2;
    MatrixXd E;
    sym_eigen_desc(M, rho2, E);
    rho2 = rho2.cwiseMax(0.0).cwiseMin(1.0);
    result.corr = rho2.cwiseSqrt();

    result.coef_fg = S11_12 * E;
    VectorXd rho_inv = VectorXd::Zero(p);
    for(long long i = 0; i < p; i++){
        if(result.corr(i) > 1.0e-12) rho_inv(i) = 1.0 / result.corr(i);
    }
    result.coef_sg = S22_inv * S21 * result.coef_fg * rho_inv.asDiagonal();

    VectorXd d11 = result.S11.diagonal().cwiseSqrt().cwiseInverse();
    VectorXd d22 = result.S22.diagonal().cwiseSqrt().cwiseInverse();
    result.loads_fg = d11.asDiagonal() * result.S11 * result.coef_fg;
    result.loads_sg = d22.asDiagonal() * result.S22 * result.coef_sg;

    MatrixXd FG_A = options.center ? center_columns(FG) : FG;
    MatrixXd SG_A = options.center ? center_columns(SG) : SG;
    result.score_fg = FG_A * result.coef_fg;
    result.score_sg = SG_A * result.coef_sg;
    if(options.stdscores){
        mat_row_elementwise_dot_vec(result.score_fg, col_sd(result.score_fg).cwiseInverse());
        mat_row_elementwise_dot_vec(result.score_sg, col_sd(result.score_sg).cwiseInverse());
    }
    result.crossload_fg = cross_cor(FG_A, result.score_sg);
    result.crossload_sg = cross_cor(SG_A, result.score_fg);

    double total = rho2.sum();
    double cum = 0;
    for(long long i = 0; i < p; i++){
        CanCorrTestRow row;
        row.pair = "U" + to_string(i + 1) + "V" + to_string(i + 1);
        row.variance = rho2(i);
        row.percent = total > 0 ? rho2(i) / total * 100 : std::nan("");
        cum += row.percent;
        row.cum_percent = cum;
        row.corr = result.corr(i);
        row.lambda = 1.0;
        for(long long j = i; j < p; j++){
            row.lambda *= 1 - rho2(j);
        }
        double pi = p - i, qi = q - i;
        if(options.test == "Bartlett"){
            row.stat = -((n - 1) - (p + q + 1) / 2.0) * std::log(row.lambda);
            row.df1 = pi * qi;
            row.df2 = std::nan("");
            row.p = std::isnan(row.stat) ? std::nan("") : (std::isinf(row.stat) ? 0.0 : gsl_cdf_chisq_Q(row.stat, row.df1));
        }else{
            double t = (n - 1) - (pi + qi + 1) / 2.0;
            double s = (pi * pi + qi * qi <= 5) ? 1.0 : std::sqrt((pi * pi * qi * qi - 4) / (pi * pi + qi * qi - 5));
            row.df1 = pi * qi;
            row.df2 = 1 + t * s - pi * qi / 2.0;
            double lambda_s = std::pow(row.lambda, 1.0 / s);
            row.stat = (1 - lambda_s) / lambda_s * row.df2 / row.df1;
            row.p = f_test_pvalue(row.stat, row.df1, row.df2);
        }
        if(row.p < options.prob) result.num_significant++;
        result.sigtest.push_back(row);
    }

    if(options.collinearity){
        result.has_collinearity = true;
        result.colin_fg = collinearity_diag(FG, fg_names);
        result.colin_sg = collinearity_diag(SG, sg_names);
    }
    return result;
}


vector<CanCorrResult> can_corr_by(const METData& data, const vector<string>& fg_vec, const vector<string>& sg_vec,
                                  const string& by, const string& means_by, const CanCorrOptions& options){
    if(!by.empty() && by == means_by){
        spdlog::error("The 'by' and 'means_by' factors must differ");
        throw std::invalid_argument("by and means_by are the same column");
    }
    vector<string> var_vec = fg_vec;
    var_vec.insert(var_vec.end(), sg_vec.begin(), sg_vec.end());
    vector<string> key_vec;
    if(!by.empty()) key_vec.push_back(by);
    if(!means_by.empty()) key_vec.push_back(means_by);
    NumericTable table = select_numeric(data, var_vec, key_vec);
    long long p = expand_variable_ranges(fg_vec, data.get_head()).size();

    vector<string> level_vec{""};
    vector<NumericTable> table_vec{table};
    if(!by.empty()){
        table_vec = split_by(table, 0, level_vec);
    }
    vector<CanCorrResult> result_vec;
    for(long long i = 0; i < (long long)table_vec.size(); i++){
        NumericTable sub = table_vec[i];
        if(!means_by.empty()){
            sub = average_by(sub, by.empty() ? 0 : 1);
        }
        if(options.verbose && !by.empty()){
            spdlog::info("Canonical correlation for {} = {} ({}/{})", by, level_vec[i], i + 1, table_vec.size());
        }
        vector<string> fg_names(sub.var_names.begin(), sub.var_names.begin() + p);
        vector<string> sg_names(sub.var_names.begin() + p, sub.var_names.end());
        CanCorrResult result = can_corr(sub.values.leftCols(p), sub.values.rightCols(sub.values.cols() - p),
                                        fg_names, sg_names, options);
        result.group = level_vec[i];
        result.row_labels = sub.row_labels;
        result_vec.push_back(result);
    }
    return result_vec;
}


static vector<string> prefixed_names(const string& prefix, long long k){
    vector<string> name_vec;
    for(long long i = 0; i < k; i++){
        name_vec.push_back(prefix + to_string(i + 1));
    }
    return name_vec;
}


static void print_collinearity(std::ostream& os, const CollinearityDiag& diag, const vector<string>& name_vec, int digits){
    os << "Determinant of the correlation matrix: " << double_to_string_sig(diag.cor_det, digits) << "\n";
    os << "Condition number: " << double_to_string_sig(diag.condition_number, digits) << "\n";
    os << "Largest absolute correlation: " << double_to_string_sig(diag.max_abs_cor, digits);
    if(!diag.max_pair.empty()) os << " (" << diag.max_pair << ")";
    os << "\n";
    write_matrix(os, diag.vif.transpose(), "", {"VIF"}, name_vec, digits);
    write_matrix(os, diag.eigenvalues.transpose(), "", {"Eigenvalues"}, prefixed_names("", diag.eigenvalues.size()), digits);
}


void print_can_corr(std::ostream& os, const vector<CanCorrResult>& result_vec, int digits){
    for(const auto& result:result_vec){
        long long p = result.fg_names.size();
        if(!result.group.empty()){
            os << "Level " << result.group << "\n";
        }
        write_section(os, "Matrix (correlation/covariance) between variables of first group (FG)");
        write_matrix(os, result.S11, "", result.fg_names, result.fg_names, digits);
        if(result.has_collinearity){
            write_section(os, "Collinearity within first group");
            print_collinearity(os, result.colin_fg, result.fg_names, digits);
        }
        write_section(os, "Matrix (correlation/covariance) between variables of second group (SG)");
        write_matrix(os, result.S22, "", result.sg_names, result.sg_names, digits);
        if(result.has_collinearity){
            write_section(os, "Collinearity within second group");
            print_collinearity(os, result.colin_sg, result.sg_names, digits);
        }
        write_section(os, "Matrix (correlation/covariance) between FG and SG");
        write_matrix(os, result.S12, "", result.fg_names, result.sg_names, digits);

        write_section(os, "Correlation of the canonical pairs and hypothesis testing");
        vector<vector<string>> row_vec;
        bool is_rao = result.test == "Rao";
        for(const auto& row:result.sigtest){
            vector<string> tmp_vec{row.pair, double_to_string_sig(row.variance, digits), double_to_string_sig(row.percent, digits),
                                   double_to_string_sig(row.cum_percent, digits), double_to_string_sig(row.corr, digits),
                                   double_to_string_sig(row.lambda, digits), double_to_string_sig(row.stat, digits),
                                   double_to_string_sig(row.df1, digits)};
            if(is_rao) tmp_vec.push_back(double_to_string_sig(row.df2, digits));
            tmp_vec.push_back(double_to_string_sig(row.p, digits));
            row_vec.push_back(tmp_vec);
        }
        vector<string> head_vec{"Pair", "Var", "Percent", "Sum", "Corr", "Lambda"};
        if(is_rao){
            head_vec.insert(head_vec.end(), {"F", "DF1", "DF2", "p_val"});
        }else{
            head_vec.insert(head_vec.end(), {"Chisq", "DF", "p_val"});
        }
        write_table(os, head_vec, row_vec);
        os << "Significant canonical pairs: " << result.num_significant << "\n";

        write_section(os, "Canonical coefficients of the first group");
        write_matrix(os, result.coef_fg, "", result.fg_names, prefixed_names("U", p), digits);
        write_section(os, "Canonical coefficients of the second group");
        write_matrix(os, result.coef_sg, "", result.sg_names, prefixed_names("V", p), digits);
        write_section(os, "Canonical loads of the first group");
        write_matrix(os, result.loads_fg, "", result.fg_names, prefixed_names("U", p), digits);
        write_section(os, "Canonical loads of the second group");
        write_matrix(os, result.loads_sg, "", result.sg_names, prefixed_names("V", p), digits);
        write_section(os, "Cross-loadings");
        write_matrix(os, result.crossload_fg, "", result.fg_names, prefixed_names("V", p), digits);
        write_matrix(os, result.crossload_sg, "", result.sg_names, prefixed_names("U", p), digits);
        if(!result.row_labels.empty()){
            write_section(os, "Canonical scores");
            MatrixXd score_mat(result.score_fg.rows(), 2 * p);
            score_mat << result.score_fg, result.score_sg;
            vector<string> score_head_vec = prefixed_names("U", p);
            vector<string> tmp_vec = prefixed_names("V", p);
            score_head_vec.insert(score_head_vec.end(), tmp_vec.begin(), tmp_vec.end());
            write_matrix(os, score_mat, "", result.row_labels, score_head_vec, digits);
        }
        os << "\n\n";
    }
}


int CanCorr::run(int argc, char* argv[]) {
    CLI::App app{"can_corr - Canonical correlation analysis"};

    app.description(R"(
    Quick Start:
        fastmet --can-corr --data data_file --FG PH EH EP --SG EL ED CL CD --out can_corr_out
    )");

    CommonCliOptions common;
    CanCorrOptions options;
    vector<string> fg_vec, sg_vec;
    string by, means_by;

    bool can_corr_flag = false;
    app.add_flag("--can-corr", can_corr_flag, "Canonical correlation analysis");
    add_common_options(app, common);

    app.add_option("--FG", fg_vec, "Variables of the first group. 'A:C' ranges are allowed.")
        ->expected(-1)
        ->required();

    app.add_option("--SG", sg_vec, "Variables of the second group, at least as many as the first group.")
        ->expected(-1)
        ->required();

    app.add_option("--by", by, "Run one analysis per level of this column.");

    app.add_option("--means-by", means_by, "Average the rows by the levels of this column first.");

    app.add_option("--use", options.use, "Matrix used: cor (default) or cov.")
        ->default_val("cor")
        ->check(CLI::IsMember({"cor", "cov"}));

    app.add_option("--test", options.test, "Significance test: Bartlett (default) or Rao.")
        ->default_val("Bartlett")
        ->check(CLI::IsMember({"Bartlett", "Rao"}));

    app.add_option("--prob", options.prob, "Probability threshold of the significance test (default: 0.05).")
        ->default_val(0.05);

    app.add_flag("--no-center", [&options](int count) {
        if (count > 0) options.center = false;
    }, "Do not center the data before computing the scores.");

    app.add_flag("--stdscores", options.stdscores, "Standardize the canonical scores.");

    app.add_flag("--no-collinearity", [&options](int count) {
        if (count > 0) options.collinearity = false;
    }, "Skip the collinearity diagnostics.");

    // Parse command-line arguments
    CLI11_PARSE(app, argc, argv);

    set_log_level(common.quiet);
    options.verbose = !common.quiet;
    log_common_options(common);
    spdlog::info("First group: {}", join_string(fg_vec, " "));
    spdlog::info("Second group: {}", join_string(sg_vec, " "));
    spdlog::info("Use: {}, test: {}", options.use, options.test);
    if(!by.empty()) spdlog::info("By: {}", by);
    if(!means_by.empty()) spdlog::info("Means by: {}", means_by);
    spdlog::info("========================");

    METData data;
    data.read(common.data_file, common.missing_in_data_vec);
    vector<CanCorrResult> result_vec = can_corr_by(data, fg_vec, sg_vec, by, means_by, options);

    write_report(common, [&](std::ostream& os){
        print_can_corr(os, result_vec, common.digits);
    });
    return 0;
}
