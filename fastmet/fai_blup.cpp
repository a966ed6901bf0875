/*
 * @Description:
 * @Author: Chao Ning
 * @Date: 2025-04-09 09:12:40
 * @LastEditTime: 2025-04-15 11:02:17
 * @LastEditors: Chao Ning
 */

#include <cmath>
#include <map>
#include <string>
#include <numeric>
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>  // Include CLI11

#include "fai_blup.hpp"
#include "cli_options.hpp"
#include "../utils/EigenMatrix_utils.hpp"
#include "../utils/someCommonFun.hpp"
#include "../utils/string_utils.hpp"
#include "../utils/report_utils.hpp"

using std::to_string;


FaiBlup::FaiBlup(){
}

FaiBlup::~FaiBlup(){
}


GenotypeTable genotype_table(const METData& data, const string& gen_col, const vector<string>& trait_vec){
    if(gen_col.empty()){
        spdlog::error("The genotype column is required");
        throw std::invalid_argument("Missing genotype column");
    }
    NumericTable numeric = average_by(select_numeric(data, trait_vec, {gen_col}), 0);
    GenotypeTable table;
    table.gen = numeric.row_labels;
    table.traits = numeric.var_names;
    table.values = numeric.values;
    return table;
}


static bool valid_ideotype_entry(const string& entry){
    double tmp;
    return entry == "max" || entry == "min" || entry == "mean" || try_string_to_double(entry, tmp);
}


static void check_ideotype(const vector<string>& ideotype_vec, long long num_traits, const string& name){
    if((long long)ideotype_vec.size() != num_traits){
        spdlog::error("The length of {} ({}) must equal the number of traits ({})", name, ideotype_vec.size(), num_traits);
        throw std::invalid_argument("Invalid length of " + name);
    }
    for(const auto& tmp:ideotype_vec){
        if(!valid_ideotype_entry(tmp)){
            spdlog::error("Invalid entry '{}' in {}; use max, min, mean or a number", tmp, name);
            throw std::invalid_argument("Invalid entry in " + name + ": " + tmp);
        }
    }
}


static double ideotype_value(const string& entry, const VectorXd& col){
    if(entry == "max") return col.maxCoeff();
    if(entry == "min") return col.minCoeff();
    if(entry == "mean") return col.mean();
    return string_to_double(entry);
}


static string ideotype_sense(const string& entry){
    if(entry == "max") return "increase";
    if(entry == "min") return "decrease";
    if(entry == "mean") return "keep";
    return "none";
}


FaiBlupResult fai_blup(const GenotypeTable& table, const FaiBlupOptions& options){
    long long n = table.values.rows();
    long long num_traits = table.values.cols();
    if(num_traits < 2){
        spdlog::error("The index needs at least two traits, {} given", num_traits);
        throw std::invalid_argument("At least two traits are required");
    }
    if((long long)table.traits.size() != num_traits || (long long)table.gen.size() != n){
        spdlog::error("The genotype and trait names do not match the table size");
        throw std::invalid_argument("Genotype table names do not match its size");
    }
    if(n < 3){
        spdlog::error("The index needs at least three genotypes, {} given", n);
        throw std::domain_error("At least three genotypes are required");
    }
    vector<string> DI = options.DI.empty() ? vector<string>(num_traits, "max") : options.DI;
    vector<string> UI = options.UI.empty() ? vector<string>(num_traits, "min") : options.UI;
    check_ideotype(DI, num_traits, "DI");
    check_ideotype(UI, num_traits, "UI");

    long long ngs = 0;
    if(options.use_selection){
        if(!(options.SI > 0 && options.SI <= 100)){
            spdlog::error("The selection intensity must be in (0, 100], {} given", options.SI);
            throw std::invalid_argument("Invalid selection intensity");
        }
        ngs = (long long)round_half_even(n * options.SI / 100.0);
        if(ngs < 1){
            spdlog::error("A selection intensity of {}% selects no genotype out of {}", options.SI, n);
            throw std::invalid_argument("Selection intensity too small for the number of genotypes");
        }
    }

    VectorXd sd_Vec = col_sd(table.values);
    vector<string> zero_vec;
    for(long long j = 0; j < num_traits; j++){
        if(!(sd_Vec(j) > 0)) zero_vec.push_back(table.traits[j]);
    }
    if(!zero_vec.empty()){
        spdlog::error("Traits with zero standard deviation: {}", join_string(zero_vec, ", "));
        throw std::runtime_error("Zero standard deviation in trait(s): " + join_string(zero_vec, ", "));
    }

    FaiBlupResult result;
    result.gen = table.gen;
    MatrixXd normalized = table.values;
    mat_row_elementwise_dot_vec(normalized, sd_Vec.cwiseInverse());
    result.fa = factor_analysis(cor_mat(normalized), options.mineval);
    const FactorAnalysis& fa = result.fa;
    long long k = fa.num_factors;
    result.scores = normalized * fa.canonical_loadings;

    vector<long long> order_vec = factor_order(fa);
    MatrixXd canonical_ordered(num_traits, k);
    for(long long j = 0; j < num_traits; j++){
        long long jj = order_vec[j];
        result.traits.push_back(table.traits[jj]);
        result.trait_factor.push_back("FA" + to_string(fa.factor_of[jj] + 1));
        canonical_ordered.row(j) = fa.canonical_loadings.row(jj);
    }

    // ideotype i takes the undesirable profile for factor f when bit (k-1-f) of i is set
    long long num_ideotypes = 1LL << k;
    result.ideotype_design.resize(num_ideotypes, num_traits);
    for(long long i = 0; i < num_ideotypes; i++){
        result.ideotype_names.push_back("ID" + to_string(i + 1));
        for(long long j = 0; j < num_traits; j++){
            long long jj = order_vec[j];
            long long f = fa.factor_of[jj];
            bool undesirable = (i >> (k - 1 - f)) & 1LL;
            result.ideotype_design(i, j) = ideotype_value(undesirable ? UI[jj] : DI[jj], normalized.col(jj));
        }
    }
    result.ideotype_scores = result.ideotype_design * canonical_ordered;

    MatrixXd joint(n + num_ideotypes, k);
    joint << result.scores, result.ideotype_scores;
    mat_row_elementwise_dot_vec(joint, col_sd(joint).cwiseInverse());
    result.distance.resize(n, num_ideotypes);
    for(long long j = 0; j < n; j++){
        for(long long i = 0; i < num_ideotypes; i++){
            result.distance(j, i) = std::sqrt((joint.row(j) - joint.row(n + i)).squaredNorm() / k);
        }
    }
    result.probability = result.distance.cwiseInverse();
    for(long long j = 0; j < n; j++){
        double row_sum = result.probability.row(j).sum();
        for(long long i = 0; i < num_ideotypes; i++){
            double val = result.probability(j, i) / row_sum;
            result.probability(j, i) = std::isnan(val) ? 0.0 : val;
        }
    }

    for(long long i = 0; i < num_ideotypes; i++){
        vector<long long> rank_vec(n);
        std::iota(rank_vec.begin(), rank_vec.end(), 0);
        const MatrixXd& prob = result.probability;
        std::stable_sort(rank_vec.begin(), rank_vec.end(), [&prob, i](long long a, long long b){
            return prob(a, i) > prob(b, i);
        });
        result.ranking.push_back(rank_vec);
    }

    if(options.use_selection){
        result.num_selected = ngs;
        VectorXd xo_Vec = table.values.colwise().mean().transpose();
        for(long long i = 0; i < num_ideotypes; i++){
            vector<SelectionDiffRow> diff_vec;
            std::map<string, vector<double>> sense_map;
            for(long long j = 0; j < num_traits; j++){
                long long jj = order_vec[j];
                SelectionDiffRow row;
                row.var = table.traits[jj];
                row.factor = result.trait_factor[j];
                row.xo = xo_Vec(jj);
                row.xs = 0;
                for(long long s = 0; s < ngs; s++){
                    row.xs += table.values(result.ranking[i][s], jj);
                }
                row.xs /= ngs;
                row.sd = row.xs - row.xo;
                row.sd_perc = row.sd / std::fabs(row.xo) * 100;
                row.sense = ideotype_sense(DI[jj]);
                row.goal = ((row.sense == "decrease" && row.sd_perc < 0) || (row.sense == "increase" && row.sd_perc > 0)) ? 100 : 0;
                sense_map[row.sense].push_back(row.sd_perc);
                diff_vec.push_back(row);
            }
            vector<TotalGainRow> gain_vec;
            for(const auto& tmp:sense_map){
                TotalGainRow gain;
                gain.sense = tmp.first;
                gain.min = *std::min_element(tmp.second.begin(), tmp.second.end());
                gain.max = *std::max_element(tmp.second.begin(), tmp.second.end());
                gain.sum = std::accumulate(tmp.second.begin(), tmp.second.end(), 0.0);
                gain.mean = gain.sum / tmp.second.size();
                gain_vec.push_back(gain);
            }
            result.selection_diff.push_back(diff_vec);
            result.total_gain.push_back(gain_vec);
        }
        for(long long s = 0; s < ngs; s++){
            result.sel_gen.push_back(table.gen[result.ranking[0][s]]);
        }
    }

    if(options.verbose){
        spdlog::info("{} factors retained, {} ideotypes", k, num_ideotypes);
        if(options.use_selection){
            spdlog::info("Selected genotypes: {}", join_string(result.sel_gen, " "));
        }
    }
    return result;
}


static vector<string> factor_names(long long k){
    vector<string> name_vec;
    for(long long i = 0; i < k; i++){
        name_vec.push_back("FA" + to_string(i + 1));
    }
    return name_vec;
}


void print_fai_blup(std::ostream& os, const FaiBlupResult& result, int digits){
    const FactorAnalysis& fa = result.fa;
    long long k = fa.num_factors;
    vector<long long> order_vec = factor_order(fa);
    vector<string> input_traits(fa.cormat.rows());
    for(long long j = 0; j < (long long)result.traits.size(); j++){
        input_traits[order_vec[j]] = result.traits[j];
    }

    write_section(os, "Principal component analysis");
    MatrixXd pca(fa.eigenvalues.size(), 3);
    pca << fa.eigenvalues, fa.variance, fa.cumulative;
    vector<string> pc_vec;
    for(long long i = 0; i < pca.rows(); i++) pc_vec.push_back("PC" + to_string(i + 1));
    write_matrix(os, pca, "PCA", pc_vec, {"Eigenvalues", "Variance", "Cumul_var"}, digits);

    write_section(os, "Factor analysis");
    MatrixXd fa_mat(fa.loadings.rows(), k + 2);
    fa_mat << fa.loadings, fa.communality, fa.uniqueness;
    vector<string> head_vec = factor_names(k);
    head_vec.push_back("Communality");
    head_vec.push_back("Uniquenesses");
    write_matrix(os, fa_mat, "VAR", input_traits, head_vec, digits);
    os << "KMO: " << double_to_string_sig(fa.kmo, digits) << "\n";

    write_section(os, "Canonical loadings");
    write_matrix(os, fa.canonical_loadings, "VAR", input_traits, factor_names(k), digits);

    write_section(os, "Scores for genotypes and ideotypes");
    write_matrix(os, result.scores, "GEN", result.gen, factor_names(k), digits);
    write_matrix(os, result.ideotype_scores, "IDEOTYPE", result.ideotype_names, factor_names(k), digits);

    write_section(os, "Spatial probability of the genotype-ideotype similarity");
    write_matrix(os, result.probability, "GEN", result.gen, result.ideotype_names, digits);

    write_section(os, "Genotype ranking");
    vector<vector<string>> rank_row_vec;
    for(long long s = 0; s < (long long)result.gen.size(); s++){
        vector<string> row{to_string(s + 1)};
        for(const auto& rank_vec:result.ranking){
            row.push_back(result.gen[rank_vec[s]]);
        }
        rank_row_vec.push_back(row);
    }
    vector<string> rank_head_vec{"Rank"};
    rank_head_vec.insert(rank_head_vec.end(), result.ideotype_names.begin(), result.ideotype_names.end());
    write_table(os, rank_head_vec, rank_row_vec);

    for(long long i = 0; i < (long long)result.selection_diff.size(); i++){
        write_section(os, "Selection differential for the ideotype " + result.ideotype_names[i]);
        vector<vector<string>> row_vec;
        for(const auto& row:result.selection_diff[i]){
            row_vec.push_back({row.var, row.factor, double_to_string_sig(row.xo, digits), double_to_string_sig(row.xs, digits),
                               double_to_string_sig(row.sd, digits), double_to_string_sig(row.sd_perc, digits),
                               row.sense, double_to_string_sig(row.goal, digits)});
        }
        write_table(os, {"VAR", "Factor", "Xo", "Xs", "SD", "SDperc", "sense", "goal"}, row_vec);
        row_vec.clear();
        for(const auto& gain:result.total_gain[i]){
            row_vec.push_back({gain.sense, double_to_string_sig(gain.min, digits), double_to_string_sig(gain.mean, digits),
                               double_to_string_sig(gain.max, digits), double_to_string_sig(gain.sum, digits)});
        }
        write_table(os, {"sense", "min", "mean", "max", "sum"}, row_vec);
    }
    if(!result.sel_gen.empty()){
        os << "Selected genotypes (" << result.num_selected << "): " << join_string(result.sel_gen, " ") << "\n";
    }
    os << "\n";
}


int FaiBlup::run(int argc, char* argv[]) {
    CLI::App app{"fai_blup - Multi-trait genotype-ideotype distance index"};

    app.description(R"(
    Quick Start:
        fastmet --fai-blup --data blup_file --gen GEN --trait GY HM NKE --DI max max min --UI min min max --out fai_out
    )");

    CommonCliOptions common;
    FaiBlupOptions options;
    string gen_col;
    vector<string> trait_vec;

    bool fai_blup_flag = false;
    app.add_flag("--fai-blup", fai_blup_flag, "Factor-analysis ideotype index");
    add_common_options(app, common);

    app.add_option("--gen", gen_col, "Genotype column. Rows of the same genotype are averaged.")
        ->required();

    app.add_option("--trait", trait_vec, "Traits. 'A:C' ranges are allowed.")
        ->expected(-1)
        ->required();

    app.add_option("--DI", options.DI, "Desirable ideotype per trait: max, min, mean or a number (default: all max).")
        ->expected(-1);

    app.add_option("--UI", options.UI, "Undesirable ideotype per trait: max, min, mean or a number (default: all min).")
        ->expected(-1);

    app.add_option("--SI", options.SI, "Selection intensity in percent (default: 15).")
        ->default_val(15.0);

    app.add_flag("--no-selection", [&options](int count) {
        if (count > 0) options.use_selection = false;
    }, "Skip the selection differentials.");

    app.add_option("--mineval", options.mineval,
        "Minimum eigenvalue of a retained factor (default: 1).")
        ->default_val(1.0);

    // Parse command-line arguments
    CLI11_PARSE(app, argc, argv);

    set_log_level(common.quiet);
    options.verbose = !common.quiet;
    log_common_options(common);
    spdlog::info("Genotype column: {}", gen_col);
    spdlog::info("Traits: {}", join_string(trait_vec, " "));
    spdlog::info("Selection intensity: {}", options.use_selection ? to_string(options.SI) : "none");
    spdlog::info("Minimum eigenvalue: {}", options.mineval);
    spdlog::info("========================");

    METData data;
    data.read(common.data_file, common.missing_in_data_vec);
    GenotypeTable table = genotype_table(data, gen_col, trait_vec);
    FaiBlupResult result = fai_blup(table, options);

    write_report(common, [&](std::ostream& os){
        print_fai_blup(os, result, common.digits);
    });
    return 0;
}
