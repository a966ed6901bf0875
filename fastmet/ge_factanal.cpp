/*
 * @Description:
 * @Author: Chao Ning
 * @Date: 2025-04-08 14:33:19
 * @LastEditTime: 2025-04-14 19:45:02
 * @LastEditors: Chao Ning
 */

#include <cmath>
#include <string>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>  // Include CLI11

#include "ge_factanal.hpp"
#include "cli_options.hpp"
#include "../utils/EigenMatrix_utils.hpp"
#include "../utils/string_utils.hpp"
#include "../utils/report_utils.hpp"

using std::to_string;


GEFactanal::GEFactanal(){
}

GEFactanal::~GEFactanal(){
}


GEFactanalResult ge_factanal(const TrialTrait& trial, const GEFactanalOptions& options){
    GEFactanalResult result;
    result.trait = trial.trait;
    result.env_levels = trial.env.levels;
    result.gen_levels = trial.gen.levels;
    if(trial.env.num_levels() < 2 || trial.gen.num_levels() < 3){
        spdlog::error("Trait {}: the factor analysis needs at least two environments and three genotypes", trial.trait);
        throw std::domain_error("Too few environments or genotypes for the factor analysis (trait " + trial.trait + ")");
    }

    MatrixXd means = ge_means(trial);
    long long num_missing = num_missing_cells(means);
    if(num_missing > 0){
        if(!options.impute_missing){
            spdlog::error("Trait {}: {} genotype x environment cells are missing and imputation is disabled", trial.trait, num_missing);
            throw std::runtime_error("Unbalanced GE matrix for trait " + trial.trait + ": " + to_string(num_missing) + " missing cells");
        }
        ImputeResult imputed = impute_ge_matrix(means, options.impute);
        means = imputed.mat;
        result.imputed = true;
        result.warning = "Data imputation used to fill the GxE matrix (" + to_string(num_missing) + " cells, "
                         + options.impute.algorithm + ", " + to_string(imputed.iterations) + " iterations)";
        spdlog::warn("Trait {}: {}", trial.trait, result.warning);
    }
    result.ge_means = means;

    VectorXd sd_Vec = col_sd(means);
    for(long long j = 0; j < sd_Vec.size(); j++){
        if(!(sd_Vec(j) > 0)){
            spdlog::error("Trait {}: all genotypes have the same mean in environment {}", trial.trait, result.env_levels[j]);
            throw std::runtime_error("Zero variance among genotypes in environment " + result.env_levels[j]);
        }
    }

    result.fa = factor_analysis(cor_mat(means), options.mineval);
    result.communality_mean = result.fa.communality.mean();
    result.scores = scale_by_sd(means) * result.fa.canonical_loadings;

    for(auto j:factor_order(result.fa)){
        EnvStratRow row;
        VectorXd col = means.col(j);
        row.env = result.env_levels[j];
        row.factor = "FA" + to_string(result.fa.factor_of[j] + 1);
        row.mean = col.mean();
        row.min = col.minCoeff();
        row.max = col.maxCoeff();
        row.cv = sd_Vec(j) / row.mean * 100;
        result.env_strat.push_back(row);
    }

    if(result.fa.num_factors < 2){
        spdlog::warn("Trait {}: the number of retained factors is {}. A plot with the scores cannot be obtained. "
                     "Use 'mineval' to increase the number of factors retained", trial.trait, result.fa.num_factors);
    }
    return result;
}


vector<GEFactanalResult> ge_factanal(const METData& data, const TrialColumns& columns, const vector<string>& trait_vec,
                                     const GEFactanalOptions& options){
    vector<string> traits = select_traits(data, columns, trait_vec);
    check_impute_options(options.impute);
    vector<GEFactanalResult> result_vec;
    for(long long i = 0; i < (long long)traits.size(); i++){
        if(options.verbose && options.progress) options.progress(i + 1, traits.size(), traits[i]);
        TrialTrait trial = build_trial_trait(data, columns, traits[i]);
        result_vec.push_back(ge_factanal(trial, options));
    }
    return result_vec;
}


static vector<string> factor_names(long long k, const string& prefix){
    vector<string> name_vec;
    for(long long i = 0; i < k; i++){
        name_vec.push_back(prefix + to_string(i + 1));
    }
    return name_vec;
}


void print_ge_factanal(std::ostream& os, const vector<GEFactanalResult>& result_vec, int digits){
    for(const auto& result:result_vec){
        const FactorAnalysis& fa = result.fa;
        long long k = fa.num_factors;
        os << "Variable " << result.trait << "\n";
        write_section(os, "Correlation matrix among environments");
        write_matrix(os, fa.cormat, "ENV", result.env_levels, result.env_levels, digits);

        write_section(os, "Eigenvalues and explained variance");
        MatrixXd pca(fa.eigenvalues.size(), 3);
        pca << fa.eigenvalues, fa.variance, fa.cumulative;
        write_matrix(os, pca, "PCA", factor_names(pca.rows(), "PC"), {"Eigenvalues", "Variance", "Cumul_var"}, digits);

        write_section(os, "Initial loadings");
        write_matrix(os, fa.initial_loadings, "Env", result.env_levels, factor_names(k, "FA"), digits);

        write_section(os, "Loadings after varimax rotation and commonalities");
        MatrixXd fa_mat(fa.loadings.rows(), k + 2);
        fa_mat << fa.loadings, fa.communality, fa.uniqueness;
        vector<string> head_vec = factor_names(k, "FA");
        head_vec.push_back("Communality");
        head_vec.push_back("Uniquenesses");
        write_matrix(os, fa_mat, "Env", result.env_levels, head_vec, digits);
        os << "KMO: " << double_to_string_sig(fa.kmo, digits)
           << "  Communality mean: " << double_to_string_sig(result.communality_mean, digits) << "\n";
        write_matrix(os, fa.msa.transpose(), "", {"MSA"}, result.env_levels, digits);

        write_section(os, "Environmental stratification based on factor analysis");
        vector<vector<string>> row_vec;
        for(const auto& row:result.env_strat){
            row_vec.push_back({row.env, row.factor, double_to_string_sig(row.mean, digits), double_to_string_sig(row.min, digits),
                               double_to_string_sig(row.max, digits), double_to_string_sig(row.cv, digits)});
        }
        write_table(os, {"Env", "Factor", "Mean", "Min", "Max", "CV"}, row_vec);
        write_section(os, "Mean = mean; Min = minimum; Max = maximum; CV = coefficient of variation (%)");

        write_section(os, "Genotype scores");
        write_matrix(os, result.scores, "Gen", result.gen_levels, factor_names(k, "FA"), digits);
        if(result.imputed){
            os << "Warning: " << result.warning << "\n";
        }
        os << "\n\n\n";
    }
}


int GEFactanal::run(int argc, char* argv[]) {
    CLI::App app{"ge_factanal - Environmental stratification by factor analysis"};

    app.description(R"(
    Quick Start:
        fastmet --ge-factanal --data data_file --env ENV --gen GEN --rep REP --trait GY --out ge_factanal_out
    )");

    CommonCliOptions common;
    TrialCliOptions trial;
    GEFactanalOptions options;

    bool ge_factanal_flag = false;
    app.add_flag("--ge-factanal", ge_factanal_flag, "Factor analysis of the GE means");
    add_common_options(app, common);
    add_trial_options(app, trial);

    app.add_option("--mineval", options.mineval,
        "Minimum eigenvalue of a retained factor (default: 1).")
        ->default_val(1.0);

    app.add_flag("--no-impute", [&options](int count) {
        if (count > 0) options.impute_missing = false;
    }, "Disable the imputation of missing genotype x environment cells.");

    app.add_option("--impute-algorithm", options.impute.algorithm,
        "Imputation algorithm: EM-SVD (default), EM-AMMI or colmeans.")
        ->default_val("EM-SVD");

    // Parse command-line arguments
    CLI11_PARSE(app, argc, argv);

    set_log_level(common.quiet);
    options.verbose = !common.quiet;
    log_common_options(common);
    spdlog::info("Minimum eigenvalue: {}", options.mineval);
    spdlog::info("========================");

    METData data;
    data.read(common.data_file, common.missing_in_data_vec);
    vector<GEFactanalResult> result_vec = ge_factanal(data, trial.columns, trial.trait_vec, options);

    write_report(common, [&](std::ostream& os){
        print_ge_factanal(os, result_vec, common.digits);
    });
    return 0;
}
