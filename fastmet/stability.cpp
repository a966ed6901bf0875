/*
 * @Description:
 * @Author: Chao Ning
 * @Date: 2025-04-07 15:40:03
 * @LastEditTime: 2025-04-14 18:31:27
 * @LastEditors: Chao Ning
 */

#include <cmath>
#include <string>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>  // Include CLI11

#include "stability.hpp"
#include "cli_options.hpp"
#include "../utils/linear_model.hpp"
#include "../utils/someCommonFun.hpp"
#include "../utils/string_utils.hpp"
#include "../utils/report_utils.hpp"


Stability::Stability(){
}

Stability::~Stability(){
}


FoxResult fox(const TrialTrait& trial){
    FoxResult result;
    result.trait = trial.trait;
    result.gen = trial.gen.levels;
    result.y = mean_by_level(trial.gen, trial.y);

    MatrixXd ge_mat = ge_means(trial);
    result.top = VectorXd::Zero(ge_mat.rows());
    for(long long j = 0; j < ge_mat.cols(); j++){
        VectorXd rank_Vec = rank_average(-ge_mat.col(j));
        for(long long i = 0; i < ge_mat.rows(); i++){
            if(!std::isnan(rank_Vec(i)) && rank_Vec(i) <= 3) result.top(i) += 1;
        }
    }
    return result;
}


ShuklaResult shukla(const TrialTrait& trial){
    long long g = trial.gen.num_levels();
    long long e = trial.env.num_levels();
    if(g < 3 || e < 2){
        spdlog::error("Trait {}: Shukla's stability variance needs at least three genotypes and two environments ({} genotypes, {} environments)",
                      trial.trait, g, e);
        throw std::domain_error("Too few genotypes or environments for Shukla's stability variance (trait " + trial.trait + ")");
    }

    // Y ~ ENV + GEN on the observed cells of the GE table
    MatrixXd ge_mat = ge_means(trial);
    vector<long long> cell_gen_vec, cell_env_vec;
    vector<double> cell_y_vec;
    for(long long j = 0; j < e; j++){
        for(long long i = 0; i < g; i++){
            if(std::isnan(ge_mat(i, j))) continue;
            cell_gen_vec.push_back(i);
            cell_env_vec.push_back(j);
            cell_y_vec.push_back(ge_mat(i, j));
        }
    }
    FactorColumn env_cell, gen_cell;
    env_cell.levels = trial.env.levels;
    env_cell.index = cell_env_vec;
    gen_cell.levels = trial.gen.levels;
    gen_cell.index = cell_gen_vec;
    VectorXd y = Eigen::Map<VectorXd>(cell_y_vec.data(), cell_y_vec.size());

    LinearModel model(y);
    model.add_term("ENV", env_cell);
    model.add_term("GEN", gen_cell);
    model.fit();
    const VectorXd& ge_Vec = model.residuals();

    VectorXd Wi = VectorXd::Zero(g);
    for(long long k = 0; k < ge_Vec.size(); k++){
        Wi(cell_gen_vec[k]) += ge_Vec(k) * ge_Vec(k);
    }
    double W_sum = Wi.sum();

    ShuklaResult result;
    result.trait = trial.trait;
    result.gen = trial.gen.levels;
    result.y = mean_by_level(trial.gen, trial.y);
    result.shukla_var = (g * (g - 1.0) * Wi.array() - W_sum) / ((e - 1.0) * (g - 1.0) * (g - 2.0));
    result.r_mean = rank_average(-result.y);
    result.r_shukla_var = rank_average(result.shukla_var);
    result.ssi_shukla_var = result.r_mean + result.r_shukla_var;
    return result;
}


vector<FoxResult> fox(const METData& data, const TrialColumns& columns, const vector<string>& trait_vec,
                      const StabilityOptions& options){
    vector<string> traits = select_traits(data, columns, trait_vec, false);
    vector<FoxResult> result_vec;
    for(long long i = 0; i < (long long)traits.size(); i++){
        if(options.verbose && options.progress) options.progress(i + 1, traits.size(), traits[i]);
        TrialTrait trial = build_trial_trait(data, columns, traits[i]);
        result_vec.push_back(fox(trial));
    }
    return result_vec;
}


vector<ShuklaResult> shukla(const METData& data, const TrialColumns& columns, const vector<string>& trait_vec,
                            const StabilityOptions& options){
    vector<string> traits = select_traits(data, columns, trait_vec);
    vector<ShuklaResult> result_vec;
    for(long long i = 0; i < (long long)traits.size(); i++){
        if(options.verbose && options.progress) options.progress(i + 1, traits.size(), traits[i]);
        TrialTrait trial = build_trial_trait(data, columns, traits[i]);
        result_vec.push_back(shukla(trial));
    }
    return result_vec;
}


void print_fox(std::ostream& os, const vector<FoxResult>& result_vec, int digits){
    for(const auto& result:result_vec){
        os << "Variable " << result.trait << "\n";
        write_section(os, "Fox TOP third criteria");
        vector<vector<string>> row_vec;
        for(size_t i = 0; i < result.gen.size(); i++){
            row_vec.push_back({result.gen[i], double_to_string_sig(result.y(i), digits), double_to_string_sig(result.top(i), digits)});
        }
        write_table(os, {"GEN", "Y", "TOP"}, row_vec);
    }
    os << "\n\n\n";
}


void print_shukla(std::ostream& os, const vector<ShuklaResult>& result_vec, int digits){
    for(const auto& result:result_vec){
        os << "Variable " << result.trait << "\n";
        write_section(os, "Shukla stability variance");
        vector<vector<string>> row_vec;
        for(size_t i = 0; i < result.gen.size(); i++){
            row_vec.push_back({result.gen[i], double_to_string_sig(result.y(i), digits),
                double_to_string_sig(result.shukla_var(i), digits), double_to_string_sig(result.r_mean(i), digits),
                double_to_string_sig(result.r_shukla_var(i), digits), double_to_string_sig(result.ssi_shukla_var(i), digits)});
        }
        write_table(os, {"GEN", "Y", "ShuklaVar", "rMean", "rShukaVar", "ssiShukaVar"}, row_vec);
    }
    os << "\n\n\n";
}


int Stability::run_fox(int argc, char* argv[]) {
    CLI::App app{"Fox - Stability analysis by the top-third criterion"};

    app.description(R"(
    Quick Start:
        fastmet --fox --data data_file --env ENV --gen GEN --trait GY HM --out fox_out
    )");

    CommonCliOptions common;
    TrialColumns columns;
    vector<string> trait_vec;
    common.digits = 3;

    bool fox_flag = false;
    app.add_flag("--fox", fox_flag, "Fox's stability analysis");
    add_common_options(app, common);
    app.add_option("--env", columns.env, "Environment column (required).")->required();
    app.add_option("--gen", columns.gen, "Genotype column (required).")->required();
    app.add_option("--trait", trait_vec,
        "List of traits (required). Use ':' to specify a range (e.g., --trait GY:NKE).")
        ->expected(-1)->required();

    // Parse command-line arguments
    CLI11_PARSE(app, argc, argv);

    set_log_level(common.quiet);
    log_common_options(common);
    spdlog::info("========================");

    StabilityOptions options;
    options.verbose = !common.quiet;

    METData data;
    data.read(common.data_file, common.missing_in_data_vec);
    vector<FoxResult> result_vec = fox(data, columns, trait_vec, options);

    write_report(common, [&](std::ostream& os){
        print_fox(os, result_vec, common.digits);
    });
    return 0;
}


int Stability::run_shukla(int argc, char* argv[]) {
    CLI::App app{"Shukla - Stability variance"};

    app.description(R"(
    Quick Start:
        fastmet --shukla --data data_file --env ENV --gen GEN --rep REP --trait GY HM --out shukla_out
    )");

    CommonCliOptions common;
    TrialCliOptions trial;
    common.digits = 3;

    bool shukla_flag = false;
    app.add_flag("--shukla", shukla_flag, "Shukla's stability variance");
    add_common_options(app, common);
    add_trial_options(app, trial);

    // Parse command-line arguments
    CLI11_PARSE(app, argc, argv);

    set_log_level(common.quiet);
    log_common_options(common);
    spdlog::info("========================");

    StabilityOptions options;
    options.verbose = !common.quiet;

    METData data;
    data.read(common.data_file, common.missing_in_data_vec);
    vector<ShuklaResult> result_vec = shukla(data, trial.columns, trial.trait_vec, options);

    write_report(common, [&](std::ostream& os){
        print_shukla(os, result_vec, common.digits);
    });
    return 0;
}
