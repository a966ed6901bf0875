/*
 * @Description:
 * @Author: Chao Ning
 * @Date: 2025-04-07 09:15:22
 * @LastEditTime: 2025-04-14 18:02:11
 * @LastEditors: Chao Ning
 */

#include <cmath>
#include <string>
#include <algorithm>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>  // Include CLI11

#include "anova_ind.hpp"
#include "cli_options.hpp"
#include "../utils/linear_model.hpp"
#include "../utils/string_utils.hpp"
#include "../utils/report_utils.hpp"


AnovaInd::AnovaInd(){
}

AnovaInd::~AnovaInd(){
}


static FactorColumn subset_factor(const FactorColumn& factor, const vector<long long>& row_vec){
    vector<string> label_vec;
    for(auto i:row_vec){
        label_vec.push_back(factor.label(i));
    }
    return make_factor(label_vec);
}


static void fill_row(const vector<AnovaRow>& table, const string& source, double& df, double& ms, double& f, double& p){
    const AnovaRow* row = find_anova_row(table, source);
    if(row == nullptr){
        df = ms = f = p = std::nan("");
        return;
    }
    df = row->df;
    ms = row->ms;
    f = row->f;
    p = row->p;
}


AnovaIndResult anova_ind(const TrialTrait& trial){
    AnovaIndResult result;
    result.trait = trial.trait;
    result.has_block = trial.has_block;

    for(long long j = 0; j < trial.env.num_levels(); j++){
        vector<long long> row_vec;
        for(long long i = 0; i < trial.num_records(); i++){
            if(trial.env.index[i] == j) row_vec.push_back(i);
        }
        VectorXd y(row_vec.size());
        for(size_t i = 0; i < row_vec.size(); i++){
            y(i) = trial.y(row_vec[i]);
        }
        FactorColumn gen = subset_factor(trial.gen, row_vec);
        FactorColumn rep = subset_factor(trial.rep, row_vec);

        LinearModel model(y);
        model.add_term("GEN", gen);
        model.add_term("REP", rep);
        FactorColumn block;
        if(trial.has_block){
            block = subset_factor(trial.block, row_vec);
            model.add_term("REP:BLOCK", {&rep, &block});
        }
        model.fit();
        vector<AnovaRow> table = model.anova();

        AnovaIndRow row;
        row.env = trial.env.levels[j];
        row.mean = y.mean();
        fill_row(table, "GEN", row.dfg, row.msg, row.fcg, row.pfg);
        fill_row(table, "REP", row.dfr, row.msr, row.fcr, row.pfr);
        fill_row(table, "REP:BLOCK", row.dfib, row.msib, row.fcib, row.pfib);
        row.dfe = model.df_residual();
        row.mse = model.mse();
        row.cv = std::sqrt(row.mse) / row.mean * 100;
        row.h2 = (row.msg - row.mse) / row.msg;
        row.as = row.h2 < 0 ? 0 : std::sqrt(row.h2);
        result.individual.push_back(row);
    }

    double mse_max = -INFINITY, mse_min = INFINITY;
    for(const auto& row:result.individual){
        if(std::isnan(row.mse)) continue;
        mse_max = std::max(mse_max, row.mse);
        mse_min = std::min(mse_min, row.mse);
    }
    result.msr_ratio = std::isinf(mse_max) ? std::nan("") : mse_max / mse_min;
    return result;
}


vector<AnovaIndResult> anova_ind(const METData& data, const TrialColumns& columns, const vector<string>& trait_vec,
                                 const AnovaIndOptions& options){
    vector<string> traits = select_traits(data, columns, trait_vec);
    vector<AnovaIndResult> result_vec;
    for(long long i = 0; i < (long long)traits.size(); i++){
        if(options.verbose && options.progress) options.progress(i + 1, traits.size(), traits[i]);
        TrialTrait trial = build_trial_trait(data, columns, traits[i]);
        result_vec.push_back(anova_ind(trial));
    }
    return result_vec;
}


void print_anova_ind(std::ostream& os, const vector<AnovaIndResult>& result_vec, int digits){
    for(const auto& result:result_vec){
        os << "Variable " << result.trait << "\n";
        write_section(os, "Within-environment ANOVA results");
        vector<string> head_vec;
        if(result.has_block){
            head_vec = {"ENV", "MEAN", "DFG", "MSG", "FCG", "PFG", "DFCR", "MSCR", "FCR", "PFCR",
                        "DFIB_R", "MSIB_R", "FCIB_R", "PFIB_R", "DFE", "MSE", "CV", "h2", "AS"};
        }else{
            head_vec = {"ENV", "MEAN", "DFG", "MSG", "FCG", "PFG", "DFB", "MSB", "FCB", "PFB",
                        "DFE", "MSE", "CV", "h2", "AS"};
        }
        vector<vector<string>> row_vec;
        for(const auto& row:result.individual){
            vector<double> val_vec = {row.mean, row.dfg, row.msg, row.fcg, row.pfg, row.dfr, row.msr, row.fcr, row.pfr};
            if(result.has_block){
                val_vec.insert(val_vec.end(), {row.dfib, row.msib, row.fcib, row.pfib});
            }
            val_vec.insert(val_vec.end(), {row.dfe, row.mse, row.cv, row.h2, row.as});
            vector<string> tmp = {row.env};
            for(auto val:val_vec){
                tmp.push_back(double_to_string_sig(val, digits));
            }
            row_vec.push_back(tmp);
        }
        write_table(os, head_vec, row_vec);
        os << "MSRratio: " << double_to_string_sig(result.msr_ratio, digits) << "\n";
        os << "---------------------------------------------------------------------------\n";
        os << "\n\n\n";
    }
}


int AnovaInd::run(int argc, char* argv[]) {
    CLI::App app{"anova_ind - Within-environment analysis of variance"};

    app.description(R"(
    Quick Start:
        fastmet --anova-ind --data data_file --env ENV --gen GEN --rep REP --trait GY HM --out anova_ind_out
    )");

    CommonCliOptions common;
    TrialCliOptions trial;
    common.digits = 3;

    bool anova_ind_flag = false;
    app.add_flag("--anova-ind", anova_ind_flag, "Within-environment ANOVA");
    add_common_options(app, common);
    add_trial_options(app, trial);

    // Parse command-line arguments
    CLI11_PARSE(app, argc, argv);

    set_log_level(common.quiet);
    log_common_options(common);
    spdlog::info("Design: {}", trial.columns.has_block() ? "alpha-lattice" : "randomized complete block");
    spdlog::info("========================");

    AnovaIndOptions options;
    options.verbose = !common.quiet;

    METData data;
    data.read(common.data_file, common.missing_in_data_vec);
    vector<AnovaIndResult> result_vec = anova_ind(data, trial.columns, trial.trait_vec, options);

    write_report(common, [&](std::ostream& os){
        print_anova_ind(os, result_vec, common.digits);
    });
    return 0;
}
