/*
 * @Description: AMMI model: ANOVA with replicates nested in environments, SVD of the
 *               genotype x environment interaction and the truncated predictions
 * @Author: Chao Ning
 * @Date: 2025-04-05 14:02:36
 * @LastEditTime: 2025-04-14 16:48:09
 * @LastEditors: Chao Ning
 */

#include <set>
#include <map>
#include <cmath>
#include <algorithm>
#include <string>
#include <stdexcept>
#include <Eigen/Dense>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>  // Include CLI11

#include "ammi.hpp"
#include "cli_options.hpp"
#include "../utils/string_utils.hpp"
#include "../utils/report_utils.hpp"


using std::to_string;
using Eigen::RowVectorXd;
using Eigen::JacobiSVD;


AMMI::AMMI(){
}

AMMI::~AMMI(){
}


MatrixXd additive_residual(const MatrixXd& ge_mat){
    VectorXd row_mean = ge_mat.rowwise().mean();
    RowVectorXd col_mean = ge_mat.colwise().mean();
    double grand = ge_mat.mean();
    MatrixXd res = ge_mat;
    res.colwise() -= row_mean;
    res.rowwise() -= col_mean;
    res.array() += grand;
    return res;
}


static AmmiTableRow to_table_row(const AnovaRow& row){
    AmmiTableRow out = {row.source, row.df, row.ss, row.ms, row.f, row.p, std::nan(""), std::nan("")};
    return out;
}


static void anova_with_reps(const TrialTrait& trial, AmmiResult& result){
    LinearModel model(trial.y);
    model.add_term("GEN", trial.gen);
    model.add_term("ENV", trial.env);
    model.add_term("GEN:ENV", {&trial.gen, &trial.env});
    model.add_term("ENV:REP", {&trial.env, &trial.rep});
    if(trial.has_block){
        model.add_term("ENV:REP:BLOCK", {&trial.env, &trial.rep, &trial.block});
    }
    model.fit();
    vector<AnovaRow> fit_table = model.anova();
    result.mse = model.mse();
    result.dfe = model.df_residual();

    // ENV, REP(ENV), [BLOCK(REP*ENV),] GEN, GEN:ENV
    vector<std::pair<string, string>> order_vec = {{"ENV", "ENV"}, {"ENV:REP", "REP(ENV)"}};
    if(trial.has_block) order_vec.push_back({"ENV:REP:BLOCK", "BLOCK(REP*ENV)"});
    order_vec.push_back({"GEN", "GEN"});
    order_vec.push_back({"GEN:ENV", "GEN:ENV"});

    result.anova.clear();
    result.probint = std::nan("");
    for(const auto& tmp:order_vec){
        const AnovaRow* row = find_anova_row(fit_table, tmp.first);
        if(row == nullptr) continue;
        AmmiTableRow out = to_table_row(*row);
        out.source = tmp.second;
        result.anova.push_back(out);
        if(tmp.first == "GEN:ENV") result.probint = row->p;
    }

    // environments are tested against replicates within environments
    if(!trial.has_block && result.anova.size() > 1 && result.anova[0].source == "ENV" && result.anova[1].source == "REP(ENV)"){
        AmmiTableRow& env_row = result.anova[0];
        const AmmiTableRow& rep_row = result.anova[1];
        env_row.f = env_row.ms / rep_row.ms;
        env_row.p = f_test_pvalue(env_row.f, env_row.df, rep_row.df);
    }

    result.anova.push_back(to_table_row(fit_table.back()));

    VectorXd hat_Vec = model.hat();
    result.augment.y = trial.y;
    result.augment.hat = hat_Vec;
    result.augment.sigma = model.sigma();
    result.augment.fitted = model.fitted();
    result.augment.resid = model.residuals();
    result.augment.stdres = model.stdres();
    result.augment.se_fit = model.se_fit();
    long long n = trial.num_records();
    result.augment.env.resize(n);
    result.augment.gen.resize(n);
    result.augment.rep.resize(n);
    result.augment.factors.resize(n);
    if(trial.has_block) result.augment.block.resize(n);
    for(long long i = 0; i < n; i++){
        result.augment.env[i] = trial.env.label(i);
        result.augment.gen[i] = trial.gen.label(i);
        result.augment.rep[i] = trial.rep.label(i);
        result.augment.factors[i] = trial.gen.label(i) + "_" + trial.rep.label(i);
        if(trial.has_block){
            result.augment.block[i] = trial.block.label(i);
            result.augment.factors[i] += "_" + trial.block.label(i);
        }
    }
}


AmmiResult performs_ammi(const TrialTrait& trial, const AmmiOptions& options){
    AmmiResult result;
    result.trait = trial.trait;
    result.has_block = trial.has_block;
    result.num_gen = trial.gen.num_levels();
    result.num_env = trial.env.num_levels();
    result.num_rep = trial.rep.num_levels();
    result.gen_levels = trial.gen.levels;
    result.env_levels = trial.env.levels;
    result.minimo = std::min(result.num_gen, result.num_env) - 1;
    if(result.minimo < 2){
        spdlog::error("Trait {}: the AMMI analysis is not possible with {} genotypes and {} environments. "
                      "Both genotypes and environments must have more than two levels.",
                      trial.trait, result.num_gen, result.num_env);
        throw std::domain_error("AMMI needs at least three genotypes and three environments (trait " + trial.trait + ")");
    }

    anova_with_reps(trial, result);

    // GE matrix
    MatrixXd ge_mat = ge_means(trial);
    long long num_missing = num_missing_cells(ge_mat);
    if(num_missing > 0){
        if(!options.impute_missing){
            spdlog::error("Trait {}: {} genotype x environment cells are missing and imputation is disabled", trial.trait, num_missing);
            throw std::runtime_error("Unbalanced GE matrix for trait " + trial.trait + ": " + to_string(num_missing) + " missing cells");
        }
        ImputeResult imputed = impute_ge_matrix(ge_mat, options.impute);
        ge_mat = imputed.mat;
        result.imputed = true;
        result.warning = "Data imputation used to fill the GxE matrix (" + to_string(num_missing) + " cells, "
                         + options.impute.algorithm + ", " + to_string(imputed.iterations) + " iterations)";
        spdlog::warn("Trait {}: {}", trial.trait, result.warning);
    }
    result.ge_means = ge_mat;

    // SVD of the interaction
    result.interaction = additive_residual(ge_mat);
    JacobiSVD<MatrixXd> svd(result.interaction, Eigen::ComputeThinU | Eigen::ComputeThinV);
    long long minimo = result.minimo;
    result.singular_values = svd.singularValues().head(minimo);
    result.U = svd.matrixU().leftCols(minimo);
    result.V = svd.matrixV().leftCols(minimo);

    VectorXd ss_Vec = result.singular_values.array().square() * (double)result.num_rep;
    double ss_sum = ss_Vec.sum();
    double accumulated = 0;
    result.pca.clear();
    for(long long k = 1; k <= minimo; k++){
        double df = (result.num_gen - 1) + (result.num_env - 1) - (2 * k - 1);
        if(df <= 0) break;
        AmmiTableRow row;
        row.source = "PC" + to_string(k);
        row.df = df;
        row.ss = ss_Vec(k - 1);
        row.ms = row.ss / row.df;
        row.f = result.mse > 0 ? row.ms / result.mse : std::nan("");
        row.p = result.dfe > 0 ? f_test_pvalue(row.f, row.df, result.dfe) : std::nan("");
        row.proportion = ss_sum > 0 ? ss_Vec(k - 1) / ss_sum * 100 : std::nan("");
        accumulated += row.proportion;
        row.accumulated = accumulated;
        result.pca.push_back(row);
    }

    // ANOVA: rows of the model, PCs, residuals and total
    AmmiTableRow residual_row = result.anova.back();
    result.anova.pop_back();
    result.anova.insert(result.anova.end(), result.pca.begin(), result.pca.end());
    result.anova.push_back(residual_row);

    // sum over every row above, principal components included
    AmmiTableRow total_row = {"Total", 0, 0, 0, std::nan(""), std::nan(""), std::nan(""), std::nan("")};
    for(const auto& row:result.anova){
        total_row.df += row.df;
        total_row.ss += row.ss;
    }
    total_row.ms = total_row.ss / total_row.df;
    result.anova.push_back(total_row);

    // scores
    VectorXd sqrt_d = result.singular_values.array().sqrt();
    result.gen_score = result.U * sqrt_d.asDiagonal();
    result.env_score = result.V * sqrt_d.asDiagonal();
    result.gen_mean = ge_mat.rowwise().mean();
    result.env_mean = ge_mat.colwise().mean().transpose();

    result.means_gxe.clear();
    for(long long j = 0; j < result.num_env; j++){
        for(long long i = 0; i < result.num_gen; i++){
            MeansGxERow row;
            row.env = result.env_levels[j];
            row.gen = result.gen_levels[i];
            row.y = ge_mat(i, j);
            row.envPC1 = result.env_score(j, 0);
            row.genPC1 = result.gen_score(i, 0);
            row.nominal = result.gen_mean(i) + row.genPC1 * row.envPC1;
            result.means_gxe.push_back(row);
        }
    }
    return result;
}


vector<AmmiResult> performs_ammi(const METData& data, const TrialColumns& columns, const vector<string>& trait_vec,
                                 const AmmiOptions& options){
    vector<string> traits = select_traits(data, columns, trait_vec);
    check_impute_options(options.impute);
    vector<AmmiResult> result_vec;
    for(long long i = 0; i < (long long)traits.size(); i++){
        if(options.verbose && options.progress) options.progress(i + 1, traits.size(), traits[i]);
        TrialTrait trial = build_trial_trait(data, columns, traits[i]);
        result_vec.push_back(performs_ammi(trial, options));
    }

    if(options.verbose){
        vector<string> nonsig_vec;
        for(const auto& result:result_vec){
            if(result.probint > 0.05) nonsig_vec.push_back(result.trait);
        }
        if(!nonsig_vec.empty()){
            spdlog::info("Variables with nonsignificant GxE interaction: {}", join_string(nonsig_vec, ", "));
        }else{
            spdlog::info("All variables with significant (p < 0.05) genotype-vs-environment interaction");
        }
    }
    return result_vec;
}


AmmiPrediction predict_ammi(const AmmiResult& result, int naxis){
    if(naxis <= 0){
        spdlog::error("Trait {}: invalid number of axes {}. The AMMI0 model is calculated automatically, please inform naxis > 0",
                      result.trait, naxis);
        throw std::invalid_argument("naxis must be greater than zero");
    }
    if(naxis > result.minimo){
        spdlog::error("Trait {}: the number of axes must be lesser than or equal to min(GEN-1;ENV-1), in this case, {}",
                      result.trait, result.minimo);
        throw std::domain_error("naxis greater than " + to_string(result.minimo) + " for trait " + result.trait);
    }

    MatrixXd residual = additive_residual(result.ge_means);
    long long num_cell = result.num_gen * result.num_env;
    AmmiPrediction pred;
    pred.trait = result.trait;
    pred.naxis = naxis;
    pred.y.resize(num_cell);
    pred.residual.resize(num_cell);
    pred.res_ammi.resize(num_cell);
    long long k = 0;
    for(long long j = 0; j < result.num_env; j++){
        for(long long i = 0; i < result.num_gen; i++){
            pred.env.push_back(result.env_levels[j]);
            pred.gen.push_back(result.gen_levels[i]);
            pred.y(k) = result.ge_means(i, j);
            pred.residual(k) = residual(i, j);
            // ((Z U) * (X V)) d restricted to the first naxis axes
            double res_ammi = 0;
            for(int a = 0; a < naxis; a++){
                res_ammi += result.U(i, a) * result.V(j, a) * result.singular_values(a);
            }
            pred.res_ammi(k) = res_ammi;
            k++;
        }
    }
    pred.ypred = pred.y - pred.residual;
    pred.ypred_ammi = pred.ypred + pred.res_ammi;
    pred.ammi0 = pred.ypred;
    return pred;
}


vector<AmmiPrediction> predict_ammi(const vector<AmmiResult>& result_vec, const vector<int>& naxis_vec){
    if(result_vec.size() != naxis_vec.size()){
        spdlog::error("The number of axes must be given for each of the {} traits, {} values found", result_vec.size(), naxis_vec.size());
        throw std::invalid_argument("naxis must have one value per trait");
    }
    vector<AmmiPrediction> pred_vec;
    for(size_t i = 0; i < result_vec.size(); i++){
        pred_vec.push_back(predict_ammi(result_vec[i], naxis_vec[i]));
    }
    return pred_vec;
}


static vector<string> table_row_strings(const AmmiTableRow& row, int digits){
    return {row.source, double_to_string_sig(row.df, digits), double_to_string_sig(row.ss, digits),
            double_to_string_sig(row.ms, digits), double_to_string_sig(row.f, digits), double_to_string_sig(row.p, digits),
            double_to_string_sig(row.proportion, digits), double_to_string_sig(row.accumulated, digits)};
}


void print_ammi(std::ostream& os, const vector<AmmiResult>& result_vec, int digits){
    for(const auto& result:result_vec){
        os << "Variable " << result.trait << "\n";
        write_section(os, "AMMI analysis table");
        vector<vector<string>> row_vec;
        for(const auto& row:result.anova){
            row_vec.push_back(table_row_strings(row, digits));
        }
        write_table(os, {"Source", "Df", "Sum Sq", "Mean Sq", "F value", "Pr(>F)", "Proportion", "Accumulated"}, row_vec);

        write_section(os, "Scores for genotypes and environments");
        vector<string> head_vec = {"type", "Code", "Y"};
        for(long long k = 0; k < result.minimo; k++){
            head_vec.push_back("PC" + to_string(k + 1));
        }
        row_vec.clear();
        for(long long i = 0; i < result.num_gen; i++){
            vector<string> row = {"GEN", result.gen_levels[i], double_to_string_sig(result.gen_mean(i), digits)};
            vector<string> tmp = format_values(result.gen_score.row(i).transpose(), digits);
            row.insert(row.end(), tmp.begin(), tmp.end());
            row_vec.push_back(row);
        }
        for(long long j = 0; j < result.num_env; j++){
            vector<string> row = {"ENV", result.env_levels[j], double_to_string_sig(result.env_mean(j), digits)};
            vector<string> tmp = format_values(result.env_score.row(j).transpose(), digits);
            row.insert(row.end(), tmp.begin(), tmp.end());
            row_vec.push_back(row);
        }
        write_table(os, head_vec, row_vec);
        if(result.imputed){
            os << "Warning: " << result.warning << "\n";
        }
        os << "\n\n\n";
    }
}


void print_ammi_prediction(std::ostream& os, const vector<AmmiPrediction>& pred_vec, int digits){
    write_section(os, "Predicted means of the AMMI model");
    vector<vector<string>> row_vec;
    for(const auto& pred:pred_vec){
        for(long long k = 0; k < pred.y.size(); k++){
            row_vec.push_back({pred.trait, to_string(pred.naxis), pred.env[k], pred.gen[k],
                double_to_string_sig(pred.y(k), digits), double_to_string_sig(pred.residual(k), digits),
                double_to_string_sig(pred.ypred(k), digits), double_to_string_sig(pred.res_ammi(k), digits),
                double_to_string_sig(pred.ypred_ammi(k), digits), double_to_string_sig(pred.ammi0(k), digits)});
        }
    }
    write_table(os, {"TRAIT", "naxis", "ENV", "GEN", "Y", "RESIDUAL", "Ypred", "ResAMMI", "YpredAMMI", "AMMI0"}, row_vec);
}


int AMMI::run(int argc, char* argv[]) {
    CLI::App app{"AMMI - Additive main effects and multiplicative interaction analysis"};

    app.description(R"(
    Quick Start:
        fastmet --ammi --data data_file --env ENV --gen GEN --rep REP --trait GY HM --out ammi_out
    )");

    CommonCliOptions common;
    TrialCliOptions trial;
    AmmiOptions options;
    std::vector<int> naxis_vec;

    bool ammi = false;
    app.add_flag("--ammi", ammi, "AMMI analysis");
    add_common_options(app, common);
    add_trial_options(app, trial);

    app.add_option("--naxis", naxis_vec,
        "Number of interaction axes for the predicted means, one value per trait.\n"
        "  - Without it only the AMMI analysis is reported.")
        ->expected(-1);

    app.add_flag("--no-impute", [&options](int count) {
        if (count > 0) options.impute_missing = false;
    }, "Disable the imputation of missing genotype x environment cells.\n"
       "  - Imputation is ENABLED by default.\n"
       "  - With --no-impute an unbalanced trait causes an error.");

    app.add_option("--impute-algorithm", options.impute.algorithm,
        "Imputation algorithm: EM-SVD (default), EM-AMMI or colmeans.")
        ->default_val("EM-SVD");

    app.add_option("--impute-naxis", options.impute.naxis,
        "Number of axes used by the imputation (default: 1).")
        ->default_val(1);

    // Parse command-line arguments
    CLI11_PARSE(app, argc, argv);

    set_log_level(common.quiet);
    options.verbose = !common.quiet;
    log_common_options(common);
    spdlog::info("Design: {}", trial.columns.has_block() ? "alpha-lattice" : "randomized complete block");
    spdlog::info("Imputation of missing GE cells: {}", options.impute_missing ? "ENABLED (" + options.impute.algorithm + ")" : "DISABLED");
    spdlog::info("========================");

    METData data;
    data.read(common.data_file, common.missing_in_data_vec);
    vector<AmmiResult> result_vec = performs_ammi(data, trial.columns, trial.trait_vec, options);
    vector<AmmiPrediction> pred_vec;
    if(!naxis_vec.empty()){
        pred_vec = predict_ammi(result_vec, naxis_vec);
    }

    write_report(common, [&](std::ostream& os){
        print_ammi(os, result_vec, common.digits);
        if(!pred_vec.empty()) print_ammi_prediction(os, pred_vec, common.digits);
    });
    return 0;
}
