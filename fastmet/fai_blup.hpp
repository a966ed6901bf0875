/*
 * @Description: Multi-trait genotype-ideotype distance index
 * @Author: Chao Ning
 * @Date: 2025-04-09 09:12:40
 * @LastEditTime: 2025-04-15 11:02:17
 * @LastEditors: Chao Ning
 */
#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <Eigen/Dense>

#include "../utils/met_data.hpp"
#include "../utils/factor_analysis.hpp"

using std::string;
using std::vector;
using Eigen::MatrixXd;
using Eigen::VectorXd;


/**
 * @brief genotype means (rows) of the traits (columns)
 */
struct GenotypeTable{
    vector<string> gen;
    vector<string> traits;
    MatrixXd values;
};

/**
 * @brief Average the rows of each genotype. Rows with missing values are removed with a warning.
 */
GenotypeTable genotype_table(const METData& data, const string& gen_col, const vector<string>& trait_vec);


struct FaiBlupOptions{
    vector<string> DI;        // desirable ideotype per trait: max, min, mean or a number; empty for all max
    vector<string> UI;        // undesirable ideotype; empty for all min
    double SI = 15;           // selection intensity (%)
    bool use_selection = true;
    double mineval = 1.0;
    bool verbose = true;
};


struct SelectionDiffRow{
    string var;
    string factor;
    double xo;
    double xs;
    double sd;
    double sd_perc;
    string sense;
    double goal;
};


struct TotalGainRow{
    string sense;
    double min;
    double mean;
    double max;
    double sum;
};


struct FaiBlupResult{
    vector<string> gen;
    vector<string> traits;                // factor order
    vector<string> trait_factor;          // factor of each trait, factor order
    FactorAnalysis fa;                    // traits in input order
    MatrixXd scores;                      // genotypes x factors
    vector<string> ideotype_names;        // ID1, ID2, ...
    MatrixXd ideotype_design;             // ideotypes x traits (normalized scale, factor order)
    MatrixXd ideotype_scores;             // ideotypes x factors
    MatrixXd distance;                    // genotypes x ideotypes
    MatrixXd probability;                 // genotypes x ideotypes
    vector<vector<long long>> ranking;    // per ideotype, genotype indices by decreasing probability
    long long num_selected = 0;
    vector<vector<SelectionDiffRow>> selection_diff;   // per ideotype
    vector<vector<TotalGainRow>> total_gain;           // per ideotype
    vector<string> sel_gen;
};


/**
 * @brief Factor-analysis ideotype index.
 *
 * @param table genotype means
 * @param options
 * @return FaiBlupResult
 */
FaiBlupResult fai_blup(const GenotypeTable& table, const FaiBlupOptions& options = FaiBlupOptions());

void print_fai_blup(std::ostream& os, const FaiBlupResult& result, int digits = 4);


class FaiBlup{
public:
    FaiBlup();
    ~FaiBlup();
    int run(int argc, char* argv[]);
};
