#pragma once

// Shared fixtures for the fastmet unit tests: small multi-environment trials built in memory.

#include <cmath>
#include <string>
#include <vector>
#include <Eigen/Dense>

#include "utils/met_data.hpp"
#include "utils/string_utils.hpp"

namespace test_helpers {

inline std::string num(double value) {
    return double_to_string_sig(value, 15);
}

// Yield of genotype g (0-based) in environment e at replicate r, with a non-additive part.
inline double trial_yield(int g, int e, int r) {
    return 10.0 + 1.5 * g + 2.0 * e + 0.4 * ((g * 7 + e * 3) % 5) + (r == 0 ? 0.1 : -0.1) * (g + 1);
}

inline double trial_height(int g, int e, int r) {
    return 50.0 + ((g * 5 + e * 11) % 7) + 0.3 * r + 0.2 * g * e;
}

// ENV GEN REP GY HM: num_env environments x num_gen genotypes x num_rep replicates, ENV-major.
inline METData make_trial_data(int num_gen = 4, int num_env = 3, int num_rep = 2) {
    std::vector<std::string> env, gen, rep, gy, hm;
    for (int e = 0; e < num_env; ++e) {
        for (int r = 0; r < num_rep; ++r) {
            for (int g = 0; g < num_gen; ++g) {
                env.push_back("E" + std::to_string(e + 1));
                gen.push_back("G" + std::to_string(g + 1));
                rep.push_back(std::to_string(r + 1));
                gy.push_back(num(trial_yield(g, e, r)));
                hm.push_back(num(trial_height(g, e, r)));
            }
        }
    }
    METData data;
    data.from_columns({"ENV", "GEN", "REP", "GY", "HM"}, {env, gen, rep, gy, hm});
    return data;
}

inline TrialColumns trial_columns() {
    TrialColumns columns;
    columns.env = "ENV";
    columns.gen = "GEN";
    columns.rep = "REP";
    return columns;
}

inline TrialTrait make_trial(const std::string& trait = "GY", int num_gen = 4, int num_env = 3, int num_rep = 2) {
    return build_trial_trait(make_trial_data(num_gen, num_env, num_rep), trial_columns(), trait);
}

// Alpha-lattice of 4 genotypes in 3 environments: 2 replicates of 2 incomplete blocks,
// {G1 G2} {G3 G4} in replicate 1 and {G1 G3} {G2 G4} in replicate 2. Block 1 of replicate 1
// adds 2; the +-1 pattern is orthogonal to genotypes, replicates and blocks, so every
// environment carries block SS 2 (2 df) and residual SS 8 (1 df).
inline double lattice_yield(int g, int e, int r) {
    static const int pattern[2][4] = {{1, -1, -1, 1}, {-1, 1, 1, -1}};
    double block_effect = (r == 0 && g < 2) ? 2.0 : 0.0;
    return 10.0 + 2.0 * g + 5.0 * e + 0.3 * ((g * 7 + e * 3) % 5) + block_effect + pattern[r][g];
}

inline METData make_lattice_data() {
    static const char* block_label[2][4] = {{"1", "1", "2", "2"}, {"1", "2", "1", "2"}};
    std::vector<std::string> env, gen, rep, block, gy;
    for (int e = 0; e < 3; ++e) {
        for (int r = 0; r < 2; ++r) {
            for (int g = 0; g < 4; ++g) {
                env.push_back("E" + std::to_string(e + 1));
                gen.push_back("G" + std::to_string(g + 1));
                rep.push_back(std::to_string(r + 1));
                block.push_back(block_label[r][g]);
                gy.push_back(num(lattice_yield(g, e, r)));
            }
        }
    }
    METData data;
    data.from_columns({"ENV", "GEN", "REP", "BLOCK", "GY"}, {env, gen, rep, block, gy});
    return data;
}

inline TrialTrait make_lattice_trial() {
    TrialColumns columns = trial_columns();
    columns.block = "BLOCK";
    return build_trial_trait(make_lattice_data(), columns, "GY");
}

// Build a data table from numeric columns.
inline METData make_numeric_data(const std::vector<std::string>& head_vec, const Eigen::MatrixXd& values) {
    std::vector<std::vector<std::string>> column_vec(values.cols());
    for (long long j = 0; j < values.cols(); ++j) {
        for (long long i = 0; i < values.rows(); ++i) {
            column_vec[j].push_back(num(values(i, j)));
        }
    }
    METData data;
    data.from_columns(head_vec, column_vec);
    return data;
}

// Deterministic pseudo-random values in [-1, 1).
inline Eigen::MatrixXd pseudo_random(long long rows, long long cols, unsigned seed = 17) {
    Eigen::MatrixXd mat(rows, cols);
    unsigned state = seed;
    for (long long j = 0; j < cols; ++j) {
        for (long long i = 0; i < rows; ++i) {
            state = state * 1103515245u + 12345u;
            mat(i, j) = ((state >> 8) % 20000) / 10000.0 - 1.0;
        }
    }
    return mat;
}

}  // namespace test_helpers
