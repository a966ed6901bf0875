/*
 * @Description: Within-environment analysis of variance
 * @Author: Chao Ning
 * @Date: 2025-04-07 09:15:22
 * @LastEditTime: 2025-04-14 18:02:11
 * @LastEditors: Chao Ning
 */
#pragma once

#include <string>
#include <vector>
#include <ostream>

#include "../utils/met_data.hpp"

using std::string;
using std::vector;


/**
 * @brief one environment. In the alpha-lattice design the replicate columns hold the complete
 *        replicates (DFCR ... PFCR) and the block columns the incomplete blocks within replicates
 *        (DFIB_R ... PFIB_R); in the randomized complete block design the replicates are the blocks
 *        (DFB ... PFB).
 */
struct AnovaIndRow{
    string env;
    double mean;
    double dfg, msg, fcg, pfg;
    double dfr, msr, fcr, pfr;
    double dfib, msib, fcib, pfib;
    double dfe, mse;
    double cv, h2, as;
};


struct AnovaIndResult{
    string trait;
    bool has_block = false;
    vector<AnovaIndRow> individual;
    double msr_ratio = 0;   // largest / smallest residual mean square
};


struct AnovaIndOptions{
    bool verbose = true;
    ProgressCallback progress = log_progress;
};


AnovaIndResult anova_ind(const TrialTrait& trial);

vector<AnovaIndResult> anova_ind(const METData& data, const TrialColumns& columns, const vector<string>& trait_vec,
                                 const AnovaIndOptions& options = AnovaIndOptions());

void print_anova_ind(std::ostream& os, const vector<AnovaIndResult>& result_vec, int digits = 3);


class AnovaInd{
public:
    AnovaInd();
    ~AnovaInd();
    int run(int argc, char* argv[]);
};
