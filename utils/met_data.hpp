/*
 * @Description: Long-format trial table: reading, column lookup, factor coding and GE means
 * @Author: Chao Ning
 * @Date: 2025-01-31 15:05:20
 * @LastEditTime: 2025-04-14 09:12:40
 * @LastEditors: Chao Ning
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <Eigen/Core>
#include <Eigen/Eigen>

using std::string;
using std::vector;
using Eigen::MatrixXd;
using Eigen::VectorXd;


vector<string> default_missing_tokens();


class METData{
    public:
        METData();
        void read(const string& data_file, const vector<string>& missing_in_data_vec = default_missing_tokens());
        void from_columns(const vector<string>& head_vec, const vector<vector<string>>& column_vec,
                          const vector<string>& missing_in_data_vec = default_missing_tokens());

        long long find_column(const string& name) const;
        vector<long long> find_columns(const vector<string>& name_vec) const;
        vector<long long> index_keep_deleteNA(const vector<long long>& col_used_vec) const;
        bool is_missing(const string& val) const;

        void get_given_column(long long columnNo, vector<string>& vec) const;
        void get_given_column(long long columnNo, VectorXd& Vec) const;
        void get_given_columns_double(const vector<long long>& column_vec, const vector<long long>& row_vec, MatrixXd& Mat) const;

        const vector<string>& get_head() const;
        const vector<long long>& get_record_number() const;
        long long get_num_records() const;

    private:
        void read_full(const string& data_file, vector<vector<string>>& data_vec);

        vector<string> m_head_column_vec;
        vector<vector<string> > m_data_vec;
        vector<long long> m_record_vec; // line number in the file (1-based, header excluded)
        vector<string> m_missing_in_data_vec;
};


/**
 * @brief Names of the design columns. An empty block selects the randomized complete block design,
 *        a block column the resolvable incomplete block (alpha-lattice) design.
 */
struct TrialColumns{
    string env;
    string gen;
    string rep;
    string block;
    bool has_block() const { return !block.empty(); }
};


struct FactorColumn{
    vector<string> levels;     // sorted
    vector<long long> index;   // level index of each record
    long long num_levels() const { return levels.size(); }
    const string& label(long long i) const { return levels[index[i]]; }
};

FactorColumn make_factor(const vector<string>& vec);

FactorColumn make_factor(const vector<string>& vec, const vector<string>& levels);


struct TrialTrait{
    string trait;
    bool has_block = false;
    FactorColumn env;
    FactorColumn gen;
    FactorColumn rep;
    FactorColumn block;
    VectorXd y;
    vector<long long> record_vec;
    long long num_records() const { return y.size(); }
};


/**
 * @brief Select the factors and the response of one trait.
 *
 * Rows with missing values in any selected column are removed with a warning, non-numeric
 * responses and duplicated Environment x Genotype x Replicate[x Block] keys raise std::runtime_error.
 * Without a replicate column every record gets replicate "1" and keys are not checked.
 *
 * @param data trial table
 * @param columns design columns
 * @param trait response column
 * @return TrialTrait
 */
TrialTrait build_trial_trait(const METData& data, const TrialColumns& columns, const string& trait);


/**
 * @brief Validate the design columns and expand trait ranges (e.g., GY:NKE) against the header
 */
vector<string> select_traits(const METData& data, const TrialColumns& columns, const vector<string>& trait_vec,
                             bool require_rep = true);


/**
 * @brief genotype x environment table of cell means, NaN for absent cells
 */
MatrixXd ge_means(const TrialTrait& trial);

VectorXd mean_by_level(const FactorColumn& factor, const VectorXd& y);

long long num_missing_cells(const MatrixXd& mat);


/**
 * @brief numeric columns of the table with optional string key columns aligned with the rows
 */
struct NumericTable{
    vector<string> var_names;
    MatrixXd values;
    vector<vector<string>> keys;   // one vector per key column
    vector<string> row_labels;     // empty unless the rows were averaged by a key
};

/**
 * @brief Select numeric columns and key columns. Rows with a missing value in any selected column are removed
 * with a warning; a non-numeric value is an error.
 *
 * @param data
 * @param var_vec variable names, 'A:C' ranges allowed
 * @param key_col_vec key (factor) columns
 * @return NumericTable
 */
NumericTable select_numeric(const METData& data, const vector<string>& var_vec, const vector<string>& key_col_vec = vector<string>());

NumericTable subset_rows(const NumericTable& table, const vector<long long>& row_vec);

// rows averaged by the levels (sorted) of key column ikey; the levels become the row labels
NumericTable average_by(const NumericTable& table, long long ikey);

// one sub-table per level (sorted) of key column ikey
vector<NumericTable> split_by(const NumericTable& table, long long ikey, vector<string>& level_vec);


// Called once per trait as (ith, total, trait); ith is 1-based
typedef std::function<void(long long, long long, const string&)> ProgressCallback;

void log_progress(long long ith, long long total, const string& trait);
