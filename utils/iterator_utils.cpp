/*
 * @Description:
 * @Author: Chao Ning
 * @Date: 2025-01-30 14:13:33
 * @LastEditTime: 2025-04-15 18:20:11
 * @LastEditors: Chao Ning
 */
#include <map>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <spdlog/spdlog.h>

#include "iterator_utils.hpp"

using std::vector;
using std::string;


bool is_duplicated(const vector<string>& vec, string& first_duplicated){
    std::unordered_set<string> seen;
    for(const auto& tmp:vec){
        if(!seen.insert(tmp).second){
            first_duplicated = tmp;
            return true;
        }
    }
    return false;
}


vector<string> vector_unique(const vector<string>& vec){
    std::set<string> level_set(vec.begin(), vec.end());
    return vector<string>(level_set.begin(), level_set.end());
}


vector<long long> find_index(const vector<string>& strDestination, const vector<string>& strSource, vector<string>& strNoFound){
    std::map<string, long long> strDestination_map;
    long long i = 0;
    for(const auto& tmp:strDestination){
        strDestination_map[tmp] = i++;
    }

    vector<long long> index_vec;
    for(const auto& tmp:strSource){
        auto it = strDestination_map.find(tmp);
        if(it == strDestination_map.end()){
            strNoFound.push_back(tmp);
        }else{
            index_vec.push_back(it->second);
        }
    }
    return index_vec;
}


vector<string> expand_variable_ranges(const vector<string>& input_vars, const vector<string>& all_vars) {
    vector<string> expanded_vars;
    std::unordered_set<string> seen_vars;
    auto add_var = [&](const string& var){
        if(!seen_vars.insert(var).second){
            spdlog::error("Duplicate variable detected: {}", var);
            throw std::invalid_argument("Duplicate variable: " + var);
        }
        expanded_vars.push_back(var);
    };

    for(const auto& var:input_vars){
        size_t colon_pos = var.find(':');
        if(colon_pos == string::npos){
            if(std::find(all_vars.begin(), all_vars.end(), var) == all_vars.end()){
                spdlog::error("Invalid variable: {}", var);
                throw std::invalid_argument("Invalid variable: " + var);
            }
            add_var(var);
            continue;
        }

        // range, e.g., GY:NKE
        auto start_it = std::find(all_vars.begin(), all_vars.end(), var.substr(0, colon_pos));
        auto end_it = std::find(all_vars.begin(), all_vars.end(), var.substr(colon_pos + 1));
        if(start_it == all_vars.end() || end_it == all_vars.end() || start_it > end_it){
            spdlog::error("Invalid range: {}", var);
            throw std::invalid_argument("Invalid range: " + var);
        }
        for(auto it = start_it; it <= end_it; ++it){
            add_var(*it);
        }
    }
    return expanded_vars;
}
