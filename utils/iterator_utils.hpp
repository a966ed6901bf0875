/*
 * @Description: Small helpers on string and index vectors
 * @Author: Chao Ning
 * @Date: 2025-01-30 14:14:47
 * @LastEditTime: 2025-04-15 18:20:11
 * @LastEditors: Chao Ning
 */
#pragma once

#include <set>
#include <vector>
#include <string>
#include <algorithm>
#include <iterator>


template <typename T>
T set_intersection_(T v1, T v2){
    T v_intersection;
    std::set_intersection(v1.begin(), v1.end(),
                          v2.begin(), v2.end(),
                          std::insert_iterator<T>(v_intersection, v_intersection.begin()));
    return v_intersection;
}


// elements of vec at the given positions
template <typename T>
std::vector<T> subset_vec(const std::vector<T>& vec, const std::vector<long long>& index_vec){
    std::vector<T> out;
    out.reserve(index_vec.size());
    for(auto i:index_vec){
        out.push_back(vec.at(i));
    }
    return out;
}


/**
 * @brief check for repeated names
 *
 * @param vec
 * @param first_duplicated set to the first repeated name, if any
 * @return true if a name occurs more than once
 */
bool is_duplicated(const std::vector<std::string>& vec, std::string& first_duplicated);

// sorted unique values
std::vector<std::string> vector_unique(const std::vector<std::string>& vec);


/**
 * @brief Positions of strSource in strDestination.
 *
 * @param strDestination
 * @param strSource
 * @param strNoFound names of strSource absent from strDestination
 * @return std::vector<long long> positions of the names that were found, in the order of strSource
 */
std::vector<long long> find_index(const std::vector<std::string>& strDestination, const std::vector<std::string>& strSource, std::vector<std::string>& strNoFound);


/**
 * @brief Expand variable names and ranges against the header. "GY:NKE" selects every column from GY to NKE.
 * Unknown names, inverted ranges and repeated variables throw std::invalid_argument.
 *
 * @param input_vars names or ranges
 * @param all_vars header
 * @return std::vector<std::string>
 */
std::vector<std::string> expand_variable_ranges(const std::vector<std::string>& input_vars,
                                                const std::vector<std::string>& all_vars);
