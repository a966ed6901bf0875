/*
 * @Descripttion:
 * @version:
 * @Author: Chao Ning
 * @Date: 2022-12-02 18:24:20
 * @LastEditors: Chao Ning
 * @LastEditTime: 2025-04-12 16:20:33
 */

#include <Eigen/Core>
#include <Eigen/Eigen>
#include <Eigen/Dense>
#include <vector>
#include <algorithm>
#include <cmath>

#include "someCommonFun.hpp"


using Eigen::VectorXd;


VectorXd rank_average(const VectorXd& Vec){
    std::vector<long long> order_vec;
    for(long long i = 0; i < Vec.size(); i++){
        if(!std::isnan(Vec(i))) order_vec.push_back(i);
    }
    std::stable_sort(order_vec.begin(), order_vec.end(), [&Vec](long long a, long long b){
        return Vec(a) < Vec(b);
    });

    VectorXd rank_Vec = VectorXd::Constant(Vec.size(), std::nan(""));
    long long n = order_vec.size();
    long long i = 0;
    while(i < n){
        long long j = i;
        while(j + 1 < n && Vec(order_vec[j + 1]) == Vec(order_vec[i])) j++;
        double avg = (i + j) / 2.0 + 1;  // 1-based
        for(long long k = i; k <= j; k++){
            rank_Vec(order_vec[k]) = avg;
        }
        i = j + 1;
    }
    return rank_Vec;
}


double round_half_even(double val){
    double fl = std::floor(val);
    double diff = val - fl;
    if(diff > 0.5) return fl + 1;
    if(diff < 0.5) return fl;
    return std::fmod(fl, 2.0) == 0 ? fl : fl + 1;
}
