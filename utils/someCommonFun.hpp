#pragma once


#include<Eigen/Dense>


/**
 * @brief ranks in increasing order, ties get the average rank; NaN values get rank NaN
 */
Eigen::VectorXd rank_average(const Eigen::VectorXd& Vec);

// round to nearest, halves to even
double round_half_even(double val);
