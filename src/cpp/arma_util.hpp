#ifndef __ARMA_UTIL_HPP__
#define __ARMA_UTIL_HPP__

#include "common.hpp"
#include "convection.hpp"

namespace arma_util {

// Columns of the matrix built by results_to_mat
std::vector<std::string> const & result_columns();

arma::rowvec result_to_row(regime_result const & result);

arma::mat results_to_mat(std::vector<regime_result> const & results);

// Saves mat as CSV with a header line; ".csv" is appended to path
void save_mat(arma::mat const & mat,
              std::vector<std::string> const & columns,
              boost::filesystem::path const & path);

}

#endif // __ARMA_UTIL_HPP__
