#include "arma_util.hpp"

std::vector<std::string> const &
arma_util::result_columns()
{
  static std::vector<std::string> const columns = {
    "heat_flux",
    "upper_tbl",
    "lower_tbl",
    "core_temperature",
    "viscosity",
    "density",
    "thermal_expansion",
    "specific_heat",
    "thermal_conductivity",
    "rayleigh",
    "critical_rayleigh",
    "regime"
  };
  return columns;
}

arma::rowvec
arma_util::result_to_row(regime_result const & result)
{
  return arma::rowvec {
    result.heat_flux,
    result.upper_tbl,
    result.lower_tbl,
    result.core_temperature,
    result.viscosity,
    result.props.density,
    result.props.thermal_expansion,
    result.props.specific_heat,
    result.props.thermal_conductivity,
    result.rayleigh,
    result.critical_rayleigh,
    static_cast<double>(result.regime)
  };
}

arma::mat
arma_util::results_to_mat(std::vector<regime_result> const & results)
{
  arma::mat mat(results.size(), result_columns().size());
  for (arma::uword i = 0; i < results.size(); ++i) {
    mat.row(i) = result_to_row(results[i]);
  }
  return mat;
}

void
arma_util::save_mat(arma::mat const & mat,
                    std::vector<std::string> const & columns,
                    boost::filesystem::path const & path)
{
  arma::field<std::string> header(columns.size());
  for (arma::uword j = 0; j < columns.size(); ++j) {
    header(j) = columns[j];
  }
  if (!mat.save(arma::csv_name(path.string() + ".csv", header))) {
    throw std::runtime_error {"failed to save " + path.string() + ".csv"};
  }
}
