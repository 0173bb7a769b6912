#ifndef __ERRORS_HPP__
#define __ERRORS_HPP__

#include <stdexcept>
#include <string>

// Raised for phases that the convection model does not handle (liquid
// water, unknown names). Nothing has been computed when this is thrown.
struct unsupported_phase_error: public std::invalid_argument {
  explicit unsupported_phase_error(std::string const & what):
    std::invalid_argument {what} {}
};

// A physical precondition failed part way through an evaluation
// (negative radicand, nonpositive temperatures, non-finite intermediates).
struct physical_domain_error: public std::domain_error {
  explicit physical_domain_error(std::string const & what):
    std::domain_error {what} {}
};

// (P, T) outside the validity range of a material correlation.
struct property_range_error: public std::out_of_range {
  explicit property_range_error(std::string const & what):
    std::out_of_range {what} {}
};

#endif // __ERRORS_HPP__
