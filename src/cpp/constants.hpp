#ifndef __CONSTANTS_HPP__
#define __CONSTANTS_HPP__

namespace constants {

// TODO: boost units
constexpr double GAS_CONSTANT = 8.314; // J mol^-1 K^-1
constexpr double ZERO_CELSIUS_K = 273.15;

// Fit constants of the rheological sublayer temperature (Deschamps and
// Sotin, 2000)
constexpr double TC_FIT_C1 = 1.43;
constexpr double TC_FIT_C2 = -0.03;

// Boundary layer Rayleigh number scaling, Ra_del = a*Ra^b
constexpr double RA_DEL_PREFACTOR = 0.28;
constexpr double RA_DEL_EXPONENT = 0.21;

}

#endif // __CONSTANTS_HPP__
