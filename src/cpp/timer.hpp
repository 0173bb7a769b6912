#ifndef __TIMER_HPP__
#define __TIMER_HPP__

#include <chrono>

namespace timer {

inline std::chrono::steady_clock::time_point & last_tic() {
  static std::chrono::steady_clock::time_point t;
  return t;
}

}

inline void tic() {
  timer::last_tic() = std::chrono::steady_clock::now();
}

// Seconds elapsed since the last call to tic()
inline double toc() {
  std::chrono::duration<double> dt =
    std::chrono::steady_clock::now() - timer::last_tic();
  return dt.count();
}

#endif // __TIMER_HPP__
