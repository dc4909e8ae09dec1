#ifndef IMOVERLAY_TIMING_HPP
#define IMOVERLAY_TIMING_HPP
#include <chrono>

using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

#endif //IMOVERLAY_TIMING_HPP
