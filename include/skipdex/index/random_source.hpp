#pragma once

#include <cstdint>
#include <random>

namespace skipdex {

// Default source of level promotion draws: uniform doubles in [0, 1).
// OrderedIndex accepts any callable with signature double() in its place.
class UniformRandomSource {
public:
    explicit UniformRandomSource(uint32_t seed) : engine_(seed), dist_(0.0, 1.0) {}
    
    double operator()() { return dist_(engine_); }
    
private:
    std::mt19937 engine_;
    std::uniform_real_distribution<double> dist_;
};

} // namespace skipdex
