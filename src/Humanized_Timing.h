//Humanized_Timing.h - Randomized click cadence.

#pragma once

#include <chrono>
#include <cstdint>
#include <random>


// Half-width of the uniform jitter band (in ms) applied around 1000/cps.
//
//   cps <= 10       : +-10 ms
//   10 < cps <= 20  : +-5 ms
//   cps > 20        : +-3 ms
double humanized_jitter_ms(double cps);

// Delay following a single action in humanized mode. Uniform within 1000/cps +- jitter, never less than 1 ms, and
// truncated to whole milliseconds. cps must be positive.
std::chrono::milliseconds humanized_delay(double cps, std::mt19937 &re);


// A burst of closely spaced actions followed by a longer pause. Used above burst_threshold_cps to approximate
// drag-clicking.
struct burst_plan_t {
    int64_t count = 0;
    std::chrono::microseconds spacing{0}; // Between consecutive actions within the burst.
    std::chrono::milliseconds pause{0};   // After the burst.
};

// floor(cps * 0.5), the centre of the burst size range.
int64_t nominal_burst_size(double cps);

// count is uniform in [max(0, nominal - 5), nominal + 5], spacing in [500, 1500] us, pause in [450, 550] ms.
burst_plan_t plan_burst(double cps, std::mt19937 &re);

