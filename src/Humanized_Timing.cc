//Humanized_Timing.cc - A part of ClickAutomaton 2026.

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>

#include "Click_Settings.h"
#include "Humanized_Timing.h"


double humanized_jitter_ms(double cps){
    if(20.0 < cps) return 3.0;
    if(10.0 < cps) return 5.0;
    return 10.0;
}

std::chrono::milliseconds humanized_delay(double cps, std::mt19937 &re){
    if( !std::isfinite(cps)
    ||  (cps < min_cps)
    ||  (max_cps < cps) ){
        throw std::invalid_argument("Click rate is outside the supported range");
    }
    const double base = 1000.0 / cps;
    const double jitter = humanized_jitter_ms(cps);

    std::uniform_real_distribution<double> rd(-jitter, jitter);
    const double delay = std::max(1.0, base + rd(re));
    return std::chrono::milliseconds( static_cast<int64_t>(delay) );
}

int64_t nominal_burst_size(double cps){
    if( !std::isfinite(cps)
    ||  (cps < min_cps)
    ||  (max_cps < cps) ){
        throw std::invalid_argument("Click rate is outside the supported range");
    }
    return static_cast<int64_t>( std::floor(cps * 0.5) );
}

burst_plan_t plan_burst(double cps, std::mt19937 &re){
    const auto nominal = nominal_burst_size(cps);

    std::uniform_int_distribution<int64_t> rd_count( std::max<int64_t>(0, nominal - 5), nominal + 5 );
    std::uniform_int_distribution<int64_t> rd_spacing(500, 1500);
    std::uniform_int_distribution<int64_t> rd_pause(450, 550);

    burst_plan_t p;
    p.count = rd_count(re);
    p.spacing = std::chrono::microseconds( rd_spacing(re) );
    p.pause = std::chrono::milliseconds( rd_pause(re) );
    return p;
}

