#pragma once

#include "types.hpp"
#include <cstdint>
#include <vector>

// Rolls finer bars up into fixed buckets (e.g. 1h -> 4h) aligned on local
// exchange time
class BarSynthesizer {
public:
    BarSynthesizer(int interval_seconds, int64_t gmtoffset = 0);

    Series aggregate(const Series& bars) const;
    int64_t bucket_start(int64_t timestamp) const;

private:
    int interval_seconds_;
    int64_t gmtoffset_;

    Bar synthesize_bar(const std::vector<Bar>& bucket) const;
};
