#include "bar_synth.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

BarSynthesizer::BarSynthesizer(int interval_seconds, int64_t gmtoffset)
    : interval_seconds_(interval_seconds)
    , gmtoffset_(gmtoffset)
{
    if (interval_seconds_ <= 0) {
        throw std::invalid_argument("Bar interval must be positive");
    }
}

int64_t BarSynthesizer::bucket_start(int64_t timestamp) const {
    int64_t local = timestamp + gmtoffset_;
    int64_t start = local - (((local % interval_seconds_) + interval_seconds_) % interval_seconds_);
    return start - gmtoffset_;
}

Series BarSynthesizer::aggregate(const Series& bars) const {
    Series out;
    if (bars.empty()) return out;

    int64_t current = bucket_start(bars.front().timestamp);
    std::vector<Bar> bucket;

    for (const auto& bar : bars) {
        int64_t start = bucket_start(bar.timestamp);

        if (start != current) {
            if (!bucket.empty()) {
                out.push_back(synthesize_bar(bucket));
            }
            current = start;
            bucket.clear();
        }

        bucket.push_back(bar);
    }

    if (!bucket.empty()) {
        out.push_back(synthesize_bar(bucket));
    }

    spdlog::debug("Synthesized {} bars of {}s from {} input bars",
                  out.size(), interval_seconds_, bars.size());
    return out;
}

Bar BarSynthesizer::synthesize_bar(const std::vector<Bar>& bucket) const {
    Bar bar;
    bar.timestamp = bucket.front().timestamp;
    bar.open = bucket.front().open;
    bar.close = bucket.back().close;
    bar.high = bucket.front().high;
    bar.low = bucket.front().low;
    bar.volume = 0.0;

    for (const auto& b : bucket) {
        bar.high = std::max(bar.high, b.high);
        bar.low = std::min(bar.low, b.low);
        bar.volume += b.volume;
    }

    return bar;
}
