// src/detect/distance_filter.cpp

#include "detector.hpp"
#include <algorithm>
#include <vector>

DistanceFilter::DistanceFilter(const FilterConfig& cfg) : cfg_(cfg) {
    if (cfg_.window < 1) throw ConfigError("smoothing_window must be >= 1");
}

std::optional<uint32_t> DistanceFilter::push(const DistanceSample& sample) {
    window_.push_back(sample);
    while (window_.size() > cfg_.window) window_.pop_front();

    // 오래 끊겼다 들어온 경우 이전 값은 버린다
    if (cfg_.max_sample_age.count() > 0) {
        while (!window_.empty() &&
               sample.timestamp - window_.front().timestamp > cfg_.max_sample_age)
            window_.pop_front();
    }

    current_ = compute();
    return current_;
}

std::size_t DistanceFilter::valid_count() const {
    return static_cast<std::size_t>(std::count_if(window_.begin(), window_.end(),
        [](const DistanceSample& s) { return s.valid(); }));
}

std::optional<uint32_t> DistanceFilter::compute() const {
    std::vector<uint32_t> vals;
    vals.reserve(window_.size());
    for (const auto& s : window_)
        if (s.valid()) vals.push_back(*s.distance_mm);

    if (vals.empty()) return std::nullopt;

    if (cfg_.method == SmoothingMethod::Median) {
        std::sort(vals.begin(), vals.end());
        std::size_t mid = vals.size() / 2;
        if (vals.size() % 2 == 1) return vals[mid];
        return static_cast<uint32_t>((uint64_t(vals[mid - 1]) + vals[mid]) / 2);
    }

    uint64_t sum = 0;
    for (uint32_t v : vals) sum += v;
    return static_cast<uint32_t>(sum / vals.size());
}
