#include "forecast_cache.hpp"

#include <cstring>
#include <plog/Log.h>

namespace pharmiq {
namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

void mix(std::uint64_t& hash, const void* data, std::size_t size) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= bytes[i];
        hash *= kFnvPrime;
    }
}

}

std::uint64_t hash_series(const TimeSeries& series) {
    std::uint64_t hash = kFnvOffset;
    const int granularity = static_cast<int>(series.granularity);
    mix(hash, &granularity, sizeof(granularity));
    for (const auto& point : series.points) {
        std::uint64_t bits = 0;
        std::memcpy(&bits, &point.quantity, sizeof(bits));
        mix(hash, &point.period, sizeof(point.period));
        mix(hash, &bits, sizeof(bits));
    }
    return hash;
}

ForecastCacheKey make_cache_key(const std::string& item_id, const TimeSeries& series, std::size_t horizon,
                                const EngineConfig& config) {
    return {item_id, hash_series(series), config.forecast_fingerprint(), horizon};
}

std::optional<ForecastResult> ForecastCache::find(const ForecastCacheKey& key) {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second;
}

void ForecastCache::store(const ForecastCacheKey& key, const ForecastResult& result) {
    entries_[key] = result;
}

void ForecastCache::invalidate(const std::string& item_id) {
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.item_id == item_id) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    PLOGD << "Invalidated " << removed << " cached forecast(s) for '" << item_id << "'";
}

}
