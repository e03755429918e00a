#pragma once

#include "config.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace pharmiq {

struct ForecastCacheKey {
    std::string item_id;
    std::uint64_t series_hash;
    std::uint64_t params_hash;
    std::size_t horizon;

    struct Hash {
        std::size_t operator()(const ForecastCacheKey& key) const noexcept {
            return std::hash<std::string>{}(key.item_id) ^ (key.series_hash << 1) ^ (key.params_hash << 2) ^
                   (key.horizon << 3);
        }
    };
};

inline bool operator==(const ForecastCacheKey& a, const ForecastCacheKey& b) {
    return a.item_id == b.item_id && a.series_hash == b.series_hash && a.params_hash == b.params_hash &&
           a.horizon == b.horizon;
}

std::uint64_t hash_series(const TimeSeries& series);
ForecastCacheKey make_cache_key(const std::string& item_id, const TimeSeries& series, std::size_t horizon,
                                const EngineConfig& config);

// Fitted forecasts kept by the caller between runs. A changed series or changed model
// parameters produce a different key, so stale entries are never returned. Not synchronized.
class ForecastCache {
public:
    std::optional<ForecastResult> find(const ForecastCacheKey& key);
    void store(const ForecastCacheKey& key, const ForecastResult& result);
    void invalidate(const std::string& item_id);
    void clear() { entries_.clear(); }

    std::size_t size() const { return entries_.size(); }
    std::size_t hits() const { return hits_; }
    std::size_t misses() const { return misses_; }

private:
    std::unordered_map<ForecastCacheKey, ForecastResult, ForecastCacheKey::Hash> entries_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

}
