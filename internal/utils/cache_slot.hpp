#ifndef UTILS_CACHE_SLOT_HPP
#define UTILS_CACHE_SLOT_HPP

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

/*
 * Holds at most one collection for the lifetime of its owner. Once set it is only ever
 * replaced by a later Set (concurrent first fetches race; last writer wins).
 */
template <typename T>
class CacheSlot {
public:
    [[nodiscard]] std::optional<std::vector<T>> Get() const {
        std::shared_lock lk(_mutex);
        return _value;
    }
    [[nodiscard]] bool IsPopulated() const {
        std::shared_lock lk(_mutex);
        return _value.has_value();
    }
    void Set(std::vector<T> value) {
        std::unique_lock lk(_mutex);
        _value = std::move(value);
    }
private:
    mutable std::shared_mutex _mutex;
    std::optional<std::vector<T>> _value = std::nullopt;
};

#endif //UTILS_CACHE_SLOT_HPP
