#pragma once
#include <any>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>

namespace port_census {

// Keyed memoization of collection results. The lock is never held across a fetch, so
// concurrent misses on one key may both fetch; the last writer wins.
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    TtlCache(std::chrono::milliseconds default_ttl, bool disabled, NowFn now = NowFn())
        : default_ttl_(default_ttl), disabled_(disabled), now_(now ? std::move(now) : NowFn([]{ return Clock::now(); })) {}

    // Returns the cached value for key if younger than ttl (default_ttl when unset),
    // otherwise calls fetch and stores its result. Exceptions from fetch propagate
    // and leave the entry untouched.
    template<typename Fn>
    auto get_or_fresh(const std::string& key, Fn&& fetch, std::optional<std::chrono::milliseconds> ttl = std::nullopt)
        -> std::decay_t<decltype(fetch())> {
        using T = std::decay_t<decltype(fetch())>;
        if(disabled_) return fetch();
        auto limit = ttl.value_or(default_ttl_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if(it != entries_.end() && now_() - it->second.timestamp < limit){
                if(const T* v = std::any_cast<T>(&it->second.data)) return *v;
            }
        }
        T fresh = fetch();
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = Entry{fresh, now_()};
        return fresh;
    }

    void clear(const std::string& key){ std::lock_guard<std::mutex> lock(mutex_); entries_.erase(key); }
    void clear_all(){ std::lock_guard<std::mutex> lock(mutex_); entries_.clear(); }
    bool contains(const std::string& key) const { std::lock_guard<std::mutex> lock(mutex_); return entries_.count(key) > 0; }
    size_t size() const { std::lock_guard<std::mutex> lock(mutex_); return entries_.size(); }
    // Age of every stored entry.
    std::map<std::string, std::chrono::milliseconds> ages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, std::chrono::milliseconds> out;
        auto now = now_();
        for(const auto& kv : entries_) out[kv.first] = std::chrono::duration_cast<std::chrono::milliseconds>(now - kv.second.timestamp);
        return out;
    }
    bool disabled() const { return disabled_; }
    std::chrono::milliseconds default_ttl() const { return default_ttl_; }

private:
    struct Entry { std::any data; Clock::time_point timestamp; };
    std::chrono::milliseconds default_ttl_;
    bool disabled_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

}
