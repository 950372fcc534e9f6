#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace respkv::ttl {

    // ---- clocks & common types -------------------------------------------------

    using Clock = std::chrono::steady_clock;    // monotonic
    using TimePt = Clock::time_point;
    using Ms = std::chrono::milliseconds;

    inline TimePt now() { return Clock::now(); }

    // Longest ttl that still fits in a TimePt counted from `base`.
    inline Ms max_ttl(TimePt base = now()) {
        return std::chrono::duration_cast<Ms>(TimePt::max() - base);
    }

    // Saturates at TimePt::max() instead of overflowing the clock's rep.
    inline TimePt from_now(Ms ttl, TimePt base = now()) {
        if (ttl > max_ttl(base)) return TimePt::max();
        return base + ttl;
    }

    inline bool is_expired(std::optional<TimePt> when, TimePt t = now()) {
        return when && t >= *when;
    }

    // ---- Expiration index ------------------------------------------------------
    //
    // Ordered set of (deadline, key), earliest first; equal deadlines are
    // ordered by key. Not synchronized: the owning Store mutates it under the
    // same lock as its key map.

    using Entry = std::pair<TimePt, std::string>;

    class Index {
    public:
        Index();
        ~Index();
        Index(const Index&) = delete;
        Index& operator=(const Index&) = delete;
        Index(Index&&) noexcept;
        Index& operator=(Index&&) noexcept;

        // returns false if the pair was already present
        bool insert(TimePt when, const std::string& key);

        // returns false if the pair was not present
        bool erase(TimePt when, const std::string& key);

        // Remove every entry due at `at` (deadline <= at), earliest first, and
        // call on_expire(key) for each.
        template <class Fn>
        void sweep_due(TimePt at, Fn&& on_expire) {
            std::string key;
            while (pop_due(at, key)) on_expire(key);
        }

        // Earliest deadline, or std::nullopt if nothing is tracked
        std::optional<TimePt> next_due() const;

        bool contains(TimePt when, const std::string& key) const;
        std::size_t size() const;
        bool empty() const { return size() == 0; }

        // Copy of all entries in order
        std::vector<Entry> snapshot() const;

    private:
        struct Impl;
        Impl* impl_{ nullptr };

        // Pop the earliest entry if it is due; false when nothing is due.
        bool pop_due(TimePt at, std::string& out_key);
    };

} // namespace respkv::ttl
