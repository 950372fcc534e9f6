#include <respkv/core/store.hpp>
#include <respkv/util/log.hpp>
#include <mutex>

namespace respkv {

    Store::Store() {
        // started last so every member it touches is already constructed
        reaper_ = std::thread([this] { reap_loop(); });
    }

    Store::~Store() {
        {
            std::unique_lock lk(mu_);
            shutdown_ = true;
        }
        wake_.notify_one();
        if (reaper_.joinable()) reaper_.join();
    }

    // KV

    void Store::set(const std::string& key, std::string value, std::optional<ttl::Ms> ttl) {
        std::optional<ttl::TimePt> when;
        if (ttl) when = ttl::from_now(*ttl);

        bool notify = false;
        {
            std::unique_lock lk(mu_);
            auto it = map_.find(key);
            if (it != map_.end()) {
                // drop the overwritten entry's deadline before tracking the new one
                if (it->second.expires_at) ttl_.erase(*it->second.expires_at, key);
                it->second.data = std::move(value);
                it->second.expires_at = when;
            }
            else {
                map_.emplace(key, StoredEntry{ std::move(value), when });
            }

            if (when) {
                auto next = ttl_.next_due();
                notify = !next || *when < *next;
                ttl_.insert(*when, key);
            }
        }
        // signal outside the lock
        if (notify) wake_.notify_one();
    }

    std::optional<std::string> Store::get(const std::string& key) const {
        auto now = ttl::now();
        std::shared_lock lk(mu_);
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;
        if (ttl::is_expired(it->second.expires_at, now)) return std::nullopt;
        return it->second.data;
    }

    bool Store::del(const std::string& key) {
        std::unique_lock lk(mu_);
        auto it = map_.find(key);
        if (it == map_.end()) return false;
        if (it->second.expires_at) ttl_.erase(*it->second.expires_at, key);
        map_.erase(it);
        return true;
    }

    std::size_t Store::size() const {
        std::shared_lock lk(mu_);
        return map_.size();
    }

    std::optional<ttl::TimePt> Store::deadline(const std::string& key) const {
        std::shared_lock lk(mu_);
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;
        return it->second.expires_at;
    }

    std::vector<ttl::Entry> Store::expirations() const {
        std::shared_lock lk(mu_);
        return ttl_.snapshot();
    }

    // Reaper

    std::optional<ttl::TimePt> Store::purge_expired_unlocked(ttl::TimePt now, std::size_t& evicted) {
        ttl_.sweep_due(now, [this, &evicted](const std::string& key) {
            map_.erase(key);
            ++evicted;
            });
        return ttl_.next_due();
    }

    void Store::reap_loop() {
        std::unique_lock lk(mu_);
        while (!shutdown_) {
            std::size_t evicted = 0;
            auto next = purge_expired_unlocked(ttl::now(), evicted);
            if (evicted > 0) {
                lk.unlock();
                log(LogLevel::Debug, "reaper evicted " + std::to_string(evicted) + " expired key(s)");
                lk.lock();
                continue;   // state may have changed while unlocked
            }
            // both waits release mu_ while sleeping
            if (next) wake_.wait_until(lk, *next);
            else wake_.wait(lk);
        }
    }

} // namespace respkv
