#pragma once
#include <condition_variable>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <respkv/time/ttl.hpp>

namespace respkv {

	// Value plus optional absolute deadline.
	struct StoredEntry {
		std::string data;
		std::optional<ttl::TimePt> expires_at;
	};

	// Key-value map with a time-ordered expiration index and a background
	// reaper thread. Share one instance between connections through
	// std::shared_ptr; the reaper is stopped and joined on destruction.
	class Store {
	public:
		Store();
		~Store();
		Store(const Store&) = delete;
		Store& operator=(const Store&) = delete;
		Store(Store&&) = delete;
		Store& operator=(Store&&) = delete;

		// Insert or overwrite. A ttl makes the entry expire at now + ttl.
		void set(const std::string& key, std::string value, std::optional<ttl::Ms> ttl = std::nullopt);

		// Value if present and not past its deadline. Never mutates: expired
		// entries are left for the reaper.
		std::optional<std::string> get(const std::string& key) const;

		// Remove key and its index entry; false if absent.
		bool del(const std::string& key);

		// Stored entries, counting expired ones the reaper has not reclaimed yet
		std::size_t size() const;
		std::optional<ttl::TimePt> deadline(const std::string& key) const;
		std::vector<ttl::Entry> expirations() const;

	private:
		void reap_loop();
		// Evict everything due at `now`; returns the next deadline, if any.
		std::optional<ttl::TimePt> purge_expired_unlocked(ttl::TimePt now, std::size_t& evicted);

		mutable std::shared_mutex mu_;
		std::condition_variable_any wake_;
		std::unordered_map<std::string, StoredEntry> map_;
		ttl::Index ttl_;
		bool shutdown_ = false;
		std::thread reaper_;
	};

} // namespace respkv
