#include <respkv/time/ttl.hpp>

#include <set>
#include <utility>

namespace respkv::ttl {

    struct Index::Impl {
        std::set<Entry> entries;    // ordered by (deadline, key)
    };

    Index::Index() : impl_(new Impl) {}
    Index::~Index() { delete impl_; }
    Index::Index(Index&& o) noexcept : impl_(std::exchange(o.impl_, nullptr)) {}
    Index& Index::operator=(Index&& o) noexcept {
        if (this != &o) { delete impl_; impl_ = std::exchange(o.impl_, nullptr); }
        return *this;
    }

    bool Index::insert(TimePt when, const std::string& key) {
        return impl_->entries.emplace(when, key).second;
    }

    bool Index::erase(TimePt when, const std::string& key) {
        return impl_->entries.erase(Entry{ when, key }) > 0;
    }

    std::optional<TimePt> Index::next_due() const {
        const auto& E = impl_->entries;
        if (E.empty()) return std::nullopt;
        return E.begin()->first;
    }

    bool Index::contains(TimePt when, const std::string& key) const {
        return impl_->entries.count(Entry{ when, key }) > 0;
    }

    std::size_t Index::size() const { return impl_->entries.size(); }

    std::vector<Entry> Index::snapshot() const {
        return std::vector<Entry>(impl_->entries.begin(), impl_->entries.end());
    }

    bool Index::pop_due(TimePt at, std::string& out_key) {
        auto& E = impl_->entries;
        if (E.empty()) return false;
        auto it = E.begin();
        if (it->first > at) return false;   // earliest is still in the future
        out_key = it->second;
        E.erase(it);
        return true;
    }

} // namespace respkv::ttl
