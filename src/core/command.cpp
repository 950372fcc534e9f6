#include <respkv/core/command.hpp>
#include <respkv/error.hpp>
#include <limits>

namespace respkv {

    // GET

    Get Get::parse_args(Parse& p) {
        return Get{ p.next_string() };
    }

    Frame Get::apply(Store& store) const {
        auto v = store.get(key);
        if (!v) return Frame::null();
        return Frame::bulk(std::move(*v));
    }

    // SET

    Set Set::parse_args(Parse& p) {
        Set s;
        s.key = p.next_string();
        s.value = p.next_bytes();
        if (!p.has_next()) return s;

        auto opt = to_lower(p.next_string());
        long long scale = 0;
        if (opt == "ex") scale = 1000;
        else if (opt == "px") scale = 1;
        else throw CommandError("syntax error");

        if (!p.has_next()) throw CommandError("syntax error");
        auto n = p.next_int();
        if (n <= 0 || n > std::numeric_limits<std::int64_t>::max() / scale)
            throw CommandError("invalid expire time in 'set' command");
        // deadlines are kept at the steady clock's resolution
        if (ttl::Ms(n * scale) > ttl::max_ttl())
            throw CommandError("invalid expire time in 'set' command");
        s.expire = ttl::Ms(n * scale);
        return s;
    }

    Frame Set::apply(Store& store) const {
        store.set(key, value, expire);
        return Frame::simple("OK");
    }

    // PING

    Ping Ping::parse_args(Parse& p) {
        Ping ping;
        if (p.has_next()) ping.msg = p.next_bytes();
        return ping;
    }

    Frame Ping::apply(Store&) const {
        if (msg) return Frame::bulk(*msg);
        return Frame::simple("PONG");
    }

    // Unknown

    Frame Unknown::apply(Store&) const {
        return Frame::error("ERR unknown command '" + name + "'");
    }

    Frame apply(const Command& cmd, Store& store) {
        return std::visit([&store](const auto& c) { return c.apply(store); }, cmd);
    }

} // namespace respkv
