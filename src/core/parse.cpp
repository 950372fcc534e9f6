#include <respkv/core/parse.hpp>
#include <respkv/error.hpp>
#include <algorithm>
#include <cctype>
#include <limits>

namespace respkv {

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    Parse::Parse(Frame frame) {
        if (frame.type != Frame::Type::Array) throw ProtocolError("expected array request");
        if (frame.array.empty()) throw ProtocolError("empty request array");
        items_ = std::move(frame.array);
        name_ = to_lower(next_string());
    }

    const Frame& Parse::next() {
        if (!has_next()) arity_error();
        return items_[pos_++];
    }

    std::string Parse::next_string() {
        const Frame& f = next();
        switch (f.type) {
        case Frame::Type::Simple:
        case Frame::Type::Bulk:    return f.str;
        case Frame::Type::Integer: return std::to_string(f.integer);
        default: throw ProtocolError("expected simple or bulk argument");
        }
    }

    std::string Parse::next_bytes() {
        const Frame& f = next();
        switch (f.type) {
        case Frame::Type::Simple:
        case Frame::Type::Bulk:    return f.str;
        case Frame::Type::Integer: return std::to_string(f.integer);
        default: throw ProtocolError("expected bulk argument");
        }
    }

    std::int64_t Parse::next_int() {
        if (has_next() && items_[pos_].type == Frame::Type::Integer) {
            auto v = items_[pos_++].integer;
            if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                throw CommandError("value is not an integer or out of range");
            return static_cast<std::int64_t>(v);
        }

        auto s = next_string();
        std::size_t i = 0;
        bool neg = false;
        if (!s.empty() && s[0] == '-') { neg = true; i = 1; }
        if (i == s.size()) throw CommandError("value is not an integer or out of range");
        std::int64_t v = 0;
        for (; i < s.size(); ++i) {
            char c = s[i];
            if (c < '0' || c > '9') throw CommandError("value is not an integer or out of range");
            int d = c - '0';
            if (v > (std::numeric_limits<std::int64_t>::max() - d) / 10)
                throw CommandError("value is not an integer or out of range");
            v = v * 10 + d;
        }
        return neg ? -v : v;
    }

    void Parse::finish() const {
        if (has_next()) arity_error();
    }

    void Parse::arity_error() const {
        throw CommandError("wrong number of arguments for '" + name_ + "' command");
    }

} // namespace respkv
