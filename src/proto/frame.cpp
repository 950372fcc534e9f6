#include <respkv/proto/frame.hpp>
#include <respkv/error.hpp>
#include <limits>
#include <ostream>
#include <string_view>

namespace respkv {

    // ---------- construction

    Frame Frame::simple(std::string s) { Frame f; f.type = Type::Simple; f.str = std::move(s); return f; }
    Frame Frame::error(std::string s) { Frame f; f.type = Type::Error; f.str = std::move(s); return f; }
    Frame Frame::integer_of(std::uint64_t v) { Frame f; f.type = Type::Integer; f.integer = v; return f; }
    Frame Frame::bulk(std::string bytes) { Frame f; f.type = Type::Bulk; f.str = std::move(bytes); return f; }
    Frame Frame::null() { return Frame{}; }
    Frame Frame::array_of(std::vector<Frame> items) { Frame f; f.type = Type::Array; f.array = std::move(items); return f; }

    bool Frame::operator==(const Frame& o) const {
        if (type != o.type) return false;
        switch (type) {
        case Type::Simple:
        case Type::Error:
        case Type::Bulk:    return str == o.str;
        case Type::Integer: return integer == o.integer;
        case Type::Null:    return true;
        case Type::Array:   return array == o.array;
        }
        return false;
    }

    std::ostream& operator<<(std::ostream& os, const Frame& f) {
        switch (f.type) {
        case Frame::Type::Simple:  return os << "Simple(" << f.str << ")";
        case Frame::Type::Error:   return os << "Error(" << f.str << ")";
        case Frame::Type::Integer: return os << "Integer(" << f.integer << ")";
        case Frame::Type::Bulk:    return os << "Bulk(" << f.str.size() << " bytes)";
        case Frame::Type::Null:    return os << "Null";
        case Frame::Type::Array:
            os << "Array[";
            for (std::size_t i = 0; i < f.array.size(); ++i) {
                if (i) os << ", ";
                os << f.array[i];
            }
            return os << "]";
        }
        return os;
    }

    // ---------- helpers

    namespace {

        // Thrown internally when parse() runs past the buffer; never escapes.
        struct Truncated {};

        struct Line {
            bool ok = false;
            std::size_t start = 0, end = 0;
        };

        // Find "\r\n" from the cursor. On success [start,end) is the line content
        // and the cursor sits after the CRLF; otherwise the cursor is unchanged.
        Line get_line(Cursor& src) {
            Line L;
            for (std::size_t i = src.pos; i + 1 < src.len; ++i) {
                if (src.data[i] == '\r' && src.data[i + 1] == '\n') {
                    L.ok = true; L.start = src.pos; L.end = i;
                    src.pos = i + 2;
                    return L;
                }
            }
            return L;
        }

        std::string_view view(const Cursor& src, const Line& L) {
            return std::string_view{ src.data + L.start, L.end - L.start };
        }

        std::uint64_t parse_u64(std::string_view s, const char* what) {
            if (s.empty()) throw ProtocolError(std::string("empty ") + what);
            std::uint64_t v = 0;
            for (char c : s) {
                if (c < '0' || c > '9') throw ProtocolError(std::string("invalid ") + what);
                std::uint64_t d = static_cast<std::uint64_t>(c - '0');
                if (v > (std::numeric_limits<std::uint64_t>::max() - d) / 10)
                    throw ProtocolError(std::string(what) + " out of range");
                v = v * 10 + d;
            }
            return v;
        }

        // Lengths are either a non-negative decimal or exactly "-1" (null).
        // Returns false for the null form.
        bool parse_length(std::string_view s, std::uint64_t max, const char* what, std::uint64_t& out) {
            if (s == "-1") return false;
            out = parse_u64(s, what);
            if (out > max) throw ProtocolError(std::string(what) + " exceeds limit");
            return true;
        }

        bool valid_utf8(std::string_view s) {
            std::size_t i = 0;
            while (i < s.size()) {
                auto c = static_cast<unsigned char>(s[i]);
                std::size_t n;
                std::uint32_t cp;
                if (c < 0x80) { ++i; continue; }
                else if ((c & 0xE0) == 0xC0) { n = 1; cp = c & 0x1F; }
                else if ((c & 0xF0) == 0xE0) { n = 2; cp = c & 0x0F; }
                else if ((c & 0xF8) == 0xF0) { n = 3; cp = c & 0x07; }
                else return false;
                if (i + n >= s.size()) return false;
                for (std::size_t k = 1; k <= n; ++k) {
                    auto cc = static_cast<unsigned char>(s[i + k]);
                    if ((cc & 0xC0) != 0x80) return false;
                    cp = (cp << 6) | (cc & 0x3F);
                }
                // overlong forms, surrogates, beyond U+10FFFF
                if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000)) return false;
                if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
                i += n + 1;
            }
            return true;
        }

        // ---------- check

        CheckResult check_at(Cursor& src, std::size_t depth) {
            if (depth > MAX_FRAME_DEPTH) throw ProtocolError("nesting too deep");
            if (src.remaining() == 0) return CheckResult::Incomplete;

            char prefix = src.data[src.pos++];
            switch (prefix) {
            case '+':
            case '-': {
                if (!get_line(src).ok) return CheckResult::Incomplete;
                return CheckResult::Complete;
            }
            case ':': {
                auto L = get_line(src);
                if (!L.ok) return CheckResult::Incomplete;
                parse_u64(view(src, L), "integer");
                return CheckResult::Complete;
            }
            case '$': {
                auto L = get_line(src);
                if (!L.ok) return CheckResult::Incomplete;
                std::uint64_t n = 0;
                if (!parse_length(view(src, L), MAX_BULK_LEN, "bulk length", n)) return CheckResult::Complete;
                if (src.remaining() < n + 2) return CheckResult::Incomplete;
                src.pos += static_cast<std::size_t>(n);
                if (src.data[src.pos] != '\r' || src.data[src.pos + 1] != '\n')
                    throw ProtocolError("bulk payload not terminated by CRLF");
                src.pos += 2;
                return CheckResult::Complete;
            }
            case '*': {
                auto L = get_line(src);
                if (!L.ok) return CheckResult::Incomplete;
                std::uint64_t n = 0;
                if (!parse_length(view(src, L), MAX_ARRAY_COUNT, "array count", n)) return CheckResult::Complete;
                for (std::uint64_t i = 0; i < n; ++i) {
                    if (check_at(src, depth + 1) == CheckResult::Incomplete) return CheckResult::Incomplete;
                }
                return CheckResult::Complete;
            }
            default:
                throw ProtocolError("unknown frame type byte");
            }
        }

        // ---------- parse

        Line need_line(Cursor& src) {
            auto L = get_line(src);
            if (!L.ok) throw Truncated{};
            return L;
        }

        Frame parse_at(Cursor& src, std::size_t depth) {
            if (depth > MAX_FRAME_DEPTH) throw ProtocolError("nesting too deep");
            if (src.remaining() == 0) throw Truncated{};

            char prefix = src.data[src.pos++];
            switch (prefix) {
            case '+':
            case '-': {
                auto L = need_line(src);
                auto text = view(src, L);
                if (!valid_utf8(text)) throw ProtocolError("invalid UTF-8 in string line");
                return prefix == '+' ? Frame::simple(std::string(text)) : Frame::error(std::string(text));
            }
            case ':': {
                auto L = need_line(src);
                return Frame::integer_of(parse_u64(view(src, L), "integer"));
            }
            case '$': {
                auto L = need_line(src);
                std::uint64_t n = 0;
                if (!parse_length(view(src, L), MAX_BULK_LEN, "bulk length", n)) return Frame::null();
                if (src.remaining() < n + 2) throw Truncated{};
                std::string bytes(src.data + src.pos, static_cast<std::size_t>(n));
                src.pos += static_cast<std::size_t>(n);
                if (src.data[src.pos] != '\r' || src.data[src.pos + 1] != '\n')
                    throw ProtocolError("bulk payload not terminated by CRLF");
                src.pos += 2;
                return Frame::bulk(std::move(bytes));
            }
            case '*': {
                auto L = need_line(src);
                std::uint64_t n = 0;
                if (!parse_length(view(src, L), MAX_ARRAY_COUNT, "array count", n)) return Frame::null();
                std::vector<Frame> items;
                items.reserve(static_cast<std::size_t>(n));
                for (std::uint64_t i = 0; i < n; ++i) items.push_back(parse_at(src, depth + 1));
                return Frame::array_of(std::move(items));
            }
            default:
                throw ProtocolError("unknown frame type byte");
            }
        }

    } // namespace

    CheckResult check(Cursor& src) {
        return check_at(src, 0);
    }

    Frame parse(Cursor& src) {
        try {
            return parse_at(src, 0);
        }
        catch (const Truncated&) {
            throw ProtocolError("frame truncated during parse");
        }
    }

    // ---------- emitters

    void encode_to(std::string& out, const Frame& f) {
        switch (f.type) {
        case Frame::Type::Simple:
            out += '+'; out += f.str; out += "\r\n";
            break;
        case Frame::Type::Error:
            out += '-'; out += f.str; out += "\r\n";
            break;
        case Frame::Type::Integer:
            out += ':'; out += std::to_string(f.integer); out += "\r\n";
            break;
        case Frame::Type::Bulk:
            out += '$'; out += std::to_string(f.str.size()); out += "\r\n";
            out += f.str; out += "\r\n";
            break;
        case Frame::Type::Null:
            out += "$-1\r\n";
            break;
        case Frame::Type::Array:
            out += '*'; out += std::to_string(f.array.size()); out += "\r\n";
            for (auto& item : f.array) encode_to(out, item);
            break;
        }
    }

    std::string encode(const Frame& f) {
        std::string out;
        encode_to(out, f);
        return out;
    }

} // namespace respkv
