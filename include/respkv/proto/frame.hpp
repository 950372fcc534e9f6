#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace respkv {

	// One RESP2 value. Simple/Error/Bulk keep their payload in `str`,
	// Integer in `integer`, Array in `array`.
	struct Frame {
		enum class Type { Simple, Error, Integer, Bulk, Null, Array };

		Type type = Type::Null;
		std::string str;
		std::uint64_t integer = 0;
		std::vector<Frame> array;

		static Frame simple(std::string s);
		static Frame error(std::string s);
		static Frame integer_of(std::uint64_t v);
		static Frame bulk(std::string bytes);
		static Frame null();
		static Frame array_of(std::vector<Frame> items);

		bool operator==(const Frame& o) const;
		bool operator!=(const Frame& o) const { return !(*this == o); }
	};

	std::ostream& operator<<(std::ostream& os, const Frame& f);

	// Read position over a contiguous byte range. check/parse advance `pos`
	// by exactly the length of the frame they walked.
	struct Cursor {
		const char* data = nullptr;
		std::size_t len = 0;
		std::size_t pos = 0;

		Cursor(const char* d, std::size_t n) : data(d), len(n) {}
		std::size_t remaining() const { return len - pos; }
	};

	enum class CheckResult { Complete, Incomplete };

	// Limits applied while decoding.
	constexpr std::size_t MAX_FRAME_DEPTH = 128;
	constexpr std::uint64_t MAX_BULK_LEN = 512ull * 1024 * 1024;
	constexpr std::uint64_t MAX_ARRAY_COUNT = 1024ull * 1024;

	// Walk one frame without copying payloads. Incomplete means the bytes ran
	// out before the frame ended; the caller may append and retry from the same
	// start. Throws ProtocolError on malformed input.
	CheckResult check(Cursor& src);

	// Materialize one frame. Call only after check() returned Complete;
	// running out of bytes here is a ProtocolError.
	Frame parse(Cursor& src);

	// Serializers
	std::string encode(const Frame& f);
	void encode_to(std::string& out, const Frame& f);

} // namespace respkv
