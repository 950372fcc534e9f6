#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <respkv/proto/frame.hpp>

namespace respkv {

	// Positional reader over the elements of a request array. Running out of
	// elements or finding one that doesn't convert is a CommandError; an
	// element that is not a Simple/Bulk/Integer frame is a ProtocolError.
	class Parse {
	public:
		// Throws ProtocolError unless frame is a non-empty Array.
		explicit Parse(Frame frame);

		// Lower-cased command name (first element).
		const std::string& command() const { return name_; }

		bool has_next() const { return pos_ < items_.size(); }
		std::size_t remaining() const { return items_.size() - pos_; }

		std::string next_string();
		std::string next_bytes();
		std::int64_t next_int();

		// Throws CommandError if arguments are left over.
		void finish() const;

	private:
		const Frame& next();
		[[noreturn]] void arity_error() const;

		std::vector<Frame> items_;
		std::size_t pos_ = 0;
		std::string name_;
	};

	std::string to_lower(std::string s);

} // namespace respkv
