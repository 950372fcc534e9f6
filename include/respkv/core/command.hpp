#pragma once
#include <optional>
#include <string>
#include <variant>
#include <respkv/core/parse.hpp>
#include <respkv/core/store.hpp>
#include <respkv/proto/frame.hpp>
#include <respkv/time/ttl.hpp>

namespace respkv {

	// GET key
	struct Get {
		std::string key;

		static Get parse_args(Parse& p);
		Frame apply(Store& store) const;
	};

	// SET key value [EX seconds | PX milliseconds]
	struct Set {
		std::string key;
		std::string value;
		std::optional<ttl::Ms> expire;

		static Set parse_args(Parse& p);
		Frame apply(Store& store) const;
	};

	// PING [message]
	struct Ping {
		std::optional<std::string> msg;

		static Ping parse_args(Parse& p);
		Frame apply(Store& store) const;
	};

	// Anything not in the command table. Replies with an error, never fails
	// to decode.
	struct Unknown {
		std::string name;

		Frame apply(Store& store) const;
	};

	using Command = std::variant<Get, Set, Ping, Unknown>;

	Frame apply(const Command& cmd, Store& store);

} // namespace respkv
