#pragma once
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <respkv/core/command.hpp>
#include <respkv/core/store.hpp>
#include <respkv/proto/frame.hpp>

namespace respkv {

	// Command-name table plus the shared store every request is applied to.
	// Immutable after construction, so one Router serves all connections.
	class Router {
	public:
		using Parser = std::function<Command(Parse&)>;
		explicit Router(std::shared_ptr<Store> s);

		// Throws ProtocolError (not an array) or CommandError (bad arguments).
		Command decode(Frame frame) const;

		// decode + apply. CommandError becomes an "-ERR ..." reply;
		// ProtocolError propagates to the caller.
		Frame dispatch(Frame frame) const;

		Store& store() const { return *store_; }

	private:
		std::shared_ptr<Store> store_;
		std::unordered_map<std::string, Parser> h_;
	};

} // namespace respkv
