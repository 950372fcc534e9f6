#include <respkv/core/router.hpp>
#include <respkv/error.hpp>

namespace respkv {

    Router::Router(std::shared_ptr<Store> s) : store_(std::move(s)) {
        h_["get"] = [](Parse& p) -> Command { return Get::parse_args(p); };
        h_["set"] = [](Parse& p) -> Command { return Set::parse_args(p); };
        h_["ping"] = [](Parse& p) -> Command { return Ping::parse_args(p); };
    }

    Command Router::decode(Frame frame) const {
        Parse p(std::move(frame));
        auto it = h_.find(p.command());
        if (it == h_.end()) return Unknown{ p.command() };
        Command cmd = it->second(p);
        p.finish();
        return cmd;
    }

    Frame Router::dispatch(Frame frame) const {
        try {
            return respkv::apply(decode(std::move(frame)), *store_);
        }
        catch (const CommandError& e) {
            return Frame::error(std::string("ERR ") + e.what());
        }
    }

} // namespace respkv
