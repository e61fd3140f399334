#include "swhid_conformance/inprocess_bridge.hpp"
#include "swhid_conformance/protocol.hpp"

#include <utility>

namespace swhid::conformance::inprocess_bridge {

Session::Session(Config cfg) : cfg_(std::move(cfg)) {
    if (cfg_.info.kind.empty()) {
        cfg_.info.kind = "inprocess";
    }
    if (cfg_.info.language.empty()) {
        cfg_.info.language = "c++";
    }
}

bool Session::available(std::string& diag_out) const {
    if (!cfg_.compute) {
        diag_out += cfg_.info.name + ": no compute function registered\n";
        return false;
    }
    return true;
}

RawOutcome Session::compute(const ComputeRequest& request,
                            const SandboxLimits& limits,
                            std::string& diag_out) const {
    const auto effective = cfg_.limits.apply(limits);
    diag_out += cfg_.info.name + ": in-process variant=" + to_string(request.variant) + "\n";

    const ComputeFn& fn = cfg_.compute;
    auto raw = run_function([&fn, &request] { return fn(request) + "\n"; }, effective, diag_out);
    return protocol::frame_plain(std::move(raw));
}

} // namespace swhid::conformance::inprocess_bridge
