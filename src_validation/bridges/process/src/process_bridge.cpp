#include "swhid_conformance/process_bridge.hpp"
#include "swhid_conformance/protocol.hpp"

#include <array>
#include <cstdlib>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace swhid::conformance::process_bridge {

namespace {

constexpr std::array<const char*, 5> kInheritedVariables{"PATH", "HOME", "LANG", "LC_ALL", "LC_CTYPE"};

void replace_all(std::string& text, std::string_view token, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

} // namespace

Session::Session(Config cfg) : cfg_(std::move(cfg)) {
    for (const char* name : kInheritedVariables) {
        if (const char* value = std::getenv(name)) {
            env_[name] = value;
        }
    }
    if (env_.find("PATH") == env_.end()) {
        env_["PATH"] = "/usr/local/bin:/usr/bin:/bin";
    }
    for (const auto& [name, value] : cfg_.manifest.env) {
        env_[name] = value;
    }
    if (cfg_.manifest.info.kind.empty()) {
        cfg_.manifest.info.kind = "process";
    }
    if (!cfg_.manifest.source_file.empty()) {
        std::error_code ec;
        impl_dir_ = std::filesystem::absolute(cfg_.manifest.source_file, ec).parent_path();
    }
}

bool Session::available(std::string& diag_out) const {
    const auto& manifest = cfg_.manifest;
    const auto resolved = resolve_executable(manifest.command, env_.at("PATH"));
    if (!resolved) {
        diag_out += manifest.info.name + ": command not found: " + manifest.command + "\n";
        return false;
    }
    if (manifest.probe.empty()) {
        return true;
    }

    ProcessSpec spec;
    spec.command = manifest.command;
    spec.argv = manifest.probe;
    spec.env = env_;
    SandboxLimits probe_limits;
    probe_limits.wall_clock = std::chrono::milliseconds{10000};
    probe_limits.cpu_seconds = 10;
    probe_limits.enforce_address_space = false;

    const auto raw = run_process(spec, probe_limits, diag_out);
    if (!std::holds_alternative<outcome::Success>(raw)) {
        diag_out += manifest.info.name + ": availability probe failed\n";
        return false;
    }
    return true;
}

std::vector<std::string> Session::render_args(const ComputeRequest& request) const {
    const std::array<std::pair<std::string_view, std::string>, 11> substitutions{{
        {"{payload}", request.payload.string()},
        {"{type}", std::string{type_name(request.type)}},
        {"{object}", std::string{type_code(request.type)}},
        {"{version}", std::to_string(request.variant.version)},
        {"{hash}", std::string{to_string(request.variant.algorithm)}},
        {"{encoding}", std::string{to_string(request.variant.encoding)}},
        {"{variant}", to_string(request.variant)},
        {"{commit}", request.commit},
        {"{tag_id}", request.tag_id},
        {"{tag}", request.tag},
        {"{impl_dir}", impl_dir_.string()},
    }};

    std::vector<std::string> args;
    args.reserve(cfg_.manifest.args.size());
    for (auto arg : cfg_.manifest.args) {
        for (const auto& [token, value] : substitutions) {
            replace_all(arg, token, value);
        }
        args.push_back(std::move(arg));
    }
    return args;
}

RawOutcome Session::compute(const ComputeRequest& request,
                            const SandboxLimits& limits,
                            std::string& diag_out) const {
    const auto& manifest = cfg_.manifest;

    ProcessSpec spec;
    spec.command = manifest.command;
    spec.argv = render_args(request);
    spec.env = env_;
    spec.cwd = cfg_.work_dir.empty() ? request.payload.parent_path() : cfg_.work_dir;

    if (manifest.protocol == WireProtocol::Json) {
        try {
            spec.stdin_data = protocol::encode_json_request(request);
        } catch (const nlohmann::json::exception& ex) {
            // Paths that are not valid UTF-8 cannot travel in a JSON request.
            outcome::CrashedOrProtocolViolation crash;
            crash.reason = CrashReason::MalformedOutput;
            crash.subtype = "request_encoding";
            crash.detail = ex.what();
            diag_out += manifest.info.name + ": cannot encode request: " + ex.what() + "\n";
            return crash;
        }
    } else if (manifest.input == PayloadInput::Stdin) {
        spec.stdin_file = request.payload;
    }

    const auto effective = manifest.limits.apply(limits);
    diag_out += manifest.info.name + ": protocol=" +
                (manifest.protocol == WireProtocol::Json ? std::string{"json"} : std::string{"plain"}) +
                " variant=" + to_string(request.variant) + "\n";

    auto raw = run_process(spec, effective, diag_out);
    if (manifest.protocol == WireProtocol::Json) {
        return protocol::decode_json_response(std::move(raw));
    }
    return protocol::frame_plain(std::move(raw));
}

} // namespace swhid::conformance::process_bridge
