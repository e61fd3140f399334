#include "swhid_conformance/protocol.hpp"

#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace swhid::conformance::protocol {

namespace {

using nlohmann::json;

outcome::CrashedOrProtocolViolation violation(const Usage& usage, std::string subtype, std::string detail) {
    outcome::CrashedOrProtocolViolation crash;
    crash.reason = CrashReason::MalformedOutput;
    crash.exit_code = 0;
    crash.subtype = std::move(subtype);
    crash.detail = std::move(detail);
    crash.usage = usage;
    return crash;
}

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

std::string preview(std::string_view text) {
    constexpr std::size_t kMax = 200;
    std::string out{text.substr(0, kMax)};
    if (text.size() > kMax) out += "...";
    return out;
}

bool is_error_response(const json& response) {
    if (response.is_discarded() || !response.is_object()) {
        return false;
    }
    const auto ok = response.find("ok");
    return ok != response.end() && ok->is_boolean() && !ok->get<bool>();
}

outcome::CrashedOrProtocolViolation reported_error(const json& response, const Usage& usage, int exit_code,
                                                   const std::string& fallback_detail) {
    outcome::CrashedOrProtocolViolation crash;
    crash.reason = CrashReason::Reported;
    crash.exit_code = exit_code;
    crash.usage = usage;
    crash.subtype = "reported";
    const auto error = response.find("error");
    if (error != response.end() && error->is_object()) {
        crash.reported_kind = error_kind_from_string(string_field(*error, "code"));
        if (auto subtype = string_field(*error, "subtype"); !subtype.empty()) {
            crash.subtype = std::move(subtype);
        }
        crash.detail = string_field(*error, "message");
    }
    if (crash.detail.empty()) {
        crash.detail = fallback_detail;
    }
    return crash;
}

}  // namespace

RawOutcome frame_plain(RawOutcome raw) {
    auto* success = std::get_if<outcome::Success>(&raw);
    if (success == nullptr) {
        return raw;
    }
    std::string_view text = success->stdout_text;
    if (text.size() >= 2 && text.substr(text.size() - 2) == "\r\n") {
        text.remove_suffix(2);
    } else if (!text.empty() && text.back() == '\n') {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return violation(success->usage, "empty_output", "no identifier on stdout");
    }
    if (text.find_first_of("\r\n") != std::string_view::npos) {
        return violation(success->usage, "multiple_lines",
                         "expected exactly one line on stdout, got: " + preview(text));
    }
    success->stdout_text = std::string{text};
    return raw;
}

RawOutcome decode_json_response(RawOutcome raw) {
    if (auto* crash = std::get_if<outcome::CrashedOrProtocolViolation>(&raw)) {
        // A typed error may accompany a non-zero exit; without one the exit stays a crash.
        if (crash->reason != CrashReason::NonZeroExit) {
            return raw;
        }
        const json response = json::parse(crash->stdout_text, nullptr, false);
        if (!is_error_response(response)) {
            return raw;
        }
        return reported_error(response, crash->usage, crash->exit_code, crash->detail);
    }

    auto* success = std::get_if<outcome::Success>(&raw);
    if (success == nullptr) {
        return raw;
    }
    const json response = json::parse(success->stdout_text, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        return violation(success->usage, "bad_json",
                         "response is not a JSON object: " + preview(success->stdout_text));
    }
    const auto ok = response.find("ok");
    if (ok == response.end() || !ok->is_boolean()) {
        return violation(success->usage, "bad_json", "response lacks boolean 'ok'");
    }

    if (ok->get<bool>()) {
        const auto swhid = response.find("swhid");
        if (swhid == response.end() || !swhid->is_string()) {
            return violation(success->usage, "bad_json", "successful response lacks 'swhid' string");
        }
        success->stdout_text = swhid->get<std::string>();
        return raw;
    }
    return reported_error(response, success->usage, 0, success->stderr_text);
}

std::string encode_json_request(const ComputeRequest& request) {
    json body = {
        {"op", "compute"},
        {"payload_path", request.payload.string()},
        {"obj_type", std::string{type_name(request.type)}},
        {"variant", to_string(request.variant)},
        {"version", request.variant.version},
        {"hash_algo", std::string{to_string(request.variant.algorithm)}},
        {"encoding", std::string{to_string(request.variant.encoding)}},
    };
    if (!request.commit.empty()) body["commit"] = request.commit;
    if (!request.tag.empty()) body["tag"] = request.tag;
    if (!request.tag_id.empty()) body["tag_id"] = request.tag_id;
    return body.dump() + "\n";
}

}  // namespace swhid::conformance::protocol
