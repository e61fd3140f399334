#include "swhid_conformance/classifier.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

namespace swhid::conformance {

namespace {

Result failed(const std::string& implementation, const Usage& usage, ErrorKind kind,
              std::string subtype, std::string message) {
    Result result;
    result.implementation = implementation;
    result.status = ResultStatus::Fail;
    result.usage = usage;
    result.error = ErrorInfo{kind, std::move(subtype), std::move(message)};
    return result;
}

bool blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char ch) { return std::isspace(ch) != 0; });
}

// Reported kinds an implementation may claim for itself.
ErrorKind reported_or_compute(const std::optional<ErrorKind>& kind) {
    if (!kind) return ErrorKind::ComputeError;
    switch (*kind) {
        case ErrorKind::ParseError:
        case ErrorKind::NormalizeError:
        case ErrorKind::ValidationError:
        case ErrorKind::ComputeError:
        case ErrorKind::IoError:
            return *kind;
        default:
            return ErrorKind::ComputeError;
    }
}

const ParseIssue& most_severe(const std::vector<ParseIssue>& issues) {
    return *std::min_element(issues.begin(), issues.end(), [](const ParseIssue& a, const ParseIssue& b) {
        return static_cast<int>(a.kind) < static_cast<int>(b.kind);
    });
}

Result classify_success(const std::string& implementation, const outcome::Success& success,
                        const ComputeRequest& request) {
    auto parsed = parse(success.stdout_text);
    if (!parsed.issues.empty()) {
        const auto& issue = most_severe(parsed.issues);
        auto result = failed(implementation, success.usage, issue.kind, issue.subtype, issue.message);
        result.swhid = success.stdout_text;
        return result;
    }

    auto& id = *parsed.identifier;
    auto semantic = validate(id);
    if (!semantic.empty()) {
        const auto& issue = semantic.front();
        auto result = failed(implementation, success.usage, issue.kind, issue.subtype, issue.message);
        result.swhid = success.stdout_text;
        return result;
    }
    if (id.variant != request.variant) {
        auto result = failed(implementation, success.usage, ErrorKind::ValidationError, "variant_mismatch",
                             "requested " + to_string(request.variant) + " but got " + to_string(id.variant));
        result.swhid = success.stdout_text;
        return result;
    }
    if (id.type != request.type) {
        auto result = failed(implementation, success.usage, ErrorKind::ValidationError, "type_mismatch",
                             "requested " + std::string{type_code(request.type)} + " but got " +
                                 std::string{type_code(id.type)});
        result.swhid = success.stdout_text;
        return result;
    }

    Result result;
    result.implementation = implementation;
    result.status = ResultStatus::Pass;
    result.usage = success.usage;
    result.swhid = success.stdout_text;
    result.identifier = std::move(id);
    return result;
}

Result classify_crash(const std::string& implementation, const outcome::CrashedOrProtocolViolation& crash) {
    switch (crash.reason) {
        case CrashReason::LaunchFailed: {
            auto result = make_unavailable(implementation, "unavailable", crash.detail);
            result.usage = crash.usage;
            return result;
        }
        case CrashReason::Reported:
            return failed(implementation, crash.usage, reported_or_compute(crash.reported_kind),
                          crash.subtype, crash.detail);
        case CrashReason::NonZeroExit:
            if (crash.exit_code == 126 || crash.exit_code == 127) {
                return failed(implementation, crash.usage, ErrorKind::IoError, crash.subtype,
                              "command could not be executed: " + crash.detail);
            }
            if (!blank(crash.detail)) {
                return failed(implementation, crash.usage, ErrorKind::ComputeError, crash.subtype, crash.detail);
            }
            return failed(implementation, crash.usage, ErrorKind::IoError, crash.subtype,
                          "exit status " + std::to_string(crash.exit_code) + " without diagnostic");
        case CrashReason::Signaled:
        case CrashReason::MalformedOutput:
            return failed(implementation, crash.usage, ErrorKind::IoError, crash.subtype, crash.detail);
    }
    return failed(implementation, crash.usage, ErrorKind::IoError, crash.subtype, crash.detail);
}

}  // namespace

std::string_view to_string(ResultStatus status) noexcept {
    switch (status) {
        case ResultStatus::Pass: return "PASS";
        case ResultStatus::Fail: return "FAIL";
        case ResultStatus::Skip: return "SKIPPED";
        case ResultStatus::Error: return "ERROR";
    }
    return "ERROR";
}

Result classify(const std::string& implementation, const RawOutcome& raw, const ComputeRequest& request) {
    if (const auto* success = std::get_if<outcome::Success>(&raw)) {
        return classify_success(implementation, *success, request);
    }
    if (const auto* crash = std::get_if<outcome::CrashedOrProtocolViolation>(&raw)) {
        return classify_crash(implementation, *crash);
    }
    if (const auto* timed_out = std::get_if<outcome::TimedOut>(&raw)) {
        return failed(implementation, timed_out->usage, ErrorKind::Timeout, "wall_clock",
                      "wall-clock limit exceeded after " + std::to_string(timed_out->usage.wall_ms) + " ms");
    }
    const auto& exceeded = std::get<outcome::ResourceExceeded>(raw);
    return failed(implementation, exceeded.usage, ErrorKind::ResourceLimit,
                  std::string{to_string(exceeded.kind)}, exceeded.detail);
}

Result make_skip(const std::string& implementation, std::string reason) {
    Result result;
    result.implementation = implementation;
    result.status = ResultStatus::Skip;
    result.skip_reason = std::move(reason);
    return result;
}

Result make_unavailable(const std::string& implementation, std::string subtype, std::string message) {
    Result result;
    result.implementation = implementation;
    result.status = ResultStatus::Error;
    result.error = ErrorInfo{ErrorKind::IoError, std::move(subtype), std::move(message)};
    return result;
}

}  // namespace swhid::conformance
