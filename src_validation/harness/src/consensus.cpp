#include "swhid_conformance/consensus.hpp"

#include <algorithm>
#include <utility>

namespace swhid::conformance {

namespace {

bool attempted(const Result& r) noexcept {
    return r.status == ResultStatus::Pass || r.status == ResultStatus::Fail;
}

std::vector<AgreementGroup> partition(const std::vector<Result>& results) {
    std::vector<AgreementGroup> groups;
    for (const auto& r : results) {
        if (r.status != ResultStatus::Pass || !r.identifier) continue;
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const AgreementGroup& g) { return g.identifier == *r.identifier; });
        if (it == groups.end()) {
            groups.push_back(AgreementGroup{serialize(*r.identifier), *r.identifier, {r.implementation}});
        } else {
            it->members.push_back(r.implementation);
        }
    }
    return groups;
}

const AgreementGroup* group_of(const std::vector<AgreementGroup>& groups, const std::string& name) {
    for (const auto& g : groups) {
        if (std::find(g.members.begin(), g.members.end(), name) != g.members.end()) return &g;
    }
    return nullptr;
}

Blame blame_failure(const Result& r) {
    const auto& e = *r.error;
    return Blame{r.implementation, e.kind, e.subtype, e.message};
}

Blame blame_mismatch(const Result& r, const std::string& reference, const char* what) {
    return Blame{r.implementation, ErrorKind::MismatchError, "mismatch",
                 "produced " + serialize(*r.identifier) + ", " + what + " " + reference};
}

void compare_golden(const std::vector<Result>& results, const NormalizedIdentifier& golden, Outcome& out) {
    const auto golden_text = serialize(golden);
    out.expected = golden_text;
    for (const auto& r : results) {
        if (!attempted(r)) continue;
        if (r.status == ResultStatus::Fail) {
            out.blame.push_back(blame_failure(r));
        } else if (!(*r.identifier == golden)) {
            out.blame.push_back(blame_mismatch(r, golden_text, "expected"));
        }
    }
    const bool matched = out.blame.empty();
    out.expected_matched = matched;
    if (matched) {
        out.status = CaseStatus::Conformant;
        out.consensus = golden_text;
        out.message = "all implementations match the golden value";
    } else {
        out.status = CaseStatus::Fail;
        const bool anyone_matched = std::any_of(out.groups.begin(), out.groups.end(),
                                                [&](const AgreementGroup& g) { return g.identifier == golden; });
        if (anyone_matched) out.consensus = golden_text;
        out.message = std::to_string(out.blame.size()) + " implementation(s) diverge from the golden value";
    }
}

void compare_peers(const std::vector<Result>& results, std::size_t attempted_count, Outcome& out) {
    if (out.groups.size() == 1 && out.groups.front().members.size() == attempted_count) {
        out.status = CaseStatus::Agreement;
        out.consensus = out.groups.front().swhid;
        out.message = "all implementations agree";
        return;
    }

    out.status = CaseStatus::Disagreement;
    const AgreementGroup* winner = nullptr;
    std::size_t largest = 0;
    bool tie = false;
    for (const auto& g : out.groups) {
        if (g.members.size() > largest) {
            largest = g.members.size();
            winner = &g;
            tie = false;
        } else if (g.members.size() == largest) {
            tie = true;
        }
    }
    if (tie) winner = nullptr;

    if (winner != nullptr && (winner->members.size() >= 2 || attempted_count == 1)) {
        out.consensus = winner->swhid;
    }

    for (const auto& r : results) {
        if (!attempted(r)) continue;
        if (r.status == ResultStatus::Fail) {
            out.blame.push_back(blame_failure(r));
            continue;
        }
        const auto* g = group_of(out.groups, r.implementation);
        if (g == nullptr) continue;
        if (winner == nullptr) {
            out.blame.push_back(Blame{r.implementation, ErrorKind::MismatchError, "no_majority",
                                      "produced " + g->swhid + "; no group holds a strict majority"});
        } else if (g != winner) {
            out.blame.push_back(blame_mismatch(r, winner->swhid, "majority produced"));
        }
    }

    if (out.groups.empty()) {
        out.message = "no implementation produced an identifier";
    } else if (winner == nullptr) {
        out.message = std::to_string(out.groups.size()) + " groups tie, no majority";
    } else {
        out.message = std::to_string(out.groups.size()) + " groups, majority of " +
                      std::to_string(winner->members.size()) + "/" + std::to_string(attempted_count);
    }
}

void compare_negative(const std::vector<Result>& results, ErrorKind expected, Outcome& out) {
    const auto expected_code = std::string{to_string(expected)};
    for (const auto& r : results) {
        if (!attempted(r)) continue;
        if (r.status == ResultStatus::Pass) {
            out.blame.push_back(Blame{r.implementation, ErrorKind::MismatchError, "unexpected_success",
                                      "accepted a payload expected to fail with " + expected_code +
                                          ", produced " + serialize(*r.identifier)});
        } else if (r.error->kind != expected) {
            auto b = blame_failure(r);
            b.message = "expected " + expected_code + ", got " + std::string{to_string(r.error->kind)} +
                        ": " + b.message;
            out.blame.push_back(std::move(b));
        }
    }
    out.expected_matched = out.blame.empty();
    if (out.blame.empty()) {
        out.status = CaseStatus::Pass;
        out.message = "all implementations rejected the payload with " + expected_code;
    } else {
        out.status = CaseStatus::Fail;
        out.message = std::to_string(out.blame.size()) + " implementation(s) did not fail with " + expected_code;
    }
}

}  // namespace

std::string_view to_string(CaseStatus status) noexcept {
    switch (status) {
        case CaseStatus::Conformant: return "CONFORMANT";
        case CaseStatus::Fail: return "FAIL";
        case CaseStatus::Agreement: return "AGREEMENT";
        case CaseStatus::Disagreement: return "DISAGREEMENT";
        case CaseStatus::Pass: return "PASS";
        case CaseStatus::Skipped: return "SKIPPED";
        case CaseStatus::Error: return "ERROR";
    }
    return "ERROR";
}

bool is_failure(CaseStatus status) noexcept {
    return status == CaseStatus::Fail || status == CaseStatus::Disagreement || status == CaseStatus::Error;
}

Outcome compare(const std::vector<Result>& results, const Expectation& expectation) {
    Outcome out;
    std::size_t attempted_count = 0;
    for (const auto& r : results) {
        if (r.status == ResultStatus::Skip) {
            out.skipped.push_back(r.implementation);
        } else if (r.status == ResultStatus::Error) {
            out.unavailable.push_back(r.implementation);
        } else {
            ++attempted_count;
        }
    }
    out.groups = partition(results);
    if (expectation.golden) {
        out.expected = serialize(*expectation.golden);
    }

    if (attempted_count == 0) {
        if (out.unavailable.empty()) {
            out.status = CaseStatus::Skipped;
            out.message = results.empty() ? "no implementation registered" : "all implementations skipped";
        } else {
            out.status = CaseStatus::Error;
            out.message = std::to_string(out.unavailable.size()) + " implementation(s) unavailable, none attempted";
        }
        return out;
    }

    if (expectation.expected_error) {
        compare_negative(results, *expectation.expected_error, out);
    } else if (expectation.golden) {
        compare_golden(results, *expectation.golden, out);
    } else {
        compare_peers(results, attempted_count, out);
    }
    return out;
}

}  // namespace swhid::conformance
