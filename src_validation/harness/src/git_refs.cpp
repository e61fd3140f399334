#include "swhid_conformance/git_refs.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace swhid::conformance {

namespace {

std::string trim_line(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

std::map<std::string, std::string> engine_environment() {
    std::map<std::string, std::string> env;
    const char* path = std::getenv("PATH");
    env["PATH"] = path != nullptr ? path : "/usr/local/bin:/usr/bin:/bin";
    if (const char* home = std::getenv("HOME")) env["HOME"] = home;
    env["LANG"] = "C";
    env["LC_ALL"] = "C";
    env["GIT_CONFIG_NOSYSTEM"] = "1";
    return env;
}

}  // namespace

bool is_full_object_id(std::string_view text) noexcept {
    return text.size() == 40 && std::all_of(text.begin(), text.end(), [](char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

GitResolver::GitResolver(Config config) : config_{std::move(config)} {
    if (config_.env.empty()) {
        config_.env = engine_environment();
    }
}

std::optional<std::string> GitResolver::git(const std::filesystem::path& repo,
                                            std::vector<std::string> args,
                                            std::string& diag) const {
    ProcessSpec spec;
    spec.command = config_.git_exe;
    spec.argv = {"-C", repo.string()};
    spec.argv.insert(spec.argv.end(), std::make_move_iterator(args.begin()), std::make_move_iterator(args.end()));
    spec.env = config_.env;

    auto raw = run_process(spec, config_.limits, diag);
    if (auto* success = std::get_if<outcome::Success>(&raw)) {
        return std::move(success->stdout_text);
    }
    diag += "git: command failed for " + repo.string() + "\n";
    return std::nullopt;
}

bool GitResolver::is_repository(const std::filesystem::path& repo, std::string& diag) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(repo, ec)) {
        return false;
    }
    return git(repo, {"rev-parse", "--git-dir"}, diag).has_value();
}

std::optional<std::string> GitResolver::resolve_commit(const std::filesystem::path& repo,
                                                       const std::string& ref,
                                                       std::string& diag) const {
    if (is_full_object_id(ref)) {
        return ref;
    }
    const std::string target = (ref.empty() ? std::string{"HEAD"} : ref) + "^{commit}";
    auto out = git(repo, {"rev-parse", "--verify", "--quiet", target}, diag);
    if (!out) {
        diag += "git: cannot resolve '" + ref + "' to a commit\n";
        return std::nullopt;
    }
    auto id = trim_line(std::move(*out));
    if (!is_full_object_id(id)) {
        diag += "git: rev-parse returned '" + id + "' for '" + ref + "'\n";
        return std::nullopt;
    }
    diag += "git: " + ref + " -> " + id + "\n";
    return id;
}

std::optional<std::string> GitResolver::resolve_tag(const std::filesystem::path& repo,
                                                    const std::string& tag,
                                                    std::string& diag) const {
    auto out = git(repo, {"rev-parse", "--verify", "--quiet", "refs/tags/" + tag}, diag);
    if (!out) {
        diag += "git: unknown tag '" + tag + "'\n";
        return std::nullopt;
    }
    auto id = trim_line(std::move(*out));
    auto type = git(repo, {"cat-file", "-t", id}, diag);
    if (!type || trim_line(std::move(*type)) != "tag") {
        diag += "git: tag '" + tag + "' is not annotated\n";
        return std::nullopt;
    }
    return id;
}

std::vector<GitResolver::Ref> GitResolver::branches(const std::filesystem::path& repo, std::string& diag) const {
    std::vector<Ref> refs;
    auto out = git(repo, {"for-each-ref", "--format=%(refname:short)%09%(objectname)", "refs/heads"}, diag);
    if (!out) return refs;

    std::istringstream lines(*out);
    std::string line;
    while (std::getline(lines, line)) {
        const auto tab = line.find('\t');
        if (tab == std::string::npos) continue;
        refs.push_back(Ref{line.substr(0, tab), trim_line(line.substr(tab + 1))});
    }
    std::sort(refs.begin(), refs.end(), [](const Ref& a, const Ref& b) { return a.name < b.name; });
    return refs;
}

std::vector<GitResolver::Ref> GitResolver::annotated_tags(const std::filesystem::path& repo,
                                                          std::string& diag) const {
    std::vector<Ref> refs;
    auto out = git(repo,
                   {"for-each-ref", "--format=%(refname:short)%09%(objectname)%09%(objecttype)", "refs/tags"},
                   diag);
    if (!out) return refs;

    std::istringstream lines(*out);
    std::string line;
    while (std::getline(lines, line)) {
        const auto first = line.find('\t');
        const auto second = first == std::string::npos ? std::string::npos : line.find('\t', first + 1);
        if (second == std::string::npos) continue;
        if (trim_line(line.substr(second + 1)) != "tag") continue;
        refs.push_back(Ref{line.substr(0, first), line.substr(first + 1, second - first - 1)});
    }
    std::sort(refs.begin(), refs.end(), [](const Ref& a, const Ref& b) { return a.name < b.name; });
    return refs;
}

}  // namespace swhid::conformance
