#include "swhid_conformance/payload_resolver.hpp"

#include <cstdlib>
#include <string_view>
#include <utility>

#include <unistd.h>

namespace swhid::conformance {

namespace {

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

std::optional<std::filesystem::path> make_temp_dir(const std::filesystem::path& parent, std::string& diag) {
    std::error_code ec;
    auto base = parent.empty() ? std::filesystem::temp_directory_path(ec) : parent;
    if (ec) {
        diag += "payload: no temporary directory: " + ec.message() + "\n";
        return std::nullopt;
    }
    std::filesystem::create_directories(base, ec);
    std::string pattern = (base / "swhid-payload-XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        diag += "payload: mkdtemp failed under " + base.string() + "\n";
        return std::nullopt;
    }
    return std::filesystem::path{pattern};
}

}  // namespace

PayloadResolver::PayloadResolver(Config config) : config_{std::move(config)} {}

PayloadResolver::~PayloadResolver() {
    for (const auto& dir : temp_dirs_) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
}

bool PayloadResolver::is_archive(const std::filesystem::path& path) {
    const auto name = path.filename().string();
    return ends_with(name, ".tar") || ends_with(name, ".tar.gz") || ends_with(name, ".tgz") ||
           ends_with(name, ".tar.xz");
}

std::optional<std::filesystem::path> PayloadResolver::resolve(const TestCase& test_case, std::string& diag) {
    auto path = test_case.payload;
    if (path.is_relative() && !test_case.source_file.empty()) {
        path = test_case.source_file.parent_path() / path;
    }
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (!ec) {
        path = absolute.lexically_normal();
    }

    // symlink_status: a dangling symlink is still a legitimate payload.
    if (!std::filesystem::exists(std::filesystem::symlink_status(path, ec))) {
        diag += "payload: not found: " + path.string() + "\n";
        return std::nullopt;
    }
    if (std::filesystem::is_regular_file(path, ec) && is_archive(path)) {
        return extract(path, diag);
    }
    return path;
}

std::optional<std::filesystem::path> PayloadResolver::extract(const std::filesystem::path& archive,
                                                              std::string& diag) {
    if (auto it = extracted_.find(archive); it != extracted_.end()) {
        return it->second;
    }
    auto dir = make_temp_dir(config_.work_dir, diag);
    if (!dir) return std::nullopt;
    temp_dirs_.push_back(*dir);

    ProcessSpec spec;
    spec.command = config_.tar_exe;
    spec.argv = {"-xf", archive.string(), "-C", dir->string()};
    const char* path_env = std::getenv("PATH");
    spec.env["PATH"] = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
    spec.env["LC_ALL"] = "C";

    const auto raw = run_process(spec, config_.limits, diag);
    if (!std::holds_alternative<outcome::Success>(raw)) {
        diag += "payload: extraction failed: " + archive.string() + "\n";
        return std::nullopt;
    }

    // A single top-level directory is the payload itself.
    std::filesystem::path root = *dir;
    std::vector<std::filesystem::path> entries;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(*dir, ec)) {
        entries.push_back(entry.path());
    }
    if (entries.size() == 1 && std::filesystem::is_directory(std::filesystem::symlink_status(entries.front(), ec))) {
        root = entries.front();
    }
    diag += "payload: extracted " + archive.string() + " -> " + root.string() + "\n";
    extracted_.emplace(archive, root);
    return root;
}

std::optional<std::uint64_t> payload_size(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

}  // namespace swhid::conformance
