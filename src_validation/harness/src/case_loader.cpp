#include "swhid_conformance/case_loader.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using swhid::conformance::ErrorKind;
using swhid::conformance::Variant;

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

std::string where(const std::filesystem::path& file, std::size_t line_no) {
    return file.string() + ":" + std::to_string(line_no);
}

bool parse_boolean(std::string_view raw,
                   const std::filesystem::path& file,
                   std::size_t line_no) {
    const auto lowered = to_lower_copy(raw);
    if (lowered == "true" || lowered == "yes" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "0") {
        return false;
    }
    throw std::runtime_error("Invalid boolean value '" + std::string{raw} + "' at " + where(file, line_no));
}

std::uint64_t parse_unsigned(const std::string& raw,
                             const std::filesystem::path& file,
                             std::size_t line_no) {
    if (raw.empty() || !std::all_of(raw.begin(), raw.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::runtime_error("Expected a non-negative integer, got '" + raw + "' at " + where(file, line_no));
    }
    try {
        return std::stoull(raw);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Integer out of range '" + raw + "' at " + where(file, line_no));
    }
}

std::vector<std::string> split_list(std::string_view raw) {
    std::vector<std::string> items;
    std::size_t begin = 0;
    while (begin <= raw.size()) {
        auto end = raw.find(',', begin);
        if (end == std::string_view::npos) end = raw.size();
        auto item = trim_copy(raw.substr(begin, end - begin));
        if (!item.empty()) items.push_back(std::move(item));
        begin = end + 1;
    }
    return items;
}

swhid::conformance::ObjectType parse_type(const std::string& raw,
                                          const std::filesystem::path& file,
                                          std::size_t line_no) {
    const auto type = swhid::conformance::object_type_from_string(to_lower_copy(raw));
    if (!type) {
        throw std::runtime_error("Unknown object type '" + raw + "' at " + where(file, line_no));
    }
    return *type;
}

Variant parse_variant(const std::string& raw,
                      const std::filesystem::path& file,
                      std::size_t line_no) {
    const auto variant = swhid::conformance::parse_variant_tag(to_lower_copy(raw));
    if (!variant) {
        throw std::runtime_error("Unknown variant '" + raw + "' at " + where(file, line_no) +
                                 " (expected e.g. v1/sha1/hex)");
    }
    return *variant;
}

// Golden values must be canonical, valid, and belong to the variant they are filed under.
void check_golden(const std::string& text,
                  const std::optional<Variant>& variant,
                  const std::string& context) {
    const auto parsed = swhid::conformance::parse(text);
    if (!parsed.ok()) {
        const auto& issue = parsed.issues.front();
        throw std::runtime_error("Golden value '" + text + "' is not canonical (" + issue.message + ") at " + context);
    }
    const auto semantic = swhid::conformance::validate(*parsed.identifier);
    if (!semantic.empty()) {
        throw std::runtime_error("Golden value '" + text + "' is invalid (" + semantic.front().message + ") at " + context);
    }
    if (variant && parsed.identifier->variant != *variant) {
        throw std::runtime_error("Golden value '" + text + "' is " + to_string(parsed.identifier->variant) +
                                 ", filed under " + to_string(*variant) + " at " + context);
    }
}

using EntryHandler = std::function<void(std::string key, std::string value, std::size_t line_no)>;

/// Shared block reader: `key=value` lines, `#` comments, `---` closes a block.
void read_blocks(const std::filesystem::path& file,
                 const std::string& what,
                 const EntryHandler& on_entry,
                 const std::function<void()>& on_block_end) {
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error(what + " file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error(what + " path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open " + what + " file: " + file.string());
    }

    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;

        const auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        if (trimmed == "---") {
            on_block_end();
            continue;
        }

        const auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            throw std::runtime_error("Expected 'key=value' entry at " + where(file, line_no));
        }

        auto key = trim_copy(std::string_view{trimmed}.substr(0, delimiter));
        auto value = trim_copy(std::string_view{trimmed}.substr(delimiter + 1));

        if (key.empty()) {
            throw std::runtime_error("Empty key at " + where(file, line_no));
        }
        on_entry(std::move(key), std::move(value), line_no);
    }
    on_block_end();
}

std::vector<std::filesystem::path> collect(const std::filesystem::path& root,
                                           std::string_view extension,
                                           const std::string& what) {
    if (!std::filesystem::exists(root)) {
        throw std::runtime_error(what + " root does not exist: " + root.string());
    }
    if (!std::filesystem::is_directory(root)) {
        return {root};
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && entry.path().extension() == extension) {
            files.emplace_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace

namespace swhid::conformance {

CasePack CaseLoader::load(const std::filesystem::path& file) const {
    CasePack pack;
    pack.source_file = file.string();

    std::string default_suite = file.stem().string();
    if (default_suite.empty()) {
        default_suite = file.filename().string();
    }
    if (default_suite.empty()) {
        default_suite = pack.source_file;
    }
    const std::string id_prefix = default_suite;

    TestCase current;
    std::size_t block_start = 0;
    bool touched = false;

    auto reset_current = [&]() {
        current = TestCase{};
        current.suite = default_suite;
        current.source_file = file;
        touched = false;
    };
    reset_current();

    auto push_current = [&]() {
        if (!touched) {
            reset_current();
            return;
        }
        const auto context = where(file, block_start);
        if (current.id.empty()) {
            current.id = id_prefix + "#" + std::to_string(pack.cases.size() + 1);
        }
        if (current.payload.empty()) {
            throw std::runtime_error("Case '" + current.id + "' has no 'path' (block at " + context + ")");
        }
        if (current.expected_error && !current.expected.empty()) {
            throw std::runtime_error("Case '" + current.id +
                                     "' declares both golden values and expected_error (block at " + context + ")");
        }
        const bool duplicate = std::any_of(pack.cases.begin(), pack.cases.end(),
                                           [&](const TestCase& c) { return c.id == current.id; });
        if (duplicate) {
            throw std::runtime_error("Duplicate case id '" + current.id + "' at " + context);
        }
        pack.cases.emplace_back(std::move(current));
        reset_current();
    };

    auto on_entry = [&](std::string key, std::string value, std::size_t line_no) {
        if (!touched) {
            block_start = line_no;
        }
        touched = true;
        const auto context = where(file, line_no);

        if (key == "suite") {
            current.suite = std::move(value);
        } else if (key == "id") {
            current.id = std::move(value);
        } else if (key == "path") {
            current.payload = std::filesystem::path{value};
        } else if (key == "type") {
            current.type = parse_type(value, file, line_no);
        } else if (key == "commit") {
            current.commit = std::move(value);
        } else if (key == "tag") {
            current.tag = std::move(value);
        } else if (key == "discover_branches") {
            current.discover_branches = parse_boolean(value, file, line_no);
        } else if (key == "discover_tags") {
            current.discover_tags = parse_boolean(value, file, line_no);
        } else if (key == "expected_error") {
            current.expected_error = error_kind_from_string(value);
            if (!current.expected_error || *current.expected_error == ErrorKind::MismatchError) {
                throw std::runtime_error("Unknown expected_error '" + value + "' at " + context);
            }
        } else if (key == "expected_swhid") {
            check_golden(value, kV1Sha1Hex, context);
            current.expected[kV1Sha1Hex] = std::move(value);
        } else if (key == "expected_swhid_sha256") {
            check_golden(value, kV2Sha256Hex, context);
            current.expected[kV2Sha256Hex] = std::move(value);
        } else if (key.rfind("expected.branch.", 0) == 0) {
            const auto name = key.substr(16);
            if (name.empty()) {
                throw std::runtime_error("Empty branch name at " + context);
            }
            check_golden(value, std::nullopt, context);
            current.expected_branches[name] = std::move(value);
        } else if (key.rfind("expected.tag.", 0) == 0) {
            const auto name = key.substr(13);
            if (name.empty()) {
                throw std::runtime_error("Empty tag name at " + context);
            }
            check_golden(value, std::nullopt, context);
            current.expected_tags[name] = std::move(value);
        } else if (key.rfind("expected.", 0) == 0) {
            const auto variant = parse_variant(key.substr(9), file, line_no);
            check_golden(value, variant, context);
            current.expected[variant] = std::move(value);
        } else if (key.rfind("attr.", 0) == 0) {
            const auto attr_key = key.substr(5);
            if (attr_key.empty()) {
                throw std::runtime_error("Empty attribute name at " + context);
            }
            current.attributes[attr_key] = std::move(value);
        } else {
            current.attributes[std::move(key)] = std::move(value);
        }
    };

    read_blocks(file, "Case", on_entry, push_current);
    return pack;
}

std::vector<CasePack> CaseLoader::load_directory(const std::filesystem::path& root) const {
    std::vector<CasePack> packs;
    for (const auto& path : collect(root, ".scn", "Case")) {
        packs.emplace_back(load(path));
    }
    return packs;
}

std::vector<ImplementationManifest> ImplementationLoader::load(const std::filesystem::path& file) const {
    std::vector<ImplementationManifest> manifests;

    ImplementationManifest current;
    bool touched = false;
    bool types_set = false;
    bool variants_set = false;
    std::size_t block_start = 0;

    auto reset_current = [&]() {
        current = ImplementationManifest{};
        current.info.kind = "process";
        current.source_file = file;
        touched = false;
        types_set = false;
        variants_set = false;
    };
    reset_current();

    auto push_current = [&]() {
        if (!touched) {
            reset_current();
            return;
        }
        const auto context = where(file, block_start);
        if (current.info.name.empty()) {
            throw std::runtime_error("Implementation without 'name' (block at " + context + ")");
        }
        if (current.command.empty()) {
            throw std::runtime_error("Implementation '" + current.info.name + "' has no 'command' (block at " +
                                     context + ")");
        }
        if (!types_set) {
            current.capabilities.types = {kAllObjectTypes.begin(), kAllObjectTypes.end()};
        }
        if (!variants_set) {
            current.capabilities.variants = {kV1Sha1Hex};
        }
        manifests.emplace_back(std::move(current));
        reset_current();
    };

    auto on_entry = [&](std::string key, std::string value, std::size_t line_no) {
        if (!touched) {
            block_start = line_no;
        }
        touched = true;
        auto& info = current.info;
        auto& caps = current.capabilities;

        if (key == "name") {
            info.name = std::move(value);
        } else if (key == "version") {
            info.version = std::move(value);
        } else if (key == "language") {
            info.language = std::move(value);
        } else if (key == "description") {
            info.description = std::move(value);
        } else if (key == "command") {
            current.command = std::move(value);
        } else if (key == "arg") {
            current.args.push_back(std::move(value));
        } else if (key == "probe") {
            current.probe.push_back(std::move(value));
        } else if (key == "protocol") {
            const auto lowered = to_lower_copy(value);
            if (lowered == "plain") {
                current.protocol = WireProtocol::Plain;
            } else if (lowered == "json") {
                current.protocol = WireProtocol::Json;
            } else {
                throw std::runtime_error("Unknown protocol '" + value + "' at " + where(file, line_no));
            }
        } else if (key == "input") {
            const auto lowered = to_lower_copy(value);
            if (lowered == "path") {
                current.input = PayloadInput::Path;
            } else if (lowered == "stdin") {
                current.input = PayloadInput::Stdin;
            } else {
                throw std::runtime_error("Unknown input mode '" + value + "' at " + where(file, line_no));
            }
        } else if (key.rfind("env.", 0) == 0) {
            const auto name = key.substr(4);
            if (name.empty()) {
                throw std::runtime_error("Empty environment variable name at " + where(file, line_no));
            }
            current.env[name] = std::move(value);
        } else if (key == "types") {
            caps.types.clear();
            for (const auto& item : split_list(value)) {
                caps.types.insert(parse_type(item, file, line_no));
            }
            types_set = true;
        } else if (key == "variants") {
            caps.variants.clear();
            for (const auto& item : split_list(value)) {
                caps.variants.insert(parse_variant(item, file, line_no));
            }
            variants_set = true;
        } else if (key == "qualifiers") {
            caps.qualifiers.clear();
            for (auto& item : split_list(value)) {
                caps.qualifiers.insert(std::move(item));
            }
        } else if (key == "max_payload_size_mb") {
            caps.max_payload_bytes = parse_unsigned(value, file, line_no) * 1024 * 1024;
        } else if (key == "api_version") {
            caps.api_version = std::move(value);
        } else if (key == "supports_unicode") {
            caps.supports_unicode = parse_boolean(value, file, line_no);
        } else if (key == "supports_percent_encoding") {
            caps.supports_percent_encoding = parse_boolean(value, file, line_no);
        } else if (key == "timeout_ms") {
            current.limits.wall_clock = std::chrono::milliseconds(static_cast<std::int64_t>(parse_unsigned(value, file, line_no)));
        } else if (key == "cpu_seconds") {
            current.limits.cpu_seconds = static_cast<int>(parse_unsigned(value, file, line_no));
        } else if (key == "memory_mb") {
            current.limits.memory_bytes = parse_unsigned(value, file, line_no) * 1024 * 1024;
        } else if (key == "enforce_address_space") {
            current.limits.enforce_address_space = parse_boolean(value, file, line_no);
        } else {
            throw std::runtime_error("Unknown implementation key '" + key + "' at " + where(file, line_no));
        }
    };

    read_blocks(file, "Implementation", on_entry, push_current);
    return manifests;
}

std::vector<ImplementationManifest> ImplementationLoader::load_directory(const std::filesystem::path& root) const {
    std::vector<ImplementationManifest> manifests;
    for (const auto& path : collect(root, ".impl", "Implementation")) {
        auto loaded = load(path);
        manifests.insert(manifests.end(),
                         std::make_move_iterator(loaded.begin()),
                         std::make_move_iterator(loaded.end()));
    }
    return manifests;
}

std::vector<std::string> GoldenValues::apply(std::vector<CasePack>& packs) const {
    std::set<std::string> used;
    for (auto& pack : packs) {
        for (auto& tc : pack.cases) {
            if (auto it = cases.find(tc.id); it != cases.end()) {
                for (const auto& [variant, value] : it->second) {
                    tc.expected[variant] = value;
                }
                used.insert(tc.id);
            }
            if (auto it = branches.find(tc.id); it != branches.end()) {
                for (const auto& [name, value] : it->second) {
                    tc.expected_branches[name] = value;
                }
                used.insert(tc.id);
            }
            if (auto it = tags.find(tc.id); it != tags.end()) {
                for (const auto& [name, value] : it->second) {
                    tc.expected_tags[name] = value;
                }
                used.insert(tc.id);
            }
        }
    }

    std::vector<std::string> unmatched;
    auto note = [&](const std::string& id) {
        if (used.count(id) == 0 && std::find(unmatched.begin(), unmatched.end(), id) == unmatched.end()) {
            unmatched.push_back(id);
        }
    };
    for (const auto& [id, values] : cases) note(id);
    for (const auto& [id, values] : branches) note(id);
    for (const auto& [id, values] : tags) note(id);
    return unmatched;
}

GoldenValues load_golden_values(const std::filesystem::path& file) {
    using nlohmann::json;

    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open golden value file: " + file.string());
    }
    const json doc = json::parse(input, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw std::runtime_error("Golden value file is not a JSON object: " + file.string());
    }

    GoldenValues golden;
    auto string_of = [&](const json& value, const std::string& context) {
        if (!value.is_string()) {
            throw std::runtime_error("Expected a string at " + context);
        }
        return value.get<std::string>();
    };

    if (const auto cases = doc.find("cases"); cases != doc.end()) {
        if (!cases->is_object()) {
            throw std::runtime_error("'cases' must be an object in " + file.string());
        }
        for (const auto& [id, per_variant] : cases->items()) {
            if (!per_variant.is_object()) {
                throw std::runtime_error("cases." + id + " must be an object in " + file.string());
            }
            for (const auto& [tag, value] : per_variant.items()) {
                const auto context = file.string() + ": cases." + id + "." + tag;
                const auto variant = parse_variant_tag(tag);
                if (!variant) {
                    throw std::runtime_error("Unknown variant '" + tag + "' at " + context);
                }
                auto text = string_of(value, context);
                check_golden(text, *variant, context);
                golden.cases[id][*variant] = std::move(text);
            }
        }
    }

    if (const auto refs = doc.find("references"); refs != doc.end()) {
        if (!refs->is_object()) {
            throw std::runtime_error("'references' must be an object in " + file.string());
        }
        for (const auto& [id, entry] : refs->items()) {
            if (!entry.is_object()) {
                throw std::runtime_error("references." + id + " must be an object in " + file.string());
            }
            for (const char* section : {"branches", "tags"}) {
                const auto it = entry.find(section);
                if (it == entry.end()) continue;
                if (!it->is_object()) {
                    throw std::runtime_error("references." + id + "." + section + " must be an object in " +
                                             file.string());
                }
                auto& target = std::string_view{section} == "branches" ? golden.branches[id] : golden.tags[id];
                for (const auto& [name, value] : it->items()) {
                    const auto context = file.string() + ": references." + id + "." + section + "." + name;
                    auto text = string_of(value, context);
                    check_golden(text, std::nullopt, context);
                    target[name] = std::move(text);
                }
            }
        }
    }
    return golden;
}

}  // namespace swhid::conformance
