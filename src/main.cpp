/// @file src/main.cpp
/// @brief vitalog CLI entry point.
///
/// Usage:
///   vitalog --parse <text...>                      Parse one entry
///   vitalog --stream                               Parse one entry per stdin line
///   vitalog --alias-list [category]                Print aliases
///   vitalog --alias-search <term>                  Search aliases
///   vitalog --alias-add <category> <abbrev> <canonical...>
///   vitalog --alias-remove <category> <abbrev>
///   vitalog --help                                 Print usage
///
/// Options (anywhere on the command line):
///   --aliases <file>   Alias file (default config/aliases.json)
///   --json             Print the export form instead of the display string

#include "vitalog/alias_config.hpp"
#include "vitalog/aliases.hpp"
#include "vitalog/entry.hpp"
#include "vitalog/parser.hpp"

#include "util/text.hpp"

#include <fmt/core.h>
#include <fmt/std.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* DEFAULT_ALIAS_FILE = "config/aliases.json";

struct Options {
    std::filesystem::path    alias_file = DEFAULT_ALIAS_FILE;
    bool                     json       = false;
    std::vector<std::string> args;  ///< Mode flag and its operands
};

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  vitalog --parse <text...>                  Parse one entry\n"
        "  vitalog --stream                           Parse one entry per stdin line\n"
        "  vitalog --alias-list [category]            List aliases\n"
        "  vitalog --alias-search <term>              Search aliases\n"
        "  vitalog --alias-add <category> <abbrev> <canonical...>\n"
        "  vitalog --alias-remove <category> <abbrev>\n"
        "  vitalog --help                             Show this help\n"
        "\n"
        "Options:\n"
        "  --aliases <file>   Alias file (default {})\n"
        "  --json             Print the export form\n"
        "\n"
        "Entry examples:\n"
        "  squat 100 3x5 rpe8 @gym\n"
        "  hr 58 resting postprandial @oura\n"
        "  @14:30 temp 37.2 oral\n",
        DEFAULT_ALIAS_FILE
    );
}

/// Pull `--aliases` and `--json` out of argv; everything else is kept in order.
/// Returns nullopt on a malformed option.
std::optional<Options> parse_options(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--aliases") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: --aliases requires a file path\n");
                return std::nullopt;
            }
            options.alias_file = argv[++i];
        } else if (arg == "--json") {
            options.json = true;
        } else {
            options.args.push_back(arg);
        }
    }
    return options;
}

std::string join(const std::vector<std::string>& words, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < words.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += words[i];
    }
    return out;
}

/// Load the alias file, or start empty when it does not exist.
std::optional<vitalog::aliases::AliasMap> load_aliases(const std::filesystem::path& path) {
    using vitalog::config::AliasConfigLoader;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        fmt::print(stderr, "[vitalog] Alias file {} not found, starting with no aliases\n", path);
        return AliasConfigLoader::empty_map();
    }
    return AliasConfigLoader::load_file(path);
}

/// Parse one line and print it. Returns false on a parse error.
bool parse_and_print(const vitalog::parser::EntryParser& parser,
                     const std::string& text, bool json) {
    try {
        const auto entry = parser.parse(text);
        if (json) {
            fmt::print("{}\n", vitalog::entry::to_json(entry).dump());
        } else {
            fmt::print("{}\n", vitalog::entry::display(entry));
        }
        return true;
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "Parse error: {}\n", e.what());
        return false;
    }
}

int run_parse(const vitalog::aliases::AliasResolver& aliases, const Options& options) {
    const std::string text = join(options.args, 1);
    if (text.empty()) {
        fmt::print(stderr, "Error: --parse requires entry text\n");
        return 1;
    }
    const vitalog::parser::EntryParser parser(aliases);
    return parse_and_print(parser, text, options.json) ? 0 : 1;
}

/// Parse stdin line by line. Blank lines and `#` comments are skipped; a bad
/// line is reported and the stream continues.
int run_stream(const vitalog::aliases::AliasResolver& aliases, bool json) {
    const vitalog::parser::EntryParser parser(aliases);

    std::string line;
    std::size_t parsed = 0;
    std::size_t failed = 0;

    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos || line[0] == '#') {
            continue;
        }
        if (parse_and_print(parser, line, json)) {
            ++parsed;
        } else {
            ++failed;
        }
    }

    fmt::print(stderr, "Parsed {} entries, {} failed.\n", parsed, failed);
    return failed == 0 ? 0 : 1;
}

int run_alias_list(const vitalog::aliases::AliasResolver& aliases, const Options& options) {
    const auto table = aliases.snapshot();

    for (const auto& [category, mapping] : table->categories()) {
        if (options.args.size() > 1 && category != options.args[1]) {
            continue;
        }
        fmt::print("{}:\n", category);
        for (const auto& [abbreviation, canonical] : mapping) {
            fmt::print("  {:<12} → {}\n", abbreviation, canonical);
        }
    }
    return 0;
}

int run_alias_search(const vitalog::aliases::AliasResolver& aliases, const Options& options) {
    if (options.args.size() < 2) {
        fmt::print(stderr, "Error: --alias-search requires a term\n");
        return 1;
    }
    const auto matches = aliases.search(join(options.args, 1));
    for (const auto& match : matches) {
        fmt::print("{:<12} {:<12} → {}\n", match.category, match.abbreviation, match.canonical);
    }
    if (matches.empty()) {
        fmt::print("No aliases match '{}'\n", join(options.args, 1));
    }
    return 0;
}

bool persist(const vitalog::aliases::AliasResolver& aliases, const std::filesystem::path& path) {
    if (!vitalog::config::AliasConfigLoader::save_file(path, aliases.snapshot()->categories())) {
        fmt::print(stderr, "Error: could not save aliases to {}\n", path);
        return false;
    }
    return true;
}

int run_alias_add(vitalog::aliases::AliasResolver& aliases, const Options& options) {
    if (options.args.size() < 4) {
        fmt::print(stderr, "Error: --alias-add requires <category> <abbrev> <canonical>\n");
        return 1;
    }
    // Entries are lowercased before lookup, so keys must be too.
    const std::string category = vitalog::util::to_lower(options.args[1]);
    const std::string abbreviation = vitalog::util::to_lower(options.args[2]);
    const std::string canonical = join(options.args, 3);

    if (!aliases.add(category, abbreviation, canonical)) {
        fmt::print(stderr, "Error: '{}' is already an alias in {} (→ {})\n", abbreviation,
                   category, aliases.resolve(category, abbreviation));
        return 1;
    }
    if (!persist(aliases, options.alias_file)) {
        return 1;
    }
    fmt::print("Added {}: {} → {}\n", category, abbreviation, canonical);
    return 0;
}

int run_alias_remove(vitalog::aliases::AliasResolver& aliases, const Options& options) {
    if (options.args.size() < 3) {
        fmt::print(stderr, "Error: --alias-remove requires <category> <abbrev>\n");
        return 1;
    }
    const std::string category = vitalog::util::to_lower(options.args[1]);
    const std::string abbreviation = vitalog::util::to_lower(options.args[2]);

    if (!aliases.remove(category, abbreviation)) {
        fmt::print(stderr, "Error: '{}' is not an alias in {}\n", abbreviation, category);
        return 1;
    }
    if (!persist(aliases, options.alias_file)) {
        return 1;
    }
    fmt::print("Removed {}: {}\n", category, abbreviation);
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    const auto options = parse_options(argc, argv);
    if (!options) {
        print_usage();
        return 1;
    }
    if (options->args.empty()) {
        print_usage();
        return 1;
    }

    const std::string& mode = options->args.front();

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    auto initial = load_aliases(options->alias_file);
    if (!initial) {
        fmt::print(stderr, "Error: cannot load aliases from {}\n", options->alias_file);
        return 1;
    }
    vitalog::aliases::AliasResolver aliases(std::move(*initial));

    if (mode == "--parse")        return run_parse(aliases, *options);
    if (mode == "--stream")       return run_stream(aliases, options->json);
    if (mode == "--alias-list")   return run_alias_list(aliases, *options);
    if (mode == "--alias-search") return run_alias_search(aliases, *options);
    if (mode == "--alias-add")    return run_alias_add(aliases, *options);
    if (mode == "--alias-remove") return run_alias_remove(aliases, *options);

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
