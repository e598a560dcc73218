// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file main.cpp
/// @brief Command-line structural diff of two JSON files
///
/// Usage:
///   struct_diff_cli left.json right.json                  # Diff list
///   struct_diff_cli --keys left.json right.json           # Also list identity keys
///   struct_diff_cli --ignore "meta.*" a.json b.json       # Suppress a family of diffs
///   struct_diff_cli --config diff.json --json a.json b.json
///
/// Exit status: 0 no differences, 1 differences found, 2 error.

#include <struct_diff/options.h>
#include <struct_diff/pattern.h>
#include <struct_diff/serialization.h>
#include <struct_diff/value_diff.h>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace struct_diff;

namespace {

constexpr int EXIT_NO_DIFFS = 0;
constexpr int EXIT_DIFFS    = 1;
constexpr int EXIT_ERROR    = 2;

void print_usage(const char* program)
{
    std::cout << "Structural JSON diff with identity-key matching for arrays\n\n";
    std::cout << "Usage: " << program << " [options] left.json right.json\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config FILE     Load detector settings and ignore patterns from FILE\n";
    std::cout << "  --ignore PATTERN  Suppress diffs whose address matches PATTERN (repeatable)\n";
    std::cout << "  --expand          Report one-sided subtrees leaf by leaf\n";
    std::cout << "  --keys            Print the identity key chosen for every array\n";
    std::cout << "  --json            Emit the diff list as JSON\n";
    std::cout << "  --help, -h        Show this help\n";
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    std::string config_path;
    std::vector<std::string> ignore_patterns;
    std::vector<std::string> files;
    bool expand = false;
    bool show_keys = false;
    bool json_output = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--ignore") {
            if (i + 1 >= argc) {
                std::cerr << "error: " << arg << " needs an argument\n";
                return EXIT_ERROR;
            }
            (arg == "--config" ? config_path : ignore_patterns.emplace_back()) = argv[++i];
        } else if (arg == "--expand") {
            expand = true;
        } else if (arg == "--keys") {
            show_keys = true;
        } else if (arg == "--json") {
            json_output = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_NO_DIFFS;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "error: unknown option " << arg << "\n";
            return EXIT_ERROR;
        } else {
            files.push_back(std::move(arg));
        }
    }

    if (files.size() != 2) {
        print_usage(argv[0]);
        return EXIT_ERROR;
    }

    try {
        DiffConfig config = config_path.empty() ? DiffConfig{} : load_options(config_path);
        if (expand) {
            config.compare.expand_one_sided = true;
        }
        config.ignore.insert(config.ignore.end(), ignore_patterns.begin(), ignore_patterns.end());
        const IgnoreList ignore = config.ignore_list();

        const Value left = load_json_file(files[0]);
        const Value right = load_json_file(files[1]);

        auto result = compare(left, right, config.compare);
        auto diffs = ignore.filter(result.diffs);

        if (json_output) {
            std::cout << to_json(diffs_to_value(diffs), false) << "\n";
        } else {
            if (show_keys) {
                std::cout << "Identity keys:\n";
                print_identity_keys(result.identity_keys, std::cout);
                std::cout << "Differences:\n";
            }
            print_diffs(diffs, std::cout);
        }
        return diffs.empty() ? EXIT_NO_DIFFS : EXIT_DIFFS;
    } catch (const JsonParseError& e) {
        std::cerr << "error: malformed JSON at offset " << e.offset() << ": " << e.what() << "\n";
    } catch (const AddressError& e) {
        std::cerr << "error: bad ignore pattern: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
    }
    return EXIT_ERROR;
}
