#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "jpatch/Diff.hpp"
#include "jpatch/DiffOptions.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/Logging.hpp"
#include "jpatch/Patch.hpp"
#include "jpatch/Validate.hpp"

using namespace jpatch;

namespace {

Value read_json_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw FileNotFoundError(path);
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    try {
        return Value::parse(ss.str());
    } catch (const Value::parse_error& e) {
        throw DocumentParseError(path, e.what());
    }
}

// Try parsing string as JSON, otherwise take it as a plain string.
Value parse_json_or_string(const std::string& raw) {
    try {
        return Value::parse(raw);
    } catch (const Value::parse_error&) {
        return Value(raw);
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("jpatch", "Apply and generate JSON Patch (RFC 6902) documents");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("indent", "Indentation of JSON output (-1 for compact)", cxxopts::value<int>()->default_value("2"))
            ("o,out", "Write output to FILE instead of stdout", cxxopts::value<std::string>())
            ("options", "Diff options file (.json or .toml)", cxxopts::value<std::string>())
            ("id", "Identity key for a list, as POINTER=KEY (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("no-lcs", "Replace lists without an identity key instead of LCS diffing")
            ("max-depth", "Maximum nesting depth for diff", cxxopts::value<std::size_t>())
            ("v,verbose", "Debug logging to stderr")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: apply DOC PATCH | diff FROM TO | validate PATCH | get DOC POINTER | test DOC POINTER VALUE\n";
            return 0;
        }

        if (result.count("verbose")) {
            logger()->set_level(spdlog::level::debug);
        }

        const int indent = result["indent"].as<int>();
        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                std::exit(1);
            }
        };

        auto emit = [&](const std::string& text) {
            if (result.count("out")) {
                const std::string out = result["out"].as<std::string>();
                std::ofstream ofs(out);
                if (!ofs) {
                    std::cerr << "Error: cannot write to " << out << "\n";
                    return 1;
                }
                ofs << text << "\n";
                return 0;
            }
            std::cout << text << "\n";
            return 0;
        };

        // APPLY
        if (cmd == "apply") {
            expect_args(3);
            Value doc = read_json_file(cmdv[1]);
            Value patch = read_json_file(cmdv[2]);
            PointerCache cache;
            return emit(jpatch::apply(doc, patch, &cache).dump(indent));
        }

        // DIFF
        if (cmd == "diff") {
            expect_args(3);
            DiffOptions diff_options;
            if (result.count("options")) {
                diff_options = load_diff_options(result["options"].as<std::string>());
            }
            if (result.count("id")) {
                for (const auto& entry : result["id"].as<std::vector<std::string>>()) {
                    auto pos = entry.rfind('=');
                    if (pos == std::string::npos || pos + 1 == entry.size()) {
                        std::cerr << "Error: --id expects POINTER=KEY, got '" << entry << "'\n";
                        return 1;
                    }
                    diff_options.list_identity_by_pointer[entry.substr(0, pos)] = entry.substr(pos + 1);
                }
            }
            if (result.count("no-lcs")) diff_options.use_lcs = false;
            if (result.count("max-depth")) diff_options.max_depth = result["max-depth"].as<std::size_t>();

            Value from = read_json_file(cmdv[1]);
            Value to = read_json_file(cmdv[2]);
            return emit(patch_to_json(jpatch::diff(from, to, diff_options)).dump(indent));
        }

        // VALIDATE
        if (cmd == "validate") {
            expect_args(2);
            auto errors = validate(read_json_file(cmdv[1]));
            if (errors.empty()) {
                std::cout << "valid\n";
                return 0;
            }
            for (const auto& e : errors) {
                std::cout << e << "\n";
            }
            return 1;
        }

        // GET
        if (cmd == "get") {
            expect_args(3);
            Value doc = read_json_file(cmdv[1]);
            return emit(jpatch::get(doc, cmdv[2]).dump(indent));
        }

        // TEST
        if (cmd == "test") {
            expect_args(4);
            Value doc = read_json_file(cmdv[1]);
            bool ok = jpatch::test(doc, cmdv[2], parse_json_or_string(cmdv[3]));
            std::cout << (ok ? "true" : "false") << "\n";
            return ok ? 0 : 1;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const PatchError& pe) {
        std::cerr << "Error: " << pe.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
