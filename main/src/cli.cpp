#include "cli.hpp"
#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "packer.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <cstring>
#include <format>
#include <iostream>
#include <string>
#include <vector>

namespace {
    constexpr int EXIT_BAD_ARGUMENTS = 1;
    constexpr int EXIT_ARCHIVE_FAILED = 2;

    // The usage and invalid-format lines are fixed text, independent of the message tables
    void print_usage(const std::string& program) {
        std::cout << std::format("Usage: {} <zip|tar> <output> <file> [file ...]", program) << std::endl;
    }

    void print_invalid_format(const std::string& cmd) {
        std::cout << std::format("{} is not a valid format.", cmd) << std::endl;
    }

    // Options are only recognized before the first positional argument, so input
    // names such as "-h" or "-notes.txt" after it are archived rather than parsed.
    std::vector<const char*> separate_positionals(int argc, char* argv[]) {
        std::vector<const char*> args;
        int i = 0;
        if (argc > 0) args.push_back(argv[i++]);
        while (i < argc && argv[i][0] == '-' && argv[i][1] != '\0') {
            if (std::strcmp(argv[i], "--") == 0) break;
            args.push_back(argv[i++]);
        }
        if (i < argc && std::strcmp(argv[i], "--") != 0) {
            args.push_back("--");
        }
        for (; i < argc; ++i) {
            args.push_back(argv[i]);
        }
        return args;
    }

    cxxopts::Options build_options(const std::string& program) {
        cxxopts::Options options(program, get_string("info.description"));
        options.positional_help(get_string("info.positional_help"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("format", "", cxxopts::value<std::string>())
            ("output", "", cxxopts::value<std::string>())
            ("files", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"format", "output", "files"});
        return options;
    }
}

int run_cli(int argc, char* argv[]) {
    const std::string program = (argc > 0 && argv[0]) ? argv[0] : "arcpack";

    try {
        init_localization();

        cxxopts::Options options = build_options(program);
        auto args = separate_positionals(argc, argv);
        auto result = options.parse(static_cast<int>(args.size()), args.data());

        if (result.count("help")) {
            std::cout << options.help({""}) << std::endl;
            return 0;
        }

        set_verbose_mode(result["verbose"].as<bool>());

        std::vector<std::string> files;
        if (result.count("files")) {
            files = result["files"].as<std::vector<std::string>>();
        }

        size_t positional = result.count("format") + result.count("output") + files.size();
        if (positional < 3) {
            print_usage(program);
            return 0;
        }

        const std::string& cmd = result["format"].as<std::string>();
        auto format = parse_archive_format(cmd);
        if (!format) {
            print_invalid_format(cmd);
            return EXIT_BAD_ARGUMENTS;
        }

        const std::string& output = result["output"].as<std::string>();
        auto archive_path = pack_files(*format, output, files);
        log_info(string_format("info.pack_success", archive_path.string()));

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return EXIT_BAD_ARGUMENTS;
    } catch (const ArcpackException& e) {
        log_error(string_format("error.arcpack_error", e.what()));
        return EXIT_ARCHIVE_FAILED;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return EXIT_ARCHIVE_FAILED;
    }

    return 0;
}
