/**
 * @file Cli.cpp
 * @brief Command-line front end of confmerge
 */

#include "confmerge/Cli.hpp"
#include "confmerge/Errors.hpp"
#include "confmerge/Log.hpp"
#include "confmerge/Merge.hpp"
#include "confmerge/Options.hpp"
#include "confmerge/Policy.hpp"
#include "confmerge/Serialize.hpp"

#include <cxxopts.hpp>

#include <exception>
#include <ostream>
#include <string>
#include <vector>

namespace confmerge {

int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err) {
    cxxopts::Options options("confmerge", "Merge JSON/TOML/YAML configuration documents with path-based conflict policies");
    options.positional_help("SOURCE...");

    options.add_options()
        ("c,config", "Path to JSON/TOML/YAML merge options file", cxxopts::value<std::string>())
        ("d,files-dir", "Base directory for sources", cxxopts::value<std::string>())
        ("overwrite", "Comma-separated overwrite patterns", cxxopts::value<std::string>()->default_value(""))
        ("append", "Comma-separated append patterns", cxxopts::value<std::string>()->default_value(""))
        ("resolve-path", "Comma-separated resolve-path patterns", cxxopts::value<std::string>()->default_value(""))
        ("default-overwrite", "Overwrite on conflict when no pattern matches")
        ("f,format", "Output format: json|toml|yaml (default: format of first source)", cxxopts::value<std::string>())
        ("o,out", "Write output to FILE instead of stdout", cxxopts::value<std::string>())
        ("explain", "Print the policy decisions for a context path and exit", cxxopts::value<std::string>())
        ("v,verbose", "Log merge decisions")
        ("q,quiet", "Only log errors")
        ("log-level", "Log level: trace|debug|info|warn|error|off", cxxopts::value<std::string>())
        ("h,help", "Show help");

    options.add_options()
        ("sources", "Documents to merge, in order", cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"sources"});

    std::vector<std::string> sources;
    MergeOptions merge;
    std::string format_name_opt;
    std::string out_path;
    std::string explain_path;

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            out << options.help() << "\n";
            return kExitOk;
        }

        if (result.count("config")) {
            merge = load_merge_options(result["config"].as<std::string>());
        }
        if (result.count("files-dir")) merge.source_base_directory = result["files-dir"].as<std::string>();
        if (result.count("default-overwrite")) merge.default_overwrite = true;
        add_pattern_lists(merge,
                          result["overwrite"].as<std::string>(),
                          result["append"].as<std::string>(),
                          result["resolve-path"].as<std::string>());

        if (result.count("format")) format_name_opt = result["format"].as<std::string>();
        if (result.count("out")) out_path = result["out"].as<std::string>();
        if (result.count("explain")) explain_path = result["explain"].as<std::string>();
        if (result.count("sources")) sources = result["sources"].as<std::vector<std::string>>();

        if (result.count("verbose")) log::set_level(spdlog::level::debug);
        if (result.count("quiet")) log::set_level(spdlog::level::err);
        if (result.count("log-level")) {
            log::set_level(log::parse_level(result["log-level"].as<std::string>()));
        }
    } catch (const MergeError& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitError;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n" << options.help() << "\n";
        return kExitUsage;
    }

    try {
        if (!explain_path.empty()) {
            out << describe_policy(MergePolicy::build(merge.policy()), explain_path);
            return kExitOk;
        }

        if (sources.empty()) {
            err << "Error: no sources given\n" << options.help() << "\n";
            return kExitUsage;
        }

        Format format = format_name_opt.empty()
            ? format_from_path(sources.front())
            : format_from_name(format_name_opt);

        Value merged = merge_documents(merge, sources);

        if (!out_path.empty()) {
            write_document_file(out_path, merged, format);
            log::logger()->info("wrote {} to {}", format_name(format), out_path);
        } else {
            out << dump_document(merged, format);
        }
        return kExitOk;

    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitError;
    }
}

} // namespace confmerge
