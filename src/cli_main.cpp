#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "catrec/Catalog.hpp"
#include "catrec/Codec.hpp"
#include "catrec/Errors.hpp"
#include "catrec/Logging.hpp"
#include "catrec/Settings.hpp"
#include "catrec/Store.hpp"

using namespace catrec;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("catrec", "Merge partial catalog records from independent sources");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("strict", "Fail on identity mismatch instead of warning")
            ("log-level", "Log level (trace, debug, info, warn, err, critical, off)", cxxopts::value<std::string>())
            ("set", "Override one setting, KEY=VALUE (repeatable, e.g. log.pattern=%v)", cxxopts::value<std::vector<std::string>>())
            ("o,out", "Write the merged store here instead of back to STORE", cxxopts::value<std::string>())
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: merge STORE INCOMING | show STORE | find STORE ID TOKEN\n";
            return 0;
        }

        SettingsLoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        if (result.count("set")) {
            for (const auto& assignment : result["set"].as<std::vector<std::string>>()) {
                const auto eq = assignment.find('=');
                if (eq == std::string::npos) {
                    std::cerr << "Error: --set expects KEY=VALUE, got '" << assignment << "'\n";
                    return 1;
                }
                load.overrides[assignment.substr(0, eq)] = assignment.substr(eq + 1);
            }
        }
        if (result.count("strict")) load.overrides["merge.identity_policy"] = "strict";
        if (result.count("log-level")) load.overrides["log.level"] = result["log-level"].as<std::string>();

        Settings settings = load_settings(load);
        init_logging(settings);

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                return false;
            }
            return true;
        };

        // MERGE
        if (cmd == "merge") {
            if (!expect_args(3)) return 1;
            const std::string store_path = cmdv[1];
            const std::string out = result.count("out") ? result["out"].as<std::string>() : store_path;

            Catalog catalog(settings.merge);
            for (const auto& r : load_store_file(store_path)) catalog.upsert(r);

            size_t merged_count = 0;
            size_t added_count = 0;
            for (const auto& r : load_store_file(cmdv[2])) {
                if (catalog.upsert(r)) ++merged_count;
                else ++added_count;
            }

            save_store_file(out, catalog.snapshot());
            std::cout << "Merged " << merged_count << ", added " << added_count
                      << ", wrote " << catalog.size() << " records to " << out << "\n";
            return 0;
        }

        // SHOW
        if (cmd == "show") {
            if (!expect_args(2)) return 1;
            std::cout << encode_document(load_store_file(cmdv[1])).dump(2) << "\n";
            return 0;
        }

        // FIND
        if (cmd == "find") {
            if (!expect_args(4)) return 1;
            Record wanted(std::stoll(cmdv[2]), cmdv[3]);
            std::vector<Record> records = load_store_file(cmdv[1]);
            if (!merge_first_match(wanted, records, settings.merge)) {
                std::cerr << "Not found: " << to_string(wanted.identity()) << "\n";
                return 1;
            }
            std::cout << to_json(wanted).dump(2) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const CatrecError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
