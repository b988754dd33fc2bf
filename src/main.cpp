#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "cli/edit_script.hpp"
#include "config/engine_config.hpp"
#include "engine/edit_engine.hpp"
#include "geometry/boost_kernel.hpp"
#include "store/store_file.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

namespace {

struct Options {
    std::string store_path;
    std::string script_path;
    std::string output_path;
    std::string config_path;
};

void print_usage() {
    std::cerr << "usage: geoedit <store.json> <script.json> [-o out.json] "
                 "[-c config.json]"
              << std::endl;
}

bool parse_args(int argc, char **argv, Options &options) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "-o" || arg == "-c") && i + 1 < argc) {
            (arg == "-o" ? options.output_path : options.config_path) =
                argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            return false;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2)
        return false;
    options.store_path = positional[0];
    options.script_path = positional[1];
    return true;
}

void report(const geoedit::TransactionPtr &record) {
    if (!record) {
        std::cout << "nothing to undo/redo" << std::endl;
        return;
    }

    std::string created;
    for (const auto &outcome : record->outcomes()) {
        for (const auto &ref : outcome.created)
            created += (created.empty() ? "" : ", ") + fmt::format("{}", ref);
    }

    std::cout << fmt::format("#{} {} '{}': {} features changed", record->sequence(),
                             geoedit::to_string(record->state()), record->name(),
                             record->changes().size());
    if (!created.empty())
        std::cout << ", created " << created;
    std::cout << std::endl;
}

void run(const Options &options) {
    LOG_INFO("Starting geoedit");

    geoedit::EngineConfig config;
    if (!options.config_path.empty())
        config = geoedit::EngineConfig::load(options.config_path);
    if (const auto level =
            geoedit::Logger::level_from_string(config.log_level))
        geoedit::Logger::set_min_level(*level);

    geoedit::FeatureStore store;
    geoedit::StoreFile::load(options.store_path, store);

    const auto script = geoedit::EditScript::load(options.script_path);

    geoedit::EditEngine engine(
        store,
        std::make_shared<geoedit::BoostGeometryKernel>(config.merge_tolerance),
        config);

    for (const auto &record : script.run(engine))
        report(record);

    if (!options.output_path.empty())
        geoedit::StoreFile::save(options.output_path, store);
}

} // namespace

int main(int argc, char **argv) {
    Options options;
    if (!parse_args(argc, argv, options)) {
        print_usage();
        return 1;
    }

    try {
        run(options);
        LOG_INFO("geoedit finished normally");
        return 0;
    } catch (const geoedit::GeoEditException &e) {
        LOG_ERROR("geoedit error: " + std::string(e.what()));
        std::cerr << geoedit::error_kind(e) << ": " << e.what() << std::endl;
        return 2;
    } catch (const std::exception &e) {
        LOG_ERROR("Standard error: " + std::string(e.what()));
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 2;
    }
}
