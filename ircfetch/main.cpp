#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "asio_irc_client.hpp"
#include "config.hpp"
#include "error.hpp"
#include "event_bus.hpp"
#include "fetch_orchestrator.hpp"
#include "search.hpp"
#include "session_state.hpp"
#include "types.h"

struct Options {
    std::string config{Command::DEFAULT_CONFIG};
    std::optional<std::string> search;
    std::optional<std::string> fetch;
    bool help = false;
};

static bool parse_options(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                Error::missing_value(std::string(arg));
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string v;
        if (arg == Command::HELP || arg == Command::HELP_SHORT) {
            options.help = true;
        } else if (arg == Command::CONFIG || arg == Command::CONFIG_SHORT) {
            if (!value(options.config)) return false;
        } else if (arg == Command::SEARCH || arg == Command::SEARCH_SHORT) {
            if (!value(v)) return false;
            options.search = v;
        } else if (arg == Command::FETCH || arg == Command::FETCH_SHORT) {
            if (!value(v)) return false;
            options.fetch = v;
        } else {
            Error::unknown_option(std::string(arg));
            return false;
        }
    }
    return true;
}

static json options_to_json(const Options& options) {
    json data = {{"config", options.config}, {"search", nullptr}, {"fetch", nullptr}};
    if (options.search) data["search"] = *options.search;
    if (options.fetch) data["fetch"] = *options.fetch;
    return data;
}

int main(int argc, char* argv[]) {
    Options options;
    if (!parse_options(argc, argv, options)) {
        return 1;
    }
    if (options.help) {
        Error::print_usage();
        return 0;
    }

    Settings settings;
    try {
        settings = Config::load(options.config);
    } catch (const Config::ConfigError& e) {
        Error::invalid_config(e.what());
        return 1;
    }

    EventBus bus;
    bus.subscribe(EventLogger(std::cout));
    SessionState state(bus, settings);
    bus.push(EventType::Options, options_to_json(options));

    if (!options.fetch) {
        std::vector<std::string> results;
        try {
            results = Search::search_resources(state.resource_file_path(), options.search.value_or(""), bus);
        } catch (const std::exception& e) {
            bus.flush();
            std::cerr << "Search failed: " << e.what() << std::endl;
            return 1;
        }
        bus.flush();
        for (const auto& result : results) {
            std::cout << json(result).dump() << std::endl;
        }
        return 0;
    }

    AsioIrcClient client(settings.irc);
    FetchOrchestrator orchestrator(state, client);
    FetchStatus status = orchestrator.run(*options.fetch);
    bus.flush();
    return status == FetchStatus::Completed ? 0 : 1;
}
