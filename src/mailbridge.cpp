// 1. Standard includes in alphabetic order
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

// 2. Libraries used in the project, in alphabetic order
#include <glaze/glaze.hpp>

// 3. All other includes
#include "cache/result_cache.hpp"
#include "config/settings.hpp"
#include "helpers/debug.hpp"
#include "helpers/properties.hpp"
#include "helpers/worker_pool.hpp"
#include "hosts/mailbox_host.hpp"
#include "mcp/stdio_server.hpp"
#include "mcp/tool_dispatcher.hpp"
#include "models/mail/connector.hpp"
#include "models/mail/errors.hpp"
#include "models/mail/imap_store.hpp"
#include "search/search_engine.hpp"
#include "views/chain_view.hpp"

namespace {
    struct command_line {
        std::filesystem::path config_path;
        bool check_only{false};
    };

    command_line parse_command_line(int argc, char** argv) {
        command_line cmd;
        for (int i = 1; i < argc; ++i) {
            std::string_view arg{argv[i]};
            if (arg == "--config" && i + 1 < argc) {
                cmd.config_path = argv[++i];
            } else if (arg == "--check") {
                cmd.check_only = true;
            } else {
                SYS_WARN_FMT("Ignoring unknown argument: {}", arg);
            }
        }
        if (cmd.config_path.empty()) {
            auto from_env = std::getenv("MAILBRIDGE_CONFIG");
            cmd.config_path = from_env ? from_env : "config.properties";
        }
        return cmd;
    }
}

int main(int argc, char** argv) {
    using namespace mailbridge;

    auto cmd = parse_command_line(argc, argv);

    helpers::properties props;
    props.load(cmd.config_path);
    auto settings = config::settings::from(props);
    auto config_text = settings.describe();
    CONFIG_INFO_FMT("Configuration from {}:\n{}", cmd.config_path.string(), config_text);

    if (settings.imap_url.empty()) {
        SYS_ERROR("imap_url is not set (config file or MAILBRIDGE_IMAP_URL)");
        return EXIT_FAILURE;
    }
    if (!settings.shared_configured()) {
        SYS_WARN("Shared mailbox not configured, only the personal mailbox will be searched");
    }

    mail::imap_store store{settings.imap()};
    mail::connector connector{store, settings.connector()};
    cache::result_cache cache{settings.cache_capacity, std::chrono::minutes{settings.cache_ttl_minutes}};

    // Two pools: a tool call blocks on its mailbox searches, which must not queue behind it
    helpers::worker_pool request_pool{settings.worker_threads, "requests"};
    helpers::worker_pool mailbox_pool{settings.worker_threads * 2, "mailboxes"};
    SYS_DEBUG_FMT("{} request workers, {} mailbox workers", request_pool.size(), mailbox_pool.size());

    hosts::mailbox_host host{connector, cache, search::search_engine{settings.search()}, mailbox_pool, settings.host()};
    mcp::tool_dispatcher dispatcher{host, settings.format(), settings.scope(), settings.max_search_results};

    // Startup diagnostics: an unreachable mail store is fatal
    try {
        auto report = host.check_access();
        auto payload = mcp::to_json(views::format_access(report));
        if (cmd.check_only) {
            std::cout << payload << std::endl;
            return report.errors.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
        }
        SYS_INFO_FMT("Mailbox access: {}", payload);
    } catch (const mail::connection_error& e) {
        SYS_ERROR_FMT("Cannot reach the mail store: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        SYS_ERROR_FMT("Startup check failed: {}", e.what());
        return EXIT_FAILURE;
    }

    mcp::stdio_server server{dispatcher, request_pool, config_text};
    auto rc = server.run();
    SYS_INFO("Server stopped");
    return rc;
}
