#pragma once

#include <chrono>
#include <cstdlib>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include "../helpers/debug.hpp"
#include "../helpers/properties.hpp"
#include "../hosts/mailbox_host.hpp"
#include "../models/mail/connector.hpp"
#include "../models/mail/imap_session.hpp"
#include "../search/strategies.hpp"
#include "../views/chain_view.hpp"

namespace mailbridge::config {
    /**
     * Effective configuration: properties file values over environment
     * fallbacks over built-in defaults.
     */
    struct settings {
        std::string imap_url;
        std::string imap_username;
        std::string imap_password;
        bool use_extended_mapi_login{true};

        std::string shared_mailbox_email;
        std::string shared_mailbox_name{"Shared Mailbox"};
        std::string shared_namespace_prefix{"shared/"};
        int personal_retention_months{6};
        int shared_retention_months{12};

        std::size_t max_search_results{500};
        std::size_t max_body_chars{0};
        bool search_all_folders{false};
        std::size_t max_search_body_chars{0};
        std::size_t max_scan_items{500};
        int index_search_timeout_seconds{30};
        std::size_t batch_processing_size{50};
        std::size_t max_recipients_display{10};
        bool clean_html_content{true};

        int connection_timeout_minutes{10};
        int max_connection_retries{3};

        int cache_ttl_minutes{60};
        std::size_t cache_capacity{100};
        std::size_t worker_threads{4};

        static settings from(const helpers::properties& props) {
            settings s;
            s.imap_url = string_or_env(props, "imap_url", "MAILBRIDGE_IMAP_URL");
            s.imap_username = string_or_env(props, "imap_username", "MAILBRIDGE_IMAP_USER");
            s.imap_password = string_or_env(props, "imap_password", "MAILBRIDGE_IMAP_PASSWORD");
            s.use_extended_mapi_login = props.get_bool("use_extended_mapi_login", s.use_extended_mapi_login);

            s.shared_mailbox_email = props.get_string("shared_mailbox_email");
            s.shared_mailbox_name = props.get_string("shared_mailbox_name", s.shared_mailbox_name);
            s.shared_namespace_prefix = props.get_string("shared_namespace_prefix", s.shared_namespace_prefix);
            s.personal_retention_months = positive(props, "personal_retention_months", s.personal_retention_months);
            s.shared_retention_months = positive(props, "shared_retention_months", s.shared_retention_months);

            s.max_search_results = positive(props, "max_search_results", s.max_search_results);
            s.max_body_chars = non_negative(props, "max_body_chars", s.max_body_chars);
            s.search_all_folders = props.get_bool("search_all_folders", s.search_all_folders);
            s.max_search_body_chars = non_negative(props, "max_search_body_chars", s.max_search_body_chars);
            s.max_scan_items = positive(props, "max_scan_items", s.max_scan_items);
            s.index_search_timeout_seconds = positive(props, "index_search_timeout_seconds", s.index_search_timeout_seconds);
            s.batch_processing_size = positive(props, "batch_processing_size", s.batch_processing_size);
            s.max_recipients_display = non_negative(props, "max_recipients_display", s.max_recipients_display);
            s.clean_html_content = props.get_bool("clean_html_content", s.clean_html_content);

            s.connection_timeout_minutes = positive(props, "connection_timeout_minutes", s.connection_timeout_minutes);
            auto retries_key = props.contains("max_connection_retries") ? "max_connection_retries" : "max_retry_attempts";
            s.max_connection_retries = positive(props, retries_key, s.max_connection_retries);

            s.cache_ttl_minutes = positive(props, "cache_ttl_minutes", s.cache_ttl_minutes);
            s.cache_capacity = positive(props, "cache_capacity", s.cache_capacity);
            s.worker_threads = positive(props, "worker_threads", s.worker_threads);
            return s;
        }

        // Placeholder addresses left over from the sample file count as unset
        bool shared_configured() const {
            return !shared_mailbox_email.empty() &&
                   shared_mailbox_email.find("your-shared-mailbox") == std::string::npos &&
                   !shared_mailbox_email.ends_with("example.com");
        }

        mail::imap_options imap() const {
            mail::imap_options options;
            options.url = imap_url;
            options.username = imap_username;
            options.password = imap_password;
            options.sasl_login = use_extended_mapi_login;
            if (shared_configured()) {
                options.shared_email = shared_mailbox_email;
            }
            options.shared_name = shared_mailbox_name;
            options.shared_prefix = shared_namespace_prefix;
            options.personal_retention_months = personal_retention_months;
            options.shared_retention_months = shared_retention_months;
            options.connect_timeout = std::chrono::minutes{connection_timeout_minutes};
            options.batch_size = batch_processing_size;
            options.clean_html = clean_html_content;
            return options;
        }

        mail::connector_options connector() const {
            return {max_connection_retries, std::chrono::seconds{1}, std::chrono::minutes{connection_timeout_minutes}};
        }

        search::search_options search() const {
            search::search_options options;
            options.index_timeout = std::chrono::seconds{index_search_timeout_seconds};
            options.max_scan_items = max_scan_items;
            options.max_search_body_chars = max_search_body_chars;
            options.batch_size = batch_processing_size;
            return options;
        }

        hosts::host_options host() const {
            return {shared_configured(), shared_mailbox_name};
        }

        views::format_options format() const {
            return {max_body_chars, max_recipients_display};
        }

        mail::search_scope scope() const {
            return search_all_folders ? mail::search_scope::all_folders : mail::search_scope::inbox_only;
        }

        // Human readable dump, password masked
        std::string describe() const {
            std::string out;
            auto line = [&out](std::string_view key, const auto& value) {
                out += std::format("{} = {}\n", key, value);
            };
            line("imap_url", imap_url);
            line("imap_username", imap_username);
            line("imap_password", imap_password.empty() ? "(not set)" : "********");
            line("use_extended_mapi_login", use_extended_mapi_login);
            line("shared_mailbox_email", shared_configured() ? shared_mailbox_email : std::string{"(not configured)"});
            line("shared_mailbox_name", shared_mailbox_name);
            line("shared_namespace_prefix", shared_namespace_prefix);
            line("personal_retention_months", personal_retention_months);
            line("shared_retention_months", shared_retention_months);
            line("max_search_results", max_search_results);
            line("max_body_chars", max_body_chars);
            line("search_all_folders", search_all_folders);
            line("max_search_body_chars", max_search_body_chars);
            line("max_scan_items", max_scan_items);
            line("index_search_timeout_seconds", index_search_timeout_seconds);
            line("batch_processing_size", batch_processing_size);
            line("max_recipients_display", max_recipients_display);
            line("clean_html_content", clean_html_content);
            line("connection_timeout_minutes", connection_timeout_minutes);
            line("max_connection_retries", max_connection_retries);
            line("cache_ttl_minutes", cache_ttl_minutes);
            line("cache_capacity", cache_capacity);
            line("worker_threads", worker_threads);
            return out;
        }

    private:
        static std::string string_or_env(const helpers::properties& props, std::string_view key, const char* env) {
            auto value = props.get_string(key);
            if (!value.empty()) {
                return value;
            }
            if (auto from_env = std::getenv(env)) {
                return from_env;
            }
            return {};
        }

        template <typename T>
        static T positive(const helpers::properties& props, std::string_view key, T fallback) {
            auto value = props.get_int(key, static_cast<long long>(fallback));
            if (value <= 0) {
                CONFIG_WARN_FMT("{} must be positive, using {}", key, fallback);
                return fallback;
            }
            return static_cast<T>(value);
        }

        template <typename T>
        static T non_negative(const helpers::properties& props, std::string_view key, T fallback) {
            auto value = props.get_int(key, static_cast<long long>(fallback));
            if (value < 0) {
                CONFIG_WARN_FMT("{} must not be negative, using {}", key, fallback);
                return fallback;
            }
            return static_cast<T>(value);
        }
    };
}
