#pragma once

#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <glaze/glaze.hpp>

#include "../helpers/debug.hpp"
#include "../helpers/string_helper.hpp"
#include "../hosts/mailbox_host.hpp"
#include "../models/mail/errors.hpp"
#include "../models/mail/types.hpp"
#include "../views/alert_view.hpp"
#include "../views/chain_view.hpp"

namespace mailbridge::mcp {
    struct tool_reply {
        std::string text;       // JSON payload
        bool is_error{false};
    };

    struct error_payload {
        std::string status{"error"};
        std::string tool;
        std::string error;
        std::string message;
        std::optional<std::string> search_text;
        std::vector<std::string> troubleshooting;
    };
}

template <>
struct glz::meta<mailbridge::mcp::error_payload> {
    using T = mailbridge::mcp::error_payload;
    static constexpr auto value = object(
        "status", &T::status,
        "tool", &T::tool,
        "error", &T::error,
        "message", &T::message,
        "search_text", &T::search_text,
        "troubleshooting", &T::troubleshooting
    );
};

namespace mailbridge::mcp {
    template <typename T>
    std::string to_json(const T& value) {
        std::string buffer;
        auto ec = glz::write_json(value, buffer);
        if (ec) {
            throw std::runtime_error("Failed to serialize payload: " + glz::format_error(ec));
        }
        return buffer;
    }

    inline constexpr std::string_view tools_schema = R"({"tools":[
{"name":"check_mailbox_access","description":"Check connection to the mail store and access to the personal and shared mailboxes","inputSchema":{"type":"object","properties":{},"required":[]}},
{"name":"get_email_chain","description":"Search emails whose subject or body contain the exact phrase and return them grouped into conversations","inputSchema":{"type":"object","properties":{"search_text":{"type":"string","description":"Exact text to search for in subject and body"},"include_personal":{"type":"boolean","description":"Search the personal mailbox (default: true)","default":true},"include_shared":{"type":"boolean","description":"Search the shared mailbox (default: true)","default":true}},"required":["search_text"]}},
{"name":"analyze_alerts","description":"Summarize alert emails matching a pattern: occurrences, cadence, active or resolved state and daily volume","inputSchema":{"type":"object","properties":{"alert_pattern":{"type":"string","description":"Text identifying the alert emails"},"include_personal":{"type":"boolean","description":"Search the personal mailbox (default: true)","default":true},"include_shared":{"type":"boolean","description":"Search the shared mailbox (default: true)","default":true}},"required":["alert_pattern"]}}
]})";

    /**
     * Maps tool calls onto the mailbox host. Every failure comes back as an
     * error payload with is_error set; nothing escapes to the protocol loop.
     */
    class tool_dispatcher {
    public:
        tool_dispatcher(hosts::mailbox_host& host, views::format_options format,
                        mail::search_scope scope, std::size_t max_results)
            : host_{host}, format_{format}, scope_{scope}, max_results_{max_results} {}

        tool_reply call(const std::string& name, const glz::json_t& arguments) {
            MCP_INFO_FMT("Executing tool: {}", name);
            std::optional<std::string> phrase;
            try {
                if (name == "check_mailbox_access") {
                    return {to_json(views::format_access(host_.check_access())), false};
                }
                if (name == "get_email_chain") {
                    auto request = make_request(arguments, "search_text");
                    phrase = request.phrase;
                    auto chain = host_.search_chain(request);
                    return {to_json(views::format_chain(request.phrase, chain, format_)), false};
                }
                if (name == "analyze_alerts") {
                    auto request = make_request(arguments, "alert_pattern");
                    phrase = request.phrase;
                    auto chain = host_.search_chain(request);
                    return {to_json(views::analyze_alerts(request.phrase, chain)), false};
                }
                throw validation_error(std::format("Unknown tool: {}", name));
            } catch (const validation_error& e) {
                return failure(name, e.what(), phrase, {
                    "Check the tool arguments against tools/list",
                    "search_text and alert_pattern must be non-empty strings",
                });
            } catch (const mail::connection_error& e) {
                return failure(name, e.what(), phrase, {
                    "Make sure the mail server is reachable",
                    "Check imap_url, imap_username and imap_password",
                    "Check network connectivity",
                });
            } catch (const mail::mailbox_not_found_error& e) {
                return failure(name, e.what(), phrase, {
                    "Check shared_mailbox_email in config.properties",
                    "Ask the mailbox owner to grant you access",
                });
            } catch (const std::exception& e) {
                return failure(name, e.what(), phrase, {
                    "Verify the mail store connection",
                    "Use specific search terms for best results",
                    "Ensure mailboxes are accessible",
                });
            }
        }

    private:
        mail::search_request make_request(const glz::json_t& arguments, std::string_view phrase_key) const {
            if (!arguments.is_null() && !arguments.is_object()) {
                throw validation_error("arguments must be an object");
            }

            mail::search_request request;
            request.scope = scope_;
            request.max_results = max_results_;

            if (!arguments.is_object() || !arguments.contains(phrase_key) || !arguments[phrase_key].is_string()) {
                throw validation_error(std::format("{} parameter is required", phrase_key));
            }
            request.phrase = arguments[phrase_key].get_string();
            if (helpers::StringHelper::trim(request.phrase).empty()) {
                throw validation_error(std::format("{} parameter is required", phrase_key));
            }

            request.mailboxes.clear();
            if (flag(arguments, "include_personal")) request.mailboxes.push_back(mail::mailbox_kind::personal);
            if (flag(arguments, "include_shared")) request.mailboxes.push_back(mail::mailbox_kind::shared);
            return request;
        }

        static bool flag(const glz::json_t& arguments, std::string_view key) {
            if (!arguments.contains(key) || arguments[key].is_null()) {
                return true;
            }
            if (!arguments[key].is_boolean()) {
                throw validation_error(std::format("{} must be a boolean", key));
            }
            return arguments[key].get<bool>();
        }

        static tool_reply failure(const std::string& tool, std::string error, std::optional<std::string> phrase,
                                  std::vector<std::string> troubleshooting) {
            MCP_ERROR_FMT("Error in tool {}: {}", tool, error);
            error_payload payload;
            payload.tool = tool;
            payload.message = std::format("Failed to execute {}: {}", tool, error);
            payload.error = std::move(error);
            payload.search_text = std::move(phrase);
            payload.troubleshooting = std::move(troubleshooting);
            return {to_json(payload), true};
        }

        hosts::mailbox_host& host_;
        views::format_options format_;
        mail::search_scope scope_;
        std::size_t max_results_;
    };
}
