#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <glaze/glaze.hpp>

#include "../helpers/debug.hpp"
#include "../helpers/worker_pool.hpp"
#include "tool_dispatcher.hpp"

namespace mailbridge::mcp {
    inline constexpr std::string_view server_name = "mailbridge";
    inline constexpr std::string_view server_version = "1.0.0";
    inline constexpr std::string_view config_resource_uri = "mailbridge://config";

    // Newest first
    inline constexpr std::array<std::string_view, 3> supported_protocol_versions{
        "2025-06-18", "2025-03-26", "2024-11-05"};

    namespace rpc_error {
        inline constexpr int parse_error = -32700;
        inline constexpr int invalid_request = -32600;
        inline constexpr int method_not_found = -32601;
        inline constexpr int invalid_params = -32602;
    }

    /**
     * JSON-RPC 2.0 over newline-delimited stdio.
     *
     * The read loop answers cheap methods inline and hands tools/call to the
     * request pool, so several tool calls can be in flight while the loop keeps
     * reading. Replies are written whole, one per line, under a lock.
     */
    class stdio_server {
    public:
        stdio_server(tool_dispatcher& dispatcher, helpers::worker_pool& request_pool, std::string config_text,
                     std::istream& in = std::cin, std::ostream& out = std::cout)
            : dispatcher_{dispatcher}, pool_{request_pool}, config_text_{std::move(config_text)}, in_{in}, out_{out} {}

        // Returns once stdin is closed and every pending tool call has answered
        int run() {
            MCP_INFO("Listening on stdio");
            std::string line;
            while (std::getline(in_, line)) {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (helpers::StringHelper::trim(line).empty()) {
                    continue;
                }
                handle_line(line);
                reap_finished();
            }

            MCP_INFO_FMT("Input closed, waiting for {} pending call(s)", in_flight_.size());
            for (auto& call : in_flight_) {
                call.wait();
            }
            in_flight_.clear();
            return 0;
        }

        void handle_line(const std::string& line) {
            glz::json_t message;
            if (auto ec = glz::read_json(message, line); ec) {
                MCP_WARN_FMT("Unparseable message: {}", glz::format_error(ec));
                write_error(glz::json_t{}, rpc_error::parse_error, "Parse error");
                return;
            }
            if (!message.is_object()) {
                write_error(glz::json_t{}, rpc_error::invalid_request, "Invalid Request");
                return;
            }

            std::optional<glz::json_t> id;
            if (message.contains("id")) {
                id = message["id"];
            }
            if (!message.contains("method") || !message["method"].is_string()) {
                write_error(id.value_or(glz::json_t{}), rpc_error::invalid_request, "Invalid Request: method is required");
                return;
            }

            auto method = message["method"].get_string();
            glz::json_t params = message.contains("params") ? message["params"] : glz::json_t{};
            MCP_DEBUG_FMT("<- {}", method);

            if (!id) {
                // notifications never get a reply
                MCP_TRACE_FMT("Notification {}", method);
                return;
            }

            if (method == "initialize") {
                write_result(*id, initialize(params));
            } else if (method == "ping") {
                write_result(*id, glz::json_t::object_t{});
            } else if (method == "tools/list") {
                glz::json_t tools;
                if (auto ec = glz::read_json(tools, std::string{tools_schema}); ec) {
                    MCP_ERROR_FMT("Tool schema is invalid: {}", glz::format_error(ec));
                }
                write_result(*id, tools);
            } else if (method == "tools/call") {
                call_tool(*id, params);
            } else if (method == "resources/list") {
                write_result(*id, list_resources());
            } else if (method == "resources/read") {
                read_resource(*id, params);
            } else {
                write_error(*id, rpc_error::method_not_found, "Method not found: " + method);
            }
        }

    private:
        glz::json_t initialize(glz::json_t& params) const {
            std::string version{supported_protocol_versions.front()};
            if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
                auto const& requested = params["protocolVersion"].get_string();
                if (std::find(supported_protocol_versions.begin(), supported_protocol_versions.end(), requested)
                    != supported_protocol_versions.end()) {
                    version = requested;
                }
            }

            glz::json_t result;
            result["protocolVersion"] = version;
            result["capabilities"]["tools"] = glz::json_t::object_t{};
            result["capabilities"]["resources"] = glz::json_t::object_t{};
            result["serverInfo"]["name"] = std::string{server_name};
            result["serverInfo"]["version"] = std::string{server_version};
            return result;
        }

        void call_tool(const glz::json_t& id, glz::json_t& params) {
            if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
                write_error(id, rpc_error::invalid_params, "Invalid params: tool name is required");
                return;
            }
            auto name = params["name"].get_string();
            glz::json_t arguments = params.contains("arguments") ? params["arguments"] : glz::json_t{};

            in_flight_.push_back(pool_.submit([this, id, name = std::move(name), arguments = std::move(arguments)] {
                auto reply = dispatcher_.call(name, arguments);

                glz::json_t content;
                content["type"] = std::string{"text"};
                content["text"] = reply.text;

                glz::json_t result;
                result["content"] = glz::json_t::array_t{content};
                result["isError"] = reply.is_error;
                write_result(id, result);
            }));
        }

        glz::json_t list_resources() const {
            glz::json_t resource;
            resource["uri"] = std::string{config_resource_uri};
            resource["name"] = std::string{"Current Configuration"};
            resource["description"] = std::string{"Effective configuration settings"};
            resource["mimeType"] = std::string{"text/plain"};

            glz::json_t result;
            result["resources"] = glz::json_t::array_t{resource};
            return result;
        }

        void read_resource(const glz::json_t& id, glz::json_t& params) {
            if (!params.is_object() || !params.contains("uri") || !params["uri"].is_string()) {
                write_error(id, rpc_error::invalid_params, "Invalid params: uri is required");
                return;
            }
            auto uri = params["uri"].get_string();
            if (uri != config_resource_uri) {
                write_error(id, rpc_error::invalid_params, "Unknown resource: " + uri);
                return;
            }

            glz::json_t contents;
            contents["uri"] = uri;
            contents["mimeType"] = std::string{"text/plain"};
            contents["text"] = config_text_;

            glz::json_t result;
            result["contents"] = glz::json_t::array_t{contents};
            write_result(id, result);
        }

        void write_result(const glz::json_t& id, glz::json_t result) {
            glz::json_t reply;
            reply["jsonrpc"] = std::string{"2.0"};
            reply["id"] = id;
            reply["result"] = std::move(result);
            write(reply);
        }

        void write_error(const glz::json_t& id, int code, const std::string& message) {
            glz::json_t reply;
            reply["jsonrpc"] = std::string{"2.0"};
            reply["id"] = id;
            reply["error"]["code"] = static_cast<double>(code);
            reply["error"]["message"] = message;
            write(reply);
        }

        void write(const glz::json_t& reply) {
            std::string buffer;
            if (auto ec = glz::write_json(reply, buffer); ec) {
                MCP_ERROR_FMT("Cannot serialize reply: {}", glz::format_error(ec));
                return;
            }
            std::lock_guard lock(out_mutex_);
            out_ << buffer << '\n' << std::flush;
        }

        void reap_finished() {
            std::erase_if(in_flight_, [](const std::future<void>& call) {
                return call.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
            });
        }

        tool_dispatcher& dispatcher_;
        helpers::worker_pool& pool_;
        std::string config_text_;
        std::istream& in_;
        std::ostream& out_;
        std::mutex out_mutex_;
        std::vector<std::future<void>> in_flight_;
    };
}
