#pragma once

#include <algorithm>
#include <charconv>
#include <chrono>
#include <expected>
#include <format>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <curl/curl.h>

#include "../../helpers/debug.hpp"
#include "../../helpers/string_helper.hpp"
#include "errors.hpp"
#include "message.hpp"
#include "store.hpp"

namespace mailbridge::mail {
    struct imap_options {
        std::string url;                        // imaps://host[:port]/
        std::string username;
        std::string password;
        bool sasl_login{true};
        std::string shared_email;
        std::string shared_name{"Shared Mailbox"};
        std::string shared_prefix{"shared/"};
        std::optional<int> personal_retention_months;
        std::optional<int> shared_retention_months;
        std::chrono::seconds connect_timeout{600};
        std::chrono::seconds operation_timeout{120};
        std::size_t batch_size{50};
        bool clean_html{true};
    };

    // Flags and size of one message as returned by UID FETCH (UID FLAGS RFC822.SIZE)
    struct fetch_attributes {
        long long uid{0};
        bool seen{false};
        std::size_t size{0};
    };

    /**
     * One authenticated IMAP connection driven through libcurl.
     *
     * Every request goes through the same easy handle so the connection (and
     * the login) is reused. Requests that carry a deadline run through the
     * multi interface and are polled until they finish or the deadline passes.
     */
    class imap_session : public store_session {
    public:
        explicit imap_session(imap_options options) : options_{std::move(options)} {
            if (!options_.url.starts_with("imaps://") && !options_.url.starts_with("imap://")) {
                throw std::invalid_argument("imap_url must start with imaps:// or imap://");
            }
            if (!options_.url.ends_with("/")) {
                options_.url += "/";
            }

            static std::once_flag curl_init_flag;
            std::call_once(curl_init_flag, []() {
                curl_global_init(CURL_GLOBAL_DEFAULT);
            });
        }

        ~imap_session() override {
            disconnect();
        }

        imap_session(const imap_session&) = delete;
        imap_session& operator=(const imap_session&) = delete;

        void connect() {
            std::lock_guard lock(mutex_);
            open_handle();
        }

        void disconnect() {
            std::lock_guard lock(mutex_);
            if (curl_) {
                curl_easy_cleanup(curl_);
                curl_ = nullptr;
            }
            is_connected_ = false;
        }

        bool alive() override {
            std::lock_guard lock(mutex_);
            if (!is_connected_ || curl_ == nullptr) {
                return false;
            }
            try {
                perform(options_.url, "NOOP");
                return true;
            } catch (const std::exception& e) {
                IMAP_DEBUG_FMT("NOOP failed: {}", e.what());
                return false;
            }
        }

        mailbox_handle resolve(mailbox_kind kind) override {
            std::lock_guard lock(mutex_);
            ensure_connection();

            mailbox_handle handle;
            handle.kind = kind;

            if (kind == mailbox_kind::personal) {
                handle.name = options_.username;
                handle.inbox = "INBOX";
                handle.retention_months = options_.personal_retention_months;
                auto response = perform(options_.url, "LIST \"\" \"INBOX\"");
                if (parse_list_response(response).empty()) {
                    throw mailbox_not_found_error("Personal INBOX is not listed by the server");
                }
                handle.accessible = true;
                return handle;
            }

            if (options_.shared_email.empty()) {
                throw mailbox_not_found_error("Shared mailbox is not configured");
            }
            handle.name = options_.shared_name.empty() ? options_.shared_email : options_.shared_name;
            handle.root = options_.shared_prefix + options_.shared_email;
            handle.inbox = handle.root + "/INBOX";
            handle.retention_months = options_.shared_retention_months;

            std::string response;
            try {
                response = perform(options_.url, std::format("LIST \"\" {}", quote(handle.root)));
            } catch (const imap_refused& e) {
                // NO reply: the mailbox exists in the namespace but we may not see it
                IMAP_WARN_FMT("Shared mailbox {} refused: {}", handle.root, e.what());
                handle.accessible = false;
                handle.error = e.what();
                return handle;
            }
            if (parse_list_response(response).empty()) {
                throw mailbox_not_found_error(std::format("Shared mailbox {} not found", options_.shared_email));
            }
            handle.accessible = true;
            return handle;
        }

        std::vector<folder_info> folders(const mailbox_handle& mailbox) override {
            std::lock_guard lock(mutex_);
            ensure_connection();
            auto pattern = mailbox.root.empty() ? std::string{"*"} : mailbox.root + "/*";
            auto response = perform(options_.url, std::format("LIST \"\" {}", quote(pattern)));
            return parse_list_response(response);
        }

        std::expected<std::vector<long long>, std::string> search(
            const std::string& folder, const std::string& phrase, query_field field,
            std::chrono::milliseconds timeout) override {
            std::lock_guard lock(mutex_);
            ensure_connection();

            auto criteria = field == query_field::subject_or_body
                ? std::format("OR SUBJECT {0} BODY {0}", quote(phrase))
                : std::format("SUBJECT {}", quote(phrase));
            auto command = std::format("UID SEARCH CHARSET UTF-8 {}", criteria);

            auto response = perform_polled(folder_url(folder), command, timeout);
            if (!response) {
                return std::unexpected(response.error());
            }
            auto uids = parse_search_response(*response);
            if (!uids) {
                return std::unexpected(std::format("unexpected SEARCH reply: {}", response->substr(0, 80)));
            }
            return *uids;
        }

        std::vector<long long> list_uids(const std::string& folder) override {
            std::lock_guard lock(mutex_);
            ensure_connection();
            auto response = perform(folder_url(folder), "UID SEARCH ALL");
            auto uids = parse_search_response(response);
            if (!uids) {
                throw std::runtime_error(std::format("list uids failed: {}", response));
            }
            return *uids;
        }

        std::vector<message_summary> summaries(
            const std::string& folder, std::span<const long long> uids, std::size_t body_prefix_chars) override {
            std::lock_guard lock(mutex_);
            ensure_connection();

            std::vector<message_summary> result;
            result.reserve(uids.size());
            for (auto uid : uids) {
                message_summary summary;
                summary.uid = uid;
                auto header = fetch_section(folder, uid, "HEADER", std::nullopt);
                summary.subject = message::decode_header(message::get_header_field(header, "Subject"));
                if (body_prefix_chars > 0) {
                    // encoded text is longer than what it decodes to
                    auto raw = fetch_section(folder, uid, "TEXT", body_prefix_chars * 2 + raw_prefix_slack);
                    summary.body_prefix = message::text_prefix(header, raw, body_prefix_chars, options_.clean_html);
                }
                result.push_back(std::move(summary));
            }
            return result;
        }

        std::vector<email_record> fetch(
            const mailbox_handle& mailbox, const std::string& folder, std::span<const long long> uids) override {
            std::lock_guard lock(mutex_);
            ensure_connection();

            std::vector<email_record> records;
            records.reserve(uids.size());
            auto batch_size = std::max<std::size_t>(options_.batch_size, 1);

            for (std::size_t offset = 0; offset < uids.size(); offset += batch_size) {
                auto batch = uids.subspan(offset, std::min(batch_size, uids.size() - offset));
                auto attributes = fetch_attributes_batch(folder, batch);

                for (auto uid : batch) {
                    // raw sections live only inside this scope
                    auto header = fetch_section(folder, uid, "HEADER", std::nullopt);
                    auto body = fetch_section(folder, uid, "TEXT", std::nullopt);

                    auto record = message::to_record(header, body, options_.clean_html);
                    record.id = std::format("{}/{}/{}", to_string(mailbox.kind), folder, uid);
                    record.folder = folder;
                    record.mailbox = mailbox.kind;
                    auto it = std::find_if(attributes.begin(), attributes.end(),
                        [uid](const fetch_attributes& a) { return a.uid == uid; });
                    if (it != attributes.end()) {
                        record.unread = !it->seen;
                        record.size = it->size;
                    } else {
                        record.size = header.size() + body.size();
                    }
                    records.push_back(std::move(record));
                }
                IMAP_DEBUG_FMT("Fetched {}/{} messages from {}", std::min(offset + batch_size, uids.size()), uids.size(), folder);
            }
            return records;
        }

        // "* SEARCH 1 2 3" -> {1, 2, 3}; nullopt when there is no SEARCH line at all
        static std::optional<std::vector<long long>> parse_search_response(std::string_view response) {
            std::optional<std::vector<long long>> result;
            std::size_t pos = 0;
            while (pos < response.size()) {
                auto end = response.find('\n', pos);
                auto line = helpers::StringHelper::trim(response.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos));
                pos = end == std::string_view::npos ? response.size() : end + 1;

                if (!line.starts_with("* SEARCH")) {
                    continue;
                }
                if (!result) {
                    result.emplace();
                }
                for (auto const& token : helpers::StringHelper::split(line.substr(8), ' ')) {
                    long long uid{};
                    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), uid);
                    if (ec == std::errc{} && ptr == token.data() + token.size()) {
                        result->push_back(uid);
                    }
                }
            }
            return result;
        }

        // Parses untagged LIST replies: * LIST (\HasNoChildren \Sent) "/" "Sent Items"
        static std::vector<folder_info> parse_list_response(std::string_view response) {
            std::vector<folder_info> folders;
            std::size_t pos = 0;
            while (pos < response.size()) {
                auto end = response.find('\n', pos);
                auto line = helpers::StringHelper::trim(response.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos));
                pos = end == std::string_view::npos ? response.size() : end + 1;

                if (!line.starts_with("* LIST ")) {
                    continue;
                }
                auto rest = line.substr(7);
                auto attr_open = rest.find('(');
                auto attr_close = rest.find(')');
                if (attr_open == std::string_view::npos || attr_close == std::string_view::npos) {
                    continue;
                }
                folder_info folder;
                folder.attributes = helpers::StringHelper::split(rest.substr(attr_open + 1, attr_close - attr_open - 1), ' ');
                rest = helpers::StringHelper::trim(rest.substr(attr_close + 1));

                auto [delimiter, after_delimiter] = read_token(rest);
                auto [path, unused] = read_token(after_delimiter);
                if (path.empty()) {
                    continue;
                }
                folder.path = path;
                auto cut = delimiter.empty() || delimiter == "NIL" ? std::string::npos : path.rfind(delimiter);
                folder.name = cut == std::string::npos ? path : path.substr(cut + delimiter.size());
                folders.push_back(std::move(folder));
            }
            return folders;
        }

        // "* 3 FETCH (UID 17 FLAGS (\Seen) RFC822.SIZE 2048)" lines
        static std::vector<fetch_attributes> parse_fetch_attributes(std::string_view response) {
            std::vector<fetch_attributes> result;
            std::size_t pos = 0;
            while (pos < response.size()) {
                auto end = response.find('\n', pos);
                auto line = helpers::StringHelper::trim(response.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos));
                pos = end == std::string_view::npos ? response.size() : end + 1;

                if (!line.starts_with("* ") || line.find(" FETCH (") == std::string_view::npos) {
                    continue;
                }
                fetch_attributes attributes;
                auto number_after = [&line](std::string_view key) -> long long {
                    auto at = line.find(key);
                    if (at == std::string_view::npos) {
                        return -1;
                    }
                    auto digits = line.substr(at + key.size());
                    long long value{};
                    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
                    return ec == std::errc{} ? value : -1;
                };
                auto uid = number_after("UID ");
                if (uid < 0) {
                    continue;
                }
                attributes.uid = uid;
                auto size = number_after("RFC822.SIZE ");
                attributes.size = size < 0 ? 0 : static_cast<std::size_t>(size);
                attributes.seen = line.find("\\Seen") != std::string_view::npos;
                result.push_back(attributes);
            }
            return result;
        }

        // IMAP quoted string with backslash and quote escaped. Quoted strings
        // are 7-bit only, so 8-bit text goes out as a non-synchronizing literal.
        static std::string quote(std::string_view text) {
            std::string clean;
            clean.reserve(text.size());
            bool eight_bit = false;
            for (char c : text) {
                if (c == '\r' || c == '\n') {
                    continue;
                }
                eight_bit = eight_bit || static_cast<unsigned char>(c) >= 0x80;
                clean.push_back(c);
            }
            if (eight_bit) {
                return std::format("{{{}+}}\r\n{}", clean.size(), clean);
            }

            std::string result{"\""};
            for (char c : clean) {
                if (c == '"' || c == '\\') {
                    result.push_back('\\');
                }
                result.push_back(c);
            }
            result.push_back('"');
            return result;
        }

    private:
        // A tagged NO/BAD reply; the connection itself is still usable
        class imap_refused : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
        };

        void open_handle() {
            if (curl_ != nullptr) {
                curl_easy_cleanup(curl_);
                curl_ = nullptr;
            }

            if (options_.username.empty() || options_.password.empty()) {
                throw connection_error("Username or password is empty");
            }

            curl_ = curl_easy_init();
            if (!curl_) {
                throw connection_error("Failed to initialize CURL");
            }

            curl_easy_setopt(curl_, CURLOPT_USERNAME, options_.username.c_str());
            curl_easy_setopt(curl_, CURLOPT_PASSWORD, options_.password.c_str());
            if (options_.sasl_login) {
                curl_easy_setopt(curl_, CURLOPT_LOGIN_OPTIONS, "AUTH=*");
            }
            curl_easy_setopt(curl_, CURLOPT_URL, options_.url.c_str());
            curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
            curl_easy_setopt(curl_, CURLOPT_TIMEOUT, static_cast<long>(options_.operation_timeout.count()));
            curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, error_buffer_);
            curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, WriteToString);

            #ifdef DEBUG
            curl_easy_setopt(curl_, CURLOPT_VERBOSE, 1L);
            #endif

            // The first transfer logs in
            perform(options_.url, "CAPABILITY");
            is_connected_ = true;
            IMAP_DEBUG_FMT("Session opened for {}", options_.username);
        }

        void ensure_connection() {
            if (!is_connected_ || curl_ == nullptr) {
                open_handle();
            }
        }

        std::string folder_url(const std::string& folder) {
            char* escaped = curl_easy_escape(curl_, folder.c_str(), static_cast<int>(folder.size()));
            if (!escaped) {
                throw std::runtime_error(std::format("Cannot escape folder name {}", folder));
            }
            std::string url = std::format("{}{}", options_.url, escaped);
            curl_free(escaped);
            return url;
        }

        std::string fetch_section(const std::string& folder, long long uid, std::string_view section, std::optional<std::size_t> partial) {
            auto url = std::format("{};UID={};SECTION={}", folder_url(folder), uid, section);
            if (partial) {
                url += std::format(";PARTIAL=0.{}", *partial);
            }
            return perform(url, {});
        }

        std::vector<fetch_attributes> fetch_attributes_batch(const std::string& folder, std::span<const long long> uids) {
            std::string set;
            for (auto uid : uids) {
                if (!set.empty()) set += ',';
                set += std::to_string(uid);
            }
            try {
                return parse_fetch_attributes(perform(folder_url(folder), std::format("UID FETCH {} (UID FLAGS RFC822.SIZE)", set)));
            } catch (const imap_refused& e) {
                IMAP_WARN_FMT("Flag fetch refused in {}: {}", folder, e.what());
                return {};
            }
        }

        void prepare(const std::string& url, std::string_view command, std::string& response) {
            error_buffer_[0] = '\0';
            curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
            if (command.empty()) {
                curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, nullptr);
            } else {
                command_ = command;
                curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, command_.c_str());
            }
            curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);
        }

        std::string perform(const std::string& url, std::string_view command) {
            std::string response;
            prepare(url, command, response);
            auto res = curl_easy_perform(curl_);
            if (res != CURLE_OK) {
                handle_curl_error(command.empty() ? "fetch" : command, res);
            }
            return response;
        }

        // Runs one request through the multi interface, polling until done or timed out
        std::expected<std::string, std::string> perform_polled(const std::string& url, std::string_view command,
                                                               std::chrono::milliseconds timeout) {
            std::string response;
            prepare(url, command, response);

            CURLM* multi = curl_multi_init();
            if (!multi) {
                return std::unexpected("Failed to initialize CURL multi handle");
            }
            curl_multi_add_handle(multi, curl_);

            auto deadline = std::chrono::steady_clock::now() + timeout;
            int running = 1;
            bool timed_out = false;
            while (running) {
                auto mc = curl_multi_perform(multi, &running);
                if (mc != CURLM_OK || !running) {
                    break;
                }
                if (std::chrono::steady_clock::now() >= deadline) {
                    timed_out = true;
                    break;
                }
                curl_multi_poll(multi, nullptr, 0, 200, nullptr);
            }

            CURLcode res = CURLE_OK;
            int queued = 0;
            while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
                if (msg->msg == CURLMSG_DONE) {
                    res = msg->data.result;
                }
            }
            curl_multi_remove_handle(multi, curl_);
            curl_multi_cleanup(multi);

            if (timed_out) {
                // the command is still in flight on the server, start over next time
                is_connected_ = false;
                IMAP_WARN_FMT("{} timed out after {} ms", command, timeout.count());
                return std::unexpected(std::format("timed out after {} ms", timeout.count()));
            }
            if (res != CURLE_OK) {
                auto message = describe_error(res);
                if (is_transport_error(res)) {
                    is_connected_ = false;
                }
                return std::unexpected(message);
            }
            return response;
        }

        std::string describe_error(CURLcode res) const {
            std::string error_msg = std::format("{} ({})", curl_easy_strerror(res), static_cast<int>(res));
            if (error_buffer_[0] != '\0') {
                error_msg += std::format(" - {}", error_buffer_);
            }
            return error_msg;
        }

        static bool is_transport_error(CURLcode res) {
            return res == CURLE_COULDNT_CONNECT ||
                   res == CURLE_COULDNT_RESOLVE_HOST ||
                   res == CURLE_OPERATION_TIMEDOUT ||
                   res == CURLE_SSL_CONNECT_ERROR ||
                   res == CURLE_RECV_ERROR ||
                   res == CURLE_SEND_ERROR ||
                   res == CURLE_LOGIN_DENIED ||
                   res == CURLE_GOT_NOTHING;
        }

        // Helper to handle CURL errors with detailed information
        [[noreturn]] void handle_curl_error(std::string_view operation, CURLcode res) {
            auto error_msg = std::format("{}: {}", operation, describe_error(res));

            // The server answered NO/BAD to a custom command
            if (res == CURLE_QUOTE_ERROR) {
                throw imap_refused(error_msg);
            }

            if (is_transport_error(res)) {
                is_connected_ = false;
                throw connection_error(error_msg);
            }

            throw std::runtime_error(error_msg);
        }

        static size_t WriteToString(void* contents, size_t size, size_t nmemb, std::string* str) {
            str->append(static_cast<char*>(contents), size * nmemb);
            return size * nmemb;
        }

        // Reads an atom or a quoted string, returning it and the remaining text
        static std::pair<std::string, std::string_view> read_token(std::string_view text) {
            text = helpers::StringHelper::trim(text);
            if (text.empty()) {
                return {{}, text};
            }
            if (text.front() != '"') {
                auto space = text.find(' ');
                return {std::string{text.substr(0, space)},
                        space == std::string_view::npos ? std::string_view{} : text.substr(space + 1)};
            }
            std::string token;
            std::size_t i = 1;
            for (; i < text.size() && text[i] != '"'; ++i) {
                if (text[i] == '\\' && i + 1 < text.size()) {
                    ++i;
                }
                token.push_back(text[i]);
            }
            return {token, i + 1 < text.size() ? text.substr(i + 1) : std::string_view{}};
        }

        static constexpr std::size_t raw_prefix_slack = 512;    // room for MIME part headers

        imap_options options_;
        CURL* curl_{};
        bool is_connected_{false};
        std::string command_;
        char error_buffer_[CURL_ERROR_SIZE]{};

        mutable std::mutex mutex_;
    };
}
