#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mailbridge::mail {
    enum class mailbox_kind { personal, shared };

    enum class search_scope { inbox_only, all_folders };

    // Which step of the search cascade produced a folder's matches
    enum class strategy_kind { none, index, subject, manual };

    inline std::string_view to_string(mailbox_kind kind) {
        return kind == mailbox_kind::personal ? "personal" : "shared";
    }

    inline std::string_view to_string(search_scope scope) {
        return scope == search_scope::inbox_only ? "inbox" : "all_folders";
    }

    inline std::string_view to_string(strategy_kind kind) {
        switch (kind) {
            case strategy_kind::index: return "index";
            case strategy_kind::subject: return "subject";
            case strategy_kind::manual: return "manual";
            default: return "none";
        }
    }

    // A mailbox as resolved at connection time; read-only afterwards
    struct mailbox_handle {
        mailbox_kind kind{mailbox_kind::personal};
        std::string name;
        std::string root;           // folder hierarchy prefix, empty for the personal account
        std::string inbox;          // full path of the inbox folder
        bool accessible{false};
        std::optional<int> retention_months;    // informational only
        std::string error;
    };

    // One message, fully extracted. Holds no reference into the mail store.
    struct email_record {
        std::string id;             // unique within the store: mailbox/folder/uid
        std::string message_id;     // RFC 5322 Message-ID, may be empty
        std::string subject;
        std::string body;
        std::string sender_name;
        std::string sender_email;
        std::vector<std::string> recipients;
        std::chrono::system_clock::time_point received{};
        std::string folder;
        mailbox_kind mailbox{mailbox_kind::personal};
        std::string thread_key;
        int importance{1};
        std::size_t size{0};
        bool unread{false};
    };

    struct search_request {
        std::string phrase;
        std::vector<mailbox_kind> mailboxes{mailbox_kind::personal, mailbox_kind::shared};
        search_scope scope{search_scope::inbox_only};
        std::size_t max_results{500};
    };

    struct folder_outcome {
        mailbox_kind mailbox{mailbox_kind::personal};
        std::string folder;
        strategy_kind strategy{strategy_kind::none};
        std::size_t matches{0};
        std::string error;
    };

    // A whole mailbox, or a single folder of it when folder is set, that could not be searched
    struct mailbox_failure {
        mailbox_kind mailbox{mailbox_kind::personal};
        std::string reason;
        std::string folder;
    };

    struct search_result {
        std::vector<email_record> records;
        strategy_kind strategy{strategy_kind::none};
        std::vector<folder_outcome> folders;
        std::chrono::milliseconds elapsed{0};
        bool truncated{false};
        std::vector<mailbox_failure> failures;
    };
}
