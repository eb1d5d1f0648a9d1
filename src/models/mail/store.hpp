#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "types.hpp"

namespace mailbridge::mail {
    enum class query_field { subject_or_body, subject };

    struct folder_info {
        std::string path;
        std::string name;           // leaf name
        std::vector<std::string> attributes;
    };

    // Lightweight view of a message used while scanning a folder by hand
    struct message_summary {
        long long uid{0};
        std::string subject;
        std::string body_prefix;
    };

    /**
     * One authenticated conversation with the mail store.
     *
     * A session is not shared between threads: every concurrent search opens
     * its own and drops it when done.
     */
    class store_session {
    public:
        virtual ~store_session() = default;

        // Cheap liveness probe
        virtual bool alive() = 0;

        // Throws mailbox_not_found_error; a mailbox we may not read comes back with accessible = false
        virtual mailbox_handle resolve(mailbox_kind kind) = 0;

        virtual std::vector<folder_info> folders(const mailbox_handle& mailbox) = 0;

        // Server-side search. An error is reported as unexpected, never as an empty list;
        // a missed deadline reads "timed out ...".
        virtual std::expected<std::vector<long long>, std::string> search(
            const std::string& folder, const std::string& phrase, query_field field,
            std::chrono::milliseconds timeout) = 0;

        // Every UID of a folder in ascending order
        virtual std::vector<long long> list_uids(const std::string& folder) = 0;

        virtual std::vector<message_summary> summaries(
            const std::string& folder, std::span<const long long> uids, std::size_t body_prefix_chars) = 0;

        virtual std::vector<email_record> fetch(
            const mailbox_handle& mailbox, const std::string& folder, std::span<const long long> uids) = 0;
    };

    class store {
    public:
        virtual ~store() = default;

        // Opens and authenticates a new session; a single attempt, throws on failure
        virtual std::unique_ptr<store_session> open() = 0;

        virtual std::string describe() const = 0;
    };
}
