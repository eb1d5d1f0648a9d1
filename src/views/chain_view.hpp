#pragma once

#include <algorithm>
#include <chrono>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <glaze/glaze.hpp>

#include "../helpers/string_helper.hpp"
#include "../hosts/mailbox_host.hpp"
#include "../models/mail/types.hpp"
#include "conversations.hpp"

namespace mailbridge::views {
    // Limits applied when a result is rendered, never when it is cached
    struct format_options {
        std::size_t max_body_chars{0};              // 0 = whole body
        std::size_t max_recipients_display{10};
    };

    inline std::string iso_time(std::chrono::system_clock::time_point tp) {
        return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(tp));
    }

    struct message_view {
        std::string id;
        std::string message_id;
        std::string subject;
        std::string sender;
        std::string sender_email;
        std::vector<std::string> recipients;
        std::size_t total_recipients{};
        std::string received;
        std::string folder;
        std::string mailbox;
        int importance{1};
        bool unread{};
        std::size_t size{};
        std::string body;
        bool body_truncated{};
    };

    struct timeline_entry {
        std::string timestamp;
        std::string sender;
        std::string mailbox;
        std::string folder;
        std::string subject;
    };

    struct conversation_stats {
        std::size_t message_count{};
        std::size_t participant_count{};
        std::string first_message;
        std::string last_message;
        double span_hours{};
        std::map<std::string, std::size_t> mailbox_distribution;
        std::map<std::string, std::size_t> folder_distribution;
    };

    struct conversation_view {
        std::string subject;
        std::string thread_key;
        std::vector<std::string> participants;
        std::vector<timeline_entry> timeline;
        std::vector<message_view> messages;
        conversation_stats stats;
    };

    struct date_span {
        std::string first;
        std::string last;
    };

    // Whole mailbox when folder is empty, otherwise one folder that could not be searched
    struct failure_view {
        std::string mailbox;
        std::string reason;
        std::optional<std::string> folder;
    };

    inline failure_view make_failure_view(const mail::mailbox_failure& failure) {
        failure_view view{std::string{mail::to_string(failure.mailbox)}, failure.reason, std::nullopt};
        if (!failure.folder.empty()) {
            view.folder = failure.folder;
        }
        return view;
    }

    struct chain_summary {
        std::string search_text;
        std::size_t total_emails{};
        std::size_t conversations{};
        std::map<std::string, std::size_t> mailbox_distribution;
        std::optional<date_span> date_range;
        std::string strategy;
        long long elapsed_ms{};
        bool truncated{};
        bool cached{};
        std::vector<failure_view> failures;
    };

    struct chain_payload {
        std::string status{"success"};
        std::vector<conversation_view> conversations;
        chain_summary summary;
    };

    struct mailbox_status_view {
        bool accessible{};
        std::string name;
        std::optional<bool> configured;
        std::optional<int> retention_months;
        std::optional<std::string> error;
    };

    struct connection_view {
        bool connected{};
        std::string timestamp;
    };

    struct access_payload {
        std::string status;
        connection_view connection;
        mailbox_status_view personal_mailbox;
        mailbox_status_view shared_mailbox;
        std::optional<std::vector<std::string>> errors;
    };

    inline std::string participant(const mail::email_record& record) {
        if (record.sender_email.empty() || record.sender_name == record.sender_email) {
            return record.sender_name;
        }
        return std::format("{} <{}>", record.sender_name, record.sender_email);
    }

    inline message_view format_message(const mail::email_record& record, const format_options& options) {
        message_view view;
        view.id = record.id;
        view.message_id = record.message_id;
        view.subject = record.subject;
        view.sender = record.sender_name;
        view.sender_email = record.sender_email;
        view.total_recipients = record.recipients.size();
        auto shown = std::min(record.recipients.size(), options.max_recipients_display);
        view.recipients.assign(record.recipients.begin(), record.recipients.begin() + static_cast<std::ptrdiff_t>(shown));
        view.received = iso_time(record.received);
        view.folder = record.folder;
        view.mailbox = std::string{mail::to_string(record.mailbox)};
        view.importance = record.importance;
        view.unread = record.unread;
        view.size = record.size;
        view.body = helpers::StringHelper::truncate(record.body, options.max_body_chars);
        view.body_truncated = options.max_body_chars != 0 && helpers::StringHelper::utf8_length(record.body) > options.max_body_chars;
        return view;
    }

    inline conversation_view format_conversation(const conversation& conv, const format_options& options) {
        conversation_view view;
        view.subject = conv.subject;
        view.thread_key = conv.messages.front().thread_key;

        std::unordered_set<std::string> seen;
        auto add_participant = [&](const std::string& who) {
            if (!who.empty() && seen.insert(helpers::StringHelper::to_lower(who)).second) {
                view.participants.push_back(who);
            }
        };

        for (auto const& record : conv.messages) {
            add_participant(participant(record));
            for (auto const& recipient : record.recipients) {
                add_participant(recipient);
            }
            view.timeline.push_back({iso_time(record.received), record.sender_name,
                                     std::string{mail::to_string(record.mailbox)}, record.folder, record.subject});
            view.messages.push_back(format_message(record, options));
            ++view.stats.mailbox_distribution[std::string{mail::to_string(record.mailbox)}];
            ++view.stats.folder_distribution[record.folder];
        }

        auto first = conv.messages.front().received;
        auto last = conv.messages.back().received;
        view.stats.message_count = conv.messages.size();
        view.stats.participant_count = view.participants.size();
        view.stats.first_message = iso_time(first);
        view.stats.last_message = iso_time(last);
        view.stats.span_hours = std::chrono::duration<double, std::ratio<3600>>(last - first).count();
        return view;
    }

    inline chain_payload format_chain(const std::string& search_text, const hosts::chain_result& chain,
                                      const format_options& options) {
        chain_payload payload;
        for (auto const& conv : chain.conversations) {
            payload.conversations.push_back(format_conversation(conv, options));
        }

        auto& summary = payload.summary;
        auto const& records = chain.result.records;
        summary.search_text = search_text;
        summary.total_emails = records.size();
        summary.conversations = chain.conversations.size();
        for (auto const& record : records) {
            ++summary.mailbox_distribution[std::string{mail::to_string(record.mailbox)}];
        }
        if (!records.empty()) {
            auto [earliest, latest] = std::minmax_element(records.begin(), records.end(),
                [](const mail::email_record& a, const mail::email_record& b) { return a.received < b.received; });
            summary.date_range = date_span{iso_time(earliest->received), iso_time(latest->received)};
        }
        summary.strategy = std::string{mail::to_string(chain.result.strategy)};
        summary.elapsed_ms = chain.result.elapsed.count();
        summary.truncated = chain.result.truncated;
        summary.cached = chain.cached;
        for (auto const& failure : chain.result.failures) {
            summary.failures.push_back(make_failure_view(failure));
        }
        payload.status = chain.result.failures.empty() ? "success" : "partial";
        return payload;
    }

    inline access_payload format_access(const hosts::access_report& report) {
        auto status_view = [](const hosts::mailbox_status& status, bool with_configured) {
            mailbox_status_view view;
            view.accessible = status.accessible;
            view.name = status.name;
            if (with_configured) view.configured = status.configured;
            view.retention_months = status.retention_months;
            if (!status.error.empty()) view.error = status.error;
            return view;
        };

        access_payload payload;
        payload.status = report.errors.empty() ? "success" : "partial";
        payload.connection = {report.connected, iso_time(report.timestamp)};
        payload.personal_mailbox = status_view(report.personal, false);
        payload.shared_mailbox = status_view(report.shared, true);
        if (!report.errors.empty()) payload.errors = report.errors;
        return payload;
    }
}

template <>
struct glz::meta<mailbridge::views::message_view> {
    using T = mailbridge::views::message_view;
    static constexpr auto value = object(
        "id", &T::id,
        "message_id", &T::message_id,
        "subject", &T::subject,
        "sender", &T::sender,
        "sender_email", &T::sender_email,
        "recipients", &T::recipients,
        "total_recipients", &T::total_recipients,
        "received_time", &T::received,
        "folder", &T::folder,
        "mailbox", &T::mailbox,
        "importance", &T::importance,
        "unread", &T::unread,
        "size", &T::size,
        "body", &T::body,
        "body_truncated", &T::body_truncated
    );
};

template <>
struct glz::meta<mailbridge::views::timeline_entry> {
    using T = mailbridge::views::timeline_entry;
    static constexpr auto value = object(
        "timestamp", &T::timestamp,
        "sender", &T::sender,
        "mailbox", &T::mailbox,
        "folder", &T::folder,
        "subject", &T::subject
    );
};

template <>
struct glz::meta<mailbridge::views::conversation_stats> {
    using T = mailbridge::views::conversation_stats;
    static constexpr auto value = object(
        "message_count", &T::message_count,
        "participant_count", &T::participant_count,
        "first_message", &T::first_message,
        "last_message", &T::last_message,
        "span_hours", &T::span_hours,
        "mailbox_distribution", &T::mailbox_distribution,
        "folder_distribution", &T::folder_distribution
    );
};

template <>
struct glz::meta<mailbridge::views::conversation_view> {
    using T = mailbridge::views::conversation_view;
    static constexpr auto value = object(
        "subject", &T::subject,
        "thread_key", &T::thread_key,
        "participants", &T::participants,
        "timeline", &T::timeline,
        "messages", &T::messages,
        "stats", &T::stats
    );
};

template <>
struct glz::meta<mailbridge::views::date_span> {
    using T = mailbridge::views::date_span;
    static constexpr auto value = object(
        "first", &T::first,
        "last", &T::last
    );
};

template <>
struct glz::meta<mailbridge::views::failure_view> {
    using T = mailbridge::views::failure_view;
    static constexpr auto value = object(
        "mailbox", &T::mailbox,
        "folder", &T::folder,
        "reason", &T::reason
    );
};

template <>
struct glz::meta<mailbridge::views::chain_summary> {
    using T = mailbridge::views::chain_summary;
    static constexpr auto value = object(
        "search_text", &T::search_text,
        "total_emails", &T::total_emails,
        "conversations", &T::conversations,
        "mailbox_distribution", &T::mailbox_distribution,
        "date_range", &T::date_range,
        "strategy", &T::strategy,
        "elapsed_ms", &T::elapsed_ms,
        "truncated", &T::truncated,
        "cached", &T::cached,
        "failed_mailboxes", &T::failures
    );
};

template <>
struct glz::meta<mailbridge::views::chain_payload> {
    using T = mailbridge::views::chain_payload;
    static constexpr auto value = object(
        "status", &T::status,
        "conversations", &T::conversations,
        "summary", &T::summary
    );
};

template <>
struct glz::meta<mailbridge::views::mailbox_status_view> {
    using T = mailbridge::views::mailbox_status_view;
    static constexpr auto value = object(
        "accessible", &T::accessible,
        "name", &T::name,
        "configured", &T::configured,
        "retention_months", &T::retention_months,
        "error", &T::error
    );
};

template <>
struct glz::meta<mailbridge::views::connection_view> {
    using T = mailbridge::views::connection_view;
    static constexpr auto value = object(
        "connected", &T::connected,
        "timestamp", &T::timestamp
    );
};

template <>
struct glz::meta<mailbridge::views::access_payload> {
    using T = mailbridge::views::access_payload;
    static constexpr auto value = object(
        "status", &T::status,
        "connection", &T::connection,
        "personal_mailbox", &T::personal_mailbox,
        "shared_mailbox", &T::shared_mailbox,
        "errors", &T::errors
    );
};
