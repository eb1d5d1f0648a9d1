#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <glaze/glaze.hpp>

#include "../helpers/string_helper.hpp"
#include "../hosts/mailbox_host.hpp"
#include "chain_view.hpp"
#include "conversations.hpp"

namespace mailbridge::views {
    struct alert_view {
        std::string subject;
        std::size_t occurrences{};
        std::string first_seen;
        std::string last_seen;
        std::optional<double> average_interval_minutes;
        std::vector<std::string> senders;
        std::map<std::string, std::size_t> mailbox_distribution;
        std::string state;
        std::chrono::system_clock::time_point last_seen_at{};   // ordering only, not serialized
    };

    struct day_count {
        std::string date;
        std::size_t count{};
    };

    struct alert_summary {
        std::string alert_pattern;
        std::size_t total_alert_emails{};
        std::size_t distinct_alerts{};
        std::size_t active_alerts{};
        std::optional<std::string> first_seen;
        std::optional<std::string> last_seen;
        std::optional<day_count> busiest_day;
        bool truncated{};
        bool cached{};
        std::vector<failure_view> failures;
    };

    struct alert_payload {
        std::string status{"success"};
        std::vector<alert_view> alerts;
        std::map<std::string, std::size_t> daily_counts;
        alert_summary summary;
    };

    // Whole-word match of a recovery marker in a subject line
    inline bool is_resolution(std::string_view subject) {
        static constexpr std::array<std::string_view, 4> markers{"resolved", "recovered", "cleared", "ok"};
        auto lowered = helpers::StringHelper::to_lower(subject);
        std::size_t i = 0;
        while (i < lowered.size()) {
            while (i < lowered.size() && !std::isalnum(static_cast<unsigned char>(lowered[i]))) ++i;
            auto start = i;
            while (i < lowered.size() && std::isalnum(static_cast<unsigned char>(lowered[i]))) ++i;
            std::string_view word{lowered.data() + start, i - start};
            if (!word.empty() && std::find(markers.begin(), markers.end(), word) != markers.end()) {
                return true;
            }
        }
        return false;
    }

    inline std::string utc_day(std::chrono::system_clock::time_point tp) {
        return std::format("{:%F}", std::chrono::floor<std::chrono::days>(tp));
    }

    /**
     * Summarizes alert emails: one entry per conversation with occurrence
     * count, cadence and whether the latest message reports a recovery.
     * Busiest alerts come first, ties broken by the most recent.
     */
    inline alert_payload analyze_alerts(const std::string& pattern, const hosts::chain_result& chain) {
        alert_payload payload;
        payload.summary.alert_pattern = pattern;

        for (auto const& conv : chain.conversations) {
            alert_view alert;
            alert.subject = conv.subject;
            alert.occurrences = conv.messages.size();

            auto first = conv.messages.front().received;
            auto last = conv.messages.back().received;
            alert.first_seen = iso_time(first);
            alert.last_seen = iso_time(last);
            alert.last_seen_at = last;
            if (conv.messages.size() > 1) {
                auto span = std::chrono::duration<double, std::ratio<60>>(last - first).count();
                alert.average_interval_minutes = span / static_cast<double>(conv.messages.size() - 1);
            }

            for (auto const& record : conv.messages) {
                auto sender = participant(record);
                if (std::find(alert.senders.begin(), alert.senders.end(), sender) == alert.senders.end()) {
                    alert.senders.push_back(sender);
                }
                ++alert.mailbox_distribution[std::string{mail::to_string(record.mailbox)}];
                ++payload.daily_counts[utc_day(record.received)];
            }

            alert.state = is_resolution(conv.messages.back().subject) ? "resolved" : "active";
            payload.alerts.push_back(std::move(alert));
        }

        std::stable_sort(payload.alerts.begin(), payload.alerts.end(), [](const alert_view& a, const alert_view& b) {
            if (a.occurrences != b.occurrences) return a.occurrences > b.occurrences;
            return a.last_seen_at > b.last_seen_at;
        });

        auto& summary = payload.summary;
        auto const& records = chain.result.records;
        summary.total_alert_emails = records.size();
        summary.distinct_alerts = payload.alerts.size();
        summary.active_alerts = static_cast<std::size_t>(std::count_if(payload.alerts.begin(), payload.alerts.end(),
            [](const alert_view& a) { return a.state == "active"; }));
        if (!records.empty()) {
            auto [earliest, latest] = std::minmax_element(records.begin(), records.end(),
                [](const mail::email_record& a, const mail::email_record& b) { return a.received < b.received; });
            summary.first_seen = iso_time(earliest->received);
            summary.last_seen = iso_time(latest->received);
        }
        for (auto const& [day, count] : payload.daily_counts) {
            if (!summary.busiest_day || count > summary.busiest_day->count) {
                summary.busiest_day = day_count{day, count};
            }
        }
        summary.truncated = chain.result.truncated;
        summary.cached = chain.cached;
        for (auto const& failure : chain.result.failures) {
            summary.failures.push_back(make_failure_view(failure));
        }
        payload.status = chain.result.failures.empty() ? "success" : "partial";
        return payload;
    }
}

template <>
struct glz::meta<mailbridge::views::alert_view> {
    using T = mailbridge::views::alert_view;
    static constexpr auto value = object(
        "subject", &T::subject,
        "occurrences", &T::occurrences,
        "first_seen", &T::first_seen,
        "last_seen", &T::last_seen,
        "average_interval_minutes", &T::average_interval_minutes,
        "senders", &T::senders,
        "mailbox_distribution", &T::mailbox_distribution,
        "state", &T::state
    );
};

template <>
struct glz::meta<mailbridge::views::day_count> {
    using T = mailbridge::views::day_count;
    static constexpr auto value = object(
        "date", &T::date,
        "count", &T::count
    );
};

template <>
struct glz::meta<mailbridge::views::alert_summary> {
    using T = mailbridge::views::alert_summary;
    static constexpr auto value = object(
        "alert_pattern", &T::alert_pattern,
        "total_alert_emails", &T::total_alert_emails,
        "distinct_alerts", &T::distinct_alerts,
        "active_alerts", &T::active_alerts,
        "first_seen", &T::first_seen,
        "last_seen", &T::last_seen,
        "busiest_day", &T::busiest_day,
        "truncated", &T::truncated,
        "cached", &T::cached,
        "failed_mailboxes", &T::failures
    );
};

template <>
struct glz::meta<mailbridge::views::alert_payload> {
    using T = mailbridge::views::alert_payload;
    static constexpr auto value = object(
        "status", &T::status,
        "alerts", &T::alerts,
        "daily_counts", &T::daily_counts,
        "summary", &T::summary
    );
};
