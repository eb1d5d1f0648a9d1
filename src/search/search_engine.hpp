#pragma once

#include <algorithm>
#include <chrono>
#include <format>
#include <string>
#include <unordered_set>
#include <vector>

#include "../helpers/debug.hpp"
#include "../helpers/string_helper.hpp"
#include "../models/mail/errors.hpp"
#include "../models/mail/store.hpp"
#include "../models/mail/types.hpp"
#include "strategies.hpp"

namespace mailbridge::search {
    /**
     * Runs the strategy cascade over the folders of one mailbox.
     *
     * For each folder the strategies are tried in order; the first one that
     * does not fail settles the folder, even when it found nothing. A failing
     * strategy (error or timeout) hands over to the next one. With the
     * all-folders scope Sent and Drafts get their own cascade after the inbox.
     */
    class search_engine {
    public:
        explicit search_engine(search_options options, std::vector<strategy> cascade = default_cascade())
            : options_{options}, cascade_{std::move(cascade)} {}

        mail::search_result run(mail::store_session& session, const mail::mailbox_handle& mailbox,
                                const std::string& phrase, mail::search_scope scope, budget& shared_budget) const {
            auto started = std::chrono::steady_clock::now();
            mail::search_result result;
            std::unordered_set<std::string> seen;

            auto folders = std::vector<std::string>{mailbox.inbox};
            if (scope == mail::search_scope::all_folders) {
                for (auto& extra : extra_folders(session, mailbox)) {
                    folders.push_back(std::move(extra));
                }
            }

            std::size_t failed_folders = 0;
            std::string last_error;
            for (auto const& folder : folders) {
                // unsearched folders leave the store unexhausted, so the result counts as truncated
                if (shared_budget.exhausted()) {
                    SEARCH_DEBUG_FMT("Result cap reached, skipping {}", folder);
                    result.truncated = true;
                    break;
                }

                auto outcome = run_cascade(session, mailbox, folder, phrase, shared_budget.remaining());
                if (!outcome.error.empty() && outcome.strategy == mail::strategy_kind::none) {
                    ++failed_folders;
                    last_error = outcome.error;
                    result.failures.push_back({mailbox.kind, outcome.error, folder});
                }

                std::size_t added = 0;
                for (auto& record : outcome.records) {
                    if (!seen.insert(record.id).second) {
                        continue;
                    }
                    result.records.push_back(std::move(record));
                    ++added;
                }
                shared_budget.consume(added);
                result.truncated = result.truncated || outcome.truncated;

                if (result.strategy == mail::strategy_kind::none) {
                    result.strategy = outcome.strategy;
                }
                result.folders.push_back({mailbox.kind, folder, outcome.strategy, added, outcome.error});
            }

            if (failed_folders > 0 && failed_folders == result.folders.size()) {
                throw mail::search_error(std::format("all search strategies failed for {} mailbox: {}",
                                                     mail::to_string(mailbox.kind), last_error));
            }

            // chronological within the mailbox
            std::stable_sort(result.records.begin(), result.records.end(),
                [](const mail::email_record& a, const mail::email_record& b) { return a.received < b.received; });

            result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            SEARCH_INFO_FMT("{} mailbox: {} records for '{}' in {} ms", mail::to_string(mailbox.kind),
                            result.records.size(), phrase, result.elapsed.count());
            return result;
        }

    private:
        struct cascade_outcome {
            std::vector<mail::email_record> records;
            mail::strategy_kind strategy{mail::strategy_kind::none};
            bool truncated{false};
            std::string error;
        };

        cascade_outcome run_cascade(mail::store_session& session, const mail::mailbox_handle& mailbox,
                                    const std::string& folder, const std::string& phrase, std::size_t limit) const {
            cascade_outcome outcome;
            strategy_context ctx{session, mailbox, folder, phrase, limit, options_};

            for (auto const& step : cascade_) {
                strategy_outcome attempt = std::unexpected(strategy_failure{"not run"});
                try {
                    attempt = step.run(ctx);
                } catch (const std::exception& e) {
                    attempt = std::unexpected(strategy_failure{e.what()});
                }

                if (attempt) {
                    SEARCH_DEBUG_FMT("{} strategy settled {} with {} records", step.name, folder, attempt->records.size());
                    outcome.records = std::move(attempt->records);
                    outcome.truncated = attempt->truncated;
                    outcome.strategy = step.kind;
                    return outcome;
                }

                SEARCH_WARN_FMT("{} strategy {} in {}: {}", step.name,
                                attempt.error().timed_out ? "timed out" : "failed", folder, attempt.error().reason);
                outcome.error = std::format("{}: {}", step.name, attempt.error().reason);
            }
            return outcome;
        }

        // Sent and Drafts, by SPECIAL-USE attribute or by well-known name
        static std::vector<std::string> extra_folders(mail::store_session& session, const mail::mailbox_handle& mailbox) {
            std::vector<std::string> sent, drafts;
            std::vector<mail::folder_info> listed;
            try {
                listed = session.folders(mailbox);
            } catch (const std::exception& e) {
                SEARCH_WARN_FMT("Cannot list folders of {} mailbox: {}", mail::to_string(mailbox.kind), e.what());
                return {};
            }

            auto has_attribute = [](const mail::folder_info& folder, std::string_view attribute) {
                return std::any_of(folder.attributes.begin(), folder.attributes.end(),
                    [attribute](const std::string& a) { return helpers::StringHelper::equals_case_insensitive(a, attribute); });
            };
            auto named = [](const mail::folder_info& folder, std::initializer_list<std::string_view> names) {
                return std::any_of(names.begin(), names.end(),
                    [&folder](std::string_view name) { return helpers::StringHelper::equals_case_insensitive(folder.name, name); });
            };

            for (auto const& folder : listed) {
                if (folder.path == mailbox.inbox) {
                    continue;
                }
                if (has_attribute(folder, "\\Sent") || named(folder, {"Sent Items", "Sent", "Sent Messages"})) {
                    sent.push_back(folder.path);
                } else if (has_attribute(folder, "\\Drafts") || named(folder, {"Drafts"})) {
                    drafts.push_back(folder.path);
                }
            }

            std::vector<std::string> result;
            if (!sent.empty()) result.push_back(sent.front());
            if (!drafts.empty()) result.push_back(drafts.front());
            return result;
        }

        search_options options_;
        std::vector<strategy> cascade_;
    };
}
