#pragma once

#include <algorithm>
#include <numeric>
#include <string>
#include <unordered_map>
#include <vector>

#include "../helpers/string_helper.hpp"
#include "../models/mail/types.hpp"

namespace mailbridge::views {
    // Records sharing a normalized subject or a thread key, oldest first
    struct conversation {
        std::string key;
        std::string subject;        // as written on the oldest message
        std::vector<mail::email_record> messages;
    };

    namespace detail {
        struct disjoint_sets {
            std::vector<std::size_t> parent;

            explicit disjoint_sets(std::size_t count) : parent(count) {
                std::iota(parent.begin(), parent.end(), std::size_t{0});
            }

            std::size_t find(std::size_t i) {
                while (parent[i] != i) {
                    parent[i] = parent[parent[i]];
                    i = parent[i];
                }
                return i;
            }

            void unite(std::size_t a, std::size_t b) {
                a = find(a);
                b = find(b);
                if (a != b) {
                    parent[std::max(a, b)] = std::min(a, b);
                }
            }
        };
    }

    /**
     * Groups records into conversations. Two records belong together when
     * their subjects normalize to the same text or when they carry the same
     * thread key, so a renamed reply still joins its thread.
     *
     * Messages inside a conversation are chronological; conversations are
     * ordered by their first message.
     */
    inline std::vector<conversation> group_conversations(const std::vector<mail::email_record>& records) {
        detail::disjoint_sets sets(records.size());
        std::unordered_map<std::string, std::size_t> by_subject;
        std::unordered_map<std::string, std::size_t> by_thread;
        std::vector<std::string> normalized(records.size());

        for (std::size_t i = 0; i < records.size(); ++i) {
            normalized[i] = helpers::StringHelper::normalize_subject(records[i].subject);
            if (!normalized[i].empty()) {
                auto [it, inserted] = by_subject.try_emplace(normalized[i], i);
                if (!inserted) sets.unite(i, it->second);
            }
            if (!records[i].thread_key.empty()) {
                auto [it, inserted] = by_thread.try_emplace(records[i].thread_key, i);
                if (!inserted) sets.unite(i, it->second);
            }
        }

        std::unordered_map<std::size_t, std::size_t> slot_of_root;
        std::vector<conversation> result;
        for (std::size_t i = 0; i < records.size(); ++i) {
            auto root = sets.find(i);
            auto [it, inserted] = slot_of_root.try_emplace(root, result.size());
            if (inserted) {
                result.emplace_back();
            }
            result[it->second].messages.push_back(records[i]);
        }

        for (auto& conv : result) {
            std::stable_sort(conv.messages.begin(), conv.messages.end(),
                [](const mail::email_record& a, const mail::email_record& b) { return a.received < b.received; });
            auto const& first = conv.messages.front();
            conv.subject = first.subject;
            conv.key = helpers::StringHelper::normalize_subject(first.subject);
            if (conv.key.empty()) {
                conv.key = first.thread_key.empty() ? first.id : first.thread_key;
            }
        }

        std::stable_sort(result.begin(), result.end(), [](const conversation& a, const conversation& b) {
            return a.messages.front().received < b.messages.front().received;
        });
        return result;
    }
}
