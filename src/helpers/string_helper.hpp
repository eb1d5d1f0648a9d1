#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mailbridge::helpers {

/**
 * String utility functions shared by the mail parser, the search engine
 * and the formatters
 */
class StringHelper {
public:
    /**
     * Converts a string to lowercase (in-place).
     *
     * @param str String to convert to lowercase
     * @return Reference to the modified string
     */
    static std::string& to_lower_inplace(std::string& str) {
        std::transform(str.begin(), str.end(), str.begin(),
                      [](unsigned char c) { return std::tolower(c); });
        return str;
    }

    /**
     * Converts a string to lowercase (returning a new string).
     */
    static std::string to_lower(std::string_view str) {
        std::string result(str);
        return to_lower_inplace(result);
    }

    /**
     * Checks if a string contains another string (case-insensitive).
     *
     * @param haystack The string to search in
     * @param needle The string to search for
     * @return true if the haystack contains the needle (ignoring case), false otherwise
     */
    static bool contains_case_insensitive(std::string_view haystack, std::string_view needle) {
        if (needle.empty()) return true;
        if (haystack.empty()) return false;

        auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
            [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
        return it != haystack.end();
    }

    /**
     * Checks if a string starts with another string (case-insensitive).
     */
    static bool starts_with_case_insensitive(std::string_view str, std::string_view prefix) {
        if (str.size() < prefix.size()) {
            return false;
        }
        return to_lower(str.substr(0, prefix.size())) == to_lower(prefix);
    }

    static bool equals_case_insensitive(std::string_view a, std::string_view b) {
        return a.size() == b.size() && starts_with_case_insensitive(a, b);
    }

    static std::string_view trim(std::string_view str) {
        auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        while (!str.empty() && is_space(str.front())) str.remove_prefix(1);
        while (!str.empty() && is_space(str.back())) str.remove_suffix(1);
        return str;
    }

    // Collapses every run of whitespace into a single space and trims the ends
    static std::string collapse_whitespace(std::string_view str) {
        std::string result;
        result.reserve(str.size());
        bool pending_space = false;
        for (unsigned char c : str) {
            if (std::isspace(c)) {
                pending_space = !result.empty();
                continue;
            }
            if (pending_space) {
                result.push_back(' ');
                pending_space = false;
            }
            result.push_back(static_cast<char>(c));
        }
        return result;
    }

    // Number of UTF-8 code points; continuation bytes are not counted
    static std::size_t utf8_length(std::string_view str) {
        std::size_t length = 0;
        for (unsigned char c : str) {
            if ((c & 0xC0) != 0x80) {
                ++length;
            }
        }
        return length;
    }

    /**
     * Cuts a string to at most max_chars UTF-8 characters, appending a marker
     * when something was removed. A limit of 0 means unlimited.
     */
    static std::string truncate(std::string_view str, std::size_t max_chars, std::string_view marker = " [truncated]") {
        if (max_chars == 0 || str.size() <= max_chars) {
            return std::string{str};
        }
        std::size_t cut = 0;
        std::size_t seen = 0;
        while (cut < str.size()) {
            if ((static_cast<unsigned char>(str[cut]) & 0xC0) != 0x80) {
                if (seen == max_chars) {
                    break;
                }
                ++seen;
            }
            ++cut;
        }
        if (cut == str.size()) {
            return std::string{str};
        }
        std::string result{str.substr(0, cut)};
        result += marker;
        return result;
    }

    /**
     * Normalizes a subject line for conversation grouping: reply/forward
     * prefixes are removed, whitespace collapsed and case folded.
     * "RE: Fwd:  Disk Alert" and "disk alert" normalize to the same key.
     */
    static std::string normalize_subject(std::string_view subject) {
        static constexpr std::array prefixes{"re", "fw", "fwd", "aw", "wg", "sv", "antw", "tr"};

        auto view = trim(subject);
        for (bool stripped = true; stripped && !view.empty();) {
            stripped = false;
            for (std::string_view prefix : prefixes) {
                if (!starts_with_case_insensitive(view, prefix)) {
                    continue;
                }
                auto rest = view.substr(prefix.size());
                // optional counter as in "Re[2]:"
                if (!rest.empty() && rest.front() == '[') {
                    auto close = rest.find(']');
                    if (close != std::string_view::npos) {
                        rest = rest.substr(close + 1);
                    }
                }
                if (!rest.empty() && rest.front() == ':') {
                    view = trim(rest.substr(1));
                    stripped = true;
                    break;
                }
            }
        }
        auto normalized = collapse_whitespace(view);
        return to_lower_inplace(normalized);
    }

    /**
     * Removes HTML markup from a message body: tags (and the content of
     * style/script blocks) are dropped, the common entities decoded and
     * whitespace collapsed.
     */
    static std::string strip_html(std::string_view html) {
        static constexpr std::array<std::pair<std::string_view, std::string_view>, 6> entities{{
            {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"},
            {"&quot;", "\""}, {"&#39;", "'"}, {"&nbsp;", " "},
        }};

        std::string text;
        text.reserve(html.size());
        for (std::size_t i = 0; i < html.size();) {
            if (html[i] == '<') {
                auto lowered = to_lower(html.substr(i, 8));
                for (std::string_view block : {"style", "script"}) {
                    if (lowered.starts_with(std::string{"<"} + std::string{block})) {
                        auto close = to_lower(html).find(std::string{"</"} + std::string{block}, i);
                        i = close == std::string::npos ? html.size() : close;
                        break;
                    }
                }
                auto end = html.find('>', i);
                if (end == std::string_view::npos) {
                    break;
                }
                text.push_back(' ');
                i = end + 1;
                continue;
            }
            if (html[i] == '&') {
                bool decoded = false;
                for (auto const& [entity, replacement] : entities) {
                    if (html.substr(i, entity.size()) == entity) {
                        text += replacement;
                        i += entity.size();
                        decoded = true;
                        break;
                    }
                }
                if (decoded) {
                    continue;
                }
            }
            text.push_back(html[i++]);
        }
        return collapse_whitespace(text);
    }

    // Splits on a delimiter, trimming every element and dropping empty ones
    static std::vector<std::string> split(std::string_view str, char delimiter) {
        std::vector<std::string> parts;
        while (!str.empty()) {
            auto pos = str.find(delimiter);
            auto part = trim(str.substr(0, pos));
            if (!part.empty()) {
                parts.emplace_back(part);
            }
            if (pos == std::string_view::npos) {
                break;
            }
            str.remove_prefix(pos + 1);
        }
        return parts;
    }
};

} // namespace mailbridge::helpers
