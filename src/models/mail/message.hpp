#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <charconv>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../../helpers/string_helper.hpp"
#include "types.hpp"

namespace mailbridge::mail {
    struct address {
        std::string name;
        std::string email;

        // Name when there is one, otherwise the bare address
        std::string display() const { return name.empty() ? email : name; }
    };

    /**
     * RFC 5322 / MIME helpers used to turn raw header and body sections into
     * an email_record.
     */
    class message {
    public:
        // Header field lookup; case-insensitive, folded continuation lines are joined
        static std::string get_header_field(std::string_view header, std::string_view field) {
            std::size_t pos = 0;
            while (pos < header.size()) {
                auto end = header.find('\n', pos);
                auto line = header.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos);
                pos = end == std::string_view::npos ? header.size() : end + 1;

                if (line.size() <= field.size() || line[field.size()] != ':' ||
                    !helpers::StringHelper::starts_with_case_insensitive(line, field)) {
                    continue;
                }
                std::string value{line.substr(field.size() + 1)};
                // unfold continuation lines
                while (pos < header.size() && (header[pos] == ' ' || header[pos] == '\t')) {
                    auto next = header.find('\n', pos);
                    value += ' ';
                    value += header.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
                    pos = next == std::string_view::npos ? header.size() : next + 1;
                }
                return helpers::StringHelper::collapse_whitespace(value);
            }
            return {};
        }

        // Decode encoded email header (RFC 2047)
        static std::string decode_header(const std::string& header) {
            if (header.empty()) {
                return header;
            }

            // Format: =?charset?encoding?encoded-text?=
            static const std::regex encoded_word_regex("=\\?([^?]+)\\?([qQbB])\\?([^?]*)\\?=");

            std::string result;
            std::smatch match;
            auto search_start = header.cbegin();
            bool previous_was_encoded = false;

            while (std::regex_search(search_start, header.cend(), match, encoded_word_regex)) {
                std::string between{search_start, match[0].first};
                // whitespace between two adjacent encoded words is dropped
                if (!(previous_was_encoded && helpers::StringHelper::trim(between).empty())) {
                    result += between;
                }

                auto encoding = std::toupper(static_cast<unsigned char>(match[2].str()[0]));
                std::string encoded_text = match[3];
                if (encoding == 'Q') {
                    result += decode_quoted_printable(encoded_text, true);
                } else {
                    result += decode_base64(encoded_text);
                }

                previous_was_encoded = true;
                search_start = match.suffix().first;
            }
            result.append(search_start, header.cend());
            return result;
        }

        // Decode quoted-printable text; in header mode '_' stands for a space
        static std::string decode_quoted_printable(std::string_view input, bool header_mode = false) {
            std::string result;
            result.reserve(input.size());

            for (std::size_t i = 0; i < input.size(); i++) {
                if (input[i] == '=') {
                    // soft line break
                    if (i + 1 < input.size() && (input[i + 1] == '\r' || input[i + 1] == '\n')) {
                        i += (input[i + 1] == '\r' && i + 2 < input.size() && input[i + 2] == '\n') ? 2 : 1;
                        continue;
                    }
                    int value = 0;
                    if (i + 2 < input.size()) {
                        auto [ptr, ec] = std::from_chars(input.data() + i + 1, input.data() + i + 3, value, 16);
                        if (ec == std::errc{} && ptr == input.data() + i + 3) {
                            result.push_back(static_cast<char>(value));
                            i += 2;
                            continue;
                        }
                    }
                    // Invalid escape, keep the equals sign
                    result.push_back('=');
                } else if (header_mode && input[i] == '_') {
                    result.push_back(' ');
                } else {
                    result.push_back(input[i]);
                }
            }

            return result;
        }

        // Decode base64 text, skipping line breaks and other non-alphabet bytes
        static std::string decode_base64(std::string_view input) {
            static constexpr std::string_view base64_chars =
                "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

            std::string result;
            result.reserve(input.size() * 3 / 4);
            unsigned int buffer = 0;
            int bits = 0;

            for (char c : input) {
                if (c == '=') {
                    break;
                }
                auto pos = base64_chars.find(c);
                if (pos == std::string_view::npos) {
                    continue;
                }
                buffer = (buffer << 6) | static_cast<unsigned int>(pos);
                bits += 6;
                if (bits >= 8) {
                    bits -= 8;
                    result.push_back(static_cast<char>((buffer >> bits) & 0xFF));
                }
            }

            return result;
        }

        // "Jane Doe <jane@example.com>", "<jane@example.com>" or a bare address
        static address parse_address(std::string_view text) {
            auto trimmed = helpers::StringHelper::trim(text);
            auto open = trimmed.rfind('<');
            auto close = trimmed.rfind('>');
            if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
                return {{}, std::string{trimmed}};
            }
            auto name = helpers::StringHelper::trim(trimmed.substr(0, open));
            if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
                name = name.substr(1, name.size() - 2);
            }
            return {decode_header(std::string{name}), std::string{trimmed.substr(open + 1, close - open - 1)}};
        }

        // Splits an address list on commas that are outside quotes and angle brackets
        static std::vector<address> parse_address_list(std::string_view text) {
            std::vector<address> result;
            bool quoted = false;
            int angle = 0;
            std::size_t start = 0;
            for (std::size_t i = 0; i <= text.size(); ++i) {
                if (i < text.size()) {
                    char c = text[i];
                    if (c == '"') quoted = !quoted;
                    else if (!quoted && c == '<') ++angle;
                    else if (!quoted && c == '>' && angle > 0) --angle;
                    if (c != ',' || quoted || angle > 0) {
                        continue;
                    }
                }
                auto item = helpers::StringHelper::trim(text.substr(start, i - start));
                if (!item.empty()) {
                    result.push_back(parse_address(item));
                }
                start = i + 1;
            }
            return result;
        }

        /**
         * Parses an RFC 5322 date such as "Tue, 1 Jul 2025 10:15:00 +0200".
         * The weekday and the seconds are optional, obsolete zone names
         * (GMT, UT, EST...) are understood.
         */
        static std::optional<std::chrono::system_clock::time_point> parse_date(std::string_view text) {
            static constexpr std::array<std::string_view, 12> months{
                "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
            static constexpr std::array<std::pair<std::string_view, int>, 10> zones{{
                {"gmt", 0}, {"ut", 0}, {"utc", 0}, {"z", 0},
                {"est", -500}, {"edt", -400}, {"cst", -600}, {"cdt", -500}, {"pst", -800}, {"pdt", -700},
            }};

            auto view = helpers::StringHelper::trim(text);
            if (auto comma = view.find(','); comma != std::string_view::npos) {
                view = helpers::StringHelper::trim(view.substr(comma + 1));
            }
            // drop a trailing comment like "(UTC)"
            if (auto paren = view.find('('); paren != std::string_view::npos) {
                view = helpers::StringHelper::trim(view.substr(0, paren));
            }

            std::vector<std::string_view> parts;
            while (!view.empty()) {
                auto space = view.find(' ');
                parts.push_back(view.substr(0, space));
                if (space == std::string_view::npos) break;
                view = helpers::StringHelper::trim(view.substr(space + 1));
            }
            if (parts.size() < 4) {
                return std::nullopt;
            }

            auto to_int = [](std::string_view s, int& out) {
                auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
                return ec == std::errc{} && ptr == s.data() + s.size();
            };

            int day = 0, year = 0;
            if (!to_int(parts[0], day) || !to_int(parts[2], year)) {
                return std::nullopt;
            }
            if (year < 50) year += 2000;
            else if (year < 100) year += 1900;

            auto month_name = helpers::StringHelper::to_lower(parts[1].substr(0, 3));
            auto month_it = std::find(months.begin(), months.end(), month_name);
            if (month_it == months.end()) {
                return std::nullopt;
            }
            auto month = static_cast<unsigned>(month_it - months.begin() + 1);

            int hour = 0, minute = 0, second = 0;
            auto time = parts[3];
            auto first_colon = time.find(':');
            if (first_colon == std::string_view::npos || !to_int(time.substr(0, first_colon), hour)) {
                return std::nullopt;
            }
            auto rest = time.substr(first_colon + 1);
            auto second_colon = rest.find(':');
            if (!to_int(rest.substr(0, second_colon), minute)) {
                return std::nullopt;
            }
            if (second_colon != std::string_view::npos && !to_int(rest.substr(second_colon + 1), second)) {
                return std::nullopt;
            }

            int offset = 0;
            if (parts.size() > 4) {
                auto zone = parts[4];
                if (!zone.empty() && (zone.front() == '+' || zone.front() == '-')) {
                    int value = 0;
                    if (to_int(zone.substr(1), value)) {
                        offset = zone.front() == '-' ? -value : value;
                    }
                } else {
                    auto lowered = helpers::StringHelper::to_lower(zone);
                    for (auto const& [name, value] : zones) {
                        if (lowered == name) {
                            offset = value;
                            break;
                        }
                    }
                }
            }

            std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                            std::chrono::day{static_cast<unsigned>(day)}};
            if (!ymd.ok()) {
                return std::nullopt;
            }
            auto offset_minutes = std::chrono::minutes{(offset / 100) * 60 + (offset % 100)};
            return std::chrono::sys_days{ymd} + std::chrono::hours{hour} + std::chrono::minutes{minute} +
                   std::chrono::seconds{second} - offset_minutes;
        }

        // References root, else In-Reply-To, else the message's own id
        static std::string thread_key(std::string_view header) {
            auto first_id = [](std::string_view value) -> std::string {
                auto open = value.find('<');
                auto close = value.find('>', open);
                if (open == std::string_view::npos || close == std::string_view::npos) {
                    return std::string{helpers::StringHelper::trim(value)};
                }
                return std::string{value.substr(open, close - open + 1)};
            };
            for (auto field : {"References", "In-Reply-To", "Message-ID"}) {
                auto value = get_header_field(header, field);
                if (!value.empty()) {
                    return first_id(value);
                }
            }
            return {};
        }

        // 0 low, 1 normal, 2 high
        static int importance(std::string_view header) {
            auto value = helpers::StringHelper::to_lower(get_header_field(header, "Importance"));
            if (value.empty()) {
                value = helpers::StringHelper::to_lower(get_header_field(header, "Priority"));
            }
            if (value == "high" || value == "urgent") return 2;
            if (value == "low" || value == "non-urgent") return 0;

            auto priority = get_header_field(header, "X-Priority");
            if (!priority.empty()) {
                if (priority.front() == '1' || priority.front() == '2') return 2;
                if (priority.front() == '4' || priority.front() == '5') return 0;
            }
            return 1;
        }

        /**
         * Extracts readable text from a message body given its headers.
         * Multipart bodies are walked recursively; the first text/plain part
         * wins, a text/html part is used (without markup when clean_html is
         * set) only when there is no plain text.
         */
        static std::string extract_text(std::string_view header, std::string_view body, bool clean_html) {
            auto content_type = get_header_field(header, "Content-Type");
            auto lowered_type = helpers::StringHelper::to_lower(content_type);

            if (lowered_type.starts_with("multipart/")) {
                auto boundary = parameter(content_type, "boundary");
                if (boundary.empty()) {
                    return std::string{body};
                }
                std::optional<std::string> html;
                for (auto const& [part_header, part_body] : split_multipart(body, boundary)) {
                    auto part_type = helpers::StringHelper::to_lower(get_header_field(part_header, "Content-Type"));
                    auto disposition = helpers::StringHelper::to_lower(get_header_field(part_header, "Content-Disposition"));
                    if (disposition.starts_with("attachment")) {
                        continue;
                    }
                    if (part_type.starts_with("multipart/") || part_type.empty() || part_type.starts_with("text/plain")) {
                        auto text = extract_text(part_header, part_body, clean_html);
                        if (!helpers::StringHelper::trim(text).empty()) {
                            return text;
                        }
                    } else if (part_type.starts_with("text/html") && !html) {
                        html = extract_text(part_header, part_body, clean_html);
                    }
                }
                return html.value_or(std::string{});
            }

            auto decoded = decode_transfer(get_header_field(header, "Content-Transfer-Encoding"), body);
            if (lowered_type.starts_with("text/html") && clean_html) {
                return helpers::StringHelper::strip_html(decoded);
            }
            return decoded;
        }

        // Readable text of a body that may have been cut short, limited to max_chars characters
        static std::string text_prefix(std::string_view header, std::string_view raw_body, std::size_t max_chars,
                                       bool clean_html) {
            return helpers::StringHelper::truncate(extract_text(header, raw_body, clean_html), max_chars, "");
        }

        // Builds a record from the raw header and text sections of one message
        static email_record to_record(std::string_view header, std::string_view body, bool clean_html) {
            email_record record;
            record.subject = decode_header(get_header_field(header, "Subject"));
            if (record.subject.empty()) {
                record.subject = "No Subject";
            }

            auto from = parse_address(decode_header(get_header_field(header, "From")));
            record.sender_name = from.name.empty() ? (from.email.empty() ? "Unknown" : from.email) : from.name;
            record.sender_email = from.email;

            for (auto field : {"To", "Cc"}) {
                for (auto const& recipient : parse_address_list(get_header_field(header, field))) {
                    record.recipients.push_back(recipient.display());
                }
            }

            auto date = parse_date(get_header_field(header, "Date"));
            record.received = date.value_or(std::chrono::system_clock::time_point{});
            record.message_id = get_header_field(header, "Message-ID");
            record.thread_key = thread_key(header);
            record.importance = importance(header);
            record.body = extract_text(header, body, clean_html);
            return record;
        }

    private:
        // Value of a header parameter such as boundary="abc"
        static std::string parameter(std::string_view value, std::string_view name) {
            auto lowered = helpers::StringHelper::to_lower(value);
            auto key = std::string{name} + "=";
            auto pos = lowered.find(key);
            if (pos == std::string::npos) {
                return {};
            }
            auto rest = value.substr(pos + key.size());
            if (!rest.empty() && rest.front() == '"') {
                auto close = rest.find('"', 1);
                return std::string{rest.substr(1, close == std::string_view::npos ? std::string_view::npos : close - 1)};
            }
            auto end = rest.find_first_of("; \t");
            return std::string{rest.substr(0, end)};
        }

        // Returns (header, body) of every part between the boundaries
        static std::vector<std::pair<std::string_view, std::string_view>> split_multipart(std::string_view body, std::string_view boundary) {
            std::vector<std::pair<std::string_view, std::string_view>> parts;
            auto delimiter = std::string{"--"} + std::string{boundary};

            auto pos = body.find(delimiter);
            while (pos != std::string_view::npos) {
                auto start = body.find('\n', pos);
                if (start == std::string_view::npos || body.substr(pos + delimiter.size(), 2) == "--") {
                    break;
                }
                ++start;
                auto next = body.find(delimiter, start);
                auto part = body.substr(start, next == std::string_view::npos ? std::string_view::npos : next - start);

                auto separator = part.find("\r\n\r\n");
                std::size_t skip = 4;
                if (separator == std::string_view::npos) {
                    separator = part.find("\n\n");
                    skip = 2;
                }
                if (separator == std::string_view::npos) {
                    parts.emplace_back(part, std::string_view{});
                } else {
                    parts.emplace_back(part.substr(0, separator + skip / 2), part.substr(separator + skip));
                }
                pos = next;
            }
            return parts;
        }

        static std::string decode_transfer(std::string_view encoding, std::string_view body) {
            auto lowered = helpers::StringHelper::to_lower(helpers::StringHelper::trim(encoding));
            if (lowered == "quoted-printable") {
                return decode_quoted_printable(body);
            }
            if (lowered == "base64") {
                return decode_base64(body);
            }
            return std::string{body};
        }
    };
}
