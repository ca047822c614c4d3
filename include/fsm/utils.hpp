//
// Created by aowei on 2025 10月 12.
//

#ifndef FSM_UTILS_HPP
#define FSM_UTILS_HPP

#include <cctype>
#include <string_view>
#include <vector>

namespace fsm::utils {
    inline bool is_space(const char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    // 去掉两侧空白
    inline std::string_view trim(std::string_view text) {
        while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
        while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
        return text;
    }

    // 按空白切分，连续空白视为一个分隔符
    inline std::vector<std::string_view> split_whitespace(const std::string_view text) {
        std::vector<std::string_view> tokens;
        size_t pos = 0;
        while (pos < text.size()) {
            if (is_space(text[pos])) {
                ++pos;
                continue;
            }
            const size_t start = pos;
            while (pos < text.size() && !is_space(text[pos])) ++pos;
            tokens.push_back(text.substr(start, pos - start));
        }
        return tokens;
    }

    // 按分隔符切分，保留空字段（"a//b" -> "a", "", "b"）
    inline std::vector<std::string_view> split(const std::string_view text, const char delimiter) {
        std::vector<std::string_view> fields;
        size_t start = 0;
        while (true) {
            const size_t pos = text.find(delimiter, start);
            if (pos == std::string_view::npos) {
                fields.push_back(text.substr(start));
                break;
            }
            fields.push_back(text.substr(start, pos - start));
            start = pos + 1;
        }
        return fields;
    }
}

#endif //FSM_UTILS_HPP
