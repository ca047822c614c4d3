//
// Created by aowei on 2025 10月 12.
//

#include <charconv>
#include <system_error>
#include <fsm/error.hpp>
#include <fsm/state.hpp>
#include <fsm/utils.hpp>

namespace fsm {
    std::vector<int> parse_state_id_list(const std::string_view text) {
        std::vector<int> ids;
        for (const auto token: utils::split_whitespace(text)) {
            int id = 0;
            // 整个 token 都必须是整数
            const auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), id);
            if (ec != std::errc() || end != token.data() + token.size()) {
                throw FsmError(ErrorType::MALFORMED_ENCODING, "Invalid state id '" + std::string(token) + "'");
            }
            ids.push_back(id);
        }
        return ids;
    }

    std::string encode_state_set(const std::set<State> &states) {
        std::string encoding;
        for (const auto &s: states) {
            if (!encoding.empty()) encoding += ' ';
            encoding += s.encode();
        }
        return encoding;
    }

    std::string to_string(const std::set<State> &states) {
        std::string result = "{";
        bool first = true;
        for (const auto &s: states) {
            if (!first) result += ", ";
            result += s.encode();
            first = false;
        }
        return result + "}";
    }
}
