//
// Created by aowei on 2025 10月 12.
//

#include <unordered_map>
#include <fsm/error.hpp>

namespace fsm {
    namespace {
        // ErrorType 转字符串 map
        const std::unordered_map<ErrorType, std::string> error_type_string_map{
            {ErrorType::MALFORMED_ENCODING, "MALFORMED_ENCODING"},
            {ErrorType::MALFORMED_ALPHABET, "MALFORMED_ALPHABET"},
            {ErrorType::UNKNOWN_STATE_ID, "UNKNOWN_STATE_ID"},
            {ErrorType::DANGLING_STATE_REFERENCE, "DANGLING_STATE_REFERENCE"},
            {ErrorType::UNKNOWN_SYMBOL, "UNKNOWN_SYMBOL"},
            {ErrorType::EPSILON_NOT_ALLOWED, "EPSILON_NOT_ALLOWED"},
            {ErrorType::INCOMPLETE_TRANSITION_FUNCTION, "INCOMPLETE_TRANSITION_FUNCTION"},
            {ErrorType::MISSING_TRANSITION, "MISSING_TRANSITION"},
        };
    }

    std::string error_type_to_string(const ErrorType type) {
        const auto it = error_type_string_map.find(type);
        return it != error_type_string_map.end() ? it->second : "UNKNOWN";
    }
}
