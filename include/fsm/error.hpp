//
// Created by aowei on 2025 10月 12.
//

#ifndef FSM_ERROR_HPP
#define FSM_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fsm {
    // 自动机构造/计算错误类型枚举
    enum class ErrorType {
        MALFORMED_ENCODING,             // 编码格式错误，字段数量不对或整数/三元组语法错误
        MALFORMED_ALPHABET,             // 字母表中出现多字符符号
        UNKNOWN_STATE_ID,               // 引用了状态字段中未声明的状态 ID
        DANGLING_STATE_REFERENCE,       // 转移/初始/接受状态不在状态集合中
        UNKNOWN_SYMBOL,                 // 符号不属于字母表
        EPSILON_NOT_ALLOWED,            // DFA 中出现 ε 转移
        INCOMPLETE_TRANSITION_FUNCTION, // 转移函数不完全或不确定
        MISSING_TRANSITION,             // 查询了不存在的转移
    };

    // 错误异常，携带错误类型和描述
    class FsmError : public std::invalid_argument {
    public:
        FsmError(const ErrorType type, const std::string &message) : std::invalid_argument(message), type_(type) {}

        [[nodiscard]] ErrorType type() const noexcept { return type_; }

    private:
        ErrorType type_;
    };

    std::string error_type_to_string(ErrorType type);
}

#endif //FSM_ERROR_HPP
