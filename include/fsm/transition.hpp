//
// Created by aowei on 2025 10月 12.
//

#ifndef FSM_TRANSITION_HPP
#define FSM_TRANSITION_HPP

#include <set>
#include <string>
#include <unordered_map>
#include <fsm/alphabet.hpp>
#include <fsm/state.hpp>

// 1. 转移三元组
namespace fsm {
    struct Transition {
        State from;    // 出发状态
        Symbol symbol; // 触发符号，EPSILON 表示 ε 转移
        State to;      // 目标状态

        Transition(const State from, const Symbol symbol, const State to) : from(from), symbol(symbol), to(to) {}

        // 编码：from,symbol,to，ε 转移的符号为空
        [[nodiscard]] std::string encode() const;
        // 可读形式：(0, a, 1)
        [[nodiscard]] std::string to_string() const;

        bool operator==(const Transition &other) const;
        // 全序：先比较出发状态，再比较符号（ε 最小），最后比较目标状态
        bool operator<(const Transition &other) const;
    };
}

// 2. 转移函数
namespace fsm {
    class TransitionFunction {
    public:
        TransitionFunction() = default;
        // 从转移集合构建索引；同一 (状态, 符号) 有多个目标时保留第一个并标记为不确定
        explicit TransitionFunction(const std::set<Transition> &transitions);

        // 返回唯一的后继状态，不存在时抛出 MISSING_TRANSITION
        [[nodiscard]] State apply_to(const State &from, Symbol symbol) const;
        [[nodiscard]] bool maps(const State &from, Symbol symbol) const;
        // 从索引还原转移集合
        [[nodiscard]] std::set<Transition> transitions() const;

        // 校验：转移中的状态都属于 states，符号都属于 alphabet
        void verify_transition_mapping(const std::set<State> &states, const Alphabet &alphabet) const;
        // 校验：每个 (状态, 符号) 都有且仅有一个转移
        void verify_total(const std::set<State> &states, const Alphabet &alphabet) const;
        // 校验：没有 ε 转移
        void verify_no_epsilon_transitions() const;

        // 编码：按全序排序后以 ; 连接
        [[nodiscard]] std::string encode() const;
        // 集合记法：{(0, a, 1), ...}
        [[nodiscard]] std::string to_string() const;

    private:
        std::unordered_map<State, std::unordered_map<Symbol, State> > delta;
        bool deterministic = true;
    };
}

#endif //FSM_TRANSITION_HPP
