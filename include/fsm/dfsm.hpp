//
// Created by aowei on 2025 10月 12.
//

#ifndef FSM_DFSM_HPP
#define FSM_DFSM_HPP

#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <fsm/alphabet.hpp>
#include <fsm/error.hpp>
#include <fsm/state.hpp>
#include <fsm/transition.hpp>

namespace fsm {
    /*
     * 确定有限状态机。编码格式：
     *
     *   <states> / <alphabet> / <transitions> / <initial> / <accepting>
     *
     * 例如 "0 1/a b/0,a,0;0,b,1;1,a,0;1,b,1/0/1"。字段和 token 两侧的空白会被忽略，
     * 接受状态字段可以为空或省略。
     *
     * 构造成功之后不可修改；最小化、规范化等算法总是返回新的 DFSM。
     */
    class DFSM {
    public:
        // 从编码构建，格式或校验错误时抛出 FsmError
        explicit DFSM(const std::string &encoding);
        // 从组成部分构建，校验失败时抛出 FsmError
        DFSM(std::set<State> states, Alphabet alphabet, TransitionFunction transitions, State initial_state,
             std::set<State> accepting_states);

        [[nodiscard]] const std::set<State> &states() const { return this->state_set; }
        [[nodiscard]] const Alphabet &alphabet() const { return this->symbols; }
        [[nodiscard]] const TransitionFunction &transition_function() const { return this->delta; }
        [[nodiscard]] const State &initial_state() const { return this->initial; }
        [[nodiscard]] const std::set<State> &accepting_states() const { return this->accepting; }

        // 编码，parse 的逆操作：状态排序、字母表按原顺序、转移按全序排序
        [[nodiscard]] std::string encode() const;
        // 集合记法描述：K/Σ/δ/s/A 五行，仅用于诊断
        void pretty_print(std::ostream &out) const;
        [[nodiscard]] std::string to_string() const;
        // 调试用：打印 DFSM 结构
        void print(const std::string &name = "DFSM") const;

        // 判断 input 是否属于该自动机的语言，input 中的字符必须属于字母表
        [[nodiscard]] bool compute(std::string_view input) const;

        // 从初始状态可达的所有状态
        [[nodiscard]] std::set<State> reachable_states() const;
        // 删除不可达状态
        [[nodiscard]] DFSM remove_unreachable_states() const;
        // 最小化：删除不可达状态后做 Moore 分割
        [[nodiscard]] DFSM minimize() const;
        // 规范化：按字母表顺序深度优先遍历，重新编号为 0, 1, 2, ...
        [[nodiscard]] DFSM to_canonic_form() const;

    private:
        struct Unchecked {};

        // 内部使用：算法可以保证不变量成立，跳过校验
        DFSM(std::set<State> states, Alphabet alphabet, TransitionFunction transitions, State initial_state,
             std::set<State> accepting_states, Unchecked);

        void parse(const std::string &encoding);
        void validate() const;
        [[nodiscard]] DFSM minimize_with_no_unreachable_states() const;

        std::set<State> state_set;
        Alphabet symbols;
        TransitionFunction delta;
        State initial{0};
        std::set<State> accepting;
    };

    // 两个自动机识别同一语言：字母表相同，且最小化 + 规范化之后编码一致
    bool equivalent(const DFSM &a, const DFSM &b);

    // 解析编码并计算 input 是否被接受
    bool compute(const std::string &encoding, std::string_view input);
}

#endif //FSM_DFSM_HPP
