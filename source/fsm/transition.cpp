//
// Created by aowei on 2025 10月 12.
//

#include <fsm/error.hpp>
#include <fsm/transition.hpp>

// Transition 的实现
namespace fsm {
    std::string Transition::encode() const {
        std::string encoding = this->from.encode() + ",";
        if (this->symbol != EPSILON) encoding += this->symbol;
        return encoding + "," + this->to.encode();
    }

    std::string Transition::to_string() const {
        const std::string symbol_str = (this->symbol == EPSILON) ? "ε" : std::string(1, this->symbol);
        return "(" + this->from.encode() + ", " + symbol_str + ", " + this->to.encode() + ")";
    }

    bool Transition::operator==(const Transition &other) const {
        return this->from == other.from && this->symbol == other.symbol && this->to == other.to;
    }

    bool Transition::operator<(const Transition &other) const {
        if (this->from != other.from) return this->from < other.from;
        if (this->symbol != other.symbol) {
            // EPSILON 为 '\0'，按无符号比较时排在所有真实符号之前
            return static_cast<unsigned char>(this->symbol) < static_cast<unsigned char>(other.symbol);
        }
        return this->to < other.to;
    }
}

// TransitionFunction 的实现
namespace fsm {
    TransitionFunction::TransitionFunction(const std::set<Transition> &transitions) {
        for (const auto &t: transitions) {
            auto &row = this->delta[t.from];
            // 集合有序，先插入的目标状态 ID 最小
            if (!row.emplace(t.symbol, t.to).second) {
                this->deterministic = false;
            }
        }
    }

    State TransitionFunction::apply_to(const State &from, const Symbol symbol) const {
        const auto row = this->delta.find(from);
        if (row != this->delta.end()) {
            const auto it = row->second.find(symbol);
            if (it != row->second.end()) return it->second;
        }
        throw FsmError(ErrorType::MISSING_TRANSITION,
                       "No transition from state " + from.encode() + " on symbol '" + std::string(1, symbol) + "'");
    }

    bool TransitionFunction::maps(const State &from, const Symbol symbol) const {
        const auto row = this->delta.find(from);
        return row != this->delta.end() && row->second.count(symbol) != 0;
    }

    std::set<Transition> TransitionFunction::transitions() const {
        std::set<Transition> result;
        for (const auto &[from, row]: this->delta) {
            for (const auto &[symbol, to]: row) {
                result.emplace(from, symbol, to);
            }
        }
        return result;
    }

    void TransitionFunction::verify_transition_mapping(const std::set<State> &states,
                                                       const Alphabet &alphabet) const {
        for (const auto &t: this->transitions()) {
            if (!states.count(t.from)) {
                throw FsmError(ErrorType::DANGLING_STATE_REFERENCE,
                               "Transition mapping contains a state (id " + t.from.encode() +
                               ") that is not a part of the state machine");
            }
            // ε 转移交给 verify_no_epsilon_transitions 处理
            if (t.symbol != EPSILON && !alphabet.contains(t.symbol)) {
                throw FsmError(ErrorType::UNKNOWN_SYMBOL,
                               "Transition " + t.to_string() + " uses symbol '" + std::string(1, t.symbol) +
                               "' that is not a part of the machine's alphabet");
            }
            if (!states.count(t.to)) {
                throw FsmError(ErrorType::DANGLING_STATE_REFERENCE,
                               "Transition mapping contains a state (id " + t.to.encode() +
                               ") that is not a part of the state machine");
            }
        }
    }

    void TransitionFunction::verify_total(const std::set<State> &states, const Alphabet &alphabet) const {
        if (!this->deterministic) {
            throw FsmError(ErrorType::INCOMPLETE_TRANSITION_FUNCTION,
                           "The transition function maps some state and symbol to more than one state");
        }
        for (const Symbol symbol: alphabet) {
            for (const auto &state: states) {
                if (!this->maps(state, symbol)) {
                    throw FsmError(ErrorType::INCOMPLETE_TRANSITION_FUNCTION,
                                   "The transition function is missing a transition from state " + state.encode() +
                                   " on symbol '" + std::string(1, symbol) + "'");
                }
            }
        }
    }

    void TransitionFunction::verify_no_epsilon_transitions() const {
        for (const auto &[from, row]: this->delta) {
            if (row.count(EPSILON)) {
                throw FsmError(ErrorType::EPSILON_NOT_ALLOWED,
                               "The transition function has an epsilon transition from state " + from.encode());
            }
        }
    }

    std::string TransitionFunction::encode() const {
        // std::set 已经按 Transition 的全序排列
        std::string encoding;
        for (const auto &t: this->transitions()) {
            if (!encoding.empty()) encoding += ';';
            encoding += t.encode();
        }
        return encoding;
    }

    std::string TransitionFunction::to_string() const {
        std::string result = "{";
        bool first = true;
        for (const auto &t: this->transitions()) {
            if (!first) result += ", ";
            result += t.to_string();
            first = false;
        }
        return result + "}";
    }
}
