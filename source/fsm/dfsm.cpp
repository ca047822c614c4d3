//
// Created by aowei on 2025 10月 12.
//

#include <charconv>
#include <iostream>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>
#include <fsm/dfsm.hpp>
#include <fsm/utils.hpp>

// 解析辅助函数
namespace fsm {
    namespace {
        int parse_id(const std::string_view token) {
            int id = 0;
            const auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), id);
            if (token.empty() || ec != std::errc() || end != token.data() + token.size()) {
                throw FsmError(ErrorType::MALFORMED_ENCODING, "Invalid state id '" + std::string(token) + "'");
            }
            return id;
        }

        // 在状态字段声明的状态里查找 ID
        State resolve(const std::map<int, State> &declared, const int id, const std::string &where) {
            const auto it = declared.find(id);
            if (it == declared.end()) {
                throw FsmError(ErrorType::UNKNOWN_STATE_ID,
                               "State id " + std::to_string(id) + " used in " + where + " is not declared");
            }
            return it->second;
        }

        // 单个转移：from , symbol , to
        Transition parse_transition(const std::string_view text, const std::map<int, State> &declared) {
            const auto parts = utils::split(text, ',');
            if (parts.size() != 3) {
                throw FsmError(ErrorType::MALFORMED_ENCODING,
                               "Transition '" + std::string(utils::trim(text)) + "' is not of the form from,symbol,to");
            }
            const auto symbol_part = utils::trim(parts[1]);
            if (symbol_part.size() > 1) {
                throw FsmError(ErrorType::MALFORMED_ENCODING,
                               "Transition symbol '" + std::string(symbol_part) + "' is not a single character");
            }
            const Symbol symbol = symbol_part.empty() ? EPSILON : symbol_part.front();
            const State from = resolve(declared, parse_id(utils::trim(parts[0])), "a transition");
            const State to = resolve(declared, parse_id(utils::trim(parts[2])), "a transition");
            return {from, symbol, to};
        }
    }
}

// DFSM 构造、解析、编码
namespace fsm {
    DFSM::DFSM(const std::string &encoding) {
        this->parse(encoding);
        this->validate();
    }

    DFSM::DFSM(std::set<State> states, Alphabet alphabet, TransitionFunction transitions, const State initial_state,
               std::set<State> accepting_states)
        : DFSM(std::move(states), std::move(alphabet), std::move(transitions), initial_state,
               std::move(accepting_states), Unchecked{}) {
        if (!this->state_set.count(this->initial)) {
            throw FsmError(ErrorType::DANGLING_STATE_REFERENCE,
                           "Initial state (id " + this->initial.encode() + ") is not a part of the state machine");
        }
        for (const auto &s: this->accepting) {
            if (!this->state_set.count(s)) {
                throw FsmError(ErrorType::DANGLING_STATE_REFERENCE,
                               "Accepting state (id " + s.encode() + ") is not a part of the state machine");
            }
        }
        this->validate();
    }

    DFSM::DFSM(std::set<State> states, Alphabet alphabet, TransitionFunction transitions, const State initial_state,
               std::set<State> accepting_states, Unchecked)
        : state_set(std::move(states)), symbols(std::move(alphabet)), delta(std::move(transitions)),
          initial(initial_state), accepting(std::move(accepting_states)) {}

    void DFSM::parse(const std::string &encoding) {
        // 1. 按 / 切分字段，接受状态字段可以省略
        const auto fields = utils::split(encoding, '/');
        if (fields.size() != 4 && fields.size() != 5) {
            throw FsmError(ErrorType::MALFORMED_ENCODING,
                           "Expected 5 '/'-separated fields but found " + std::to_string(fields.size()));
        }
        // 2. 状态字段：ID -> State
        std::map<int, State> declared;
        for (const int id: parse_state_id_list(fields[0])) {
            declared.emplace(id, State(id));
        }
        // 3. 字母表
        Alphabet alphabet = Alphabet::parse(fields[1]);
        // 4. 转移列表，整个字段为空表示没有转移
        std::set<Transition> transitions;
        if (!utils::trim(fields[2]).empty()) {
            for (const auto tuple: utils::split(fields[2], ';')) {
                if (utils::trim(tuple).empty()) {
                    throw FsmError(ErrorType::MALFORMED_ENCODING, "Empty transition in transition list");
                }
                transitions.insert(parse_transition(tuple, declared));
            }
        }
        // 5. 初始状态，必须恰好一个整数
        const auto initial_ids = parse_state_id_list(fields[3]);
        if (initial_ids.size() != 1) {
            throw FsmError(ErrorType::MALFORMED_ENCODING, "Initial state field must hold exactly one state id");
        }
        const State initial_state = resolve(declared, initial_ids.front(), "the initial state");
        // 6. 接受状态
        std::set<State> accepting_states;
        if (fields.size() == 5) {
            for (const int id: parse_state_id_list(fields[4])) {
                accepting_states.insert(resolve(declared, id, "the accepting states"));
            }
        }

        std::set<State> states;
        for (const auto &[_, s]: declared) states.insert(s);

        this->state_set = std::move(states);
        this->symbols = std::move(alphabet);
        this->delta = TransitionFunction(transitions);
        this->initial = initial_state;
        this->accepting = std::move(accepting_states);
    }

    void DFSM::validate() const {
        this->delta.verify_transition_mapping(this->state_set, this->symbols);
        this->delta.verify_total(this->state_set, this->symbols);
        this->delta.verify_no_epsilon_transitions();
    }

    std::string DFSM::encode() const {
        return encode_state_set(this->state_set) + "/" +
               this->symbols.encode() + "/" +
               this->delta.encode() + "/" +
               this->initial.encode() + "/" +
               encode_state_set(this->accepting);
    }

    void DFSM::pretty_print(std::ostream &out) const {
        out << "K = " << fsm::to_string(this->state_set) << "\n";
        out << "Σ = " << this->symbols.to_string() << "\n";
        out << "δ = " << this->delta.to_string() << "\n";
        out << "s = " << this->initial.encode() << "\n";
        out << "A = " << fsm::to_string(this->accepting) << "\n";
    }

    std::string DFSM::to_string() const {
        std::ostringstream out;
        this->pretty_print(out);
        return out.str();
    }

    // 调试用打印函数
    void DFSM::print(const std::string &name) const {
        std::cout << "=== " << name << " Structure ===" << std::endl;
        std::cout << "States: " << encode_state_set(this->state_set) << std::endl;
        std::cout << "Alphabet: " << this->symbols.encode() << std::endl;
        std::cout << "Start State: " << this->initial.encode() << std::endl;
        std::cout << "Accept States: " << encode_state_set(this->accepting) << std::endl;
        std::cout << "Transitions:\n";
        for (const auto &t: this->delta.transitions()) {
            std::cout << "  State " << t.from.encode() << " --" << t.symbol << "--> State " << t.to.encode()
                    << std::endl;
        }
        std::cout << "===========================\n" << std::endl;
    }

    bool DFSM::compute(const std::string_view input) const {
        State current = this->initial;
        for (const char c: input) {
            if (!this->symbols.contains(c)) {
                throw FsmError(ErrorType::UNKNOWN_SYMBOL,
                               "Input symbol '" + std::string(1, c) + "' is not a part of the machine's alphabet");
            }
            current = this->delta.apply_to(current, c);
        }
        return this->accepting.count(current) != 0;
    }

    bool equivalent(const DFSM &a, const DFSM &b) {
        if (!(a.alphabet() == b.alphabet())) return false;
        return a.minimize().to_canonic_form().encode() == b.minimize().to_canonic_form().encode();
    }

    bool compute(const std::string &encoding, const std::string_view input) {
        return DFSM(encoding).compute(input);
    }
}
