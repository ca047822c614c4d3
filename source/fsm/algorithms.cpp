//
// Created by aowei on 2025 10月 13.
//

#include <map>
#include <stack>
#include <unordered_map>
#include <utility>
#include <vector>
#include <fsm/dfsm.hpp>

// 可达性
namespace fsm {
    // 不动点迭代：不断加入从当前可达集合一步可达的状态，直到没有新状态
    std::set<State> DFSM::reachable_states() const {
        std::set<State> reachable;
        std::set<State> newly_reachable{this->initial};
        while (!newly_reachable.empty()) {
            reachable.insert(newly_reachable.begin(), newly_reachable.end());
            newly_reachable.clear();
            for (const auto &state: reachable) {
                for (const Symbol symbol: this->symbols) {
                    const State next = this->delta.apply_to(state, symbol);
                    if (!reachable.count(next)) newly_reachable.insert(next);
                }
            }
        }
        return reachable;
    }

    DFSM DFSM::remove_unreachable_states() const {
        std::set<State> reachable = this->reachable_states();

        std::set<Transition> reachable_transitions;
        for (const auto &t: this->delta.transitions()) {
            if (reachable.count(t.from) && reachable.count(t.to)) reachable_transitions.insert(t);
        }
        std::set<State> reachable_accepting;
        for (const auto &s: this->accepting) {
            if (reachable.count(s)) reachable_accepting.insert(s);
        }
        return {std::move(reachable), this->symbols, TransitionFunction(reachable_transitions), this->initial,
                std::move(reachable_accepting), Unchecked{}};
    }
}

// 最小化辅助函数
namespace fsm {
    namespace {
        // 一轮划分：状态 -> 分区 ID；representatives[i] 是分区 i 的代表状态
        using Partition = std::map<State, int>;

        // s 和 t 在上一轮属于同一分区，且每个符号的后继也在上一轮的同一分区
        bool equivalent_in(const Partition &previous, const TransitionFunction &delta, const Alphabet &alphabet,
                           const State &s, const State &t) {
            if (previous.at(s) != previous.at(t)) return false;
            for (const Symbol symbol: alphabet) {
                if (previous.at(delta.apply_to(s, symbol)) != previous.at(delta.apply_to(t, symbol))) {
                    return false;
                }
            }
            return true;
        }

        // 初始划分：接受状态一组，非接受状态一组（空组不建）
        Partition initial_partition(const std::set<State> &states, const std::set<State> &accepting,
                                    std::vector<State> &representatives) {
            Partition partition;
            int accepting_id = -1;
            int rejecting_id = -1;
            for (const auto &s: states) {
                int &id = accepting.count(s) ? accepting_id : rejecting_id;
                if (id < 0) {
                    id = static_cast<int>(representatives.size());
                    representatives.push_back(s);
                }
                partition.emplace(s, id);
            }
            return partition;
        }

        // 细分一轮：上一轮的代表保持原来的分区 ID，其他状态加入第一个等价的代表，没有则自成新分区
        Partition refine(const Partition &previous, const TransitionFunction &delta, const Alphabet &alphabet,
                         std::vector<State> &representatives) {
            Partition next;
            for (size_t i = 0; i < representatives.size(); ++i) {
                next.emplace(representatives[i], static_cast<int>(i));
            }
            for (const auto &[state, _]: previous) {
                if (next.count(state)) continue;
                bool found = false;
                for (size_t i = 0; i < representatives.size() && !found; ++i) {
                    if (equivalent_in(previous, delta, alphabet, state, representatives[i])) {
                        next.emplace(state, static_cast<int>(i));
                        found = true;
                    }
                }
                if (!found) {
                    next.emplace(state, static_cast<int>(representatives.size()));
                    representatives.push_back(state);
                }
            }
            return next;
        }
    }
}

// 最小化与规范化
namespace fsm {
    DFSM DFSM::minimize() const {
        return this->remove_unreachable_states().minimize_with_no_unreachable_states();
    }

    DFSM DFSM::minimize_with_no_unreachable_states() const {
        // 1. Moore 分割，迭代到划分不再变化；划分只会变细，最多 |states| 轮
        std::vector<State> representatives;
        Partition previous;
        Partition partition = initial_partition(this->state_set, this->accepting, representatives);
        while (partition != previous) {
            previous = std::move(partition);
            partition = refine(previous, this->delta, this->symbols, representatives);
        }
        // 2. 原状态 -> 所在分区的代表
        std::unordered_map<State, State> equivalent;
        for (const auto &[state, id]: partition) {
            equivalent.emplace(state, representatives[id]);
        }
        // 3. 用代表重写转移，重复的转移在集合中合并
        std::set<Transition> minimal_transitions;
        for (const auto &t: this->delta.transitions()) {
            minimal_transitions.emplace(equivalent.at(t.from), t.symbol, equivalent.at(t.to));
        }
        std::set<State> minimal_states;
        for (const auto &[_, rep]: equivalent) minimal_states.insert(rep);
        std::set<State> minimal_accepting;
        for (const auto &s: this->accepting) minimal_accepting.insert(equivalent.at(s));

        return {std::move(minimal_states), this->symbols, TransitionFunction(minimal_transitions),
                equivalent.at(this->initial), std::move(minimal_accepting), Unchecked{}};
    }

    // 深度优先遍历，后继按字母表顺序访问，状态按首次发现的顺序编号
    DFSM DFSM::to_canonic_form() const {
        std::set<Transition> canonic_transitions;
        std::unordered_map<State, State> canonic_states;
        std::stack<State> todo;
        int free_id = 0;

        todo.push(this->initial);
        canonic_states.emplace(this->initial, State(free_id++));

        while (!todo.empty()) {
            const State top = todo.top();
            todo.pop();
            for (const Symbol symbol: this->symbols) {
                const State next = this->delta.apply_to(top, symbol);
                if (!canonic_states.count(next)) {
                    canonic_states.emplace(next, State(free_id++));
                    todo.push(next);
                }
                canonic_transitions.emplace(canonic_states.at(top), symbol, canonic_states.at(next));
            }
        }

        std::set<State> states;
        for (const auto &[_, s]: canonic_states) states.insert(s);
        // 不可达的接受状态不参与编号
        std::set<State> accepting_states;
        for (const auto &s: this->accepting) {
            const auto it = canonic_states.find(s);
            if (it != canonic_states.end()) accepting_states.insert(it->second);
        }

        return {std::move(states), this->symbols, TransitionFunction(canonic_transitions),
                canonic_states.at(this->initial), std::move(accepting_states), Unchecked{}};
    }
}
