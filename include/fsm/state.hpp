//
// Created by aowei on 2025 10月 12.
//

#ifndef FSM_STATE_HPP
#define FSM_STATE_HPP

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace fsm {
    // 状态：只由整数 ID 标识，比较和 hash 都只看 ID
    class State {
    public:
        explicit State(const int id) : id_(id) {}

        [[nodiscard]] int id() const { return id_; }
        [[nodiscard]] std::string encode() const { return std::to_string(id_); }

        bool operator==(const State &other) const { return id_ == other.id_; }
        bool operator!=(const State &other) const { return id_ != other.id_; }
        bool operator<(const State &other) const { return id_ < other.id_; }

    private:
        int id_;
    };

    // 解析空白分隔的整数列表，用于状态字段和接受状态字段
    std::vector<int> parse_state_id_list(std::string_view text);
    // 状态集合编码：按 ID 排序，单个空格连接
    std::string encode_state_set(const std::set<State> &states);
    // 集合记法：{0, 1}
    std::string to_string(const std::set<State> &states);
}

// State 的 hash 函数，用于加入到 unordered_map 里面
template<>
struct std::hash<fsm::State> {
    size_t operator()(const fsm::State &state) const noexcept {
        return std::hash<int>()(state.id());
    }
};

#endif //FSM_STATE_HPP
