//
// Created by aowei on 2025 10月 12.
//

#ifndef FSM_ALPHABET_HPP
#define FSM_ALPHABET_HPP

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace fsm {
    using Symbol = char;
    // 全局常量：表示 ε 转移，不是真实的输入字符
    constexpr Symbol EPSILON = '\0';

    // 字母表：有序的符号集合，迭代顺序即插入顺序
    class Alphabet {
    public:
        using const_iterator = std::vector<Symbol>::const_iterator;

        Alphabet() = default;
        explicit Alphabet(const std::vector<Symbol> &symbols);

        // 按空白切分，每个 token 必须是单个字符；重复符号只保留第一次出现
        static Alphabet parse(std::string_view text);

        [[nodiscard]] bool contains(Symbol symbol) const;
        [[nodiscard]] std::size_t size() const { return this->symbols.size(); }
        [[nodiscard]] bool empty() const { return this->symbols.empty(); }

        [[nodiscard]] const_iterator begin() const { return this->symbols.begin(); }
        [[nodiscard]] const_iterator end() const { return this->symbols.end(); }

        // 编码：符号以单个空格连接
        [[nodiscard]] std::string encode() const;
        // 集合记法：{a, b}
        [[nodiscard]] std::string to_string() const;

        bool operator==(const Alphabet &other) const { return this->symbols == other.symbols; }

    private:
        void add(Symbol symbol);

        std::vector<Symbol> symbols;      // 插入顺序
        std::unordered_set<Symbol> index; // 成员查询
    };
}

#endif //FSM_ALPHABET_HPP
