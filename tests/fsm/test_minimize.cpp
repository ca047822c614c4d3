//
// Created by aowei on 2025 10月 14.
//

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <fsm/dfsm.hpp>

using namespace fsm;

namespace {
    // 以 b 结尾的串：{0,1} 等价、{2,3} 等价，4 不可达
    const std::string redundant_ends_with_b =
            "0 1 2 3 4/a b/0,a,1;0,b,2;1,a,1;1,b,3;2,a,1;2,b,3;3,a,1;3,b,2;4,a,4;4,b,4/0/2 3 4";
    // 长度是 3 的倍数的串，用 6 个状态表示，需要两轮细分
    const std::string mod_three_cycle = "0 1 2 3 4 5/a/0,a,1;1,a,2;2,a,3;3,a,4;4,a,5;5,a,0/0/0 3";

    // 辅助函数：字母表上长度不超过 max_length 的所有串
    std::vector<std::string> all_strings(const Alphabet &alphabet, const size_t max_length) {
        std::vector<std::string> result{""};
        size_t begin = 0;
        for (size_t length = 1; length <= max_length; ++length) {
            const size_t end = result.size();
            for (size_t i = begin; i < end; ++i) {
                for (const Symbol c: alphabet) {
                    result.push_back(result[i] + c);
                }
            }
            begin = end;
        }
        return result;
    }
}

// 测试可达状态集合
TEST(ReachabilityTest, ReachableStates) {
    const DFSM machine(redundant_ends_with_b);

    EXPECT_EQ(machine.reachable_states(), (std::set<State>{State(0), State(1), State(2), State(3)}));
}

// 测试删除不可达状态
TEST(ReachabilityTest, RemoveUnreachableStates) {
    const DFSM machine(redundant_ends_with_b);

    const DFSM pruned = machine.remove_unreachable_states();

    EXPECT_EQ(pruned.encode(), "0 1 2 3/a b/0,a,1;0,b,2;1,a,1;1,b,3;2,a,1;2,b,3;3,a,1;3,b,2/0/2 3");
    // 原自动机不变
    EXPECT_EQ(machine.encode(), redundant_ends_with_b);
}

TEST(ReachabilityTest, EmptyAlphabetReachesOnlyInitial) {
    const DFSM machine("0 1 2///1/1 2");

    EXPECT_EQ(machine.remove_unreachable_states().encode(), "1///1/1");
}

// 测试等价状态合并到代表状态
TEST(MinimizeTest, MergesEquivalentStates) {
    const DFSM machine(redundant_ends_with_b);

    const DFSM minimal = machine.minimize();

    EXPECT_EQ(minimal.encode(), "0 2/a b/0,a,0;0,b,2;2,a,0;2,b,2/0/2");
    EXPECT_EQ(machine.encode(), redundant_ends_with_b);
}

// 测试需要多轮细分才能到达不动点
TEST(MinimizeTest, MultipleRefinementRounds) {
    const DFSM machine(mod_three_cycle);

    EXPECT_EQ(machine.minimize().encode(), "0 1 2/a/0,a,1;1,a,2;2,a,0/0/0");
}

// 测试全部非接受或全部接受时只剩一个状态
TEST(MinimizeTest, SingleBlock) {
    EXPECT_EQ(DFSM("0 1 2/a/0,a,1;1,a,2;2,a,0/0/").minimize().encode(), "0/a/0,a,0/0/");
    EXPECT_EQ(DFSM("3 4/a b/3,a,4;3,b,3;4,a,3;4,b,4/4/3 4").minimize().encode(), "3/a b/3,a,3;3,b,3/3/3");
}

// 测试最小化是幂等的
TEST(MinimizeTest, Idempotent) {
    for (const auto &encoding: {redundant_ends_with_b, mod_three_cycle}) {
        const DFSM once = DFSM(encoding).minimize();
        const DFSM twice = once.minimize();

        EXPECT_EQ(twice.states().size(), once.states().size());
        EXPECT_EQ(twice.to_canonic_form().encode(), once.to_canonic_form().encode());
    }
}

// 测试最小化和删除不可达状态不改变语言
TEST(MinimizeTest, LanguagePreserved) {
    const std::vector<std::string> encodings = {
        redundant_ends_with_b,
        mod_three_cycle,
        "0 1 2 3/a b/0,a,1;0,b,0;1,a,2;1,b,0;2,a,2;2,b,3;3,a,3;3,b,3/0/2 3",
        "0 1 2 3 4 5/0 1/0,0,1;0,1,2;1,0,3;1,1,4;2,0,4;2,1,3;3,0,5;3,1,5;4,0,5;4,1,5;5,0,5;5,1,5/0/1 2 5",
    };
    for (const auto &encoding: encodings) {
        const DFSM machine(encoding);
        const DFSM minimal = machine.minimize();
        const DFSM pruned = machine.remove_unreachable_states();
        for (const auto &input: all_strings(machine.alphabet(), 7)) {
            EXPECT_EQ(machine.compute(input), minimal.compute(input)) << encoding << " on '" << input << "'";
            EXPECT_EQ(machine.compute(input), pruned.compute(input)) << encoding << " on '" << input << "'";
        }
    }
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
