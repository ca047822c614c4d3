//
// Created by aowei on 2025 10月 14.
//

#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>
#include <fsm/alphabet.hpp>
#include <fsm/error.hpp>
#include <fsm/state.hpp>

using namespace fsm;

// 测试字母表按插入顺序解析和编码
TEST(AlphabetTest, ParseKeepsInsertionOrder) {
    const Alphabet alphabet = Alphabet::parse("  b a   c ");

    EXPECT_EQ(alphabet.size(), 3);
    EXPECT_EQ(alphabet.encode(), "b a c");
    EXPECT_EQ(std::vector<Symbol>(alphabet.begin(), alphabet.end()), (std::vector<Symbol>{'b', 'a', 'c'}));
}

// 测试重复符号只保留一次
TEST(AlphabetTest, DuplicatesAreDropped) {
    const Alphabet alphabet = Alphabet::parse("a b a b");

    EXPECT_EQ(alphabet.encode(), "a b");
    EXPECT_TRUE(alphabet.contains('a'));
    EXPECT_TRUE(alphabet.contains('b'));
    EXPECT_FALSE(alphabet.contains('c'));
}

// 测试空字母表合法
TEST(AlphabetTest, EmptyAlphabet) {
    const Alphabet alphabet = Alphabet::parse("   ");

    EXPECT_TRUE(alphabet.empty());
    EXPECT_EQ(alphabet.encode(), "");
    EXPECT_EQ(alphabet.to_string(), "{}");
}

// 测试多字符符号报错
TEST(AlphabetTest, MultiCharacterSymbolIsMalformed) {
    try {
        (void) Alphabet::parse("a bc");
        FAIL() << "expected FsmError";
    } catch (const FsmError &e) {
        EXPECT_EQ(e.type(), ErrorType::MALFORMED_ALPHABET);
    }
}

TEST(AlphabetTest, SetNotation) {
    EXPECT_EQ(Alphabet::parse("x y").to_string(), "{x, y}");
}

// 测试状态只按 ID 比较
TEST(StateTest, OrderingAndEqualityById) {
    EXPECT_EQ(State(3), State(3));
    EXPECT_NE(State(3), State(4));
    EXPECT_TRUE(State(-1) < State(2));
    EXPECT_EQ(std::hash<State>()(State(7)), std::hash<State>()(State(7)));
    EXPECT_EQ(State(12).encode(), "12");
}

// 测试状态 ID 列表解析
TEST(StateTest, ParseStateIdList) {
    EXPECT_EQ(parse_state_id_list(" 0  1\t2 "), (std::vector<int>{0, 1, 2}));
    EXPECT_TRUE(parse_state_id_list("").empty());
    EXPECT_THROW((void) parse_state_id_list("0 x"), FsmError);
    EXPECT_THROW((void) parse_state_id_list("1a"), FsmError);
}

// 测试状态集合按 ID 排序编码
TEST(StateTest, EncodeStateSetSorted) {
    const std::set<State> states{State(5), State(0), State(2)};

    EXPECT_EQ(encode_state_set(states), "0 2 5");
    EXPECT_EQ(encode_state_set({}), "");
    EXPECT_EQ(to_string(states), "{0, 2, 5}");
}

TEST(ErrorTest, ErrorTypeToString) {
    EXPECT_EQ(error_type_to_string(ErrorType::EPSILON_NOT_ALLOWED), "EPSILON_NOT_ALLOWED");
    EXPECT_EQ(error_type_to_string(ErrorType::INCOMPLETE_TRANSITION_FUNCTION), "INCOMPLETE_TRANSITION_FUNCTION");
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
