//
// Created by aowei on 2025 10月 14.
//

#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>
#include <fsmkit/acceptor/dfa.hpp>
#include <fsmkit/core/errors.hpp>

using namespace fsmkit::acceptor;
using fsmkit::core::MachineDefinitionError;
using fsmkit::core::UndefinedTransitionError;
using fsmkit::core::symbols_of;

// 辅助函数：整数序列 -> 符号序列
std::vector<Symbol> ints(const std::vector<std::int64_t> &values) {
    return std::vector<Symbol>(values.begin(), values.end());
}

// 辅助函数：两状态环 p <-> q，p 为初始且接受；0 停在原地，1 去另一个状态
DFA build_two_cycle() {
    DFA dfa({std::int64_t{0}, std::int64_t{1}});
    auto *p = dfa.add_state("p", true, true);
    auto *q = dfa.add_state("q");
    p->add_transition(std::int64_t{0}, p);
    p->add_transition(std::int64_t{1}, q);
    q->add_transition(std::int64_t{0}, q);
    q->add_transition(std::int64_t{1}, p);
    return dfa;
}

// 辅助函数：q0 -a-> q1 -b-> q2 (b 自环) -a-> q3（接受），不完整
DFA build_partial() {
    DFA dfa({"a", "b"});
    auto *q0 = dfa.add_state("q0", true);
    auto *q1 = dfa.add_state("q1");
    auto *q2 = dfa.add_state("q2");
    auto *q3 = dfa.add_state("q3", false, true);
    q0->add_transition("a", q1);
    q1->add_transition("b", q2);
    q2->add_transition("b", q2);
    q2->add_transition("a", q3);
    return dfa;
}

// 测试两状态环的判定结果
TEST(DFATest, TwoStateCycle) {
    const DFA dfa = build_two_cycle();
    EXPECT_TRUE(dfa.accept(ints({})));
    EXPECT_FALSE(dfa.accept(ints({1})));
    EXPECT_TRUE(dfa.accept(ints({0, 0})));
    EXPECT_FALSE(dfa.accept(ints({0, 0, 1})));
    // 1 过去，0 停在 q，1 回到 p
    EXPECT_TRUE(dfa.accept(ints({1, 0, 1})));
    EXPECT_TRUE(dfa.accept(ints({1, 1})));
}

// 测试空序列：结果等于初始状态的 accepting
TEST(DFATest, EmptySequenceLaw) {
    const DFA accepting = build_two_cycle();
    EXPECT_EQ(accepting.accept({}), accepting.initial()->accepting);

    const DFA rejecting = build_partial();
    EXPECT_EQ(rejecting.accept({}), rejecting.initial()->accepting);
    EXPECT_FALSE(rejecting.accept({}));
}

// 测试数字字母表上的多状态 DFA
TEST(DFATest, NumericAlphabet) {
    DFA dfa({std::int64_t{0}, std::int64_t{1}});
    auto *q0 = dfa.add_state("q0", true, true);
    auto *q1 = dfa.add_state("q1");
    auto *q2 = dfa.add_state("q2");
    auto *q3 = dfa.add_state("q3");
    auto *q4 = dfa.add_state("q4", false, true);
    auto *q5 = dfa.add_state("q5", false, true);
    q0->add_transition(std::int64_t{1}, q1);
    q0->add_transition(std::int64_t{0}, q2);
    q1->add_transition(std::int64_t{1}, q1);
    q1->add_transition(std::int64_t{0}, q2);
    q2->add_transition(std::int64_t{1}, q3);
    q2->add_transition(std::int64_t{0}, q4);
    q3->add_transition(std::int64_t{1}, q3);
    q3->add_transition(std::int64_t{0}, q4);
    q4->add_transition(std::int64_t{1}, q5);
    q4->add_transition(std::int64_t{0}, q2);
    q5->add_transition(std::int64_t{1}, q5);
    q5->add_transition(std::int64_t{0}, q2);

    EXPECT_TRUE(dfa.accept(ints({})));
    EXPECT_FALSE(dfa.accept(ints({0})));
    EXPECT_FALSE(dfa.accept(ints({1})));
    EXPECT_FALSE(dfa.accept(ints({0, 1})));
    EXPECT_TRUE(dfa.accept(ints({0, 0})));
    EXPECT_FALSE(dfa.accept(ints({1, 1})));
    EXPECT_FALSE(dfa.accept(ints({1, 0, 1})));
    EXPECT_TRUE(dfa.accept(ints({1, 0, 1, 0})));
    EXPECT_TRUE(dfa.accept(ints({1, 0, 0, 1})));
    EXPECT_TRUE(dfa.is_complete());
}

// 测试缺失转移抛出异常，而不是当作拒绝
TEST(DFATest, MissingTransitionIsAnError) {
    const DFA dfa = build_partial();
    EXPECT_TRUE(dfa.accept(symbols_of("aba")));
    EXPECT_TRUE(dfa.accept(symbols_of("abbba")));
    EXPECT_FALSE(dfa.accept(symbols_of("abb")));
    EXPECT_THROW((void) dfa.accept(symbols_of("aab")), UndefinedTransitionError);
    EXPECT_THROW((void) dfa.accept(symbols_of("aa")), UndefinedTransitionError);
    // 字母表之外的符号同样报错
    EXPECT_THROW((void) dfa.accept(symbols_of("c")), UndefinedTransitionError);

    try {
        (void) dfa.accept(symbols_of("abc"));
        FAIL() << "expected UndefinedTransitionError";
    } catch (const UndefinedTransitionError &e) {
        EXPECT_EQ(e.state_name(), "q2");
        EXPECT_EQ(e.symbol(), Symbol{"c"});
    }
}

// 测试判定是纯函数：重复调用结果一致，失败的调用不影响后续调用
TEST(DFATest, AcceptIsPure) {
    const DFA dfa = build_partial();
    const auto before = dfa.render();
    EXPECT_TRUE(dfa.accept(symbols_of("aba")));
    EXPECT_TRUE(dfa.accept(symbols_of("aba")));
    EXPECT_FALSE(dfa.accept(symbols_of("ab")));
    EXPECT_THROW((void) dfa.accept(symbols_of("aab")), UndefinedTransitionError);
    EXPECT_TRUE(dfa.accept(symbols_of("aba")));
    EXPECT_EQ(dfa.render(), before);
}

// 测试可达状态集合
TEST(DFATest, ReachableStates) {
    DFA dfa = build_partial();
    dfa.add_state("orphan");
    std::set<std::string> names;
    for (const auto *state: dfa.states()) names.insert(state->name);
    EXPECT_EQ(names, (std::set<std::string>{"q0", "q1", "q2", "q3"}));
    EXPECT_EQ(dfa.states().front(), dfa.initial());
}

// 测试补全：缺失转移全部指向陷阱状态，原来报错的输入变成拒绝
TEST(DFATest, CompleteAddsSinkState) {
    DFA dfa = build_partial();
    EXPECT_FALSE(dfa.is_complete());

    auto *sink = dfa.complete();
    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->name, SINK_STATE_NAME);
    EXPECT_FALSE(sink->accepting);
    EXPECT_TRUE(dfa.is_complete());
    EXPECT_EQ(dfa.states().size(), 5);

    EXPECT_FALSE(dfa.accept(symbols_of("aab")));
    EXPECT_FALSE(dfa.accept(symbols_of("aa")));
    EXPECT_FALSE(dfa.accept(symbols_of("abaa")));
    EXPECT_TRUE(dfa.accept(symbols_of("aba")));

    // 已经完整时不再添加
    EXPECT_EQ(dfa.complete(), nullptr);
}

// 测试陷阱状态重名时换一个名字
TEST(DFATest, CompleteAvoidsNameClash) {
    DFA dfa({"a"});
    auto *p = dfa.add_state(SINK_STATE_NAME, true);
    (void) p;
    auto *sink = dfa.complete();
    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->name, std::string(SINK_STATE_NAME) + "'");
    EXPECT_FALSE(dfa.accept(symbols_of("aaa")));
}

// 测试组装错误
TEST(DFATest, DefinitionErrors) {
    DFA dfa({"a"});
    EXPECT_THROW((void) dfa.accept({}), MachineDefinitionError);
    dfa.add_state("p", true);
    EXPECT_THROW(dfa.add_state("p"), MachineDefinitionError);
    EXPECT_THROW(dfa.add_state("q", true), MachineDefinitionError);
    EXPECT_NE(dfa.find_state("p"), nullptr);
    EXPECT_EQ(dfa.find_state("q"), nullptr);
}

// 测试渲染结果确定，并且标出初始和接受状态
TEST(DFATest, RenderIsDeterministic) {
    const DFA first = build_two_cycle();
    const DFA second = build_two_cycle();
    EXPECT_EQ(first.render(), second.render());
    const std::string expected = "> p *\n"
            "  0 -> p\n"
            "  1 -> q\n"
            "       q\n"
            "         0 -> q\n"
            "         1 -> p\n";
    EXPECT_EQ(first.render(), expected);
}

// 测试移动后状态指针仍然有效
TEST(DFATest, MoveKeepsStates) {
    DFA original = build_two_cycle();
    const auto *p = original.initial();
    DFA moved = std::move(original);
    EXPECT_EQ(moved.initial(), p);
    EXPECT_FALSE(moved.accept(ints({1})));
}

// 测试逐步执行的游标：forward 前进，reset 复位，accept 不影响游标
TEST(DFATest, CursorForwardAndReset) {
    DFA dfa = build_two_cycle();
    EXPECT_EQ(dfa.current(), dfa.initial());
    dfa.forward(std::int64_t{1});
    EXPECT_EQ(dfa.current()->name, "q");
    dfa.forward(std::int64_t{0});
    EXPECT_EQ(dfa.current()->name, "q");
    EXPECT_TRUE(dfa.accept(ints({0, 0})));
    EXPECT_EQ(dfa.current()->name, "q");
    dfa.forward(std::int64_t{1});
    EXPECT_TRUE(dfa.current()->accepting);
    dfa.forward(std::int64_t{1});
    dfa.reset();
    EXPECT_EQ(dfa.current()->name, "p");
}

// 测试游标遇到缺失转移：抛出异常，游标不动，之后还能继续
TEST(DFATest, CursorStaysOnUndefinedTransition) {
    DFA dfa = build_partial();
    dfa.forward("a");
    EXPECT_THROW(dfa.forward("a"), UndefinedTransitionError);
    EXPECT_EQ(dfa.current()->name, "q1");
    dfa.forward("b");
    dfa.forward("a");
    EXPECT_TRUE(dfa.current()->accepting);
}

// 测试没有初始状态时游标不可用
TEST(DFATest, CursorWithoutInitialState) {
    DFA dfa({"a"});
    dfa.add_state("p");
    EXPECT_EQ(dfa.current(), nullptr);
    EXPECT_THROW(dfa.forward("a"), MachineDefinitionError);
    EXPECT_THROW(dfa.reset(), MachineDefinitionError);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
