// Test suite for line and word splitting

#include "safeseq/text.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using namespace safeseq;

using Lines = std::vector<std::string>;

void test_lines() {
    std::cout << "Testing lines..." << std::endl;

    assert(lines("") == Lines{});
    assert(lines("a") == (Lines{"a"}));
    assert(lines("a\n") == (Lines{"a"}));
    assert(lines("a\nb") == (Lines{"a", "b"}));
    assert(lines("a\nb\n") == (Lines{"a", "b"}));
    assert(lines("\n") == (Lines{""}));
    assert(lines("\n\n") == (Lines{"", ""}));
    assert(lines("a\n\nb") == (Lines{"a", "", "b"}));

    // lines keeps carriage returns
    assert(lines("a\r\nb") == (Lines{"a\r", "b"}));

    std::cout << "✓ lines works" << std::endl;
}

void test_lines_cr() {
    std::cout << "Testing lines_cr..." << std::endl;

    assert(lines_cr("a\r\nb\nc\r\n") == (Lines{"a", "b", "c"}));
    assert(lines_cr("") == Lines{});
    assert(lines_cr("\r\n") == (Lines{""}));
    assert(lines_cr("no newline\r") == (Lines{"no newline"}));

    // Only one trailing '\r' per line, and only at the end
    assert(lines_cr("a\r\r\n") == (Lines{"a\r"}));
    assert(lines_cr("a\rb\n") == (Lines{"a\rb"}));

    // A bare '\r' is not a line break
    assert(lines_cr("a\rb") == (Lines{"a\rb"}));

    std::cout << "✓ lines_cr works" << std::endl;
}

void test_lines_cr_matches_drop_suffix() {
    std::cout << "Testing lines_cr against lines + drop_suffix..." << std::endl;

    const std::string text = "one\r\ntwo\n\r\nthree\r\r\nfour";
    Lines expected;
    for (const auto& line : lines(text)) {
        expected.push_back(drop_suffix("\r", line));
    }
    assert(lines_cr(text) == expected);
    assert(expected.size() == 5);
    assert(expected[2].empty());
    assert(expected[3] == "three\r");

    std::cout << "✓ lines_cr composes lines and drop_suffix" << std::endl;
}

void test_unlines() {
    std::cout << "Testing unlines..." << std::endl;

    assert(unlines(Lines{}) == "");
    assert(unlines(Lines{"a", "b"}) == "a\nb\n");
    assert(unlines(Lines{""}) == "\n");

    const std::string text = "x\ny\n\nz\n";
    assert(unlines(lines(text)) == text);

    std::cout << "✓ unlines works" << std::endl;
}

void test_words() {
    std::cout << "Testing words and unwords..." << std::endl;

    assert(words("") == Lines{});
    assert(words("   \t\n ") == Lines{});
    assert(words("one") == (Lines{"one"}));
    assert(words("  one two\tthree\nfour  ") == (Lines{"one", "two", "three", "four"}));

    assert(unwords(Lines{}) == "");
    assert(unwords(Lines{"a"}) == "a");
    assert(unwords(Lines{"a", "b", "c"}) == "a b c");
    assert(unwords(words(" a  b ")) == "a b");

    std::cout << "✓ words and unwords work" << std::endl;
}

int main() {
    std::cout << "=== Text Tests ===" << std::endl;

    test_lines();
    test_lines_cr();
    test_lines_cr_matches_drop_suffix();
    test_unlines();
    test_words();

    std::cout << "\n=== All Text tests passed! ===" << std::endl;
    return 0;
}
