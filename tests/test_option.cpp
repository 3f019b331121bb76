// Test suite for Option<T> - explicit absence of a value

#include "safeseq/option.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <stdexcept>

using namespace safeseq;

void test_construction() {
    std::cout << "Testing Option construction..." << std::endl;

    Option<int> empty;
    assert(empty.is_none());
    assert(!empty);

    Option<int> none = None;
    assert(none.is_none());

    Option<int> some(42);
    assert(some.is_some());
    assert(static_cast<bool>(some));
    assert(some.contains(42));
    assert(!some.contains(7));

    auto s = Some<std::string>("hello");
    assert(s.is_some());
    assert(s.contains("hello"));

    std::cout << "✓ Option construction works" << std::endl;
}

void test_unwrap() {
    std::cout << "Testing unwrap and expect..." << std::endl;

    Option<int> some(5);
    assert(some.unwrap() == 5);
    // unwrap moves the value out
    assert(some.is_none());

    Option<int> none;
    bool threw = false;
    try {
        none.unwrap();
    } catch (const std::runtime_error& e) {
        threw = true;
        assert(std::string(e.what()) == "Called unwrap on None");
    }
    assert(threw);

    threw = false;
    try {
        Option<int>(None).expect("no value here");
    } catch (const std::runtime_error& e) {
        threw = true;
        assert(std::string(e.what()) == "no value here");
    }
    assert(threw);

    assert(Option<int>(None).unwrap_or(9) == 9);
    assert(Option<int>(3).unwrap_or(9) == 3);

    int calls = 0;
    assert(Option<int>(None).unwrap_or_else([&calls] { ++calls; return 11; }) == 11);
    assert(Option<int>(4).unwrap_or_else([&calls] { ++calls; return 11; }) == 4);
    assert(calls == 1);

    std::cout << "✓ unwrap and expect work" << std::endl;
}

void test_copy_and_move() {
    std::cout << "Testing copy and move..." << std::endl;

    auto a = Some<std::string>("abc");
    Option<std::string> b = a;
    assert(a.contains("abc"));
    assert(b.contains("abc"));

    Option<std::string> c = std::move(a);
    assert(c.contains("abc"));
    assert(a.is_none());

    Option<std::string> d;
    d = b;
    assert(d == b);

    d = Option<std::string>(None);
    assert(d.is_none());

    std::cout << "✓ Copy and move work" << std::endl;
}

void test_combinators() {
    std::cout << "Testing combinators..." << std::endl;

    auto len = Some<std::string>("four").map([](std::string s) { return s.size(); });
    assert(len.contains(4));

    auto missing = Option<std::string>(None).map([](std::string s) { return s.size(); });
    assert(missing.is_none());

    auto name = Some<std::string>("abc");
    auto upper_len = name.map_ref([](const std::string& s) { return s.size() * 2; });
    assert(upper_len.contains(6));
    assert(name.contains("abc"));

    auto half = [](int x) -> Option<int> {
        if (x % 2 != 0) return None;
        return Some(x / 2);
    };
    assert(Some(8).and_then(half).contains(4));
    assert(Some(7).and_then(half).is_none());
    assert(Option<int>(None).and_then(half).is_none());

    auto even = [](const int& x) { return x % 2 == 0; };
    assert(Some(2).filter(even).contains(2));
    assert(Some(3).filter(even).is_none());

    assert(Option<int>(None).or_else([] { return Some(1); }).contains(1));
    assert(Some(2).or_else([] { return Some(1); }).contains(2));

    std::cout << "✓ Combinators work" << std::endl;
}

void test_take_and_replace() {
    std::cout << "Testing take and replace..." << std::endl;

    Option<int> opt(10);
    Option<int> taken = opt.take();
    assert(taken.contains(10));
    assert(opt.is_none());

    opt.replace(20);
    assert(opt.contains(20));
    opt.replace(30);
    assert(opt.contains(30));

    std::cout << "✓ take and replace work" << std::endl;
}

void test_references() {
    std::cout << "Testing as_ref and as_mut..." << std::endl;

    auto opt = Some<std::string>("hello");
    auto view = opt.as_ref();
    assert(view.is_some());
    assert(view.unwrap() == "hello");
    assert(view.cloned() == Some<std::string>("hello"));

    auto handle = opt.as_mut();
    handle.unwrap().append(" world");
    assert(opt.contains("hello world"));

    // cloned detaches: later edits through the handle do not reach the copy
    Option<std::string> copy = handle.cloned();
    handle.unwrap().append("!");
    assert(copy.contains("hello world"));
    assert(opt.contains("hello world!"));

    Option<std::string> empty;
    assert(empty.as_mut().cloned().is_none());

    Option<std::string> none;
    assert(none.as_ref().is_none());
    assert(none.as_mut().is_none());

    std::string fallback = "fallback";
    assert(none.as_ref().unwrap_or(fallback) == "fallback");

    std::cout << "✓ as_ref and as_mut work" << std::endl;
}

void test_equality() {
    std::cout << "Testing equality..." << std::endl;

    assert(Some(1) == Some(1));
    assert(Some(1) != Some(2));
    assert(Some(1) != Option<int>(None));
    assert(Option<int>(None) == Option<int>(None));
    assert(Option<int>(None) == None);
    assert(None == Option<int>(None));
    assert(Some(1) != None);

    std::cout << "✓ Equality works" << std::endl;
}

int main() {
    std::cout << "=== Option Tests ===" << std::endl;

    test_construction();
    test_unwrap();
    test_copy_and_move();
    test_combinators();
    test_take_and_replace();
    test_references();
    test_equality();

    std::cout << "\n=== All Option tests passed! ===" << std::endl;
    return 0;
}
