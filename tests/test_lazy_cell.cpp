#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <libctdi.hpp>

#include <stdexcept>
#include <string>

using libctdi::lazy_cell;

TEMPLATE_TEST_CASE("lazy_cell starts empty", "[lazy_cell]",
                   libctdi::thread_safe, libctdi::single_thread) {
    lazy_cell<int, TestType> cell;
    REQUIRE(cell.get() == nullptr);
}

TEMPLATE_TEST_CASE("lazy_cell runs the initializer once", "[lazy_cell]",
                   libctdi::thread_safe, libctdi::single_thread) {
    lazy_cell<std::string, TestType> cell;
    int calls = 0;

    auto& first = cell.get_or_init([&] { ++calls; return std::string("ready"); });
    auto& second = cell.get_or_init([&] { ++calls; return std::string("again"); });

    REQUIRE(calls == 1);
    REQUIRE(&first == &second);
    REQUIRE(first == "ready");
    REQUIRE(cell.get() == &first);
}

TEMPLATE_TEST_CASE("lazy_cell set fills an empty cell only", "[lazy_cell]",
                   libctdi::thread_safe, libctdi::single_thread) {
    lazy_cell<int, TestType> cell;

    REQUIRE(cell.set(7));
    REQUIRE_FALSE(cell.set(8));
    REQUIRE(*cell.get() == 7);

    bool ran = false;
    REQUIRE(cell.get_or_init([&] { ran = true; return 9; }) == 7);
    REQUIRE_FALSE(ran);
}

TEMPLATE_TEST_CASE("lazy_cell stays empty when the initializer throws", "[lazy_cell]",
                   libctdi::thread_safe, libctdi::single_thread) {
    lazy_cell<int, TestType> cell;

    REQUIRE_THROWS_AS(cell.get_or_init([]() -> int { throw std::runtime_error("boom"); }),
                      std::runtime_error);
    REQUIRE(cell.get() == nullptr);

    REQUIRE(cell.get_or_init([] { return 3; }) == 3);
}

TEMPLATE_TEST_CASE("lazy_cell detects reentrant initialization", "[lazy_cell]",
                   libctdi::thread_safe, libctdi::single_thread) {
    lazy_cell<int, TestType> cell;

    REQUIRE_THROWS_AS(cell.get_or_init([&cell] {
                          return cell.get_or_init([] { return 1; }) + 1;
                      }),
                      libctdi::reentrant_initialization);
    REQUIRE(cell.get() == nullptr);
}

TEMPLATE_TEST_CASE("lazy_cell reset empties a filled cell", "[lazy_cell]",
                   libctdi::thread_safe, libctdi::single_thread) {
    lazy_cell<std::string, TestType> cell;
    cell.get_or_init([] { return std::string("first"); });

    cell.reset();
    REQUIRE(cell.get() == nullptr);
    REQUIRE(cell.get_or_init([] { return std::string("second"); }) == "second");
}
