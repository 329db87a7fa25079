#include "propcheck.h"

#include <numeric>
#include <stdexcept>

void test_constant() {
    run_test("constant(42) should always generate 42",
             Gen::constant(42),
             [](int num) { return num == 42; });
}

void test_int_range_bounds() {
    run_test("int_range(3,10) should generate 3..10 inclusive",
             Gen::int_range(3, 10),
             [](int64_t num) { return num >= 3 && num <= 10; });
}

void test_int_leaf_does_not_shrink() {
    run_test("int_range(1,1) - an odd leaf is reported with 0 reductions",
             Gen::int_range(1, 1),
             [](int64_t num) { return num % 2 == 0; });
}

void test_map() {
    run_test("map() transforms the value",
             Gen::int_range(0, 10).map([](int64_t n) { return n * 2; }),
             [](int64_t n) { return n % 2 == 0; });
}

void test_list_shrinking() {
    run_test("list() - [5, 5, 5] with sum < 10 shrinks to two elements",
             Gen::list(Gen::constant<int64_t>(5), Gen::int_range(3, 3)),
             [](const std::vector<int64_t> &xs) { return std::accumulate(xs.begin(), xs.end(), int64_t(0)) < 10; });
}

void test_document_shrinking() {
    CheckConfig config;
    config.trials = 10;
    config.verbose = true;
    run_test("document(2) - documents with 3+ keys shrink to exactly 3",
             Gen::document(2),
             [](const Document &doc) { return doc.size() < 3; },
             config);
}

void test_copy_preserves_equality() {
    run_test("value(3) - a copy compares equal to its source",
             Gen::value(3, true),
             [](const Value &v) {
                 Value copy = v;
                 return copy == v;
             });
}

void test_raising_predicate() {
    CheckConfig config;
    config.trials = 3;
    run_test("value(1) - a throwing predicate is reported without shrinking",
             Gen::value(1, false),
             [](const Value &) -> bool { throw std::runtime_error("predicate blew up"); },
             config);
}

int main() {
    test_constant();
    test_int_range_bounds();
    test_int_leaf_does_not_shrink();
    test_map();
    test_list_shrinking();
    test_document_shrinking();
    test_copy_preserves_equality();
    test_raising_predicate();
    return 0;
}
