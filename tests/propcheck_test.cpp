#include "propcheck_gtest.h"

#include <gtest/gtest-spi.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

    Generator<Document> five_key_document() {
        Document doc;
        for (int i = 0; i < 5; i++) {
            doc.set("k" + std::to_string(i), i);
        }
        return Gen::constant(doc);
    }

    CheckConfig seeded(uint64_t seed, size_t trials) {
        CheckConfig config;
        config.seed = seed;
        config.trials = trials;
        return config;
    }

}// namespace

TEST(Check, OddLeafIsReportedUnshrunk) {
    auto is_even = [](int64_t n) { return n % 2 == 0; };
    std::vector<std::string> result = check(is_even, Gen::int_range(1, 1), 1);
    EXPECT_EQ(result, (std::vector<std::string>{"after 0 reductions: 1"}));
}

TEST(Check, PassingPropertyReportsNothing) {
    EXPECT_TRUE(check([](int64_t n) { return n >= 0; }, Gen::int_range(0, 100)).empty());
}

TEST(Check, OneRecordPerFailingTrial) {
    auto is_even = [](int64_t n) { return n % 2 == 0; };
    EXPECT_EQ(check(is_even, Gen::int_range(1, 1), 7).size(), 7u);
}

TEST(Check, DocumentShrinksToThreeKeys) {
    auto small = [](const Document &doc) { return doc.size() < 3; };
    CheckConfig config = seeded(137, 1);
    config.reduction_attempts = 64;
    CheckReport<Document> report = run(five_key_document(), small, config);
    ASSERT_EQ(report.counterexamples.size(), 1u);
    const auto &c = report.counterexamples[0];
    EXPECT_EQ(c.original.size(), 5u);
    auto shrunk = std::get<Shrunk<Document>>(c.outcome);
    EXPECT_EQ(shrunk.value.size(), 3u);
    EXPECT_EQ(to_string(c).rfind("after 2 reductions: {", 0), 0u);
}

TEST(Check, DefaultBudgetShrinksBothScenarios) {
    auto small = [](const Document &doc) { return doc.size() < 3; };
    CheckReport<Document> docs = run(five_key_document(), small, seeded(163, 1));
    ASSERT_EQ(docs.counterexamples.size(), 1u);
    EXPECT_EQ(std::get<Shrunk<Document>>(docs.counterexamples[0].outcome).value.size(), 3u);

    auto below_ten = [](const std::vector<int64_t> &xs) { return std::accumulate(xs.begin(), xs.end(), int64_t(0)) < 10; };
    auto sums = run(Gen::list(Gen::constant<int64_t>(5), Gen::int_range(3, 3)), below_ten, seeded(167, 1));
    EXPECT_EQ(to_strings(sums), (std::vector<std::string>{"after 1 reductions: [5, 5]"}));
}

TEST(Check, DocumentFailureIsAlwaysReported) {
    auto small = [](const Document &doc) { return doc.size() < 3; };
    std::vector<std::string> result = check(small, five_key_document(), 3);
    ASSERT_EQ(result.size(), 3u);
    for (const auto &line : result) {
        EXPECT_EQ(line.rfind("after ", 0), 0u) << line;
    }
}

TEST(Check, RaisingPredicateIsReportedPerTrialWithoutShrinking) {
    int calls = 0;
    auto boom = [&calls](const std::vector<int64_t> &) -> bool {
        calls++;
        throw std::runtime_error("boom");
    };
    auto gen = Gen::list(Gen::constant<int64_t>(5), Gen::int_range(3, 3));
    std::vector<std::string> result = check(boom, gen, 4);
    ASSERT_EQ(result.size(), 4u);
    for (const auto &line : result) {
        EXPECT_EQ(line, "[5, 5, 5] : boom");
    }
    // One evaluation per trial: nothing was shrunk.
    EXPECT_EQ(calls, 4);
}

TEST(Check, NonStandardThrowIsStillCaptured) {
    auto odd = [](int64_t) -> bool { throw 42; };
    std::vector<std::string> result = check(odd, Gen::constant<int64_t>(3), 1);
    EXPECT_EQ(result, (std::vector<std::string>{"3 : unknown exception"}));
}

TEST(Check, SequenceSumShrinksToTwoFives) {
    auto below_ten = [](const std::vector<int64_t> &xs) { return std::accumulate(xs.begin(), xs.end(), int64_t(0)) < 10; };
    CheckConfig config = seeded(139, 5);
    config.reduction_attempts = 64;
    auto report = run(Gen::list(Gen::choose_value<int64_t>({5}), Gen::int_range(3, 3)), below_ten, config);
    ASSERT_EQ(report.counterexamples.size(), 5u);
    for (const auto &line : to_strings(report)) {
        EXPECT_EQ(line, "after 1 reductions: [5, 5]");
    }
}

TEST(Check, SameSeedSameReport) {
    // Nothing time-dependent in here, unlike ObjectIds.
    using Rows = std::vector<std::vector<int64_t>>;
    auto few = [](const Rows &rows) {
        size_t total = 0;
        for (const auto &row : rows) { total += row.size(); }
        return total < 5;
    };
    auto gen = Gen::list(Gen::list(Gen::int_range(0, 9), Gen::int_range(0, 4)), Gen::int_range(0, 6));
    auto a = to_strings(run(gen, few, seeded(149, 20)));
    auto b = to_strings(run(gen, few, seeded(149, 20)));
    EXPECT_FALSE(a.empty());
    EXPECT_EQ(a, b);
}

TEST(Check, ReportKeepsTheSeed) {
    auto report = run(Gen::boolean(), [](bool) { return true; }, seeded(151, 3));
    EXPECT_EQ(report.seed, 151u);
    EXPECT_EQ(report.trials, 3u);
    EXPECT_TRUE(report.passed());
    EXPECT_EQ(to_string(report), "Passes (3 trials)");
}

TEST(Check, FailingReportSummary) {
    auto report = run(Gen::int_range(1, 1), [](int64_t n) { return n == 0; }, seeded(157, 2));
    EXPECT_EQ(to_string(report),
              "Fails (seed 157, 0 raised):\n"
              "found 2 counter examples, displaying first 2:\n"
              "    -> after 0 reductions: 1\n"
              "    -> after 0 reductions: 1");
}

TEST(Check, NegateFlipsThePredicate) {
    auto is_even = [](int64_t n) { return n % 2 == 0; };
    EXPECT_TRUE(check(negate(is_even), Gen::int_range(1, 1), 3).empty());
    EXPECT_EQ(check(negate(is_even), Gen::int_range(2, 2), 3).size(), 3u);
}

TEST(Check, RunTestWritesToTheConfiguredLog) {
    std::ostringstream log;
    CheckConfig config = seeded(173, 2);
    config.log = &log;
    run_test("odd leaf", Gen::int_range(1, 1), [](int64_t n) { return n == 0; }, config);
    EXPECT_EQ(log.str(),
              "--------\n"
              "[odd leaf] Fails (seed 173, 0 raised):\n"
              "found 2 counter examples, displaying first 2:\n"
              "    -> after 0 reductions: 1\n"
              "    -> after 0 reductions: 1\n");
}

TEST(Check, ByteCounterexamplesReadAsNumbers) {
    auto below_200 = [](uint8_t b) { return b < 200; };
    std::vector<std::string> result = check(below_200, Gen::constant<uint8_t>(250), 1);
    EXPECT_EQ(result, (std::vector<std::string>{"after 0 reductions: 250"}));
}

TEST(FormatFailures, ListsOnlyTheFirstFew) {
    std::vector<std::string> examples = {"a", "b", "c", "d", "e", "f", "g"};
    EXPECT_EQ(format_failures(examples, 5),
              "found 7 counter examples, displaying first 5:\n"
              "    -> a\n    -> b\n    -> c\n    -> d\n    -> e");
    EXPECT_EQ(format_failures({"only"}, 5), "found 1 counter examples, displaying first 1:\n    -> only");
}

TEST(GtestIntegration, PassingPropertyIsSuccess) {
    EXPECT_TRUE(holds_for_all([](int64_t n) { return n <= 10; }, Gen::int_range(0, 10)));
    PROPCHECK_ASSERT_HOLDS([](const Value &v) { return v == v; }, Gen::value(2, true));
}

TEST(GtestIntegration, FailingPropertyCarriesTheMessage) {
    auto is_even = [](int64_t n) { return n % 2 == 0; };
    ::testing::AssertionResult result = holds_for_all(is_even, Gen::int_range(1, 1), 2);
    ASSERT_FALSE(result);
    std::string message = result.message();
    EXPECT_NE(message.find("found 100 counter examples, displaying first 2:"), std::string::npos);
    EXPECT_NE(message.find("    -> after 0 reductions: 1"), std::string::npos);
    EXPECT_NE(message.find("(seed "), std::string::npos);
}

TEST(GtestIntegration, MacrosAcceptLambdasWithCommas) {
    PROPCHECK_EXPECT_HOLDS([](int64_t n) { std::pair<int64_t, int64_t> p{n, n}; return p.first == p.second; },
                           Gen::int_range(0, 9));
    PROPCHECK_ASSERT_HOLDS([](int64_t n) { std::pair<int64_t, int64_t> p{n, -n}; return p.first + p.second == 0; },
                           Gen::int_range(0, 9), size_t(3));
}

TEST(GtestIntegration, AssertMacroFailsTheTest) {
    EXPECT_FATAL_FAILURE(PROPCHECK_ASSERT_HOLDS([](int64_t) { return false; }, Gen::int_range(1, 1)),
                         "found 100 counter examples, displaying first 5:");
}

TEST(GtestIntegration, ExpectMacroFailsTheTest) {
    EXPECT_NONFATAL_FAILURE(PROPCHECK_EXPECT_HOLDS([](int64_t) { return false; }, Gen::int_range(1, 1)),
                            "after 0 reductions: 1");
}
