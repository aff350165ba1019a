/**
 * @file test_warning.cpp
 * @brief Unit tests for warnings and observers (GoogleTest)
 *
 * Covers:
 * - warnings only for present-but-malformed optional values
 * - per-decode observer vs. process-wide observer
 * - emit_warnings = false
 * - StreamWarningLogger output, including concurrent decodes
 */

#include <gtest/gtest.h>
#include "unbox/Decode.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace unbox;

namespace {

struct Contact {
    explicit Contact(Unboxer& unboxer)
        : name(unboxer.required<std::string>("name"))
        , phone(unboxer.optional<int>("phone"))
        , tags(unboxer.optional<std::vector<std::string>>("tags", true))
    {}

    std::string name;
    std::optional<int> phone;
    std::optional<std::vector<std::string>> tags;
};

class CollectingObserver : public WarningObserver {
public:
    void on_warning(const Warning& warning) override {
        std::lock_guard<std::mutex> lock(mutex_);
        warnings.push_back(warning);
    }

    std::vector<Warning> warnings;

private:
    std::mutex mutex_;
};

std::size_t count_lines(const std::string& text) {
    std::size_t lines = 0;
    for (char c : text) {
        if (c == '\n') ++lines;
    }
    return lines;
}

} // anonymous namespace

// ============================================================================
// Test Fixture
// ============================================================================

class WarningTest : public ::testing::Test {
protected:
    void SetUp() override {
        observer = std::make_shared<CollectingObserver>();
        options.observer = observer;
    }

    void TearDown() override {
        set_warning_observer(nullptr);
    }

    std::shared_ptr<CollectingObserver> observer;
    DecodeOptions options;
};

// ============================================================================
// When warnings are produced
// ============================================================================

TEST_F(WarningTest, NoWarningForAbsentOrNullOptional) {
    auto absent = decode<Contact>(Value{{"name", "a"}}, options);
    auto null = decode<Contact>(Value{{"name", "a"}, {"phone", nullptr}}, options);

    ASSERT_TRUE(absent.ok());
    ASSERT_TRUE(null.ok());
    EXPECT_FALSE(null.value().phone.has_value());
    EXPECT_TRUE(observer->warnings.empty());
}

TEST_F(WarningTest, WarningForMalformedOptional) {
    auto result = decode<Contact>(Value{{"name", "a"}, {"phone", "call me"}}, options);

    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.value().phone.has_value());
    ASSERT_EQ(observer->warnings.size(), 1u);

    const Warning& warning = observer->warnings[0];
    EXPECT_EQ(warning.kind(), Warning::Kind::InvalidOptionalValue);
    EXPECT_EQ(warning.error().path(), "phone");
    EXPECT_EQ(warning.describe().rfind("Ignored invalid optional value: ", 0), 0u);
}

TEST_F(WarningTest, WarningForDroppedElement) {
    auto result = decode<Contact>(Value{{"name", "a"}, {"tags", {"x", 1, "y"}}}, options);

    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.value().tags.has_value());
    EXPECT_EQ(*result.value().tags, (std::vector<std::string>{"x", "1", "y"}));
    EXPECT_TRUE(observer->warnings.empty());

    auto nested = decode<Contact>(
        Value{{"name", "a"}, {"tags", Value::array({"x", Value::array(), "y"})}}, options);
    ASSERT_TRUE(nested.ok());
    EXPECT_EQ(nested.value().tags->size(), 2u);
    ASSERT_EQ(observer->warnings.size(), 1u);
    EXPECT_EQ(observer->warnings[0].kind(), Warning::Kind::InvalidElement);
    EXPECT_EQ(observer->warnings[0].describe().rfind("Skipped invalid collection element: ", 0), 0u);
}

TEST_F(WarningTest, WarningsNeverChangeTheOutcome) {
    auto result = decode<Contact>(Value{{"phone", "call me"}}, options);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().path(), "name");
}

// ============================================================================
// Delivery
// ============================================================================

TEST_F(WarningTest, ProcessWideObserver) {
    auto global = std::make_shared<CollectingObserver>();
    set_warning_observer(global);
    EXPECT_EQ(warning_observer(), global);

    auto result = decode<Contact>(Value{{"name", "a"}, {"phone", "x"}});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(global->warnings.size(), 1u);
}

TEST_F(WarningTest, DecodeObserverTakesPrecedence) {
    auto global = std::make_shared<CollectingObserver>();
    set_warning_observer(global);

    auto result = decode<Contact>(Value{{"name", "a"}, {"phone", "x"}}, options);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(observer->warnings.size(), 1u);
    EXPECT_TRUE(global->warnings.empty());
}

TEST_F(WarningTest, EmitWarningsDisabled) {
    auto global = std::make_shared<CollectingObserver>();
    set_warning_observer(global);
    options.emit_warnings = false;

    auto result = decode<Contact>(Value{{"name", "a"}, {"phone", "x"}}, options);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(observer->warnings.empty());
    EXPECT_TRUE(global->warnings.empty());
}

TEST_F(WarningTest, NoObserverIsFine) {
    auto result = decode<Contact>(Value{{"name", "a"}, {"phone", "x"}});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(warning_observer(), nullptr);
}

// ============================================================================
// StreamWarningLogger
// ============================================================================

TEST(StreamWarningLoggerTest, WritesOneLinePerWarning) {
    std::ostringstream out;
    DecodeOptions options;
    options.observer = std::make_shared<StreamWarningLogger>(out);

    auto result = decode<Contact>(Value{{"name", "a"}, {"phone", "x"}}, options);
    ASSERT_TRUE(result.ok());

    const std::string text = out.str();
    EXPECT_EQ(text.rfind("Warning: Ignored invalid optional value: ", 0), 0u);
    EXPECT_NE(text.find("\"phone\""), std::string::npos);
    EXPECT_EQ(count_lines(text), 1u);
}

TEST(StreamWarningLoggerTest, ConcurrentDecodes) {
    std::ostringstream out;
    DecodeOptions options;
    options.observer = std::make_shared<StreamWarningLogger>(out);

    const Value tree = {{"name", "a"}, {"phone", "x"}};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&tree, &options] {
            for (int i = 0; i < 25; ++i) {
                auto result = decode<Contact>(tree, options);
                EXPECT_TRUE(result.ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(count_lines(out.str()), 100u);
}
