/**
 * @file test_error_classifier.cpp
 * @brief Unit tests for status report parsing and error classification.
 */

#include "runner/error_classifier.hpp"

#include <gtest/gtest.h>

using namespace code_sandbox;

TEST(ErrorClassifierTest, ParsesReport) {
    auto report = parse_status_report(R"({"error_type":"ZeroDivisionError","error":"division by zero"})");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->type_name, "ZeroDivisionError");
    EXPECT_EQ(report->message, "division by zero");
}

TEST(ErrorClassifierTest, MessageIsOptional) {
    auto report = parse_status_report(R"({"error_type":"KeyboardInterrupt"})");
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->message.empty());
}

TEST(ErrorClassifierTest, RejectsMalformedReports) {
    EXPECT_FALSE(parse_status_report(""));
    EXPECT_FALSE(parse_status_report("not json"));
    EXPECT_FALSE(parse_status_report("[1, 2]"));
    EXPECT_FALSE(parse_status_report(R"({"error":"no type"})"));
    EXPECT_FALSE(parse_status_report(R"({"error_type":42})"));
    EXPECT_FALSE(parse_status_report(R"({"error_type":"ValueError")"));
}

TEST(ErrorClassifierTest, KnownTypes) {
    EXPECT_EQ(classify_error_type("ZeroDivisionError"), ErrorKind::DivisionByZero);
    EXPECT_EQ(classify_error_type("TypeError"), ErrorKind::TypeError);
    EXPECT_EQ(classify_error_type("NameError"), ErrorKind::NameError);
    EXPECT_EQ(classify_error_type("KeyError"), ErrorKind::KeyError);
    EXPECT_EQ(classify_error_type("RecursionError"), ErrorKind::RecursionError);
    EXPECT_EQ(classify_error_type("AssertionError"), ErrorKind::AssertionError);
}

TEST(ErrorClassifierTest, SubclassesMapToParentKind) {
    EXPECT_EQ(classify_error_type("ModuleNotFoundError"), ErrorKind::ImportError);
    EXPECT_EQ(classify_error_type("UnboundLocalError"), ErrorKind::NameError);
    EXPECT_EQ(classify_error_type("UnicodeDecodeError"), ErrorKind::ValueError);
    EXPECT_EQ(classify_error_type("IndentationError"), ErrorKind::SyntaxError);
}

TEST(ErrorClassifierTest, UnknownTypesAreUncategorized) {
    EXPECT_EQ(classify_error_type("MyCustomError"), ErrorKind::Uncategorized);
    EXPECT_EQ(classify_error_type(""), ErrorKind::Uncategorized);
    EXPECT_EQ(classify_error_type("zerodivisionerror"), ErrorKind::Uncategorized);
}
