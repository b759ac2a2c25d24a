/**
 * @file test_calculator.cpp
 * @brief Unit tests for calculate/evaluate/compute and category classification
 */

#include <gtest/gtest.h>
#include <bmi/calculator.hpp>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

using namespace bmi;

namespace {

double value_in(const std::string& message) {
    const std::string prefix = "Your BMI is ";
    EXPECT_EQ(message.rfind(prefix, 0), 0u) << message;
    return std::strtod(message.c_str() + prefix.size(), nullptr);
}

} // namespace

// ============================================================================
// Reference values
// ============================================================================

TEST(CalculateTest, TypicalAdult) {
    EXPECT_EQ(calculate(1.75, 70.0), "Your BMI is 22.86");
}

TEST(CalculateTest, ExactValueKeepsTwoDecimals) {
    EXPECT_EQ(calculate(2.00, 100.0), "Your BMI is 25.00");
}

TEST(CalculateTest, ValueMatchesFormulaRoundedToHundredths) {
    const double heights[] = {0.5, 1.2, 1.6, 1.75, 1.91, 2.3};
    const double weights[] = {3.2, 45.0, 63.7, 88.8, 150.0};
    for (double h : heights) {
        for (double w : weights) {
            const double expected = std::round(w / (h * h) * 100.0) / 100.0;
            EXPECT_NEAR(value_in(calculate(h, w)), expected, 1e-9) << h << " m, " << w << " kg";
        }
    }
}

TEST(CalculateTest, HandComputedValues) {
    EXPECT_EQ(calculate(1.6, 45.0), "Your BMI is 17.58");    // 17.578125
    EXPECT_EQ(calculate(1.2, 63.7), "Your BMI is 44.24");    // 44.236...
    EXPECT_EQ(calculate(2.3, 150.0), "Your BMI is 28.36");   // 28.355...
    EXPECT_EQ(calculate(1.91, 88.8), "Your BMI is 24.34");   // 24.341...
}

TEST(CalculateTest, NoUpperBoundOnInputs) {
    EXPECT_EQ(calculate(0.1, 500.0), "Your BMI is 50000.00");
}

TEST(CalculateTest, HugeValueStaysFinite) {
    const auto message = calculate(1.0, 1e307);
    EXPECT_EQ(message.find("inf"), std::string::npos) << message;
    EXPECT_DOUBLE_EQ(value_in(message), 1e307);
    EXPECT_EQ(message.substr(message.size() - 3), ".00");
}

// ============================================================================
// Invalid input
// ============================================================================

TEST(CalculateTest, ZeroHeight_Invalid) {
    EXPECT_EQ(calculate(0.0, 70.0), "Invalid input values");
}

TEST(CalculateTest, ZeroWeight_Invalid) {
    EXPECT_EQ(calculate(1.75, 0.0), "Invalid input values");
}

TEST(CalculateTest, NegativeHeight_Invalid) {
    EXPECT_EQ(calculate(-1.0, 70.0), "Invalid input values");
}

TEST(CalculateTest, NegativeWeight_Invalid) {
    EXPECT_EQ(calculate(1.75, -70.0), "Invalid input values");
}

TEST(CalculateTest, NonFiniteInputs_Invalid) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(calculate(nan, 70.0), "Invalid input values");
    EXPECT_EQ(calculate(1.75, nan), "Invalid input values");
    EXPECT_EQ(calculate(inf, 70.0), "Invalid input values");
    EXPECT_EQ(calculate(1.75, inf), "Invalid input values");
}

TEST(CalculateTest, InvalidInputDoesNotThrow) {
    EXPECT_NO_THROW((void)calculate(-3.0, -4.0));
}

TEST(CalculateTest, RepeatedCallsGiveIdenticalOutput) {
    const auto first = calculate(1.68, 59.3);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(calculate(1.68, 59.3), first);
    }
    EXPECT_EQ(calculate(0.0, 1.0), calculate(0.0, 1.0));
}

// ============================================================================
// Structured result
// ============================================================================

TEST(EvaluateTest, ValidResultCarriesRoundedValue) {
    const auto result = evaluate(1.75, 70.0);
    EXPECT_TRUE(result.valid);
    EXPECT_DOUBLE_EQ(result.value, 22.86);
    EXPECT_EQ(result.message, "Your BMI is 22.86");
}

TEST(EvaluateTest, InvalidResult) {
    const auto result = evaluate(0.0, 70.0);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.message, invalid_input_message);
}

TEST(ComputeTest, ReturnsUnroundedValue) {
    EXPECT_DOUBLE_EQ(compute(Measurement{1.75, 70.0}), 70.0 / (1.75 * 1.75));
}

TEST(ComputeTest, InvalidMeasurement_Throws) {
    EXPECT_THROW((void)compute(Measurement{0.0, 70.0}), std::invalid_argument);
    EXPECT_THROW((void)compute(Measurement{1.75, -2.0}), std::invalid_argument);
}

TEST(RoundTest, HalfAwayFromZero) {
    EXPECT_DOUBLE_EQ(round_to_hundredths(0.125), 0.13);
    EXPECT_DOUBLE_EQ(round_to_hundredths(-0.125), -0.13);
    EXPECT_DOUBLE_EQ(round_to_hundredths(22.857142), 22.86);
    EXPECT_DOUBLE_EQ(round_to_hundredths(22.854), 22.85);
    EXPECT_DOUBLE_EQ(round_to_hundredths(25.0), 25.0);
}

TEST(RoundTest, LargeValuesPassThrough) {
    EXPECT_EQ(round_to_hundredths(1e307), 1e307);
    EXPECT_EQ(round_to_hundredths(std::numeric_limits<double>::max()), std::numeric_limits<double>::max());
    EXPECT_DOUBLE_EQ(round_to_hundredths(1e12 + 0.125), 1e12 + 0.13);
}

// ============================================================================
// Categories
// ============================================================================

TEST(ClassifyTest, BandBoundaries) {
    EXPECT_EQ(classify(18.49), Category::Underweight);
    EXPECT_EQ(classify(18.5), Category::Normal);
    EXPECT_EQ(classify(24.99), Category::Normal);
    EXPECT_EQ(classify(25.0), Category::Overweight);
    EXPECT_EQ(classify(29.99), Category::Overweight);
    EXPECT_EQ(classify(30.0), Category::Obese);
}

TEST(ClassifyTest, Names) {
    EXPECT_EQ(to_string(Category::Underweight), "Underweight");
    EXPECT_EQ(to_string(Category::Normal), "Normal");
    EXPECT_EQ(to_string(Category::Overweight), "Overweight");
    EXPECT_EQ(to_string(Category::Obese), "Obese");
}
