#pragma once

#include "measurement.hpp"

#include <cmath>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace bmi
{
    inline constexpr std::string_view invalid_input_message = "Invalid input values";

    enum class Category
    {
        Underweight,
        Normal,
        Overweight,
        Obese,
    };

    inline std::string_view to_string(Category category) noexcept
    {
        switch (category)
        {
        case Category::Underweight:
            return "Underweight";
        case Category::Normal:
            return "Normal";
        case Category::Overweight:
            return "Overweight";
        case Category::Obese:
            return "Obese";
        }
        return "Unknown";
    }

    // WHO adult bands.
    [[nodiscard]] inline Category classify(double bmi) noexcept
    {
        if (bmi < 18.5)
        {
            return Category::Underweight;
        }
        if (bmi < 25.0)
        {
            return Category::Normal;
        }
        if (bmi < 30.0)
        {
            return Category::Overweight;
        }
        return Category::Obese;
    }

    struct Result
    {
        bool valid{false};
        double value{0.0};
        std::string message{};
    };

    [[nodiscard]] inline double round_to_hundredths(double value) noexcept
    {
        // At or above 2^52 / 100 there are no hundredths left to round, and value * 100 may overflow.
        if (!(std::fabs(value) < 0x1p52 / 100.0))
        {
            return value;
        }
        return std::round(value * 100.0) / 100.0;
    }

    // Unrounded weight / height^2. Throws std::invalid_argument for an invalid measurement.
    [[nodiscard]] inline double compute(const Measurement& measurement)
    {
        measurement.validate();
        return measurement.weight_kg / (measurement.height_m * measurement.height_m);
    }

    [[nodiscard]] inline Result evaluate(double height_m, double weight_kg)
    {
        const Measurement measurement{height_m, weight_kg};
        if (!measurement.is_valid())
        {
            return Result{false, 0.0, std::string(invalid_input_message)};
        }

        const double rounded = round_to_hundredths(compute(measurement));
        return Result{true, rounded, fmt::format("Your BMI is {:.2f}", rounded)};
    }

    /*
     * Returns "Your BMI is {bmi}" with the value printed to two decimals, or
     * invalid_input_message when either input is not strictly positive.
     * Never throws on bad input; the caller displays the string as-is.
     */
    [[nodiscard]] inline std::string calculate(double height_m, double weight_kg)
    {
        return evaluate(height_m, weight_kg).message;
    }
} // namespace bmi
