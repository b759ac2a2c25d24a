#pragma once

#include <cmath>
#include <stdexcept>

namespace bmi
{
    // Height in metres, weight in kilograms.
    struct Measurement
    {
        double height_m{0.0};
        double weight_kg{0.0};

        [[nodiscard]] bool is_valid() const noexcept
        {
            return is_positive(height_m) && is_positive(weight_kg);
        }

        void validate() const
        {
            if (!is_positive(height_m))
            {
                throw std::invalid_argument("Height must be a positive, finite number of metres");
            }
            if (!is_positive(weight_kg))
            {
                throw std::invalid_argument("Weight must be a positive, finite number of kilograms");
            }
        }

    private:
        // NaN fails the comparison.
        [[nodiscard]] static bool is_positive(double value) noexcept
        {
            return value > 0.0 && std::isfinite(value);
        }
    };
} // namespace bmi
