// Prints the calculator output for a fixed table of measurements
#include <bmi/calculator.hpp>
#include <safe_io/utils.hpp>

#include <array>
#include <string>

namespace
{
    using bmi::Measurement;

    constexpr std::array<Measurement, 9> samples{{
        {1.75, 70.0},
        {2.00, 100.0},
        {1.60, 45.0},
        {1.82, 88.5},
        {1.68, 95.0},
        {0.0, 70.0},
        {1.75, 0.0},
        {-1.0, 70.0},
        {1.50, -40.0},
    }};

    void run_demo()
    {
        safe_io::print("{:>8}  {:>8}  {:<22}  {}", "height", "weight", "result", "category");

        for (const auto& sample : samples)
        {
            const auto result = bmi::evaluate(sample.height_m, sample.weight_kg);
            const std::string category = result.valid ? std::string(bmi::to_string(bmi::classify(result.value))) : "-";

            safe_io::print(
                "{:>8.2f}  {:>8.1f}  {:<22}  {}",
                sample.height_m,
                sample.weight_kg,
                result.message,
                category);
        }
    }
} // namespace

int main()
{
    run_demo();
    return 0;
}
