#pragma once

#include "calculator.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace bmi
{
    enum class Field
    {
        Height,
        Weight,
    };

    inline std::string_view to_string(Field field) noexcept
    {
        switch (field)
        {
        case Field::Height:
            return "Height (m)";
        case Field::Weight:
            return "Weight (kg)";
        }
        return "Unknown";
    }

    [[nodiscard]] inline std::optional<double> parse_number(std::string_view text) noexcept
    {
        constexpr std::string_view whitespace = " \t\r\n";
        const auto first = text.find_first_not_of(whitespace);
        if (first == std::string_view::npos)
        {
            return std::nullopt;
        }
        text = text.substr(first, text.find_last_not_of(whitespace) - first + 1);

        // from_chars rejects a leading '+', strtod does not.
        if (text.front() == '+')
        {
            text.remove_prefix(1);
            if (text.empty() || text.front() == '-')
            {
                return std::nullopt;
            }
        }

        double value = 0.0;
        const auto* end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec != std::errc{} || ptr != end || !std::isfinite(value))
        {
            return std::nullopt;
        }
        return value;
    }

    /*
     * Text-field state between a view and the calculator. The view feeds
     * keystrokes in, calls submit() and redraws result() whenever revision()
     * has moved on since its last frame.
     */
    class Form
    {
    public:
        static constexpr std::size_t max_field_length = 16;

        [[nodiscard]] const std::string& text(Field field) const noexcept { return m_fields[index(field)]; }

        void set_text(Field field, std::string_view text)
        {
            auto& target = m_fields[index(field)];
            target.clear();
            append_filtered(target, text);
        }

        // Appends the accepted characters of text to the focused field.
        void append(std::string_view text)
        {
            append_filtered(m_fields[index(m_focused)], text);
        }

        void erase_last() noexcept
        {
            auto& target = m_fields[index(m_focused)];
            if (!target.empty())
            {
                target.pop_back();
            }
        }

        void clear() noexcept
        {
            for (auto& field : m_fields)
            {
                field.clear();
            }
            m_result.clear();
            m_category.reset();
            m_focused = Field::Height;
            ++m_revision;
        }

        void focus(Field field) noexcept { m_focused = field; }
        void focus_next() noexcept { m_focused = m_focused == Field::Height ? Field::Weight : Field::Height; }
        [[nodiscard]] Field focused() const noexcept { return m_focused; }

        const std::string& submit()
        {
            // Unparseable text counts as a non-positive value.
            const double height = parse_number(text(Field::Height)).value_or(0.0);
            const double weight = parse_number(text(Field::Weight)).value_or(0.0);

            auto result = evaluate(height, weight);
            m_category = result.valid ? std::optional<Category>{classify(result.value)} : std::nullopt;
            m_result = std::move(result.message);
            ++m_revision;
            return m_result;
        }

        [[nodiscard]] const std::string& result() const noexcept { return m_result; }
        [[nodiscard]] std::optional<Category> category() const noexcept { return m_category; }
        [[nodiscard]] std::uint64_t revision() const noexcept { return m_revision; }

    private:
        [[nodiscard]] static std::size_t index(Field field) noexcept { return static_cast<std::size_t>(field); }

        [[nodiscard]] static bool accepts(char c) noexcept
        {
            return (c >= '0' && c <= '9') || c == '.' || c == '-';
        }

        static void append_filtered(std::string& target, std::string_view text)
        {
            for (char c : text)
            {
                if (target.size() >= max_field_length)
                {
                    break;
                }
                if (accepts(c))
                {
                    target.push_back(c);
                }
            }
        }

        std::array<std::string, 2> m_fields{};
        Field m_focused{Field::Height};
        std::string m_result{};
        std::optional<Category> m_category{};
        std::uint64_t m_revision{0};
    };
} // namespace bmi
