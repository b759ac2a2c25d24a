#pragma once

#include <bmi/form.hpp>

#include <algorithm>
#include <optional>
#include <string>

namespace bmi::desktop
{
    struct ViewOptions
    {
        std::string title{"BMI Calculator"};
        int width{640};
        int height{280};
        // Render scale applied to the 8x8 debug font and every widget.
        float text_scale{2.0f};
        // Empty lets SDL choose the renderer backend.
        std::string renderer_driver{};
        bool vsync{true};
    };

    struct Rect
    {
        float x{0.0f};
        float y{0.0f};
        float w{0.0f};
        float h{0.0f};

        [[nodiscard]] bool contains(float px, float py) const noexcept
        {
            return px >= x && px < x + w && py >= y && py < y + h;
        }
    };

    enum class Widget
    {
        HeightField,
        WeightField,
        CalculateButton,
    };

    // All rectangles are in render (logical) coordinates.
    struct Layout
    {
        Rect height_label{};
        Rect height_field{};
        Rect weight_label{};
        Rect weight_field{};
        Rect button{};
        Rect result{};
        Rect category{};

        [[nodiscard]] const Rect& field(Field which) const noexcept
        {
            return which == Field::Height ? height_field : weight_field;
        }

        [[nodiscard]] const Rect& label(Field which) const noexcept
        {
            return which == Field::Height ? height_label : weight_label;
        }
    };

    inline constexpr float glyph_size = 8.0f;
    inline constexpr float margin = 8.0f;
    inline constexpr float row_height = glyph_size + 8.0f;
    inline constexpr float row_pitch = row_height + 8.0f;

    [[nodiscard]] inline Layout compute_layout(float width)
    {
        constexpr float label_width = 12.0f * glyph_size;
        constexpr float min_field_width = static_cast<float>(Form::max_field_length + 1) * glyph_size + 8.0f;
        constexpr float button_width = 9.0f * glyph_size + 16.0f;

        const float field_x = margin + label_width + margin;
        const float field_width = std::max(min_field_width, width - field_x - margin);
        const float text_width = std::max(label_width, width - 2.0f * margin);

        Layout layout{};
        float y = margin;
        layout.height_label = Rect{margin, y, label_width, row_height};
        layout.height_field = Rect{field_x, y, field_width, row_height};

        y += row_pitch;
        layout.weight_label = Rect{margin, y, label_width, row_height};
        layout.weight_field = Rect{field_x, y, field_width, row_height};

        y += row_pitch;
        layout.button = Rect{field_x, y, button_width, row_height};

        y += row_pitch + margin;
        layout.result = Rect{margin, y, text_width, row_height};

        y += row_height;
        layout.category = Rect{margin, y, text_width, row_height};
        return layout;
    }

    [[nodiscard]] inline std::optional<Widget> hit_test(const Layout& layout, float x, float y) noexcept
    {
        if (layout.height_field.contains(x, y))
        {
            return Widget::HeightField;
        }
        if (layout.weight_field.contains(x, y))
        {
            return Widget::WeightField;
        }
        if (layout.button.contains(x, y))
        {
            return Widget::CalculateButton;
        }
        return std::nullopt;
    }
} // namespace bmi::desktop
