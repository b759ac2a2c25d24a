#include <bmi/bmi.hpp>
#include <bmi_desktop/layout.hpp>
#include <safe_io/utils.hpp>

#define SDL_MAIN_HANDLED
#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <SDL3/SDL.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace
{
    using bmi::Category;
    using bmi::Field;
    using bmi::Form;
    using bmi::desktop::Layout;
    using bmi::desktop::Rect;
    using bmi::desktop::ViewOptions;
    using bmi::desktop::Widget;

    struct Rgba
    {
        std::uint8_t r{0};
        std::uint8_t g{0};
        std::uint8_t b{0};
        std::uint8_t a{255};
    };

    constexpr Rgba background{24, 24, 30};
    constexpr Rgba label_color{190, 190, 200};
    constexpr Rgba field_fill{40, 40, 50};
    constexpr Rgba field_border{90, 90, 105};
    constexpr Rgba focus_border{90, 160, 255};
    constexpr Rgba text_color{240, 240, 240};
    constexpr Rgba button_fill{60, 110, 200};
    constexpr Rgba error_color{235, 90, 80};

    Rgba category_color(Category category) noexcept
    {
        switch (category)
        {
        case Category::Underweight:
            return Rgba{110, 170, 255};
        case Category::Normal:
            return Rgba{110, 210, 120};
        case Category::Overweight:
            return Rgba{240, 200, 80};
        case Category::Obese:
            return Rgba{235, 90, 80};
        }
        return text_color;
    }

    void set_color(SDL_Renderer* renderer, Rgba color)
    {
        SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    }

    SDL_FRect to_sdl(const Rect& rect) noexcept
    {
        return SDL_FRect{rect.x, rect.y, rect.w, rect.h};
    }

    void draw_text(SDL_Renderer* renderer, const Rect& rect, std::string_view text, Rgba color)
    {
        const std::string buffer(text);
        const float y = rect.y + (rect.h - bmi::desktop::glyph_size) * 0.5f;
        set_color(renderer, color);
        SDL_RenderDebugText(renderer, rect.x + 4.0f, y, buffer.c_str());
    }

    void draw_box(SDL_Renderer* renderer, const Rect& rect, Rgba fill, Rgba border)
    {
        const SDL_FRect box = to_sdl(rect);
        set_color(renderer, fill);
        SDL_RenderFillRect(renderer, &box);
        set_color(renderer, border);
        SDL_RenderRect(renderer, &box);
    }

    void draw_field(SDL_Renderer* renderer, const Layout& layout, const Form& form, Field field)
    {
        draw_text(renderer, layout.label(field), bmi::to_string(field), label_color);

        const bool focused = form.focused() == field;
        draw_box(renderer, layout.field(field), field_fill, focused ? focus_border : field_border);

        std::string content = form.text(field);
        if (focused)
        {
            content.push_back('_');
        }
        draw_text(renderer, layout.field(field), content, text_color);
    }

    void render(SDL_Renderer* renderer, const Layout& layout, const Form& form)
    {
        set_color(renderer, background);
        SDL_RenderClear(renderer);

        draw_field(renderer, layout, form, Field::Height);
        draw_field(renderer, layout, form, Field::Weight);

        draw_box(renderer, layout.button, button_fill, focus_border);
        draw_text(renderer, layout.button, "Calculate", text_color);

        if (!form.result().empty())
        {
            const auto category = form.category();
            draw_text(renderer, layout.result, form.result(), category ? text_color : error_color);
            if (category)
            {
                draw_text(renderer, layout.category, bmi::to_string(*category), category_color(*category));
            }
        }

        SDL_RenderPresent(renderer);
    }

    void submit(Form& form)
    {
        const auto& result = form.submit();
        safe_io::debug(
            "height='{}' weight='{}' -> {}",
            form.text(Field::Height),
            form.text(Field::Weight),
            result);
    }

    void handle_key(SDL_Keycode key, Form& form, bool& running)
    {
        switch (key)
        {
        case SDLK_ESCAPE:
            form.clear();
            break;
        case SDLK_TAB:
            form.focus_next();
            break;
        case SDLK_BACKSPACE:
            form.erase_last();
            break;
        case SDLK_RETURN:
        case SDLK_KP_ENTER:
            submit(form);
            break;
        case SDLK_Q:
            if (SDL_GetModState() & SDL_KMOD_CTRL)
            {
                running = false;
            }
            break;
        default:
            break;
        }
    }

    void handle_click(const Layout& layout, float x, float y, Form& form)
    {
        const auto widget = bmi::desktop::hit_test(layout, x, y);
        if (!widget)
        {
            return;
        }

        switch (*widget)
        {
        case Widget::HeightField:
            form.focus(Field::Height);
            break;
        case Widget::WeightField:
            form.focus(Field::Weight);
            break;
        case Widget::CalculateButton:
            submit(form);
            break;
        }
    }

    Layout layout_for(int window_width, const ViewOptions& options)
    {
        return bmi::desktop::compute_layout(static_cast<float>(window_width) / options.text_scale);
    }
}

int main()
{
    const ViewOptions options{};

    if (!SDL_Init(SDL_INIT_VIDEO))
    {
        safe_io::error("SDL_Init failed: {}", SDL_GetError());
        return 1;
    }

    SDL_PropertiesID props = SDL_CreateProperties();
    SDL_SetStringProperty(props, SDL_PROP_WINDOW_CREATE_TITLE_STRING, options.title.c_str());
    SDL_SetNumberProperty(props, SDL_PROP_WINDOW_CREATE_WIDTH_NUMBER, options.width);
    SDL_SetNumberProperty(props, SDL_PROP_WINDOW_CREATE_HEIGHT_NUMBER, options.height);
    SDL_SetBooleanProperty(props, SDL_PROP_WINDOW_CREATE_RESIZABLE_BOOLEAN, true);

    SDL_Window* window = SDL_CreateWindowWithProperties(props);
    SDL_DestroyProperties(props);
    if (!window)
    {
        safe_io::error("Window creation failed: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    const char* driver = options.renderer_driver.empty() ? nullptr : options.renderer_driver.c_str();
    SDL_Renderer* renderer = SDL_CreateRenderer(window, driver);
    if (!renderer)
    {
        safe_io::error("Renderer creation failed: {}", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    if (!SDL_SetRenderScale(renderer, options.text_scale, options.text_scale))
    {
        safe_io::warn("SDL_SetRenderScale failed: {}", SDL_GetError());
    }
    if (options.vsync && !SDL_SetRenderVSync(renderer, 1))
    {
        safe_io::warn("VSync unavailable: {}", SDL_GetError());
    }
    if (!SDL_StartTextInput(window))
    {
        safe_io::warn("Text input unavailable: {}", SDL_GetError());
    }

    safe_io::info("Renderer: {}", SDL_GetRendererName(renderer));
    safe_io::info("Controls: Tab switch field, Enter calculate, Esc clear, Ctrl+Q exit.");

    Form form{};
    Layout layout = layout_for(options.width, options);
    bool running = true;
    bool dirty = true;
    std::uint64_t drawn_revision = form.revision();

    while (running)
    {
        SDL_Event e;
        if (!SDL_WaitEvent(&e))
        {
            safe_io::error("SDL_WaitEvent failed: {}", SDL_GetError());
            break;
        }

        do
        {
            switch (e.type)
            {
            case SDL_EVENT_QUIT:
                running = false;
                break;
            case SDL_EVENT_WINDOW_RESIZED:
                layout = layout_for(e.window.data1, options);
                dirty = true;
                break;
            case SDL_EVENT_WINDOW_EXPOSED:
                dirty = true;
                break;
            case SDL_EVENT_TEXT_INPUT:
                form.append(e.text.text);
                dirty = true;
                break;
            case SDL_EVENT_KEY_DOWN:
                handle_key(e.key.key, form, running);
                dirty = true;
                break;
            case SDL_EVENT_MOUSE_BUTTON_DOWN:
                if (e.button.button == SDL_BUTTON_LEFT)
                {
                    SDL_ConvertEventToRenderCoordinates(renderer, &e);
                    handle_click(layout, e.button.x, e.button.y, form);
                    dirty = true;
                }
                break;
            default:
                break;
            }
        } while (SDL_PollEvent(&e));

        if (running && (dirty || form.revision() != drawn_revision))
        {
            render(renderer, layout, form);
            drawn_revision = form.revision();
            dirty = false;
        }
    }

    SDL_StopTextInput(window);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
