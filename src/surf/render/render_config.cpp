#include "common/assert.hpp"

#include "surf/render/render_config.hpp"

namespace surfdoc {

std::optional<Theme> theme_by_name(std::string_view name) noexcept
{
    if (name == "light") {
        return Theme::light;
    }
    if (name == "dark") {
        return Theme::dark;
    }
    return {};
}

std::string_view theme_name(Theme theme) noexcept
{
    switch (theme) {
    case Theme::light: return "light";
    case Theme::dark: return "dark";
    }
    SURFDOC_ASSERT_UNREACHABLE("Invalid theme.");
}

} // namespace surfdoc
