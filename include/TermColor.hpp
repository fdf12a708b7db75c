#pragma once

#include <cstdint>
#include <rs/result.hpp>
#include <string>
#include <string_view>

namespace nodesel {

enum class ColorMode : std::uint8_t {
  Always,
  Auto,
  Never,
};

void setColorMode(ColorMode mode) noexcept;
rs::Result<void> setColorMode(std::string_view mode) noexcept;
ColorMode getColorMode() noexcept;

bool shouldColorStderr() noexcept;

std::string gray(std::string_view str) noexcept;
std::string red(std::string_view str) noexcept;
std::string green(std::string_view str) noexcept;
std::string yellow(std::string_view str) noexcept;
std::string cyan(std::string_view str) noexcept;
std::string bold(std::string_view str) noexcept;

} // namespace nodesel
