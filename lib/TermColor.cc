#include "TermColor.hpp"

#include <cstdlib>
#include <fmt/color.h>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <unistd.h>

namespace nodesel {

static ColorMode colorModeFromEnv() noexcept {
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  const char* env = std::getenv("NODESEL_TERM_COLOR");
  if (env == nullptr) {
    return ColorMode::Auto;
  }
  const std::string_view value = env;
  if (value == "always") {
    return ColorMode::Always;
  } else if (value == "never") {
    return ColorMode::Never;
  }
  return ColorMode::Auto;
}

class ColorState {
public:
  void set(const ColorMode mode) noexcept {
    this->mode = mode;
    switch (mode) {
    case ColorMode::Always:
      shouldColor = true;
      return;
    case ColorMode::Auto:
      shouldColor = isatty(STDERR_FILENO) != 0;
      return;
    case ColorMode::Never:
      shouldColor = false;
      return;
    }
  }

  ColorMode get() const noexcept { return mode; }
  bool shouldColorStderr() const noexcept { return shouldColor; }

  static ColorState& instance() noexcept {
    static ColorState instance;
    return instance;
  }

private:
  ColorMode mode = ColorMode::Auto;
  bool shouldColor = false;

  ColorState() noexcept { set(colorModeFromEnv()); }
};

void setColorMode(const ColorMode mode) noexcept {
  ColorState::instance().set(mode);
}

rs::Result<void> setColorMode(const std::string_view mode) noexcept {
  if (mode == "always") {
    setColorMode(ColorMode::Always);
  } else if (mode == "auto") {
    setColorMode(ColorMode::Auto);
  } else if (mode == "never") {
    setColorMode(ColorMode::Never);
  } else {
    rs_bail("unknown color mode `{}`; expected always, auto, or never", mode);
  }
  return rs::Ok();
}

ColorMode getColorMode() noexcept { return ColorState::instance().get(); }

bool shouldColorStderr() noexcept {
  return ColorState::instance().shouldColorStderr();
}

static std::string colorize(const std::string_view str,
                            const fmt::text_style& style) noexcept {
  if (!shouldColorStderr()) {
    return std::string(str);
  }
  return fmt::format("{}", fmt::styled(str, style));
}

std::string gray(const std::string_view str) noexcept {
  return colorize(str, fmt::fg(fmt::terminal_color::bright_black));
}
std::string red(const std::string_view str) noexcept {
  return colorize(str, fmt::fg(fmt::terminal_color::red));
}
std::string green(const std::string_view str) noexcept {
  return colorize(str, fmt::fg(fmt::terminal_color::green));
}
std::string yellow(const std::string_view str) noexcept {
  return colorize(str, fmt::fg(fmt::terminal_color::yellow));
}
std::string cyan(const std::string_view str) noexcept {
  return colorize(str, fmt::fg(fmt::terminal_color::cyan));
}
std::string bold(const std::string_view str) noexcept {
  return colorize(str, fmt::emphasis::bold);
}

} // namespace nodesel
