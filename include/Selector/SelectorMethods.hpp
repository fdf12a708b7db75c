#pragma once

#include "Manifest.hpp"
#include "Selector/SelectorSpec.hpp"

#include <functional>
#include <rs/result.hpp>
#include <span>
#include <string_view>

namespace nodesel {

// Returns the subset of `included` that matches `value`.
using SelectorMethod = std::function<rs::Result<NodeSet>(
    const NodeSet& included, std::string_view value)>;

// Names accepted as the `method` of a selection criterion.
std::span<const std::string_view> selectorMethodNames() noexcept;

bool globMatch(std::string_view pattern, std::string_view text) noexcept;

class MethodManager {
public:
  explicit MethodManager(const Manifest& manifest) : manifest(manifest) {}

  // Fails when `name` is not a known selector method or the arguments do not
  // fit it.
  rs::Result<SelectorMethod> getMethod(std::string_view name,
                                       const MethodArgs& args) const noexcept;

private:
  const Manifest& manifest;
};

} // namespace nodesel
