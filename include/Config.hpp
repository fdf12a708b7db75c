#pragma once

#include "Manifest.hpp"
#include "Selector/SelectorSpec.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <toml11/types.hpp>
#include <vector>

namespace nodesel {

namespace fs = std::filesystem;

// `[selection]`
struct SelectionConfig {
  bool greedy = false;
  // Empty means every resource kind.
  std::vector<ResourceKind> resourceTypes;
  bool warnError = false;
};

// `[selectors.<name>]`
struct NamedSelector {
  std::string name;
  std::vector<std::string> select;
  std::vector<std::string> exclude;
  std::optional<bool> greedy;
};

class Config {
public:
  static constexpr std::string_view FILE_NAME = "nodesel.toml";

  Config() = default;

  static rs::Result<Config> tryParse(fs::path path = fs::current_path()
                                                     / FILE_NAME,
                                     bool findParents = true) noexcept;
  static rs::Result<Config> tryFromToml(const toml::value& data,
                                        fs::path path = {}) noexcept;
  static rs::Result<fs::path> findPath(fs::path candidateDir) noexcept;

  // The spec of a named selector. Its own `greedy` overrides
  // `selection.greedy`.
  rs::Result<SelectionSpec> selectorSpec(std::string_view name) const noexcept;

  fs::path path;
  SelectionConfig selection;
  std::map<std::string, NamedSelector, std::less<>> selectors;
};

} // namespace nodesel
