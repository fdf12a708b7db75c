#pragma once

#include "Manifest.hpp"

#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace nodesel {

using MethodArgs = std::map<std::string, std::string>;

// A single criterion such as `tag:nightly` or `2+model_a+`.
struct SelectionCriteria {
  std::string raw;
  std::string method;
  MethodArgs methodArguments;
  std::string value;

  bool childrensParents = false;
  bool parents = false;
  std::optional<std::size_t> parentsDepth;
  bool children = false;
  std::optional<std::size_t> childrenDepth;

  bool greedy = false;
  bool expectExists = false;
};

enum class SetOperation : std::uint8_t {
  Union,
  Intersection,
  Difference,
};

std::string_view toString(SetOperation op) noexcept;

// Union / intersection operate on every set; difference is left associative.
NodeSet combine(SetOperation op, const std::vector<NodeSet>& sets);

class SelectionSpec;

struct SelectionComposite {
  SetOperation op = SetOperation::Union;
  std::vector<SelectionSpec> components;
  bool expectExists = false;
  std::string raw;
};

class SelectionSpec {
public:
  using Node = std::variant<SelectionCriteria, SelectionComposite>;

  SelectionSpec(SelectionCriteria criteria) // NOLINT
      : node(std::move(criteria)) {}
  SelectionSpec(SelectionComposite composite) // NOLINT
      : node(std::move(composite)) {}

  static SelectionSpec unionOf(std::vector<SelectionSpec> components,
                               bool expectExists = false, std::string raw = {});
  static SelectionSpec intersectionOf(std::vector<SelectionSpec> components,
                                      bool expectExists = false,
                                      std::string raw = {});
  static SelectionSpec differenceOf(std::vector<SelectionSpec> components,
                                    bool expectExists = false,
                                    std::string raw = {});

  const Node& get() const noexcept { return node; }
  bool isCriteria() const noexcept {
    return std::holds_alternative<SelectionCriteria>(node);
  }

  const std::string& raw() const noexcept;
  bool expectExists() const noexcept;

private:
  Node node;
};

} // namespace nodesel

template <>
struct fmt::formatter<nodesel::SelectionSpec> {
  // NOLINTNEXTLINE(*-static)
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const nodesel::SelectionSpec& spec, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", spec.raw());
  }
};
