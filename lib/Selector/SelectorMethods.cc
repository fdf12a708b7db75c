#include "Selector/SelectorMethods.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace nodesel {

namespace fs = std::filesystem;

static constexpr std::array<std::string_view, 8> SELECTOR_METHODS = {
  "fqn",     "tag",           "path",   "package",
  "config",  "resource_type", "source", "exposure",
};

std::span<const std::string_view> selectorMethodNames() noexcept {
  return SELECTOR_METHODS;
}

bool globMatch(const std::string_view pattern,
               const std::string_view text) noexcept {
  std::size_t p = 0;
  std::size_t t = 0;
  std::size_t starP = std::string_view::npos;
  std::size_t starT = 0;

  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && pattern[p] == '*') {
      starP = p++;
      starT = t;
    } else if (starP != std::string_view::npos) {
      p = starP + 1;
      t = ++starT;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

static std::vector<std::string_view> splitOn(const std::string_view str,
                                             const char delim) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = str.find(delim, start);
    if (pos == std::string_view::npos) {
      parts.push_back(str.substr(start));
      return parts;
    }
    parts.push_back(str.substr(start, pos - start));
    start = pos + 1;
  }
}

template <typename Pred>
static rs::Result<NodeSet> filterMembers(const Manifest& manifest,
                                         const NodeSet& included, Pred pred) {
  NodeSet matched;
  for (const NodeId& id : included) {
    const GraphMember* member = manifest.find(id);
    rs_ensure(member != nullptr, "Node {} not found in the manifest!", id);
    if (pred(*member)) {
      matched.insert(id);
    }
  }
  return rs::Ok(std::move(matched));
}

// A node matches when the value names it directly, or when the dotted value
// matches a prefix of its fully qualified name segment by segment.
static bool isSelectedByFqn(const std::vector<std::string>& fqn,
                            const std::string_view value) {
  if (!fqn.empty() && fqn.back() == value) {
    return true;
  }

  std::vector<std::string_view> flatFqn;
  for (const std::string& segment : fqn) {
    for (const std::string_view part : splitOn(segment, '.')) {
      flatFqn.push_back(part);
    }
  }

  const std::vector<std::string_view> selectorParts = splitOn(value, '.');
  if (flatFqn.size() < selectorParts.size()) {
    return false;
  }
  for (std::size_t i = 0; i < selectorParts.size(); ++i) {
    if (!globMatch(selectorParts[i], flatFqn[i])) {
      return false;
    }
  }
  return true;
}

static bool isUnderPath(const std::string_view memberPath,
                        const std::string_view value) {
  if (memberPath.empty()) {
    return false;
  }
  if (value.find_first_of("*?") != std::string_view::npos) {
    return globMatch(value, memberPath);
  }

  const fs::path target = fs::path(value).lexically_normal();
  const fs::path candidate = fs::path(memberPath).lexically_normal();
  if (candidate == target) {
    return true;
  }

  // Directory prefix match, component by component.
  auto targetItr = target.begin();
  auto candidateItr = candidate.begin();
  for (; targetItr != target.end(); ++targetItr, ++candidateItr) {
    if (targetItr->empty()) {
      // Trailing separator.
      continue;
    }
    if (candidateItr == candidate.end() || *candidateItr != *targetItr) {
      return false;
    }
  }
  return true;
}

static SelectorMethod fqnMethod(const Manifest& manifest) {
  return [&manifest](const NodeSet& included,
                     const std::string_view value) -> rs::Result<NodeSet> {
    return filterMembers(manifest, included, [&](const GraphMember& member) {
      const auto* node = std::get_if<ManifestNode>(&member);
      return node != nullptr && isSelectedByFqn(node->fqn, value);
    });
  };
}

static SelectorMethod tagMethod(const Manifest& manifest) {
  return [&manifest](const NodeSet& included,
                     const std::string_view value) -> rs::Result<NodeSet> {
    return filterMembers(manifest, included, [&](const GraphMember& member) {
      return std::visit(
          [&](const auto& m) {
            for (const std::string& tag : m.tags) {
              if (globMatch(value, tag)) {
                return true;
              }
            }
            return false;
          },
          member);
    });
  };
}

static SelectorMethod pathMethod(const Manifest& manifest) {
  return [&manifest](const NodeSet& included,
                     const std::string_view value) -> rs::Result<NodeSet> {
    return filterMembers(manifest, included, [&](const GraphMember& member) {
      return std::visit(
          [&](const auto& m) { return isUnderPath(m.path, value); }, member);
    });
  };
}

static SelectorMethod packageMethod(const Manifest& manifest) {
  return [&manifest](const NodeSet& included,
                     const std::string_view value) -> rs::Result<NodeSet> {
    return filterMembers(manifest, included, [&](const GraphMember& member) {
      return std::visit(
          [&](const auto& m) { return globMatch(value, m.packageName); },
          member);
    });
  };
}

static SelectorMethod configMethod(const Manifest& manifest, std::string key) {
  return [&manifest, key = std::move(key)](
             const NodeSet& included,
             const std::string_view value) -> rs::Result<NodeSet> {
    return filterMembers(manifest, included, [&](const GraphMember& member) {
      return std::visit(
          [&](const auto& m) {
            const auto itr = m.config.find(key);
            return itr != m.config.end() && globMatch(value, itr->second);
          },
          member);
    });
  };
}

static SelectorMethod resourceTypeMethod(const Manifest& manifest) {
  return [&manifest](const NodeSet& included,
                     const std::string_view value) -> rs::Result<NodeSet> {
    const ResourceKind kind = rs_try(parseResourceKind(value));
    return filterMembers(manifest, included, [&](const GraphMember& member) {
      return resourceKind(member) == kind;
    });
  };
}

// `source:raw`, `source:raw.orders` or `source:shop.raw.orders`.
static SelectorMethod sourceMethod(const Manifest& manifest) {
  return [&manifest](const NodeSet& included,
                     const std::string_view value) -> rs::Result<NodeSet> {
    const std::vector<std::string_view> parts = splitOn(value, '.');
    std::string_view packagePattern = "*";
    std::string_view sourcePattern;
    std::string_view tablePattern = "*";
    switch (parts.size()) {
    case 1:
      sourcePattern = parts[0];
      break;
    case 2:
      sourcePattern = parts[0];
      tablePattern = parts[1];
      break;
    case 3:
      packagePattern = parts[0];
      sourcePattern = parts[1];
      tablePattern = parts[2];
      break;
    default:
      rs_bail("invalid source selector value `{}`; sources have at most 3 "
              "components (package.source.table)",
              value);
    }

    return filterMembers(manifest, included, [&](const GraphMember& member) {
      const auto* source = std::get_if<SourceDefinition>(&member);
      return source != nullptr
             && globMatch(packagePattern, source->packageName)
             && globMatch(sourcePattern, source->sourceName)
             && globMatch(tablePattern, source->name);
    });
  };
}

// `exposure:dashboard` or `exposure:shop.dashboard`.
static SelectorMethod exposureMethod(const Manifest& manifest) {
  return [&manifest](const NodeSet& included,
                     const std::string_view value) -> rs::Result<NodeSet> {
    const std::vector<std::string_view> parts = splitOn(value, '.');
    rs_ensure(parts.size() <= 2,
              "invalid exposure selector value `{}`; exposures have at most "
              "2 components (package.exposure)",
              value);
    const std::string_view packagePattern = parts.size() == 2 ? parts[0] : "*";
    const std::string_view namePattern = parts.back();

    return filterMembers(manifest, included, [&](const GraphMember& member) {
      const auto* exposure = std::get_if<Exposure>(&member);
      return exposure != nullptr
             && globMatch(packagePattern, exposure->packageName)
             && globMatch(namePattern, exposure->name);
    });
  };
}

rs::Result<SelectorMethod>
MethodManager::getMethod(const std::string_view name,
                         const MethodArgs& args) const noexcept {
  if (name == "config") {
    const auto key = args.find("key");
    rs_ensure(key != args.end() && !key->second.empty(),
              "the config selector needs a key, e.g. `config.materialized:view`");
    return rs::Ok(configMethod(manifest, key->second));
  }

  rs_ensure(args.empty(), "the '{}' selector does not take arguments ({})",
            name, fmt::join(args, ", "));
  if (name == "fqn") {
    return rs::Ok(fqnMethod(manifest));
  } else if (name == "tag") {
    return rs::Ok(tagMethod(manifest));
  } else if (name == "path") {
    return rs::Ok(pathMethod(manifest));
  } else if (name == "package") {
    return rs::Ok(packageMethod(manifest));
  } else if (name == "resource_type") {
    return rs::Ok(resourceTypeMethod(manifest));
  } else if (name == "source") {
    return rs::Ok(sourceMethod(manifest));
  } else if (name == "exposure") {
    return rs::Ok(exposureMethod(manifest));
  }
  rs_bail("unknown selector method '{}'", name);
}

} // namespace nodesel

#ifdef NODESEL_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace nodesel; // NOLINT(build/namespaces,google-build-using-namespace)

static Manifest makeManifest() {
  Manifest manifest;
  std::ignore = manifest.add(ManifestNode{
      .uniqueId = "model.shop.stg_orders",
      .resourceKind = ResourceKind::Model,
      .name = "stg_orders",
      .fqn = { "shop", "staging", "stg_orders" },
      .packageName = "shop",
      .path = "models/staging/stg_orders.sql",
      .tags = { "nightly", "finance" },
      .config = { { "materialized", "view" } },
      .dependsOn = { "source.shop.raw.orders" },
  });
  std::ignore = manifest.add(ManifestNode{
      .uniqueId = "model.shop.orders",
      .resourceKind = ResourceKind::Model,
      .name = "orders",
      .fqn = { "shop", "marts", "orders" },
      .packageName = "shop",
      .path = "models/marts/orders.sql",
      .tags = { "hourly" },
      .config = { { "materialized", "table" } },
      .dependsOn = { "model.shop.stg_orders" },
  });
  std::ignore = manifest.add(ManifestNode{
      .uniqueId = "test.shop.unique_orders_id",
      .resourceKind = ResourceKind::Test,
      .name = "unique_orders_id",
      .fqn = { "shop", "marts", "unique_orders_id" },
      .packageName = "shop",
      .path = "models/marts/schema.yml",
      .dependsOn = { "model.shop.orders" },
  });
  std::ignore = manifest.add(ManifestNode{
      .uniqueId = "model.utils.calendar",
      .resourceKind = ResourceKind::Model,
      .name = "calendar",
      .fqn = { "utils", "calendar" },
      .packageName = "utils",
      .path = "models/calendar.sql",
  });
  std::ignore = manifest.add(SourceDefinition{
      .uniqueId = "source.shop.raw.orders",
      .name = "orders",
      .sourceName = "raw",
      .fqn = { "shop", "raw", "orders" },
      .packageName = "shop",
      .path = "models/sources.yml",
      .tags = { "nightly" },
  });
  std::ignore = manifest.add(Exposure{
      .uniqueId = "exposure.shop.revenue",
      .name = "revenue",
      .fqn = { "shop", "revenue" },
      .packageName = "shop",
      .dependsOn = { "model.shop.orders" },
  });
  return manifest;
}

static NodeSet allIds(const Manifest& manifest) {
  NodeSet ids;
  for (const auto& [id, member] : manifest.members()) {
    ids.insert(id);
  }
  return ids;
}

static NodeSet search(const Manifest& manifest, std::string_view method,
                      std::string_view value, const MethodArgs& args = {}) {
  const MethodManager manager(manifest);
  return manager.getMethod(method, args).unwrap()(allIds(manifest), value)
      .unwrap();
}

static void testGlobMatch() {
  assertTrue(globMatch("*", ""));
  assertTrue(globMatch("*", "anything"));
  assertTrue(globMatch("stg_*", "stg_orders"));
  assertTrue(globMatch("*_orders", "stg_orders"));
  assertTrue(globMatch("s?g_*s", "stg_orders"));
  assertTrue(globMatch("a*b*c", "aXXbYYc"));
  assertFalse(globMatch("stg_*", "orders"));
  assertFalse(globMatch("a*b*c", "aXXbYY"));
  assertFalse(globMatch("?", ""));

  pass();
}

static void testFqnMethod() {
  const Manifest manifest = makeManifest();
  assertEq(search(manifest, "fqn", "orders"), NodeSet{ "model.shop.orders" });
  assertEq(search(manifest, "fqn", "shop.staging"),
           NodeSet{ "model.shop.stg_orders" });
  assertEq(search(manifest, "fqn", "shop.marts.*"),
           NodeSet{ "model.shop.orders", "test.shop.unique_orders_id" });
  // Sources and exposures are not nodes.
  assertEq(search(manifest, "fqn", "*"),
           NodeSet{ "model.shop.stg_orders", "model.shop.orders",
                    "test.shop.unique_orders_id", "model.utils.calendar" });
  assertTrue(search(manifest, "fqn", "nothing").empty());

  pass();
}

static void testTagMethod() {
  const Manifest manifest = makeManifest();
  assertEq(search(manifest, "tag", "nightly"),
           NodeSet{ "model.shop.stg_orders", "source.shop.raw.orders" });
  assertEq(search(manifest, "tag", "*ly"),
           NodeSet{ "model.shop.stg_orders", "model.shop.orders",
                    "source.shop.raw.orders" });

  pass();
}

static void testPathMethod() {
  const Manifest manifest = makeManifest();
  assertEq(search(manifest, "path", "models/staging"),
           NodeSet{ "model.shop.stg_orders" });
  assertEq(search(manifest, "path", "models/staging/"),
           NodeSet{ "model.shop.stg_orders" });
  assertEq(search(manifest, "path", "models/marts/orders.sql"),
           NodeSet{ "model.shop.orders" });
  assertEq(search(manifest, "path", "models/*.yml"),
           NodeSet{ "test.shop.unique_orders_id", "source.shop.raw.orders" });
  assertTrue(search(manifest, "path", "models/stag").empty());

  pass();
}

static void testPackageAndConfigMethods() {
  const Manifest manifest = makeManifest();
  assertEq(search(manifest, "package", "utils"),
           NodeSet{ "model.utils.calendar" });
  assertEq(search(manifest, "config", "table", { { "key", "materialized" } }),
           NodeSet{ "model.shop.orders" });

  const MethodManager manager(manifest);
  assertEq(manager.getMethod("config", {}).unwrap_err()->what(),
           "the config selector needs a key, e.g. `config.materialized:view`");

  pass();
}

static void testResourceTypeMethod() {
  const Manifest manifest = makeManifest();
  assertEq(search(manifest, "resource_type", "test"),
           NodeSet{ "test.shop.unique_orders_id" });
  assertEq(search(manifest, "resource_type", "exposure"),
           NodeSet{ "exposure.shop.revenue" });

  const MethodManager manager(manifest);
  const SelectorMethod method = manager.getMethod("resource_type", {}).unwrap();
  assertEq(method(allIds(manifest), "macro").unwrap_err()->what(),
           "invalid resource type `macro`");

  pass();
}

static void testSourceAndExposureMethods() {
  const Manifest manifest = makeManifest();
  assertEq(search(manifest, "source", "raw"),
           NodeSet{ "source.shop.raw.orders" });
  assertEq(search(manifest, "source", "raw.ord*"),
           NodeSet{ "source.shop.raw.orders" });
  assertEq(search(manifest, "source", "shop.raw.orders"),
           NodeSet{ "source.shop.raw.orders" });
  assertTrue(search(manifest, "source", "other.raw.orders").empty());
  assertEq(search(manifest, "exposure", "shop.revenue"),
           NodeSet{ "exposure.shop.revenue" });
  assertEq(search(manifest, "exposure", "*"),
           NodeSet{ "exposure.shop.revenue" });

  pass();
}

static void testUnknownMethod() {
  const Manifest manifest = makeManifest();
  const MethodManager manager(manifest);
  assertEq(manager.getMethod("state", {}).unwrap_err()->what(),
           "unknown selector method 'state'");
  assertTrue(manager.getMethod("tag", { { "key", "x" } }).is_err());

  pass();
}

static void testSearchRespectsIncluded() {
  const Manifest manifest = makeManifest();
  const MethodManager manager(manifest);
  const SelectorMethod method = manager.getMethod("tag", {}).unwrap();
  assertEq(method({ "source.shop.raw.orders" }, "nightly").unwrap(),
           NodeSet{ "source.shop.raw.orders" });
  assertEq(method({ "model.shop.missing" }, "nightly").unwrap_err()->what(),
           "Node model.shop.missing not found in the manifest!");

  pass();
}

} // namespace tests

int main() {
  tests::testGlobMatch();
  tests::testFqnMethod();
  tests::testTagMethod();
  tests::testPathMethod();
  tests::testPackageAndConfigMethods();
  tests::testResourceTypeMethod();
  tests::testSourceAndExposureMethods();
  tests::testUnknownMethod();
  tests::testSearchRespectsIncluded();
}

#endif
