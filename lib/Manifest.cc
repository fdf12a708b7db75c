#include "Manifest.hpp"

#include <exception>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace nodesel {

static constexpr std::pair<std::string_view, ResourceKind> RESOURCE_KINDS[] = {
  { "model", ResourceKind::Model },
  { "test", ResourceKind::Test },
  { "seed", ResourceKind::Seed },
  { "snapshot", ResourceKind::Snapshot },
  { "analysis", ResourceKind::Analysis },
  { "operation", ResourceKind::Operation },
  { "source", ResourceKind::Source },
  { "exposure", ResourceKind::Exposure },
};

rs::Result<ResourceKind> parseResourceKind(const std::string_view str) noexcept {
  for (const auto& [name, kind] : RESOURCE_KINDS) {
    if (name == str) {
      return rs::Ok(kind);
    }
  }
  rs_bail("invalid resource type `{}`", str);
}

std::string_view toString(const ResourceKind kind) noexcept {
  for (const auto& [name, k] : RESOURCE_KINDS) {
    if (k == kind) {
      return name;
    }
  }
  __builtin_unreachable();
}

ResourceKind resourceKind(const GraphMember& member) noexcept {
  return std::visit(
      Overloaded{
          [](const ManifestNode& node) { return node.resourceKind; },
          [](const SourceDefinition&) { return ResourceKind::Source; },
          [](const Exposure&) { return ResourceKind::Exposure; },
      },
      member);
}

const NodeId& uniqueId(const GraphMember& member) noexcept {
  return std::visit([](const auto& m) -> const NodeId& { return m.uniqueId; },
                    member);
}

const std::string& memberName(const GraphMember& member) noexcept {
  return std::visit([](const auto& m) -> const std::string& { return m.name; },
                    member);
}

const std::vector<NodeId>& dependsOn(const GraphMember& member) noexcept {
  static const std::vector<NodeId> none;
  return std::visit(
      Overloaded{
          [](const ManifestNode& node) -> const std::vector<NodeId>& {
            return node.dependsOn;
          },
          [](const SourceDefinition&) -> const std::vector<NodeId>& {
            return none;
          },
          [](const Exposure& exposure) -> const std::vector<NodeId>& {
            return exposure.dependsOn;
          },
      },
      member);
}

bool isEnabled(const GraphMember& member) noexcept {
  return std::visit([](const auto& m) { return m.enabled; }, member);
}

bool isEmpty(const GraphMember& member) noexcept {
  if (const auto* node = std::get_if<ManifestNode>(&member)) {
    return node->empty;
  }
  return false;
}

bool canSelectIndirectly(const GraphMember& member) noexcept {
  const auto* node = std::get_if<ManifestNode>(&member);
  return node != nullptr && node->resourceKind == ResourceKind::Test;
}

static std::map<std::string, std::string>
parseConfig(const nlohmann::json& config, bool& enabled) {
  std::map<std::string, std::string> entries;
  if (!config.is_object()) {
    return entries;
  }
  for (const auto& [key, value] : config.items()) {
    if (key == "enabled") {
      enabled = value.get<bool>();
    } else if (value.is_string()) {
      entries.emplace(key, value.get<std::string>());
    } else {
      entries.emplace(key, value.dump());
    }
  }
  return entries;
}

static std::vector<NodeId> parseDependsOn(const nlohmann::json& data) {
  if (!data.contains("depends_on")) {
    return {};
  }
  return data.at("depends_on")
      .value("nodes", std::vector<NodeId>{});
}

static rs::Result<ManifestNode> parseNode(const std::string& id,
                                          const nlohmann::json& data) {
  ManifestNode node;
  node.uniqueId = id;
  node.resourceKind = rs_try(
      parseResourceKind(data.at("resource_type").get<std::string>()));
  rs_ensure(node.resourceKind != ResourceKind::Source
                && node.resourceKind != ResourceKind::Exposure,
            "`{}` is a {} and must be listed under `{}s`", id,
            node.resourceKind, node.resourceKind);
  node.name = data.at("name").get<std::string>();
  node.fqn = data.value("fqn", std::vector<std::string>{ node.name });
  node.packageName = data.value("package_name", std::string());
  node.path = data.value("path", std::string());
  node.tags = data.value("tags", std::vector<std::string>{});
  node.config = parseConfig(data.value("config", nlohmann::json::object()),
                            node.enabled);
  node.dependsOn = parseDependsOn(data);
  node.empty = data.value("empty", false);
  return rs::Ok(std::move(node));
}

static SourceDefinition parseSource(const std::string& id,
                                    const nlohmann::json& data) {
  SourceDefinition source;
  source.uniqueId = id;
  source.name = data.at("name").get<std::string>();
  source.sourceName = data.at("source_name").get<std::string>();
  source.packageName = data.value("package_name", std::string());
  source.fqn = data.value(
      "fqn", std::vector<std::string>{ source.packageName, source.sourceName,
                                       source.name });
  source.path = data.value("path", std::string());
  source.tags = data.value("tags", std::vector<std::string>{});
  source.config = parseConfig(data.value("config", nlohmann::json::object()),
                              source.enabled);
  return source;
}

static Exposure parseExposure(const std::string& id,
                              const nlohmann::json& data) {
  Exposure exposure;
  exposure.uniqueId = id;
  exposure.name = data.at("name").get<std::string>();
  exposure.fqn = data.value("fqn", std::vector<std::string>{ exposure.name });
  exposure.packageName = data.value("package_name", std::string());
  exposure.path = data.value("path", std::string());
  exposure.tags = data.value("tags", std::vector<std::string>{});
  exposure.config = parseConfig(
      data.value("config", nlohmann::json::object()), exposure.enabled);
  exposure.dependsOn = parseDependsOn(data);
  return exposure;
}

rs::Result<void> Manifest::add(GraphMember member) noexcept {
  const NodeId id = uniqueId(member);
  rs_ensure(!id.empty(), "graph member must have a unique id");
  rs_ensure(!members_.contains(id), "duplicate unique id `{}` in manifest",
            id);
  members_.emplace(id, std::move(member));
  return rs::Ok();
}

const GraphMember* Manifest::find(const NodeId& id) const noexcept {
  const auto itr = members_.find(id);
  if (itr == members_.end()) {
    return nullptr;
  }
  return &itr->second;
}

static rs::Result<Manifest> fromJson(const nlohmann::json& data, fs::path path) {
  rs_ensure(data.is_object(), "manifest must be a JSON object");

  Manifest manifest;
  manifest.path = std::move(path);

  if (data.contains("nodes")) {
    for (const auto& [id, node] : data.at("nodes").items()) {
      rs_try(manifest.add(rs_try(parseNode(id, node))));
    }
  }
  if (data.contains("sources")) {
    for (const auto& [id, source] : data.at("sources").items()) {
      rs_try(manifest.add(parseSource(id, source)));
    }
  }
  if (data.contains("exposures")) {
    for (const auto& [id, exposure] : data.at("exposures").items()) {
      rs_try(manifest.add(parseExposure(id, exposure)));
    }
  }

  spdlog::debug("Loaded {} graph members", manifest.size());
  return rs::Ok(std::move(manifest));
}

rs::Result<Manifest> Manifest::tryFromJson(const nlohmann::json& data,
                                           fs::path path) noexcept {
  try {
    return fromJson(data, std::move(path));
  } catch (const nlohmann::json::exception& e) {
    return rs::Err(rs::anyhow(e.what()));
  }
}

rs::Result<Manifest> Manifest::tryParse(fs::path path,
                                        const bool findParents) noexcept {
  if (findParents) {
    path = rs_try(findPath(path.parent_path()));
  }

  std::ifstream ifs(path);
  rs_ensure(ifs.is_open(), "failed to open `{}`", path.string());

  nlohmann::json data;
  try {
    data = nlohmann::json::parse(ifs);
  } catch (const nlohmann::json::parse_error& e) {
    rs_bail("failed to parse `{}`: {}", path.string(), e.what());
  }
  return tryFromJson(data, std::move(path));
}

rs::Result<fs::path> Manifest::findPath(fs::path candidateDir) noexcept {
  const fs::path origCandDir = candidateDir;
  while (true) {
    const fs::path manifestPath = candidateDir / FILE_NAME;
    spdlog::trace("Finding manifest: {}", manifestPath.string());
    if (fs::exists(manifestPath)) {
      return rs::Ok(manifestPath);
    }

    const fs::path parentPath = candidateDir.parent_path();
    if (candidateDir.has_parent_path()
        && parentPath != candidateDir.root_directory()) {
      candidateDir = parentPath;
    } else {
      break;
    }
  }

  rs_bail("{} not found in `{}` and its parents", FILE_NAME,
          origCandDir.string());
}

} // namespace nodesel

#ifdef NODESEL_TEST

#  include <fmt/format.h>
#  include <rs/tests.hpp>

namespace tests {

using namespace nodesel; // NOLINT(build/namespaces,google-build-using-namespace)

static void testParseResourceKind() {
  assertTrue(parseResourceKind("model").unwrap() == ResourceKind::Model);
  assertTrue(parseResourceKind("test").unwrap() == ResourceKind::Test);
  assertTrue(parseResourceKind("source").unwrap() == ResourceKind::Source);
  assertEq(parseResourceKind("macro").unwrap_err()->what(),
           "invalid resource type `macro`");
  assertEq(toString(ResourceKind::Exposure), "exposure");

  pass();
}

static void testTryFromJson() {
  const auto data = nlohmann::json::parse(R"({
    "nodes": {
      "model.shop.orders": {
        "resource_type": "model",
        "name": "orders",
        "fqn": ["shop", "staging", "orders"],
        "package_name": "shop",
        "path": "models/staging/orders.sql",
        "tags": ["nightly"],
        "config": { "enabled": true, "materialized": "view" },
        "depends_on": { "nodes": ["source.shop.raw.orders"] }
      },
      "test.shop.not_null_orders_id": {
        "resource_type": "test",
        "name": "not_null_orders_id",
        "depends_on": { "nodes": ["model.shop.orders"] }
      },
      "model.shop.disabled": {
        "resource_type": "model",
        "name": "disabled",
        "config": { "enabled": false },
        "empty": true
      }
    },
    "sources": {
      "source.shop.raw.orders": {
        "name": "orders",
        "source_name": "raw",
        "package_name": "shop"
      }
    },
    "exposures": {
      "exposure.shop.dashboard": {
        "name": "dashboard",
        "depends_on": { "nodes": ["model.shop.orders"] }
      }
    }
  })");

  const Manifest manifest = Manifest::tryFromJson(data).unwrap();
  assertEq(manifest.size(), 5UL);

  const GraphMember* orders = manifest.find("model.shop.orders");
  assertTrue(orders != nullptr);
  assertTrue(resourceKind(*orders) == ResourceKind::Model);
  assertEq(memberName(*orders), "orders");
  assertEq(dependsOn(*orders).size(), 1UL);
  assertEq(std::get<ManifestNode>(*orders).config.at("materialized"), "view");
  assertFalse(canSelectIndirectly(*orders));

  const GraphMember* test = manifest.find("test.shop.not_null_orders_id");
  assertTrue(canSelectIndirectly(*test));
  assertEq(std::get<ManifestNode>(*test).fqn.size(), 1UL);

  const GraphMember* disabled = manifest.find("model.shop.disabled");
  assertFalse(isEnabled(*disabled));
  assertTrue(isEmpty(*disabled));

  const GraphMember* source = manifest.find("source.shop.raw.orders");
  assertTrue(resourceKind(*source) == ResourceKind::Source);
  assertEq(std::get<SourceDefinition>(*source).fqn.size(), 3UL);
  assertTrue(dependsOn(*source).empty());

  const GraphMember* exposure = manifest.find("exposure.shop.dashboard");
  assertTrue(resourceKind(*exposure) == ResourceKind::Exposure);
  assertFalse(isEmpty(*exposure));

  assertTrue(manifest.find("model.shop.missing") == nullptr);

  pass();
}

static void testTryFromJsonErrors() {
  {
    const auto data = nlohmann::json::parse(R"({
      "nodes": {
        "model.shop.orders": { "resource_type": "macro", "name": "orders" }
      }
    })");
    assertEq(Manifest::tryFromJson(data).unwrap_err()->what(),
             "invalid resource type `macro`");
  }
  {
    const auto data = nlohmann::json::parse(R"({
      "nodes": {
        "source.shop.raw.orders": { "resource_type": "source", "name": "orders" }
      }
    })");
    assertEq(Manifest::tryFromJson(data).unwrap_err()->what(),
             "`source.shop.raw.orders` is a source and must be listed under "
             "`sources`");
  }
  {
    const auto data = nlohmann::json::parse(R"({
      "nodes": { "model.shop.orders": { "resource_type": "model" } }
    })");
    assertTrue(Manifest::tryFromJson(data).is_err());
  }
  {
    const auto data = nlohmann::json::parse("[]");
    assertEq(Manifest::tryFromJson(data).unwrap_err()->what(),
             "manifest must be a JSON object");
  }

  pass();
}

static void testAddDuplicate() {
  Manifest manifest;
  assertTrue(
      manifest.add(ManifestNode{ .uniqueId = "model.a", .name = "a" }).is_ok());
  assertEq(manifest.add(ManifestNode{ .uniqueId = "model.a", .name = "a" })
               .unwrap_err()
               ->what(),
           "duplicate unique id `model.a` in manifest");

  pass();
}

static void testFindPath() {
  const fs::path root = fs::temp_directory_path() / "nodesel-manifest-test";
  const fs::path nested = root / "models" / "staging";
  fs::create_directories(nested);

  assertEq(Manifest::findPath(nested).unwrap_err()->what(),
           fmt::format("manifest.json not found in `{}` and its parents",
                       nested.string()));

  std::ofstream(root / "manifest.json") << R"({"nodes": {}})";
  assertEq(Manifest::findPath(nested).unwrap(), root / "manifest.json");

  fs::remove_all(root);

  pass();
}

} // namespace tests

int main() {
  tests::testParseResourceKind();
  tests::testTryFromJson();
  tests::testTryFromJsonErrors();
  tests::testAddDuplicate();
  tests::testFindPath();
}

#endif
