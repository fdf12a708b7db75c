#pragma once

#include <cstdint>
#include <filesystem>
#include <fmt/format.h>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace nodesel {

namespace fs = std::filesystem;

using NodeId = std::string;
using NodeSet = std::unordered_set<NodeId>;

enum class ResourceKind : std::uint8_t {
  Model,
  Test,
  Seed,
  Snapshot,
  Analysis,
  Operation,
  Source,
  Exposure,
};

rs::Result<ResourceKind> parseResourceKind(std::string_view str) noexcept;
std::string_view toString(ResourceKind kind) noexcept;

// Models, tests, seeds, snapshots, analyses and operations.
struct ManifestNode {
  NodeId uniqueId;
  ResourceKind resourceKind = ResourceKind::Model;
  std::string name;
  std::vector<std::string> fqn;
  std::string packageName;
  std::string path;
  std::vector<std::string> tags;
  std::map<std::string, std::string> config;
  std::vector<NodeId> dependsOn;
  bool enabled = true;
  // True when the node has nothing to materialize.
  bool empty = false;
};

struct SourceDefinition {
  NodeId uniqueId;
  std::string name;
  std::string sourceName;
  std::vector<std::string> fqn;
  std::string packageName;
  std::string path;
  std::vector<std::string> tags;
  std::map<std::string, std::string> config;
  bool enabled = true;
};

struct Exposure {
  NodeId uniqueId;
  std::string name;
  std::vector<std::string> fqn;
  std::string packageName;
  std::string path;
  std::vector<std::string> tags;
  std::map<std::string, std::string> config;
  std::vector<NodeId> dependsOn;
  bool enabled = true;
};

using GraphMember = std::variant<ManifestNode, SourceDefinition, Exposure>;

template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

ResourceKind resourceKind(const GraphMember& member) noexcept;
const NodeId& uniqueId(const GraphMember& member) noexcept;
const std::string& memberName(const GraphMember& member) noexcept;
const std::vector<NodeId>& dependsOn(const GraphMember& member) noexcept;
bool isEnabled(const GraphMember& member) noexcept;
bool isEmpty(const GraphMember& member) noexcept;

// Test nodes are the only members that can be pulled in by a selected
// parent without being selected themselves.
bool canSelectIndirectly(const GraphMember& member) noexcept;

class Manifest {
public:
  static constexpr std::string_view FILE_NAME = "manifest.json";

  Manifest() = default;

  static rs::Result<Manifest> tryParse(fs::path path = fs::current_path()
                                                       / FILE_NAME,
                                       bool findParents = true) noexcept;
  static rs::Result<Manifest> tryFromJson(const nlohmann::json& data,
                                          fs::path path = {}) noexcept;
  static rs::Result<fs::path> findPath(fs::path candidateDir) noexcept;

  rs::Result<void> add(GraphMember member) noexcept;

  // Returns nullptr when no member has the given id.
  const GraphMember* find(const NodeId& id) const noexcept;
  bool contains(const NodeId& id) const noexcept {
    return members_.contains(id);
  }
  std::size_t size() const noexcept { return members_.size(); }
  const std::unordered_map<NodeId, GraphMember>& members() const noexcept {
    return members_;
  }

  fs::path path;

private:
  std::unordered_map<NodeId, GraphMember> members_;
};

} // namespace nodesel

template <>
struct fmt::formatter<nodesel::ResourceKind> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const nodesel::ResourceKind kind, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(nodesel::toString(kind),
                                                    ctx);
  }
};
