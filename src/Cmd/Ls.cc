#include "Ls.hpp"

#include "Cli.hpp"
#include "Config.hpp"
#include "Diag.hpp"
#include "Graph/Graph.hpp"
#include "Graph/GraphQueue.hpp"
#include "Manifest.hpp"
#include "Selector/NodeSelector.hpp"
#include "Selector/SelectorSpec.hpp"
#include "Selector/SpecParser.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <print>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace nodesel {

namespace fs = std::filesystem;

static rs::Result<void> lsMain(CliArgsView args);

const Subcmd LS_CMD =
    Subcmd{ "ls" }
        .setDesc("List the selected nodes in execution order")
        .addOpt(Opt{ "--manifest" }
                    .setPlaceholder("<FILE>")
                    .setDesc("Path to manifest.json (searched upwards by "
                             "default)"))
        .addOpt(Opt{ "--select" }
                    .setShort("-s")
                    .setPlaceholder("<SPEC>")
                    .setDesc("Nodes to include; may be repeated"))
        .addOpt(Opt{ "--exclude" }
                    .setPlaceholder("<SPEC>")
                    .setDesc("Nodes to exclude; may be repeated"))
        .addOpt(Opt{ "--selector" }
                    .setPlaceholder("<NAME>")
                    .setDesc("Use a selector defined in nodesel.toml"))
        .addOpt(Opt{ "--resource-type" }
                    .setPlaceholder("<KIND>")
                    .setDesc("Only list nodes of this kind; may be repeated"))
        .addOpt(Opt{ "--greedy" }.setDesc(
            "Include tests even when some of their parents are not selected"))
        .addOpt(Opt{ "--config" }
                    .setPlaceholder("<FILE>")
                    .setDesc("Path to nodesel.toml (searched upwards by "
                             "default)"))
        .addOpt(Opt{ "--output" }
                    .setPlaceholder("<FORMAT>")
                    .setDesc("Print unique ids or names: id, name")
                    .setDefault("id"))
        .setMainFn(lsMain);

namespace {

enum class OutputFormat : std::uint8_t {
  Id,
  Name,
};

struct LsArgs {
  std::optional<fs::path> manifestPath;
  std::vector<std::string> select;
  std::vector<std::string> exclude;
  std::optional<std::string> selector;
  std::vector<std::string> resourceTypes;
  bool greedy = false;
  std::optional<fs::path> configPath;
  OutputFormat output = OutputFormat::Id;
};

} // namespace

static rs::Result<OutputFormat> parseOutputFormat(const std::string_view str) {
  if (str == "id") {
    return rs::Ok(OutputFormat::Id);
  } else if (str == "name") {
    return rs::Ok(OutputFormat::Name);
  }
  rs_bail("invalid output format `{}`; expected `id` or `name`", str);
}

static rs::Result<Config> loadConfig(const std::optional<fs::path>& path) {
  if (path.has_value()) {
    return Config::tryParse(*path, /*findParents=*/false);
  }

  const auto found = Config::findPath(fs::current_path());
  if (found.is_err()) {
    spdlog::debug("{}; using the default configuration",
                  found.unwrap_err()->what());
    return rs::Ok(Config());
  }
  return Config::tryParse(found.unwrap(), /*findParents=*/false);
}

static rs::Result<SelectionSpec> buildSpec(const LsArgs& args,
                                           const Config& config) {
  if (args.selector.has_value()) {
    rs_ensure(args.select.empty() && args.exclude.empty(),
              "`--selector` cannot be combined with `--select` or "
              "`--exclude`");
    return config.selectorSpec(*args.selector);
  }
  return parseDifference(args.select, args.exclude,
                         args.greedy || config.selection.greedy);
}

static rs::Result<NodeMatcher> buildMatcher(const LsArgs& args,
                                            const Config& config) {
  std::unordered_set<ResourceKind> kinds;
  for (const std::string& kind : args.resourceTypes) {
    kinds.insert(rs_try(parseResourceKind(kind)));
  }
  // The command line overrides nodesel.toml.
  if (kinds.empty()) {
    kinds.insert(config.selection.resourceTypes.begin(),
                 config.selection.resourceTypes.end());
  }

  if (kinds.empty()) {
    return rs::Ok(matchAll());
  }
  return rs::Ok(resourceTypeMatcher(std::move(kinds)));
}

static rs::Result<void> lsMain(const CliArgsView cliArgs) {
  LsArgs args;
  for (auto itr = cliArgs.begin(); itr != cliArgs.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, cliArgs.end(), "ls"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (arg == "--greedy") {
      args.greedy = true;
      continue;
    }

    if (!matchesAny(arg, { "--manifest", "-s", "--select", "--exclude",
                           "--selector", "--resource-type", "--config",
                           "--output" })) {
      return LS_CMD.noSuchArg(arg);
    }
    if (itr + 1 == cliArgs.end()) {
      return Subcmd::missingOptArgumentFor(arg);
    }
    const std::string_view value = *++itr;

    if (arg == "--manifest") {
      args.manifestPath = fs::path(value);
    } else if (matchesAny(arg, { "-s", "--select" })) {
      args.select.emplace_back(value);
    } else if (arg == "--exclude") {
      args.exclude.emplace_back(value);
    } else if (arg == "--selector") {
      args.selector = std::string(value);
    } else if (arg == "--resource-type") {
      args.resourceTypes.emplace_back(value);
    } else if (arg == "--config") {
      args.configPath = fs::path(value);
    } else {
      args.output = rs_try(parseOutputFormat(value));
    }
  }

  const Config config = rs_try(loadConfig(args.configPath));
  const Manifest manifest = rs_try(
      args.manifestPath.has_value()
          ? Manifest::tryParse(*args.manifestPath, /*findParents=*/false)
          : Manifest::tryParse());
  spdlog::debug("Loaded {} members from {}", manifest.size(),
                manifest.path.string());

  const Graph graph = rs_try(Graph::fromManifest(manifest));
  const SelectionSpec spec = rs_try(buildSpec(args, config));
  Diag::verbose("Selecting", "{}", spec);

  NodeMatcher matcher = rs_try(buildMatcher(args, config));
  const NodeSelector selector = rs_try(NodeSelector::create(
      graph, manifest, std::move(matcher),
      SelectorOptions{ .warnError = config.selection.warnError }));
  const std::unique_ptr<GraphQueue> queue =
      rs_try(selector.getGraphQueue(spec));

  const std::size_t total = queue->size();
  while (!queue->empty()) {
    const std::optional<NodeId> next = queue->get();
    rs_ensure(next.has_value(), "graph queue stalled with {} node(s) left",
              queue->size());

    if (args.output == OutputFormat::Id) {
      std::println("{}", *next);
    } else {
      const GraphMember* member = manifest.find(*next);
      rs_ensure(member != nullptr, "Node {} not found in the manifest!",
                *next);
      std::println("{}", memberName(*member));
    }
    rs_try(queue->markDone(*next));
  }

  Diag::info("Selected", "{} node(s)", total);
  return rs::Ok();
}

} // namespace nodesel
