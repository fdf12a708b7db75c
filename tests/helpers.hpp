#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <sys/wait.h>
#include <system_error>
#include <utility>
#include <vector>

namespace tests {

namespace fs = std::filesystem;

struct TempDir {
  fs::path path;

  TempDir()
      : path([] {
          const auto epoch =
              std::chrono::steady_clock::now().time_since_epoch();
          const auto ticks =
              std::chrono::duration_cast<std::chrono::nanoseconds>(epoch)
                  .count();
          const auto random =
              static_cast<std::uint64_t>(std::random_device{}());
          std::ostringstream oss;
          oss << "nodesel-test-" << random << '-' << ticks;
          return fs::temp_directory_path() / oss.str();
        }()) {
    fs::create_directories(path);
  }

  ~TempDir() {
    if (path.empty()) {
      return;
    }
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  TempDir(TempDir&& other) noexcept : path(std::move(other.path)) {
    other.path.clear();
  }

  TempDir& operator=(TempDir&& other) noexcept {
    if (this != &other) {
      path = std::move(other.path);
      other.path.clear();
    }
    return *this;
  }

  [[nodiscard]] fs::path operator/(const fs::path& relative) const {
    return path / relative;
  }
};

inline std::string readFile(const fs::path& file) {
  std::ifstream ifs(file);
  return std::string(std::istreambuf_iterator<char>(ifs), {});
}

inline void writeFile(const fs::path& file, const std::string& content) {
  std::ofstream ofs(file);
  ofs << content;
}

inline fs::path nodeselBinary() {
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  if (const char* env = std::getenv("NODESEL")) {
    return fs::path(env);
  }
  return fs::current_path() / "nodesel";
}

struct RunResult {
  int status = -1;
  std::string out;
  std::string err;

  bool success() const { return status == 0; }
};

inline std::string shellQuote(const std::string_view arg) {
  std::string quoted = "'";
  for (const char c : arg) {
    if (c == '\'') {
      quoted += R"('\'')";
    } else {
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}

// Runs nodesel with colors disabled and captures its output.
inline RunResult runNodesel(const std::vector<std::string>& args,
                            const fs::path& workdir = {}) {
  const TempDir outDir;
  const fs::path outFile = outDir / "stdout";
  const fs::path errFile = outDir / "stderr";

  std::string cmd;
  if (!workdir.empty()) {
    cmd += "cd " + shellQuote(workdir.string()) + " && ";
  }
  cmd += "NODESEL_TERM_COLOR=never " + shellQuote(nodeselBinary().string());
  for (const std::string& arg : args) {
    cmd += ' ' + shellQuote(arg);
  }
  cmd += " >" + shellQuote(outFile.string());
  cmd += " 2>" + shellQuote(errFile.string());

  // NOLINTNEXTLINE(concurrency-mt-unsafe,cert-env33-c)
  const int raw = std::system(cmd.c_str());
  RunResult result;
  result.status = WIFEXITED(raw) ? WEXITSTATUS(raw) : -1;
  result.out = readFile(outFile);
  result.err = readFile(errFile);
  return result;
}

inline RunResult runNodesel(std::initializer_list<std::string> args,
                            const fs::path& workdir = {}) {
  return runNodesel(std::vector<std::string>(args), workdir);
}

// A small shop project:
//
//   source raw.orders    -> stg_orders    -> orders -> not_null_orders_id
//   source raw.customers -> stg_customers -/        \-> revenue_dashboard
//
// relationships_orders_customers tests orders and stg_customers. legacy is
// disabled and country_codes is a lone seed.
inline constexpr std::string_view SHOP_MANIFEST = R"({
  "nodes": {
    "model.shop.stg_orders": {
      "resource_type": "model",
      "name": "stg_orders",
      "fqn": ["shop", "staging", "stg_orders"],
      "package_name": "shop",
      "path": "models/staging/stg_orders.sql",
      "tags": ["nightly"],
      "config": { "materialized": "view" },
      "depends_on": { "nodes": ["source.shop.raw.orders"] }
    },
    "model.shop.stg_customers": {
      "resource_type": "model",
      "name": "stg_customers",
      "fqn": ["shop", "staging", "stg_customers"],
      "package_name": "shop",
      "path": "models/staging/stg_customers.sql",
      "config": { "materialized": "view" },
      "depends_on": { "nodes": ["source.shop.raw.customers"] }
    },
    "model.shop.orders": {
      "resource_type": "model",
      "name": "orders",
      "fqn": ["shop", "marts", "orders"],
      "package_name": "shop",
      "path": "models/marts/orders.sql",
      "tags": ["finance"],
      "config": { "materialized": "table" },
      "depends_on": {
        "nodes": ["model.shop.stg_orders", "model.shop.stg_customers"]
      }
    },
    "model.shop.legacy": {
      "resource_type": "model",
      "name": "legacy",
      "fqn": ["shop", "legacy"],
      "package_name": "shop",
      "path": "models/legacy.sql",
      "config": { "enabled": false },
      "depends_on": { "nodes": ["model.shop.stg_orders"] }
    },
    "seed.shop.country_codes": {
      "resource_type": "seed",
      "name": "country_codes",
      "fqn": ["shop", "country_codes"],
      "package_name": "shop",
      "path": "seeds/country_codes.csv"
    },
    "test.shop.not_null_orders_id": {
      "resource_type": "test",
      "name": "not_null_orders_id",
      "fqn": ["shop", "marts", "not_null_orders_id"],
      "package_name": "shop",
      "path": "models/marts/schema.yml",
      "depends_on": { "nodes": ["model.shop.orders"] }
    },
    "test.shop.relationships_orders_customers": {
      "resource_type": "test",
      "name": "relationships_orders_customers",
      "fqn": ["shop", "marts", "relationships_orders_customers"],
      "package_name": "shop",
      "path": "models/marts/schema.yml",
      "depends_on": {
        "nodes": ["model.shop.orders", "model.shop.stg_customers"]
      }
    }
  },
  "sources": {
    "source.shop.raw.orders": {
      "name": "orders",
      "source_name": "raw",
      "package_name": "shop",
      "path": "models/sources.yml",
      "tags": ["nightly"]
    },
    "source.shop.raw.customers": {
      "name": "customers",
      "source_name": "raw",
      "package_name": "shop",
      "path": "models/sources.yml"
    }
  },
  "exposures": {
    "exposure.shop.revenue_dashboard": {
      "name": "revenue_dashboard",
      "package_name": "shop",
      "depends_on": { "nodes": ["model.shop.orders"] }
    }
  }
}
)";

// Creates a project directory holding SHOP_MANIFEST.
inline TempDir makeShopProject() {
  TempDir tmp;
  writeFile(tmp / "manifest.json", std::string(SHOP_MANIFEST));
  return tmp;
}

} // namespace tests
