#pragma once

#include "Selector/SelectorSpec.hpp"

#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace nodesel {

// Used when nothing is passed to --select.
inline const std::vector<std::string> DEFAULT_INCLUDES = {
  "fqn:*",
  "source:*",
  "exposure:*",
};

// Parses one criterion, e.g. `@tag:nightly`, `2+orders+1`,
// `config.materialized:view`.
rs::Result<SelectionCriteria> parseCriteria(std::string_view raw,
                                            bool greedy) noexcept;

// Each element may hold several space separated specs. Specs are unioned;
// comma separated parts of one spec are intersected.
rs::Result<SelectionSpec> parseUnion(const std::vector<std::string>& components,
                                     bool expectExists, bool greedy) noexcept;

// `include` minus `exclude`. An empty `include` selects DEFAULT_INCLUDES.
// Exclusions are always greedy.
rs::Result<SelectionSpec>
parseDifference(const std::vector<std::string>& include,
                const std::vector<std::string>& exclude, bool greedy) noexcept;

} // namespace nodesel
