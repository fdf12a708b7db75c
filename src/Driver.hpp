#pragma once

#include <rs/result.hpp>

namespace nodesel {

// NOLINTNEXTLINE(*-avoid-c-arrays)
rs::Result<void, void> run(int argc, char* argv[]) noexcept;

} // namespace nodesel
