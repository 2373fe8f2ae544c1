#pragma once

#include <string>

namespace runq::core {

/// Generate an opaque identifier: prefix + 12 random lowercase hex chars,
/// e.g. make_id("run_") -> "run_3f9a0c1b77de". Thread-safe.
std::string make_id(const std::string &prefix);

} // namespace runq::core
