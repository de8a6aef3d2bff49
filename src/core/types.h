#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace sc {

namespace fs = std::filesystem;
using Path = fs::path;

using u64 = std::uint64_t;
using f64 = double;
using usize = std::size_t;

// Every length in the engine (pieces, bars, kerf, trim) is in millimetres
using Millimeters = f64;

// Empty on failure; the reason has already been logged
template <typename T>
using Result = std::optional<T>;

} // namespace sc
