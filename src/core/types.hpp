#pragma once

#include <cstdint>
#include <filesystem>

namespace tvfs {

namespace fs = std::filesystem;

using u32 = uint32_t;
using u64 = uint64_t;
using i32 = int32_t;
using i64 = int64_t;

} // namespace tvfs
