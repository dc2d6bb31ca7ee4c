#pragma once

#include <cstddef>
#include <string>

namespace MP
{
// formats a byte count with the largest of B, KB, MB, GB, TB that keeps it >= 1
// every step divides by 1024 and drops the remainder, e.g. 1536 -> "1 KB"
std::string format_size(size_t bytes);
} // namespace MP
