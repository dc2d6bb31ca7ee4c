#pragma once

#include <string>

namespace MP
{
// returns a random version 4 uuid, e.g. "3f2b8c1e-9a4d-4c7e-b2f1-0d6e5a9c8b7a"
std::string make_chunk_id();
} // namespace MP
