#pragma once

#include "fixed_pool.h"
#include "variable_pool.h"
#include <iosfwd>
#include <string>

namespace MP::report
{
void print_table(std::ostream& out, const fixed_pool& pool);
void print_summary(std::ostream& out, const fixed_pool& pool);
void print_owner(std::ostream& out, const fixed_pool& pool, const std::string& owner);

// chunk ids are cut to their first 6 characters
void print_table(std::ostream& out, const variable_pool& pool);
void print_summary(std::ostream& out, const variable_pool& pool);
void print_owner(std::ostream& out, const variable_pool& pool, const std::string& owner);
} // namespace MP::report
