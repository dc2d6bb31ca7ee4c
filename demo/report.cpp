#include "report.h"
#include "size_format.h"
#include <cstddef>
#include <iomanip>
#include <ostream>
#include <string>

namespace MP::report
{
namespace
{
constexpr const char* USED = "■";
constexpr const char* FREE = "▢";

std::string short_id(const std::string& id)
{
    return id.substr(0, 6);
}
} // namespace

void print_table(std::ostream& out, const fixed_pool& pool)
{
    out << "Fixed Block Memory Pool Table:\n";
    out << std::left << std::setw(6) << "ID" << ' ' << std::setw(15) << "OWNER" << ' ' << "USE\n";
    out << std::string(26, '-') << '\n';

    for (const auto& b : pool.get_blocks())
    {
        out << std::left << std::setw(6) << b.id << ' ' << std::setw(15) << b.owner.value_or("-") << ' '
            << (b.allocated ? USED : FREE) << '\n';
    }
    out << '\n';
}

void print_summary(std::ostream& out, const fixed_pool& pool)
{
    out << "Fixed Block Size Memory Pool Summary:\n";
    out << std::string(30, '-') << '\n';
    out << "Free memory:     " << pool.get_remaining_blocks() << '/' << pool.get_total_blocks() << " blocks\n";
    out << "Total Memory:    " << pool.get_total_size() << '\n';
    out << "BlockSize:       " << pool.get_block_size() << "\n\n";
}

void print_owner(std::ostream& out, const fixed_pool& pool, const std::string& owner)
{
    out << "Total memory belonging to \"" << owner << "\":\n";
    out << std::string(30, '-') << '\n';

    for (size_t id : pool.get_owner_blocks(owner))
        out << "Block ID: " << id << '\n';

    auto usage = pool.get_owner_usage(owner);
    out << "Total = " << usage.block_count << " blocks or " << usage.total_bytes << "\n\n";
}

void print_table(std::ostream& out, const variable_pool& pool)
{
    out << "Variable Block Memory Pool Table:\n";
    out << std::left << std::setw(8) << "ID" << ' ' << std::setw(15) << "OWNER" << ' ' << std::setw(8) << "SIZE"
        << ' ' << "USE\n";
    out << std::string(36, '-') << '\n';

    for (const auto& c : pool.get_chunks())
    {
        out << std::left << std::setw(8) << short_id(c.id) << ' ' << std::setw(15) << c.owner << ' '
            << std::setw(8) << format_size(c.size) << ' ' << (c.allocated ? USED : FREE) << '\n';
    }
    out << '\n';
}

void print_summary(std::ostream& out, const variable_pool& pool)
{
    out << "Summary of Entire System:\n";
    out << std::string(30, '-') << '\n';
    out << "Free memory   " << pool.get_remaining_capacity() << " (" << pool.get_free_percentage() << "%)\n";
    out << "Total Memory  " << pool.get_total_capacity() << "\n\n";
}

void print_owner(std::ostream& out, const variable_pool& pool, const std::string& owner)
{
    out << "Total memory belonging to \"" << owner << "\":\n";
    out << std::left << std::setw(8) << "ID" << ' ' << "SIZE\n";
    out << std::string(30, '-') << '\n';

    for (const auto& c : pool.get_owner_chunks(owner))
        out << std::left << std::setw(8) << short_id(c.id) << ' ' << c.size << '\n';

    auto usage = pool.get_owner_usage(owner);
    out << "\nTotal = " << usage.total_bytes << " consisting of " << usage.chunk_count << " block(s)\n\n";
}
} // namespace MP::report
