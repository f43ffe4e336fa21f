#pragma once

#include <optional>
#include <vector>

#include "agenda/data/Entry.hpp"
#include "agenda/data/Record.hpp"

namespace agenda {
namespace data {

class EntryBuilder
{
public:
    static std::optional<Entry> build(const Record &record);
    static std::vector<Entry> buildAll(const std::vector<Record> &records);
};

} // namespace data
} // namespace agenda
