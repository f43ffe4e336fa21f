#pragma once

#include <QString>
#include <vector>

#include "agenda/data/Entry.hpp"

namespace agenda {
namespace data {

class EntryRepository
{
public:
    virtual ~EntryRepository() = default;

    virtual QString name() const = 0;
    virtual std::vector<Entry> fetchEntries() const = 0;
};

} // namespace data
} // namespace agenda
