#pragma once

#include "agenda/data/Entry.hpp"

namespace agenda {
namespace core {

// Independent copy of an entry rebound to one concrete start/end pair.
struct Occurrence
{
    data::Entry entry;
    bool fromException = false;

    const data::TemporalValue &start() const { return entry.start; }
    const std::optional<data::TemporalValue> &end() const { return entry.end; }
};

} // namespace core
} // namespace agenda
