#pragma once

#include <QtGlobal>
#include <vector>

#include "agenda/core/Occurrence.hpp"
#include "agenda/data/Entry.hpp"

namespace agenda {
namespace core {

class RecurrenceExpander
{
public:
    static constexpr int MaxOccurrences = 1000;
    // Candidates examined per entry, including those skipped before the window.
    static constexpr int MaxCandidates = 100000;

    explicit RecurrenceExpander(int maxOccurrences = MaxOccurrences, int maxCandidates = MaxCandidates);

    int maxOccurrences() const;
    int maxCandidates() const;

    std::vector<Occurrence> expand(const data::Entry &entry,
                                   const std::vector<data::Entry> &exceptions,
                                   qint64 windowStart,
                                   qint64 windowEnd) const;
    // Same as above, additionally stopping after `limit` candidates. The number
    // of candidates examined is stored in `candidates` when given.
    std::vector<Occurrence> expand(const data::Entry &entry,
                                   const std::vector<data::Entry> &exceptions,
                                   qint64 windowStart,
                                   qint64 windowEnd,
                                   int limit,
                                   int *candidates = nullptr) const;

private:
    static Occurrence instantiate(const data::Entry &entry,
                                  const std::vector<data::Entry> &exceptions,
                                  qint64 instant,
                                  qint64 duration);

    int m_maxOccurrences = MaxOccurrences;
    int m_maxCandidates = MaxCandidates;
};

} // namespace core
} // namespace agenda
