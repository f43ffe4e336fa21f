#include "agenda/core/RecurrenceExpander.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/core/RecurrenceRule.hpp"

#include <algorithm>

namespace agenda {
namespace core {

RecurrenceExpander::RecurrenceExpander(int maxOccurrences, int maxCandidates)
    : m_maxOccurrences(qBound(0, maxOccurrences, MaxOccurrences))
    , m_maxCandidates(qBound(0, maxCandidates, MaxCandidates))
{
}

int RecurrenceExpander::maxOccurrences() const
{
    return m_maxOccurrences;
}

int RecurrenceExpander::maxCandidates() const
{
    return m_maxCandidates;
}

std::vector<Occurrence> RecurrenceExpander::expand(const data::Entry &entry,
                                                   const std::vector<data::Entry> &exceptions,
                                                   qint64 windowStart,
                                                   qint64 windowEnd) const
{
    return expand(entry, exceptions, windowStart, windowEnd, m_maxCandidates);
}

std::vector<Occurrence> RecurrenceExpander::expand(const data::Entry &entry,
                                                   const std::vector<data::Entry> &exceptions,
                                                   qint64 windowStart,
                                                   qint64 windowEnd,
                                                   int limit,
                                                   int *candidates) const
{
    if (candidates) {
        *candidates = 0;
    }

    // Window clipping of single events happens in the projector.
    if (!entry.recurrenceRule) {
        if (candidates) {
            *candidates = 1;
        }
        return { Occurrence{ entry, false } };
    }

    const RecurrenceRule rule = RecurrenceRule::parse(*entry.recurrenceRule);
    const qint64 duration = entry.end ? entry.end->instant - entry.start.instant : 0;
    const std::size_t cap = static_cast<std::size_t>(std::max(0, std::min(limit, m_maxOccurrences)));
    const int candidateCap = std::max(0, std::min(limit, m_maxCandidates));

    std::vector<Occurrence> occurrences;
    qint64 current = entry.start.instant;
    int examined = 0;

    while (occurrences.size() < cap) {
        if (rule.until && current > *rule.until) {
            break;
        }
        if (rule.count && examined >= *rule.count) {
            break;
        }
        if (current > windowEnd) {
            break;
        }
        if (examined >= candidateCap) {
            if (candidateCap == m_maxCandidates) {
                qCWarning(lcAgendaRecurrence) << "Expansion of" << entry.sourcePath << "stopped after" << examined
                                              << "candidates before reaching the window end";
            }
            break;
        }

        // Candidates before the window still count towards COUNT.
        ++examined;
        if (current >= windowStart || current + duration > windowStart) {
            occurrences.push_back(instantiate(entry, exceptions, current, duration));
        }

        const qint64 next = data::advance(current, rule.interval, rule.frequency);
        if (next <= current) {
            qCWarning(lcAgendaRecurrence) << "Recurrence rule" << *entry.recurrenceRule
                                          << "does not advance, stopping expansion of" << entry.sourcePath;
            break;
        }
        current = next;
    }

    if (candidates) {
        *candidates = examined;
    }
    if (cap > 0 && occurrences.size() >= cap) {
        qCDebug(lcAgendaRecurrence) << "Expansion of" << entry.sourcePath << "stopped at" << cap << "occurrences";
    }
    return occurrences;
}

Occurrence RecurrenceExpander::instantiate(const data::Entry &entry,
                                           const std::vector<data::Entry> &exceptions,
                                           qint64 instant,
                                           qint64 duration)
{
    for (const data::Entry &exception : exceptions) {
        if (exception.recurrenceId && exception.recurrenceId->instant == instant) {
            return Occurrence{ exception, true };
        }
    }

    Occurrence occurrence{ entry, false };
    occurrence.entry.start.instant = instant;
    if (occurrence.entry.end) {
        occurrence.entry.end->instant = instant + duration;
    }
    return occurrence;
}

} // namespace core
} // namespace agenda
