#include "agenda/data/EntryBuilder.hpp"

#include "agenda/core/Logging.hpp"

namespace agenda {
namespace data {

namespace {
std::optional<TemporalValue> optionalValue(const Record &record, const QString &key)
{
    if (!record.contains(key)) {
        return std::nullopt;
    }
    return parseTemporalValue(record.value(key));
}
} // namespace

std::optional<Entry> EntryBuilder::build(const Record &record)
{
    const QString startKey = QStringLiteral("DTSTART");
    if (!record.contains(startKey)) {
        qCWarning(lcAgendaData) << "No start date for:" << record.sourcePath;
        return std::nullopt;
    }

    QString error;
    const auto start = parseTemporalValue(record.value(startKey), &error);
    if (!start) {
        qCWarning(lcAgendaData) << "No start date for:" << record.sourcePath << error;
        return std::nullopt;
    }

    Entry entry;
    entry.start = *start;
    entry.end = optionalValue(record, QStringLiteral("DTEND"));
    entry.recurrenceId = optionalValue(record, QStringLiteral("RECURRENCE-ID"));
    if (record.contains(QStringLiteral("RRULE"))) {
        entry.recurrenceRule = record.value(QStringLiteral("RRULE"));
    }
    entry.summary = record.value(QStringLiteral("SUMMARY")).trimmed();
    entry.sourcePath = record.sourcePath;
    return entry;
}

std::vector<Entry> EntryBuilder::buildAll(const std::vector<Record> &records)
{
    std::vector<Entry> entries;
    entries.reserve(records.size());
    for (const Record &record : records) {
        if (auto entry = build(record)) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

} // namespace data
} // namespace agenda
