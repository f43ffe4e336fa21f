#pragma once

#include "agenda/data/EntryRepository.hpp"

namespace agenda {
namespace data {

class InMemoryEntryRepository : public EntryRepository
{
public:
    explicit InMemoryEntryRepository(QString name = QString());
    ~InMemoryEntryRepository() override;

    QString name() const override;
    std::vector<Entry> fetchEntries() const override;

    void addEntry(Entry entry);
    void clear();

private:
    QString m_name;
    std::vector<Entry> m_entries;
};

} // namespace data
} // namespace agenda
