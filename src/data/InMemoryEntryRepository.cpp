#include "agenda/data/InMemoryEntryRepository.hpp"

namespace agenda {
namespace data {

InMemoryEntryRepository::InMemoryEntryRepository(QString name)
    : m_name(std::move(name))
{
}

InMemoryEntryRepository::~InMemoryEntryRepository() = default;

QString InMemoryEntryRepository::name() const
{
    return m_name;
}

std::vector<Entry> InMemoryEntryRepository::fetchEntries() const
{
    return m_entries;
}

void InMemoryEntryRepository::addEntry(Entry entry)
{
    m_entries.push_back(std::move(entry));
}

void InMemoryEntryRepository::clear()
{
    m_entries.clear();
}

} // namespace data
} // namespace agenda
