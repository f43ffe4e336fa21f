#pragma once

#include <QString>
#include <functional>
#include <optional>

#include "agenda/data/EntryRepository.hpp"

namespace agenda {
namespace data {

struct CalendarData
{
    QString name;
    std::vector<Entry> entries;
    bool ok = false;
};

// Every regular file directly inside the directory is read as event-record text.
class DirectoryEntryRepository : public EntryRepository
{
public:
    // Returns the file content, or nullopt with a description in `error`.
    using FileReader = std::function<std::optional<QString>(const QString &filePath, QString *error)>;

    explicit DirectoryEntryRepository(QString directoryPath, FileReader reader = FileReader());
    ~DirectoryEntryRepository() override = default;

    QString name() const override;
    std::vector<Entry> fetchEntries() const override;

    bool isValid() const;
    QString directoryPath() const;

    static QString normalizePath(const QString &path);
    static std::optional<QString> readFile(const QString &filePath, QString *error);

private:
    void load();

    FileReader m_reader;
    QString m_directoryPath;
    QString m_name;
    std::vector<Entry> m_entries;
    bool m_valid = false;
};

CalendarData loadCalendar(const QString &directoryPath);

} // namespace data
} // namespace agenda
