#include "agenda/data/DirectoryEntryRepository.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/data/EntryBuilder.hpp"
#include "agenda/data/RecordParser.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <algorithm>
#include <iterator>

namespace agenda {
namespace data {

DirectoryEntryRepository::DirectoryEntryRepository(QString directoryPath, FileReader reader)
    : m_reader(reader ? std::move(reader) : FileReader(&DirectoryEntryRepository::readFile))
    , m_directoryPath(normalizePath(directoryPath))
    , m_name(QFileInfo(m_directoryPath).fileName())
{
    load();
}

QString DirectoryEntryRepository::name() const
{
    return m_name;
}

std::vector<Entry> DirectoryEntryRepository::fetchEntries() const
{
    return m_entries;
}

bool DirectoryEntryRepository::isValid() const
{
    return m_valid;
}

QString DirectoryEntryRepository::directoryPath() const
{
    return m_directoryPath;
}

QString DirectoryEntryRepository::normalizePath(const QString &path)
{
    QString normalized = QDir::fromNativeSeparators(path.trimmed());
    if (normalized == QLatin1String("~")) {
        normalized = QDir::homePath();
    } else if (normalized.startsWith(QLatin1String("~/"))) {
        normalized = QDir::homePath() + normalized.mid(1);
    }
    normalized = QDir::cleanPath(normalized);
    if (normalized.size() > 1 && normalized.endsWith('/')) {
        normalized.chop(1);
    }
    return normalized;
}

void DirectoryEntryRepository::load()
{
    m_entries.clear();
    m_valid = false;

    const QFileInfo info(m_directoryPath);
    if (!info.exists() || !info.isDir()) {
        qCWarning(lcAgendaData) << "Directory does not exist:" << m_directoryPath;
        return;
    }

    QDir dir(m_directoryPath);
    if (!info.isReadable()) {
        qCWarning(lcAgendaData) << "Directory is not readable:" << m_directoryPath;
        return;
    }

    const QFileInfoList files = dir.entryInfoList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDir::Name);

    std::vector<Record> records;
    for (const QFileInfo &file : files) {
        const QString filePath = dir.filePath(file.fileName());
        QString error;
        const auto content = m_reader(filePath, &error);
        if (!content) {
            qCWarning(lcAgendaData) << "Could not read file:" << filePath << error;
            continue;
        }
        auto fileRecords = RecordParser::parse(*content, filePath);
        std::move(fileRecords.begin(), fileRecords.end(), std::back_inserter(records));
    }

    m_entries = EntryBuilder::buildAll(records);
    m_valid = true;
    qCDebug(lcAgendaData) << "Loaded" << m_entries.size() << "entries from" << files.size() << "files in"
                          << m_directoryPath;
}

std::optional<QString> DirectoryEntryRepository::readFile(const QString &filePath, QString *error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (error) {
            *error = file.errorString();
        }
        return std::nullopt;
    }
    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    return stream.readAll();
}

CalendarData loadCalendar(const QString &directoryPath)
{
    DirectoryEntryRepository repository(directoryPath);
    CalendarData calendar;
    calendar.name = repository.name();
    calendar.ok = repository.isValid();
    calendar.entries = repository.fetchEntries();
    return calendar;
}

} // namespace data
} // namespace agenda
