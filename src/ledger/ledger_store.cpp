#include "ledger/ledger_store.hpp"

#include <stdexcept>
#include <string>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"

namespace tally {

LedgerStore::LedgerStore()
    : m_path(ledgerFilePath())
{
}

LedgerStore::LedgerStore(const QString &path)
    : m_path(path)
{
}

const QString &LedgerStore::path() const
{
    return m_path;
}

void LedgerStore::moveAside(const QString &reason) const
{
    const QString backup = m_path + QStringLiteral(".bak");
    QFile::remove(backup);
    const bool moved = QFile::rename(m_path, backup);
    TLOG_WARN(QStringLiteral("LedgerStore"),
              QStringLiteral("load"),
              QStringLiteral("ledger_corrupt"),
              (nlohmann::json{{"path", m_path.toStdString()},
                              {"backup", backup.toStdString()}}));
}

std::vector<LedgerEntry> LedgerStore::load() const
{
    QFile file(m_path);
    if (!file.exists()) {
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw std::runtime_error("failed to open ledger: " + m_path.toStdString());
    }
    const QByteArray data = file.readAll();
    file.close();

    nlohmann::ordered_json document;
    try {
        document = nlohmann::ordered_json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &) {
        moveAside(QStringLiteral("json_parse_error"));
        return {};
    }
    if (!document.is_array()) {
        moveAside(QStringLiteral("not_an_array"));
        return {};
    }

    std::vector<LedgerEntry> entries;
    entries.reserve(document.size());
    for (const auto &item : document) {
        if (!item.is_object()) {
            TLOG_WARN(QStringLiteral("LedgerStore"),
                      QStringLiteral("load"),
                      QStringLiteral("record_dropped"),
                      (nlohmann::json{{"value", item.dump()}}));
            continue;
        }
        entries.push_back(item.get<LedgerEntry>());
    }

    TLOG_DEBUG(QStringLiteral("LedgerStore"),
               QStringLiteral("load"),
               QStringLiteral("ledger_loaded"),
               (nlohmann::json{{"path", m_path.toStdString()},
                               {"entries", entries.size()}}));
    return entries;
}

void LedgerStore::save(const std::vector<LedgerEntry> &entries) const
{
    const QString dir = QFileInfo(m_path).absolutePath();
    if (!QDir().mkpath(dir)) {
        throw std::runtime_error("failed to create ledger directory: " + dir.toStdString());
    }

    nlohmann::ordered_json document = nlohmann::ordered_json::array();
    for (const auto &entry : entries) {
        document.push_back(entry);
    }
    const QByteArray data = QByteArray::fromStdString(document.dump(2));

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw std::runtime_error("failed to open ledger for writing: " + m_path.toStdString());
    }
    if (file.write(data) != data.size() || !file.commit()) {
        throw std::runtime_error("failed to write ledger: " + m_path.toStdString());
    }

    TLOG_DEBUG(QStringLiteral("LedgerStore"),
               QStringLiteral("save"),
               QStringLiteral("ledger_saved"),
               (nlohmann::json{{"path", m_path.toStdString()},
                               {"entries", entries.size()}}));
}

bool LedgerStore::clear() const
{
    if (!QFile::exists(m_path)) {
        return false;
    }
    if (!QFile::remove(m_path)) {
        throw std::runtime_error("failed to delete ledger: " + m_path.toStdString());
    }
    TLOG_INFO(QStringLiteral("LedgerStore"),
              QStringLiteral("clear"),
              QStringLiteral("ledger_cleared"),
              (nlohmann::json{{"path", m_path.toStdString()}}));
    return true;
}

} // namespace tally
