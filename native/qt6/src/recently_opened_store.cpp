#include "recently_opened_store.h"
#include <QDebug>
#include <algorithm>

namespace {
const char* kEntriesKey = "Workbench/RecentlyOpened/Paths";
}

RecentlyOpenedStore::RecentlyOpenedStore(QSettings* settings, int maxEntries, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_maxEntries(qMax(1, maxEntries))
{
}

bool RecentlyOpenedStore::samePath(const QString& a, const QString& b)
{
#ifdef Q_OS_WIN
    return a.compare(b, Qt::CaseInsensitive) == 0;
#else
    return a == b;
#endif
}

QStringList RecentlyOpenedStore::entries() const
{
    return m_settings->value(kEntriesKey).toStringList();
}

void RecentlyOpenedStore::addRecentlyOpened(const QStringList& paths)
{
    if (paths.isEmpty()) return;

    QStringList current = entries();
    // Last path of the batch ends up on top, like opening them one after the other
    for (const QString& path : paths) {
        if (path.isEmpty()) continue;
        current.erase(std::remove_if(current.begin(), current.end(),
                                     [&path](const QString& e) { return samePath(e, path); }),
                      current.end());
        current.prepend(path);
    }
    while (current.size() > m_maxEntries) {
        current.removeLast();
    }

    store(current);
    qDebug() << "[RecentlyOpened] Added" << paths.size() << "path(s)," << current.size() << "total";
}

void RecentlyOpenedStore::remove(const QStringList& paths)
{
    QStringList current = entries();
    const int before = current.size();
    current.erase(std::remove_if(current.begin(), current.end(), [&paths](const QString& e) {
                      return std::any_of(paths.cbegin(), paths.cend(),
                                         [&e](const QString& p) { return samePath(e, p); });
                  }),
                  current.end());
    if (current.size() != before) {
        store(current);
    }
}

void RecentlyOpenedStore::clear()
{
    store(QStringList());
}

void RecentlyOpenedStore::setMaxEntries(int maxEntries)
{
    m_maxEntries = qMax(1, maxEntries);
    QStringList current = entries();
    if (current.size() > m_maxEntries) {
        store(current.mid(0, m_maxEntries));
    }
}

void RecentlyOpenedStore::store(const QStringList& entries)
{
    m_settings->setValue(kEntriesKey, entries);
    m_settings->sync();
    emit changed();
}
