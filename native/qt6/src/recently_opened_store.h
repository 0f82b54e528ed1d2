#pragma once

#include <QObject>
#include <QSettings>
#include <QStringList>
#include "workbench_services.h"

// Recently opened paths kept in QSettings, most recent first.
class RecentlyOpenedStore : public QObject, public IRecentlyOpenedRegistry {
    Q_OBJECT

public:
    RecentlyOpenedStore(QSettings* settings, int maxEntries, QObject* parent = nullptr);

    void addRecentlyOpened(const QStringList& paths) override;
    void remove(const QStringList& paths);
    void clear();

    QStringList entries() const;
    int maxEntries() const { return m_maxEntries; }
    void setMaxEntries(int maxEntries);

signals:
    void changed();

private:
    static bool samePath(const QString& a, const QString& b);
    void store(const QStringList& entries);

    QSettings* m_settings;
    int m_maxEntries;
};
