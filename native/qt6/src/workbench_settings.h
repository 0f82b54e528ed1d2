#pragma once

#include <QObject>
#include <QSettings>
#include <QString>
#include "workbench_types.h"

/**
 * @brief Persistent workbench preferences that drive drop handling.
 *
 * Keys:
 * "Workbench/Drop/ForceReuseWindow"
 * "Workbench/RecentlyOpened/MaxEntries"
 * "Workbench/Log/MaxEntries"
 */
class WorkbenchSettings : public QObject {
    Q_OBJECT

public:
    static WorkbenchSettings& instance();

    struct DropSettings {
        bool forceReuseWindow = true;
        int maxRecentlyOpened = 100;
        int maxLogEntries = 1000;

        DropSettings() = default;
    };

    // Settings read from an explicit store, for tests and embedders.
    explicit WorkbenchSettings(QSettings* settings, QObject* parent = nullptr);

    DropSettings load() const;
    void save(const DropSettings& settings);

    // Options handed to each EditorAreaDropHandler.
    DropOptions dropOptions() const;

    // Pushes the stored log limits to LogManager.
    void applyLogSettings() const;

signals:
    void settingsChanged();

private:
    WorkbenchSettings();
    WorkbenchSettings(const WorkbenchSettings&) = delete;
    WorkbenchSettings& operator=(const WorkbenchSettings&) = delete;

    QSettings* m_settings = nullptr;
};
