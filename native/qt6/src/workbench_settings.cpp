#include "workbench_settings.h"
#include <QDebug>
#include "log_manager.h"

namespace {
const char* kForceReuseWindowKey = "Workbench/Drop/ForceReuseWindow";
const char* kMaxRecentlyOpenedKey = "Workbench/RecentlyOpened/MaxEntries";
const char* kMaxLogEntriesKey = "Workbench/Log/MaxEntries";
}

WorkbenchSettings& WorkbenchSettings::instance() {
    static WorkbenchSettings s;
    return s;
}

WorkbenchSettings::WorkbenchSettings()
    : QObject(nullptr)
{
    m_settings = new QSettings("KWorkbench", "KWorkbench", this);
}

WorkbenchSettings::WorkbenchSettings(QSettings* settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
}

WorkbenchSettings::DropSettings WorkbenchSettings::load() const {
    DropSettings defaults;
    DropSettings s;
    s.forceReuseWindow = m_settings->value(kForceReuseWindowKey, defaults.forceReuseWindow).toBool();
    s.maxRecentlyOpened = qMax(1, m_settings->value(kMaxRecentlyOpenedKey, defaults.maxRecentlyOpened).toInt());
    s.maxLogEntries = qMax(1, m_settings->value(kMaxLogEntriesKey, defaults.maxLogEntries).toInt());
    return s;
}

void WorkbenchSettings::save(const DropSettings& settings) {
    m_settings->setValue(kForceReuseWindowKey, settings.forceReuseWindow);
    m_settings->setValue(kMaxRecentlyOpenedKey, qMax(1, settings.maxRecentlyOpened));
    m_settings->setValue(kMaxLogEntriesKey, qMax(1, settings.maxLogEntries));
    m_settings->sync();
    LogManager::instance().setMaxEntries(qMax(1, settings.maxLogEntries));

    qDebug() << "[WorkbenchSettings] Saved drop settings, forceReuseWindow =" << settings.forceReuseWindow;
    emit settingsChanged();
}

DropOptions WorkbenchSettings::dropOptions() const {
    DropOptions options;
    options.forceReuseWindow = load().forceReuseWindow;
    return options;
}

void WorkbenchSettings::applyLogSettings() const {
    LogManager::instance().setMaxEntries(load().maxLogEntries);
}
