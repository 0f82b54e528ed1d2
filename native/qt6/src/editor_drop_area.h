#pragma once

#include <QWidget>
#include "workbench_services.h"
#include "workbench_types.h"

class EditorAreaDropHandler;
class WorkbenchSettings;

// Editor area surface that hands every drop to an EditorAreaDropHandler.
class EditorDropArea : public QWidget
{
    Q_OBJECT

public:
    // Drop options follow WorkbenchSettings::instance().
    explicit EditorDropArea(const WorkbenchServices& services, QWidget* parent = nullptr);
    // settings must outlive the widget.
    EditorDropArea(const WorkbenchServices& services, WorkbenchSettings* settings, QWidget* parent = nullptr);

    void setDropOptions(const DropOptions& options) { m_options = options; }
    DropOptions dropOptions() const { return m_options; }

    // Drops still being processed.
    int pendingDrops() const { return m_pendingDrops; }

signals:
    void dropHandled(bool workspaceOpened);
    void openFailed(const QString& message);

protected:
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dragMoveEvent(QDragMoveEvent* event) override;
    void dropEvent(QDropEvent* event) override;

private:
    void releaseWhenSettled(EditorAreaDropHandler* handler);

    WorkbenchServices m_services;
    DropOptions m_options;
    int m_pendingDrops = 0;
};
