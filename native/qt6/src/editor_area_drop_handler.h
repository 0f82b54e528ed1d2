#pragma once
#include <QFuture>
#include <QList>
#include <QObject>
#include <QStringList>
#include <QUrl>
#include <optional>
#include <variant>
#include "workbench_services.h"
#include "workbench_types.h"

// External resources of one drop, split by what they can be opened as.
struct ExternalPartition {
    QList<QUrl> workspaces;
    QList<QUrl> folders;
};

// Open each path in its own window (reusing the current one where possible).
struct OpenDirect {
    QStringList paths;
};

// Create a new workspace made of these folders, then open it.
struct CreateCompositeWorkspace {
    QList<QUrl> folders;
};

using OpenPlan = std::variant<OpenDirect, CreateCompositeWorkspace>;

/**
 * @brief Handles a drop onto the editor area.
 *
 * Two kinds of drops are understood:
 * - a single dirty editor dragged over from another window: its backup is
 *   copied so the editor can be restored here with its unsaved content
 * - external folders and workspace files: they are opened in a window, several
 *   folders are first merged into a new workspace
 *
 * One instance per drop. The instance must stay alive until openCompletion()
 * has finished.
 */
class EditorAreaDropHandler : public QObject {
    Q_OBJECT

public:
    EditorAreaDropHandler(const QList<DraggedResource>& resources,
                          const WorkbenchServices& services,
                          const DropOptions& options = DropOptions(),
                          QObject* parent = nullptr);

    // Resolves to true if a workspace or folder is being opened because of the drop.
    QFuture<bool> handleDrop();

    const QList<DraggedResource>& resources() const { return m_resources; }

    // Finishes once the window opening started by the drop is done, failed if it failed.
    QFuture<void> openCompletion() const { return m_openCompletion; }

    static bool isWorkspaceFile(const QUrl& resource);
    static std::optional<OpenPlan> planWorkspaceOpening(const ExternalPartition& partition);

signals:
    void openFailed(const QString& message);

private:
    QFuture<bool> doHandleDrop();
    QFuture<bool> handleDirtyEditorDrop();
    QFuture<bool> handleExternalDrop();

    QFuture<ExternalPartition> partitionExternalResources(const QList<QUrl>& resources);
    QFuture<QUrl> lookupFolder(const QUrl& resource);
    void executeOpenPlan(const OpenPlan& plan);
    QFuture<void> openPaths(const QStringList& paths);
    QList<QUrl> externalResources() const;

    QList<DraggedResource> m_resources;
    WorkbenchServices m_services;
    DropOptions m_options;
    QFuture<void> m_openCompletion;
};
