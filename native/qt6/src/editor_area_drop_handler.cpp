#include "editor_area_drop_handler.h"

#include <QDebug>
#include <QFileInfo>
#include <algorithm>
#include <exception>

#include "future_utils.h"
#include "log_manager.h"

EditorAreaDropHandler::EditorAreaDropHandler(const QList<DraggedResource>& resources,
                                             const WorkbenchServices& services,
                                             const DropOptions& options,
                                             QObject* parent)
    : QObject(parent)
    , m_resources(resources)
    , m_services(services)
    , m_options(options)
    , m_openCompletion(FutureUtils::ready())
{
}

QFuture<bool> EditorAreaDropHandler::handleDrop()
{
    qDebug() << "[DropHandler] Handling drop of" << m_resources.size() << "resource(s)";

    return doHandleDrop().then(this, [this](bool isWorkspaceOpening) {
        // Opened workspaces are added to the recent list by the window opening itself
        if (!isWorkspaceOpening) {
            QStringList paths;
            for (const QUrl& resource : externalResources()) {
                paths << toFsPath(resource);
            }
            if (!paths.isEmpty()) {
                m_services.recentlyOpened->addRecentlyOpened(paths);
            }
        }
        return isWorkspaceOpening;
    });
}

QFuture<bool> EditorAreaDropHandler::doHandleDrop()
{
    // Dirty editor dragged over from another window
    if (m_resources.size() == 1 && !m_resources.first().isExternal && !m_resources.first().backupResource.isEmpty()) {
        return handleDirtyEditorDrop();
    }

    // Files or folders dropped from another program or the OS
    const bool hasExternal = std::any_of(m_resources.cbegin(), m_resources.cend(),
                                         [](const DraggedResource& r) { return r.isExternal; });
    if (hasExternal) {
        return handleExternalDrop();
    }

    return FutureUtils::ready(false);
}

QFuture<bool> EditorAreaDropHandler::handleDirtyEditorDrop()
{
    DraggedResource& dropped = m_resources.first();

    try {
        // Every dropped untitled editor becomes a new untitled editor here
        if (dropped.resource.scheme() == Schemas::untitled) {
            dropped.resource = m_services.untitled->createOrGet();
        }

        if (m_services.textFiles->isDirty(dropped.resource) || m_services.editorGroups->isOpen(dropped.resource)) {
            qDebug() << "[DropHandler] Target already dirty or open, keeping it:" << dropped.resource;
            return FutureUtils::ready(false);
        }

        const QUrl target = dropped.resource;
        IBackupFileService* backups = m_services.backups;
        return m_services.textFiles->resolveTextContent(dropped.backupResource, BACKUP_FILE_RESOLVE_OPTIONS)
            .then(this, [backups, target](const RawTextContent& content) {
                return backups->backupResource(target, backups->parseBackupContent(content.value));
            })
            .unwrap()
            .then([target] {
                LogManager::instance().addLog(QString("[DropHandler] Restored backup of dropped editor %1").arg(target.toString()));
                return false;
            })
            .onFailed([target](const std::exception& e) {
                qWarning() << "[DropHandler] Could not migrate dropped editor" << target << ":" << e.what();
                return false;
            })
            .onFailed([target] {
                qWarning() << "[DropHandler] Could not migrate dropped editor" << target << ": unknown error";
                return false;
            })
            .onCanceled([target] {
                qWarning() << "[DropHandler] Migration of dropped editor" << target << "was canceled";
                return false;
            });
    } catch (const std::exception& e) {
        qWarning() << "[DropHandler] Could not migrate dropped editor" << dropped.resource << ":" << e.what();
        return FutureUtils::ready(false);
    }
}

QFuture<bool> EditorAreaDropHandler::handleExternalDrop()
{
    return partitionExternalResources(externalResources()).then(this, [this](const ExternalPartition& partition) {
        const std::optional<OpenPlan> plan = planWorkspaceOpening(partition);

        // Plain files only: these open as editors, not here
        if (!plan) {
            return false;
        }

        m_services.window->focusWindow();
        executeOpenPlan(*plan);

        return true;
    });
}

QFuture<ExternalPartition> EditorAreaDropHandler::partitionExternalResources(const QList<QUrl>& resources)
{
    ExternalPartition partition;
    QList<QFuture<QUrl>> lookups;
    lookups.reserve(resources.size());

    for (const QUrl& resource : resources) {
        if (isWorkspaceFile(resource)) {
            partition.workspaces << resource;
        } else {
            lookups << lookupFolder(resource);
        }
    }

    if (lookups.isEmpty()) {
        return FutureUtils::ready(partition);
    }

    return QtFuture::whenAll(lookups.begin(), lookups.end()).then([partition](const QList<QFuture<QUrl>>& settled) {
        ExternalPartition result = partition;
        for (const QFuture<QUrl>& lookup : settled) {
            if (lookup.resultCount() == 0) continue;
            const QUrl folder = lookup.result();
            if (!folder.isEmpty()) {
                result.folders << folder;
            }
        }
        return result;
    });
}

QFuture<QUrl> EditorAreaDropHandler::lookupFolder(const QUrl& resource)
{
    QFuture<FileStat> stat;
    try {
        stat = m_services.files->resolveFile(resource);
    } catch (const std::exception& e) {
        qDebug() << "[DropHandler] Cannot stat dropped resource" << resource << ":" << e.what();
        return FutureUtils::ready(QUrl());
    }

    // Failing to resolve is expected for plain files dropped with the folders
    return stat
        .then([](const FileStat& s) { return s.isDirectory ? s.resource : QUrl(); })
        .onFailed([resource] {
            qDebug() << "[DropHandler] Dropped resource is not a folder:" << resource;
            return QUrl();
        })
        .onCanceled([] { return QUrl(); });
}

bool EditorAreaDropHandler::isWorkspaceFile(const QUrl& resource)
{
    const QString name = QFileInfo(resource.path()).fileName();
    const int dot = name.lastIndexOf('.');
    return dot > 0 && name.mid(dot + 1) == WORKSPACE_EXTENSION;
}

std::optional<OpenPlan> EditorAreaDropHandler::planWorkspaceOpening(const ExternalPartition& partition)
{
    if (partition.workspaces.isEmpty() && partition.folders.isEmpty()) {
        return std::nullopt;
    }

    // Workspaces or a single folder open as they are
    if (!partition.workspaces.isEmpty() || partition.folders.size() == 1) {
        OpenDirect direct;
        for (const QUrl& workspace : partition.workspaces) direct.paths << toFsPath(workspace);
        for (const QUrl& folder : partition.folders) direct.paths << toFsPath(folder);
        return OpenPlan(direct);
    }

    return OpenPlan(CreateCompositeWorkspace{ partition.folders });
}

void EditorAreaDropHandler::executeOpenPlan(const OpenPlan& plan)
{
    QFuture<void> opening;

    if (const auto* direct = std::get_if<OpenDirect>(&plan)) {
        LogManager::instance().addLog(QString("[DropHandler] Opening %1 dropped location(s)").arg(direct->paths.size()));
        opening = openPaths(direct->paths);
    } else {
        const auto& composite = std::get<CreateCompositeWorkspace>(plan);
        QList<WorkspaceFolderCreationData> folders;
        folders.reserve(composite.folders.size());
        for (const QUrl& folder : composite.folders) {
            folders.append(WorkspaceFolderCreationData{ folder, QString() });
        }
        LogManager::instance().addLog(QString("[DropHandler] Creating workspace from %1 dropped folders").arg(folders.size()));

        opening = m_services.workspaces->createWorkspace(folders)
            .then(this, [this](const WorkspaceIdentifier& workspace) {
                return openPaths(QStringList{ workspace.configPath });
            })
            .unwrap();
    }

    m_openCompletion = opening.onFailed(this, [this](const std::exception& e) {
        const QString message = QString::fromUtf8(e.what());
        qWarning() << "[DropHandler] Opening dropped locations failed:" << message;
        LogManager::instance().addLog("[DropHandler] Opening dropped locations failed: " + message, "ERROR");
        emit openFailed(message);
        throw;
    });
}

QFuture<void> EditorAreaDropHandler::openPaths(const QStringList& paths)
{
    OpenWindowOptions options;
    options.forceReuseWindow = m_options.forceReuseWindow;
    return m_services.windows->openWindow(paths, options);
}

QList<QUrl> EditorAreaDropHandler::externalResources() const
{
    QList<QUrl> external;
    for (const DraggedResource& r : m_resources) {
        if (r.isExternal) external << r.resource;
    }
    return external;
}
