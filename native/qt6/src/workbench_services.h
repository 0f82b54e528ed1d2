#pragma once
#include <QFuture>
#include <QList>
#include <QString>
#include <QStringList>
#include <QUrl>
#include "workbench_types.h"

// Host-side collaborators the editor area drop handling talks to.
// Failures are reported through the returned futures (see WorkbenchError).

class IRecentlyOpenedRegistry {
public:
    virtual ~IRecentlyOpenedRegistry() = default;
    virtual void addRecentlyOpened(const QStringList& paths) = 0;
};

class IFileService {
public:
    virtual ~IFileService() = default;
    virtual QFuture<FileStat> resolveFile(const QUrl& resource) = 0;
};

class ITextFileService {
public:
    virtual ~ITextFileService() = default;
    virtual bool isDirty(const QUrl& resource) const = 0;
    virtual QFuture<RawTextContent> resolveTextContent(const QUrl& resource, const ResolveContentOptions& options) = 0;
};

class IBackupFileService {
public:
    virtual ~IBackupFileService() = default;
    virtual QFuture<void> backupResource(const QUrl& resource, const QString& content) = 0;
    virtual QString parseBackupContent(const QString& rawContent) const = 0;
};

class IWindowService {
public:
    virtual ~IWindowService() = default;
    virtual void focusWindow() = 0;
};

class IWindowsService {
public:
    virtual ~IWindowsService() = default;
    virtual QFuture<void> openWindow(const QStringList& paths, const OpenWindowOptions& options) = 0;
};

class IWorkspacesService {
public:
    virtual ~IWorkspacesService() = default;
    virtual QFuture<WorkspaceIdentifier> createWorkspace(const QList<WorkspaceFolderCreationData>& folders) = 0;
};

class IUntitledEditorService {
public:
    virtual ~IUntitledEditorService() = default;
    // Returns the resource of a new untitled editor.
    virtual QUrl createOrGet() = 0;
};

class IEditorGroupService {
public:
    virtual ~IEditorGroupService() = default;
    virtual bool isOpen(const QUrl& resource) const = 0;
};

// Non-owning; every pointer must outlive the handlers built from it.
struct WorkbenchServices {
    IFileService* files = nullptr;
    IRecentlyOpenedRegistry* recentlyOpened = nullptr;
    IWindowService* window = nullptr;
    IWindowsService* windows = nullptr;
    IWorkspacesService* workspaces = nullptr;
    ITextFileService* textFiles = nullptr;
    IBackupFileService* backups = nullptr;
    IEditorGroupService* editorGroups = nullptr;
    IUntitledEditorService* untitled = nullptr;
};
