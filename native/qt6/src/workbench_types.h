#pragma once
#include <QDateTime>
#include <QDir>
#include <QList>
#include <QString>
#include <QStringList>
#include <QUrl>

namespace Schemas {
inline const QString untitled = QStringLiteral("untitled");
inline const QString file = QStringLiteral("file");
}

// Extension (without dot) of workspace description files.
inline const QString WORKSPACE_EXTENSION = QStringLiteral("code-workspace");

struct DraggedResource {
    QUrl resource;
    bool isExternal = false;
    QUrl backupResource; // only for dirty editors dragged between windows
};

// What an in-app editor drag carries to the other window.
struct DraggedEditor {
    QUrl resource;
    QUrl backupResource;
};

struct FileStat {
    QUrl resource;
    QString name;
    bool isDirectory = false;
    bool isSymbolicLink = false;
    qint64 size = 0;
    QDateTime lastModified;
};

struct ResolveContentOptions {
    bool acceptTextOnly = false;
    QString encoding;
};

// Backups are always read as raw utf8 regardless of the user's encoding.
inline const ResolveContentOptions BACKUP_FILE_RESOLVE_OPTIONS{ true, QStringLiteral("utf8") };

struct RawTextContent {
    QUrl resource;
    QString value;
    QString encoding;
};

struct OpenWindowOptions {
    bool forceReuseWindow = false;
    bool forceNewWindow = false;
};

struct WorkspaceFolderCreationData {
    QUrl uri;
    QString name;
};

struct WorkspaceIdentifier {
    QString id;
    QString configPath;
};

struct DropOptions {
    bool forceReuseWindow = true;
};

// Local filesystem path of a resource, in native separators.
inline QString toFsPath(const QUrl& resource)
{
    if (resource.isLocalFile()) {
        return QDir::toNativeSeparators(resource.toLocalFile());
    }
    return QDir::toNativeSeparators(resource.path());
}
