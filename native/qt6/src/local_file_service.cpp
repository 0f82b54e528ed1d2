#include "local_file_service.h"

#include <QDebug>
#include <QFileInfo>
#include <QtConcurrent>

#include "workbench_error.h"

LocalFileService::LocalFileService(QThreadPool* pool)
    : m_pool(pool)
{
}

QFuture<FileStat> LocalFileService::resolveFile(const QUrl& resource)
{
    return QtConcurrent::run(m_pool, [resource]() {
        return stat(resource);
    });
}

FileStat LocalFileService::stat(const QUrl& resource)
{
    if (!resource.isLocalFile()) {
        throw WorkbenchError(WorkbenchError::Code::UnsupportedScheme,
                             QString("Cannot resolve %1").arg(resource.toString()));
    }

    QFileInfo fi(resource.toLocalFile());
    if (!fi.exists()) {
        throw WorkbenchError(WorkbenchError::Code::FileNotFound,
                             QString("File not found: %1").arg(fi.filePath()));
    }

    FileStat s;
    s.resource = QUrl::fromLocalFile(fi.absoluteFilePath());
    s.name = fi.fileName();
    s.isDirectory = fi.isDir();
    s.isSymbolicLink = fi.isSymLink();
    s.size = fi.isDir() ? 0 : fi.size();
    s.lastModified = fi.lastModified();
    return s;
}
