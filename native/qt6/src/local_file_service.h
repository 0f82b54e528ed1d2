#pragma once
#include <QFuture>
#include <QThreadPool>
#include <QUrl>
#include "workbench_services.h"

// Resolves file stats with QFileInfo on a worker pool.
class LocalFileService : public IFileService {
public:
    explicit LocalFileService(QThreadPool* pool = QThreadPool::globalInstance());

    QFuture<FileStat> resolveFile(const QUrl& resource) override;

    // Blocking variant used by the worker; throws WorkbenchError.
    static FileStat stat(const QUrl& resource);

private:
    QThreadPool* m_pool;
};
