#include "editor_drop_area.h"

#include "dragged_resources.h"
#include "editor_area_drop_handler.h"
#include "log_manager.h"
#include "workbench_settings.h"

#include <QDebug>
#include <QDragEnterEvent>
#include <QDragMoveEvent>
#include <QDropEvent>
#include <QFutureWatcher>
#include <QMimeData>
#include <exception>

EditorDropArea::EditorDropArea(const WorkbenchServices& services, QWidget* parent)
    : EditorDropArea(services, &WorkbenchSettings::instance(), parent)
{
}

EditorDropArea::EditorDropArea(const WorkbenchServices& services, WorkbenchSettings* settings, QWidget* parent)
    : QWidget(parent)
    , m_services(services)
    , m_options(settings->dropOptions())
{
    setAcceptDrops(true);
    connect(settings, &WorkbenchSettings::settingsChanged, this, [this, settings]() {
        m_options = settings->dropOptions();
    });
}

void EditorDropArea::dragEnterEvent(QDragEnterEvent* event)
{
    if (DraggedResources::hasDroppableData(event->mimeData())) {
        event->acceptProposedAction();
    } else {
        event->ignore();
    }
}

void EditorDropArea::dragMoveEvent(QDragMoveEvent* event)
{
    if (DraggedResources::hasDroppableData(event->mimeData())) {
        event->acceptProposedAction();
    } else {
        event->ignore();
    }
}

void EditorDropArea::dropEvent(QDropEvent* event)
{
    const QList<DraggedResource> resources = DraggedResources::extract(event->mimeData());
    if (resources.isEmpty()) {
        event->ignore();
        return;
    }
    event->acceptProposedAction();

    LogManager::instance().addLog(QString("[EditorDropArea] Drop with %1 resource(s)").arg(resources.size()));

    auto* handler = new EditorAreaDropHandler(resources, m_services, m_options, this);
    connect(handler, &EditorAreaDropHandler::openFailed, this, &EditorDropArea::openFailed);
    ++m_pendingDrops;

    handler->handleDrop()
        .then(this, [this, handler](bool workspaceOpened) {
            emit dropHandled(workspaceOpened);
            releaseWhenSettled(handler);
        })
        .onFailed(this, [this, handler](const std::exception& e) {
            const QString message = QString::fromUtf8(e.what());
            qWarning() << "[EditorDropArea] Drop failed:" << message;
            emit openFailed(message);
            releaseWhenSettled(handler);
        })
        .onCanceled(this, [this, handler]() {
            qWarning() << "[EditorDropArea] Drop was canceled";
            releaseWhenSettled(handler);
        });
}

void EditorDropArea::releaseWhenSettled(EditorAreaDropHandler* handler)
{
    // The handler drives the window opening, keep it until that is done
    auto* watcher = new QFutureWatcher<void>(handler);
    connect(watcher, &QFutureWatcher<void>::finished, this, [this, handler]() {
        --m_pendingDrops;
        handler->deleteLater();
    });
    watcher->setFuture(handler->openCompletion());
}
