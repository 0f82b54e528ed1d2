#pragma once
#include <QList>
#include <QString>
#include "workbench_types.h"

class QMimeData;

/**
 * DraggedResources - reading and writing the drag payloads the editor area understands.
 *
 * In-app drags carry editors (with the backup of their unsaved content) or plain
 * resources as JSON. Everything coming from the OS arrives as URLs and is
 * treated as external.
 */
namespace DraggedResources {

// JSON array of { "resource": uri, "backupResource": uri }
inline const QString EditorsMimeType = QStringLiteral("application/vnd.kworkbench.editors");
// JSON array of uri strings
inline const QString ResourcesMimeType = QStringLiteral("application/vnd.kworkbench.resources");
// JSON array of local paths, produced by the file explorer
inline const QString FilesMimeType = QStringLiteral("application/vnd.kworkbench.files");

/**
 * Collect the drop candidates of a drag payload.
 *
 * @param externalOnly skip in-app editors and resources
 */
QList<DraggedResource> extract(const QMimeData* mime, bool externalOnly = false);

// Write editors for a drag to another window.
void fillMimeData(QMimeData* mime, const QList<DraggedEditor>& editors);

// True if the payload carries local files or any of the in-app formats.
bool hasDroppableData(const QMimeData* mime);

} // namespace DraggedResources
