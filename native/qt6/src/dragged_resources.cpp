#include "dragged_resources.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QMimeData>
#include <QUrl>
#include <algorithm>

namespace {

bool parseArray(const QMimeData* mime, const QString& format, QJsonArray* out)
{
    const QByteArray raw = mime->data(format);
    if (raw.isEmpty()) return false;

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "[DraggedResources] Ignoring malformed" << format << "payload:" << error.errorString();
        return false;
    }
    *out = doc.array();
    return true;
}

} // namespace

namespace DraggedResources {

QList<DraggedResource> extract(const QMimeData* mime, bool externalOnly)
{
    QList<DraggedResource> resources;
    if (!mime) return resources;

    // Window to window
    if (!externalOnly) {
        QJsonArray editors;
        QJsonArray uris;
        if (parseArray(mime, EditorsMimeType, &editors)) {
            for (const QJsonValue& v : editors) {
                const QJsonObject editor = v.toObject();
                const QUrl resource(editor.value("resource").toString());
                if (!resource.isValid() || resource.isEmpty()) continue;
                DraggedResource r;
                r.resource = resource;
                r.backupResource = QUrl(editor.value("backupResource").toString());
                r.isExternal = false;
                resources << r;
            }
        } else if (parseArray(mime, ResourcesMimeType, &uris)) {
            for (const QJsonValue& v : uris) {
                const QUrl resource(v.toString());
                if (!resource.isValid() || resource.isEmpty()) continue;
                resources << DraggedResource{ resource, false, QUrl() };
            }
        }
    }

    // Native file transfer
    if (mime->hasUrls()) {
        for (const QUrl& url : mime->urls()) {
            if (url.isLocalFile()) {
                resources << DraggedResource{ url, true, QUrl() };
            }
        }
    }

    QJsonArray files;
    if (parseArray(mime, FilesMimeType, &files)) {
        for (const QJsonValue& v : files) {
            const QString path = v.toString();
            if (path.isEmpty()) continue;
            resources << DraggedResource{ QUrl::fromLocalFile(path), true, QUrl() };
        }
    }

    return resources;
}

void fillMimeData(QMimeData* mime, const QList<DraggedEditor>& editors)
{
    if (!mime || editors.isEmpty()) return;

    QJsonArray editorArray;
    QJsonArray resourceArray;
    for (const DraggedEditor& editor : editors) {
        QJsonObject obj;
        obj.insert("resource", editor.resource.toString(QUrl::FullyEncoded));
        if (!editor.backupResource.isEmpty()) {
            obj.insert("backupResource", editor.backupResource.toString(QUrl::FullyEncoded));
        }
        editorArray.append(obj);
        resourceArray.append(editor.resource.toString(QUrl::FullyEncoded));
    }

    mime->setData(EditorsMimeType, QJsonDocument(editorArray).toJson(QJsonDocument::Compact));
    mime->setData(ResourcesMimeType, QJsonDocument(resourceArray).toJson(QJsonDocument::Compact));
}

bool hasDroppableData(const QMimeData* mime)
{
    if (!mime) return false;
    const QList<QUrl> urls = mime->urls();
    const bool hasLocalFiles = std::any_of(urls.cbegin(), urls.cend(), [](const QUrl& u) { return u.isLocalFile(); });
    return hasLocalFiles
        || mime->hasFormat(EditorsMimeType)
        || mime->hasFormat(ResourcesMimeType)
        || mime->hasFormat(FilesMimeType);
}

} // namespace DraggedResources
