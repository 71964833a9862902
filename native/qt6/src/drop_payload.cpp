#include "drop_payload.h"

#include <QDir>
#include <QMimeData>
#include <QUrl>
#include <algorithm>

namespace DropPayload {

bool hasFileList(const QMimeData* mime)
{
    if (!mime || !mime->hasUrls()) return false;
    const QList<QUrl> urls = mime->urls();
    return std::any_of(urls.cbegin(), urls.cend(), [](const QUrl& url) { return url.isLocalFile(); });
}

std::optional<QStringList> fileList(const QMimeData* mime, bool nativeSeparators)
{
    if (!mime || !mime->hasUrls()) return std::nullopt;

    QStringList paths;
    const QList<QUrl> urls = mime->urls();
    for (const QUrl& url : urls) {
        if (!url.isLocalFile()) continue;
        const QString path = url.toLocalFile();
        paths << (nativeSeparators ? QDir::toNativeSeparators(path) : path);
    }
    if (paths.isEmpty()) return std::nullopt;
    return paths;
}

} // namespace DropPayload
