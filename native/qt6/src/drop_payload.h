#pragma once

#include <QStringList>
#include <optional>

class QMimeData;

/**
 * DropPayload - queries on a drag payload for the file-drop list.
 *
 * A file-drop list is a text/uri-list entry with at least one local file URL.
 */
namespace DropPayload {

// True if the payload lists at least one local file.
// Reads the URL list, so it may throw whatever the payload's data retrieval throws.
bool hasFileList(const QMimeData* mime);

/**
 * Local file paths carried by the payload, in payload order.
 * Non-local URLs are skipped.
 *
 * @return std::nullopt if the payload has no URL list or no local file in it
 */
std::optional<QStringList> fileList(const QMimeData* mime, bool nativeSeparators = true);

} // namespace DropPayload
