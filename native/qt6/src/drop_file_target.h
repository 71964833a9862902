#pragma once

#include <QStringList>

/**
 * Capability a host window implements to receive files dropped from a
 * file-system browser. Paths arrive in the order the drag source listed them.
 *
 * openFiles() is always called from the host window's event loop, never from
 * inside the drop event itself, so it is free to block (e.g. show a modal
 * dialog) without stalling the drag source.
 */
class DropFileTarget {
public:
    virtual ~DropFileTarget() = default;
    virtual void openFiles(const QStringList& paths) = 0;
};
