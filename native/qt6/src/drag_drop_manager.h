#pragma once

#include <QObject>
#include <QPointer>
#include <QWidget>
#include <stdexcept>
#include <type_traits>

#include "drop_file_target.h"
#include "drop_settings.h"

class QDragMoveEvent;
class QDropEvent;

// Thrown when a window is bound without being a DropFileTarget.
class ContractViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief DragDropManager - accepts files dropped from a file browser onto a window
 *
 * Usage:
 *   class MainWindow : public QMainWindow, public DropFileTarget {
 *       void openFiles(const QStringList& paths) override;
 *       DragDropManager m_dragDropManager;
 *   };
 *   MainWindow::MainWindow() { m_dragDropManager.attach(this); }
 *
 * The manager installs itself as an event filter on the window. Drag-enter
 * answers CopyAction when the payload carries a file list. A drop queues
 * openFiles() on the window and returns at once: the drag source is blocked
 * until the drop handler returns, and openFiles() may itself block.
 *
 * Exceptions raised while handling a drop are logged and swallowed since
 * nothing on the drag source side can handle them.
 */
class DragDropManager : public QObject {
    Q_OBJECT

public:
    explicit DragDropManager(QObject* parent = nullptr);
    ~DragDropManager() override;

    template <typename Host>
    void attach(Host* host)
    {
        static_assert(std::is_base_of<QWidget, Host>::value, "DragDropManager host must be a QWidget");
        static_assert(std::is_base_of<DropFileTarget, Host>::value, "DragDropManager host must implement DropFileTarget");
        if (!host) throw ContractViolation("DragDropManager: host window is null");
        attachTo(host, host);
    }

    // Attaching to a new host reloads DropSettings; re-attaching to the
    // current host keeps any setSettings() override.

    // Runtime-checked form for callers holding a plain QWidget*.
    // Throws ContractViolation if host is null or not a DropFileTarget.
    void attach(QWidget* host);

    bool isAttached() const { return !m_host.isNull(); }
    QWidget* host() const { return m_host.data(); }

    DropSettings settings() const { return m_settings; }
    void setSettings(const DropSettings& settings) { m_settings = settings; }

    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    void attachTo(QWidget* window, DropFileTarget* target);
    void handleDragEnter(QDragMoveEvent* event);
    void handleDrop(QDropEvent* event);

    QPointer<QWidget> m_host;
    DropFileTarget* m_target = nullptr;
    DropSettings m_settings;
};
