#include "drag_drop_manager.h"
#include "drop_payload.h"
#include "log_manager.h"

#include <QDebug>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QEvent>
#include <QMetaObject>
#include <exception>

DragDropManager::DragDropManager(QObject* parent)
    : QObject(parent)
{
}

DragDropManager::~DragDropManager() {
    if (m_host) m_host->removeEventFilter(this);
}

void DragDropManager::attach(QWidget* host) {
    if (!host) {
        throw ContractViolation("DragDropManager: host window is null");
    }
    auto* target = dynamic_cast<DropFileTarget*>(host);
    if (!target) {
        throw ContractViolation("DragDropManager: host window doesn't implement DropFileTarget");
    }
    attachTo(host, target);
}

void DragDropManager::attachTo(QWidget* window, DropFileTarget* target) {
    if (m_host && m_host != window) {
        m_host->removeEventFilter(this);
        qDebug() << "[DragDropManager] Moving drop target from" << m_host->objectName() << "to" << window->objectName();
    }

    if (m_host != window) {
        m_settings = DropSettings::load();
    }
    m_host = window;
    m_target = target;

    window->setAcceptDrops(true);
    window->installEventFilter(this);

    LogManager::instance().addLog(QString("[DragDropManager] Accepting file drops on %1")
                                      .arg(window->objectName().isEmpty() ? QString(window->metaObject()->className())
                                                                         : window->objectName()));
}

bool DragDropManager::eventFilter(QObject* watched, QEvent* event) {
    if (!m_host || watched != m_host) return QObject::eventFilter(watched, event);

    switch (event->type()) {
        case QEvent::DragEnter:
        case QEvent::DragMove:
            handleDragEnter(static_cast<QDragMoveEvent*>(event));
            return true;
        case QEvent::Drop:
            handleDrop(static_cast<QDropEvent*>(event));
            return true;
        default:
            break;
    }
    return QObject::eventFilter(watched, event);
}

void DragDropManager::handleDragEnter(QDragMoveEvent* event) {
    bool accept = false;
    try {
        accept = DropPayload::hasFileList(event->mimeData());
    } catch (const std::exception& e) {
        LogManager::instance().addLog(QString("Error in drag enter handler: %1").arg(QString::fromLocal8Bit(e.what())), "ERROR");
    } catch (...) {
        LogManager::instance().addLog("Error in drag enter handler: unknown exception", "ERROR");
    }

    if (accept) {
        event->setDropAction(Qt::CopyAction);
        event->accept();
    } else {
        event->setDropAction(Qt::IgnoreAction);
        event->ignore();
    }
}

void DragDropManager::handleDrop(QDropEvent* event) {
    // The drag source stays blocked until this returns: never show UI or rethrow here.
    try {
        const std::optional<QStringList> paths = DropPayload::fileList(event->mimeData(), m_settings.nativeSeparators);
        if (!paths) {
            event->ignore();
            return;
        }

        DropFileTarget* target = m_target;
        const QStringList files = *paths;
        const bool queued = QMetaObject::invokeMethod(m_host.data(), [target, files]() {
            target->openFiles(files);
        }, Qt::QueuedConnection);
        if (!queued) {
            LogManager::instance().addLog("Error in drop handler: could not queue openFiles on the host window", "ERROR");
            event->ignore();
            return;
        }

        event->setDropAction(Qt::CopyAction);
        event->accept();

        // The file browser window may be covering ours.
        if (m_settings.activateOnDrop) {
            QWidget* top = m_host->window();
            top->raise();
            top->activateWindow();
        }
    } catch (const std::exception& e) {
        LogManager::instance().addLog(QString("Error in drop handler: %1").arg(QString::fromLocal8Bit(e.what())), "ERROR");
        event->ignore();
    } catch (...) {
        LogManager::instance().addLog("Error in drop handler: unknown exception", "ERROR");
        event->ignore();
    }
}
