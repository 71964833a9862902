#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QStringList>

#include "drag_drop_manager.h"
#include "drop_file_target.h"

class QLabel;
class QListWidget;
class QPlainTextEdit;

class MainWindow : public QMainWindow, public DropFileTarget
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    void openFiles(const QStringList &paths) override;

    QStringList openedFiles() const { return m_openedFiles; }

private slots:
    void onLogAdded(const QString &entry);
    void onClearFiles();

private:
    void setupUi();
    void updateStatus();

    DragDropManager m_dragDropManager;
    QStringList m_openedFiles;
    bool m_confirmOnOpen = false;

    QListWidget *fileList = nullptr;
    QPlainTextEdit *logView = nullptr;
    QLabel *statusLabel = nullptr;
};

#endif // MAINWINDOW_H
