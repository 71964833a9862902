#include "mainwindow.h"
#include "log_manager.h"

#include <QDir>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QSettings>
#include <QSplitter>
#include <QVBoxLayout>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    setObjectName("MainWindow");
    setWindowTitle("DropFiles");
    resize(720, 480);

    QSettings s("DropFiles", "DropFiles");
    m_confirmOnOpen = s.value("Demo/ConfirmOnOpen", false).toBool();

    setupUi();

    // Backfill entries logged before the pane existed
    for (const QString &entry : LogManager::instance().logs()) logView->appendPlainText(entry);
    connect(&LogManager::instance(), &LogManager::logAdded, this, &MainWindow::onLogAdded);

    m_dragDropManager.attach(this);
    updateStatus();
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi()
{
    QWidget *central = new QWidget(this);
    QVBoxLayout *mainLayout = new QVBoxLayout(central);
    mainLayout->setContentsMargins(8, 8, 8, 8);
    mainLayout->setSpacing(6);

    QHBoxLayout *header = new QHBoxLayout();
    statusLabel = new QLabel(central);
    header->addWidget(statusLabel);
    header->addStretch();
    QPushButton *clearButton = new QPushButton("Clear", central);
    connect(clearButton, &QPushButton::clicked, this, &MainWindow::onClearFiles);
    header->addWidget(clearButton);
    mainLayout->addLayout(header);

    QSplitter *splitter = new QSplitter(Qt::Vertical, central);
    fileList = new QListWidget(splitter);
    fileList->setSelectionMode(QAbstractItemView::ExtendedSelection);
    // Child widgets must not claim the drop before the window sees it
    fileList->setAcceptDrops(false);
    logView = new QPlainTextEdit(splitter);
    logView->setReadOnly(true);
    logView->setAcceptDrops(false);
    logView->setMaximumBlockCount(LogManager::MAX_LOGS);
    logView->setStyleSheet("QPlainTextEdit { background-color: #1a1a1a; color: #cccccc; font-family: monospace; font-size: 11px; }");
    splitter->addWidget(fileList);
    splitter->addWidget(logView);
    splitter->setStretchFactor(0, 3);
    splitter->setStretchFactor(1, 1);
    mainLayout->addWidget(splitter, 1);

    setCentralWidget(central);
}

void MainWindow::openFiles(const QStringList &paths)
{
    for (const QString &path : paths) {
        m_openedFiles << path;
        fileList->addItem(path);
        LogManager::instance().addLog("[MainWindow] Opened " + path);
    }
    updateStatus();

    if (m_confirmOnOpen) {
        QMessageBox::information(this, "Files dropped",
                                 QString("%1 file(s) received:\n%2").arg(paths.size()).arg(paths.join('\n')));
    }
}

void MainWindow::onLogAdded(const QString &entry)
{
    logView->appendPlainText(entry);
}

void MainWindow::onClearFiles()
{
    m_openedFiles.clear();
    fileList->clear();
    updateStatus();
}

void MainWindow::updateStatus()
{
    if (m_openedFiles.isEmpty())
        statusLabel->setText("Drop files here from your file manager");
    else
        statusLabel->setText(QString("%1 file(s) opened").arg(m_openedFiles.size()));
}
