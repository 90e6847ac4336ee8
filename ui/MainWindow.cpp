#include "MainWindow.hpp"
#include "LocalModel.hpp"
#include "RemoteModel.hpp"
#include "SettingsDialog.hpp"
#include "SettingsStore.hpp"
#include "UiAlerts.hpp"
#include "scpnator/RuntimeLogging.hpp"
#include <QAction>
#include <QFileDialog>
#include <QHeaderView>
#include <QKeySequence>
#include <QLabel>
#include <QListView>
#include <QPlainTextEdit>
#include <QSplitter>
#include <QStatusBar>
#include <QTableWidget>
#include <QToolBar>
#include <QVBoxLayout>

namespace {

// Líneas de diagnóstico conservadas en el panel.
constexpr int kMaxDiagnosticBlocks = 5000;

QString stateLabel(scpnator::TransferState s) {
    switch (s) {
    case scpnator::TransferState::Pending: return QObject::tr("Pending");
    case scpnator::TransferState::Running: return QObject::tr("Running");
    case scpnator::TransferState::Succeeded: return QObject::tr("Done");
    case scpnator::TransferState::Failed: return QObject::tr("Failed");
    }
    return {};
}

QListView* makePaneView(QWidget* parent) {
    auto* v = new QListView(parent);
    v->setSelectionMode(QAbstractItemView::ExtendedSelection);
    v->setDragEnabled(true);
    v->setAcceptDrops(true);
    v->setDropIndicatorShown(true);
    v->setDragDropMode(QAbstractItemView::DragDrop);
    v->setDefaultDropAction(Qt::CopyAction);
    v->setEditTriggers(QAbstractItemView::NoEditTriggers);
    return v;
}

} // namespace

MainWindow::MainWindow(SettingsStore* settings, QWidget* parent)
    : QMainWindow(parent), settings_(settings) {
    setWindowTitle(QStringLiteral("SCPNator"));
    controller_ = new BrowserController(settings_, this);
    controller_->setOverwritePrompt([this](const QStringList& names) {
        return UiAlerts::confirmOverwrite(this, names);
    });

    localModel_ = new LocalModel(this);
    remoteModel_ = new RemoteModel(this);
    localView_ = makePaneView(this);
    remoteView_ = makePaneView(this);
    localView_->setModel(localModel_);
    remoteView_->setModel(remoteModel_);

    localPathLabel_ = new QLabel(this);
    remotePathLabel_ = new QLabel(this);
    localPathLabel_->setTextInteractionFlags(Qt::TextSelectableByMouse);
    remotePathLabel_->setTextInteractionFlags(Qt::TextSelectableByMouse);

    auto pane = [this](QLabel* label, QListView* view) {
        auto* w = new QWidget(this);
        auto* l = new QVBoxLayout(w);
        l->setContentsMargins(0, 0, 0, 0);
        l->addWidget(label);
        l->addWidget(view);
        return w;
    };
    auto* panes = new QSplitter(Qt::Horizontal, this);
    panes->addWidget(pane(localPathLabel_, localView_));
    panes->addWidget(pane(remotePathLabel_, remoteView_));

    transfers_ = new QTableWidget(0, 3, this);
    transfers_->setHorizontalHeaderLabels({tr("Name"), tr("State"), tr("Message")});
    transfers_->horizontalHeader()->setStretchLastSection(true);
    transfers_->verticalHeader()->setVisible(false);
    transfers_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    diagnostics_ = new QPlainTextEdit(this);
    diagnostics_->setReadOnly(true);
    diagnostics_->setMaximumBlockCount(kMaxDiagnosticBlocks);

    auto* bottom = new QSplitter(Qt::Horizontal, this);
    bottom->addWidget(transfers_);
    bottom->addWidget(diagnostics_);

    auto* vertical = new QSplitter(Qt::Vertical, this);
    vertical->addWidget(panes);
    vertical->addWidget(bottom);
    vertical->setStretchFactor(0, 3);
    vertical->setStretchFactor(1, 1);
    setCentralWidget(vertical);

    auto* tb = addToolBar(tr("Main"));
    tb->addAction(tr("Settings"), this, &MainWindow::openSettings);
    tb->addAction(tr("Local folder..."), this, &MainWindow::chooseLocalRoot);
    tb->addSeparator();
    tb->addAction(tr("Local up"), controller_, &BrowserController::goLocalUp);
    tb->addAction(tr("Remote up"), controller_, &BrowserController::goRemoteUp);
    tb->addAction(tr("Remote home"), controller_, &BrowserController::goRemoteHome);
    actRefresh_ = tb->addAction(tr("Refresh"), controller_, [this] {
        controller_->refreshLocal();
        controller_->refreshRemote();
    });
    actRefresh_->setShortcut(QKeySequence::Refresh);
    tb->addSeparator();
    actTransfer_ = tb->addAction(tr("Transfer"), this, &MainWindow::transferSelected);
    actTransfer_->setShortcut(QKeySequence(Qt::Key_F5));
    actCancel_ = tb->addAction(tr("Cancel"), controller_, &BrowserController::cancelTransfers);

    connect(remoteView_, &QListView::activated, this, &MainWindow::remoteActivated);
    connect(localView_, &QListView::activated, this, &MainWindow::localActivated);
    connect(remoteModel_, &RemoteModel::localPathsDropped, controller_,
            &BrowserController::dropLocalOnRemote);
    connect(localModel_, &LocalModel::remoteItemsDropped, controller_,
            &BrowserController::dropRemoteOnLocal);

    connect(controller_, &BrowserController::remoteListingChanged, this,
            [this](const std::vector<scpnator::RemoteEntry>& entries) {
                remoteModel_->setEntries(entries);
                remoteView_->clearSelection();
            });
    connect(controller_, &BrowserController::remoteListingFailed, this,
            [this](const QString& msg) { statusBar()->showMessage(msg, 8000); });
    connect(controller_, &BrowserController::remotePathChanged, remotePathLabel_,
            [this](const QString& p) { remotePathLabel_->setText(tr("Remote: %1").arg(p)); });
    connect(controller_, &BrowserController::remoteBusyChanged, this, [this](bool busy) {
        if (busy) statusBar()->showMessage(tr("Listing..."));
        else if (statusBar()->currentMessage() == tr("Listing...")) statusBar()->clearMessage();
    });
    connect(controller_, &BrowserController::localListingChanged, this,
            [this](const std::vector<scpnator::LocalEntry>& entries) {
                localModel_->setEntries(entries);
            });
    connect(controller_, &BrowserController::localListingFailed, this,
            [this](const QString& msg) { statusBar()->showMessage(msg, 8000); });
    connect(controller_, &BrowserController::localPathChanged, localPathLabel_,
            [this](const QString& p) { localPathLabel_->setText(tr("Local: %1").arg(p)); });
    connect(controller_, &BrowserController::transferBusyChanged, this, &MainWindow::updateActions);
    connect(controller_, &BrowserController::batchStarted, this, &MainWindow::showBatch);
    connect(controller_, &BrowserController::transferItemChanged, this, &MainWindow::updateRow);
    connect(controller_, &BrowserController::transferDiagnostic, this, &MainWindow::appendDiagnostic);
    connect(controller_, &BrowserController::batchFinished, this, &MainWindow::batchDone);
    connect(controller_, &BrowserController::statusMessage, this,
            [this](const QString& text, int ms) { statusBar()->showMessage(text, ms); });
    connect(settings_, &SettingsStore::credentialStoreFailed, this, [this](const QString& detail) {
        statusBar()->showMessage(tr("Credential store unavailable: %1").arg(detail), 8000);
    });

    localPathLabel_->setText(tr("Local: %1").arg(controller_->localPath()));
    if (controller_->usingMockRemote())
        statusBar()->showMessage(tr("Mock remote (development mode)"), 5000);
    updateActions();
    resize(1100, 720);
    controller_->start();
}

void MainWindow::updateActions() {
    const bool busy = controller_->transferBusy();
    actTransfer_->setEnabled(!busy);
    actCancel_->setEnabled(busy);
}

void MainWindow::openSettings() {
    SettingsDialog dlg(settings_, &grants_, this);
    if (dlg.exec() == QDialog::Accepted)
        controller_->goRemoteHome();
}

void MainWindow::chooseLocalRoot() {
    const QString pick = QFileDialog::getExistingDirectory(this, tr("Choose local folder"),
                                                           controller_->localRoot());
    if (!pick.isEmpty())
        controller_->setLocalRoot(pick);
}

void MainWindow::transferSelected() {
    controller_->transferSelection(
        remoteModel_->entriesAt(remoteView_->selectionModel()->selectedIndexes()));
}

void MainWindow::remoteActivated(const QModelIndex& idx) {
    if (const auto* e = remoteModel_->entryAt(idx)) {
        const scpnator::RemoteEntry entry = *e; // el modelo se reinicia al navegar
        controller_->openRemote(entry);
    }
}

void MainWindow::localActivated(const QModelIndex& idx) {
    if (const auto* e = localModel_->entryAt(idx)) {
        const scpnator::LocalEntry entry = *e;
        controller_->openLocal(entry);
    }
}

void MainWindow::showBatch(const QVector<TransferRow>& rows) {
    // Cada lote reemplaza la lista anterior.
    transfers_->setRowCount(0);
    rowById_.clear();
    diagnostics_->clear();
    for (const auto& r : rows) {
        const int row = transfers_->rowCount();
        transfers_->insertRow(row);
        transfers_->setItem(row, 0, new QTableWidgetItem(r.name));
        transfers_->setItem(row, 1, new QTableWidgetItem(stateLabel(r.state)));
        transfers_->setItem(row, 2, new QTableWidgetItem(r.message));
        rowById_.insert(r.id, row);
    }
}

void MainWindow::updateRow(const TransferRow& r) {
    const auto it = rowById_.constFind(r.id);
    if (it == rowById_.constEnd()) return;
    transfers_->item(*it, 1)->setText(stateLabel(r.state));
    transfers_->item(*it, 2)->setText(r.message.trimmed());
    transfers_->item(*it, 2)->setToolTip(r.message);
}

void MainWindow::appendDiagnostic(quint64 itemId, const QString& text) {
    // Con -vvv el volumen es alto; sin registro sensible sólo líneas no-debug.
    const bool verbose = scpnator::sensitiveLoggingEnabled();
    const auto lines = text.split('\n', Qt::SkipEmptyParts);
    for (const auto& line : lines) {
        if (!verbose && line.startsWith(QLatin1String("debug"))) continue;
        diagnostics_->appendPlainText(QStringLiteral("[%1] %2").arg(itemId).arg(line));
    }
}

void MainWindow::batchDone(int succeeded, int failed) {
    statusBar()->showMessage(
        tr("Transfer finished: %1 succeeded, %2 failed").arg(succeeded).arg(failed), 6000);
}
