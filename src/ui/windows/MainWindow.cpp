#include "ui/windows/MainWindow.hpp"

#include "app/Application.hpp"
#include "ui/windows/SettingsDialog.hpp"

#include <QCloseEvent>
#include <QMenuBar>
#include <QMessageBox>
#include <QStatusBar>
#include <QToolBar>

#include <spdlog/spdlog.h>

namespace pingscope::ui {

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
    setWindowTitle("PingScope - Uptime Monitor");
    setMinimumSize(360, 240);

    setupUi();
    setupMenuBar();
    setupToolBar();
    setupStatusBar();
    setupConnections();

    updateStatusBar();
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi() {
    auto& app = app::Application::instance();
    const auto& config = app.config().config();

    uptimeWidget_ = new UptimePingWidget(&app.widgetViewModel(), &app.detailViewModel(), this);
    uptimeWidget_->setTimeZone(config.timeDisplay);
    uptimeWidget_->setCompactThreshold(config.compactCardThreshold);
    setCentralWidget(uptimeWidget_);
}

void MainWindow::setupMenuBar() {
    auto* fileMenu = menuBar()->addMenu("&File");

    refreshAction_ = fileMenu->addAction("&Refresh", this, &MainWindow::onRefresh);
    refreshAction_->setShortcut(QKeySequence::Refresh);

    fileMenu->addSeparator();

    quitAction_ = fileMenu->addAction("&Quit", this, &QMainWindow::close);
    quitAction_->setShortcut(QKeySequence::Quit);

    auto* toolsMenu = menuBar()->addMenu("&Tools");

    settingsAction_ = toolsMenu->addAction("&Settings...", this, &MainWindow::onSettings);
    settingsAction_->setShortcut(QKeySequence::Preferences);

    auto* helpMenu = menuBar()->addMenu("&Help");
    helpMenu->addAction("&About PingScope", this, &MainWindow::onAbout);
}

void MainWindow::setupToolBar() {
    auto* toolBar = addToolBar("Main");
    toolBar->setMovable(false);

    toolBar->addAction(refreshAction_);
    toolBar->addSeparator();
    toolBar->addAction(settingsAction_);
}

void MainWindow::setupStatusBar() {
    statusLabel_ = new QLabel("Ready", this);
    endpointLabel_ = new QLabel(this);

    statusBar()->addWidget(statusLabel_, 1);
    statusBar()->addPermanentWidget(endpointLabel_);
}

void MainWindow::setupConnections() {
    auto& vm = app::Application::instance().widgetViewModel();

    connect(&vm, &viewmodels::PingWidgetViewModel::stateChanged, this,
            &MainWindow::updateStatusBar);
    connect(uptimeWidget_, &UptimePingWidget::dataReady, this, &MainWindow::onDataReady);
    connect(uptimeWidget_, &UptimePingWidget::zoomOpened, this, [this](const QString& address) {
        statusLabel_->setText(QString("Viewing %1").arg(address));
    });
    connect(uptimeWidget_, &UptimePingWidget::zoomClosed, this, &MainWindow::updateStatusBar);
}

void MainWindow::onRefresh() {
    app::Application::instance().widgetViewModel().refresh();
}

void MainWindow::onSettings() {
    SettingsDialog dialog(this);
    if (dialog.exec() == QDialog::Accepted) {
        auto& app = app::Application::instance();
        const auto& config = app.config().config();
        uptimeWidget_->setTimeZone(config.timeDisplay);
        uptimeWidget_->setCompactThreshold(config.compactCardThreshold);
        app.widgetViewModel().refresh();
    }
}

void MainWindow::onAbout() {
    QMessageBox::about(this, "About PingScope",
                       "<h2>PingScope</h2>"
                       "<p>Version 1.0.0</p>"
                       "<p>SmokePing-style latency and uptime graphs for dashboard ping widgets.</p>");
}

void MainWindow::onDataReady(const core::PingWidgetData& data) {
    spdlog::debug("Widget snapshot with {} targets received", data.targets.size());
    updateStatusBar();
}

void MainWindow::updateStatusBar() {
    const auto& vm = app::Application::instance().widgetViewModel();

    statusLabel_->setText(
        QString("State: %1").arg(QString::fromStdString(viewmodels::widgetStateToString(vm.state()))));

    if (vm.usingFallback()) {
        endpointLabel_->setText("<span style='color:orange'>Current status only</span>");
    } else if (vm.data()) {
        endpointLabel_->setText(QString("Widget %1").arg(vm.widgetId()));
    } else {
        endpointLabel_->setText("--");
    }
}

void MainWindow::closeEvent(QCloseEvent* event) {
    saveWindowState();
    event->accept();
}

void MainWindow::saveWindowState() {
    auto& config = app::Application::instance().config().config();

    if (!isMaximized()) {
        auto geom = geometry();
        config.windowX = geom.x();
        config.windowY = geom.y();
        config.windowWidth = geom.width();
        config.windowHeight = geom.height();
    }
    config.windowMaximized = isMaximized();

    if (!app::Application::instance().config().save()) {
        spdlog::warn("Failed to save window state");
    }
}

} // namespace pingscope::ui
