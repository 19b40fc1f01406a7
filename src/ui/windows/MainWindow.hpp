#pragma once

#include "core/types/PingWidgetData.hpp"
#include "ui/widgets/UptimePingWidget.hpp"

#include <QAction>
#include <QLabel>
#include <QMainWindow>

namespace pingscope::ui {

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onRefresh();
    void onSettings();
    void onAbout();

    void onDataReady(const core::PingWidgetData& data);
    void updateStatusBar();

private:
    void setupUi();
    void setupMenuBar();
    void setupToolBar();
    void setupStatusBar();
    void setupConnections();

    void saveWindowState();

    UptimePingWidget* uptimeWidget_{nullptr};

    QAction* refreshAction_{nullptr};
    QAction* settingsAction_{nullptr};
    QAction* quitAction_{nullptr};

    QLabel* statusLabel_{nullptr};
    QLabel* endpointLabel_{nullptr};
};

} // namespace pingscope::ui
