#include <QApplication>
#include <QTimer>

#include <cstdlib>

#include <spdlog/spdlog.h>

#include "AutostartManager.h"
#include "CharacterWindow.h"
#include "Logging.h"
#include "PowerMonitor.h"
#include "SettingsManager.h"
#include "TimerEngine.h"
#include "TrayController.h"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setApplicationName("Praymodoro");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Praymodoro");

    // The overlay can be hidden from the tray; hiding it must not quit
    app.setQuitOnLastWindowClosed(false);

    initLogging();
    spdlog::info("Praymodoro {} starting", app.applicationVersion().toStdString());

    // ── Settings ──────────────────────────────────────────────────────────────
    SettingsManager settingsMgr;
    const AppSettings settings = settingsMgr.settings();

    // The autostart entry can be removed behind our back; the stored
    // preference wins.
    AutostartManager autostart;
    if (autostart.isEnabled() != settings.launchAtStartup
        && !autostart.setEnabled(settings.launchAtStartup)) {
        spdlog::warn("Could not sync autostart entry: {}", autostart.lastError().toStdString());
    }

    // ── Overlay, timer and tray ───────────────────────────────────────────────
    CharacterWindow window(settings);
    QObject::connect(&window, &CharacterWindow::positionChanged, [&settingsMgr](int x, int y) {
        if (!settingsMgr.savePosition(x, y))
            spdlog::error("Saving window position failed: {}",
                          settingsMgr.lastError().toStdString());
    });

    PowerMonitor powerMonitor;
    if (!powerMonitor.connectToSystem())
        spdlog::warn("Resume detection disabled: {}", powerMonitor.lastError().toStdString());

    TimerEngine timer;
    timer.setResumeSource(&powerMonitor);

    TrayController tray(&window, &settingsMgr, &autostart);

    QObject::connect(&timer, &TimerEngine::tick,          &window, &CharacterWindow::onTimerTick);
    QObject::connect(&timer, &TimerEngine::periodChanged, &window, &CharacterWindow::onPeriodChanged);
    QObject::connect(&timer, &TimerEngine::tick,          &tray,   &TrayController::onTimerTick);
    QObject::connect(&tray,  &TrayController::quitRequested, &app, &QCoreApplication::quit);

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&] {
        spdlog::info("Shutting down");
        timer.destroy();
        tray.hide();
    });

    // The first tick is computed synchronously here, so a broken timetable
    // surfaces before the event loop starts.
    try {
        timer.start();
    } catch (const ConfigurationFault& e) {
        spdlog::critical("Timetable is invalid: {}", e.what());
        return EXIT_FAILURE;
    }

    window.show();

    // QSystemTrayIcon::show() before the event loop runs can silently fail
    // to register with the notification area.
    QTimer::singleShot(0, &tray, &TrayController::show);

    return app.exec();
}
