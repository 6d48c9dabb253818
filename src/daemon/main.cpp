// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include "../core/logging.h"
#include <QCommandLineParser>
#include <QGuiApplication>
#include <KAboutData>
#include <KDBusService>
#include <KLocalizedString>
#include <signal.h>

using namespace DragSense;

namespace {

void quitOnSignal(int /*signal*/)
{
    // Daemon::stop() runs once exec() returns
    QCoreApplication::quit();
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);

    // In-process sensor windows close after every drag
    app.setQuitOnLastWindowClosed(false);

    KLocalizedString::setApplicationDomain("dragsensed");

    KAboutData aboutData(QStringLiteral("dragsensed"), i18n("DragSense Daemon"), QStringLiteral("1.0.0"),
                         i18n("Reports files dragged anywhere on the desktop"), KAboutLicense::GPL_V3,
                         i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setDesktopFileName(QStringLiteral("org.dragsense.daemon"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    const QCommandLineOption replaceOption(QStringList{QStringLiteral("r"), QStringLiteral("replace")},
                                           i18n("Replace a running dragsensed"));
    const QCommandLineOption helperOption(QStringLiteral("helper"),
                                          i18n("Sensor helper executable, overriding dragsenserc"), i18n("path"));
    const QCommandLineOption pointerOption(QStringLiteral("pointer"), i18n("Start pointer monitoring"));
    const QCommandLineOption noDragOption(QStringLiteral("no-drag"), i18n("Do not start drag monitoring"));
    const QCommandLineOption keyboardOption(QStringLiteral("keyboard"), i18n("Start keyboard monitoring"));
    parser.addOptions({replaceOption, helperOption, pointerOption, keyboardOption, noDragOption});

    parser.process(app);
    aboutData.processCommandLine(&parser);

    KDBusService::StartupOptions startup = KDBusService::Unique;
    if (parser.isSet(replaceOption)) {
        startup |= KDBusService::Replace;
    }
    KDBusService service(startup);
    QObject::connect(&service, &KDBusService::activateRequested, &app, []() {
        qCDebug(lcDaemon) << "Second instance started, nothing to do";
    });

    Daemon::Overrides overrides;
    overrides.helperPath = parser.value(helperOption);
    if (parser.isSet(pointerOption)) {
        overrides.startPointer = true;
    }
    if (parser.isSet(keyboardOption)) {
        overrides.startKeyboard = true;
    }
    if (parser.isSet(noDragOption)) {
        overrides.startDrag = false;
    }

    Daemon daemon(overrides);
    if (!daemon.init()) {
        qCCritical(lcDaemon) << "Initialization failed, exiting";
        return 1;
    }

    signal(SIGINT, quitOnSignal);
    signal(SIGTERM, quitOnSignal);
    signal(SIGHUP, quitOnSignal);

    daemon.start();
    qCInfo(lcDaemon) << "Running";

    const int result = app.exec();
    daemon.stop();
    return result;
}
