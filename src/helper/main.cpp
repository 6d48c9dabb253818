// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "helperapp.h"
#include "../config/settings.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include <QCommandLineParser>
#include <QGuiApplication>
#include <KAboutData>
#include <KLocalizedString>
#include <signal.h>

using namespace DragSense;

void signalHandler(int /*signal*/)
{
    QCoreApplication::quit();
}

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);
    app.setQuitOnLastWindowClosed(false);

    KLocalizedString::setApplicationDomain("dragsensed");

    KAboutData aboutData(QString(HelperExecutableName), i18n("DragSense Sensor Helper"), QStringLiteral("1.0.0"),
                         i18n("Drop-target windows around the pointer for DragSense"), KAboutLicense::GPL_V3,
                         i18n("© 2026 fuddlesworth"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(QStringLiteral("x"), i18n("Logical X of the button press"));
    parser.addPositionalArgument(QStringLiteral("y"), i18n("Logical Y of the button press"));
    HelperProtocol::addLayoutOptions(&parser);
    parser.process(app);
    aboutData.processCommandLine(&parser);

    // Grace period and theming come from dragsenserc; the host passes the layout
    Settings settings;
    QString layoutError;
    const std::optional<GridLayout> layout = HelperProtocol::decodeLayout(parser, settings.gridLayout(), &layoutError);
    if (!layout) {
        HelperApp(GridLayout::defaultLayout()).reportError(ErrorCode::InvalidArgument, layoutError);
        return HelperApp::ExitArmFailed;
    }

    HelperApp helper(*layout);
    helper.setDropGraceMs(settings.dropGraceMs());
    helper.setThemeSensorWindows(settings.themeSensorWindows());

    const QStringList positional = parser.positionalArguments();
    bool xOk = false;
    bool yOk = false;
    const qreal x = positional.size() == 2 ? positional.at(0).toDouble(&xOk) : 0;
    const qreal y = positional.size() == 2 ? positional.at(1).toDouble(&yOk) : 0;
    if (!xOk || !yOk) {
        helper.reportError(ErrorCode::InvalidArgument, QStringLiteral("Expected <x> <y>, got %1").arg(positional.join(QLatin1Char(' '))));
        return HelperApp::ExitArmFailed;
    }

    // The host closing the pipe must not kill us mid-write
    signal(SIGPIPE, SIG_IGN);
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    if (!helper.start(QPointF(x, y))) {
        return HelperApp::ExitArmFailed;
    }

    return app.exec();
}
