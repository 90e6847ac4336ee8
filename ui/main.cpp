#include "MainWindow.hpp"
#include "SecretStore.hpp"
#include "SettingsStore.hpp"
#include <QApplication>

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QApplication::setOrganizationName(QStringLiteral("SCPNator"));
    QApplication::setApplicationName(QStringLiteral("SCPNator"));

    SecretStore secrets;
    SettingsStore settings(&secrets);
    MainWindow w(&settings);
    w.show();
    return app.exec();
}
