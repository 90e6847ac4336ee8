// Connection settings: server, user, base folder, passphrase, identity key.
#pragma once
#include <QDialog>

class QLineEdit;
class PathGrantStore;
class SettingsStore;

class SettingsDialog : public QDialog {
    Q_OBJECT
public:
    SettingsDialog(SettingsStore* settings, PathGrantStore* grants, QWidget* parent = nullptr);

private slots:
    void accept() override; // guarda en SettingsStore
    void browseIdentityKey();
    void clearIdentityKey();

private:
    SettingsStore* settings_ = nullptr;  // no es propiedad
    PathGrantStore* grants_ = nullptr;   // no es propiedad
    QLineEdit* server_ = nullptr;
    QLineEdit* username_ = nullptr;
    QLineEdit* baseDir_ = nullptr;
    QLineEdit* passphrase_ = nullptr;
    QLineEdit* identityKey_ = nullptr;
    bool identityChanged_ = false;
    bool identityCleared_ = false;
};
