#pragma once
#include "SecretStore.hpp"
#include "scpnator/AccessGrant.hpp"
#include "scpnator/RemoteTypes.hpp"
#include <QObject>
#include <QSettings>
#include <QString>

// Persistent user settings. Every setter writes through to QSettings (or to
// the SecretStore for the passphrase) and emits changed().
class SettingsStore : public QObject {
    Q_OBJECT
public:
    explicit SettingsStore(SecretStore* secrets, QObject* parent = nullptr);

    QString serverAddress() const { return serverAddress_; }
    QString username() const { return username_; }
    QString baseDirectory() const { return baseDirectory_; }
    QString passphrase() const { return passphrase_; }
    QString identityKeyPath() const { return identityKeyPath_; }
    QString identityKeyBookmark() const { return identityKeyBookmark_; }
    QString lastLocalPath() const { return lastLocalPath_; }
    QString lastRemotePath() const { return lastRemotePath_; }
    QString localAccessBookmark() const { return localAccessBookmark_; }

    void setServerAddress(const QString& v);
    void setUsername(const QString& v);
    void setBaseDirectory(const QString& v);
    void setPassphrase(const QString& v);
    void setLastLocalPath(const QString& v);
    void setLastRemotePath(const QString& v);
    void setLocalAccessBookmark(const QString& v);

    // A ".pub" selection maps to the private key; stores path and grant.
    void updateIdentityKey(const QString& path, scpnator::AccessGrantProvider& grants);
    void clearIdentityKey();

    QString accountKey() const { return username_ + "@" + serverAddress_; }
    scpnator::CredentialContext credentialContext() const;

    static QString defaultLocalRoot();

signals:
    void changed();
    // Error del almacén seguro (no fatal).
    void credentialStoreFailed(const QString& detail);

private:
    void store(const char* key, const QString& value);
    void reloadPassphrase();

    SecretStore* secrets_ = nullptr; // no es propiedad
    QSettings settings_;

    QString serverAddress_;
    QString username_;
    QString baseDirectory_;
    QString passphrase_;
    QString identityKeyPath_;
    QString identityKeyBookmark_;
    QString lastLocalPath_;
    QString lastRemotePath_;
    QString localAccessBookmark_;
};
