#include "SettingsStore.hpp"
#include "Logging.hpp"
#include "scpnator/IdentityResolver.hpp"
#include <QDir>
#include <QStandardPaths>

SettingsStore::SettingsStore(SecretStore* secrets, QObject* parent)
    : QObject(parent), secrets_(secrets), settings_("SCPNator", "SCPNator") {
    serverAddress_ = settings_.value("settings/serverAddress").toString();
    username_ = settings_.value("settings/username").toString();
    baseDirectory_ = settings_.value("settings/baseDirectory", "~").toString();
    identityKeyPath_ = settings_.value("settings/identityKeyPath").toString();
    identityKeyBookmark_ = settings_.value("settings/identityKeyBookmark").toString();
    lastLocalPath_ = settings_.value("settings/lastLocalPath", defaultLocalRoot()).toString();
    lastRemotePath_ = settings_.value("settings/lastRemotePath", "~").toString();
    localAccessBookmark_ = settings_.value("settings/localAccessBookmark").toString();
    reloadPassphrase();
}

QString SettingsStore::defaultLocalRoot() {
    const QString downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    return downloads.isEmpty() ? QDir::homePath() + "/Downloads" : downloads;
}

void SettingsStore::store(const char* key, const QString& value) {
    settings_.setValue(key, value);
    settings_.sync();
    if (settings_.status() != QSettings::NoError)
        qWarning(scSettings) << "Could not persist" << key;
}

void SettingsStore::reloadPassphrase() {
    passphrase_.clear();
    if (!secrets_ || serverAddress_.isEmpty() || username_.isEmpty())
        return;
    const auto found = secrets_->getSecret(accountKey());
    if (!found.status.ok()) {
        // Se degrada a passphrase vacía.
        qWarning(scSettings) << "Credential store lookup failed:" << found.status.detail;
        emit credentialStoreFailed(found.status.detail);
        return;
    }
    passphrase_ = found.value.value_or(QString());
}

void SettingsStore::setServerAddress(const QString& v) {
    if (v == serverAddress_) return;
    serverAddress_ = v;
    store("settings/serverAddress", v);
    reloadPassphrase();
    emit changed();
}

void SettingsStore::setUsername(const QString& v) {
    if (v == username_) return;
    username_ = v;
    store("settings/username", v);
    reloadPassphrase();
    emit changed();
}

void SettingsStore::setBaseDirectory(const QString& v) {
    const QString dir = v.isEmpty() ? QStringLiteral("~") : v;
    if (dir == baseDirectory_) return;
    baseDirectory_ = dir;
    store("settings/baseDirectory", dir);
    emit changed();
}

void SettingsStore::setPassphrase(const QString& v) {
    passphrase_ = v;
    if (!secrets_ || serverAddress_.isEmpty() || username_.isEmpty()) {
        emit changed();
        return;
    }
    const auto r = v.isEmpty() ? secrets_->removeSecret(accountKey())
                               : secrets_->setSecret(accountKey(), v);
    if (!r.ok()) {
        qWarning(scSettings) << "Credential store write failed:" << r.detail;
        emit credentialStoreFailed(r.detail);
    }
    emit changed();
}

void SettingsStore::setLastLocalPath(const QString& v) {
    if (v == lastLocalPath_) return;
    lastLocalPath_ = v;
    store("settings/lastLocalPath", v);
    emit changed();
}

void SettingsStore::setLastRemotePath(const QString& v) {
    if (v == lastRemotePath_) return;
    lastRemotePath_ = v;
    store("settings/lastRemotePath", v);
    emit changed();
}

void SettingsStore::setLocalAccessBookmark(const QString& v) {
    localAccessBookmark_ = v;
    store("settings/localAccessBookmark", v);
    emit changed();
}

void SettingsStore::updateIdentityKey(const QString& path,
                                      scpnator::AccessGrantProvider& grants) {
    const std::string priv = scpnator::stripPublicKeySuffix(path.toStdString());
    identityKeyPath_ = QString::fromStdString(priv);
    identityKeyBookmark_ = QString::fromStdString(grants.save(priv));
    if (identityKeyBookmark_.isEmpty())
        qWarning(scSettings) << "Identity key grant could not be created; using the plain path";
    store("settings/identityKeyPath", identityKeyPath_);
    store("settings/identityKeyBookmark", identityKeyBookmark_);
    emit changed();
}

void SettingsStore::clearIdentityKey() {
    identityKeyPath_.clear();
    identityKeyBookmark_.clear();
    settings_.remove("settings/identityKeyPath");
    settings_.remove("settings/identityKeyBookmark");
    settings_.sync();
    emit changed();
}

scpnator::CredentialContext SettingsStore::credentialContext() const {
    scpnator::CredentialContext ctx;
    ctx.server_address = serverAddress_.trimmed().toStdString();
    ctx.username = username_.trimmed().toStdString();
    ctx.passphrase = passphrase_.toStdString();
    if (!identityKeyPath_.isEmpty())
        ctx.identity_key_path = identityKeyPath_.toStdString();
    if (!identityKeyBookmark_.isEmpty())
        ctx.identity_key_token = identityKeyBookmark_.toStdString();
    return ctx;
}
