#include "SettingsDialog.hpp"
#include "PathGrantStore.hpp"
#include "SecretStore.hpp"
#include "SettingsStore.hpp"
#include "UiAlerts.hpp"
#include <QDialogButtonBox>
#include <QDir>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

SettingsDialog::SettingsDialog(SettingsStore* settings, PathGrantStore* grants, QWidget* parent)
    : QDialog(parent), settings_(settings), grants_(grants) {
    setWindowTitle(tr("Settings"));

    auto* form = new QFormLayout();
    form->setFieldGrowthPolicy(QFormLayout::AllNonFixedFieldsGrow);

    server_ = new QLineEdit(settings_->serverAddress(), this);
    server_->setPlaceholderText(tr("host.example.com"));
    username_ = new QLineEdit(settings_->username(), this);
    baseDir_ = new QLineEdit(settings_->baseDirectory(), this);
    baseDir_->setPlaceholderText(QStringLiteral("~"));
    passphrase_ = new QLineEdit(settings_->passphrase(), this);
    passphrase_->setEchoMode(QLineEdit::Password);

    identityKey_ = new QLineEdit(settings_->identityKeyPath(), this);
    identityKey_->setReadOnly(true);
    identityKey_->setPlaceholderText(tr("ssh-agent / ~/.ssh/id_rsa, id_ed25519"));
    auto* browse = new QPushButton(tr("Choose..."), this);
    auto* clear = new QPushButton(tr("Clear"), this);
    connect(browse, &QPushButton::clicked, this, &SettingsDialog::browseIdentityKey);
    connect(clear, &QPushButton::clicked, this, &SettingsDialog::clearIdentityKey);
    auto* keyRow = new QHBoxLayout();
    keyRow->addWidget(identityKey_, 1);
    keyRow->addWidget(browse);
    keyRow->addWidget(clear);

    form->addRow(tr("Server"), server_);
    form->addRow(tr("Username"), username_);
    form->addRow(tr("Base folder"), baseDir_);
    form->addRow(tr("Key passphrase"), passphrase_);
    form->addRow(tr("Identity key"), keyRow);

    auto* root = new QVBoxLayout(this);
    root->addLayout(form);
    if (SecretStore::insecureFallbackActive()) {
        auto* warn = new QLabel(tr("Warning: the passphrase is stored without encryption."), this);
        warn->setWordWrap(true);
        root->addWidget(warn);
    }
    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttons, &QDialogButtonBox::accepted, this, &SettingsDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &SettingsDialog::reject);
    root->addWidget(buttons);
}

void SettingsDialog::browseIdentityKey() {
    const QString start = identityKey_->text().isEmpty() ? QDir::homePath() + "/.ssh"
                                                         : identityKey_->text();
    const QString pick = QFileDialog::getOpenFileName(this, tr("Choose identity key"), start);
    if (pick.isEmpty()) return;
    identityKey_->setText(pick);
    identityChanged_ = true;
    identityCleared_ = false;
}

void SettingsDialog::clearIdentityKey() {
    identityKey_->clear();
    identityCleared_ = true;
    identityChanged_ = false;
}

void SettingsDialog::accept() {
    const QString server = server_->text().trimmed();
    const QString user = username_->text().trimmed();
    if (server.isEmpty() != user.isEmpty()) {
        UiAlerts::warning(this, tr("Settings"), tr("Server and username go together."));
        return;
    }
    settings_->setServerAddress(server);
    settings_->setUsername(user);
    settings_->setBaseDirectory(baseDir_->text().trimmed());
    // Tras fijar usuario/servidor para que la cuenta sea la correcta.
    if (passphrase_->text() != settings_->passphrase())
        settings_->setPassphrase(passphrase_->text());
    if (identityCleared_)
        settings_->clearIdentityKey();
    else if (identityChanged_ && grants_)
        settings_->updateIdentityKey(identityKey_->text(), *grants_);
    QDialog::accept();
}
