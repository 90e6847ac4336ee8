#pragma once
#include <QString>
#include <optional>

// Secure storage for the passphrase, keyed by account ("user@server").
// Backends: Keychain (macOS), Secret Service via libsecret (Linux), or an
// opt-in insecure QSettings fallback for platforms without either.
class SecretStore {
public:
    enum class PersistStatus { Stored, Unavailable, PermissionDenied, BackendError };

    struct PersistResult {
        PersistStatus status = PersistStatus::Stored;
        QString detail;
        bool ok() const { return status == PersistStatus::Stored; }
    };

    // value vacío = no hay secreto guardado; status refleja errores del backend.
    struct LookupResult {
        std::optional<QString> value;
        PersistResult status;
    };

    PersistResult setSecret(const QString& account, const QString& value);
    LookupResult getSecret(const QString& account) const;
    PersistResult removeSecret(const QString& account);

    // true only when secrets end up in plain QSettings.
    static bool insecureFallbackActive();
    static QString backendName();
};
