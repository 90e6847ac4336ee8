// SecretStore: Keychain (macOS), libsecret (Linux) or optional QSettings fallback.
#include "SecretStore.hpp"
#include "Logging.hpp"
#include <QByteArray>
#include <QSettings>
#include <QVariant>
#include <cstdlib>

#ifdef __APPLE__
#include <CoreFoundation/CoreFoundation.h>
#include <Security/Security.h>

namespace {

CFStringRef serviceName() {
    static CFStringRef s = CFSTR("SCPNator");
    return s;
}

// Libera el objeto CF al salir del ámbito.
template <typename T> struct CfHolder {
    T ref = nullptr;
    explicit CfHolder(T r) : ref(r) {}
    ~CfHolder() {
        if (ref) CFRelease(ref);
    }
    CfHolder(const CfHolder&) = delete;
    CfHolder& operator=(const CfHolder&) = delete;
};

CFStringRef cfAccount(const QString& account) {
    return CFStringCreateWithCharacters(kCFAllocatorDefault,
                                        reinterpret_cast<const UniChar*>(account.utf16()),
                                        account.size());
}

CFMutableDictionaryRef baseQuery(CFStringRef account) {
    CFMutableDictionaryRef q = CFDictionaryCreateMutable(
        kCFAllocatorDefault, 0, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks);
    CFDictionarySetValue(q, kSecClass, kSecClassGenericPassword);
    CFDictionarySetValue(q, kSecAttrService, serviceName());
    CFDictionarySetValue(q, kSecAttrAccount, account);
    return q;
}

SecretStore::PersistResult mapStatus(OSStatus st) {
    SecretStore::PersistResult r;
    if (st == errSecSuccess) return r;
    if (st == errSecNotAvailable)
        r.status = SecretStore::PersistStatus::Unavailable;
    else if (st == errSecAuthFailed || st == errSecInteractionNotAllowed || st == errSecUserCanceled)
        r.status = SecretStore::PersistStatus::PermissionDenied;
    else
        r.status = SecretStore::PersistStatus::BackendError;
    r.detail = QString("Keychain OSStatus=%1").arg(static_cast<int>(st));
    return r;
}

} // namespace

SecretStore::PersistResult SecretStore::setSecret(const QString& account, const QString& value) {
    if (account.isEmpty())
        return {PersistStatus::BackendError, QStringLiteral("Empty account")};
    CfHolder<CFStringRef> acc(cfAccount(account));
    const QByteArray bytes = value.toUtf8();
    CfHolder<CFDataRef> data(CFDataCreate(kCFAllocatorDefault,
                                          reinterpret_cast<const UInt8*>(bytes.constData()),
                                          bytes.size()));
    if (!acc.ref || !data.ref)
        return {PersistStatus::BackendError, QStringLiteral("Could not build Keychain item")};

    CfHolder<CFMutableDictionaryRef> query(baseQuery(acc.ref));
    CfHolder<CFMutableDictionaryRef> attrs(CFDictionaryCreateMutable(
        kCFAllocatorDefault, 0, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks));
    CFDictionarySetValue(attrs.ref, kSecValueData, data.ref);
    CFDictionarySetValue(attrs.ref, kSecAttrAccessible, kSecAttrAccessibleAfterFirstUnlock);

    OSStatus st = SecItemUpdate(query.ref, attrs.ref);
    if (st == errSecItemNotFound) {
        CFDictionarySetValue(query.ref, kSecValueData, data.ref);
        CFDictionarySetValue(query.ref, kSecAttrAccessible, kSecAttrAccessibleAfterFirstUnlock);
        st = SecItemAdd(query.ref, nullptr);
    }
    return mapStatus(st);
}

SecretStore::LookupResult SecretStore::getSecret(const QString& account) const {
    LookupResult out;
    CfHolder<CFStringRef> acc(cfAccount(account));
    CfHolder<CFMutableDictionaryRef> query(baseQuery(acc.ref));
    CFDictionarySetValue(query.ref, kSecReturnData, kCFBooleanTrue);
    CFDictionarySetValue(query.ref, kSecMatchLimit, kSecMatchLimitOne);

    CFTypeRef raw = nullptr;
    const OSStatus st = SecItemCopyMatching(query.ref, &raw);
    CfHolder<CFTypeRef> result(raw);
    if (st == errSecItemNotFound) return out;
    if (st != errSecSuccess) {
        out.status = mapStatus(st);
        return out;
    }
    if (result.ref && CFGetTypeID(result.ref) == CFDataGetTypeID()) {
        CFDataRef data = static_cast<CFDataRef>(result.ref);
        const QString s = QString::fromUtf8(reinterpret_cast<const char*>(CFDataGetBytePtr(data)),
                                            static_cast<int>(CFDataGetLength(data)));
        if (!s.isEmpty()) out.value = s;
    }
    return out;
}

SecretStore::PersistResult SecretStore::removeSecret(const QString& account) {
    CfHolder<CFStringRef> acc(cfAccount(account));
    CfHolder<CFMutableDictionaryRef> query(baseQuery(acc.ref));
    const OSStatus st = SecItemDelete(query.ref);
    if (st == errSecItemNotFound) return {};
    return mapStatus(st);
}

bool SecretStore::insecureFallbackActive() { return false; }
QString SecretStore::backendName() { return QStringLiteral("Keychain"); }

#elif defined(HAVE_LIBSECRET)

#include <libsecret/secret.h>

namespace {

const SecretSchema* scpnatorSchema() {
    static const SecretSchema schema = {
        "scpnator.secret", SECRET_SCHEMA_NONE,
        {
            {"account", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {NULL, SecretSchemaAttributeType(0)},
        }
    };
    return &schema;
}

QString takeError(GError* gerr, const char* fallback) {
    const QString detail = gerr ? QString::fromUtf8(gerr->message) : QString::fromUtf8(fallback);
    if (gerr) g_error_free(gerr);
    return detail;
}

} // namespace

SecretStore::PersistResult SecretStore::setSecret(const QString& account, const QString& value) {
    if (account.isEmpty())
        return {PersistStatus::BackendError, QStringLiteral("Empty account")};
    const QByteArray a = account.toUtf8();
    const QByteArray v = value.toUtf8();
    GError* gerr = nullptr;
    const gboolean ok = secret_password_store_sync(scpnatorSchema(), SECRET_COLLECTION_DEFAULT,
                                                   "SCPNator passphrase", v.constData(), nullptr,
                                                   &gerr, "account", a.constData(), nullptr);
    if (ok) return {};
    return {PersistStatus::BackendError, takeError(gerr, "libsecret store failed")};
}

SecretStore::LookupResult SecretStore::getSecret(const QString& account) const {
    LookupResult out;
    const QByteArray a = account.toUtf8();
    GError* gerr = nullptr;
    gchar* pw = secret_password_lookup_sync(scpnatorSchema(), nullptr, &gerr,
                                            "account", a.constData(), nullptr);
    if (gerr) {
        out.status = {PersistStatus::BackendError, takeError(gerr, "libsecret lookup failed")};
        return out;
    }
    if (!pw) return out;
    const QString s = QString::fromUtf8(pw);
    secret_password_free(pw);
    if (!s.isEmpty()) out.value = s;
    return out;
}

SecretStore::PersistResult SecretStore::removeSecret(const QString& account) {
    const QByteArray a = account.toUtf8();
    GError* gerr = nullptr;
    secret_password_clear_sync(scpnatorSchema(), nullptr, &gerr, "account", a.constData(), nullptr);
    if (gerr) return {PersistStatus::BackendError, takeError(gerr, "libsecret clear failed")};
    return {};
}

bool SecretStore::insecureFallbackActive() { return false; }
QString SecretStore::backendName() { return QStringLiteral("Secret Service"); }

#else // sin backend seguro: fallback opcional vía variable de entorno

namespace {

bool fallbackEnabled() {
#ifdef SCPNATOR_BUILD_SECURE_ONLY
    return false;
#else
    const char* v = std::getenv("SCPNATOR_ENABLE_INSECURE_FALLBACK");
    return v && *v == '1';
#endif
}

} // namespace

SecretStore::PersistResult SecretStore::setSecret(const QString& account, const QString& value) {
    if (account.isEmpty())
        return {PersistStatus::BackendError, QStringLiteral("Empty account")};
    if (!fallbackEnabled())
        return {PersistStatus::Unavailable, QStringLiteral("No secure credential store in this build")};
    QSettings s("SCPNator", "Secrets");
    s.setValue(account, value);
    s.sync();
    if (s.status() != QSettings::NoError)
        return {PersistStatus::BackendError, QStringLiteral("QSettings could not persist the secret")};
    qWarning(scSettings) << "Passphrase stored with the insecure QSettings fallback";
    return {};
}

SecretStore::LookupResult SecretStore::getSecret(const QString& account) const {
    LookupResult out;
    if (!fallbackEnabled()) {
        out.status = {PersistStatus::Unavailable, QStringLiteral("No secure credential store in this build")};
        return out;
    }
    QSettings s("SCPNator", "Secrets");
    const QVariant v = s.value(account);
    if (v.isValid() && !v.toString().isEmpty()) out.value = v.toString();
    return out;
}

SecretStore::PersistResult SecretStore::removeSecret(const QString& account) {
    if (!fallbackEnabled()) return {PersistStatus::Unavailable, QString()};
    QSettings s("SCPNator", "Secrets");
    s.remove(account);
    return {};
}

bool SecretStore::insecureFallbackActive() { return fallbackEnabled(); }
QString SecretStore::backendName() {
    return fallbackEnabled() ? QStringLiteral("QSettings (insecure)") : QStringLiteral("none");
}

#endif
