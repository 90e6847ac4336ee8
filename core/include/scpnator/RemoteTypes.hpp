// Tipos básicos compartidos entre UI y core: entradas remotas/locales,
// contexto de credenciales y resultado de cada subproceso ssh/scp.
// Mantener estas estructuras simples y copiables facilita su uso en UI.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace scpnator {

enum class RemoteEntryKind { File, Directory, Symlink, Other };

// Entrada de un listado remoto. La identidad es el nombre dentro del listado.
struct RemoteEntry {
    std::string     id;             // == name
    std::string     name;
    RemoteEntryKind kind = RemoteEntryKind::File;
    std::string     relative_path;  // ruta remota tal como se construyó al listar

    bool isDirectory() const { return kind == RemoteEntryKind::Directory; }
};

inline RemoteEntry makeRemoteEntry(const std::string &name, RemoteEntryKind kind,
                                   const std::string &relativePath = {}) {
    RemoteEntry e;
    e.id = name;
    e.name = name;
    e.kind = kind;
    e.relative_path = relativePath;
    return e;
}

// Snapshot of one local directory entry; identity is the absolute path.
struct LocalEntry {
    std::string   id;             // == absolute_path
    std::string   absolute_path;
    std::string   name;
    bool          is_dir = false;
    std::int64_t  mtime  = 0;     // epoch (segundos)
};

// Identity/credential context handed to every remote operation.
struct CredentialContext {
    std::string server_address;
    std::string username;
    std::string passphrase;                          // nunca se loguea
    std::optional<std::string> identity_key_path;
    std::optional<std::string> identity_key_token;   // grant/bookmark opaco

    std::string accountKey() const { return username + "@" + server_address; }
    std::string target() const { return username + "@" + server_address; }
};

// Resultado de una invocación de subproceso. Se produce una vez y no cambia.
struct SessionResult {
    std::int32_t exit_code = 0;
    std::string  std_out;
    std::string  std_err;
    bool         timed_out = false;
    bool         canceled  = false;

    bool succeeded() const { return exit_code == 0 && !timed_out && !canceled; }
};

// Error taxonomy used to tag failures surfaced to the user.
enum class FailureKind {
    None,
    AuthenticationOrConnection, // exit != 0 de ssh/scp; mensaje = stderr
    Parse,                      // línea de listado malformada (se descarta)
    LocalIO,                    // escaneo/copia local o fallo al lanzar
    CredentialStore,            // Keychain/libsecret (no fatal)
    KeyCopy,                    // copia estable de la clave (no fatal)
    Timeout,
    Canceled
};

enum class LogLevel { Debug, Info, Warning, Error };

// The core has no logging framework; callers may plug a sink.
using LogSink = std::function<void(LogLevel, const std::string &)>;

// Diagnostic text chunk callback (stderr of ssh/scp, delivered incrementally).
using ChunkCB = std::function<void(const std::string &)>;

// Cooperative cancellation predicate, polled while a subprocess runs.
using CancelCB = std::function<bool()>;

} // namespace scpnator
