// Interfaz abstracta para operaciones remotas. Implementaciones concretas
// (ssh/scp por subproceso, mock en memoria) deben respetar esta API para
// mantener la UI y el orquestador desacoplados del transporte.
#pragma once
#include "RemoteTypes.hpp"
#include <chrono>
#include <functional>

namespace scpnator {

class RemoteSession {
public:
    using ProgressCB = ChunkCB; // fragmentos de diagnóstico (stderr) en vivo

    virtual ~RemoteSession() = default;

    // Ejecuta un comando en el host remoto bajo sh. Devuelve false sólo si
    // el comando no pudo completarse (lanzamiento, timeout, cancelación);
    // un exit != 0 queda en out.exit_code.
    virtual bool execute(const std::string& command,
                         std::chrono::milliseconds timeout,
                         SessionResult& out,
                         std::string& err) = 0;

    // Listado de directorio remoto (directorios primero, orden sin mayúsculas)
    virtual bool list(const std::string& remote_path,
                      std::vector<RemoteEntry>& out,
                      std::string& err) = 0;

    // Comprobar existencia (archivo o carpeta)
    virtual bool exists(const std::string& remote_path,
                        bool& exists,
                        std::string& err) = 0;

    // Copia remoto -> carpeta local (recursiva si is_dir)
    virtual bool download(const std::string& remote_path,
                          bool is_dir,
                          const std::string& local_dir,
                          std::string& err,
                          ProgressCB progress = {},
                          CancelCB shouldCancel = {}) = 0;

    // Copia local -> carpeta remota (recursiva si is_dir)
    virtual bool upload(const std::string& local_path,
                        bool is_dir,
                        const std::string& remote_dir,
                        std::string& err,
                        ProgressCB progress = {},
                        CancelCB shouldCancel = {}) = 0;

    // Clasificación del último fallo (FailureKind::None tras un éxito).
    virtual FailureKind lastFailure() const = 0;
};

} // namespace scpnator
