#pragma once
#include "RemoteSession.hpp"
#include <map>
#include <mutex>
#include <set>

namespace scpnator {

// In-memory RemoteSession for tests and SCPNATOR_MOCK_REMOTE=1 runs.
class MockRemoteSession : public RemoteSession {
public:
  struct Invocation {
    enum class Op { Execute, List, Exists, Download, Upload };
    Op          op;
    std::string path;   // comando, ruta remota o ruta local según op
    bool        is_dir = false;
    std::string target; // carpeta destino de la copia
  };

  MockRemoteSession();

  bool execute(const std::string& command,
               std::chrono::milliseconds timeout,
               SessionResult& out,
               std::string& err) override;

  bool list(const std::string& remote_path,
            std::vector<RemoteEntry>& out,
            std::string& err) override;

  bool exists(const std::string& remote_path,
              bool& exists,
              std::string& err) override;

  bool download(const std::string& remote_path,
                bool is_dir,
                const std::string& local_dir,
                std::string& err,
                ProgressCB progress = {},
                CancelCB shouldCancel = {}) override;

  bool upload(const std::string& local_path,
              bool is_dir,
              const std::string& remote_dir,
              std::string& err,
              ProgressCB progress = {},
              CancelCB shouldCancel = {}) override;

  FailureKind lastFailure() const override;

  // Árbol simulado
  void addDirectory(const std::string& path);
  void addFile(const std::string& path);
  void clearTree();

  // Fallos guionizados: la copia de esta ruta (remota en descarga, local en
  // subida) sale con código != 0 y este stderr.
  void failCopyOf(const std::string& path, const std::string& stderrText);
  void failListingOf(const std::string& path, const std::string& stderrText);

  // Si está activo, las descargas crean un archivo/carpeta vacío en local.
  void setMaterializeDownloads(bool on) { materialize_ = on; }

  std::vector<Invocation> invocations() const;
  std::size_t countOf(Invocation::Op op) const;

private:
  void record(Invocation inv);
  void insertEntry(const std::string& dir, RemoteEntry entry);

  mutable std::mutex mtx_;
  std::map<std::string, std::vector<RemoteEntry>> tree_;
  std::map<std::string, std::string> copyFailures_;
  std::map<std::string, std::string> listFailures_;
  std::vector<Invocation> log_;
  FailureKind lastFailure_ = FailureKind::None;
  bool materialize_ = false;
};

} // namespace scpnator
