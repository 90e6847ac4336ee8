#pragma once
#include "AccessGrant.hpp"
#include "IdentityResolver.hpp"
#include "ProcessRunner.hpp"
#include "RemoteSession.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scpnator {

// Last meaningful line of an ssh/scp diagnostic stream (debug lines skipped),
// for short user-facing messages.
std::string diagnosticSummary(const std::string& stderrText);

// Session executor backed by the system OpenSSH `ssh`/`scp` executables.
// Host identity is never persisted: every run skips known_hosts entirely.
class ScpSession : public RemoteSession {
public:
    static constexpr std::chrono::milliseconds kDefaultCommandTimeout{120000};

    ScpSession(ProcessRunner& runner,
               IdentityResolver& identity,
               AccessGrantProvider* grants = nullptr);

    void setCredentials(const CredentialContext& ctx);
    CredentialContext credentials() const;

    void setLogSink(LogSink sink) { log_ = std::move(sink); }
    // Deshabilitar sólo en tests: evita consultar el gestor de sesión del SO.
    void setAgentDiscoveryEnabled(bool on) { agentDiscovery_ = on; }
    // Plazo para copias; 0 = sin límite (siguen siendo cancelables).
    void setCopyTimeout(std::chrono::milliseconds t) { copyTimeout_ = t; }

    // Operaciones explícitas con credenciales por llamada.
    bool runCommand(const CredentialContext& ctx,
                    const std::string& command,
                    std::chrono::milliseconds timeout,
                    SessionResult& out,
                    std::string& err,
                    CancelCB shouldCancel = {});

    bool copyFromRemote(const CredentialContext& ctx,
                        const std::string& remote_path,
                        bool is_dir,
                        const std::string& local_dir,
                        SessionResult& out,
                        std::string& err,
                        ProgressCB progress = {},
                        CancelCB shouldCancel = {});

    bool copyToRemote(const CredentialContext& ctx,
                      const std::string& local_path,
                      bool is_dir,
                      const std::string& remote_dir,
                      SessionResult& out,
                      std::string& err,
                      ProgressCB progress = {},
                      CancelCB shouldCancel = {});

    bool remotePathExists(const CredentialContext& ctx,
                          const std::string& path,
                          bool& exists,
                          std::string& err);

    // RemoteSession (usa las credenciales fijadas con setCredentials)
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

private:
    enum class Tool { Ssh, Scp };

    // Ruta a pasar con -i (copia estable o, si falla, la original).
    std::optional<std::string> childIdentity(const IdentityResolution& res);
    std::vector<std::pair<std::string, std::string>> childEnvironment();
    std::optional<std::string> discoverAgentSocket();

    std::vector<std::string> baseArgs(Tool tool,
                                      const std::optional<std::string>& identity) const;

    bool launch(const ProcessSpec& spec,
                SessionResult& out,
                std::string& err,
                ProgressCB progress,
                CancelCB shouldCancel);

    bool validate(const CredentialContext& ctx, std::string& err);
    void setFailure(FailureKind kind);

    ProcessRunner& runner_;
    IdentityResolver& identity_;
    AccessGrantProvider* grants_ = nullptr; // no es propiedad
    LogSink log_;
    bool agentDiscovery_ = true;
    std::chrono::milliseconds copyTimeout_{0};

    mutable std::mutex mtx_; // protege ctx_ y lastFailure_
    CredentialContext ctx_;
    FailureKind lastFailure_ = FailureKind::None;
};

} // namespace scpnator
