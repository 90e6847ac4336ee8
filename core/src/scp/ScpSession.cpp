// Backend ssh/scp: construye la plantilla de argumentos, resuelve identidad y
// agente, y lanza OpenSSH como subproceso. Sin known_hosts: cada ejecución se
// evalúa sin identidad de host persistida.
#include "scpnator/ScpSession.hpp"
#include "scpnator/RemoteListing.hpp"
#include "scpnator/RemotePath.hpp"
#include "scpnator/RuntimeLogging.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace scpnator {

namespace {

const char* const kEnvLauncher = "/usr/bin/env";
constexpr std::chrono::milliseconds kAgentLookupTimeout{5000};

std::string trimmedCopy(const std::string& s) {
    const auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return {};
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool socketPathExists(const std::string& path) {
    std::error_code ec;
    return !path.empty() && std::filesystem::exists(path, ec);
}

} // namespace

std::string diagnosticSummary(const std::string& stderrText) {
    std::istringstream in(stderrText);
    std::string line;
    std::string last;
    while (std::getline(in, line)) {
        const std::string t = trimmedCopy(line);
        if (t.empty() || t.rfind("debug", 0) == 0 || t.rfind("OpenSSH_", 0) == 0)
            continue;
        last = t;
    }
    return last;
}

ScpSession::ScpSession(ProcessRunner& runner,
                       IdentityResolver& identity,
                       AccessGrantProvider* grants)
    : runner_(runner), identity_(identity), grants_(grants) {}

void ScpSession::setCredentials(const CredentialContext& ctx) {
    std::lock_guard<std::mutex> lk(mtx_);
    ctx_ = ctx;
}

CredentialContext ScpSession::credentials() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ctx_;
}

FailureKind ScpSession::lastFailure() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lastFailure_;
}

void ScpSession::setFailure(FailureKind kind) {
    std::lock_guard<std::mutex> lk(mtx_);
    lastFailure_ = kind;
}

bool ScpSession::validate(const CredentialContext& ctx, std::string& err) {
    if (ctx.server_address.empty() || ctx.username.empty()) {
        err = "Server address and username are required";
        setFailure(FailureKind::AuthenticationOrConnection);
        return false;
    }
    return true;
}

std::optional<std::string> ScpSession::childIdentity(const IdentityResolution& res) {
    if (!res.key_path)
        return std::nullopt;
    const StableIdentity stable = identity_.stabilize(*res.key_path);
    if (!stable.error.empty())
        return *res.key_path;
    return stable.path;
}

std::optional<std::string> ScpSession::discoverAgentSocket() {
    ProcessSpec spec;
    spec.timeout = kAgentLookupTimeout;
    SessionResult res;
    std::string err;
#ifdef __APPLE__
    spec.program = "/bin/launchctl";
    spec.args = {"getenv", "SSH_AUTH_SOCK"};
    if (runner_.run(spec, res, err) && res.exit_code == 0) {
        const std::string value = trimmedCopy(res.std_out);
        if (socketPathExists(value))
            return value;
    }
#else
    spec.program = "systemctl";
    spec.args = {"--user", "show-environment"};
    if (runner_.run(spec, res, err) && res.exit_code == 0) {
        std::istringstream in(res.std_out);
        std::string line;
        static const std::string key = "SSH_AUTH_SOCK=";
        while (std::getline(in, line)) {
            if (line.rfind(key, 0) != 0)
                continue;
            const std::string value = trimmedCopy(line.substr(key.size()));
            if (socketPathExists(value))
                return value;
        }
    }
    const char* runtimeDir = std::getenv("XDG_RUNTIME_DIR");
    if (runtimeDir && *runtimeDir) {
        const std::filesystem::path base(runtimeDir);
        for (const char* rel : {"ssh-agent.socket", "gcr/ssh", "keyring/ssh"}) {
            const std::string candidate = (base / rel).string();
            if (socketPathExists(candidate))
                return candidate;
        }
    }
#endif
    return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> ScpSession::childEnvironment() {
    std::vector<std::pair<std::string, std::string>> env;
    const char* sock = std::getenv("SSH_AUTH_SOCK");
    if ((!sock || !*sock) && agentDiscovery_) {
        // Procesos lanzados desde la GUI no heredan el socket del agente.
        if (auto found = discoverAgentSocket()) {
            emitLog(log_, LogLevel::Info, "Using discovered ssh-agent socket");
            env.emplace_back("SSH_AUTH_SOCK", *found);
        } else {
            emitLog(log_, LogLevel::Debug, "No ssh-agent socket found");
        }
    }
    return env;
}

std::vector<std::string> ScpSession::baseArgs(Tool tool,
                                              const std::optional<std::string>& identity) const {
    std::vector<std::string> args = {
        tool == Tool::Ssh ? "ssh" : "scp",
        "-vvv",
        "-F", "/dev/null",
        "-o", "BatchMode=yes", // nunca pedir nada interactivamente
        "-o", "StrictHostKeyChecking=no",
        "-o", "UserKnownHostsFile=/dev/null",
        "-o", "GlobalKnownHostsFile=/dev/null",
        "-o", "PreferredAuthentications=publickey",
#ifdef __APPLE__
        "-o", "UseKeychain=yes",
#endif
        "-o", "LogLevel=DEBUG3",
    };
    if (tool == Tool::Scp)
        args.push_back("-p");
    if (identity) {
        // Compatibilidad con servidores antiguos (ssh-rsa)
        args.insert(args.end(), {"-o", "IdentitiesOnly=no",
                                 "-o", "PubkeyAcceptedAlgorithms=+ssh-rsa",
                                 "-o", "HostkeyAlgorithms=+ssh-rsa",
                                 "-i", *identity});
    }
    return args;
}

bool ScpSession::launch(const ProcessSpec& spec,
                        SessionResult& out,
                        std::string& err,
                        ProgressCB progress,
                        CancelCB shouldCancel) {
    std::string runErr;
    if (!runner_.run(spec, out, runErr, std::move(progress), std::move(shouldCancel))) {
        err = runErr.empty() ? "Could not launch " + spec.program : runErr;
        setFailure(FailureKind::LocalIO);
        emitLog(log_, LogLevel::Error, err);
        return false;
    }
    if (sensitiveLoggingEnabled() && !out.std_err.empty())
        emitLog(log_, LogLevel::Debug, out.std_err);
    if (out.timed_out) {
        err = "Timed out after " + std::to_string(spec.timeout.count() / 1000) + "s";
        setFailure(FailureKind::Timeout);
        emitLog(log_, LogLevel::Warning, err);
        return false;
    }
    if (out.canceled) {
        err = "Canceled";
        setFailure(FailureKind::Canceled);
        return false;
    }
    setFailure(FailureKind::None);
    return true;
}

bool ScpSession::runCommand(const CredentialContext& ctx,
                            const std::string& command,
                            std::chrono::milliseconds timeout,
                            SessionResult& out,
                            std::string& err,
                            CancelCB shouldCancel) {
    if (!validate(ctx, err))
        return false;
    const IdentityResolution res = identity_.resolve(ctx);
    ScopedAccess access(grants_, res.scoped_path);
    const auto idPath = childIdentity(res);

    ProcessSpec spec;
    spec.program = kEnvLauncher;
    spec.args = baseArgs(Tool::Ssh, idPath);
    spec.args.push_back(ctx.target());
    // El comando remoto siempre corre bajo un sh POSIX.
    spec.args.push_back("sh -lc " + shellQuote(command));
    spec.env = childEnvironment();
    spec.timeout = timeout;

    emitLog(log_, LogLevel::Debug,
            std::string("ssh exec on ") + ctx.server_address +
                (idPath ? " with identity file" : " via agent"));
    return launch(spec, out, err, {}, std::move(shouldCancel));
}

bool ScpSession::copyFromRemote(const CredentialContext& ctx,
                                const std::string& remote_path,
                                bool is_dir,
                                const std::string& local_dir,
                                SessionResult& out,
                                std::string& err,
                                ProgressCB progress,
                                CancelCB shouldCancel) {
    if (!validate(ctx, err))
        return false;
    const IdentityResolution res = identity_.resolve(ctx);
    ScopedAccess access(grants_, res.scoped_path);
    const auto idPath = childIdentity(res);

    ProcessSpec spec;
    spec.program = kEnvLauncher;
    spec.args = baseArgs(Tool::Scp, idPath);
    if (is_dir)
        spec.args.push_back("-r");
    spec.args.push_back(ctx.target() + ":" + remote_path);
    spec.args.push_back(local_dir);
    spec.env = childEnvironment();
    spec.timeout = copyTimeout_;

    if (!launch(spec, out, err, std::move(progress), std::move(shouldCancel)))
        return false;
    if (out.exit_code != 0) {
        err = out.std_err.empty() ? "scp failed" : out.std_err;
        setFailure(FailureKind::AuthenticationOrConnection);
        emitLog(log_, LogLevel::Warning,
                "scp download exited with code " + std::to_string(out.exit_code));
        return false;
    }
    return true;
}

bool ScpSession::copyToRemote(const CredentialContext& ctx,
                              const std::string& local_path,
                              bool is_dir,
                              const std::string& remote_dir,
                              SessionResult& out,
                              std::string& err,
                              ProgressCB progress,
                              CancelCB shouldCancel) {
    if (!validate(ctx, err))
        return false;
    const IdentityResolution res = identity_.resolve(ctx);
    ScopedAccess access(grants_, res.scoped_path);
    const auto idPath = childIdentity(res);

    std::string dir = remote_dir;
    if (dir.empty() || dir.back() != '/')
        dir += "/";

    ProcessSpec spec;
    spec.program = kEnvLauncher;
    spec.args = baseArgs(Tool::Scp, idPath);
    if (is_dir)
        spec.args.push_back("-r");
    spec.args.push_back(local_path);
    // Sin comillas: scp hace su propio escapado del lado remoto.
    spec.args.push_back(ctx.target() + ":" + dir);
    spec.env = childEnvironment();
    spec.timeout = copyTimeout_;

    if (!launch(spec, out, err, std::move(progress), std::move(shouldCancel)))
        return false;
    if (out.exit_code != 0) {
        err = out.std_err.empty() ? "scp failed" : out.std_err;
        setFailure(FailureKind::AuthenticationOrConnection);
        emitLog(log_, LogLevel::Warning,
                "scp upload exited with code " + std::to_string(out.exit_code));
        return false;
    }
    return true;
}

bool ScpSession::remotePathExists(const CredentialContext& ctx,
                                  const std::string& path,
                                  bool& exists,
                                  std::string& err) {
    exists = false;
    SessionResult res;
    if (!runCommand(ctx, buildExistsCommand(path), kDefaultCommandTimeout, res, err))
        return false;
    if (res.exit_code != 0) {
        err = res.std_err.empty() ? "existence probe failed" : res.std_err;
        setFailure(FailureKind::AuthenticationOrConnection);
        return false;
    }
    exists = res.std_out.find("exists") != std::string::npos;
    return true;
}

bool ScpSession::execute(const std::string& command,
                         std::chrono::milliseconds timeout,
                         SessionResult& out,
                         std::string& err) {
    return runCommand(credentials(), command, timeout, out, err);
}

bool ScpSession::list(const std::string& remote_path,
                      std::vector<RemoteEntry>& out,
                      std::string& err) {
    SessionResult res;
    if (!runCommand(credentials(), buildListCommand(remote_path),
                    kDefaultCommandTimeout, res, err))
        return false;
    if (res.exit_code != 0) {
        err = res.std_err.empty()
                  ? "Listing failed with exit code " + std::to_string(res.exit_code)
                  : res.std_err;
        setFailure(FailureKind::AuthenticationOrConnection);
        return false;
    }
    out = parseLongListing(res.std_out);
    for (auto& e : out)
        e.relative_path = joinRemotePath(remote_path, e.name);
    return true;
}

bool ScpSession::exists(const std::string& remote_path,
                        bool& exists,
                        std::string& err) {
    return remotePathExists(credentials(), remote_path, exists, err);
}

bool ScpSession::download(const std::string& remote_path,
                          bool is_dir,
                          const std::string& local_dir,
                          std::string& err,
                          ProgressCB progress,
                          CancelCB shouldCancel) {
    SessionResult res;
    return copyFromRemote(credentials(), remote_path, is_dir, local_dir, res, err,
                          std::move(progress), std::move(shouldCancel));
}

bool ScpSession::upload(const std::string& local_path,
                        bool is_dir,
                        const std::string& remote_dir,
                        std::string& err,
                        ProgressCB progress,
                        CancelCB shouldCancel) {
    SessionResult res;
    return copyToRemote(credentials(), local_path, is_dir, remote_dir, res, err,
                        std::move(progress), std::move(shouldCancel));
}

} // namespace scpnator
