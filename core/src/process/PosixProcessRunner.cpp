// fork/exec process runner: drains stdout/stderr with poll(), forwards
// stderr incrementally, enforces deadline and cooperative cancellation.
#include "scpnator/ProcessRunner.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace scpnator {

namespace {

using Clock = std::chrono::steady_clock;

// Descriptor de archivo con cierre automático.
struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    ~Fd() { reset(); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    void reset(int f = -1) {
        if (fd >= 0)
            ::close(fd);
        fd = f;
    }
};

// Las tuberías nacen con FD_CLOEXEC: otro hilo que haga fork() a la vez no
// debe heredar sus extremos (el drenaje no vería EOF hasta que ese hijo
// terminase).
#if defined(__linux__)
constexpr bool kAtomicCloexec = true;
#else
constexpr bool kAtomicCloexec = false;
#endif

// Sin pipe2(): creación de tuberías y fork() se serializan entre hilos.
std::mutex& spawnMutex() {
    static std::mutex m;
    return m;
}

bool makePipe(Fd& readEnd, Fd& writeEnd) {
    int fds[2];
#if defined(__linux__)
    if (::pipe2(fds, O_CLOEXEC) != 0)
        return false;
#else
    if (::pipe(fds) != 0)
        return false;
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    return true;
}

void setNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0)
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Entorno heredado con las variables de `overrides` añadidas/sustituidas.
std::vector<std::string> mergedEnvironment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        const std::string entry(*e);
        const auto eq = entry.find('=');
        const std::string key = entry.substr(0, eq);
        bool replaced = false;
        for (const auto& kv : overrides) {
            if (kv.first == key) {
                replaced = true;
                break;
            }
        }
        if (!replaced)
            env.push_back(entry);
    }
    for (const auto& kv : overrides)
        env.push_back(kv.first + "=" + kv.second);
    return env;
}

std::vector<char*> cStrings(std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& s : items)
        out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

// Lee lo disponible; devuelve false en EOF o error definitivo.
bool drain(int fd, std::string& sink, const ChunkCB& onChunk) {
    char buf[4096];
    for (;;) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            std::string chunk(buf, static_cast<std::size_t>(n));
            sink += chunk;
            if (onChunk)
                onChunk(chunk);
            continue;
        }
        if (n == 0)
            return false;
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return true;
        return false;
    }
}

} // namespace

bool PosixProcessRunner::run(const ProcessSpec& spec,
                             SessionResult& out,
                             std::string& err,
                             ChunkCB onStderr,
                             CancelCB shouldCancel) {
    out = SessionResult{};
    if (spec.program.empty()) {
        err = "No program to launch";
        return false;
    }

    std::unique_lock<std::mutex> spawnLock(spawnMutex(), std::defer_lock);
    if (!kAtomicCloexec)
        spawnLock.lock();

    Fd outR, outW, errR, errW, execR, execW;
    if (!makePipe(outR, outW) || !makePipe(errR, errW) || !makePipe(execR, execW)) {
        err = std::string("pipe: ") + std::strerror(errno);
        return false;
    }

    // Todo lo que el hijo necesita se prepara antes de fork().
    std::vector<std::string> argStorage;
    argStorage.reserve(spec.args.size() + 1);
    argStorage.push_back(spec.program);
    argStorage.insert(argStorage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv = cStrings(argStorage);
    std::vector<std::string> envStorage = mergedEnvironment(spec.env);
    std::vector<char*> envp = cStrings(envStorage);

    const pid_t pid = ::fork();
    if (pid < 0) {
        err = std::string("fork: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        const int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0)
            ::dup2(devNull, STDIN_FILENO);
        ::dup2(outW.fd, STDOUT_FILENO);
        ::dup2(errW.fd, STDERR_FILENO);
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        const int code = errno;
        ssize_t ignored = ::write(execW.fd, &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    if (spawnLock.owns_lock())
        spawnLock.unlock();
    ::setpgid(pid, pid);
    outW.reset();
    errW.reset();
    execW.reset();

    // Si exec falla el hijo escribe errno; si tiene éxito la tubería se cierra.
    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(execR.fd, &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        err = "Could not launch " + spec.program + ": " + std::strerror(execErrno);
        return false;
    }

    setNonBlocking(outR.fd);
    setNonBlocking(errR.fd);

    const auto started = Clock::now();
    Clock::time_point termSentAt{};
    bool termSent = false;
    bool killSent = false;
    bool outOpen = true;
    bool errOpen = true;

    auto signalGroup = [pid](int sig) {
        if (::kill(-pid, sig) != 0)
            ::kill(pid, sig);
    };

    auto enforceLimits = [&]() {
        const auto now = Clock::now();
        if (!termSent) {
            const bool expired = spec.timeout.count() > 0 && now - started >= spec.timeout;
            const bool canceled = shouldCancel && shouldCancel();
            if (expired || canceled) {
                out.timed_out = expired;
                out.canceled = !expired && canceled;
                signalGroup(SIGTERM);
                termSent = true;
                termSentAt = now;
            }
        } else if (!killSent && now - termSentAt >= killGrace_) {
            signalGroup(SIGKILL);
            killSent = true;
        }
    };

    while (outOpen || errOpen) {
        pollfd fds[2];
        nfds_t count = 0;
        if (outOpen)
            fds[count++] = {outR.fd, POLLIN, 0};
        if (errOpen)
            fds[count++] = {errR.fd, POLLIN, 0};

        const int rc = ::poll(fds, count, 100);
        if (rc < 0 && errno != EINTR) {
            err = std::string("poll: ") + std::strerror(errno);
            signalGroup(SIGKILL);
            killSent = true;
            break;
        }
        for (nfds_t i = 0; rc > 0 && i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;
            if (fds[i].fd == outR.fd)
                outOpen = drain(outR.fd, out.std_out, {});
            else
                errOpen = drain(errR.fd, out.std_err, onStderr);
        }
        enforceLimits();
    }

    // Las tuberías pueden cerrarse antes de que el proceso termine.
    int status = 0;
    pid_t waited;
    for (;;) {
        waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid || (waited < 0 && errno != EINTR))
            break;
        enforceLimits();
        ::usleep(20 * 1000);
    }

    if (waited == pid) {
        if (WIFEXITED(status))
            out.exit_code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            out.exit_code = 128 + WTERMSIG(status);
    } else {
        out.exit_code = -1;
    }
    return true;
}

} // namespace scpnator
