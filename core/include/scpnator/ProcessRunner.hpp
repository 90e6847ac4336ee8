// Subprocess boundary used by the ssh/scp session. Abstract so the argument
// templates and environment handling can be tested with a recording fake.
#pragma once
#include "RemoteTypes.hpp"
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace scpnator {

struct ProcessSpec {
    std::string program;                 // resolved through PATH
    std::vector<std::string> args;       // argv[1..]
    // Variables añadidas/sobrescritas sobre el entorno heredado.
    std::vector<std::pair<std::string, std::string>> env;
    std::chrono::milliseconds timeout{0}; // 0 = sin límite
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Runs the process to completion, draining stdout and stderr. stderr is
    // also delivered incrementally to onStderr (from the calling thread).
    // Returns false only when the process could not be launched; a timeout
    // or cancellation still returns true with the flags set in `out`.
    virtual bool run(const ProcessSpec& spec,
                     SessionResult& out,
                     std::string& err,
                     ChunkCB onStderr = {},
                     CancelCB shouldCancel = {}) = 0;
};

// fork/exec implementation with poll()-driven pipe draining. The child runs
// in its own process group so timeouts/cancellation also stop the ssh that
// scp spawns.
class PosixProcessRunner : public ProcessRunner {
public:
    bool run(const ProcessSpec& spec,
             SessionResult& out,
             std::string& err,
             ChunkCB onStderr = {},
             CancelCB shouldCancel = {}) override;

    // Time between SIGTERM and SIGKILL when stopping a child.
    void setKillGrace(std::chrono::milliseconds grace) { killGrace_ = grace; }

private:
    std::chrono::milliseconds killGrace_{2000};
};

} // namespace scpnator
