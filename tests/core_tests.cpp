// Core unit tests without external framework (run via CTest).
#include "scpnator/AccessGrant.hpp"
#include "scpnator/DiagnosticChannel.hpp"
#include "scpnator/IdentityResolver.hpp"
#include "scpnator/LocalBrowser.hpp"
#include "scpnator/MockRemoteSession.hpp"
#include "scpnator/ProcessRunner.hpp"
#include "scpnator/RemoteListing.hpp"
#include "scpnator/RemotePath.hpp"
#include "scpnator/ScpSession.hpp"
#include "scpnator/TransferOrchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace scpnator;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

// Temporary directory removed when the test finishes.
struct TempDir {
    fs::path path;

    explicit TempDir(const std::string &tag) {
        static int counter = 0;
        path = fs::temp_directory_path() /
               ("scpnator_" + tag + "_" + std::to_string(::getpid()) + "_" +
                std::to_string(++counter));
        std::error_code ec;
        fs::remove_all(path, ec);
        fs::create_directories(path, ec);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void writeFile(const fs::path &p, const std::string &content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

struct FakeGrants : AccessGrantProvider {
    std::map<std::string, ResolvedGrant> grants;
    int starts = 0;
    int stops = 0;

    std::string save(const std::string &path) override {
        const std::string token = "grant:" + path;
        grants[token] = ResolvedGrant{path, false};
        return token;
    }
    std::optional<ResolvedGrant> resolve(const std::string &token) override {
        auto it = grants.find(token);
        if (it == grants.end())
            return std::nullopt;
        return it->second;
    }
    bool startAccess(const std::string &) override {
        ++starts;
        return true;
    }
    void stopAccess(const std::string &) override { ++stops; }
};

// Records every spec and answers with a scripted result.
struct RecordingRunner : ProcessRunner {
    std::vector<ProcessSpec> specs;
    SessionResult next;
    // Respuestas por programa (p. ej. systemctl); el resto recibe `next`.
    std::map<std::string, SessionResult> byProgram;
    bool launchOk = true;

    bool run(const ProcessSpec &spec, SessionResult &out, std::string &err,
             ChunkCB onStderr, CancelCB) override {
        specs.push_back(spec);
        const auto scripted = byProgram.find(spec.program);
        if (scripted != byProgram.end()) {
            out = scripted->second;
            return true;
        }
        if (!launchOk) {
            err = "exec failed";
            return false;
        }
        out = next;
        if (onStderr && !next.std_err.empty())
            onStderr(next.std_err);
        return true;
    }
};

bool hasArg(const std::vector<std::string> &args, const std::string &a) {
    return std::find(args.begin(), args.end(), a) != args.end();
}

std::string argAfter(const std::vector<std::string> &args,
                     const std::string &flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end())
        return {};
    return *(it + 1);
}

std::vector<std::string> names(const std::vector<RemoteEntry> &entries) {
    std::vector<std::string> out;
    for (const auto &e : entries)
        out.push_back(e.name);
    return out;
}

// ---------------------------------------------------------------- listing

void test_listing_directory_first(TestContext &t) {
    const auto entries = parseLongListing(
        "-rw-r--r--  1 u g 10 Jan 1 00:00 a.txt\n"
        "drwxr-xr-x 2 u g 64 Jan 1 00:00 sub/");
    t.check(entries.size() == 2, "two entries expected");
    if (entries.size() != 2)
        return;
    t.check(entries[0].name == "sub" &&
                entries[0].kind == RemoteEntryKind::Directory,
            "directory should come first with its '/' stripped");
    t.check(entries[1].name == "a.txt" &&
                entries[1].kind == RemoteEntryKind::File,
            "a.txt should be a file");
    t.check(entries[0].id == entries[0].name, "entry id should equal name");
}

void test_listing_drops_noise(TestContext &t) {
    const auto entries = parseLongListing(
        "total 48\n"
        "\n"
        "   \n"
        "-rw-r--r-- 1 u g 10 Jan 1 short\n"
        "garbage\n"
        "-rw-r--r-- 1 u g 10 Jan  1 00:00 my report final.pdf\n");
    t.check(entries.size() == 1, "only the complete line should survive");
    if (!entries.empty())
        t.check(entries[0].name == "my report final.pdf",
                "spaces in names should be rejoined");
}

void test_listing_indicators(TestContext &t) {
    const auto entries = parseLongListing(
        "lrwxrwxrwx 1 u g 7 Jan 1 00:00 link@\n"
        "-rw-r--r-- 1 u g 7 Jan 1 00:00 odd@\n"
        "lrwxrwxrwx 1 u g 7 Jan 1 00:00 cur -> /srv/current/\n"
        "-rwxr-xr-x 1 u g 7 Jan 1 00:00 run.sh*\n"
        "drwxr-xr-x 1 u g 7 Jan 1 00:00 plain\n"
        "prw-r--r-- 1 u g 0 Jan 1 00:00 fifo|\n");
    std::map<std::string, RemoteEntryKind> kinds;
    for (const auto &e : entries)
        kinds[e.name] = e.kind;
    t.check(kinds.count("link") && kinds["link"] == RemoteEntryKind::Symlink,
            "'@' with l permission should be a symlink");
    t.check(kinds.count("odd") && kinds["odd"] == RemoteEntryKind::File,
            "'@' without l permission should be a file");
    t.check(kinds.count("cur") && kinds["cur"] == RemoteEntryKind::Symlink,
            "arrow target should be cut from symlink names");
    t.check(kinds.count("plain") &&
                kinds["plain"] == RemoteEntryKind::Directory,
            "d permission without indicator should be a directory");
    t.check(kinds.count("run.sh*") && kinds["run.sh*"] == RemoteEntryKind::File,
            "other indicators are left in the name");
    t.check(kinds.count("fifo|") && kinds["fifo|"] == RemoteEntryKind::File,
            "non d/l permission should classify as file");
}

void test_listing_sort_case_insensitive(TestContext &t) {
    const auto entries = parseLongListing(
        "-rw-r--r-- 1 u g 1 Jan 1 00:00 beta\n"
        "-rw-r--r-- 1 u g 1 Jan 1 00:00 Alpha\n"
        "drwxr-xr-x 1 u g 1 Jan 1 00:00 zeta/\n"
        "drwxr-xr-x 1 u g 1 Jan 1 00:00 Docs/\n"
        "-rw-r--r-- 1 u g 1 Jan 1 00:00 Gamma\n");
    const std::vector<std::string> expected = {"Docs", "zeta", "Alpha", "beta",
                                               "Gamma"};
    t.check(names(entries) == expected,
            "dirs first, then case-insensitive ascending");
}

void test_list_command(TestContext &t) {
    t.check(buildListCommand("~") ==
                "cd ~ && ls -laF --group-directories-first '.' 2>/dev/null",
            "'~' should list '.' after cd ~");
    t.check(buildListCommand("~/my dir") ==
                "cd ~ && ls -laF --group-directories-first 'my dir' 2>/dev/null",
            "home-relative path should be listed relative to home");
    t.check(buildListCommand("/var/log") ==
                "ls -laF --group-directories-first '/var/log' 2>/dev/null",
            "absolute path should be quoted as-is");
    t.checkContains(buildListCommand("/tmp/it's"), "'/tmp/it'\\''s'",
                    "single quotes should be escaped");
}

void test_exists_command(TestContext &t) {
    t.check(buildExistsCommand("/srv/a.txt") ==
                "if [ -e '/srv/a.txt' ]; then echo exists; else echo missing; fi",
            "absolute probe command");
    t.check(buildExistsCommand("~/a.txt") ==
                "cd ~ && if [ -e 'a.txt' ]; then echo exists; else echo missing; fi",
            "home-relative probe should cd ~ first");
}

// ------------------------------------------------------------------ paths

void test_join_single_separator(TestContext &t) {
    for (const std::string base : {"~", "~/", "/srv", "/srv/", "/"}) {
        const std::string joined = joinRemotePath(base, "x");
        t.check(joined.find("//") == std::string::npos,
                "no double separator for base '" + base + "'");
        t.check(joined.size() >= 2 &&
                    joined.compare(joined.size() - 2, 2, "/x") == 0,
                "exactly one separator before the name for base '" + base + "'");
    }
    t.check(joinRemotePath("", "x") == "x", "empty base yields the name");
}

void test_remote_parent(TestContext &t) {
    t.check(remoteParent("~") == "~", "~ has no parent");
    t.check(remoteParent("~/a") == "~", "parent of ~/a");
    t.check(remoteParent("~/a/b/") == "~/a", "trailing slash stripped");
    t.check(remoteParent("/a") == "/", "parent of /a");
    t.check(remoteParent("/") == "/", "root stays root");
    t.check(lastPathComponent("/tmp/dir/") == "dir", "last component");
    t.check(shellQuote("it's") == "'it'\\''s'", "shellQuote escaping");
}

// --------------------------------------------------------------- identity

void test_identity_pub_suffix(TestContext &t) {
    TempDir home("home");
    IdentityResolver r(nullptr, (home.path / "keys").string(), home.path.string());
    CredentialContext ctx;
    ctx.identity_key_path = "~/.ssh/id_rsa.pub";
    const auto res = r.resolve(ctx);
    t.check(res.key_path && *res.key_path == "~/.ssh/id_rsa",
            "public key path should resolve to its private key");
    t.check(!res.scoped_path, "plain path needs no scoped access");
}

void test_identity_grant_precedence(TestContext &t) {
    TempDir home("home");
    FakeGrants grants;
    IdentityResolver r(&grants, (home.path / "keys").string(), home.path.string());
    CredentialContext ctx;
    ctx.identity_key_path = "/configured/key";
    ctx.identity_key_token = grants.save("/granted/id_ed25519.pub");
    const auto res = r.resolve(ctx);
    t.check(res.key_path && *res.key_path == "/granted/id_ed25519",
            "grant should win over configured path");
    t.check(res.from_grant && res.scoped_path, "grant should be scoped");

    ctx.identity_key_token = "unknown";
    const auto fallback = r.resolve(ctx);
    t.check(fallback.key_path && *fallback.key_path == "/configured/key",
            "unresolvable grant should fall through to the configured path");
}

void test_identity_fallbacks(TestContext &t) {
    TempDir home("home");
    IdentityResolver r(nullptr, (home.path / "keys").string(), home.path.string());
    CredentialContext ctx;
    t.check(!r.resolve(ctx).key_path, "no key anywhere should mean agent auth");

    fs::create_directories(home.path / ".ssh");
    writeFile(home.path / ".ssh" / "id_ed25519", "ed");
    auto res = r.resolve(ctx);
    t.check(res.key_path &&
                *res.key_path == (home.path / ".ssh" / "id_ed25519").string(),
            "id_ed25519 should be found when id_rsa is missing");

    writeFile(home.path / ".ssh" / "id_rsa", "rsa");
    res = r.resolve(ctx);
    t.check(res.key_path &&
                *res.key_path == (home.path / ".ssh" / "id_rsa").string(),
            "id_rsa should be preferred");
    t.check(res.from_fallback, "fallback flag should be set");
}

void test_identity_stable_copy(TestContext &t) {
    TempDir home("home");
    const fs::path keys = home.path / "app" / "Keys";
    IdentityResolver r(nullptr, keys.string(), home.path.string());
    const fs::path src = home.path / "work_key";
    writeFile(src, "PRIVATE");

    const auto first = r.stabilize(src.string());
    t.check(first.error.empty(), "first stabilize should succeed");
    t.check(first.copied, "first stabilize should copy");
    t.check(first.path == (keys / "work_key").string(),
            "copy should be keyed by file name");
    std::error_code ec;
    const auto perms = fs::status(first.path, ec).permissions();
    t.check((perms & (fs::perms::group_all | fs::perms::others_all)) ==
                fs::perms::none,
            "stable copy should be owner-only");

    const auto second = r.stabilize(src.string());
    t.check(!second.copied, "unchanged source should not be copied again");
    t.check(second.path == first.path, "same stable path on repeat");

    writeFile(src, "PRIVATE-ROTATED");
    const auto third = r.stabilize(src.string());
    t.check(third.copied, "size change should trigger a new copy");

    // Mismo tamaño: sólo decide la fecha de modificación.
    const auto dstTime = fs::last_write_time(third.path, ec);
    writeFile(src, "PRIVATE-ROTATEX");
    fs::last_write_time(src, dstTime - std::chrono::hours(1), ec);
    const auto older = r.stabilize(src.string());
    t.check(!ec && !older.copied,
            "same size and older source should keep the copy");

    fs::last_write_time(src, dstTime + std::chrono::hours(1), ec);
    const auto newer = r.stabilize(src.string());
    t.check(!ec && newer.copied, "newer source of the same size should be copied");
    std::string content;
    std::ifstream in(newer.path, std::ios::binary);
    content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    t.check(content == "PRIVATE-ROTATEX", "copy should carry the new content");

    const auto missing = r.stabilize((home.path / "nope").string());
    t.check(!missing.error.empty(), "missing source should report an error");
    t.check(missing.path == (home.path / "nope").string(),
            "copy failure should fall back to the original path");
}

void test_identity_concurrent_stabilize(TestContext &t) {
    TempDir home("home");
    const fs::path src = home.path / "shared_key";
    const std::string payload(64 * 1024, 'k');
    writeFile(src, payload);

    int failures = 0;
    int truncated = 0;
    for (int i = 0; i < 100; ++i) {
        const fs::path keys = home.path / ("Keys" + std::to_string(i));
        IdentityResolver r(nullptr, keys.string(), home.path.string());
        StableIdentity a, b;
        std::thread other([&] { a = r.stabilize(src.string()); });
        b = r.stabilize(src.string());
        other.join();
        if (!a.error.empty() || !b.error.empty())
            ++failures;
        std::error_code ec;
        if (fs::file_size(keys / "shared_key", ec) != payload.size() || ec)
            ++truncated;
    }
    t.check(failures == 0, "concurrent stabilize should not report copy failures");
    t.check(truncated == 0, "installed copy should always be complete");
}

// ----------------------------------------------------------- local browser

void test_local_listing(TestContext &t) {
    TempDir dir("local");
    writeFile(dir.path / "old.txt", "1");
    writeFile(dir.path / "new.txt", "2");
    writeFile(dir.path / "b_same.txt", "3");
    writeFile(dir.path / "a_same.txt", "4");
    writeFile(dir.path / ".hidden", "5");
    fs::create_directories(dir.path / "folder");

    const auto now = fs::file_time_type::clock::now();
    fs::last_write_time(dir.path / "old.txt", now - std::chrono::hours(48));
    fs::last_write_time(dir.path / "new.txt", now);
    fs::last_write_time(dir.path / "a_same.txt", now - std::chrono::hours(10));
    fs::last_write_time(dir.path / "b_same.txt", now - std::chrono::hours(10));
    fs::last_write_time(dir.path / "folder", now - std::chrono::hours(20));

    std::vector<LocalEntry> out;
    std::string err;
    t.check(listLocalDirectory(dir.path.string(), out, err),
            "local listing should succeed");
    std::vector<std::string> got;
    for (const auto &e : out)
        got.push_back(e.name);
    const std::vector<std::string> expected = {"new.txt", "a_same.txt",
                                               "b_same.txt", "folder",
                                               "old.txt"};
    t.check(got == expected, "newest first, name tiebreak, hidden skipped");
    for (const auto &e : out) {
        t.check(e.id == e.absolute_path, "local id is the absolute path");
        if (e.name == "folder")
            t.check(e.is_dir, "folder should be a directory");
    }

    std::vector<LocalEntry> none;
    t.check(!listLocalDirectory((dir.path / "missing").string(), none, err),
            "missing dir should fail");
    t.check(!err.empty() && none.empty(), "failure should report and stay empty");
    t.check(localEntryExists(dir.path.string(), "old.txt"), "exists probe");
    t.check(!localEntryExists(dir.path.string(), "ghost"), "missing probe");
}

void test_local_navigator(TestContext &t) {
    TempDir dir("nav");
    fs::create_directories(dir.path / "a" / "b");
    LocalNavigator nav(dir.path.string());
    LocalEntry a;
    a.absolute_path = (dir.path / "a").string();
    a.is_dir = true;
    t.check(nav.enter(a) && nav.current() == a.absolute_path, "enter folder");
    LocalEntry f;
    f.absolute_path = (dir.path / "a" / "x.txt").string();
    t.check(!nav.enter(f), "files cannot be entered");
    nav.goUp();
    t.check(nav.isAtRoot(), "up from child returns to root");
    nav.goUp();
    t.check(nav.current() == nav.root(), "going up past root clamps");
    nav.setCurrent("/");
    t.check(nav.isAtRoot(), "outside paths clamp to root");
}

// ------------------------------------------------------------ state machine

void test_transfer_transitions(TestContext &t) {
    TransferBatch batch(TransferDirection::RemoteToLocal, "/tmp");
    auto &item = batch.add(makeRemoteEntry("a", RemoteEntryKind::File), "~/a");
    t.check(item.state() == TransferState::Pending, "starts pending");
    t.check(!item.advance(TransferState::Succeeded), "pending cannot succeed");
    t.check(item.advance(TransferState::Running), "pending -> running");
    t.check(!item.advance(TransferState::Pending), "cannot revert");
    t.check(item.advance(TransferState::Failed, "boom",
                         FailureKind::AuthenticationOrConnection),
            "running -> failed");
    t.check(item.message() == "boom", "failure message kept");
    t.check(!item.advance(TransferState::Succeeded), "terminal state is final");
    t.check(item.state() == TransferState::Failed, "state unchanged");

    const auto id = item.id();
    TransferBatch other(TransferDirection::RemoteToLocal, "/tmp");
    t.check(other.add(makeRemoteEntry("a", RemoteEntryKind::File), "~/a").id() !=
                id,
            "ids are fresh per batch");
}

// ------------------------------------------------------------- orchestrator

struct CollectingObserver : TransferObserver {
    std::mutex mtx;
    int started = 0;
    int finished = 0;
    std::vector<std::pair<std::uint64_t, TransferState>> changes;
    std::vector<DiagnosticChunk> chunks;
    std::function<void(const TransferItemStatus &)> onChange;

    void batchStarted(const TransferBatch &) override { ++started; }
    void itemChanged(const TransferItemStatus &s) override {
        changes.emplace_back(s.id(), s.state());
        if (onChange)
            onChange(s);
    }
    void diagnostic(const DiagnosticChunk &c) override {
        std::lock_guard<std::mutex> lk(mtx);
        chunks.push_back(c);
    }
    void batchFinished(const TransferBatch &) override { ++finished; }
};

std::vector<RemoteEntry> threeFiles() {
    return {makeRemoteEntry("a.txt", RemoteEntryKind::File),
            makeRemoteEntry("b.txt", RemoteEntryKind::File),
            makeRemoteEntry("c.txt", RemoteEntryKind::File)};
}

void test_batch_isolates_failures(TestContext &t) {
    TempDir local("dl");
    MockRemoteSession remote;
    remote.failCopyOf("~/b.txt", "scp: b.txt: Permission denied");
    TransferOrchestrator orch(remote);
    CollectingObserver obs;
    orch.setObserver(&obs);
    int localRefreshes = 0;
    int remoteRefreshes = 0;
    orch.setLocalRefresh([&] { ++localRefreshes; });
    orch.setRemoteRefresh([&] { ++remoteRefreshes; });

    const auto outcome =
        orch.downloadSelection(threeFiles(), "~", local.path.string());
    t.check(outcome == BatchOutcome::Completed, "batch should complete");
    const auto batch = orch.lastBatch();
    t.check(batch.size() == 3, "three statuses");
    if (batch.size() == 3) {
        t.check(batch.items()[0].state() == TransferState::Succeeded, "item 1 ok");
        t.check(batch.items()[1].state() == TransferState::Failed,
                "item 2 failed");
        t.check(batch.items()[1].message() == "scp: b.txt: Permission denied",
                "failure message is the diagnostic text");
        t.check(batch.items()[1].failure() ==
                    FailureKind::AuthenticationOrConnection,
                "failure kind tagged");
        t.check(batch.items()[2].state() == TransferState::Succeeded,
                "item 3 still ran");
    }
    t.check(localRefreshes == 2, "one local refresh per successful download");
    t.check(remoteRefreshes == 0, "no remote refresh for downloads");
    t.check(remote.countOf(MockRemoteSession::Invocation::Op::Download) == 3,
            "three copies launched");
    t.check(obs.started == 1 && obs.finished == 1, "observer brackets batch");
    t.check(obs.changes.size() == 6, "running + final per item");
    t.check(!obs.chunks.empty(), "diagnostic chunks delivered");
    t.check(!orch.isBusy(), "busy flag released");

    const auto invs = remote.invocations();
    t.check(!invs.empty() && invs.front().path == "~/a.txt" &&
                invs.front().target == local.path.string(),
            "download source and destination");
}

void test_collision_decline(TestContext &t) {
    TempDir local("dl");
    writeFile(local.path / "a.txt", "existing");
    MockRemoteSession remote;
    TransferOrchestrator orch(remote);
    std::vector<std::string> asked;
    orch.setConfirmOverwrite([&](const std::vector<std::string> &names) {
        asked = names;
        return false;
    });
    const auto outcome = orch.downloadEntries(
        {makeRemoteEntry("a.txt", RemoteEntryKind::File)}, "~",
        local.path.string());
    t.check(outcome == BatchOutcome::Declined, "decline aborts the batch");
    t.check(asked == std::vector<std::string>{"a.txt"},
            "collisions passed to confirmation");
    t.check(remote.invocations().empty(), "zero subprocess invocations");
    t.check(orch.lastBatch().empty(), "status list remains empty");
}

void test_upload_collision_confirmed(TestContext &t) {
    TempDir local("ul");
    writeFile(local.path / "readme.txt", "new");
    fs::create_directories(local.path / "assets");
    MockRemoteSession remote; // ya contiene ~/readme.txt
    TransferOrchestrator orch(remote);
    int confirms = 0;
    orch.setConfirmOverwrite([&](const std::vector<std::string> &names) {
        ++confirms;
        return names.size() == 1 && names[0] == "readme.txt";
    });
    int remoteRefreshes = 0;
    orch.setRemoteRefresh([&] { ++remoteRefreshes; });
    const auto outcome = orch.uploadPaths(
        {(local.path / "readme.txt").string(), (local.path / "assets").string()},
        "~/");
    t.check(outcome == BatchOutcome::Completed, "confirmed upload runs");
    t.check(confirms == 1, "one confirmation per batch");
    t.check(remote.countOf(MockRemoteSession::Invocation::Op::Exists) == 2,
            "one remote probe per item");
    t.check(remoteRefreshes == 2, "remote refresh per successful upload");
    const auto batch = orch.lastBatch();
    t.check(batch.size() == 2 && batch.items()[1].item().isDirectory(),
            "upload of a folder is shown as a directory");
    bool exists = false;
    std::string err;
    remote.exists("~/assets", exists, err);
    t.check(exists, "uploaded folder appears remotely");
}

void test_rejections(TestContext &t) {
    MockRemoteSession remote;
    TransferOrchestrator orch(remote);
    t.check(orch.downloadSelection({}, "~", "/tmp") == BatchOutcome::Rejected,
            "empty selection rejected");
    t.check(orch.uploadPaths({}, "~") == BatchOutcome::Rejected,
            "empty upload rejected");

    TempDir local("dl");
    BatchOutcome nested = BatchOutcome::Completed;
    orch.setLocalRefresh([&] {
        nested = orch.downloadSelection(
            {makeRemoteEntry("x", RemoteEntryKind::File)}, "~",
            local.path.string());
    });
    orch.downloadSelection({makeRemoteEntry("a.txt", RemoteEntryKind::File)},
                           "~", local.path.string());
    t.check(nested == BatchOutcome::Rejected,
            "a batch started while another runs is rejected");
    t.check(orch.lastBatch().size() == 1, "running batch not replaced");
}

void test_cancel_batch(TestContext &t) {
    TempDir local("dl");
    MockRemoteSession remote;
    TransferOrchestrator orch(remote);
    CollectingObserver obs;
    obs.onChange = [&](const TransferItemStatus &s) {
        if (s.state() == TransferState::Succeeded)
            orch.cancel();
    };
    orch.setObserver(&obs);
    orch.downloadSelection(threeFiles(), "~", local.path.string());
    const auto batch = orch.lastBatch();
    t.check(batch.count(TransferState::Succeeded) == 1, "first item finished");
    t.check(batch.count(TransferState::Failed) == 2, "remaining items canceled");
    t.check(batch.size() == 3 && batch.items()[1].failure() == FailureKind::Canceled &&
                batch.items()[2].message() == "Canceled",
            "failure kind is Canceled");
    t.check(remote.countOf(MockRemoteSession::Invocation::Op::Download) == 1,
            "items after the cancel are not launched");

    orch.setObserver(nullptr);
    orch.downloadSelection(threeFiles(), "~", local.path.string());
    t.check(orch.lastBatch().count(TransferState::Succeeded) == 3,
            "cancel does not leak into the next batch");
}

// Remote whose existence check triggers a cancel, as a user pressing
// Cancel while the collision check is still running.
class CancelOnExistsRemote : public MockRemoteSession {
public:
    TransferOrchestrator *orch = nullptr;

    bool exists(const std::string &remote_path, bool &exists,
                std::string &err) override {
        if (orch)
            orch->cancel();
        return MockRemoteSession::exists(remote_path, exists, err);
    }
};

void test_cancel_during_collision_check(TestContext &t) {
    TempDir local("ul");
    writeFile(local.path / "x1.txt", "1");
    writeFile(local.path / "x2.txt", "2");
    CancelOnExistsRemote remote;
    TransferOrchestrator orch(remote);
    remote.orch = &orch;
    int confirms = 0;
    orch.setConfirmOverwrite([&](const std::vector<std::string> &) {
        ++confirms;
        return true;
    });
    const auto outcome = orch.uploadPaths(
        {(local.path / "x1.txt").string(), (local.path / "x2.txt").string()}, "~");
    t.check(outcome == BatchOutcome::Canceled,
            "cancel during the collision check ends the batch");
    t.check(remote.countOf(MockRemoteSession::Invocation::Op::Upload) == 0,
            "no upload launched after cancel");
    t.check(remote.countOf(MockRemoteSession::Invocation::Op::Exists) == 1,
            "remaining names are not checked");
    t.check(confirms == 0, "no overwrite prompt after cancel");
    t.check(orch.lastBatch().empty(), "status list stays empty");
    t.check(!orch.isBusy(), "busy flag released");

    remote.orch = nullptr;
    t.check(orch.uploadPaths({(local.path / "x1.txt").string()}, "~") ==
                BatchOutcome::Completed,
            "next batch is not affected by the earlier cancel");
    t.check(remote.countOf(MockRemoteSession::Invocation::Op::Upload) == 1,
            "next batch uploads");
}

void test_cancel_while_confirming(TestContext &t) {
    TempDir local("dl");
    writeFile(local.path / "a.txt", "existing");
    MockRemoteSession remote;
    TransferOrchestrator orch(remote);
    orch.setConfirmOverwrite([&](const std::vector<std::string> &) {
        orch.cancel(); // el usuario cancela con el diálogo abierto
        return true;
    });
    const auto outcome = orch.downloadEntries(
        {makeRemoteEntry("a.txt", RemoteEntryKind::File)}, "~",
        local.path.string());
    t.check(outcome == BatchOutcome::Canceled, "cancel while confirming ends the batch");
    t.check(remote.invocations().empty(), "no copy launched");
}

void test_local_access_scoped(TestContext &t) {
    TempDir local("dl");
    MockRemoteSession remote;
    remote.failCopyOf("~/b.txt", "denied");
    FakeGrants grants;
    TransferOrchestrator orch(remote);
    orch.setLocalAccess(&grants, local.path.string());
    orch.downloadSelection(threeFiles(), "~", local.path.string());
    t.check(grants.starts == 3 && grants.stops == 3,
            "root access acquired and released around every copy");
}

// ------------------------------------------------------------- ScpSession

CredentialContext aliceCtx() {
    CredentialContext ctx;
    ctx.server_address = "example.test";
    ctx.username = "alice";
    ctx.passphrase = "s3cret";
    return ctx;
}

void test_ssh_argument_template(TestContext &t) {
    TempDir home("home");
    RecordingRunner runner;
    IdentityResolver identity(nullptr, (home.path / "keys").string(),
                              home.path.string());
    ScpSession s(runner, identity);
    s.setAgentDiscoveryEnabled(false);

    SessionResult out;
    std::string err;
    t.check(s.runCommand(aliceCtx(), "echo 'hi'", std::chrono::seconds(5), out, err),
            "runCommand should succeed");
    t.check(runner.specs.size() == 1, "one process launched");
    if (runner.specs.empty())
        return;
    const auto &spec = runner.specs[0];
    t.check(spec.program == "/usr/bin/env", "launched through env");
    t.check(!spec.args.empty() && spec.args[0] == "ssh", "ssh tool");
    t.check(hasArg(spec.args, "-vvv"), "verbose diagnostics");
    t.check(argAfter(spec.args, "-F") == "/dev/null", "no user config");
    for (const char *opt :
         {"BatchMode=yes", "StrictHostKeyChecking=no",
          "UserKnownHostsFile=/dev/null", "GlobalKnownHostsFile=/dev/null",
          "PreferredAuthentications=publickey", "LogLevel=DEBUG3"})
        t.check(hasArg(spec.args, opt), std::string("missing option ") + opt);
    t.check(!hasArg(spec.args, "-i"), "no identity means agent auth");
    t.check(spec.args.size() >= 2 &&
                spec.args[spec.args.size() - 2] == "alice@example.test",
            "target before command");
    t.check(spec.args.back() == "sh -lc 'echo '\\''hi'\\'''",
            "command wrapped for sh with quotes escaped");
    t.check(spec.timeout == std::chrono::seconds(5), "timeout forwarded");
    for (const auto &a : spec.args)
        t.check(a.find("s3cret") == std::string::npos,
                "passphrase never on the command line");
    t.check(spec.env.empty(), "no agent injection when discovery is off");
}

// Sets an environment variable for one test and restores it afterwards.
struct ScopedEnv {
    std::string name;
    std::optional<std::string> saved;

    ScopedEnv(const std::string &n, const char *value) : name(n) {
        if (const char *old = std::getenv(n.c_str()))
            saved = old;
        if (value)
            ::setenv(n.c_str(), value, 1);
        else
            ::unsetenv(n.c_str());
    }
    ~ScopedEnv() {
        if (saved)
            ::setenv(name.c_str(), saved->c_str(), 1);
        else
            ::unsetenv(name.c_str());
    }
};

std::optional<std::string> injectedAgentSocket(const RecordingRunner &runner) {
    for (const auto &spec : runner.specs) {
        if (spec.program != "/usr/bin/env")
            continue;
        for (const auto &kv : spec.env) {
            if (kv.first == "SSH_AUTH_SOCK")
                return kv.second;
        }
    }
    return std::nullopt;
}

void test_agent_socket_discovery(TestContext &t) {
    TempDir home("home");
    TempDir runtime("xdg");
    ScopedEnv noSock("SSH_AUTH_SOCK", nullptr);
    ScopedEnv xdg("XDG_RUNTIME_DIR", runtime.path.string().c_str());
    IdentityResolver identity(nullptr, (home.path / "keys").string(),
                              home.path.string());
    SessionResult out;
    std::string err;

    const fs::path announced = runtime.path / "announced.sock";
    const fs::path fallback = runtime.path / "ssh-agent.socket";
    SessionResult lookup;
    lookup.exit_code = 0;
#ifdef __APPLE__
    const std::string lookupProgram = "/bin/launchctl";
    auto announce = [&](const fs::path &p) { lookup.std_out = p.string() + "\n"; };
#else
    const std::string lookupProgram = "systemctl";
    auto announce = [&](const fs::path &p) {
        lookup.std_out = "HOME=/home/alice\nSSH_AUTH_SOCK=" + p.string() + "\nLANG=C\n";
    };
#endif

    {
        // El socket anunciado por la sesión existe: se inyecta.
        writeFile(announced, "");
        announce(announced);
        RecordingRunner runner;
        runner.byProgram[lookupProgram] = lookup;
        ScpSession s(runner, identity);
        s.runCommand(aliceCtx(), "true", std::chrono::seconds(5), out, err);
        t.check(!runner.specs.empty() && runner.specs.front().program == lookupProgram,
                "agent lookup runs before ssh when SSH_AUTH_SOCK is unset");
        const auto sock = injectedAgentSocket(runner);
        t.check(sock && *sock == announced.string(),
                "announced agent socket injected into the child environment");
        fs::remove(announced);
    }
#ifndef __APPLE__
    {
        // Anunciado pero inexistente: se prueba $XDG_RUNTIME_DIR.
        writeFile(fallback, "");
        announce(announced);
        RecordingRunner runner;
        runner.byProgram[lookupProgram] = lookup;
        ScpSession s(runner, identity);
        s.runCommand(aliceCtx(), "true", std::chrono::seconds(5), out, err);
        const auto sock = injectedAgentSocket(runner);
        t.check(sock && *sock == fallback.string(),
                "runtime dir socket used when the announced one is missing");
        fs::remove(fallback);
    }
#endif
    {
        // Ningún candidato existe: no se inyecta nada.
        announce(announced);
        RecordingRunner runner;
        runner.byProgram[lookupProgram] = lookup;
        ScpSession s(runner, identity);
        s.runCommand(aliceCtx(), "true", std::chrono::seconds(5), out, err);
        t.check(!injectedAgentSocket(runner),
                "nothing injected when no candidate socket exists");
    }
    {
        // Con SSH_AUTH_SOCK heredado no se busca nada.
        ScopedEnv inherited("SSH_AUTH_SOCK", "/tmp/inherited.sock");
        RecordingRunner runner;
        ScpSession s(runner, identity);
        s.runCommand(aliceCtx(), "true", std::chrono::seconds(5), out, err);
        t.check(runner.specs.size() == 1 && !injectedAgentSocket(runner),
                "inherited agent socket is left alone");
    }
}

void test_scp_argument_template(TestContext &t) {
    TempDir home("home");
    writeFile(home.path / "deploy_key", "KEY");
    RecordingRunner runner;
    IdentityResolver identity(nullptr, (home.path / "keys").string(),
                              home.path.string());
    ScpSession s(runner, identity);
    s.setAgentDiscoveryEnabled(false);

    auto ctx = aliceCtx();
    ctx.identity_key_path = (home.path / "deploy_key.pub").string();
    SessionResult out;
    std::string err;
    t.check(s.copyToRemote(ctx, "/tmp/site", true, "~/www", out, err),
            "upload should succeed");
    t.check(s.copyFromRemote(ctx, "~/www/index.html", false, "/tmp/dl", out, err),
            "download should succeed");
    t.check(runner.specs.size() == 2, "two processes launched");
    if (runner.specs.size() != 2)
        return;
    const auto &up = runner.specs[0].args;
    t.check(up[0] == "scp" && hasArg(up, "-p") && hasArg(up, "-r"),
            "scp directory upload flags");
    t.check(argAfter(up, "-i") == (home.path / "keys" / "deploy_key").string(),
            "stable copy of the private key passed with -i");
    t.check(hasArg(up, "PubkeyAcceptedAlgorithms=+ssh-rsa") &&
                hasArg(up, "HostkeyAlgorithms=+ssh-rsa") &&
                hasArg(up, "IdentitiesOnly=no"),
            "legacy algorithms enabled with an explicit key");
    t.check(up[up.size() - 2] == "/tmp/site", "upload source");
    t.check(up.back() == "alice@example.test:~/www/", "upload dir gets '/'");

    const auto &down = runner.specs[1].args;
    t.check(!hasArg(down, "-r"), "file download is not recursive");
    t.check(down[down.size() - 2] == "alice@example.test:~/www/index.html",
            "download source");
    t.check(down.back() == "/tmp/dl", "download destination");
    t.check(runner.specs[1].timeout.count() == 0, "copies have no deadline");
}

void test_scp_failures(TestContext &t) {
    TempDir home("home");
    RecordingRunner runner;
    IdentityResolver identity(nullptr, (home.path / "keys").string(),
                              home.path.string());
    ScpSession s(runner, identity);
    s.setAgentDiscoveryEnabled(false);
    SessionResult out;
    std::string err;

    CredentialContext empty;
    t.check(!s.runCommand(empty, "ls", std::chrono::seconds(1), out, err),
            "missing server/user should fail");
    t.check(runner.specs.empty(), "nothing launched without credentials");

    runner.next.exit_code = 255;
    runner.next.std_err = "debug1: x\nalice@example.test: Permission denied (publickey).\n";
    std::string chunks;
    t.check(!s.copyFromRemote(aliceCtx(), "~/a", false, "/tmp", out, err,
                              [&](const std::string &c) { chunks += c; }),
            "non-zero exit should fail");
    t.check(err == runner.next.std_err, "error detail is the diagnostic stream");
    t.check(chunks == runner.next.std_err, "diagnostics streamed to progress");
    t.check(s.lastFailure() == FailureKind::AuthenticationOrConnection,
            "auth/connection failure kind");
    t.check(diagnosticSummary(err) ==
                "alice@example.test: Permission denied (publickey).",
            "summary skips debug lines");

    runner.next = SessionResult{};
    runner.next.exit_code = 1;
    t.check(!s.copyToRemote(aliceCtx(), "/tmp/a", false, "~", out, err),
            "silent failure still fails");
    t.check(err == "scp failed", "generic message without diagnostics");

    runner.next = SessionResult{};
    runner.next.timed_out = true;
    runner.next.exit_code = 143;
    t.check(!s.runCommand(aliceCtx(), "sleep 9", std::chrono::seconds(1), out, err),
            "timeout should fail");
    t.check(s.lastFailure() == FailureKind::Timeout, "timeout kind");

    runner.launchOk = false;
    t.check(!s.runCommand(aliceCtx(), "ls", std::chrono::seconds(1), out, err),
            "launch failure should fail");
    t.check(s.lastFailure() == FailureKind::LocalIO, "launch failure is local");
}

void test_scp_list_and_exists(TestContext &t) {
    TempDir home("home");
    RecordingRunner runner;
    IdentityResolver identity(nullptr, (home.path / "keys").string(),
                              home.path.string());
    ScpSession s(runner, identity);
    s.setAgentDiscoveryEnabled(false);
    s.setCredentials(aliceCtx());

    runner.next.std_out = "total 8\n"
                          "drwxr-xr-x 2 u g 64 Jan 1 00:00 ./\n"
                          "-rw-r--r-- 1 u g 10 Jan 1 00:00 a.txt\n";
    std::vector<RemoteEntry> entries;
    std::string err;
    t.check(s.list("~/docs/", entries, err), "list should succeed");
    t.check(entries.size() == 2 && entries[1].relative_path == "~/docs/a.txt",
            "relative paths joined with one separator");
    t.check(!runner.specs.empty() &&
                runner.specs.back().args.back() ==
                    "sh -lc " + shellQuote(buildListCommand("~/docs/")),
            "listing command sent through sh");

    runner.next = SessionResult{};
    runner.next.exit_code = 255;
    runner.next.std_err = "ssh: connect to host example.test port 22: Connection refused";
    entries.clear();
    t.check(!s.list("~", entries, err), "listing failure is surfaced");
    t.check(err == runner.next.std_err && entries.empty(),
            "listing error carries diagnostics");

    runner.next = SessionResult{};
    runner.next.std_out = "exists\n";
    bool found = false;
    t.check(s.exists("~/a.txt", found, err) && found, "exists probe true");
    runner.next.std_out = "missing\n";
    t.check(s.exists("~/b.txt", found, err) && !found, "exists probe false");
}

void test_scp_scoped_identity_access(TestContext &t) {
    TempDir home("home");
    writeFile(home.path / "granted_key", "KEY");
    FakeGrants grants;
    RecordingRunner runner;
    IdentityResolver identity(&grants, (home.path / "keys").string(),
                              home.path.string());
    ScpSession s(runner, identity, &grants);
    s.setAgentDiscoveryEnabled(false);
    auto ctx = aliceCtx();
    ctx.identity_key_token = grants.save((home.path / "granted_key").string());
    SessionResult out;
    std::string err;
    runner.next.exit_code = 1;
    s.copyToRemote(ctx, "/tmp/a", false, "~", out, err);
    t.check(grants.starts == 1 && grants.stops == 1,
            "grant released even when the copy fails");
}

// --------------------------------------------------------------- channel

void test_diagnostic_channel(TestContext &t) {
    DiagnosticChannel ch;
    ch.push({1, "a"});
    ch.push({1, "b"});
    ch.close();
    ch.push({2, "late"});
    DiagnosticChunk c;
    std::string got;
    while (ch.pop(c))
        got += c.text;
    t.check(got == "ab", "pending chunks drained, pushes after close ignored");
    t.check(ch.isClosed() && !ch.tryPop(c), "closed and empty");
}

void test_scoped_access(TestContext &t) {
    FakeGrants grants;
    {
        ScopedAccess a(&grants, std::string("/x"));
        t.check(a.active(), "access started");
        ScopedAccess none(&grants, std::nullopt);
        t.check(!none.active(), "no path, no access");
    }
    t.check(grants.starts == 1 && grants.stops == 1, "released on scope exit");
}

} // namespace

int main() {
    TestContext t;
    test_listing_directory_first(t);
    test_listing_drops_noise(t);
    test_listing_indicators(t);
    test_listing_sort_case_insensitive(t);
    test_list_command(t);
    test_exists_command(t);
    test_join_single_separator(t);
    test_remote_parent(t);
    test_identity_pub_suffix(t);
    test_identity_grant_precedence(t);
    test_identity_fallbacks(t);
    test_identity_stable_copy(t);
    test_identity_concurrent_stabilize(t);
    test_local_listing(t);
    test_local_navigator(t);
    test_transfer_transitions(t);
    test_batch_isolates_failures(t);
    test_collision_decline(t);
    test_upload_collision_confirmed(t);
    test_rejections(t);
    test_cancel_batch(t);
    test_cancel_during_collision_check(t);
    test_cancel_while_confirming(t);
    test_local_access_scoped(t);
    test_ssh_argument_template(t);
    test_agent_socket_discovery(t);
    test_scp_argument_template(t);
    test_scp_failures(t);
    test_scp_list_and_exists(t);
    test_scp_scoped_identity_access(t);
    test_diagnostic_channel(t);
    test_scoped_access(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] scpnator_core_tests\n";
    return EXIT_SUCCESS;
}
