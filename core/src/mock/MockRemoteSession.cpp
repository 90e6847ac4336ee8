#include "scpnator/MockRemoteSession.hpp"
#include "scpnator/RemoteListing.hpp"
#include "scpnator/RemotePath.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace scpnator {

namespace {

// "~/a/b" -> {"~/a", "b"}; sin barra el padre es "~".
std::pair<std::string, std::string> splitParent(const std::string& path) {
  std::string p = path;
  if (p.size() > 1 && p.back() == '/') p.pop_back();
  const auto pos = p.find_last_of('/');
  if (pos == std::string::npos) return {"~", p};
  return {pos == 0 ? "/" : p.substr(0, pos), p.substr(pos + 1)};
}

std::string normalizedDir(const std::string& path) {
  if (path.empty() || path == ".") return "~";
  std::string p = path;
  while (p.size() > 1 && p.back() == '/') p.pop_back();
  return p;
}

} // namespace

MockRemoteSession::MockRemoteSession() {
  addDirectory("~/proyectos");
  addDirectory("~/logs");
  addFile("~/readme.txt");
  addFile("~/foto.jpg");
  addFile("~/proyectos/notas.md");
  addFile("~/logs/app.log");
}

void MockRemoteSession::insertEntry(const std::string& dir, RemoteEntry entry) {
  auto& entries = tree_[dir];
  auto it = std::find_if(entries.begin(), entries.end(),
                         [&](const RemoteEntry& e) { return e.name == entry.name; });
  if (it != entries.end()) *it = std::move(entry);
  else entries.push_back(std::move(entry));
}

void MockRemoteSession::addDirectory(const std::string& path) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string dir = normalizedDir(path);
  tree_[dir];
  if (dir == "~" || dir == "/") return;
  const auto parts = splitParent(dir);
  insertEntry(parts.first, makeRemoteEntry(parts.second, RemoteEntryKind::Directory,
                                           dir));
}

void MockRemoteSession::addFile(const std::string& path) {
  std::lock_guard<std::mutex> lk(mtx_);
  const auto parts = splitParent(path);
  insertEntry(parts.first, makeRemoteEntry(parts.second, RemoteEntryKind::File, path));
}

void MockRemoteSession::clearTree() {
  std::lock_guard<std::mutex> lk(mtx_);
  tree_.clear();
  tree_["~"];
}

void MockRemoteSession::failCopyOf(const std::string& path, const std::string& stderrText) {
  std::lock_guard<std::mutex> lk(mtx_);
  copyFailures_[path] = stderrText;
}

void MockRemoteSession::failListingOf(const std::string& path, const std::string& stderrText) {
  std::lock_guard<std::mutex> lk(mtx_);
  listFailures_[normalizedDir(path)] = stderrText;
}

void MockRemoteSession::record(Invocation inv) {
  log_.push_back(std::move(inv));
}

std::vector<MockRemoteSession::Invocation> MockRemoteSession::invocations() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return log_;
}

std::size_t MockRemoteSession::countOf(Invocation::Op op) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return static_cast<std::size_t>(std::count_if(
      log_.begin(), log_.end(), [op](const Invocation& i) { return i.op == op; }));
}

FailureKind MockRemoteSession::lastFailure() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return lastFailure_;
}

bool MockRemoteSession::execute(const std::string& command,
                                std::chrono::milliseconds,
                                SessionResult& out,
                                std::string&) {
  std::lock_guard<std::mutex> lk(mtx_);
  record({Invocation::Op::Execute, command, false, {}});
  out = SessionResult{};
  out.std_out = "mock\n";
  lastFailure_ = FailureKind::None;
  return true;
}

bool MockRemoteSession::list(const std::string& remote_path,
                             std::vector<RemoteEntry>& out,
                             std::string& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  record({Invocation::Op::List, remote_path, true, {}});
  const std::string dir = normalizedDir(remote_path);
  auto failed = listFailures_.find(dir);
  if (failed != listFailures_.end()) {
    err = failed->second;
    lastFailure_ = FailureKind::AuthenticationOrConnection;
    return false;
  }
  auto it = tree_.find(dir);
  if (it == tree_.end()) {
    err = "ls: cannot access '" + dir + "': No such file or directory";
    lastFailure_ = FailureKind::AuthenticationOrConnection;
    return false;
  }
  out.clear();
  out.push_back(makeRemoteEntry(".", RemoteEntryKind::Directory,
                                joinRemotePath(remote_path, ".")));
  out.push_back(makeRemoteEntry("..", RemoteEntryKind::Directory,
                                joinRemotePath(remote_path, "..")));
  for (const auto& e : it->second)
    out.push_back(makeRemoteEntry(e.name, e.kind, joinRemotePath(remote_path, e.name)));
  sortRemoteEntries(out);
  lastFailure_ = FailureKind::None;
  return true;
}

bool MockRemoteSession::exists(const std::string& remote_path,
                               bool& exists,
                               std::string&) {
  std::lock_guard<std::mutex> lk(mtx_);
  record({Invocation::Op::Exists, remote_path, false, {}});
  const auto parts = splitParent(remote_path);
  exists = false;
  auto it = tree_.find(normalizedDir(parts.first));
  if (it != tree_.end()) {
    exists = std::any_of(it->second.begin(), it->second.end(),
                         [&](const RemoteEntry& e) { return e.name == parts.second; });
  }
  lastFailure_ = FailureKind::None;
  return true;
}

bool MockRemoteSession::download(const std::string& remote_path,
                                 bool is_dir,
                                 const std::string& local_dir,
                                 std::string& err,
                                 ProgressCB progress,
                                 CancelCB shouldCancel) {
  std::string failure;
  bool failing = false;
  bool materialize = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    record({Invocation::Op::Download, remote_path, is_dir, local_dir});
    auto f = copyFailures_.find(remote_path);
    failing = f != copyFailures_.end();
    if (failing) failure = f->second;
    materialize = materialize_;
  }
  if (shouldCancel && shouldCancel()) {
    err = "Canceled";
    std::lock_guard<std::mutex> lk(mtx_);
    lastFailure_ = FailureKind::Canceled;
    return false;
  }
  if (progress) progress("debug1: Sending command: scp -v -f " + remote_path + "\n");
  if (failing) {
    if (progress) progress(failure);
    err = failure.empty() ? "scp failed" : failure;
    std::lock_guard<std::mutex> lk(mtx_);
    lastFailure_ = FailureKind::AuthenticationOrConnection;
    return false;
  }
  if (materialize) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path dst = fs::path(local_dir) / lastPathComponent(remote_path);
    if (is_dir) {
      fs::create_directories(dst, ec);
    } else {
      std::ofstream f(dst, std::ios::binary | std::ios::trunc);
      if (!f) ec = std::make_error_code(std::errc::io_error);
    }
    if (ec) {
      err = "No se pudo escribir en " + dst.string();
      std::lock_guard<std::mutex> lk(mtx_);
      lastFailure_ = FailureKind::LocalIO;
      return false;
    }
  }
  if (progress) progress("debug1: Exit status 0\n");
  std::lock_guard<std::mutex> lk(mtx_);
  lastFailure_ = FailureKind::None;
  return true;
}

bool MockRemoteSession::upload(const std::string& local_path,
                               bool is_dir,
                               const std::string& remote_dir,
                               std::string& err,
                               ProgressCB progress,
                               CancelCB shouldCancel) {
  std::string failure;
  bool failing = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    record({Invocation::Op::Upload, local_path, is_dir, remote_dir});
    auto f = copyFailures_.find(local_path);
    failing = f != copyFailures_.end();
    if (failing) failure = f->second;
  }
  if (shouldCancel && shouldCancel()) {
    err = "Canceled";
    std::lock_guard<std::mutex> lk(mtx_);
    lastFailure_ = FailureKind::Canceled;
    return false;
  }
  if (progress) progress("debug1: Sending command: scp -v -t " + remote_dir + "\n");
  if (failing) {
    if (progress) progress(failure);
    err = failure.empty() ? "scp failed" : failure;
    std::lock_guard<std::mutex> lk(mtx_);
    lastFailure_ = FailureKind::AuthenticationOrConnection;
    return false;
  }
  const std::string name = lastPathComponent(local_path);
  const std::string dir = normalizedDir(remote_dir);
  std::lock_guard<std::mutex> lk(mtx_);
  insertEntry(dir, makeRemoteEntry(name, is_dir ? RemoteEntryKind::Directory
                                                : RemoteEntryKind::File,
                                   joinRemotePath(dir, name)));
  if (is_dir) tree_[joinRemotePath(dir, name)];
  lastFailure_ = FailureKind::None;
  if (progress) progress("debug1: Exit status 0\n");
  return true;
}

} // namespace scpnator
