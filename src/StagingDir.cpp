#include "StagingDir.h"
#include "Logger.h"
#include "MergeError.h"
#include <atomic>
#include <chrono>
#include <random>
#include <system_error>
#include <vector>
#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#include <signal.h>
#include <cerrno>
#endif

namespace fs = std::filesystem;

namespace {
    long current_pid() {
#ifdef _WIN32
        return static_cast<long>(_getpid());
#else
        return static_cast<long>(::getpid());
#endif
    }

    bool process_alive(long pid) {
#ifdef _WIN32
        (void)pid;
        return true;  // no cheap liveness check; never sweep on Windows
#else
        if (pid <= 0) return false;
        return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
#endif
    }

    fs::path resolve_root(const fs::path& root) {
        return root.empty() ? fs::temp_directory_path() : root;
    }

    // comicmerge_<pid>_<seq>_<rand> -> pid, or -1
    long owner_pid(const std::string& name) {
        const std::string prefix = StagingDir::PREFIX;
        if (name.compare(0, prefix.size(), prefix) != 0) return -1;
        size_t start = prefix.size();
        size_t end = name.find('_', start);
        if (end == std::string::npos || end == start) return -1;
        try {
            return std::stol(name.substr(start, end - start));
        } catch (const std::exception&) {
            return -1;
        }
    }
}

StagingDir::StagingDir(const fs::path& root) {
    static std::atomic<unsigned> sequence{0};
    std::random_device rd;
    std::mt19937 rng(rd() ^ static_cast<unsigned>(
        std::chrono::steady_clock::now().time_since_epoch().count()));

    fs::path base = resolve_root(root);
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::string name = std::string(PREFIX) + std::to_string(current_pid()) + "_" +
                           std::to_string(sequence++) + "_" + std::to_string(rng() % 1000000);
        fs::path candidate = base / name;
        std::error_code ec;
        if (fs::create_directories(candidate, ec)) {
            m_path = candidate;
            return;
        }
        if (ec) {
            throw MergeError(ErrorKind::IOFailure,
                             "cannot create staging directory " + candidate.string() + ": " + ec.message());
        }
    }
    throw MergeError(ErrorKind::IOFailure, "cannot allocate a unique staging directory under " + base.string());
}

StagingDir::~StagingDir() {
    if (m_path.empty()) return;
    std::error_code ec;
    fs::remove_all(m_path, ec);
    if (ec) Logger::warn("Failed to remove staging directory " + m_path.string() + ": " + ec.message());
}

fs::path StagingDir::subdir(const std::string& name) const {
    fs::path dir = m_path / name;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw MergeError(ErrorKind::IOFailure, "cannot create " + dir.string() + ": " + ec.message());
    return dir;
}

size_t StagingDir::sweep_stale(const fs::path& root) {
    size_t removed = 0;
    std::error_code ec;
    fs::path base = resolve_root(root);
    fs::directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) return 0;

    std::vector<fs::path> stale;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec)) continue;
        long pid = owner_pid(it->path().filename().string());
        if (pid < 0 || pid == current_pid() || process_alive(pid)) continue;
        stale.push_back(it->path());
    }

    for (const auto& dir : stale) {
        std::error_code rm_ec;
        fs::remove_all(dir, rm_ec);
        if (rm_ec) {
            Logger::warn("Cannot remove stale staging directory " + dir.string() + ": " + rm_ec.message());
        } else {
            Logger::info("Removed stale staging directory " + dir.string());
            ++removed;
        }
    }
    return removed;
}
