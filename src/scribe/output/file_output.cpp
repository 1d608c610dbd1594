#include "file_output.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace {

std::atomic<unsigned> temp_counter{0};

// Closes the descriptor on every exit path.
struct UniqueFd {
    int fd = -1;

    explicit UniqueFd(int f) : fd(f) {}
    ~UniqueFd() {
        if (fd >= 0) ::close(fd);
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int release() {
        int f = fd;
        fd = -1;
        return f;
    }
};

// Removes the temporary file unless the rename went through.
struct TempFileGuard {
    std::string path;
    bool committed = false;

    ~TempFileGuard() {
        if (!committed) ::unlink(path.c_str());
    }
};

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

std::expected<void, std::string> write_all(int fd, const std::string& text) {
    size_t total_written = 0;
    while (total_written < text.size()) {
        ssize_t n = ::write(fd, text.data() + total_written, text.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_message("write() failed"));
        }
        total_written += static_cast<size_t>(n);
    }
    return {};
}

// Short name in the destination's directory, so a long destination name
// cannot push it past NAME_MAX.
std::string temp_path_for(const std::string& target) {
    auto dir = std::filesystem::path(target).parent_path();
    auto name = ".scribe-" + std::to_string(::getpid()) + "-" +
                std::to_string(temp_counter.fetch_add(1)) + ".tmp";
    return (dir / name).string();
}

} // namespace

FileOutput::FileOutput(std::string path) : path_(std::move(path)) {}

std::expected<void, std::string> FileOutput::deliver(const std::string& text) {
    if (path_.empty()) {
        return std::unexpected("empty output path");
    }

    struct stat st{};
    if (::stat(path_.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            return std::unexpected("is a directory");
        }
        if (!S_ISREG(st.st_mode)) {
            return write_in_place(path_, text);
        }
        // Resolve symlinks so the rename replaces the target, not the link.
        char* resolved = ::realpath(path_.c_str(), nullptr);
        if (!resolved) {
            return std::unexpected(errno_message("realpath() failed"));
        }
        std::string target(resolved);
        std::free(resolved);
        return write_atomic(target, text);
    }

    if (errno != ENOENT) {
        return std::unexpected(errno_message("stat() failed"));
    }

    // A dangling symlink: let open() create its target.
    struct stat lst{};
    if (::lstat(path_.c_str(), &lst) == 0 && S_ISLNK(lst.st_mode)) {
        return write_in_place(path_, text);
    }

    return write_atomic(path_, text);
}

std::expected<void, std::string> FileOutput::write_atomic(const std::string& target,
                                                          const std::string& text) {
    std::string tmp = temp_path_for(target);
    UniqueFd file(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666));
    if (file.fd < 0) {
        return std::unexpected(errno_message("open() failed"));
    }
    TempFileGuard guard{tmp};

    if (auto res = write_all(file.fd, text); !res) return res;

    if (::fsync(file.fd) < 0) {
        return std::unexpected(errno_message("fsync() failed"));
    }
    if (::close(file.release()) < 0) {
        return std::unexpected(errno_message("close() failed"));
    }

    if (std::rename(tmp.c_str(), target.c_str()) < 0) {
        return std::unexpected(errno_message("rename() failed"));
    }
    guard.committed = true;
    return {};
}

std::expected<void, std::string> FileOutput::write_in_place(const std::string& target,
                                                            const std::string& text) {
    UniqueFd file(::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666));
    if (file.fd < 0) {
        return std::unexpected(errno_message("open() failed"));
    }

    if (auto res = write_all(file.fd, text); !res) return res;

    if (::close(file.release()) < 0) {
        return std::unexpected(errno_message("close() failed"));
    }
    return {};
}
