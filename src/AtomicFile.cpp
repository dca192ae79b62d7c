/**
 * @file AtomicFile.cpp
 * @brief POSIX temp + fsync + rename + fsync(dir)
 */

#include "composer/AtomicFile.hpp"
#include "composer/Errors.hpp"
#include "composer/Logging.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <random>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace composer {

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

// Generate a temporary filename
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    static const char hex_chars[] = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[dis(gen)];
    }
    return base + ".tmp." + suffix;
}

// fsync a directory by path; best effort, rename already happened
void fsync_directory(const std::string& dir_path) {
    int dir_fd = ::open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) {
        logger()->debug("cannot open '{}' for fsync: {}", dir_path, errno_text());
        return;
    }
    if (::fsync(dir_fd) != 0) {
        logger()->debug("fsync of '{}' failed: {}", dir_path, errno_text());
    }
    ::close(dir_fd);
}

std::string parent_directory(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

} // namespace

AtomicFile::AtomicFile(std::string target)
    : target_(std::move(target))
    , temp_path_(make_temp_filename(target_)) {
    fd_ = ::open(temp_path_.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd_ < 0) {
        throw IOError(target_, "failed to create temp file '" + temp_path_ + "': " + errno_text());
    }

    // Carry the mode of the file being replaced
    struct stat st;
    if (::stat(target_.c_str(), &st) == 0) {
        if (::fchmod(fd_, st.st_mode & 07777) != 0) {
            logger()->warn("could not copy permissions of '{}': {}", target_, errno_text());
        }
    }
}

AtomicFile::~AtomicFile() {
    if (!committed_) discard();
}

void AtomicFile::write(const std::string& content) {
    if (fd_ < 0) {
        throw IOError(target_, "write after commit or failure");
    }
    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd_, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string why = errno_text();
            discard();
            throw IOError(target_, "failed to write temp file: " + why);
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
}

void AtomicFile::commit() {
    if (fd_ < 0) {
        throw IOError(target_, "commit after failure");
    }
    if (::fsync(fd_) != 0) {
        std::string why = errno_text();
        discard();
        throw IOError(target_, "failed to fsync temp file: " + why);
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        std::string why = errno_text();
        discard();
        throw IOError(target_, "failed to close temp file: " + why);
    }
    if (::rename(temp_path_.c_str(), target_.c_str()) != 0) {
        std::string why = errno_text();
        discard();
        throw IOError(target_, "failed to rename temp file: " + why);
    }
    committed_ = true;
    fsync_directory(parent_directory(target_));
}

void AtomicFile::discard() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!temp_path_.empty()) {
        ::unlink(temp_path_.c_str());
        temp_path_.clear();
    }
}

void atomic_write_file(const std::string& path, const std::string& content) {
    AtomicFile file(path);
    file.write(content);
    file.commit();
}

} // namespace composer
