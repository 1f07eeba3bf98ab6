#include "sandbox/scratch_directory.hpp"
#include "core/utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace codeauditor {

ScratchDirectory::ScratchDirectory(const std::filesystem::path& root, std::string_view run_id) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        throw std::runtime_error(std::format(
            "Cannot create scratch root '{}': {}", root.string(), ec.message()));
    }

    const std::string pattern = (root / std::format("run-{}-XXXXXX", run_id)).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    // mkdtemp creates the directory with mode 0700
    if (::mkdtemp(buf.data()) == nullptr) {
        throw std::runtime_error(std::format(
            "mkdtemp('{}') failed: {}", pattern, std::strerror(errno)));
    }
    path_ = std::filesystem::path(buf.data());
}

ScratchDirectory::~ScratchDirectory() {
    remove();
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

std::filesystem::path ScratchDirectory::write_file(std::string_view file_name,
                                                   std::string_view content) const {
    const auto file_path = path_ / file_name;
    const int fd = ::open(file_path.c_str(),
                          O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, 0600);
    if (fd < 0) {
        throw std::runtime_error(std::format(
            "Cannot create '{}': {}", file_path.string(), std::strerror(errno)));
    }

    size_t written = 0;
    while (written < content.size()) {
        const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int saved = errno;
            ::close(fd);
            throw std::runtime_error(std::format(
                "Write to '{}' failed: {}", file_path.string(), std::strerror(saved)));
        }
        written += static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        throw std::runtime_error(std::format(
            "Close of '{}' failed: {}", file_path.string(), std::strerror(errno)));
    }
    return file_path;
}

void ScratchDirectory::remove() noexcept {
    if (path_.empty()) return;

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        utils::log::error(std::format("Failed to remove scratch directory '{}': {}",
                                      path_.string(), ec.message()));
    }
    path_.clear();
}

} // namespace codeauditor
