#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

#include "FileSink.hpp"


DirectorySink::DirectorySink(std::filesystem::path directory)
    : directory{std::move(directory)} {}

DirectorySink::~DirectorySink() {
    close();
}

std::filesystem::path DirectorySink::resolve(const std::string& name) const {
    std::filesystem::path leaf = std::filesystem::path(name).filename();
    if (leaf.empty() || leaf == "." || leaf == "..") {
        return {};
    }
    return directory / leaf;
}

bool DirectorySink::exists(const std::string& name) const {
    std::filesystem::path path = resolve(name);
    if (path.empty()) return false;

    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool DirectorySink::create(const std::string& name) {
    if (file_fd != -1) return false;

    std::filesystem::path path = resolve(name);
    if (path.empty()) return false;

    // O_EXCL: never truncate a file that appeared after the exists() check
    file_fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    return file_fd != -1;
}

bool DirectorySink::write(const char* data, size_t length) {
    if (file_fd == -1) return false;

    size_t total_written = 0;
    while (total_written < length) {
        ssize_t n = ::write(file_fd, data + total_written, length - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        total_written += n;
    }
    return true;
}

bool DirectorySink::close() {
    if (file_fd == -1) return true;

    int status = ::close(file_fd);
    file_fd = -1;
    return status == 0;
}
