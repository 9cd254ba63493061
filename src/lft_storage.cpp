#include "lft_storage.hpp"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstring>
#include <fstream>

namespace lft {

namespace {

bool path_exists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

} // namespace

std::string base_name(const std::string& path) {
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos) return std::string();
    size_t slash = path.rfind('/', end);
    size_t start = (slash == std::string::npos) ? 0 : slash + 1;
    return path.substr(start, end - start + 1);
}

bool read_file(const std::string& path, Bytes& out, std::string& err) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        err = path + ": " + std::strerror(errno);
        return false;
    }
    ifs.seekg(0, std::ios::end);
    std::streamoff size = ifs.tellg();
    if (size < 0) {
        err = path + ": cannot determine size";
        return false;
    }
    ifs.seekg(0, std::ios::beg);
    out.resize(static_cast<size_t>(size));
    if (!out.empty()) {
        ifs.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
        if (!ifs) {
            err = path + ": short read";
            return false;
        }
    }
    return true;
}

bool ensure_directory(const std::string& dir, std::string& err) {
    struct stat st{};
    if (::stat(dir.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) return true;
        err = dir + ": exists and is not a directory";
        return false;
    }
    if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
        err = dir + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

std::string sanitize_received_name(const std::string& name) {
    std::string b = base_name(name);
    if (b.empty() || b == "." || b == "..") return "received.bin";
    return b;
}

std::string unique_output_path(const std::string& dir, const std::string& name) {
    std::string path = join_path(dir, name);
    if (!path_exists(path)) return path;

    // Split "photo.tar.gz" as "photo.tar" + ".gz"; a leading dot is not an extension
    size_t dot = name.rfind('.');
    std::string stem = name;
    std::string ext;
    if (dot != std::string::npos && dot > 0) {
        stem = name.substr(0, dot);
        ext = name.substr(dot);
    }
    for (unsigned counter = 1;; ++counter) {
        path = join_path(dir, stem + "_" + std::to_string(counter) + ext);
        if (!path_exists(path)) return path;
    }
}

bool save_received_file(const std::string& dir, const std::string& name, const Bytes& data,
                        std::string& saved_path, std::string& err) {
    if (!ensure_directory(dir, err)) return false;
    std::string path = unique_output_path(dir, sanitize_received_name(name));

    int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
    if (fd < 0) {
        err = path + ": " + std::strerror(errno);
        return false;
    }
    size_t off = 0;
    while (off < data.size()) {
        ssize_t w = ::write(fd, data.data() + off, data.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            err = path + ": " + std::strerror(errno);
            ::close(fd);
            ::unlink(path.c_str());
            return false;
        }
        off += static_cast<size_t>(w);
    }
    bool synced = ::fsync(fd) == 0;
    int sync_errno = errno;
    if (::close(fd) != 0 || !synced) {
        err = path + ": " + std::strerror(synced ? errno : sync_errno);
        return false;
    }
    saved_path = path;
    return true;
}

} // namespace lft
