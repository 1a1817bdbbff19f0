#include "core/FileSync.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace podfetch {
namespace core {

bool syncToDisk(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        spdlog::warn("cannot open {} to sync: {}", path, strerror(errno));
        return false;
    }
    bool ok = fsync(fd) == 0;
    if (!ok) {
        spdlog::warn("fsync {} failed: {}", path, strerror(errno));
    }
    close(fd);
    return ok;
}

} // namespace core
} // namespace podfetch
