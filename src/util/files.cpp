#include "util/files.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace sdbx::util {

std::uintmax_t removePath(const fs::path& path) {
    if (!fs::exists(fs::symlink_status(path))) return 0;
    const auto count = fs::remove_all(path);
    log::Registry::fs()->info("[files] Removed {} ({} entries)", path.string(), count);
    return count;
}

void movePath(const fs::path& src, const fs::path& dst) {
    if (dst.has_parent_path()) fs::create_directories(dst.parent_path());

    std::error_code ec;
    fs::rename(src, dst, ec);
    if (!ec) {
        log::Registry::fs()->info("[files] Moved {} -> {}", src.string(), dst.string());
        return;
    }

    if (ec != std::errc::cross_device_link) throw fs::filesystem_error("rename", src, dst, ec);

    log::Registry::fs()->debug("[files] {} and {} are on different devices, copying", src.string(), dst.string());
    fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::copy_symlinks);
    fs::remove_all(src);
    log::Registry::fs()->info("[files] Moved {} -> {} (copy)", src.string(), dst.string());
}

bool isSameEntity(const fs::path& a, const fs::path& b) {
    if (!fs::exists(a) || !fs::exists(b)) return false;
    return fs::equivalent(a, b);
}

fs::path resolveCaseInsensitive(const fs::path& root, const fs::path& rel) {
    auto out = root;
    bool resolving = true;

    for (const auto& part : rel) {
        if (part.empty() || part == "/") continue;

        auto next = out / part;
        if (resolving && !fs::exists(fs::symlink_status(next))) {
            resolving = false;
            std::error_code ec;
            const auto wanted = toLower(part.string());
            for (fs::directory_iterator it(out, ec), end; !ec && it != end; it.increment(ec)) {
                if (toLower(it->path().filename().string()) == wanted) {
                    next = it->path();
                    resolving = true;
                    break;
                }
            }
        }
        out = std::move(next);
    }

    return out;
}

}
