#include "asset_fetcher.h"
#include "http_client.h"
#include "logger.h"
#include "path_utils.h"
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace conductor {

VoidResult CurlAssetFetcher::fetch(const std::string& url, const std::string& path) {
    if (file_exists(path)) {
        return VoidResult();
    }
    if (url.empty()) {
        return make_io_error(path + " is missing and no download URL is configured");
    }

    auto dir = ensure_directory(parent_path(path));
    if (dir.is_error()) return dir;

    const std::string partial = path + ".part";
    LOG_INFO("Downloading " + url + " -> " + path);
    auto fetched = http::download(url, partial, timeout_ms_);
    if (fetched.is_error()) {
        LOG_ERROR("Download failed: " + fetched.error().describe());
        return fetched;
    }
    if (!file_exists(partial)) {
        std::remove(partial.c_str());
        return make_io_error("Downloaded file is empty: " + url);
    }
    if (std::rename(partial.c_str(), path.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        std::remove(partial.c_str());
        return make_io_error("rename " + partial + ": " + reason);
    }
    LOG_INFO("Downloaded " + file_name(path));
    return VoidResult();
}

} // namespace conductor
