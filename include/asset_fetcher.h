#pragma once

#include "errors.h"
#include <string>

namespace conductor {

/**
 * @brief Makes a model or voice file available on local disk
 *
 * Providers call fetch() from prepare(); a file that is already present is
 * never downloaded again.
 */
class AssetFetcher {
public:
    virtual ~AssetFetcher() = default;

    /**
     * @brief Make sure `path` exists, downloading it from `url` if missing
     * @return IOError/NetworkError on failure, with no partial file left behind
     */
    virtual VoidResult fetch(const std::string& url, const std::string& path) = 0;
};

/**
 * @brief libcurl-backed fetcher: downloads to "<path>.part", then renames
 */
class CurlAssetFetcher : public AssetFetcher {
public:
    explicit CurlAssetFetcher(int timeout_ms = 600000) : timeout_ms_(timeout_ms) {}

    VoidResult fetch(const std::string& url, const std::string& path) override;

private:
    int timeout_ms_;
};

} // namespace conductor
