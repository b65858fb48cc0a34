// assets.h - Front-end asset sources served through a custom protocol
// Assets are keyed by a normalized path: leading '/', forward slashes, no "." segments.
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_ASSETS_H
#define WEBSHELL_ASSETS_H

#include <cstdint>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/stat.h>

#include "error.h"
#include "webview.h"

namespace webshell {

// "a\\b/./c" -> "/a/b/c". Returns nullopt for keys that climb out of the root.
inline std::optional<std::string> normalizeAssetKey(const std::string& path) {
    std::vector<std::string> segments;
    std::string segment;
    std::string input = path;
    for (auto& c : input) {
        if (c == '\\') c = '/';
    }
    input += '/';

    for (char c : input) {
        if (c != '/') {
            segment += c;
            continue;
        }
        if (segment.empty() || segment == ".") {
            // skip
        } else if (segment == "..") {
            return std::nullopt;
        } else {
            segments.push_back(segment);
        }
        segment.clear();
    }

    std::string key;
    for (const auto& s : segments) {
        key += '/';
        key += s;
    }
    return key.empty() ? std::string("/") : key;
}

class Assets {
public:
    virtual ~Assets() = default;

    // key must already be normalized
    virtual std::optional<std::vector<uint8_t>> get(const std::string& key) const = 0;
};

class MemoryAssets : public Assets {
public:
    void insert(const std::string& path, std::vector<uint8_t> bytes) {
        std::optional<std::string> key = normalizeAssetKey(path);
        if (!key) {
            throw Error(ErrorKind::ASSET_NOT_FOUND, "invalid asset path " + path);
        }
        assets_[*key] = std::move(bytes);
    }

    void insert(const std::string& path, const std::string& text) {
        insert(path, std::vector<uint8_t>(text.begin(), text.end()));
    }

    std::optional<std::vector<uint8_t>> get(const std::string& key) const override {
        auto it = assets_.find(key);
        if (it == assets_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t size() const { return assets_.size(); }

private:
    std::map<std::string, std::vector<uint8_t>> assets_;
};

// Reads assets from a directory on disk
class DirectoryAssets : public Assets {
public:
    explicit DirectoryAssets(const std::string& root) : root_(root) {
        while (root_.size() > 1 && root_.back() == '/') {
            root_.pop_back();
        }
    }

    std::optional<std::vector<uint8_t>> get(const std::string& key) const override {
        std::optional<std::string> normalized = normalizeAssetKey(key);
        if (!normalized) {
            return std::nullopt;
        }
        // Directories and other special files are not assets
        std::string path = root_ + *normalized;
        struct stat sb;
        if (stat(path.c_str(), &sb) != 0 || !S_ISREG(sb.st_mode)) {
            return std::nullopt;
        }
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                    std::istreambuf_iterator<char>());
    }

private:
    std::string root_;
};

// Path part of "scheme://host/path?query#fragment"; "/" maps to "/index.html"
inline std::string assetKeyFromUrl(const std::string& url) {
    std::string path = url;
    size_t scheme = path.find("://");
    if (scheme != std::string::npos) {
        size_t pathStart = path.find('/', scheme + 3);
        path = pathStart == std::string::npos ? "/" : path.substr(pathStart);
    }
    path = path.substr(0, path.find_first_of("?#"));

    std::optional<std::string> key = normalizeAssetKey(path);
    if (!key) {
        return "";
    }
    return *key == "/" ? "/index.html" : *key;
}

// A custom protocol serving assets; throws Error(ASSET_NOT_FOUND) for unknown paths
inline UriSchemeProtocol assetProtocol(std::shared_ptr<const Assets> assets) {
    return [assets](const std::string& url) {
        std::string key = assetKeyFromUrl(url);
        std::optional<std::vector<uint8_t>> bytes;
        if (!key.empty()) {
            bytes = assets->get(key);
        }
        if (!bytes) {
            throw Error(ErrorKind::ASSET_NOT_FOUND, url);
        }
        return *bytes;
    };
}

} // namespace webshell

#endif // WEBSHELL_ASSETS_H
