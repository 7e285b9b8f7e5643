#pragma once

#include <string>

namespace jellyvr::application {

/**
 * @brief Заменить префикс внутреннего адреса Jellyfin на внешний
 *
 * URL, не начинающиеся с internalBase, возвращаются без изменений.
 * Пустой externalBase означает "внешний адрес совпадает с внутренним".
 * Граница префикса проверяется: "http://jf:80960/x" не считается
 * URL'ом хоста "http://jf:8096".
 */
inline std::string rewriteMediaUrl(const std::string& url,
                                   const std::string& internalBase,
                                   const std::string& externalBase) {
    if (externalBase.empty() || internalBase.empty() || internalBase == externalBase) {
        return url;
    }
    if (url.compare(0, internalBase.size(), internalBase) != 0) {
        return url;
    }
    if (url.size() > internalBase.size()) {
        char next = url[internalBase.size()];
        if (next != '/' && next != '?' && next != '#') {
            return url;
        }
    }
    return externalBase + url.substr(internalBase.size());
}

} // namespace jellyvr::application
