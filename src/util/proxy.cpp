#include "hubagent/util/proxy.hpp"

#include "hubagent/util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace hubagent {

std::string ProxyUrl(const ProxyConfig& proxy) {
    std::string url = "http://";
    if (!proxy.user.empty()) {
        url += proxy.user + ":" + proxy.password + "@";
    }
    url += proxy.server;
    if (!proxy.port.empty()) {
        url += ":" + proxy.port;
    }
    return url;
}

Result UseProxy(const ProxyConfig& proxy) {
    if (proxy.server.empty()) return Result::Ok();

    if (const char* existing = std::getenv("HTTP_PROXY"); existing && *existing) {
        LogDebug("HTTP_PROXY already set, keeping it");
        return Result::Ok();
    }

    if (::setenv("HTTP_PROXY", ProxyUrl(proxy).c_str(), 1) != 0) {
        const int e = errno;
        return Result::Fail(e, std::string("setenv HTTP_PROXY: ") + std::strerror(e));
    }
    LogInfo("using HTTP proxy %s:%s", proxy.server.c_str(), proxy.port.c_str());
    return Result::Ok();
}

} // namespace hubagent
