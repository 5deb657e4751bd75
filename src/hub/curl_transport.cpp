// curl_transport.cpp - ITransport over libcurl with a shared connection pool.

#include "hubagent/hub/curl_transport.hpp"

#include "hubagent/util/logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace hubagent::hub {

namespace {

std::once_flag g_curl_init;

struct EasyDeleter {
    void operator()(CURL* p) const { if (p) curl_easy_cleanup(p); }
};

struct SlistDeleter {
    void operator()(curl_slist* p) const { if (p) curl_slist_free_all(p); }
};

using EasyPtr = std::unique_ptr<CURL, EasyDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

struct TransferState {
    CURL* easy = nullptr;
    const Request* request = nullptr;
    const CallContext* ctx = nullptr;
    Response* response = nullptr;
    bool cancelled = false;
    bool sink_failed = false;
    std::string sink_error;
};

std::string Trim(std::string s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userp) {
    auto* st = static_cast<TransferState*>(userp);
    const size_t total = size * nmemb;

    long code = 0;
    curl_easy_getinfo(st->easy, CURLINFO_RESPONSE_CODE, &code);

    if (st->request->response_sink && code > 0 && code < 400) {
        auto r = st->request->response_sink->WriteAll(
            std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(ptr), total));
        if (!r.is_ok()) {
            st->sink_failed = true;
            st->sink_error = r.msg;
            return 0; // CURLE_WRITE_ERROR
        }
        return total;
    }

    st->response->body.append(ptr, total);
    return total;
}

size_t WriteHeader(char* ptr, size_t size, size_t nmemb, void* userp) {
    auto* st = static_cast<TransferState*>(userp);
    const size_t total = size * nmemb;
    std::string line(ptr, total);

    // A new status line starts a new header block (redirects, 1xx).
    if (line.rfind("HTTP/", 0) == 0) {
        st->response->headers.clear();
        return total;
    }

    const size_t colon = line.find(':');
    if (colon != std::string::npos) {
        st->response->headers[Trim(line.substr(0, colon))] = Trim(line.substr(colon + 1));
    }
    return total;
}

int OnProgress(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* st = static_cast<TransferState*>(userp);
    if (st->ctx->Cancelled()) {
        st->cancelled = true;
        return 1; // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

void ApplyMethod(CURL* easy, const Request& request) {
    const auto& m = request.method;
    if (m == kMethodGet) {
        curl_easy_setopt(easy, CURLOPT_HTTPGET, 1L);
    } else if (m == kMethodPost) {
        curl_easy_setopt(easy, CURLOPT_POST, 1L);
    } else if (m == "HEAD") {
        curl_easy_setopt(easy, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, m.c_str());
    }

    if (request.body) {
        curl_easy_setopt(easy, CURLOPT_POSTFIELDS, request.body->data());
        curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body->size()));
    } else if (m == kMethodPost) {
        curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, 0L);
    }
}

} // namespace

struct CurlTransport::Share {
    CURLSH* handle = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;

    static void Lock(CURL*, curl_lock_data data, curl_lock_access, void* userp) {
        static_cast<Share*>(userp)->locks[static_cast<size_t>(data)].lock();
    }

    static void Unlock(CURL*, curl_lock_data data, void* userp) {
        static_cast<Share*>(userp)->locks[static_cast<size_t>(data)].unlock();
    }
};

CurlTransport::CurlTransport(TransportConfig config)
    : config_(std::move(config)), share_(std::make_unique<Share>()) {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    if (config_.proxy.empty()) {
        if (const char* env = std::getenv("HTTP_PROXY"); env && *env) {
            config_.proxy = env;
        }
    }

    share_->handle = curl_share_init();
    if (!share_->handle) {
        throw std::runtime_error("curl_share_init failed");
    }
    curl_share_setopt(share_->handle, CURLSHOPT_LOCKFUNC, &Share::Lock);
    curl_share_setopt(share_->handle, CURLSHOPT_UNLOCKFUNC, &Share::Unlock);
    curl_share_setopt(share_->handle, CURLSHOPT_USERDATA, share_.get());
    curl_share_setopt(share_->handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(share_->handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_->handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);

    LogDebug("CurlTransport: %s, proxy=%s, ca=%s, mtls=%s",
             curl_version(),
             config_.proxy.empty() ? "none" : "set",
             config_.tls.ca_cert_path.empty() ? "system" : config_.tls.ca_cert_path.c_str(),
             config_.tls.client_cert_path.empty() ? "off" : "on");
}

CurlTransport::~CurlTransport() {
    if (share_ && share_->handle) {
        curl_share_cleanup(share_->handle);
    }
}

void CurlTransport::UpdateTlsConfig(TlsConfig tls) {
    std::lock_guard<std::mutex> lk(config_mu_);
    config_.tls = std::move(tls);
}

TlsConfig CurlTransport::CurrentTlsConfig() const {
    std::lock_guard<std::mutex> lk(config_mu_);
    return config_.tls;
}

TransportConfig CurlTransport::Snapshot() const {
    std::lock_guard<std::mutex> lk(config_mu_);
    return config_;
}

std::expected<Response, TransportError> CurlTransport::Send(const Request& request,
                                                            const CallContext& ctx) {
    if (ctx.Cancelled()) {
        return std::unexpected(TransportError{TransportErrorCode::Cancelled, "request cancelled"});
    }

    const TransportConfig cfg = Snapshot();

    auto timeout = cfg.transfer_timeout;
    if (auto remaining = ctx.Remaining()) {
        if (*remaining <= Clock::duration::zero()) {
            return std::unexpected(
                TransportError{TransportErrorCode::Timeout, "deadline exceeded before request"});
        }
        timeout = std::min(timeout,
                           std::chrono::duration_cast<std::chrono::milliseconds>(*remaining));
        if (timeout.count() == 0) timeout = std::chrono::milliseconds(1);
    }

    EasyPtr easy(curl_easy_init());
    if (!easy) {
        return std::unexpected(TransportError{TransportErrorCode::Failed, "curl_easy_init failed"});
    }
    CURL* h = easy.get();

    Response response;
    TransferState state;
    state.easy = h;
    state.request = &request;
    state.ctx = &ctx;
    state.response = &response;

    char errbuf[CURL_ERROR_SIZE]{};

    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_SHARE, share_->handle);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_PROTOCOLS_STR, "https");
    curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS_STR, "https");
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");

    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(cfg.connect_timeout.count()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPIDLE, static_cast<long>(cfg.keep_alive.count()));
    curl_easy_setopt(h, CURLOPT_TCP_KEEPINTVL, static_cast<long>(cfg.keep_alive.count()));
    curl_easy_setopt(h, CURLOPT_MAXCONNECTS, cfg.max_idle_connections);
    curl_easy_setopt(h, CURLOPT_MAXAGE_CONN, static_cast<long>(cfg.idle_connection_timeout.count()));

    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
    if (!cfg.tls.ca_cert_path.empty()) {
        curl_easy_setopt(h, CURLOPT_CAINFO, cfg.tls.ca_cert_path.c_str());
    }
    if (!cfg.tls.client_cert_path.empty() && !cfg.tls.client_key_path.empty()) {
        curl_easy_setopt(h, CURLOPT_SSLCERT, cfg.tls.client_cert_path.c_str());
        curl_easy_setopt(h, CURLOPT_SSLKEY, cfg.tls.client_key_path.c_str());
    }
    if (!cfg.proxy.empty()) {
        curl_easy_setopt(h, CURLOPT_PROXY, cfg.proxy.c_str());
    }

    ApplyMethod(h, request);

    SlistPtr header_list;
    for (const auto& [name, value] : request.headers) {
        const std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            return std::unexpected(
                TransportError{TransportErrorCode::Failed, "cannot allocate request headers"});
        }
        if (!header_list) header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    }

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &WriteBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, &WriteHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, &OnProgress);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &state);

    const CURLcode rc = curl_easy_perform(h);

    if (rc != CURLE_OK) {
        const std::string detail = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
        if (state.cancelled) {
            return std::unexpected(TransportError{TransportErrorCode::Cancelled, "request cancelled"});
        }
        if (state.sink_failed) {
            return std::unexpected(
                TransportError{TransportErrorCode::SinkFailed, "response sink: " + state.sink_error});
        }
        if (rc == CURLE_OPERATION_TIMEDOUT) {
            return std::unexpected(TransportError{TransportErrorCode::Timeout, detail});
        }
        LogDebug("CurlTransport: %s %s failed: %s",
                 request.method.c_str(), request.path.c_str(), detail.c_str());
        return std::unexpected(TransportError{TransportErrorCode::Failed, detail});
    }

    long code = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
    response.status = static_cast<int>(code);

    LogDebug("CurlTransport: %s %s -> %d", request.method.c_str(), request.path.c_str(),
             response.status);
    return response;
}

} // namespace hubagent::hub
