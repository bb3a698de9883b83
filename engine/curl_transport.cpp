// ============================================================
// curl_transport.cpp
// ============================================================

#include "curl_transport.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <curl/curl.h>
#include <stdexcept>

// ---------------------------------------------------------------
// libcurl callbacks
// ---------------------------------------------------------------

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::vector<u8>*>(userdata);
    size_t bytes = size * nmemb;
    body->insert(body->end(), (const u8*)ptr, (const u8*)ptr + bytes);
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<Headers*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

    // A new status line starts a new header block (redirects, 100-continue)
    if (utils::starts_with(line, "HTTP/")) {
        headers->clear();
        return bytes;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        (*headers)[utils::trim(line.substr(0, colon))] = utils::trim(line.substr(colon + 1));
    }
    return bytes;
}

struct XferContext {
    const TransportProgress* progress;
    const AbortCheck*        should_abort;
    bool                     aborted{false};
    curl_off_t               last_dl{-1};
    curl_off_t               last_ul{-1};
};

static int xferinfo_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                             curl_off_t ultotal, curl_off_t ulnow)
{
    auto* ctx = static_cast<XferContext*>(clientp);
    if (*ctx->should_abort && (*ctx->should_abort)()) {
        ctx->aborted = true;
        return 1;   // non-zero aborts the transfer
    }
    if (*ctx->progress) {
        if (ulnow != ctx->last_ul && ulnow > 0) {
            ctx->last_ul = ulnow;
            (*ctx->progress)(ProgressDirection::UPLOAD, (u64)ulnow, (u64)ultotal);
        }
        if (dlnow != ctx->last_dl && dlnow > 0) {
            ctx->last_dl = dlnow;
            (*ctx->progress)(ProgressDirection::DOWNLOAD, (u64)dlnow, (u64)dltotal);
        }
    }
    return 0;
}

static TransportStatus map_curl_code(CURLcode rc) {
    switch (rc) {
        case CURLE_OK:                  return TransportStatus::OK;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
                                        return TransportStatus::DNS_FAILED;
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:   return TransportStatus::CONNECT_FAILED;
        case CURLE_OPERATION_TIMEDOUT:  return TransportStatus::TIMED_OUT;
        case CURLE_ABORTED_BY_CALLBACK: return TransportStatus::ABORTED;
        default:                        return TransportStatus::IO_ERROR;
    }
}

// ---------------------------------------------------------------
// RAII holders
// ---------------------------------------------------------------

namespace {

struct GlobalInit {
    GlobalInit() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_global_init failed: ") +
                                     curl_easy_strerror(rc));
        }
    }
};

struct EasyHandle {
    CURL* h;
    EasyHandle() : h(curl_easy_init()) {
        if (!h) throw std::runtime_error("curl_easy_init failed");
    }
    ~EasyHandle() { curl_easy_cleanup(h); }
    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;
};

struct HeaderList {
    curl_slist* list{nullptr};
    void append(const std::string& line) {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) throw std::runtime_error("curl_slist_append failed");
        list = next;
    }
    ~HeaderList() { if (list) curl_slist_free_all(list); }
};

} // namespace

static void ensure_global_init() {
    static GlobalInit init;
}

// ---------------------------------------------------------------
// CurlTransport
// ---------------------------------------------------------------

CurlTransport::CurlTransport(CurlTransportOptions opts)
    : opts_(std::move(opts))
{
    ensure_global_init();
    LOG_DEBUG(std::string("CurlTransport using ") + curl_version());
}

TransportResult CurlTransport::perform(const TransportRequest& request,
                                       const TransportProgress& progress,
                                       const AbortCheck& should_abort)
{
    TransportResult result;
    EasyHandle easy;
    CURL* curl = easy.h;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    switch (request.method) {
        case HttpMethod::HTTP_GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::HTTP_POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            break;
        case HttpMethod::HTTP_PUT:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
            break;
        case HttpMethod::HTTP_DELETE:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
        case HttpMethod::HTTP_PATCH:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PATCH");
            break;
        case HttpMethod::HTTP_HEAD:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
    }

    // Bodies for PUT/PATCH go through POSTFIELDS too; CUSTOMREQUEST keeps the verb
    if (request.method == HttpMethod::HTTP_POST || request.method == HttpMethod::HTTP_PUT ||
        request.method == HttpMethod::HTTP_PATCH) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)request.body.size());
    }

    HeaderList headers;
    for (auto& kv : request.headers) {
        headers.append(kv.first + ": " + kv.second);
    }
    switch (request.cache_policy) {
        case CachePolicy::RELOAD_IGNORING_LOCAL_CACHE:
            if (!request.headers.count("Cache-Control")) headers.append("Cache-Control: no-cache");
            if (!request.headers.count("Pragma"))        headers.append("Pragma: no-cache");
            break;
        case CachePolicy::RETURN_CACHE_DATA_ELSE_LOAD:
            if (!request.headers.count("Cache-Control")) headers.append("Cache-Control: max-stale");
            break;
        case CachePolicy::RETURN_CACHE_DATA_DONT_LOAD:
            if (!request.headers.count("Cache-Control")) {
                headers.append("Cache-Control: only-if-cached, max-stale");
            }
            break;
        case CachePolicy::USE_PROTOCOL_CACHE_POLICY:
            break;
    }
    // Suppress "Expect: 100-continue" on large bodies
    headers.append("Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.list);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &result.headers);

    XferContext xfer{&progress, &should_abort};
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &xfer);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, (long)opts_.connect_timeout_ms);
    if (request.timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)request.timeout_ms);
    }

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, opts_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, opts_.verify_tls ? 2L : 0L);
    if (!opts_.ca_bundle.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, opts_.ca_bundle.c_str());
    }
    if (opts_.follow_redirects) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    }
    if (opts_.verbose) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    CURLcode rc = curl_easy_perform(curl);
    result.status = xfer.aborted ? TransportStatus::ABORTED : map_curl_code(rc);

    if (result.status == TransportStatus::OK) {
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        result.http_status = (int)code;
    } else {
        result.error = curl_easy_strerror(rc);
        result.body.clear();
        LOG_DEBUG(std::string(method_name(request.method)) + " " + request.url + ": " +
                  transport_status_name(result.status) + " (" + result.error + ")");
    }
    return result;
}
