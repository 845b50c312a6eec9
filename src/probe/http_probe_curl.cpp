/*
 * http_probe_curl.cpp
 *
 * Readiness GET via the libcurl easy API. One easy handle per probe object is
 * reused across attempts; bodies are discarded, only the status code matters.
 */

#include <v6boot/probe/readiness_prober.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <string_view>

namespace v6boot::probe {

namespace {

std::once_flag g_curlInit;

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

size_t discard_cb(char* /*ptr*/, size_t size, size_t nmemb, void* /*userdata*/) {
    return size * nmemb;
}

} // namespace

CurlHttpProbe::CurlHttpProbe() {
    std::call_once(g_curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    handle_ = curl_easy_init();
}

CurlHttpProbe::~CurlHttpProbe() {
    if (handle_) {
        curl_easy_cleanup(static_cast<CURL*>(handle_));
        handle_ = nullptr;
    }
}

Result<long> CurlHttpProbe::get(const std::string& url, Duration timeout) {
    auto* curl = static_cast<CURL*>(handle_);
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_cb);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "v6boot-readiness/1");

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        return makeCurlError(rc, "GET " + url);
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    spdlog::debug("GET {} -> {}", url, status);
    return status;
}

std::unique_ptr<IHttpProbe> makeCurlHttpProbe() {
    return std::make_unique<CurlHttpProbe>();
}

} // namespace v6boot::probe
