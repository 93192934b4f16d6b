#include <nodule/http.hpp>
#include <nodule/log.hpp>

#include <curl/curl.h>

#include <memory>

namespace nodule {

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) curl_easy_cleanup(curl);
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct SlistDeleter {
    void operator()(curl_slist* list) const {
        if (list) curl_slist_free_all(list);
    }
};
using SlistHandle = std::unique_ptr<curl_slist, SlistDeleter>;

static size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    size_t bytes = size * nmemb;
    body->append(ptr, bytes);
    return bytes;
}

CurlGlobal::CurlGlobal() {
    ok_ = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
}

CurlGlobal::~CurlGlobal() {
    if (ok_) curl_global_cleanup();
}

CurlTransport::CurlTransport(HttpOptions options)
    : options_(std::move(options)) {}

Result<std::string> CurlTransport::get(const std::string& url,
                                       const std::string& accept) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return NoduleError{NoduleError::Network,
            "failed to create HTTP handle for " + url};
    }

    std::string body;
    char errbuf[CURL_ERROR_SIZE] = {0};

    SlistHandle headers;
    if (!accept.empty()) {
        std::string h = "Accept: " + accept;
        headers.reset(curl_slist_append(nullptr, h.c_str()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    if (options_.timeout_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeout_seconds);
    }

    log::trace("GET %s", url.c_str());
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(res);
        return NoduleError{NoduleError::Network,
            "GET " + url + " failed: " + detail};
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    log::trace("GET %s -> %ld (%zu bytes)", url.c_str(), status, body.size());

    return Result<std::string>::ok(std::move(body));
}

} // namespace nodule
