#include "ai/transport.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <memory>
#include "common/exceptions.hpp"

namespace kata {
using namespace std;

completion_transport::~completion_transport() {}

curl_global::curl_global() {
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK)
        throw internal_error(fmt::format("unable to initialize libcurl: {}", curl_easy_strerror(res)));
}

curl_global::~curl_global() {
    curl_global_cleanup();
}

static size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

// 返回非零值时 CURL 中止传输并返回 CURLE_ABORTED_BY_CALLBACK
static int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return is_cancelled(static_cast<const cancellation_token *>(clientp)) ? 1 : 0;
}

static network_failure classify_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return network_failure::TIMEOUT;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return network_failure::DNS;
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PARTIAL_FILE:
            return network_failure::CONNECTION;
        case CURLE_ABORTED_BY_CALLBACK:
            return network_failure::CANCELLED;
        default:
            return network_failure::OTHER;
    }
}

http_response curl_transport::post(const http_request &request, const cancellation_token *cancel) {
    if (is_cancelled(cancel))
        throw network_error(network_failure::CANCELLED, "request cancelled before it was sent");

    unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
        throw network_error(network_failure::OTHER, "unable to create CURL handle");

    curl_slist *raw_headers = nullptr;
    for (const string &header : request.headers)
        raw_headers = curl_slist_append(raw_headers, header.c_str());
    unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers, curl_slist_free_all);

    http_response response;
    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<cancellation_token *>(cancel));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        string message = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        DLOG(INFO) << "POST " << request.url << " failed: " << message;
        throw network_error(classify_curl_error(res), message);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    DLOG(INFO) << "POST " << request.url << " returned " << response.status_code;
    return response;
}

}  // namespace kata
