#include "http_prober.h"
#include "logger.h"
#include <curl/curl.h>
#include <mutex>

#define LOG_HTTP_DEBUG(message) LOG_DEBUG("http", message)
#define LOG_HTTP_ERROR(message) LOG_ERROR("http", message)

namespace netlaunch {

namespace {

std::once_flag curl_init_flag;

size_t discard_body(char* /*ptr*/, size_t size, size_t nmemb, void* /*userdata*/) {
    return size * nmemb;
}

} // namespace

CurlHttpProber::CurlHttpProber() {
    // curl_global_init is not thread-safe and must run once per process
    std::call_once(curl_init_flag, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG_HTTP_ERROR("curl_global_init failed: " << curl_easy_strerror(rc));
        }
    });
}

ProbeOutcome CurlHttpProber::head(const std::string& url, int timeout_ms) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return ProbeOutcome::failure("Failed to initialize CURL");
    }

    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "netlaunch/1.0");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::string message = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
        if (res == CURLE_OPERATION_TIMEDOUT) {
            message = "Request timeout";
        }
        LOG_HTTP_DEBUG("HEAD " << url << " failed: " << message);
        return ProbeOutcome::failure(message);
    }

    LOG_HTTP_DEBUG("HEAD " << url << " -> " << http_code);
    return ProbeOutcome::response(static_cast<int>(http_code));
}

} // namespace netlaunch
