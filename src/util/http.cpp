#include <cratebox/http.hpp>
#include <cratebox/log.hpp>

#include <fstream>
#include <memory>
#include <mutex>

extern "C" {
#include <curl/curl.h>
}

namespace fs = std::filesystem;

namespace cratebox {

namespace {

void curl_easy_closer(CURL* curl) {
    if (curl != nullptr) {
        curl_easy_cleanup(curl);
    }
}

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t write_to_stream(char* data, size_t size, size_t nmemb, void* userptr) {
    auto actual_size = size * nmemb;
    auto* file = static_cast<std::ofstream*>(userptr);
    file->write(data, static_cast<std::streamsize>(actual_size));
    // Returning a short count makes curl abort with CURLE_WRITE_ERROR
    return file->good() ? actual_size : 0;
}

void remove_partial(const fs::path& dest) {
    std::error_code ec;
    fs::remove(dest, ec);
}

} // namespace

CurlHttpClient::CurlHttpClient(std::string user_agent)
    : user_agent_(std::move(user_agent)) {
    ensure_curl_global_init();
}

Status CurlHttpClient::download(const std::string& url, const fs::path& dest) {
    std::unique_ptr<CURL, decltype(&curl_easy_closer)> handle{
        curl_easy_init(), curl_easy_closer};
    if (!handle) {
        return CrateboxError{CrateboxError::Network, "curl_easy_init failed"};
    }

    std::ofstream file(dest, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot create download target", dest.string());
    }

    char error_buf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, static_cast<void*>(&file));
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, error_buf);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);

    log::debug("GET %s", url.c_str());
    CURLcode res = curl_easy_perform(handle.get());
    file.close();

    if (res != CURLE_OK) {
        remove_partial(dest);
        std::string detail = error_buf[0] != '\0' ? error_buf : curl_easy_strerror(res);
        return CrateboxError{CrateboxError::Network,
            "failed to download " + url + ": " + detail};
    }

    long status = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        remove_partial(dest);
        return CrateboxError{CrateboxError::Network,
            "failed to download " + url + ": HTTP status " + std::to_string(status)};
    }

    if (file.fail()) {
        remove_partial(dest);
        return CrateboxError::at(CrateboxError::IO,
            "failed to write downloaded data", dest.string());
    }

    return ok_status();
}

std::shared_ptr<HttpClient> make_default_http_client(const std::string& user_agent) {
    return std::make_shared<CurlHttpClient>(user_agent);
}

} // namespace cratebox
