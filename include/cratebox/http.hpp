#pragma once

#include <cratebox/result.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace cratebox {

// Plain HTTP GET capability. Implementations stream the response body into
// `dest`, report a non-2xx status as a Network error, and never leave a file
// at `dest` when they fail.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Status download(const std::string& url,
                            const std::filesystem::path& dest) = 0;
};

// libcurl-backed client; safe to share between threads, every download uses
// its own easy handle.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent);

    Status download(const std::string& url,
                    const std::filesystem::path& dest) override;

    const std::string& user_agent() const { return user_agent_; }

private:
    std::string user_agent_;
};

std::shared_ptr<HttpClient> make_default_http_client(const std::string& user_agent);

} // namespace cratebox
