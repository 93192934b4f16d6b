#pragma once

#include <nodule/result.hpp>
#include <string>

namespace nodule {

// "Fetch bytes for a URL". The core only ever sees this interface.
class Transport {
public:
    virtual ~Transport() = default;

    // Body of a successful GET. Any transport failure or HTTP status >= 400
    // is a Network error naming the URL. `accept` may be empty.
    virtual Result<std::string> get(const std::string& url,
                                    const std::string& accept) = 0;
};

struct HttpOptions {
    long timeout_seconds = 0;     // 0 = no limit
    std::string user_agent = "nodule/0.1.0";
};

// libcurl easy-handle transport. Blocking, one request at a time.
class CurlTransport : public Transport {
public:
    explicit CurlTransport(HttpOptions options = {});

    Result<std::string> get(const std::string& url,
                            const std::string& accept) override;

private:
    HttpOptions options_;
};

// Process-wide curl_global_init / curl_global_cleanup
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const { return ok_; }

private:
    bool ok_ = false;
};

} // namespace nodule
