#pragma once

#include <memory>
#include <string>

#include "counselscript/config.hpp"

namespace counselscript::net {

// Blocking HTTP(S) client for one provider endpoint
class HttpClient {
public:
    explicit HttpClient(EndpointSettings endpoint);
    virtual ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // True on a 2xx reply. response receives the body either way; transport
    // failures are logged and reported as false.
    virtual bool send_request(const std::string& method,
                              const std::string& target,
                              const std::string& body,
                              std::string& response);

    virtual int last_status() const { return last_status_; }

    const EndpointSettings& endpoint() const { return endpoint_; }

protected:
    HttpClient();   // for test doubles

    EndpointSettings endpoint_;
    int last_status_ = 0;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace counselscript::net
