#pragma once

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

namespace streamfetch::core {

enum class TransferErrc {
    kNotFound,      // Upload source missing
    kAlreadyExists, // Destination present, resume and overwrite disabled
    kNetwork,       // Transport, DNS or TLS failure
    kTimeout,       // Request deadline exceeded
    kHttpStatus,    // Non-success server response
    kCancelled,     // Caller-initiated
    kIo,            // Local read/write failure
};

std::string_view TransferErrcToString(TransferErrc code);

class TransferError : public std::runtime_error {
public:
    TransferError(TransferErrc code, const std::string& message);
    TransferError(unsigned int http_status, std::string body, const std::string& message);

    TransferErrc code() const noexcept { return code_; }

    // Only meaningful for kHttpStatus
    unsigned int http_status() const noexcept { return http_status_; }
    const std::string& body() const noexcept { return body_; }

    // beast::error::timeout becomes kTimeout, everything else kNetwork
    static TransferError FromNetwork(const boost::system::error_code& ec, std::string_view what);

private:
    TransferErrc code_;
    unsigned int http_status_ = 0;
    std::string body_;
};

} // namespace streamfetch::core
