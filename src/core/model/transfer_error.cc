#include <boost/beast/core/error.hpp>
#include <core/model/transfer_error.h>

namespace streamfetch::core {

std::string_view TransferErrcToString(TransferErrc code) {
    switch (code) {
    case TransferErrc::kNotFound:
        return "not found";
    case TransferErrc::kAlreadyExists:
        return "already exists";
    case TransferErrc::kNetwork:
        return "network";
    case TransferErrc::kTimeout:
        return "timeout";
    case TransferErrc::kHttpStatus:
        return "http status";
    case TransferErrc::kCancelled:
        return "cancelled";
    case TransferErrc::kIo:
        return "io";
    }
    return "unknown";
}

TransferError::TransferError(TransferErrc code, const std::string& message)
    : std::runtime_error(message)
    , code_(code) {}

TransferError::TransferError(unsigned int http_status, std::string body, const std::string& message)
    : std::runtime_error(message)
    , code_(TransferErrc::kHttpStatus)
    , http_status_(http_status)
    , body_(std::move(body)) {}

TransferError TransferError::FromNetwork(const boost::system::error_code& ec,
                                         std::string_view what) {
    std::string message = std::string(what) + ": " + ec.message();
    if (ec == boost::beast::error::timeout) {
        return TransferError(TransferErrc::kTimeout, message);
    }
    return TransferError(TransferErrc::kNetwork, message);
}

} // namespace streamfetch::core
