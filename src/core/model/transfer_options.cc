#include <core/model/transfer_options.h>
#include <stdexcept>

namespace streamfetch::core {

void TransferOptions::Validate() const {
    if (buffer_size == 0) {
        throw std::invalid_argument("buffer_size must be greater than zero");
    }
    if (buffer_size > transfer::kMaxBufferSize) {
        throw std::invalid_argument("buffer_size exceeds the maximum of 32 MB");
    }
    if (timeout.count() <= 0) {
        throw std::invalid_argument("timeout must be positive");
    }
    if (max_redirects < 0) {
        throw std::invalid_argument("max_redirects must not be negative");
    }
}

} // namespace streamfetch::core
