#include "sendpath/transfer-config.hpp"

#include <stdexcept>

#include "sendpath/sendfile.hpp"

namespace sendpath {

void TransferConfig::validate() const {
  if (maxChunkBytes == 0 || maxChunkBytes > kMaxSendfileChunk) {
    throw std::invalid_argument("TransferConfig: maxChunkBytes must be between 1 and 0x7ffff000");
  }
  if (writableWaitTimeout.count() <= 0) {
    throw std::invalid_argument("TransferConfig: writableWaitTimeout must be strictly positive");
  }
  if (fallbackBufferSize == 0) {
    throw std::invalid_argument("TransferConfig: fallbackBufferSize must be greater than 0");
  }
  if (maxPooledBuffers == 0) {
    throw std::invalid_argument("TransferConfig: maxPooledBuffers must be greater than 0");
  }
  if (flushRetryBudget == 0) {
    throw std::invalid_argument("TransferConfig: flushRetryBudget must be greater than 0");
  }
}

}  // namespace sendpath
