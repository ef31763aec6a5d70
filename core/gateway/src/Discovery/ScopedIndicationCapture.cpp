/**
 * @file ScopedIndicationCapture.cpp
 * @author BacLink Development Team
 */

#include "Discovery/ScopedIndicationCapture.h"

namespace BacLink {
namespace Discovery {

using Transport::IndicationHandler;
using Transport::InboundMessage;

ScopedIndicationCapture::ScopedIndicationCapture(
    Transport::ITransport &transport)
    : transport_(transport), buffer_(std::make_shared<Buffer>()) {
  auto buffer = buffer_;
  IndicationHandler previous = transport_.SetIndicationHandler(
      [buffer](const InboundMessage &message) {
        IndicationHandler chained;
        {
          std::lock_guard<std::mutex> lock(buffer->mutex);
          if (message.i_am) {
            buffer->items.push_back(*message.i_am);
          }
          chained = buffer->chained;
        }
        if (chained) {
          chained(message);
        }
      });

  std::lock_guard<std::mutex> lock(buffer_->mutex);
  buffer_->chained = previous;
  previous_ = std::move(previous);
}

ScopedIndicationCapture::~ScopedIndicationCapture() {
  transport_.SetIndicationHandler(previous_);
}

std::vector<Transport::IAmIndication> ScopedIndicationCapture::Drain() {
  std::lock_guard<std::mutex> lock(buffer_->mutex);
  std::vector<Transport::IAmIndication> result;
  result.swap(buffer_->items);
  return result;
}

} // namespace Discovery
} // namespace BacLink
