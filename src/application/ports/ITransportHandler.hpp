#pragma once

#include <memory>

#include "application/ports/ITransport.hpp"

namespace tether::initiator::application::ports
{

// Receives ownership of every transport the supervisor establishes.
struct ITransportHandler
{
  virtual ~ITransportHandler() = default;
  virtual void on_established(std::shared_ptr<ITransport> transport) = 0;
};

}  // namespace tether::initiator::application::ports
