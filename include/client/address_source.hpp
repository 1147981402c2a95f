// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 AddressSource / AddressPublisher: the two collaborators of IpPoller

 AddressSource:    where the current public address comes from (AddressProber)
 AddressPublisher: where a changed address is delivered (ScpPublisher)

 Tests substitute scripted implementations.
*/

#include <functional>
#include <optional>
#include <string>

namespace ipbeacon {
namespace client {

// Polled by long-running operations; true means give up early
using StopCheck = std::function<bool()>;

class AddressSource {
public:
  virtual ~AddressSource() = default;

  // Current public address, already validated, or nullopt if it could not be
  // determined (or stop_requested fired first). Must not throw for ordinary
  // network failures.
  virtual std::optional<std::string> Probe(const StopCheck& stop_requested = {}) = 0;
};

class AddressPublisher {
public:
  virtual ~AddressPublisher() = default;

  // Deliver address to the server. Returns true only when delivery is
  // confirmed. Invalid addresses are refused.
  virtual bool Push(const std::string& address) = 0;
};

}  // namespace client
}  // namespace ipbeacon
