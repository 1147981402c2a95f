// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/change_detector.hpp"

#include "util/netaddress.hpp"

namespace ipbeacon {
namespace client {

bool AddressChanged(const std::string& candidate, const std::optional<std::string>& cached) {
  if (!util::IsValidIPv4(candidate)) {
    return false;
  }
  if (!cached || !util::IsValidIPv4(*cached)) {
    return true;
  }
  return candidate != *cached;
}

}  // namespace client
}  // namespace ipbeacon
