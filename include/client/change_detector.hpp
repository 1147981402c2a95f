// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <optional>
#include <string>

namespace ipbeacon {
namespace client {

// Decide whether candidate must be pushed. An absent or invalid cached
// value always counts as changed, so the first cycle pushes. An invalid
// candidate never counts as changed (there is nothing safe to push).
bool AddressChanged(const std::string& candidate, const std::optional<std::string>& cached);

}  // namespace client
}  // namespace ipbeacon
