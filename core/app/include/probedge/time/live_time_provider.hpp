#pragma once

#include "probedge/time/i_time_provider.hpp"

namespace probedge {

// -----------------------------------------------------------------------------
// LiveTimeProvider: system_clock backed ITimeProvider
// -----------------------------------------------------------------------------
// Used by the probedge executable. Stateless, so concurrent now_ms() calls
// need no synchronization.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace probedge
