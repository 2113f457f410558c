#pragma once

#include <string>

#include "core/types.hpp"

namespace rover {

// Common entry point for every frame producer. Implementations are driven
// from one thread at a time; they are not internally synchronized.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Fills `out` with a freshly captured, encoded frame. On failure returns
    // false and sets `error` to a diagnostic suitable for the frame status.
    virtual bool produceFrame(Frame& out, std::string& error) = 0;

    // Releases any device resources. The next produceFrame() may reopen.
    virtual void close() {}
};

}  // namespace rover
