#include "core/types.hpp"

namespace rover {

const char* frameSourceName(FrameSourceKind kind) {
    switch (kind) {
        case FrameSourceKind::Hardware:
            return "hardware";
        case FrameSourceKind::Synthetic:
            return "synthetic";
    }
    return "synthetic";
}

}  // namespace rover
