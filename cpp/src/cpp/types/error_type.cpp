#include <opbridge/types/error_type.h>

namespace opbridge {

    std::string_view error_type_name(const std::exception &e) noexcept {
        if (auto *bridge_error = dynamic_cast<const BridgeError *>(&e); bridge_error != nullptr) {
            return bridge_error->error_type();
        }
        return "HandlerExecutionError";
    }

}  // namespace opbridge
