#include "data_capturing/types.hpp"

namespace data_capturing {

std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::LifecycleStart:
            return "lifecycle_start";
        case EventType::LifecyclePause:
            return "lifecycle_pause";
        case EventType::LifecycleResume:
            return "lifecycle_resume";
        case EventType::LifecycleStop:
            return "lifecycle_stop";
        case EventType::ModalityTypeChange:
            return "modality_type_change";
    }
    return "unknown";
}

}  // namespace data_capturing
