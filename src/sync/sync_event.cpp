#include "sync_event.hpp"

const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::Status:   return "status";
        case EventKind::Progress: return "progress";
        case EventKind::Error:    return "error";
        case EventKind::Complete: return "complete";
        case EventKind::Done:     return "done";
    }
    return "status";
}
