#pragma once
#include "AutoResizeController.hpp"
#include "bridge/UIRequest.hpp"
#include "render/IRenderHost.hpp"
#include <optional>

// State of one open window. Owned and mutated only by the dispatch loop.
struct WindowSession {
    UIRequest                           request;     // holds the reply channel
    Size                                contentSize; // content area asked of the host
    std::optional<Size>                 outerSize;   // set once auto-resize applied
    std::optional<AutoResizeController> autoResize;  // set when auto_resize requested

    WindowId id() const { return request.id; }

    AutoResizeController::Stage resizeStage() const {
        return autoResize ? autoResize->stage()
                          : AutoResizeController::Stage::NotStarted;
    }
};
