#pragma once
#include "render/IRenderHost.hpp"
#include <optional>

// Window chrome the render host adds around the content area.
// Defined outside AutoResizeController so it can be a default argument
// of the constructor (its member initializers must be complete first).
struct AutoResizeChromeOffset {
    int width  = 16;
    int height = 39;
};

// Two-stage window sizing: open at twice the requested height (no
// scrollbar can appear), measure the content, shrink once to
// measured + chrome. Only one shrink per window.
// Assumes content height does not depend on viewport height.
class AutoResizeController {
public:
    enum class Stage {
        NotStarted,
        MeasuringOversized,
        Resized             // terminal
    };

    // Window chrome the render host adds around the content area
    using ChromeOffset = AutoResizeChromeOffset;

    explicit AutoResizeController(ChromeOffset chrome = {},
                                  int paddingAllowance = 20)
        : chrome_(chrome), padding_(paddingAllowance) {}

    // NotStarted -> MeasuringOversized. Returns the content size to open
    // the window at.
    Size begin(Size requested) {
        stage_ = Stage::MeasuringOversized;
        return oversized(requested);
    }

    // MeasuringOversized -> Resized. Returns the final outer window size,
    // or nothing if a measurement was not expected (not started, or the
    // window was already resized once).
    std::optional<Size> onMeasured(Size measured) {
        if (stage_ != Stage::MeasuringOversized)
            return std::nullopt;
        stage_    = Stage::Resized;
        measured_ = measured;
        return finalSize(measured);
    }

    Size finalSize(Size measured) const {
        return {measured.width + chrome_.width,
                measured.height + chrome_.height};
    }

    static Size oversized(Size requested) {
        return {requested.width, requested.height * 2};
    }

    Stage stage() const { return stage_; }
    int padding() const { return padding_; }
    ChromeOffset chrome() const { return chrome_; }
    std::optional<Size> measured() const { return measured_; }

private:
    ChromeOffset chrome_;
    int padding_;
    Stage stage_ = Stage::NotStarted;
    std::optional<Size> measured_;
};

inline const char* stageName(AutoResizeController::Stage s) {
    switch (s) {
        case AutoResizeController::Stage::NotStarted:         return "not_started";
        case AutoResizeController::Stage::MeasuringOversized: return "measuring_oversized";
        case AutoResizeController::Stage::Resized:            return "resized";
    }
    return "unknown";
}
