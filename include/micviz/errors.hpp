#pragma once

#include <stdexcept>
#include <string>

namespace micviz {

// Polling a frame source whose session is closed. This is a caller bug,
// never a runtime condition, hence a logic_error.
class NotOpenError : public std::logic_error {
public:
    explicit NotOpenError(const std::string& what) : std::logic_error(what) {}
};

// The capture stream died underneath a running session.
class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string& what) : std::runtime_error(what) {}
};

// User-facing messages published to PresentationState
inline constexpr const char* kAcquisitionErrorMessage =
    "Could not access the microphone. Check that an input device is connected "
    "and that this program is allowed to use it.";
inline constexpr const char* kAnalysisErrorMessage =
    "Audio analysis stopped unexpectedly. Press Start to try again.";

} // namespace micviz
