#include "presentation_state.hpp"

namespace micviz {

void PresentationState::publish(const Metrics& metrics) {
    metrics_ = metrics;
    ++revision_;
}

void PresentationState::publish_error(const std::string& message) {
    last_error_ = message;
    recording_ = false;
    ++revision_;
}

void PresentationState::reset(const Metrics& defaults) {
    metrics_ = defaults;
    recording_ = false;
    ++revision_;
}

void PresentationState::set_recording(bool recording) {
    if (recording_ == recording) return;
    recording_ = recording;
    ++revision_;
}

void PresentationState::clear_error() {
    if (!last_error_) return;
    last_error_.reset();
    ++revision_;
}

} // namespace micviz
