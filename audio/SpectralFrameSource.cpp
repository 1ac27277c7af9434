#include "SpectralFrameSource.hpp"

#include "audio_input.hpp"
#include "errors.hpp"
#include "spectrum_analyser.hpp"

namespace micviz::audio {

void SpectralFrameSource::attach(const IAudioInput* input, dsp::ISpectrumAnalyser* analyser) {
    input_ = input;
    analyser_ = analyser;
}

void SpectralFrameSource::detach() {
    input_ = nullptr;
    analyser_ = nullptr;
}

bool SpectralFrameSource::is_open() const {
    return input_ && analyser_ && input_->is_open();
}

SpectralFrame SpectralFrameSource::poll() {
    if (!is_open()) {
        throw NotOpenError("SpectralFrameSource::poll() called without an open audio session");
    }
    if (input_->stream_failed()) {
        throw CaptureError("capture stream failed: " + input_->last_error());
    }
    return analyser_->get_value();
}

} // namespace micviz::audio
