#include "AudioSession.hpp"

#include <stdexcept>
#include <utility>

namespace micviz::audio {

AudioSession::AudioSession(std::unique_ptr<IAudioInput> input, std::unique_ptr<dsp::ISpectrumAnalyser> analyser)
    : input_(std::move(input)), analyser_(std::move(analyser)) {
    if (!input_ || !analyser_) {
        throw std::invalid_argument("AudioSession needs both an audio input and an analyser");
    }
}

AudioSession::~AudioSession() {
    close();
}

bool AudioSession::open() {
    if (!input_ || !analyser_) return false;
    if (input_->is_open()) return true;

    dsp::ISpectrumAnalyser* analyser = analyser_.get();
    input_->set_process_callback([analyser](const float* in, int num_samples) {
        analyser->push_samples(in, num_samples);
    });
    if (!input_->open()) return false;
    frames_.attach(input_.get(), analyser);
    return true;
}

void AudioSession::close() {
    frames_.detach();
    if (input_) {
        // Joins the capture thread, so the callback no longer touches the analyser
        input_->close();
        input_.reset();
    }
    analyser_.reset();
}

bool AudioSession::is_open() const {
    return input_ && analyser_ && input_->is_open();
}

std::string AudioSession::input_error() const {
    return input_ ? input_->last_error() : std::string("audio input released");
}

} // namespace micviz::audio
