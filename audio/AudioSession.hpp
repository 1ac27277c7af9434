#pragma once

#include "SpectralFrameSource.hpp"
#include "audio_input.hpp"
#include "spectrum_analyser.hpp"

#include <memory>

namespace micviz::audio {

// One microphone + analyser pair. The input's capture callback feeds the
// analyser; frames() reads it back. Destruction closes and disposes both.
class AudioSession {
public:
    AudioSession(std::unique_ptr<IAudioInput> input, std::unique_ptr<dsp::ISpectrumAnalyser> analyser);
    ~AudioSession();

    AudioSession(const AudioSession&) = delete;
    AudioSession& operator=(const AudioSession&) = delete;

    // Connects input -> analyser and opens the input. False on failure,
    // with the backend's reason in input_error().
    bool open();
    // Closes the input, then disposes input and analyser in that order.
    void close();
    bool is_open() const;

    SpectralFrameSource& frames() { return frames_; }
    const IAudioInput* input() const { return input_.get(); }
    std::string input_error() const;

private:
    std::unique_ptr<IAudioInput> input_;
    std::unique_ptr<dsp::ISpectrumAnalyser> analyser_;
    SpectralFrameSource frames_;
};

} // namespace micviz::audio
