#pragma once

#include "metrics.hpp"

namespace micviz {
class IAudioInput;
namespace dsp { class ISpectrumAnalyser; }
}

namespace micviz::audio {

// Read side of an open AudioSession: one poll() per analysis cycle returns
// the analyser's current spectrum. Holds non-owning pointers that the
// session clears before releasing its resources.
class SpectralFrameSource {
public:
    SpectralFrameSource() = default;

    // Throws NotOpenError when the session is closed, CaptureError when the
    // capture stream has failed. An empty frame is a valid "nothing yet".
    SpectralFrame poll();

    bool is_open() const;

private:
    friend class AudioSession;
    void attach(const IAudioInput* input, dsp::ISpectrumAnalyser* analyser);
    void detach();

    const IAudioInput* input_ = nullptr;
    dsp::ISpectrumAnalyser* analyser_ = nullptr;
};

} // namespace micviz::audio
