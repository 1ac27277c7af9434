#pragma once

#include <complex>
#include <vector>

namespace micviz::fft {

inline bool is_power_of_two(int n) { return n > 0 && (n & (n - 1)) == 0; }

// Bit-reversal table and per-stage twiddles for one radix-2 transform size.
// Construction throws std::invalid_argument unless size is a power of two >= 2.
class FftPlan {
public:
    explicit FftPlan(int size);

    int size() const { return n_; }

    // In-place iterative radix-2 FFT; data.size() must equal size().
    void forward(std::vector<std::complex<float>>& data) const;

private:
    int n_;
    std::vector<int> bitrev_;
    std::vector<std::vector<std::complex<float>>> stages_;
    mutable std::vector<std::complex<float>> scratch_;
};

// Periodic Hann window of length n.
std::vector<float> hann_window(int n);

} // namespace micviz::fft
