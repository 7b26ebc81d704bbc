/**
 * @example 01_pan_sweep.cc
 * @brief Stereo positioning of a mono signal
 *
 * Sweeps a mono sample from hard left to hard right, prints the channel
 * levels for each position and the 16-bit PCM frames of the result.
 */

#include <bae/mono.hh>
#include <bae/stereo.hh>
#include <bae/track.hh>
#include <bae/error.hh>
#include <bae/sdk/gain.hh>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

namespace {
    double level_db(float v, float reference) {
        return bae::linear_to_db(bae::math{static_cast<double>(v) / reference}).value;
    }
}

int main(int argc, char* argv[]) {
    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [amplitude] [steps]\n";
        return 1;
    }

    try {
        const float amplitude = argc > 1 ? std::stof(argv[1]) : 0.5f;
        const int steps = argc > 2 ? std::stoi(argv[2]) : 8;
        if (steps < 1) {
            std::cerr << "steps must be positive\n";
            return 1;
        }

        const bae::sample s{amplitude};
        bae::stereo_track_t sweep;

        std::cout << std::fixed << std::setprecision(2);
        std::cout << "   pan    left dB   right dB\n";
        for (int i = 0; i <= steps; i++) {
            const float g = -1.0f + 2.0f * static_cast<float>(i) / static_cast<float>(steps);
            const auto frame = bae::pan<bae::stereo>(s, g);
            sweep.push_back(frame);

            std::cout << std::setw(6) << g
                      << std::setw(11) << level_db(frame.left.value, amplitude)
                      << std::setw(11) << level_db(frame.right.value, amplitude) << "\n";
        }

        // Mono reference: panning is a no-op for a single channel
        const auto m = bae::pan<bae::mono>(s, 0.3f);
        std::cout << "\nmono: " << m << ", as stereo: " << bae::stereo{m.into_sample()} << "\n";

        const auto pcm = bae::encode_track(sweep, bae::audio_format::s16le);
        std::cout << "\ns16le frames (" << pcm.size() << " bytes):\n" << std::hex << std::setfill('0');
        for (std::size_t i = 0; i < pcm.size(); i++) {
            std::cout << std::setw(2) << static_cast<int>(pcm[i]) << ((i % 4 == 3) ? "\n" : " ");
        }
        std::cout << std::dec;
    } catch (const bae::bae_error& e) {
        std::cerr << "bae error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
