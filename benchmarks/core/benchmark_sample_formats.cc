#include <nanobench.h>
#include <bae/mono.hh>
#include <bae/stereo.hh>
#include <bae/track.hh>
#include <cmath>
#include <vector>

namespace bae::benchmark {

namespace {
    stereo_track_t make_track(std::size_t frames) {
        stereo_track_t track;
        track.reserve(frames);
        for (std::size_t i = 0; i < frames; ++i) {
            const auto s = sample{std::sin(static_cast<float>(i) * 0.01f)};
            track.push_back(stereo{s, -s});
        }
        return track;
    }
}

void register_sample_format_benchmarks(ankerl::nanobench::Bench& bench) {
    bench.title("Sample Formats");

    stereo acc{};
    const stereo step{sample{0.001f}, sample{-0.001f}};
    bench.run("stereo_add_mul_gain", [&] {
        acc += step;
        acc *= math{0.999};
        ankerl::nanobench::doNotOptimizeAway(acc);
    });

    float x = 0.1f;
    bench.run("stereo_from_into_sample", [&] {
        x = stereo::from_sample(sample{x}).into_sample().value;
        ankerl::nanobench::doNotOptimizeAway(x);
    });

    const std::vector<int16> codes{1234, -4321};
    bench.run("stereo_try_from_i16", [&] {
        auto r = stereo::try_from(codes);
        ankerl::nanobench::doNotOptimizeAway(r);
    });

    const mono m{sample{0.3f}};
    bench.run("mono_to_i24", [&] {
        auto v = m.to_i24();
        ankerl::nanobench::doNotOptimizeAway(v);
    });
}

void register_panning_benchmarks(ankerl::nanobench::Bench& bench) {
    bench.title("Panning");

    float g = -1.0f;
    bench.run("pan_stereo_float", [&] {
        g = g > 1.0f ? -1.0f : g + 0.01f;
        auto st = pan<stereo>(sample{0.5f}, g);
        ankerl::nanobench::doNotOptimizeAway(st);
    });

    double gd = -1.0;
    bench.run("pan_stereo_double", [&] {
        gd = gd > 1.0 ? -1.0 : gd + 0.01;
        auto st = pan<stereo>(sample{0.5f}, gd);
        ankerl::nanobench::doNotOptimizeAway(st);
    });
}

void register_track_benchmarks(ankerl::nanobench::Bench& bench) {
    bench.title("Tracks");

    const auto track = make_track(4096);
    bench.run("encode_track_s16le_4096", [&] {
        auto bytes = encode_track(track, audio_format::s16le);
        ankerl::nanobench::doNotOptimizeAway(bytes);
    });

    const auto bytes = encode_track(track, audio_format::s24le);
    bench.run("decode_track_s24le_4096", [&] {
        auto back = decode_track<stereo>(bytes, audio_format::s24le);
        ankerl::nanobench::doNotOptimizeAway(back);
    });

    bench.run("convert_track_to_mono_4096", [&] {
        auto down = convert_track<mono>(track);
        ankerl::nanobench::doNotOptimizeAway(down);
    });
}

} // namespace bae::benchmark
