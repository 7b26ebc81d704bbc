#include <doctest/doctest.h>
#include <bae/sdk/sample_codec.hh>
#include <cmath>
#include <cstdint>
#include <limits>

TEST_SUITE("SDK::SampleCodec") {
    TEST_CASE("U8 to sample conversion") {
        SUBCASE("Basic conversion") {
            // U8: 0-255, 128 = silence
            CHECK(bae::sample_from_u8(0).value == doctest::Approx(-1.0f));
            CHECK(bae::sample_from_u8(64).value == doctest::Approx(-0.5f).epsilon(0.01f));
            CHECK(bae::sample_from_u8(128).value == doctest::Approx(0.0f).epsilon(0.01f));
            CHECK(bae::sample_from_u8(192).value == doctest::Approx(0.5f).epsilon(0.01f));
            CHECK(bae::sample_from_u8(255).value == doctest::Approx(1.0f));
        }

        SUBCASE("Monotonic over the full range") {
            for (int v = 1; v < 256; v++) {
                CHECK(bae::sample_from_u8(static_cast<uint8_t>(v)).value >
                      bae::sample_from_u8(static_cast<uint8_t>(v - 1)).value);
            }
        }
    }

    TEST_CASE("Sample to U8 conversion") {
        CHECK(bae::sample_to_u8(bae::sample{-1.0f}) == 0);
        CHECK(bae::sample_to_u8(bae::sample{1.0f}) == 255);
        CHECK(bae::sample_to_u8(bae::sample{0.0f}) == 128);

        SUBCASE("Out of range values are clamped") {
            CHECK(bae::sample_to_u8(bae::sample{-3.0f}) == 0);
            CHECK(bae::sample_to_u8(bae::sample{7.5f}) == 255);
        }

        SUBCASE("Every byte survives a round trip") {
            for (int v = 0; v < 256; v++) {
                const auto b = static_cast<uint8_t>(v);
                CHECK(bae::sample_to_u8(bae::sample_from_u8(b)) == b);
            }
        }
    }

    TEST_CASE("S16 conversion") {
        SUBCASE("Basic conversion") {
            CHECK(bae::sample_from_i16(-32768).value == doctest::Approx(-1.0f));
            CHECK(bae::sample_from_i16(-16384).value == doctest::Approx(-0.5f));
            CHECK(bae::sample_from_i16(0).value == 0.0f);
            CHECK(bae::sample_from_i16(16384).value == doctest::Approx(0.5f));
            CHECK(bae::sample_from_i16(32767).value == doctest::Approx(1.0f).epsilon(0.0001f));
        }

        SUBCASE("Small values keep their sign") {
            CHECK(bae::sample_from_i16(-1).value < 0.0f);
            CHECK(bae::sample_from_i16(1).value > 0.0f);
            CHECK(std::abs(bae::sample_from_i16(1).value) < 0.001f);
        }

        SUBCASE("Edges and clamping") {
            CHECK(bae::sample_to_i16(bae::sample{-1.0f}) == std::numeric_limits<int16_t>::min());
            CHECK(bae::sample_to_i16(bae::sample{1.0f}) == std::numeric_limits<int16_t>::max());
            CHECK(bae::sample_to_i16(bae::sample{2.0f}) == std::numeric_limits<int16_t>::max());
            CHECK(bae::sample_to_i16(bae::sample{-2.0f}) == std::numeric_limits<int16_t>::min());
            CHECK(bae::sample_to_i16(bae::sample{0.0f}) == 0);
        }

        SUBCASE("NaN quantizes to silence") {
            CHECK(bae::sample_to_i16(bae::sample{std::numeric_limits<float>::quiet_NaN()}) == 0);
        }

        SUBCASE("Every value survives a round trip") {
            for (int v = std::numeric_limits<int16_t>::min(); v <= std::numeric_limits<int16_t>::max(); v += 7) {
                const auto x = static_cast<int16_t>(v);
                REQUIRE(bae::sample_to_i16(bae::sample_from_i16(x)) == x);
            }
            CHECK(bae::sample_to_i16(bae::sample_from_i16(32767)) == 32767);
        }
    }

    TEST_CASE("S24 conversion") {
        SUBCASE("Basic conversion") {
            CHECK(bae::sample_from_i24(0).value == 0.0f);
            CHECK(bae::sample_from_i24(0x00400000).value == doctest::Approx(0.5f));
            CHECK(bae::sample_from_i24(0x007FFFFF).value == doctest::Approx(1.0f).epsilon(0.0001f));
            // 0x800000 is the most negative 24-bit value
            CHECK(bae::sample_from_i24(0x00800000).value == doctest::Approx(-1.0f));
        }

        SUBCASE("Upper byte is ignored on input") {
            CHECK(bae::sample_from_i24(-1).value == bae::sample_from_i24(0x00FFFFFF).value);
            CHECK(bae::sample_from_i24(0x7F400000).value == bae::sample_from_i24(0x00400000).value);
            CHECK(bae::sample_from_i24(-8388608).value == doctest::Approx(-1.0f));
        }

        SUBCASE("Upper byte is zero on output") {
            CHECK(bae::sample_to_i24(bae::sample{-1.0f}) == 0x00800000);
            CHECK(bae::sample_to_i24(bae::sample{1.0f}) == 0x007FFFFF);
            CHECK(bae::sample_to_i24(bae::sample{-0.5f}) == 0x00C00000);
            for (float f : {-1.0f, -0.3f, 0.0f, 0.3f, 1.0f}) {
                CHECK((bae::sample_to_i24(bae::sample{f}) & ~bae::i24_mask) == 0);
            }
        }

        SUBCASE("Values survive a round trip") {
            for (int32_t v = 0; v <= bae::i24_mask; v += 4099) {
                REQUIRE(bae::sample_to_i24(bae::sample_from_i24(v)) == v);
            }
            CHECK(bae::sample_to_i24(bae::sample_from_i24(0x007FFFFF)) == 0x007FFFFF);
            CHECK(bae::sample_to_i24(bae::sample_from_i24(0x00800000)) == 0x00800000);
        }
    }
}
