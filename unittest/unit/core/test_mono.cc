#include <doctest/doctest.h>
#include <bae/mono.hh>
#include "../../test_helpers.hh"
#include <cstdint>
#include <vector>

using bae::mono;
using bae::sample;

TEST_SUITE("Core::Mono") {
    TEST_CASE("Construction") {
        SUBCASE("Default is silence") {
            CHECK(mono{}.value == sample{0.0f});
            CHECK(mono{} == mono::from_sample(sample{0.0f}));
        }

        SUBCASE("From a sample") {
            mono m{sample{0.25f}};
            CHECK(m.value.value == 0.25f);

            mono implicit = sample{-0.5f};
            CHECK(implicit.value.value == -0.5f);
        }

        CHECK(mono::num_samples() == 1);
    }

    TEST_CASE("Sample conversion is the identity") {
        for (auto s : bae::test::sweep_samples()) {
            CHECK(mono::from_sample(s).into_sample() == s);
            CHECK(static_cast<sample>(mono{s}) == s);
        }
    }

    TEST_CASE("Arithmetic") {
        const mono a{sample{0.5f}};
        const mono b{sample{0.25f}};

        CHECK((-a).value.value == -0.5f);
        CHECK((a + b).value.value == doctest::Approx(0.75f));
        CHECK((a * b).value.value == doctest::Approx(0.125f));
        CHECK((a * sample{-2.0f}).value.value == doctest::Approx(-1.0f));
        CHECK((a * bae::math{0.1}).value.value == doctest::Approx(0.05f));

        SUBCASE("Subtraction subtracts") {
            CHECK((a - b).value.value == doctest::Approx(0.25f));
            CHECK((b - a).value.value == doctest::Approx(-0.25f));

            mono c = a;
            c -= b;
            CHECK(c == a - b);
        }

        SUBCASE("Addition then subtraction restores the value") {
            for (auto s : bae::test::sweep_samples()) {
                const mono x{s};
                CHECK(((x + b) - b).value.value == doctest::Approx(s.value));
            }
        }

        SUBCASE("Compound forms match the binary operators") {
            mono c = a;
            c += b;
            CHECK(c == a + b);

            c = a;
            c *= b;
            CHECK(c == a * b);

            c = a;
            c *= sample{0.3f};
            CHECK(c == a * sample{0.3f});

            c = a;
            c *= bae::math{0.3};
            CHECK(c == a * bae::math{0.3});
        }

        SUBCASE("Multiplying by silence yields silence") {
            for (auto s : bae::test::sweep_samples()) {
                CHECK(mono{s} * mono{} == mono{});
            }
        }
    }

    TEST_CASE("Integer conversion in") {
        SUBCASE("Bytes") {
            auto r = mono::try_from(std::vector<uint8_t>{255});
            REQUIRE(r.ok());
            CHECK(r.value().value.value == doctest::Approx(1.0f));
        }

        SUBCASE("16-bit") {
            auto r = mono::try_from(std::vector<int16_t>{-16384});
            REQUIRE(r.ok());
            CHECK(r.value().value.value == doctest::Approx(-0.5f));
        }

        SUBCASE("24-bit") {
            auto r = mono::try_from(std::vector<int32_t>{0x00400000});
            REQUIRE(r.ok());
            CHECK(r.value().value.value == doctest::Approx(0.5f));
        }

        SUBCASE("Extra elements are ignored") {
            auto r = mono::try_from(std::vector<int16_t>{16384, -32768, 7});
            REQUIRE(r.ok());
            CHECK(r.value() == mono::try_from(std::vector<int16_t>{16384}).value());
        }

        SUBCASE("Empty input fails") {
            const char* expected = "ERROR: Given vector was length 0. This function requires length 1.";
            CHECK(mono::try_from(std::vector<uint8_t>{}).error() == expected);
            CHECK(mono::try_from(std::vector<int16_t>{}).error() == expected);
            CHECK(mono::try_from(std::vector<int32_t>{}).error() == expected);
            CHECK_FALSE(mono::try_from(std::vector<int16_t>{}).ok());
        }
    }

    TEST_CASE("Integer conversion out") {
        const mono m{sample{-1.0f}};
        CHECK(m.to_u8() == std::vector<uint8_t>{0});
        CHECK(m.to_i16() == std::vector<int16_t>{-32768});
        CHECK(m.to_i24() == std::vector<int32_t>{0x00800000});

        for (auto s : bae::test::sweep_samples()) {
            CHECK(mono{s}.to_u8().size() == mono::num_samples());
            CHECK(mono{s}.to_i16().size() == mono::num_samples());
            CHECK(mono{s}.to_i24().size() == mono::num_samples());
        }

        SUBCASE("16-bit round trip") {
            for (int16_t v : {-32768, -12345, -1, 0, 1, 4242, 32767}) {
                const auto m2 = mono::try_from(std::vector<int16_t>{v}).value();
                REQUIRE(m2.to_i16().size() == 1);
                CHECK(bae::test::within_steps(m2.to_i16()[0], v));
            }
        }
    }

    TEST_CASE("Panning passes the sample through") {
        const sample s{0.4f};
        CHECK(bae::pan<mono>(s, -1.0f) == mono{s});
        CHECK(bae::pan<mono>(s, 0.75) == mono{s});
        CHECK(bae::pan<mono>(s, 42) == mono{s});
        CHECK(bae::panner<mono, const char*>::to_sample_format(s, "left") == mono{s});
    }
}
