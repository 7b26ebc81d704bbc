#include <doctest/doctest.h>
#include <bae/sdk/audio_format.hh>
#include <sstream>

using bae::audio_format;

TEST_SUITE("SDK::AudioFormat") {
    TEST_CASE("Audio format properties") {
        SUBCASE("Bit size") {
            CHECK(bae::audio_format_bit_size(audio_format::u8) == 8);
            CHECK(bae::audio_format_bit_size(audio_format::s16le) == 16);
            CHECK(bae::audio_format_bit_size(audio_format::s16be) == 16);
            CHECK(bae::audio_format_bit_size(audio_format::s24le) == 32);
            CHECK(bae::audio_format_bit_size(audio_format::s24be) == 32);
        }

        SUBCASE("Byte size") {
            CHECK(bae::audio_format_byte_size(audio_format::u8) == 1);
            CHECK(bae::audio_format_byte_size(audio_format::s16le) == 2);
            CHECK(bae::audio_format_byte_size(audio_format::s24be) == 4);
            CHECK(bae::audio_format_byte_size(audio_format::unknown) == 0);
        }

        SUBCASE("Signedness") {
            CHECK_FALSE(bae::audio_format_is_signed(audio_format::u8));
            CHECK(bae::audio_format_is_signed(audio_format::s16le));
            CHECK(bae::audio_format_is_signed(audio_format::s24be));
        }

        SUBCASE("Endianness") {
            CHECK_FALSE(bae::audio_format_is_big_endian(audio_format::u8));
            CHECK_FALSE(bae::audio_format_is_big_endian(audio_format::s16le));
            CHECK(bae::audio_format_is_big_endian(audio_format::s16be));
            CHECK_FALSE(bae::audio_format_is_big_endian(audio_format::s24le));
            CHECK(bae::audio_format_is_big_endian(audio_format::s24be));
        }
    }

    TEST_CASE("Audio format names") {
        auto name = [](audio_format fmt) {
            std::ostringstream os;
            os << fmt;
            return os.str();
        };

        CHECK(name(audio_format::unknown) == "unknown");
        CHECK(name(audio_format::u8) == "u8");
        CHECK(name(audio_format::s16le) == "s16le");
        CHECK(name(audio_format::s16be) == "s16be");
        CHECK(name(audio_format::s24le) == "s24le");
        CHECK(name(audio_format::s24be) == "s24be");
        CHECK(name(static_cast<audio_format>(0x1234)) == "audio_format(4660)");
    }
}
