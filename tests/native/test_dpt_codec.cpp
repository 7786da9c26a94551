#include <cassert>
#include <cmath>
#include <cstdint>
#include <limits>

#include "codec/dpt.hpp"

using knxbridge::codec::Bytes;
using knxbridge::codec::DecodeError;
using knxbridge::codec::EncodeError;
namespace dpt = knxbridge::codec::dpt;

namespace {

uint16_t raw(const Bytes &bytes) {
    return static_cast<uint16_t>((bytes[0] << 8) | bytes[1]);
}

} // namespace

int main() {
    {
        bool on = false;
        assert(dpt::decode_dpt1(Bytes{0x01}, on) == DecodeError::None);
        assert(on);
        assert(dpt::decode_dpt1(Bytes{0x00}, on) == DecodeError::None);
        assert(!on);

        // Only bit 0 is significant.
        assert(dpt::decode_dpt1(Bytes{0xFE}, on) == DecodeError::None);
        assert(!on);
        assert(dpt::decode_dpt1(Bytes{0x81}, on) == DecodeError::None);
        assert(on);

        on = true;
        assert(dpt::decode_dpt1(Bytes{}, on) == DecodeError::LengthMismatch);
        assert(dpt::decode_dpt1(Bytes{0x01, 0x00}, on) == DecodeError::LengthMismatch);
        assert(dpt::decode_dpt1(Bytes{0x01, 0x00, 0x00}, on) == DecodeError::LengthMismatch);
        assert(on);

        Bytes out;
        assert(dpt::encode_dpt1(true, out) == EncodeError::None);
        assert(out == Bytes{0x01});
        assert(dpt::encode_dpt1(false, out) == EncodeError::None);
        assert(out == Bytes{0x00});

        uint8_t small[1] = {0xAA};
        size_t written = 7;
        assert(dpt::encode_dpt1(true, small, 0, written) == EncodeError::BufferTooSmall);
        assert(written == 0);
        assert(small[0] == 0xAA);
    }

    {
        Bytes out;
        assert(dpt::encode_dpt9(21.0f, out) == EncodeError::None);
        assert(out.size() == 2);
        assert(raw(out) == 0x0C1A);

        assert(dpt::encode_dpt9(-30.0f, out) == EncodeError::None);
        assert(raw(out) == 0x8A24);

        assert(dpt::encode_dpt9(0.0f, out) == EncodeError::None);
        assert(raw(out) == 0x0000);

        float value = 0.0f;
        assert(dpt::decode_dpt9(Bytes{0x0C, 0x1A}, value) == DecodeError::None);
        assert(std::fabs(value - 21.0f) < 0.001f);

        assert(dpt::decode_dpt9(Bytes{0x8A, 0x24}, value) == DecodeError::None);
        assert(std::fabs(value + 30.0f) < 0.001f);

        // 0.01 * 2047 * 2^0
        assert(dpt::decode_dpt9(Bytes{0x07, 0xFF}, value) == DecodeError::None);
        assert(std::fabs(value - 20.47f) < 0.001f);
    }

    {
        // Saturation at both ends of the range; 0x7FFF stays reserved.
        Bytes out;
        assert(dpt::encode_dpt9(1.0e9f, out) == EncodeError::None);
        assert(raw(out) == 0x7FFE);
        assert(dpt::encode_dpt9(std::numeric_limits<float>::infinity(), out) == EncodeError::None);
        assert(raw(out) == 0x7FFE);
        assert(dpt::encode_dpt9(-1.0e9f, out) == EncodeError::None);
        assert(raw(out) == 0xF800);

        float value = 0.0f;
        assert(dpt::decode_dpt9(Bytes{0x7F, 0xFE}, value) == DecodeError::None);
        assert(std::fabs(value - 670433.28f) < 1.0f);
        assert(dpt::decode_dpt9(Bytes{0xF8, 0x00}, value) == DecodeError::None);
        assert(std::fabs(value + 671088.64f) < 1.0f);

        value = 42.0f;
        assert(dpt::decode_dpt9(Bytes{0x7F, 0xFF}, value) == DecodeError::InvalidValue);
        assert(value == 42.0f);

        assert(dpt::encode_dpt9(std::numeric_limits<float>::quiet_NaN(), out) ==
               EncodeError::NotRepresentable);
    }

    {
        float value = 5.0f;
        assert(dpt::decode_dpt9(Bytes{0x0C}, value) == DecodeError::LengthMismatch);
        assert(dpt::decode_dpt9(Bytes{0x0C, 0x1A, 0x00}, value) == DecodeError::LengthMismatch);
        assert(value == 5.0f);

        uint8_t small[1] = {0};
        size_t written = 3;
        assert(dpt::encode_dpt9(21.0f, small, sizeof(small), written) == EncodeError::BufferTooSmall);
        assert(written == 0);
    }

    {
        // Round trip stays within one quantisation step across the range.
        const float samples[] = {-273.0f, -30.5f, -0.01f, 0.01f, 19.87f, 21.5f, 100.0f, 5000.0f,
                                 123456.0f};
        for (float sample : samples) {
            Bytes out;
            assert(dpt::encode_dpt9(sample, out) == EncodeError::None);
            float decoded = 0.0f;
            assert(dpt::decode_dpt9(out, decoded) == DecodeError::None);
            assert(std::fabs(decoded - sample) <= dpt::dpt9_resolution(sample));
        }
        assert(std::fabs(dpt::dpt9_resolution(10.0f) - 0.01f) < 1e-6f);
        assert(std::fabs(dpt::dpt9_resolution(21.0f) - 0.02f) < 1e-6f);
    }

    return 0;
}
