#include "value_codec.h"
#include <cctype>

namespace jdxi
{
    namespace ValueCodec
    {

        namespace
        {
            // Round-half-up integer division for non-negative numerators.
            int divRound(long long num, long long den)
            {
                return static_cast<int>((2 * num + den) / (2 * den));
            }

            bool equalsIgnoreCase(const char *a, const std::string &b)
            {
                size_t i = 0;
                for (; a[i] != '\0'; ++i)
                {
                    if (i >= b.size())
                        return false;
                    if (std::tolower(static_cast<unsigned char>(a[i])) !=
                        std::tolower(static_cast<unsigned char>(b[i])))
                        return false;
                }
                return i == b.size();
            }
        }

        Result<int> toRaw(const ParameterSpec &spec, int display)
        {
            if (display < spec.displayMin || display > spec.displayMax)
                return Result<int>::failure(ErrorCode::OutOfRange);

            switch (spec.encoding)
            {
            case ValueEncoding::Unsigned:
            {
                const long long rawSpan = spec.rawMax - spec.rawMin;
                const long long displaySpan = spec.displayMax - spec.displayMin;
                if (displaySpan == 0)
                    return Result<int>::success(spec.rawMin);

                int raw = spec.rawMin + divRound((display - spec.displayMin) * rawSpan, displaySpan);
                if (raw < spec.rawMin)
                    raw = spec.rawMin;
                if (raw > spec.rawMax)
                    raw = spec.rawMax;
                return Result<int>::success(raw);
            }

            case ValueEncoding::SignedOffset:
            {
                const int raw = spec.center + display;
                if (raw < spec.rawMin || raw > spec.rawMax)
                    return Result<int>::failure(ErrorCode::OutOfRange);
                return Result<int>::success(raw);
            }

            case ValueEncoding::Enum:
            {
                if (spec.options == nullptr || display >= spec.options->numOptions)
                    return Result<int>::failure(ErrorCode::OutOfRange);
                return Result<int>::success(spec.options->options[display].raw);
            }
            }
            return Result<int>::failure(ErrorCode::OutOfRange);
        }

        Result<int> toDisplay(const ParameterSpec &spec, int raw)
        {
            if (raw < spec.rawMin || raw > spec.rawMax)
                return Result<int>::failure(ErrorCode::InvalidRaw);

            switch (spec.encoding)
            {
            case ValueEncoding::Unsigned:
            {
                const long long rawSpan = spec.rawMax - spec.rawMin;
                const long long displaySpan = spec.displayMax - spec.displayMin;
                if (rawSpan == 0)
                    return Result<int>::success(spec.displayMin);

                int display = spec.displayMin + divRound((raw - spec.rawMin) * displaySpan, rawSpan);
                if (display > spec.displayMax)
                    display = spec.displayMax;
                return Result<int>::success(display);
            }

            case ValueEncoding::SignedOffset:
                return Result<int>::success(raw - spec.center);

            case ValueEncoding::Enum:
            {
                if (spec.options == nullptr)
                    return Result<int>::failure(ErrorCode::InvalidRaw);
                for (uint8_t i = 0; i < spec.options->numOptions; ++i)
                {
                    if (spec.options->options[i].raw == raw)
                        return Result<int>::success(i);
                }
                return Result<int>::failure(ErrorCode::InvalidRaw);
            }
            }
            return Result<int>::failure(ErrorCode::InvalidRaw);
        }

        Result<int> optionIndex(const ParameterSpec &spec, const std::string &label)
        {
            if (spec.encoding != ValueEncoding::Enum || spec.options == nullptr)
                return Result<int>::failure(ErrorCode::OutOfRange);

            for (uint8_t i = 0; i < spec.options->numOptions; ++i)
            {
                if (equalsIgnoreCase(spec.options->options[i].label, label))
                    return Result<int>::success(i);
            }
            return Result<int>::failure(ErrorCode::OutOfRange);
        }

        Result<int> toRawFromLabel(const ParameterSpec &spec, const std::string &label)
        {
            auto index = optionIndex(spec, label);
            if (!index.ok())
                return index;
            return toRaw(spec, index.value);
        }

        const char *optionLabel(const ParameterSpec &spec, int display)
        {
            if (spec.encoding != ValueEncoding::Enum || spec.options == nullptr)
                return nullptr;
            if (display < 0 || display >= spec.options->numOptions)
                return nullptr;
            return spec.options->options[display].label;
        }

        Result<std::vector<uint8_t>> encodeRaw(const ParameterSpec &spec, int raw)
        {
            if (spec.size > 1)
            {
                // One nibble per byte, most significant first
                const int bits = 4 * spec.size;
                if (raw < 0 || raw >= (1 << bits))
                    return Result<std::vector<uint8_t>>::failure(ErrorCode::ByteRange);

                std::vector<uint8_t> bytes;
                for (int shift = bits - 4; shift >= 0; shift -= 4)
                    bytes.push_back(static_cast<uint8_t>((raw >> shift) & 0x0F));
                return Result<std::vector<uint8_t>>::success(bytes);
            }

            if (raw < 0 || raw > 0x7F)
                return Result<std::vector<uint8_t>>::failure(ErrorCode::ByteRange);
            return Result<std::vector<uint8_t>>::success({static_cast<uint8_t>(raw)});
        }

        Result<int> decodeRaw(const ParameterSpec &spec, const uint8_t *data, size_t count)
        {
            if (data == nullptr || count != spec.size)
                return Result<int>::failure(ErrorCode::InvalidRaw);

            if (spec.size > 1)
            {
                int value = 0;
                for (size_t i = 0; i < count; ++i)
                {
                    if (data[i] > 0x0F)
                        return Result<int>::failure(ErrorCode::InvalidRaw);
                    value = (value << 4) | data[i];
                }
                return Result<int>::success(value);
            }

            if (data[0] > 0x7F)
                return Result<int>::failure(ErrorCode::InvalidRaw);
            return Result<int>::success(data[0]);
        }

    } // namespace ValueCodec
} // namespace jdxi
