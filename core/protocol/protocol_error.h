#pragma once

#include <cstdint>
#include <utility>

namespace jdxi
{

    /**
     * Failure reasons shared by every encode and decode path.
     *
     * Encode-path errors are raised before any byte is produced.
     * Decode-path errors mean the inbound message should be discarded.
     */
    enum class ErrorCode : uint8_t
    {
        None = 0,
        ByteRange,        // byte argument outside 0..127
        OutOfRange,       // display value outside the parameter range
        InvalidRaw,       // raw value the parameter cannot hold
        InvalidPartial,   // partial index outside the synth's table
        UnknownParameter, // parameter id not in the section table
        UnknownBank,      // bank letter or msb/lsb pair not recognised
        SlotOutOfRange,   // program slot outside 1..64
        ParseError,       // malformed inbound message
        TruncatedMessage, // inbound message shorter than a header
        ChecksumMismatch, // trailing checksum does not match
        EmptyPayload      // DT1 without data or RQ1 with zero length
    };

    inline const char *errorName(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::None:
            return "None";
        case ErrorCode::ByteRange:
            return "ByteRange";
        case ErrorCode::OutOfRange:
            return "OutOfRange";
        case ErrorCode::InvalidRaw:
            return "InvalidRaw";
        case ErrorCode::InvalidPartial:
            return "InvalidPartial";
        case ErrorCode::UnknownParameter:
            return "UnknownParameter";
        case ErrorCode::UnknownBank:
            return "UnknownBank";
        case ErrorCode::SlotOutOfRange:
            return "SlotOutOfRange";
        case ErrorCode::ParseError:
            return "ParseError";
        case ErrorCode::TruncatedMessage:
            return "TruncatedMessage";
        case ErrorCode::ChecksumMismatch:
            return "ChecksumMismatch";
        case ErrorCode::EmptyPayload:
            return "EmptyPayload";
        }
        return "Unknown";
    }

    /**
     * Value-or-error return type.
     * value is only meaningful when ok() is true.
     */
    template <typename T>
    struct Result
    {
        T value{};
        ErrorCode error = ErrorCode::None;

        bool ok() const { return error == ErrorCode::None; }

        static Result success(T v)
        {
            Result r;
            r.value = std::move(v);
            return r;
        }

        static Result failure(ErrorCode e)
        {
            Result r;
            r.error = e;
            return r;
        }
    };

} // namespace jdxi
