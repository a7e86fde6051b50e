#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "network_messages.h"
#include "network_constants.h"

// Raised for payloads that cannot be turned into a command or message.
// Receivers log it and skip the single offending message.
class DecodeError : public std::runtime_error {
public:
    enum class Kind {
        Malformed,      // Not JSON, or not a JSON object
        MissingField,   // A required key is absent
        InvalidValue,   // A key has the wrong type or an out-of-range value
        UnknownType     // The "type" tag is not part of the protocol
    };

    DecodeError(Kind kind, const std::string& message);

    Kind GetKind() const { return kind; }

private:
    Kind kind;
};

const char* DecodeErrorKindToString(DecodeError::Kind kind);

// JSON text encoding shared by both channels. TCP adds a '\n' per message,
// UDP sends one message per datagram with no terminator.
namespace WireCodec {
    std::string EncodeCommand(const ClientCommand& command);
    ClientCommand DecodeCommand(const std::string& text);

    std::string EncodeMessage(const ServerMessage& message);
    ServerMessage DecodeMessage(const std::string& text);

    // Wire tag of a value, e.g. "HOST_GAME"
    const char* CommandName(const ClientCommand& command);
    const char* MessageName(const ServerMessage& message);
}

// Splits a TCP byte stream into newline-terminated lines.
// Partial reads are accumulated; the trailing partial segment is kept for the next Feed.
class LineFramer {
public:
    explicit LineFramer(std::size_t maxLineLength = NetworkConstants::MAX_LINE_LENGTH);

    // Returns every complete line (terminator and any '\r' stripped, blank lines skipped)
    std::vector<std::string> Feed(const char* data, std::size_t size);

    void Clear();

    std::size_t GetPendingSize() const { return pending.size(); }
    std::size_t GetDiscardedLineCount() const { return discardedLines; }

private:
    std::string pending;
    std::size_t maxLineLength;
    bool discarding;            // Inside an oversized line, skipping until the next '\n'
    std::size_t discardedLines;
};
