// ==============================================================================
// error.cpp - Таксономия ошибок декодирования
// ==============================================================================

#include "jumplist/error.hpp"

#include <iomanip>
#include <sstream>

namespace jumplist {

const char* error_kind_to_string(JumplistErrorKind kind) {
    switch (kind) {
    case JumplistErrorKind::Structure:
        return "structure";
    case JumplistErrorKind::UnknownVariant:
        return "unknown_variant";
    case JumplistErrorKind::EmbeddedDecode:
        return "embedded_decode";
    case JumplistErrorKind::EmptyArtifact:
        return "empty_artifact";
    case JumplistErrorKind::UnrecognizedFileType:
        return "unrecognized_file_type";
    case JumplistErrorKind::Io:
        return "io";
    }
    return "unknown";
}

std::string JumplistError::format() const {
    if (field.empty()) {
        return message;
    }
    std::ostringstream oss;
    oss << message << " (field '" << field << "' at offset 0x" << std::hex << offset << ")";
    return oss.str();
}

JumplistError JumplistError::make(JumplistErrorKind kind, std::string message) {
    JumplistError err;
    err.kind = kind;
    err.message = std::move(message);
    return err;
}

}  // namespace jumplist
