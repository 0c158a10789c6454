#include "accrete/domain.hpp"
#include "accrete/utility.hpp"

namespace accrete {

std::string_view to_string(CiStage stage) {
    switch (stage) {
    case CiStage::Build:
        return "build";
    case CiStage::Test:
        return "test";
    case CiStage::Report:
        return "report";
    }
    return "unknown";
}

std::optional<CiStage> parse_ci_stage(std::string_view text) {
    if (text == "build")
        return CiStage::Build;
    if (text == "test")
        return CiStage::Test;
    if (text == "report")
        return CiStage::Report;
    return std::nullopt;
}

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MissingField:
        return "MissingField";
    case ErrorKind::MalformedCache:
        return "MalformedCache";
    case ErrorKind::EmptyIdentifier:
        return "EmptyIdentifier";
    case ErrorKind::InvalidPath:
        return "InvalidPath";
    case ErrorKind::InvalidEncoding:
        return "InvalidEncoding";
    case ErrorKind::DuplicateRuleName:
        return "DuplicateRuleName";
    case ErrorKind::DuplicateOutput:
        return "DuplicateOutput";
    case ErrorKind::DependencyCycle:
        return "DependencyCycle";
    case ErrorKind::ConcurrentModification:
        return "ConcurrentModification";
    case ErrorKind::Io:
        return "Io";
    case ErrorKind::Usage:
        return "Usage";
    }
    return "Unknown";
}

} // namespace accrete
