#include "filmlist_resolver/core/models.hpp"

namespace filmlist_resolver {
namespace core {

std::string to_string(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "File not found";
        case ConfigError::InvalidFormat: return "Invalid format";
        case ConfigError::ValidationError: return "Validation failed";
        case ConfigError::PermissionDenied: return "Permission denied";
        default: return "Unknown error";
    }
}

std::string to_string(LookupError error) {
    switch (error) {
        case LookupError::NetworkError: return "Network error";
        case LookupError::HttpError: return "HTTP error";
        case LookupError::ParseError: return "Parse error";
        case LookupError::InvalidResponse: return "Invalid response";
        default: return "Unknown error";
    }
}

std::string to_string(TranslationError error) {
    switch (error) {
        case TranslationError::NetworkError: return "Network error";
        case TranslationError::HttpError: return "HTTP error";
        case TranslationError::ParseError: return "Parse error";
        default: return "Unknown error";
    }
}

std::string to_string(ExtractError error) {
    switch (error) {
        case ExtractError::FileNotFound: return "File not found";
        case ExtractError::ReadFailed: return "Read failed";
        case ExtractError::NoTableFound: return "No movie data found";
        case ExtractError::NoEntriesFound: return "No valid movie entries found";
        default: return "Unknown error";
    }
}

std::string to_string(WriteError error) {
    switch (error) {
        case WriteError::DirectoryUnavailable: return "Output directory unavailable";
        case WriteError::OpenFailed: return "Cannot open file for writing";
        case WriteError::WriteFailed: return "Write failed";
        default: return "Unknown error";
    }
}

} // namespace core
} // namespace filmlist_resolver
