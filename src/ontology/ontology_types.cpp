#include "ontology/ontology_types.h"

#include "utils/string_utils.h"

namespace ontoreg {

Version Version::parse(const std::string& text) {
    const auto trimmed = trimAscii(text);
    if (trimmed.empty() || toLowerAscii(trimmed) == "latest") {
        return Version::latest();
    }
    return Version::declared(trimmed);
}

const char* fileEnding(FileType type) {
    switch (type) {
        case FileType::Json:
            return ".json";
        case FileType::Obo:
            return ".obo";
        case FileType::Owl:
            return ".owl";
    }
    return "";
}

const char* to_string(FileType type) {
    switch (type) {
        case FileType::Json:
            return "json";
        case FileType::Obo:
            return "obo";
        case FileType::Owl:
            return "owl";
    }
    return "unknown";
}

std::optional<FileType> parseFileType(const std::string& text) {
    std::string lower = toLowerAscii(trimAscii(text));
    if (!lower.empty() && lower.front() == '.') {
        lower.erase(0, 1);
    }
    if (lower == "json") return FileType::Json;
    if (lower == "obo") return FileType::Obo;
    if (lower == "owl") return FileType::Owl;
    return std::nullopt;
}

}  // namespace ontoreg
