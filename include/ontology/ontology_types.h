#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace ontoreg {

// Version selector: either "latest" (resolved through a metadata provider)
// or an already concrete version string.
class Version {
public:
    static Version latest() { return Version(); }
    static Version declared(std::string value) { return Version(std::move(value)); }

    // "latest" (case-insensitive) and an empty string map to Latest.
    static Version parse(const std::string& text);

    bool isLatest() const { return latest_; }
    const std::string& value() const { return value_; }

    std::string toString() const { return latest_ ? "latest" : value_; }

    bool operator==(const Version& other) const {
        return latest_ == other.latest_ && value_ == other.value_;
    }
    bool operator!=(const Version& other) const { return !(*this == other); }

private:
    Version() : latest_(true) {}
    explicit Version(std::string value) : latest_(false), value_(std::move(value)) {}

    bool latest_;
    std::string value_;
};

inline std::ostream& operator<<(std::ostream& os, const Version& version) {
    return os << version.toString();
}

enum class FileType {
    Json,
    Obo,
    Owl,
};

// ".json", ".obo" or ".owl"
const char* fileEnding(FileType type);

// "json", "obo" or "owl"
const char* to_string(FileType type);

// Accepts "json"/"obo"/"owl" with or without the leading dot, any case.
std::optional<FileType> parseFileType(const std::string& text);

struct OntologyMetadata {
    std::string ontology_id;
    std::string version;
    std::optional<std::string> json_file_location;
    std::optional<std::string> owl_file_location;
    std::optional<std::string> obo_file_location;
    std::optional<std::string> title;
};

}  // namespace ontoreg
