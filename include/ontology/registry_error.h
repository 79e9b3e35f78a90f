#pragma once

#include <optional>
#include <string>
#include <utility>

namespace ontoreg {

enum class RegistryErrorCode : int {
    kOk = 0,
    kProvidingMetadata = 1,
    kProvidingOntology = 2,
    kNoRegistry = 3,
    kWriteFailed = 4,
    kRenameFailed = 5,
    kRemoveFailed = 6,
};

inline const char* to_string(RegistryErrorCode code) {
    switch (code) {
        case RegistryErrorCode::kOk:
            return "OK";
        case RegistryErrorCode::kProvidingMetadata:
            return "PROVIDING_METADATA";
        case RegistryErrorCode::kProvidingOntology:
            return "PROVIDING_ONTOLOGY";
        case RegistryErrorCode::kNoRegistry:
            return "NO_REGISTRY";
        case RegistryErrorCode::kWriteFailed:
            return "WRITE_FAILED";
        case RegistryErrorCode::kRenameFailed:
            return "RENAME_FAILED";
        case RegistryErrorCode::kRemoveFailed:
            return "REMOVE_FAILED";
    }
    return "UNKNOWN";
}

/// Result of registry and provider operations
template <typename T>
struct RegistryResult {
    RegistryErrorCode error{RegistryErrorCode::kOk};
    std::string error_message;
    std::optional<T> data;

    bool ok() const { return error == RegistryErrorCode::kOk; }
};

/// Specialization for operations without a payload
template <>
struct RegistryResult<void> {
    RegistryErrorCode error{RegistryErrorCode::kOk};
    std::string error_message;

    bool ok() const { return error == RegistryErrorCode::kOk; }
};

template <typename T>
RegistryResult<T> registrySuccess(T value) {
    RegistryResult<T> result;
    result.data = std::move(value);
    return result;
}

inline RegistryResult<void> registrySuccess() { return {}; }

template <typename T>
RegistryResult<T> registryFailure(RegistryErrorCode code, std::string message) {
    RegistryResult<T> result;
    result.error = code;
    result.error_message = std::move(message);
    return result;
}

// "Unable to register ontology: <message>" style text for logs and CLI output.
template <typename T>
std::string describeError(const RegistryResult<T>& result) {
    switch (result.error) {
        case RegistryErrorCode::kOk:
            return "";
        case RegistryErrorCode::kProvidingMetadata:
            return "Unable to provide metadata: " + result.error_message;
        case RegistryErrorCode::kProvidingOntology:
            return "Unable to provide ontology: " + result.error_message;
        case RegistryErrorCode::kNoRegistry:
            return "Unable to create registry: " + result.error_message;
        case RegistryErrorCode::kWriteFailed:
        case RegistryErrorCode::kRenameFailed:
            return "Unable to register ontology: " + result.error_message;
        case RegistryErrorCode::kRemoveFailed:
            return "Unable to unregister ontology: " + result.error_message;
    }
    return result.error_message;
}

}  // namespace ontoreg
