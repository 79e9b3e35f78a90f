#include "ontology/file_system_ontology_registry.h"

#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ontoreg {

namespace {

bool pathExists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

void removeTempFile(const fs::path& temp_path) {
    std::error_code ec;
    fs::remove(temp_path, ec);
    if (ec) {
        spdlog::debug("FileSystemOntologyRegistry: could not remove temporary file '{}': {}",
                      temp_path.string(), ec.message());
    }
}

fs::path absoluteOrSame(fs::path path) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    return ec ? path : absolute;
}

}  // namespace

FileSystemOntologyRegistry::FileSystemOntologyRegistry(
    fs::path registry_path,
    std::shared_ptr<const OntologyMetadataProvider> metadata_provider,
    std::shared_ptr<const OntologyProvider> ontology_provider)
    : registry_path_(absoluteOrSame(std::move(registry_path))),
      metadata_provider_(std::move(metadata_provider)),
      ontology_provider_(std::move(ontology_provider)) {}

std::string FileSystemOntologyRegistry::registryFileName(const std::string& ontology_id,
                                                         const std::string& version,
                                                         FileType file_type) {
    return ontology_id + "_" + version + fileEnding(file_type);
}

std::string FileSystemOntologyRegistry::providerFileName(const std::string& ontology_id,
                                                         FileType file_type) {
    return ontology_id + fileEnding(file_type);
}

RegistryResult<std::string> FileSystemOntologyRegistry::resolveVersion(const std::string& ontology_id,
                                                                       const Version& version) const {
    if (!version.isLatest()) {
        return registrySuccess(version.value());
    }
    if (!metadata_provider_) {
        return registryFailure<std::string>(RegistryErrorCode::kProvidingMetadata,
                                            "no metadata provider configured to resolve '" +
                                                ontology_id + "'");
    }

    auto metadata = metadata_provider_->provideMetadata(ontology_id);
    if (!metadata.ok() || !metadata.data) {
        return registryFailure<std::string>(RegistryErrorCode::kProvidingMetadata,
                                            std::move(metadata.error_message));
    }
    if (metadata.data->version.empty()) {
        return registryFailure<std::string>(RegistryErrorCode::kProvidingMetadata,
                                            "Version not found for " + ontology_id);
    }
    return registrySuccess(std::move(metadata.data->version));
}

RegistryResult<fs::path> FileSystemOntologyRegistry::registerOntology(const std::string& ontology_id,
                                                                      const Version& version,
                                                                      FileType file_type) {
    auto resolved = resolveVersion(ontology_id, version);
    if (!resolved.ok()) {
        spdlog::warn("FileSystemOntologyRegistry: unable to resolve version '{}' of '{}': {}",
                     version.toString(), ontology_id, resolved.error_message);
        return registryFailure<fs::path>(resolved.error, std::move(resolved.error_message));
    }
    const std::string& resolved_version = *resolved.data;

    const auto registry_file_name = registryFileName(ontology_id, resolved_version, file_type);
    const auto out_path = registry_path_ / registry_file_name;

    if (pathExists(out_path)) {
        spdlog::debug("FileSystemOntologyRegistry: '{}' already registered", out_path.string());
        return registrySuccess(out_path);
    }

    std::error_code ec;
    fs::create_directories(registry_path_, ec);
    std::error_code is_dir_ec;
    if (ec && !fs::is_directory(registry_path_, is_dir_ec)) {
        spdlog::warn("FileSystemOntologyRegistry: unable to create registry '{}': {}",
                     registry_path_.string(), ec.message());
        return registryFailure<fs::path>(RegistryErrorCode::kNoRegistry,
                                         "'" + registry_path_.string() + "': " + ec.message());
    }

    if (!ontology_provider_) {
        return registryFailure<fs::path>(RegistryErrorCode::kProvidingOntology,
                                         "no ontology provider configured");
    }
    const auto provider_file_name = providerFileName(ontology_id, file_type);
    auto content = ontology_provider_->provideOntology(ontology_id, provider_file_name, resolved_version);
    if (!content.ok() || !content.data) {
        spdlog::warn("FileSystemOntologyRegistry: unable to fetch '{}' version '{}': {}",
                     provider_file_name, resolved_version, content.error_message);
        return registryFailure<fs::path>(RegistryErrorCode::kProvidingOntology,
                                         std::move(content.error_message));
    }
    spdlog::debug("FileSystemOntologyRegistry: fetched '{}' version '{}' bytes={}",
                  provider_file_name, resolved_version, content.data->size());

    std::lock_guard<std::mutex> lock(write_mutex_);

    if (pathExists(out_path)) {
        spdlog::debug("FileSystemOntologyRegistry: '{}' was registered by another thread",
                      out_path.string());
        return registrySuccess(out_path);
    }

    const auto temp_path = registry_path_ / (registry_file_name + ".tmp");
    {
        std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            removeTempFile(temp_path);
            return registryFailure<fs::path>(RegistryErrorCode::kWriteFailed,
                                             "Unable to create temporary file '" + temp_path.string() + "'");
        }
        ofs.write(content.data->data(), static_cast<std::streamsize>(content.data->size()));
        ofs.flush();
        if (!ofs.good()) {
            ofs.close();
            removeTempFile(temp_path);
            return registryFailure<fs::path>(RegistryErrorCode::kWriteFailed,
                                             "Unable to write to temporary file '" + temp_path.string() + "'");
        }
    }

    fs::rename(temp_path, out_path, ec);
    if (ec) {
        removeTempFile(temp_path);
        return registryFailure<fs::path>(RegistryErrorCode::kRenameFailed,
                                         "Unable to rename temporary file '" + temp_path.string() +
                                             "': " + ec.message());
    }

    spdlog::info("FileSystemOntologyRegistry: registered '{}'", out_path.string());
    return registrySuccess(out_path);
}

RegistryResult<void> FileSystemOntologyRegistry::unregisterOntology(const std::string& ontology_id,
                                                                    const Version& version,
                                                                    FileType file_type) {
    auto resolved = resolveVersion(ontology_id, version);
    if (!resolved.ok()) {
        spdlog::warn("FileSystemOntologyRegistry: failed to unregister, cannot resolve '{}' of '{}'",
                     version.toString(), ontology_id);
        return registryFailure<void>(resolved.error, std::move(resolved.error_message));
    }

    const auto file_path = registry_path_ / registryFileName(ontology_id, *resolved.data, file_type);

    std::lock_guard<std::mutex> lock(write_mutex_);

    if (!pathExists(file_path)) {
        spdlog::debug("FileSystemOntologyRegistry: nothing to unregister at '{}'", file_path.string());
        return registrySuccess();
    }

    std::error_code ec;
    fs::remove(file_path, ec);
    if (ec) {
        spdlog::warn("FileSystemOntologyRegistry: failed to unregister '{}': {}", file_path.string(),
                     ec.message());
        return registryFailure<void>(RegistryErrorCode::kRemoveFailed,
                                     "'" + file_path.string() + "': " + ec.message());
    }

    spdlog::info("FileSystemOntologyRegistry: unregistered '{}'", file_path.string());
    return registrySuccess();
}

std::optional<fs::path> FileSystemOntologyRegistry::get(const std::string& ontology_id,
                                                        const Version& version,
                                                        FileType file_type) const {
    auto resolved = resolveVersion(ontology_id, version);
    if (!resolved.ok()) {
        spdlog::warn("FileSystemOntologyRegistry: unable to get '{}' for version '{}'", ontology_id,
                     version.toString());
        return std::nullopt;
    }

    const auto file_path = registry_path_ / registryFileName(ontology_id, *resolved.data, file_type);
    if (!pathExists(file_path)) {
        spdlog::debug("FileSystemOntologyRegistry: '{}' is not registered", file_path.string());
        return std::nullopt;
    }

    spdlog::debug("FileSystemOntologyRegistry: returned '{}'", file_path.string());
    return file_path;
}

std::vector<std::string> FileSystemOntologyRegistry::list() const {
    std::vector<std::string> files;

    std::error_code ec;
    fs::directory_iterator it(registry_path_, ec);
    if (ec) {
        spdlog::debug("FileSystemOntologyRegistry: registry '{}' is not readable: {}",
                      registry_path_.string(), ec.message());
        return files;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || type_ec) continue;
        files.push_back(it->path().string());
    }

    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace ontoreg
