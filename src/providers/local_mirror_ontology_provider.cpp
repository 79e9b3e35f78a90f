#include "providers/local_mirror_ontology_provider.h"

#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ontoreg {

LocalMirrorOntologyProvider::LocalMirrorOntologyProvider(fs::path root) : root_(std::move(root)) {}

fs::path LocalMirrorOntologyProvider::releasePath(const std::string& ontology_id,
                                                  const std::string& file_name,
                                                  const std::string& version) const {
    return root_ / ontology_id / "releases" / version / file_name;
}

RegistryResult<std::string> LocalMirrorOntologyProvider::provideOntology(const std::string& ontology_id,
                                                                         const std::string& file_name,
                                                                         const std::string& version) const {
    const auto path = releasePath(ontology_id, file_name, version);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return registryFailure<std::string>(RegistryErrorCode::kProvidingOntology,
                                            "release file not found '" + path.string() + "'");
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        return registryFailure<std::string>(RegistryErrorCode::kProvidingOntology,
                                            "unable to open '" + path.string() + "'");
    }
    std::string body((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        return registryFailure<std::string>(RegistryErrorCode::kProvidingOntology,
                                            "unable to read '" + path.string() + "'");
    }

    spdlog::debug("LocalMirrorOntologyProvider: read '{}' bytes={}", path.string(), body.size());
    return registrySuccess(std::move(body));
}

}  // namespace ontoreg
