#include "providers/bio_registry_metadata_provider.h"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "utils/http_client.h"
#include "utils/json_utils.h"
#include "utils/string_utils.h"
#include "utils/url_encode.h"

namespace ontoreg {

BioRegistryMetadataProvider::BioRegistryMetadataProvider(std::string api_url,
                                                         std::chrono::milliseconds timeout)
    : api_url_(ensureTrailingSlash(std::move(api_url))), timeout_(timeout) {}

RegistryResult<OntologyMetadata> BioRegistryMetadataProvider::parseResource(const std::string& ontology_id,
                                                                            const std::string& body) {
    std::string parse_error;
    auto j = parse_json(body, &parse_error);
    if (!j || !j->is_object()) {
        spdlog::debug("BioRegistryMetadataProvider: unparsable metadata for '{}': {}", ontology_id,
                      parse_error.empty() ? "not a JSON object" : parse_error);
        return registryFailure<OntologyMetadata>(RegistryErrorCode::kProvidingMetadata,
                                                 "Unable to parse metadata for " + ontology_id);
    }

    auto version = optional_string(*j, "version");
    if (!version || version->empty()) {
        return registryFailure<OntologyMetadata>(RegistryErrorCode::kProvidingMetadata,
                                                 "Version not found for " + ontology_id);
    }

    OntologyMetadata metadata;
    metadata.ontology_id = optional_string(*j, "prefix").value_or(ontology_id);
    metadata.version = std::move(*version);
    metadata.json_file_location = optional_string(*j, "download_json");
    metadata.owl_file_location = optional_string(*j, "download_owl");
    metadata.obo_file_location = optional_string(*j, "download_obo");
    metadata.title = optional_string(*j, "name");
    return registrySuccess(std::move(metadata));
}

RegistryResult<OntologyMetadata> BioRegistryMetadataProvider::provideMetadata(const std::string& ontology_id) const {
    HttpUrl base = parseUrl(api_url_);
    auto client = makeClient(base, timeout_);
    if (!client) {
        spdlog::warn("BioRegistryMetadataProvider: failed to create HTTP client for '{}'", api_url_);
        return registryFailure<OntologyMetadata>(RegistryErrorCode::kProvidingMetadata,
                                                 "failed to create HTTP client for '" + api_url_ + "'");
    }

    const std::string path = buildEncodedPath(base.path, std::string("registry"), ontology_id);
    spdlog::debug("BioRegistryMetadataProvider: fetching metadata url='{}{}'", originOf(base), path);

    httplib::Headers headers = {{"User-Agent", userAgent()}, {"Accept", "application/json"}};
    auto res = client->Get(path, headers);
    if (!res) {
        spdlog::warn("BioRegistryMetadataProvider: request failed (no response) path='{}' error={}", path,
                     httplib::to_string(res.error()));
        return registryFailure<OntologyMetadata>(RegistryErrorCode::kProvidingMetadata,
                                                 "metadata request for " + ontology_id + " failed: " +
                                                     httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        spdlog::warn("BioRegistryMetadataProvider: request failed status={} path='{}'", res->status, path);
        return registryFailure<OntologyMetadata>(RegistryErrorCode::kProvidingMetadata,
                                                 "metadata request for " + ontology_id +
                                                     " failed status=" + std::to_string(res->status));
    }

    auto metadata = parseResource(ontology_id, res->body);
    if (metadata.ok()) {
        spdlog::debug("BioRegistryMetadataProvider: '{}' resolved to version '{}'", ontology_id,
                      metadata.data->version);
    }
    return metadata;
}

}  // namespace ontoreg
