#include "providers/obo_library_provider.h"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "utils/http_client.h"
#include "utils/string_utils.h"
#include "utils/url_encode.h"

namespace ontoreg {

OboLibraryProvider::OboLibraryProvider(std::string base_url, std::chrono::milliseconds timeout)
    : base_url_(trimTrailingSlash(std::move(base_url))), timeout_(timeout) {}

RegistryResult<std::string> OboLibraryProvider::provideOntology(const std::string& ontology_id,
                                                                const std::string& file_name,
                                                                const std::string& version) const {
    HttpUrl base = parseUrl(base_url_);
    auto client = makeClient(base, timeout_);
    if (!client) {
        spdlog::warn("OboLibraryProvider: failed to create HTTP client for '{}'", base_url_);
        return registryFailure<std::string>(RegistryErrorCode::kProvidingOntology,
                                            "failed to create HTTP client for '" + base_url_ + "'");
    }

    const std::string path =
        buildEncodedPath(base.path, ontology_id, std::string("releases"), version, file_name);
    spdlog::debug("OboLibraryProvider: fetching url='{}{}'", originOf(base), path);

    httplib::Headers headers = {{"User-Agent", userAgent()}};
    auto res = client->Get(path, headers);
    if (!res) {
        spdlog::warn("OboLibraryProvider: request failed (no response) path='{}' error={}", path,
                     httplib::to_string(res.error()));
        return registryFailure<std::string>(RegistryErrorCode::kProvidingOntology,
                                            "request for '" + path + "' failed: " +
                                                httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        spdlog::warn("OboLibraryProvider: request failed status={} path='{}'", res->status, path);
        return registryFailure<std::string>(RegistryErrorCode::kProvidingOntology,
                                            "request for '" + path + "' failed status=" +
                                                std::to_string(res->status));
    }

    spdlog::debug("OboLibraryProvider: got file '{}' for ontology '{}' and version '{}' bytes={}", file_name,
                  ontology_id, version, res->body.size());
    return registrySuccess(std::move(res->body));
}

}  // namespace ontoreg
