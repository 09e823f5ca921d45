// =============================================================================
// qzbulk - HTTP Remote Store
// =============================================================================
// RemoteStore speaking the Qizx REST API over libcurl.
//
// One instance owns one curl easy handle and keeps its connection alive
// between requests. Instances are not thread-safe; create one per worker.
// =============================================================================

#ifndef QZB_REMOTE_HTTP_REMOTE_STORE_H
#define QZB_REMOTE_HTTP_REMOTE_STORE_H

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "qzb/remote/client_config.h"
#include "qzb/remote/remote_store.h"

namespace qzb::remote {

class HttpRemoteStoreImpl;

/// @brief Parsed server response.
struct HttpResponse {
    long status = 0;

    /// @brief Media type without parameters, lower-cased ("text/plain").
    std::string mimeType;

    Payload body;
};

/// @brief Map a response to an exception if it reports a failure.
/// @throws RemoteError for HTTP status >= 400 or a text/x-qizx-error body
void checkResponse(const HttpResponse& response, const std::string& library,
                   const std::string& path);

/// @brief Number of import errors in a put response ("IMPORT ERRORS n").
/// @throws RemoteError (kUnexpectedResponse) if the line is missing
[[nodiscard]] int parseImportErrors(std::string_view text);

class HttpRemoteStore final : public RemoteStore {
public:
    /// @throws ConnectionError if the curl handle cannot be created
    explicit HttpRemoteStore(ClientConfig config);

    ~HttpRemoteStore() override;

    HttpRemoteStore(const HttpRemoteStore&) = delete;
    HttpRemoteStore& operator=(const HttpRemoteStore&) = delete;

    [[nodiscard]] std::vector<std::string> listLibraries() override;
    [[nodiscard]] std::vector<Member> listMembers(const std::string& library,
                                                  const std::string& path, int depth) override;
    [[nodiscard]] Payload getDocument(const std::string& library,
                                      const std::string& path) override;
    [[nodiscard]] PropertySet getProperties(const std::string& library,
                                            const std::string& path) override;
    void putDocument(const std::string& library, const std::string& path, const Payload& body,
                     DocumentKind kind) override;
    void putProperties(const std::string& library, const std::string& path,
                       const PropertySet& properties) override;
    void ensureLibrary(const std::string& library) override;

    [[nodiscard]] const ClientConfig& config() const noexcept;

private:
    std::unique_ptr<HttpRemoteStoreImpl> impl_;
};

/// @brief Factory creating one HttpRemoteStore per call from a resolved
///        configuration.
[[nodiscard]] RemoteStoreFactory makeHttpRemoteStoreFactory(ClientConfig config);

}  // namespace qzb::remote

#endif  // QZB_REMOTE_HTTP_REMOTE_STORE_H
