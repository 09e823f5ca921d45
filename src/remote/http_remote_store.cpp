// =============================================================================
// qzbulk - HTTP Remote Store Implementation
// =============================================================================
// Request/response plumbing on a libcurl easy handle:
// - GET requests carry their parameters in the query string
// - POST requests are form-encoded, or multipart for document uploads
// - Every response is checked by checkResponse() before it is used
// =============================================================================

#include "qzb/remote/http_remote_store.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string>

#include <curl/curl.h>
#include <fmt/format.h>

#include "qzb/archive/archive_layout.h"
#include "qzb/common/error.h"
#include "qzb/common/logger.h"
#include "qzb/remote/property_codec.h"

namespace qzb::remote {

namespace {

constexpr std::string_view kErrorMimeType = "text/x-qizx-error";
constexpr std::string_view kTextMimeType = "text/plain";
constexpr std::string_view kUserAgent = "qzbulk/1.0";

using Params = std::vector<std::pair<std::string, std::string>>;

struct QizxErrorKind {
    std::string_view name;
    RemoteErrorKind kind;
};

constexpr std::array<QizxErrorKind, 8> kErrorKinds{{
    {"BadRequest", RemoteErrorKind::kBadRequest},
    {"Server", RemoteErrorKind::kServer},
    {"NotFound", RemoteErrorKind::kNotFound},
    {"AccessControl", RemoteErrorKind::kAccessControl},
    {"XMLData", RemoteErrorKind::kXmlData},
    {"Compilation", RemoteErrorKind::kCompilation},
    {"Evaluation", RemoteErrorKind::kEvaluation},
    {"TimeOut", RemoteErrorKind::kTimeout},
}};

std::once_flag gCurlInitFlag;

void globalInit() {
    std::call_once(gCurlInitFlag, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw ConnectionError(
                fmt::format("curl_global_init failed: {}", curl_easy_strerror(rc)));
        }
    });
}

std::size_t writeCallback(char* data, std::size_t size, std::size_t count, void* userdata) {
    auto* body = static_cast<Payload*>(userdata);
    const std::size_t bytes = size * count;
    body->insert(body->end(), data, data + bytes);
    return bytes;
}

std::string bodyText(const HttpResponse& response) {
    return toString(response.body);
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!line.empty()) {
            lines.emplace_back(line);
        }
        start = end + 1;
    }
    return lines;
}

bool isXmlMimeType(std::string_view mimeType) {
    return mimeType == "text/xml" || mimeType == "application/xml";
}

[[noreturn]] void throwUnexpected(const HttpResponse& response, const std::string& library,
                                  const std::string& path) {
    throw RemoteError(RemoteErrorKind::kUnexpectedResponse,
                      fmt::format("Unexpected response (HTTP {}, {})", response.status,
                                  response.mimeType.empty() ? "no content type" : response.mimeType),
                      ErrorContext{}.withLibrary(library).withPath(path));
}

}  // namespace

// =============================================================================
// Response Checks
// =============================================================================

void checkResponse(const HttpResponse& response, const std::string& library,
                   const std::string& path) {
    if (response.mimeType == kErrorMimeType) {
        std::string text = bodyText(response);
        std::string_view kindName = std::string_view(text).substr(0, text.find(':'));
        RemoteErrorKind kind = RemoteErrorKind::kOther;
        for (const auto& entry : kErrorKinds) {
            if (entry.name == kindName) {
                kind = entry.kind;
                break;
            }
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
            text.pop_back();
        }
        throw RemoteError(kind, text, ErrorContext{}.withLibrary(library).withPath(path));
    }

    if (response.status >= 400) {
        throw RemoteError(response.status, fmt::format("HTTP error {}", response.status),
                          ErrorContext{}.withLibrary(library).withPath(path));
    }
}

int parseImportErrors(std::string_view text) {
    constexpr std::string_view kPrefix = "IMPORT ERRORS ";
    for (const std::string& line : splitLines(text)) {
        if (!line.starts_with(kPrefix)) {
            continue;
        }
        std::string_view count = std::string_view(line).substr(kPrefix.size());
        while (!count.empty() && std::isspace(static_cast<unsigned char>(count.back())) != 0) {
            count.remove_suffix(1);
        }
        int errors = 0;
        auto parsed = std::from_chars(count.data(), count.data() + count.size(), errors);
        if (parsed.ec == std::errc{} && parsed.ptr == count.data() + count.size()) {
            return errors;
        }
    }
    throw RemoteError(RemoteErrorKind::kUnexpectedResponse, "Missing IMPORT ERRORS line");
}

// =============================================================================
// HttpRemoteStoreImpl
// =============================================================================

class HttpRemoteStoreImpl {
public:
    explicit HttpRemoteStoreImpl(ClientConfig config) : config_(std::move(config)) {
        globalInit();
        curl_ = curl_easy_init();
        if (curl_ == nullptr) {
            throw ConnectionError("Failed to create HTTP client");
        }
    }

    ~HttpRemoteStoreImpl() { curl_easy_cleanup(curl_); }

    HttpRemoteStoreImpl(const HttpRemoteStoreImpl&) = delete;
    HttpRemoteStoreImpl& operator=(const HttpRemoteStoreImpl&) = delete;

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

    HttpResponse get(const Params& params, const std::string& library, const std::string& path) {
        prepare(config_.baseUrl + "?" + encode(params));
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
        return perform(library, path);
    }

    HttpResponse post(const Params& params, const std::string& library, const std::string& path) {
        prepare(config_.baseUrl);
        const std::string form = encode(params);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(form.size()));
        curl_easy_setopt(curl_, CURLOPT_COPYPOSTFIELDS, form.c_str());
        return perform(library, path);
    }

    HttpResponse postMultipart(const Params& params, const std::string& fileField,
                               const std::string& fileName, const Payload& data,
                               const std::string& library, const std::string& path) {
        prepare(config_.baseUrl);

        std::unique_ptr<curl_mime, decltype(&curl_mime_free)> mime(curl_mime_init(curl_),
                                                                   &curl_mime_free);
        if (!mime) {
            throw ConnectionError("Failed to create multipart form");
        }
        for (const auto& [name, value] : params) {
            curl_mimepart* part = curl_mime_addpart(mime.get());
            curl_mime_name(part, name.c_str());
            curl_mime_data(part, value.data(), value.size());
        }
        curl_mimepart* file = curl_mime_addpart(mime.get());
        curl_mime_name(file, fileField.c_str());
        curl_mime_filename(file, fileName.c_str());
        curl_mime_data(file, reinterpret_cast<const char*>(data.data()), data.size());

        curl_easy_setopt(curl_, CURLOPT_MIMEPOST, mime.get());
        return perform(library, path);
    }

private:
    std::string escape(const std::string& value) {
        char* escaped = curl_easy_escape(curl_, value.data(), static_cast<int>(value.size()));
        if (escaped == nullptr) {
            throw ConnectionError("Failed to encode request parameter");
        }
        std::string result(escaped);
        curl_free(escaped);
        return result;
    }

    std::string encode(const Params& params) {
        std::string encoded;
        for (const auto& [name, value] : params) {
            if (!encoded.empty()) {
                encoded += '&';
            }
            encoded += escape(name);
            encoded += '=';
            encoded += escape(value);
        }
        return encoded;
    }

    void prepare(const std::string& url) {
        curl_easy_reset(curl_);
        response_.clear();
        errorBuffer_[0] = '\0';

        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl_, CURLOPT_USERAGENT, kUserAgent.data());
        curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errorBuffer_.data());
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_);

        if (config_.username && config_.password) {
            curl_easy_setopt(curl_, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
            curl_easy_setopt(curl_, CURLOPT_USERNAME, config_.username->c_str());
            curl_easy_setopt(curl_, CURLOPT_PASSWORD, config_.password->c_str());
        } else {
            curl_easy_setopt(curl_, CURLOPT_NETRC, static_cast<long>(CURL_NETRC_OPTIONAL));
        }

        if (!config_.verifyPeer) {
            curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 0L);
        }
        if (config_.caBundle) {
            curl_easy_setopt(curl_, CURLOPT_CAINFO, config_.caBundle->c_str());
        }
        if (config_.clientCert) {
            curl_easy_setopt(curl_, CURLOPT_SSLCERT, config_.clientCert->c_str());
        }

        if (config_.timeout) {
            // no bytes received for `timeout` seconds fails the request
            const long seconds = static_cast<long>(config_.timeout->count());
            curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, seconds);
            curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME, seconds);
        }
    }

    HttpResponse perform(const std::string& library, const std::string& path) {
        CURLcode rc = curl_easy_perform(curl_);
        if (rc == CURLE_OPERATION_TIMEDOUT) {
            throw RemoteError(RemoteErrorKind::kTimeout,
                              fmt::format("Request timed out: {}", errorMessage(rc)),
                              ErrorContext{}.withLibrary(library).withPath(path));
        }
        if (rc != CURLE_OK) {
            throw ConnectionError(fmt::format("HTTP request to {} failed: {}", config_.baseUrl,
                                              errorMessage(rc)),
                                  ErrorContext{}.withLibrary(library).withPath(path));
        }

        HttpResponse response;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);

        char* contentType = nullptr;
        if (curl_easy_getinfo(curl_, CURLINFO_CONTENT_TYPE, &contentType) == CURLE_OK &&
            contentType != nullptr) {
            std::string_view type(contentType);
            type = type.substr(0, type.find(';'));
            while (!type.empty() && std::isspace(static_cast<unsigned char>(type.back())) != 0) {
                type.remove_suffix(1);
            }
            response.mimeType.assign(type);
            std::transform(response.mimeType.begin(), response.mimeType.end(),
                           response.mimeType.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        }
        response.body = std::move(response_);
        response_.clear();

        QZB_LOG_TRACE("HTTP {} {} ({} bytes)", response.status, response.mimeType,
                      response.body.size());
        checkResponse(response, library, path);
        return response;
    }

    std::string errorMessage(CURLcode rc) const {
        return errorBuffer_[0] != '\0' ? std::string(errorBuffer_.data())
                                       : std::string(curl_easy_strerror(rc));
    }

    ClientConfig config_;
    CURL* curl_ = nullptr;
    Payload response_;
    std::array<char, CURL_ERROR_SIZE> errorBuffer_{};
};

// =============================================================================
// HttpRemoteStore
// =============================================================================

HttpRemoteStore::HttpRemoteStore(ClientConfig config)
    : impl_(std::make_unique<HttpRemoteStoreImpl>(std::move(config))) {}

HttpRemoteStore::~HttpRemoteStore() = default;

const ClientConfig& HttpRemoteStore::config() const noexcept {
    return impl_->config();
}

std::vector<std::string> HttpRemoteStore::listLibraries() {
    HttpResponse response = impl_->get({{"op", "listlib"}}, {}, {});
    if (response.mimeType != kTextMimeType || response.body.empty()) {
        throwUnexpected(response, {}, {});
    }
    return splitLines(bodyText(response));
}

std::vector<Member> HttpRemoteStore::listMembers(const std::string& library,
                                                 const std::string& path, int depth) {
    Params params{{"op", "getprop"},
                  {"path", path},
                  {"properties", std::string(kNatureProperty)},
                  {"library", library}};
    if (depth > 0) {
        params.emplace_back("depth", std::to_string(depth));
    }

    HttpResponse response = impl_->get(params, library, path);
    if (!isXmlMimeType(response.mimeType)) {
        throwUnexpected(response, library, path);
    }

    std::vector<PropertySet> sets;
    try {
        sets = decodePropertiesList(response.body);
    } catch (const FormatError& e) {
        throw RemoteError(RemoteErrorKind::kUnexpectedResponse, e.message(),
                          ErrorContext{}.withLibrary(library).withPath(path));
    }

    const std::string self = archive::layout::normalizePath(path);
    std::vector<Member> members;
    for (const PropertySet& set : sets) {
        if (set.path.empty() || archive::layout::normalizePath(set.path) == self) {
            continue;
        }
        Member member;
        member.path = set.path;
        if (const Property* nature = set.find(kNatureProperty)) {
            member.nature = parseNature(nature->value);
        }
        members.push_back(std::move(member));
    }
    return members;
}

Payload HttpRemoteStore::getDocument(const std::string& library, const std::string& path) {
    HttpResponse response =
        impl_->get({{"op", "get"}, {"path", path}, {"library", library}}, library, path);
    return std::move(response.body);
}

PropertySet HttpRemoteStore::getProperties(const std::string& library, const std::string& path) {
    HttpResponse response =
        impl_->get({{"op", "getprop"}, {"path", path}, {"library", library}}, library, path);
    if (!isXmlMimeType(response.mimeType)) {
        throwUnexpected(response, library, path);
    }

    std::vector<PropertySet> sets;
    try {
        sets = decodePropertiesList(response.body);
    } catch (const FormatError& e) {
        throw RemoteError(RemoteErrorKind::kUnexpectedResponse, e.message(),
                          ErrorContext{}.withLibrary(library).withPath(path));
    }
    if (sets.empty()) {
        throw RemoteError(RemoteErrorKind::kNotFound, "No properties returned",
                          ErrorContext{}.withLibrary(library).withPath(path));
    }

    PropertySet result = std::move(sets.front());
    if (result.path.empty()) {
        result.path = path;
    }
    return result;
}

void HttpRemoteStore::putDocument(const std::string& library, const std::string& path,
                                  const Payload& body, DocumentKind kind) {
    const std::string op = kind == DocumentKind::kXml ? "put" : "putnonxml";
    std::string fileName = path.substr(path.rfind('/') + 1);

    // the server creates missing ancestor collections on put
    HttpResponse response = impl_->postMultipart(
        {{"op", op}, {"library", library}, {"path", path}}, "data", fileName, body, library, path);
    if (response.mimeType != kTextMimeType) {
        throwUnexpected(response, library, path);
    }

    const std::string text = bodyText(response);
    if (parseImportErrors(text) > 0) {
        throw RemoteError(RemoteErrorKind::kImport, text,
                          ErrorContext{}.withLibrary(library).withPath(path));
    }
}

void HttpRemoteStore::putProperties(const std::string& library, const std::string& path,
                                    const PropertySet& properties) {
    const Property* nature = properties.find(kNatureProperty);
    if (nature != nullptr && parseNature(nature->value) == MemberNature::kCollection &&
        archive::layout::normalizePath(path) != "/") {
        HttpResponse response = impl_->post(
            {{"op", "mkcol"}, {"path", path}, {"parents", "true"}, {"library", library}}, library,
            path);
        if (response.mimeType != kTextMimeType) {
            throwUnexpected(response, library, path);
        }
    }

    Params params{{"op", "setprop"}, {"path", path}, {"library", library}};
    int count = 0;
    for (const Property& property : properties.properties) {
        if (isServerManagedProperty(property.name)) {
            continue;
        }
        const std::string suffix = count == 0 ? std::string() : std::to_string(count + 1);
        params.emplace_back("name" + suffix, property.name);
        params.emplace_back("value" + suffix, property.value);
        params.emplace_back("type" + suffix, property.type);
        ++count;
    }
    if (count == 0) {
        return;
    }

    HttpResponse response = impl_->post(params, library, path);
    if (response.mimeType != kTextMimeType || response.body.empty()) {
        throwUnexpected(response, library, path);
    }
}

void HttpRemoteStore::ensureLibrary(const std::string& library) {
    std::vector<std::string> libraries = listLibraries();
    if (std::find(libraries.begin(), libraries.end(), library) != libraries.end()) {
        return;
    }

    QZB_LOG_INFO("Creating library {}", library);
    HttpResponse response = impl_->post({{"op", "mklib"}, {"name", library}}, library, {});
    if (response.mimeType != kTextMimeType || response.body.empty()) {
        throwUnexpected(response, library, {});
    }
}

RemoteStoreFactory makeHttpRemoteStoreFactory(ClientConfig config) {
    return [config = std::move(config)]() -> std::unique_ptr<RemoteStore> {
        return std::make_unique<HttpRemoteStore>(config);
    };
}

}  // namespace qzb::remote
