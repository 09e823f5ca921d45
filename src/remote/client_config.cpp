// =============================================================================
// qzbulk - Client Configuration Implementation
// =============================================================================

#include "qzb/remote/client_config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <memory>

#include <curl/curl.h>
#include <fmt/format.h>

#include "qzb/common/error.h"
#include "qzb/common/logger.h"

namespace qzb::remote {

namespace {

std::string trim(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/// Boolean spellings accepted by INI readers; std::nullopt for anything else.
std::optional<bool> parseBool(std::string_view value) {
    const std::string lower = toLower(std::string(value));
    if (lower == "1" || lower == "yes" || lower == "true" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "no" || lower == "false" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

struct CurlUrlDeleter {
    void operator()(CURLU* url) const noexcept { curl_url_cleanup(url); }
};

std::optional<std::string> urlPart(CURLU* url, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    if (curl_url_get(url, part, &value, flags) != CURLUE_OK || value == nullptr) {
        return std::nullopt;
    }
    std::string result(value);
    curl_free(value);
    return result;
}

void parseUrl(const std::string& text, ClientConfig& config) {
    std::unique_ptr<CURLU, CurlUrlDeleter> url(curl_url());
    if (!url) {
        throw ConnectionError("Out of memory parsing the database URL");
    }

    CURLUcode rc = curl_url_set(url.get(), CURLUPART_URL, text.c_str(), 0);
    if (rc != CURLUE_OK) {
        throw ConnectionError(
            fmt::format("Invalid database URL '{}': {}", text, curl_url_strerror(rc)));
    }

    auto scheme = urlPart(url.get(), CURLUPART_SCHEME);
    if (!scheme || (*scheme != "http" && *scheme != "https")) {
        throw ConnectionError(fmt::format("Unsupported URL scheme in '{}'", text));
    }

    auto user = urlPart(url.get(), CURLUPART_USER, CURLU_URLDECODE);
    auto password = urlPart(url.get(), CURLUPART_PASSWORD, CURLU_URLDECODE);
    if (user && password) {
        config.username = std::move(user);
        config.password = std::move(password);
    }

    if (auto fragment = urlPart(url.get(), CURLUPART_FRAGMENT, CURLU_URLDECODE);
        fragment && !fragment->empty()) {
        config.defaultLibrary = std::move(fragment);
    }

    for (CURLUPart part : {CURLUPART_USER, CURLUPART_PASSWORD, CURLUPART_FRAGMENT, CURLUPART_QUERY}) {
        if (curl_url_set(url.get(), part, nullptr, 0) != CURLUE_OK) {
            throw ConnectionError(fmt::format("Invalid database URL '{}'", text));
        }
    }

    auto base = urlPart(url.get(), CURLUPART_URL);
    if (!base) {
        throw ConnectionError(fmt::format("Invalid database URL '{}'", text));
    }
    config.baseUrl = std::move(*base);
}

}  // namespace

void parseIni(std::istream& in, IniSections& sections) {
    std::map<std::string, std::string>* section = nullptr;
    std::string line;
    int lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;
        const std::string text = trim(line);
        if (text.empty() || text.front() == '#' || text.front() == ';') {
            continue;
        }

        if (text.front() == '[') {
            const auto close = text.find(']');
            if (close == std::string::npos) {
                throw FormatError(fmt::format("line {}: unterminated section header", lineNumber));
            }
            section = &sections[trim(std::string_view(text).substr(1, close - 1))];
            continue;
        }

        if (section == nullptr) {
            throw FormatError(fmt::format("line {}: entry outside of a section", lineNumber));
        }
        const auto separator = text.find_first_of("=:");
        if (separator == std::string::npos) {
            throw FormatError(fmt::format("line {}: expected 'key = value'", lineNumber));
        }
        (*section)[toLower(trim(std::string_view(text).substr(0, separator)))] =
            trim(std::string_view(text).substr(separator + 1));
    }
}

std::vector<std::filesystem::path> ClientConfig::defaultConfigPaths() {
    std::vector<std::filesystem::path> paths{"/etc/qizx"};
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        paths.emplace_back(std::filesystem::path(home) / ".qizx");
    }
    paths.emplace_back(".qizx");
    return paths;
}

ClientConfig ClientConfig::resolve(std::string_view urlOrSection,
                                   const std::vector<std::filesystem::path>& configPaths) {
    ClientConfig config;
    std::string url(urlOrSection);

    if (url.find(':') == std::string::npos) {
        IniSections sections;
        for (const auto& path : configPaths) {
            std::ifstream in(path);
            if (!in.is_open()) {
                continue;
            }
            try {
                parseIni(in, sections);
            } catch (const FormatError& e) {
                throw ConnectionError(fmt::format("{}: {}", path.string(), e.message()));
            }
            QZB_LOG_DEBUG("Read client configuration {}", path.string());
        }

        auto it = sections.find(url);
        if (it == sections.end()) {
            throw ConnectionError(fmt::format("No section '{}' in the configuration files", url));
        }
        const auto& values = it->second;

        auto urlIt = values.find("url");
        if (urlIt == values.end() || urlIt->second.empty()) {
            throw ConnectionError(fmt::format("Section '{}' has no url", url));
        }

        if (auto verify = values.find("verify"); verify != values.end()) {
            if (auto flag = parseBool(verify->second)) {
                config.verifyPeer = *flag;
            } else {
                config.caBundle = verify->second;
            }
        }
        if (auto cert = values.find("cert"); cert != values.end()) {
            config.clientCert = cert->second;
        }
        if (auto timeout = values.find("timeout"); timeout != values.end()) {
            long seconds = 0;
            const std::string& value = timeout->second;
            auto parsed = std::from_chars(value.data(), value.data() + value.size(), seconds);
            if (parsed.ec != std::errc{} || seconds <= 0) {
                throw ConnectionError(
                    fmt::format("Section '{}': invalid timeout '{}'", url, value));
            }
            config.timeout = std::chrono::seconds(seconds);
        }

        url = urlIt->second;
    }

    parseUrl(url, config);
    return config;
}

}  // namespace qzb::remote
