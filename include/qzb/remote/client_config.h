// =============================================================================
// qzbulk - Client Configuration
// =============================================================================
// Resolves the database address given on the command line.
//
// A value containing ':' is a URL:
//   http[s]://user:password@host:port/qizx/api#library
// Anything else names a section of the INI configuration files
// /etc/qizx, ~/.qizx and ./.qizx (later files override earlier ones):
//
//   [production]
//   url = https://qizx.example.com/qizx/api
//   verify = /etc/ssl/company-ca.pem     ; or true / false
//   cert = /etc/ssl/client.pem
//   timeout = 30
// =============================================================================

#ifndef QZB_REMOTE_CLIENT_CONFIG_H
#define QZB_REMOTE_CLIENT_CONFIG_H

#include <chrono>
#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qzb::remote {

/// @brief Parsed INI file: section -> key -> value (keys lower-cased).
using IniSections = std::map<std::string, std::map<std::string, std::string>>;

/// @brief Parse INI text ('#' and ';' comments, "key = value" or "key: value").
/// @param sections Existing sections; keys found in the input override them
/// @throws FormatError on a line outside any section or without a separator
void parseIni(std::istream& in, IniSections& sections);

/// @brief Everything needed to create an HTTP client.
struct ClientConfig {
    /// @brief Service URL without credentials, query or fragment.
    std::string baseUrl;

    std::optional<std::string> username;
    std::optional<std::string> password;

    /// @brief Library named by the URL fragment.
    std::optional<std::string> defaultLibrary;

    /// @brief Verify the server certificate.
    bool verifyPeer = true;

    /// @brief CA bundle used for verification (verify = <path>).
    std::optional<std::string> caBundle;

    /// @brief Client certificate (PEM).
    std::optional<std::string> clientCert;

    /// @brief Per-request timeout; none when unset.
    std::optional<std::chrono::seconds> timeout;

    /// @brief Resolve a URL or configuration section.
    /// @throws ConnectionError if the section or its url key is missing, or
    ///         the URL cannot be parsed
    [[nodiscard]] static ClientConfig resolve(
        std::string_view urlOrSection,
        const std::vector<std::filesystem::path>& configPaths = defaultConfigPaths());

    /// @brief /etc/qizx, ~/.qizx, ./.qizx
    [[nodiscard]] static std::vector<std::filesystem::path> defaultConfigPaths();
};

}  // namespace qzb::remote

#endif  // QZB_REMOTE_CLIENT_CONFIG_H
