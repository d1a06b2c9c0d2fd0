/**
 * @file model.cpp
 * @brief Paths, tree entries, health codes and export serialization
 */

#include "../include/vaulthunter.h"

#include <nlohmann/json.hpp>

namespace vaulthunter {

using json = nlohmann::json;

const char* const PASSWORD_FIELD = "Password";

// ============================================================================
// PATH
// ============================================================================

Path Path::parse(const std::string& text) {
    Path path;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(SEPARATOR, start);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (end > start) {
            path.components_.push_back(text.substr(start, end - start));
        }
        start = end + 1;
    }
    return path;
}

void Path::push(const std::string& component) {
    if (component.empty()) {
        throw std::invalid_argument("Path component is empty");
    }
    if (component.find(SEPARATOR) != std::string::npos) {
        throw std::invalid_argument("Path component contains '/': " + component);
    }
    components_.push_back(component);
}

Path Path::pushed(const std::string& component) const {
    Path p = *this;
    p.push(component);
    return p;
}

std::string Path::leaf() const {
    return components_.empty() ? std::string() : components_.back();
}

std::string Path::str() const {
    std::string out;
    for (size_t i = 0; i < components_.size(); ++i) {
        if (i > 0) out += SEPARATOR;
        out += components_[i];
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const Path& path) {
    return os << path.str();
}

// ============================================================================
// TREE ENTRY
// ============================================================================

TreeEntry TreeEntry::from_listing(const std::string& raw) {
    TreeEntry entry;
    if (!raw.empty() && raw.back() == Path::SEPARATOR) {
        entry.kind = Kind::Dir;
        entry.name = raw.substr(0, raw.size() - 1);
    } else {
        entry.kind = Kind::Key;
        entry.name = raw;
    }
    return entry;
}

// ============================================================================
// ENUM NAMES
// ============================================================================

HealthStatus health_status_from_http(int status_code) {
    switch (status_code) {
        case 200: return HealthStatus::Active;
        case 429: return HealthStatus::Standby;
        case 472: return HealthStatus::Recovery;
        case 473: return HealthStatus::Performance;
        case 501: return HealthStatus::Uninitialized;
        case 503: return HealthStatus::Sealed;
        default:
            throw StoreError("Invalid status code from health: " + std::to_string(status_code),
                             status_code);
    }
}

const char* to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Active: return "active";
        case HealthStatus::Standby: return "standby";
        case HealthStatus::Recovery: return "recovery";
        case HealthStatus::Performance: return "performance";
        case HealthStatus::Uninitialized: return "uninitialized";
        case HealthStatus::Sealed: return "sealed";
    }
    return "unknown";
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::NoToken: return "no-token";
        case SessionState::Probing: return "probing";
        case SessionState::Authenticated: return "authenticated";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Store: return "store";
        case ErrorKind::AuthRejected: return "auth-rejected";
        case ErrorKind::MalformedResponse: return "malformed-response";
        case ErrorKind::NoCredentialSource: return "no-credential-source";
        case ErrorKind::Local: return "local";
    }
    return "unknown";
}

// ============================================================================
// EXPORT
// ============================================================================

std::string export_to_json(const std::vector<ExportEntry>& entries) {
    json out = json::array();
    for (const auto& entry : entries) {
        out.push_back({
            {"path", entry.path.str()},
            {"fields", entry.record}
        });
    }
    return out.dump(2);
}

} // namespace vaulthunter
