#include "identity_resolver.hpp"
#include "command_security.hpp"
#include "fleet_log.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace fleet {

namespace {

const std::regex& macPattern() {
    static const std::regex pattern(R"(([0-9A-Fa-f]{2}[:-]){5}[0-9A-Fa-f]{2})");
    return pattern;
}

const std::regex& ipv4Pattern() {
    static const std::regex pattern(R"(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)");
    return pattern;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

} // anonymous namespace

IdentityResolver::IdentityResolver(const CommandRunner& runner, AddressNameMap mapping,
                                   std::string scan_command, int scan_timeout_sec)
    : runner_(runner),
      mapping_(std::move(mapping)),
      scan_command_(std::move(scan_command)),
      scan_timeout_sec_(scan_timeout_sec) {}

// =============================================================================
// Mapping file
// =============================================================================

IdentityResolver::AddressNameMap::AddressNameMap(std::initializer_list<Entry> entries) {
    for (const auto& e : entries) set(e.first, e.second);
}

void IdentityResolver::AddressNameMap::set(const std::string& mac, const std::string& name) {
    for (auto& e : entries_) {
        if (e.first == mac) {
            e.second = name;
            return;
        }
    }
    entries_.emplace_back(mac, name);
}

const std::string* IdentityResolver::AddressNameMap::find(const std::string& mac) const {
    for (const auto& e : entries_) {
        if (e.first == mac) return &e.second;
    }
    return nullptr;
}

const std::string& IdentityResolver::AddressNameMap::at(const std::string& mac) const {
    const std::string* name = find(mac);
    if (!name) throw std::out_of_range("no mapping for " + mac);
    return *name;
}

std::string IdentityResolver::normalizeMac(const std::string& mac) {
    std::string out = trimCopy(mac);
    for (char& c : out) {
        if (c == '-') {
            c = ':';
        } else {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

IdentityResolver::AddressNameMap IdentityResolver::loadMapping(const std::string& path) {
    AddressNameMap mapping;

    std::ifstream file(path);
    if (!file.is_open()) {
        FLOG_WARN("identity", "Mapping file not found: %s", path.c_str());
        return mapping;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trimCopy(line);
        if (line.empty() || line[0] == '#') continue;

        if (std::count(line.begin(), line.end(), '=') != 1) {
            FLOG_DEBUG("identity", "%s:%d: skipping malformed line", path.c_str(), line_no);
            continue;
        }

        size_t eq = line.find('=');
        std::string mac = normalizeMac(line.substr(0, eq));
        std::string name = trimCopy(line.substr(eq + 1));
        if (mac.empty() || name.empty()) {
            FLOG_DEBUG("identity", "%s:%d: skipping entry with empty key or name", path.c_str(), line_no);
            continue;
        }

        mapping.set(mac, name);
    }

    FLOG_DEBUG("identity", "Loaded %zu address mappings from %s", mapping.size(), path.c_str());
    return mapping;
}

// =============================================================================
// Scan parsing
// =============================================================================

std::optional<std::string> IdentityResolver::extractMac(const std::string& line) {
    std::smatch m;
    if (std::regex_search(line, m, macPattern())) {
        return normalizeMac(m.str(0));
    }
    return std::nullopt;
}

std::optional<std::string> IdentityResolver::extractIpv4(const std::string& line) {
    std::smatch m;
    if (std::regex_search(line, m, ipv4Pattern())) {
        return m.str(0);
    }
    return std::nullopt;
}

bool IdentityResolver::lineHasAddress(const std::string& line, const std::string& ip) {
    if (ip.empty()) return false;
    auto isAddrChar = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) || c == '.'; };

    size_t pos = line.find(ip);
    while (pos != std::string::npos) {
        bool left_ok = (pos == 0) || !isAddrChar(line[pos - 1]);
        size_t end = pos + ip.size();
        bool right_ok = (end >= line.size()) || !isAddrChar(line[end]);
        if (left_ok && right_ok) return true;
        pos = line.find(ip, pos + 1);
    }
    return false;
}

std::optional<std::string> IdentityResolver::runScan() const {
    CommandResult scan = runner_.runSystem(scan_command_, scan_timeout_sec_);
    if (!scan.success) {
        FLOG_WARN("identity", "Neighbor scan failed (%s): %s",
                  errorKindName(scan.kind), scan.errorText().c_str());
        return std::nullopt;
    }
    return scan.outputText();
}

// =============================================================================
// Lookups
// =============================================================================

std::string IdentityResolver::resolveName(const std::string& device_id) const {
    if (mapping_.empty()) return device_id;

    std::string ip = security::stripPort(device_id);
    if (ip.empty()) return device_id;

    try {
        auto scan = runScan();
        if (!scan) return device_id;

        for (const auto& line : splitLines(*scan)) {
            if (!lineHasAddress(line, ip)) continue;
            auto mac = extractMac(line);
            if (!mac) continue;

            const std::string* name = mapping_.find(*mac);
            if (name && !name->empty()) {
                FLOG_DEBUG("identity", "%s -> %s (%s)", device_id.c_str(), name->c_str(), mac->c_str());
                return *name;
            }
            return device_id;
        }
    } catch (const std::exception& e) {
        FLOG_ERROR("identity", "Name resolution for %s failed: %s", device_id.c_str(), e.what());
    }
    return device_id;
}

std::vector<IdentityResolver::UsableDevice> IdentityResolver::listUsableDevices() const {
    std::vector<UsableDevice> devices;

    if (mapping_.empty()) {
        FLOG_WARN("identity", "No address mappings loaded; cannot list LAN devices");
        return devices;
    }

    try {
        auto scan = runScan();
        if (!scan) return devices;

        auto lines = splitLines(*scan);
        std::vector<std::string> normalized;
        normalized.reserve(lines.size());
        for (const auto& line : lines) {
            normalized.push_back(normalizeMac(line));
        }

        for (const auto& [mac, name] : mapping_) {
            if (name.empty()) continue;
            for (size_t i = 0; i < lines.size(); ++i) {
                if (normalized[i].find(mac) == std::string::npos) continue;

                // First line carrying the MAC decides for this entry
                auto ip = extractIpv4(lines[i]);
                if (ip) {
                    devices.push_back({*ip, name, mac});
                }
                break;
            }
        }
    } catch (const std::exception& e) {
        FLOG_ERROR("identity", "LAN device listing failed: %s", e.what());
        devices.clear();
    }

    FLOG_INFO("identity", "%zu of %zu mapped devices present on the LAN", devices.size(), mapping_.size());
    return devices;
}

} // namespace fleet
