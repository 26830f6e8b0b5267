#pragma once
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "command_runner.hpp"

namespace fleet {

/**
 * Identity Resolver
 * Maps LAN devices to human names by joining a static MAC -> name file with
 * the host's neighbor table (ARP cache).
 *
 * All lookups are best-effort and total: a missing mapping file or a failed
 * scan degrades to raw addresses, never to an error.
 */
class IdentityResolver {
public:
    // normalized MAC (aa:bb:cc:dd:ee:ff) -> display name, in file order.
    // Re-setting a MAC replaces its name and keeps its original position.
    class AddressNameMap {
    public:
        using Entry = std::pair<std::string, std::string>;
        using const_iterator = std::vector<Entry>::const_iterator;

        AddressNameMap() = default;
        AddressNameMap(std::initializer_list<Entry> entries);

        void set(const std::string& mac, const std::string& name);
        const std::string* find(const std::string& mac) const;
        const std::string& at(const std::string& mac) const;  // throws std::out_of_range

        size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }
        const_iterator begin() const { return entries_.begin(); }
        const_iterator end() const { return entries_.end(); }

        bool operator==(const AddressNameMap& other) const { return entries_ == other.entries_; }

    private:
        std::vector<Entry> entries_;
    };

    struct UsableDevice {
        std::string ip;
        std::string name;
        std::string mac;
    };

    // Mapping is loaded by the caller and is read-only from here on
    IdentityResolver(const CommandRunner& runner, AddressNameMap mapping,
                     std::string scan_command = "arp -a",
                     int scan_timeout_sec = kControlTimeoutSec);

    // key=value file; blank and '#' lines skipped, malformed lines (and lines
    // with an empty key or name) skipped, duplicate keys: last one wins.
    // Missing file -> empty map.
    static AddressNameMap loadMapping(const std::string& path);

    // Device id (optionally host:port) -> mapped name, or device_id unchanged
    std::string resolveName(const std::string& device_id) const;

    // Mapping entries whose MAC is currently in the neighbor table
    std::vector<UsableDevice> listUsableDevices() const;

    const AddressNameMap& mapping() const { return mapping_; }

    // "AA-BB-CC-DD-EE-FF" -> "aa:bb:cc:dd:ee:ff"
    static std::string normalizeMac(const std::string& mac);

    // First MAC / IPv4 address found in a line of scan output
    static std::optional<std::string> extractMac(const std::string& line);
    static std::optional<std::string> extractIpv4(const std::string& line);

    // True if `ip` occurs in `line` and is not part of a longer dotted number
    static bool lineHasAddress(const std::string& line, const std::string& ip);

private:
    std::optional<std::string> runScan() const;

    const CommandRunner& runner_;
    const AddressNameMap mapping_;
    std::string scan_command_;
    int scan_timeout_sec_;
};

} // namespace fleet
