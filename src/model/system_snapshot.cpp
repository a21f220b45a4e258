// EN: JSON mapping and helpers for system snapshot records.
// FR: Correspondance JSON et utilitaires pour les enregistrements d'instantané système.

#include "model/system_snapshot.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace HVC {

void to_json(nlohmann::json& j, const DeviceRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"class", record.device_class},
        {"display_name", record.display_name},
        {"present", record.present},
        {"hardware_ids", record.hardware_ids},
        {"driver", record.driver},
    };
}

void from_json(const nlohmann::json& j, DeviceRecord& record) {
    j.at("id").get_to(record.id);
    j.at("class").get_to(record.device_class);
    j.at("display_name").get_to(record.display_name);
    j.at("present").get_to(record.present);
    j.at("hardware_ids").get_to(record.hardware_ids);
    j.at("driver").get_to(record.driver);
}

void to_json(nlohmann::json& j, const DriverPackageRecord& record) {
    j = nlohmann::json{
        {"published_name", record.published_name},
        {"original_name", record.original_name},
        {"provider", record.provider},
        {"class", record.class_name},
        {"version", record.version},
    };
}

void from_json(const nlohmann::json& j, DriverPackageRecord& record) {
    j.at("published_name").get_to(record.published_name);
    j.at("original_name").get_to(record.original_name);
    j.at("provider").get_to(record.provider);
    j.at("class").get_to(record.class_name);
    j.at("version").get_to(record.version);
}

void to_json(nlohmann::json& j, const NetworkInterfaceRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"name", record.name},
        {"mac", record.mac_address},
        {"ip", record.ip_address},
        {"prefix", record.prefix_length},
        {"gateway", record.gateway},
        {"dns", record.dns_servers},
        {"dhcp", record.dhcp_enabled},
    };
}

void from_json(const nlohmann::json& j, NetworkInterfaceRecord& record) {
    j.at("id").get_to(record.id);
    j.at("name").get_to(record.name);
    j.at("mac").get_to(record.mac_address);
    j.at("ip").get_to(record.ip_address);
    j.at("prefix").get_to(record.prefix_length);
    j.at("gateway").get_to(record.gateway);
    j.at("dns").get_to(record.dns_servers);
    j.at("dhcp").get_to(record.dhcp_enabled);
}

void to_json(nlohmann::json& j, const PartitionRecord& record) {
    j = nlohmann::json{
        {"number", record.number},
        {"drive_letter", record.drive_letter},
        {"size_bytes", record.size_bytes},
        {"type", record.type},
    };
}

void from_json(const nlohmann::json& j, PartitionRecord& record) {
    j.at("number").get_to(record.number);
    j.at("drive_letter").get_to(record.drive_letter);
    j.at("size_bytes").get_to(record.size_bytes);
    j.at("type").get_to(record.type);
}

void to_json(nlohmann::json& j, const DiskRecord& record) {
    j = nlohmann::json{
        {"number", record.number},
        {"name", record.name},
        {"offline", record.offline},
        {"read_only", record.read_only},
        {"partition_style", record.partition_style},
        {"size_bytes", record.size_bytes},
        {"partitions", record.partitions},
    };
}

void from_json(const nlohmann::json& j, DiskRecord& record) {
    j.at("number").get_to(record.number);
    j.at("name").get_to(record.name);
    j.at("offline").get_to(record.offline);
    j.at("read_only").get_to(record.read_only);
    j.at("partition_style").get_to(record.partition_style);
    j.at("size_bytes").get_to(record.size_bytes);
    j.at("partitions").get_to(record.partitions);
}

void to_json(nlohmann::json& j, const SoftwareRecord& record) {
    j = nlohmann::json{
        {"name", record.name},
        {"version", record.version},
        {"publisher", record.publisher},
        {"product_code", record.product_code},
        {"uninstall_command", record.uninstall_command},
    };
}

void from_json(const nlohmann::json& j, SoftwareRecord& record) {
    j.at("name").get_to(record.name);
    j.at("version").get_to(record.version);
    j.at("publisher").get_to(record.publisher);
    j.at("product_code").get_to(record.product_code);
    j.at("uninstall_command").get_to(record.uninstall_command);
}

namespace SnapshotUtils {

std::string normalizeMac(const std::string& mac) {
    std::string hex;
    for (char c : mac) {
        if (c == ':' || c == '-' || c == '.') {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return "";
        }
        hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (hex.size() != 12) {
        return "";
    }

    std::string normalized;
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (i > 0) normalized.push_back(':');
        normalized.append(hex, i, 2);
    }
    return normalized;
}

std::int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string formatTimestampMs(std::int64_t ms) {
    const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << (ms % 1000) << "Z";
    return ss.str();
}

// EN: Iterative glob with single-star backtracking.
// FR: Glob itératif avec retour arrière sur la dernière étoile.
bool globMatch(const std::string& pattern, const std::string& text) {
    auto lower = [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); };

    size_t p = 0;
    size_t t = 0;
    size_t star = std::string::npos;
    size_t star_text = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || lower(pattern[p]) == lower(text[t]))) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            star_text = t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++star_text;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

bool matchesAny(const std::vector<std::string>& patterns, const std::string& text) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&text](const std::string& pattern) { return globMatch(pattern, text); });
}

} // namespace SnapshotUtils

} // namespace HVC
