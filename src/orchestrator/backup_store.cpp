// EN: Backup store implementation. Sections are JSON files checked with zlib CRC-32.
// FR: Implémentation du magasin de sauvegardes. Les sections sont des fichiers JSON contrôlés par CRC-32 zlib.

#include "orchestrator/backup_store.hpp"

#include "infrastructure/logging/logger.hpp"
#include "orchestrator/workflow_errors.hpp"

#include <nlohmann/json.hpp>
#include <zlib.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace HVC {
namespace Orchestrator {

namespace {

constexpr const char* kModule = "backup";
constexpr const char* kStagingPrefix = ".staging-";

const std::vector<std::string>& sectionNames() {
    static const std::vector<std::string> names{"devices", "drivers", "network", "disks", "software"};
    return names;
}

std::uint32_t checksum(const std::string& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
    return static_cast<std::uint32_t>(crc);
}

bool readFile(const std::filesystem::path& path, std::string& content) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

// EN: Howard Hinnant's days_from_civil / civil_from_days, valid for the proleptic Gregorian calendar.
// FR: days_from_civil / civil_from_days de Howard Hinnant, valides pour le calendrier grégorien proleptique.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

bool parseDigits(const std::string& text, size_t offset, size_t count, int& value) {
    value = 0;
    for (size_t i = offset; i < offset + count; ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    return true;
}

} // namespace

BackupStore::BackupStore(std::filesystem::path root, Logger& logger, Clock clock)
    : root_(std::move(root)), logger_(logger), clock_(std::move(clock)) {}

std::string BackupStore::formatId(std::int64_t epoch_ms) {
    std::int64_t days = epoch_ms / 86400000;
    std::int64_t rem = epoch_ms % 86400000;
    if (rem < 0) {
        rem += 86400000;
        --days;
    }
    std::int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civilFromDays(days, year, month, day);

    const int hours = static_cast<int>(rem / 3600000);
    const int minutes = static_cast<int>((rem / 60000) % 60);
    const int seconds = static_cast<int>((rem / 1000) % 60);
    const int millis = static_cast<int>(rem % 1000);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04lld%02u%02uT%02d%02d%02d.%03dZ",
                  static_cast<long long>(year), month, day, hours, minutes, seconds, millis);
    return buffer;
}

std::optional<std::int64_t> BackupStore::parseId(const std::string& id) {
    // EN: Exact shape: YYYYMMDDTHHMMSS.mmmZ (20 characters)
    // FR: Forme exacte : YYYYMMDDTHHMMSS.mmmZ (20 caractères)
    if (id.size() != 20 || id[8] != 'T' || id[15] != '.' || id[19] != 'Z') {
        return std::nullopt;
    }
    int year, month, day, hours, minutes, seconds, millis;
    if (!parseDigits(id, 0, 4, year) || !parseDigits(id, 4, 2, month) || !parseDigits(id, 6, 2, day) ||
        !parseDigits(id, 9, 2, hours) || !parseDigits(id, 11, 2, minutes) || !parseDigits(id, 13, 2, seconds) ||
        !parseDigits(id, 16, 3, millis)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hours > 23 || minutes > 59 || seconds > 59) {
        return std::nullopt;
    }

    const std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const std::int64_t ms = days * 86400000 + hours * 3600000LL + minutes * 60000LL + seconds * 1000LL + millis;
    // EN: Reject dates like Feb 30 that do not survive the round trip.
    // FR: Rejette les dates comme le 30 février qui ne survivent pas à l'aller-retour.
    if (formatId(ms) != id) {
        return std::nullopt;
    }
    return ms;
}

void BackupStore::writeFile(const std::filesystem::path& path, const std::string& content) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw BackupError("cannot open " + path.string() + " for writing");
    }
    file << content;
    file.flush();
    if (!file) {
        throw BackupError("failed to write " + path.string());
    }
}

BackupHandle BackupStore::save(const SystemSnapshot& snapshot) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw BackupError("cannot create backup directory " + root_.string() + ": " + ec.message());
    }

    std::int64_t candidate_ms = clock_();
    if (const auto newest = latest()) {
        const auto newest_ms = parseId(newest->id);
        if (newest_ms && candidate_ms <= *newest_ms) {
            candidate_ms = *newest_ms + 1;
        }
    }
    while (std::filesystem::exists(root_ / formatId(candidate_ms))) {
        ++candidate_ms;
    }

    BackupHandle handle{formatId(candidate_ms), root_ / formatId(candidate_ms)};
    const std::filesystem::path staging = root_ / (std::string(kStagingPrefix) + handle.id);

    try {
        std::filesystem::remove_all(staging);
        std::filesystem::create_directories(staging);

        const std::vector<std::pair<std::string, nlohmann::json>> sections{
            {"devices", nlohmann::json(snapshot.devices)},
            {"drivers", nlohmann::json(snapshot.drivers)},
            {"network", nlohmann::json(snapshot.network)},
            {"disks", nlohmann::json(snapshot.disks)},
            {"software", nlohmann::json(snapshot.software)},
        };

        nlohmann::json manifest;
        manifest["format_version"] = kFormatVersion;
        manifest["id"] = handle.id;
        manifest["captured_at_ms"] = snapshot.captured_at_ms;
        manifest["captured_at"] = SnapshotUtils::formatTimestampMs(snapshot.captured_at_ms);
        manifest["host"] = snapshot.host;
        manifest["platform"] = snapshot.platform;
        manifest["partial"] = snapshot.partial;
        manifest["failed_sections"] = snapshot.failed_sections;
        manifest["sections"] = nlohmann::json::object();

        for (const auto& [name, data] : sections) {
            const std::string file_name = name + ".json";
            const std::string content = data.dump(2);
            writeFile(staging / file_name, content);
            manifest["sections"][name] = {{"file", file_name}, {"crc32", checksum(content)}};
        }

        writeFile(staging / kManifestFile, manifest.dump(2));
        std::filesystem::rename(staging, handle.path);
    } catch (const BackupError& e) {
        std::error_code cleanup_ec;
        std::filesystem::remove_all(staging, cleanup_ec);
        logger_.error(kModule, "Backup failed", {{"id", handle.id}, {"error", e.what()}});
        throw;
    } catch (const std::exception& e) {
        std::error_code cleanup_ec;
        std::filesystem::remove_all(staging, cleanup_ec);
        logger_.error(kModule, "Backup failed", {{"id", handle.id}, {"error", e.what()}});
        throw BackupError(std::string("cannot write backup ") + handle.id + ": " + e.what());
    }

    logger_.info(kModule, "Backup saved", {{"id", handle.id}, {"path", handle.path.string()}});
    return handle;
}

std::vector<BackupHandle> BackupStore::list() const {
    std::vector<BackupHandle> handles;
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return handles;
    }

    for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
        if (!entry.is_directory()) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (!parseId(name)) {
            continue;
        }
        if (!std::filesystem::exists(entry.path() / kManifestFile)) {
            continue;
        }
        handles.push_back({name, entry.path()});
    }
    if (ec) {
        logger_.warn(kModule, "Backup directory listing incomplete", {{"error", ec.message()}});
    }

    std::sort(handles.begin(), handles.end(),
              [](const BackupHandle& a, const BackupHandle& b) { return a.id > b.id; });
    return handles;
}

std::optional<BackupHandle> BackupStore::latest() const {
    const auto handles = list();
    if (handles.empty()) {
        return std::nullopt;
    }
    return handles.front();
}

std::optional<BackupHandle> BackupStore::find(const std::string& id) const {
    if (!parseId(id)) {
        return std::nullopt;
    }
    const auto path = root_ / id;
    if (!std::filesystem::is_directory(path)) {
        return std::nullopt;
    }
    return BackupHandle{id, path};
}

SystemSnapshot BackupStore::load(const BackupHandle& handle) const {
    if (!std::filesystem::is_directory(handle.path)) {
        throw NotFoundError(handle.id);
    }

    std::string manifest_text;
    if (!readFile(handle.path / kManifestFile, manifest_text)) {
        throw CorruptDataError(handle.id, "manifest is missing or unreadable");
    }

    SystemSnapshot snapshot;
    try {
        const auto manifest = nlohmann::json::parse(manifest_text);
        if (manifest.at("format_version").get<int>() != kFormatVersion) {
            throw CorruptDataError(handle.id, "unsupported format version");
        }
        snapshot.captured_at_ms = manifest.at("captured_at_ms").get<std::int64_t>();
        snapshot.host = manifest.at("host").get<std::string>();
        snapshot.platform = manifest.at("platform").get<std::string>();
        snapshot.partial = manifest.at("partial").get<bool>();
        snapshot.failed_sections = manifest.at("failed_sections").get<std::vector<std::string>>();

        const auto& sections = manifest.at("sections");
        for (const auto& name : sectionNames()) {
            if (!sections.contains(name)) {
                throw CorruptDataError(handle.id, "section " + name + " is missing from the manifest");
            }
            const auto& entry = sections.at(name);
            std::string content;
            if (!readFile(handle.path / entry.at("file").get<std::string>(), content)) {
                throw CorruptDataError(handle.id, "section " + name + " is unreadable");
            }
            if (checksum(content) != entry.at("crc32").get<std::uint32_t>()) {
                throw CorruptDataError(handle.id, "section " + name + " fails its CRC-32 check");
            }

            const auto data = nlohmann::json::parse(content);
            if (name == "devices") {
                snapshot.devices = data.get<std::vector<DeviceRecord>>();
            } else if (name == "drivers") {
                snapshot.drivers = data.get<std::vector<DriverPackageRecord>>();
            } else if (name == "network") {
                snapshot.network = data.get<std::vector<NetworkInterfaceRecord>>();
            } else if (name == "disks") {
                snapshot.disks = data.get<std::vector<DiskRecord>>();
            } else {
                snapshot.software = data.get<std::vector<SoftwareRecord>>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw CorruptDataError(handle.id, e.what());
    }

    logger_.debug(kModule, "Backup loaded", {{"id", handle.id}});
    return snapshot;
}

std::filesystem::path BackupStore::driverStorePath(const BackupHandle& handle) {
    return handle.path / kDriverStoreDir;
}

std::filesystem::path BackupStore::createDriverStore(const BackupHandle& handle) const {
    const auto path = driverStorePath(handle);
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw BackupError("cannot create driver store " + path.string() + ": " + ec.message());
    }
    return path;
}

} // namespace Orchestrator
} // namespace HVC
