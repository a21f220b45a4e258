// EN: Unit tests for the on-disk backup store.
// FR: Tests unitaires pour le magasin de sauvegardes sur disque.

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "common/test_helpers.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/backup_store.hpp"
#include "orchestrator/workflow_errors.hpp"

using namespace HVC;
using namespace HVC::Orchestrator;

namespace fs = std::filesystem;

namespace {

// EN: 2026-03-14T09:26:53.589Z
// FR: 2026-03-14T09:26:53.589Z
constexpr std::int64_t kFixedMs = 1773480413589;

SystemSnapshot sampleSnapshot() {
    SystemSnapshot snapshot;
    snapshot.captured_at_ms = kFixedMs;
    snapshot.host = "guest-01";
    snapshot.platform = "windows";
    snapshot.devices = {Testing::ghostDevice("PCI\\VEN_15AD\\1", "vmxnet3 Ethernet Adapter")};
    snapshot.drivers = {Testing::vmwareDriver("oem12.inf", "vmxnet3.inf"),
                        Testing::vmwareDriver("oem13.inf", "pvscsi.inf")};
    snapshot.network = {Testing::staticInterface("12", "Ethernet0", "00:50:56:AB:CD:01", "10.0.0.10")};

    DiskRecord disk;
    disk.number = 1;
    disk.name = "VMware Virtual disk";
    disk.offline = true;
    disk.partition_style = "GPT";
    disk.size_bytes = 42949672960ULL;
    disk.partitions.push_back({2, "", 42812211200ULL, "Basic"});
    snapshot.disks = {disk};

    snapshot.software = {Testing::vmwareTools()};
    snapshot.partial = true;
    snapshot.failed_sections = {"network"};
    return snapshot;
}

} // namespace

class BackupStoreTest : public ::testing::Test {
protected:
    void SetUp() override { logger_.setOutputStream(&log_); }

    BackupStore makeStore() {
        return BackupStore(dir_.path() / "backups", logger_, [this] { return now_ms_; });
    }

    void rewrite(const fs::path& file, const std::string& content) {
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
    }

    Testing::ScratchDir dir_{"hvc-backups"};
    std::ostringstream log_;
    Logger logger_;
    std::int64_t now_ms_ = kFixedMs;
};

TEST_F(BackupStoreTest, SaveThenLoad_ShouldReturnEqualSnapshot) {
    auto store = makeStore();
    const auto original = sampleSnapshot();

    const auto handle = store.save(original);

    EXPECT_EQ(handle.id, "20260314T092653.589Z");
    EXPECT_EQ(handle.path, dir_.path() / "backups" / handle.id);
    EXPECT_EQ(store.load(handle), original);
}

TEST_F(BackupStoreTest, Manifest_ShouldRecordChecksumsAndMetadata) {
    auto store = makeStore();
    const auto handle = store.save(sampleSnapshot());

    const auto manifest = nlohmann::json::parse(Testing::readFile(handle.path / BackupStore::kManifestFile));
    EXPECT_EQ(manifest["format_version"], BackupStore::kFormatVersion);
    EXPECT_EQ(manifest["id"], handle.id);
    EXPECT_EQ(manifest["host"], "guest-01");
    EXPECT_EQ(manifest["captured_at"], "2026-03-14T09:26:53.589Z");
    EXPECT_TRUE(manifest["partial"].get<bool>());
    for (const char* section : {"devices", "drivers", "network", "disks", "software"}) {
        ASSERT_TRUE(manifest["sections"].contains(section)) << section;
        EXPECT_TRUE(fs::exists(handle.path / manifest["sections"][section]["file"].get<std::string>()));
        EXPECT_TRUE(manifest["sections"][section]["crc32"].is_number_unsigned());
    }
}

TEST_F(BackupStoreTest, Save_ShouldNeverReuseAnId) {
    auto store = makeStore();
    const auto first = store.save(sampleSnapshot());
    // EN: Clock did not move, then moved backwards.
    // FR: L'horloge n'a pas avancé, puis a reculé.
    const auto second = store.save(sampleSnapshot());
    now_ms_ = kFixedMs - 60000;
    const auto third = store.save(sampleSnapshot());

    EXPECT_LT(first.id, second.id);
    EXPECT_LT(second.id, third.id);
    EXPECT_EQ(second.id, "20260314T092653.590Z");
    EXPECT_EQ(store.list().size(), 3u);
}

TEST_F(BackupStoreTest, List_ShouldBeNewestFirstAndIgnoreForeignEntries) {
    auto store = makeStore();
    const auto older = store.save(sampleSnapshot());
    now_ms_ += 3600000;
    const auto newer = store.save(sampleSnapshot());

    fs::create_directories(store.root() / ".staging-20260314T120000.000Z");
    fs::create_directories(store.root() / "notes");
    fs::create_directories(store.root() / "20260101T000000.000Z");
    std::ofstream(store.root() / "README.txt") << "hello";

    const auto handles = store.list();
    ASSERT_EQ(handles.size(), 2u);
    EXPECT_EQ(handles[0], newer);
    EXPECT_EQ(handles[1], older);
    EXPECT_EQ(store.latest(), newer);
}

TEST_F(BackupStoreTest, EmptyStore_ShouldHaveNoLatest) {
    auto store = makeStore();
    EXPECT_TRUE(store.list().empty());
    EXPECT_FALSE(store.latest().has_value());
}

TEST_F(BackupStoreTest, Find_ShouldValidateId) {
    auto store = makeStore();
    const auto handle = store.save(sampleSnapshot());

    EXPECT_EQ(store.find(handle.id), handle);
    EXPECT_FALSE(store.find("20990101T000000.000Z").has_value());
    EXPECT_FALSE(store.find("../etc").has_value());
}

TEST_F(BackupStoreTest, Load_ShouldThrowNotFoundForMissingBackup) {
    auto store = makeStore();
    const BackupHandle missing{"20260101T000000.000Z", store.root() / "20260101T000000.000Z"};

    try {
        store.load(missing);
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.backupId(), missing.id);
    }
}

TEST_F(BackupStoreTest, Load_ShouldDetectChecksumMismatch) {
    auto store = makeStore();
    const auto handle = store.save(sampleSnapshot());

    auto devices = nlohmann::json::parse(Testing::readFile(handle.path / "devices.json"));
    devices[0]["present"] = true;
    rewrite(handle.path / "devices.json", devices.dump(2));

    try {
        store.load(handle);
        FAIL() << "expected CorruptDataError";
    } catch (const CorruptDataError& e) {
        EXPECT_EQ(e.backupId(), handle.id);
        EXPECT_NE(std::string(e.what()).find("devices"), std::string::npos);
    }
}

TEST_F(BackupStoreTest, Load_ShouldDetectMissingSectionAndBadJson) {
    auto store = makeStore();
    const auto handle = store.save(sampleSnapshot());

    fs::remove(handle.path / "software.json");
    EXPECT_THROW(store.load(handle), CorruptDataError);

    rewrite(handle.path / BackupStore::kManifestFile, "{ not json");
    EXPECT_THROW(store.load(handle), CorruptDataError);

    fs::remove(handle.path / BackupStore::kManifestFile);
    EXPECT_THROW(store.load(handle), CorruptDataError);
}

TEST_F(BackupStoreTest, Load_ShouldRejectUnknownFormatVersion) {
    auto store = makeStore();
    const auto handle = store.save(sampleSnapshot());

    auto manifest = nlohmann::json::parse(Testing::readFile(handle.path / BackupStore::kManifestFile));
    manifest["format_version"] = 99;
    rewrite(handle.path / BackupStore::kManifestFile, manifest.dump());

    EXPECT_THROW(store.load(handle), CorruptDataError);
}

TEST_F(BackupStoreTest, Save_ShouldFailWhenRootIsAFile) {
    const auto root = dir_.path() / "backups";
    std::ofstream(root) << "not a directory";
    auto store = makeStore();

    EXPECT_THROW(store.save(sampleSnapshot()), BackupError);
    EXPECT_FALSE(store.latest().has_value());
}

TEST_F(BackupStoreTest, DriverStore_ShouldLiveInsideBackup) {
    auto store = makeStore();
    const auto handle = store.save(sampleSnapshot());

    const auto path = store.createDriverStore(handle);
    EXPECT_EQ(path, handle.path / BackupStore::kDriverStoreDir);
    EXPECT_TRUE(fs::is_directory(path));
    EXPECT_EQ(BackupStore::driverStorePath(handle), path);
    // EN: The extra directory does not disturb loading.
    // FR: Le répertoire supplémentaire ne perturbe pas le chargement.
    EXPECT_NO_THROW(store.load(handle));
}

TEST(BackupIdTest, FormatAndParse_ShouldAgree) {
    EXPECT_EQ(BackupStore::formatId(0), "19700101T000000.000Z");
    EXPECT_EQ(BackupStore::formatId(kFixedMs), "20260314T092653.589Z");
    EXPECT_EQ(BackupStore::parseId("20260314T092653.589Z"), kFixedMs);
    EXPECT_EQ(BackupStore::parseId("20240229T235959.999Z"), BackupStore::parseId("20240301T000000.000Z").value() - 1);
}

TEST(BackupIdTest, Parse_ShouldRejectMalformedIds) {
    EXPECT_FALSE(BackupStore::parseId("").has_value());
    EXPECT_FALSE(BackupStore::parseId("20260314T092653.589").has_value());
    EXPECT_FALSE(BackupStore::parseId("20260314X092653.589Z").has_value());
    EXPECT_FALSE(BackupStore::parseId("2026031AT092653.589Z").has_value());
    EXPECT_FALSE(BackupStore::parseId("20261314T092653.589Z").has_value());
    EXPECT_FALSE(BackupStore::parseId("20260230T000000.000Z").has_value());
    EXPECT_FALSE(BackupStore::parseId("20260314T246053.589Z").has_value());
}
