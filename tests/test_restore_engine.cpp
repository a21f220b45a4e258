// EN: Restore engine tests: driver reimport, interface mapping and unmapped reporting.
// FR: Tests du moteur de restauration : réimport des pilotes, association des interfaces et éléments non associés.

#include <gtest/gtest.h>

#include <sstream>

#include "common/fake_system_management.hpp"
#include "common/test_helpers.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/backup_store.hpp"
#include "orchestrator/confirmation_gate.hpp"
#include "orchestrator/inventory_probe.hpp"
#include "orchestrator/restore_engine.hpp"
#include "orchestrator/step_executor.hpp"
#include "orchestrator/workflow_errors.hpp"
#include "orchestrator/workflow_sequencer.hpp"

using namespace HVC;
using namespace HVC::Orchestrator;
using HVC::Testing::FakeSystemManagement;

namespace {

NetworkInterfaceRecord dhcpInterface(const std::string& id, const std::string& name, const std::string& mac) {
    NetworkInterfaceRecord iface;
    iface.id = id;
    iface.name = name;
    iface.mac_address = mac;
    iface.dhcp_enabled = true;
    return iface;
}

} // namespace

class RestoreEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_.setOutputStream(&log_);

        saved_.host = "guest-01";
        saved_.platform = "windows";
        saved_.drivers = {Testing::vmwareDriver("oem12.inf", "vmxnet3.inf")};
        saved_.network = {
            Testing::staticInterface("12", "Ethernet0", "00:50:56:AB:CD:01", "10.0.0.10"),
            Testing::staticInterface("13", "Ethernet1", "00:50:56:AB:CD:02", "10.0.0.11"),
            Testing::staticInterface("14", "Ethernet2", "00:50:56:AB:CD:03", "10.0.0.12"),
        };
        handle_ = store_.save(saved_);

        // EN: After migration: drivers gone, adapters renamed with new ids and DHCP addressing.
        // FR: Après migration : pilotes supprimés, adaptateurs renommés avec de nouveaux ids en DHCP.
        auto& state = system_.state();
        state.network = {
            dhcpInterface("21", "Ethernet 2", "00-50-56-ab-cd-01"),
            dhcpInterface("22", "Ethernet 3", "00-50-56-ab-cd-02"),
            dhcpInterface("23", "Ethernet 5", "00-15-5d-00-00-09"),
        };
        state.importable_drivers = saved_.drivers;
    }

    WorkflowRun restore(const std::string& answers, bool include_network, bool dry_run = false) {
        in_.str(answers);
        in_.clear();
        ConfirmationGate gate(in_, out_, logger_);
        InventoryProbe probe(system_, logger_);
        StepExecutor executor(system_, logger_);
        WorkflowSequencer sequencer(probe, store_, gate, executor, system_, logger_);
        RestoreEngine engine(sequencer, store_, logger_);

        RestoreOptions options;
        options.run_id = "restore-0001";
        options.include_network = include_network;
        options.dry_run = dry_run;
        return engine.restore(handle_, options);
    }

    std::vector<std::string> stepNames(const WorkflowRun& run) const {
        std::vector<std::string> names;
        for (const auto& result : run.results) {
            names.push_back(result.step_name);
        }
        return names;
    }

    Testing::ScratchDir dir_{"hvc-restore"};
    std::istringstream in_;
    std::ostringstream out_;
    std::ostringstream log_;
    Logger logger_;
    std::int64_t now_ms_ = 1773480413589;
    BackupStore store_{dir_.path() / "backups", logger_, [this] { return now_ms_; }};
    FakeSystemManagement system_;
    SystemSnapshot saved_;
    BackupHandle handle_;
};

TEST_F(RestoreEngineTest, FullRestore_ShouldReimportDriversAndMapInterfacesByMac) {
    store_.createDriverStore(handle_);

    const auto run = restore("y\ny\n", true);

    EXPECT_EQ(run.status(), RunStatus::Completed);
    EXPECT_EQ(run.command, "restore");
    EXPECT_EQ(stepNames(run), (std::vector<std::string>{"import-drivers", "rescan-devices", "restore-network:21",
                                                        "restore-network:22"}));
    EXPECT_EQ(system_.imported_from, BackupStore::driverStorePath(handle_).string());
    EXPECT_EQ(system_.state().drivers, saved_.drivers);

    EXPECT_TRUE(system_.mutated("applyNetworkSettings:21"));
    EXPECT_TRUE(system_.mutated("applyNetworkSettings:22"));
    EXPECT_FALSE(system_.mutated("applyNetworkSettings:23"));
    EXPECT_EQ(system_.state().network[0].ip_address, "10.0.0.10");
    EXPECT_FALSE(system_.state().network[1].dhcp_enabled);

    // EN: The third saved adapter has no counterpart and nothing is created for it.
    // FR: La troisième carte sauvegardée n'a pas d'équivalent et rien n'est créé pour elle.
    EXPECT_EQ(system_.state().network.size(), 3u);
    EXPECT_EQ(run.unmapped_items, std::vector<std::string>{"interface Ethernet2 (00:50:56:AB:CD:03)"});
    EXPECT_NE(WorkflowUtils::formatSummary(run).find("[Unmapped] interface Ethernet2"), std::string::npos);
}

TEST_F(RestoreEngineTest, Restore_ShouldTakeAFreshBackupFirst) {
    store_.createDriverStore(handle_);

    const auto run = restore("y\ny\n", true);

    ASSERT_TRUE(run.backup.has_value());
    EXPECT_NE(run.backup->id, handle_.id);
    EXPECT_EQ(store_.list().size(), 2u);
    EXPECT_FALSE(system_.mutated("exportDriverPackages"));
}

TEST_F(RestoreEngineTest, NetworkRestore_ShouldRequireDoubleConfirmation) {
    const auto run = restore("y\n", true);

    EXPECT_EQ(run.status(), RunStatus::Aborted);
    EXPECT_EQ(run.abort_cause, AbortCause::ConfirmationDenied);
    EXPECT_EQ(system_.mutationCount(), 0u);
    EXPECT_NE(out_.str().find("Are you absolutely sure?"), std::string::npos);
}

TEST_F(RestoreEngineTest, DriverOnlyRestore_ShouldAskOnceAndLeaveNetworkAlone) {
    store_.createDriverStore(handle_);

    const auto run = restore("y\n", false);

    EXPECT_EQ(run.status(), RunStatus::Completed);
    EXPECT_EQ(stepNames(run), (std::vector<std::string>{"import-drivers", "rescan-devices"}));
    EXPECT_EQ(out_.str().find("Are you absolutely sure?"), std::string::npos);
    EXPECT_TRUE(system_.state().network[0].dhcp_enabled);
    EXPECT_TRUE(run.unmapped_items.empty());
}

TEST_F(RestoreEngineTest, MissingDriverStore_ShouldReportPackagesAsUnmapped) {
    const auto run = restore("y\n", false);

    EXPECT_EQ(stepNames(run), std::vector<std::string>{"rescan-devices"});
    EXPECT_TRUE(system_.mutated("rescanDevices"));
    EXPECT_FALSE(system_.mutated("importDriverPackages"));
    EXPECT_EQ(run.unmapped_items, std::vector<std::string>{"driver package vmxnet3.inf 1.9.5.0"});
    EXPECT_NE(log_.str().find("no exported driver store"), std::string::npos);
}

TEST_F(RestoreEngineTest, PresentDrivers_ShouldOnlyRescan) {
    store_.createDriverStore(handle_);
    system_.state().drivers = saved_.drivers;

    const auto run = restore("y\n", false);

    EXPECT_EQ(stepNames(run), std::vector<std::string>{"rescan-devices"});
    // EN: Rescanning is not destructive, so no new backup is taken.
    // FR: Le rescan n'est pas destructif, aucune nouvelle sauvegarde n'est donc prise.
    EXPECT_FALSE(run.backup.has_value());
    EXPECT_EQ(store_.list().size(), 1u);
}

TEST_F(RestoreEngineTest, DryRun_ShouldReportWithoutMutation) {
    store_.createDriverStore(handle_);

    const auto run = restore("", true, true);

    EXPECT_EQ(run.results.size(), 4u);
    for (const auto& result : run.results) {
        EXPECT_EQ(result.outcome, StepOutcome::WouldPerform) << result.step_name;
    }
    EXPECT_EQ(system_.mutationCount(), 0u);
    EXPECT_EQ(store_.list().size(), 1u);
}

TEST_F(RestoreEngineTest, MissingBackup_ShouldThrowBeforeAnyMutation) {
    handle_ = {"20200101T000000.000Z", store_.root() / "20200101T000000.000Z"};

    EXPECT_THROW(restore("y\n", true), NotFoundError);
    EXPECT_EQ(system_.mutationCount(), 0u);
    EXPECT_EQ(system_.state().inventory_queries, 0);
}

TEST(RestoreUtilsTest, MapInterfaces_ShouldFallBackToNameAndUseEachLiveOnce) {
    const std::vector<NetworkInterfaceRecord> saved = {
        Testing::staticInterface("1", "Ethernet0", "00:50:56:AB:CD:01", "10.0.0.10"),
        Testing::staticInterface("2", "Ethernet1", "", "10.0.0.11"),
        Testing::staticInterface("3", "ethernet0", "00:50:56:AB:CD:07", "10.0.0.12"),
    };
    const std::vector<NetworkInterfaceRecord> live = {
        dhcpInterface("31", "ETHERNET1", "aa:bb:cc:dd:ee:ff"),
        dhcpInterface("30", "Ethernet0", "00:50:56:ab:cd:01"),
    };

    const auto matches = RestoreUtils::mapInterfaces(saved, live);

    ASSERT_EQ(matches.size(), 3u);
    ASSERT_TRUE(matches[0].live.has_value());
    EXPECT_EQ(matches[0].live->id, "30");
    EXPECT_EQ(matches[0].matched_by, "mac");
    ASSERT_TRUE(matches[1].live.has_value());
    EXPECT_EQ(matches[1].live->id, "31");
    EXPECT_EQ(matches[1].matched_by, "name");
    // EN: "Ethernet0" was already claimed by MAC.
    // FR: "Ethernet0" a déjà été pris par MAC.
    EXPECT_FALSE(matches[2].live.has_value());
    EXPECT_TRUE(matches[2].matched_by.empty());
}

TEST(RestoreUtilsTest, SettingsDiffer_ShouldIgnoreAddressFieldsUnderDhcp) {
    auto saved = Testing::staticInterface("1", "Ethernet0", "", "10.0.0.10");
    auto live = saved;
    EXPECT_FALSE(RestoreUtils::settingsDiffer(saved, live));

    live.gateway = "10.0.0.254";
    EXPECT_TRUE(RestoreUtils::settingsDiffer(saved, live));

    saved.dhcp_enabled = true;
    live.dhcp_enabled = true;
    EXPECT_FALSE(RestoreUtils::settingsDiffer(saved, live));

    live.dns_servers = {"1.1.1.1"};
    EXPECT_TRUE(RestoreUtils::settingsDiffer(saved, live));
}

TEST(RestoreUtilsTest, MissingDriverPackages_ShouldCompareOriginalNameAndVersion) {
    const std::vector<DriverPackageRecord> saved = {Testing::vmwareDriver("oem12.inf", "vmxnet3.inf"),
                                                    Testing::vmwareDriver("oem13.inf", "pvscsi.inf")};
    auto renamed = Testing::vmwareDriver("oem40.inf", "VMXNET3.INF");
    auto older = Testing::vmwareDriver("oem41.inf", "pvscsi.inf");
    older.version = "1.3.0.0";

    const auto missing = RestoreUtils::missingDriverPackages(saved, {renamed, older});

    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].original_name, "pvscsi.inf");
}
