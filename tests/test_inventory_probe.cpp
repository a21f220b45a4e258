// EN: Unit tests for the inventory probe.
// FR: Tests unitaires pour la sonde d'inventaire.

#include <gtest/gtest.h>

#include <sstream>

#include "common/fake_system_management.hpp"
#include "common/test_helpers.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/inventory_probe.hpp"

using namespace HVC;
using namespace HVC::Orchestrator;
using HVC::Testing::FakeSystemManagement;

class InventoryProbeTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_.setOutputStream(&log_);
        auto& state = system_.state();
        state.devices = {Testing::ghostDevice("PCI\\VEN_15AD\\1", "vmxnet3 Ethernet Adapter")};
        state.drivers = {Testing::vmwareDriver("oem12.inf", "vmxnet3.inf")};
        state.network = {Testing::staticInterface("12", "Ethernet0", "00:50:56:AB:CD:01", "10.0.0.10")};
        state.software = {Testing::vmwareTools()};
    }

    std::ostringstream log_;
    Logger logger_;
    FakeSystemManagement system_;
    InventoryProbe probe_{system_, logger_};
};

TEST_F(InventoryProbeTest, Capture_ShouldCollectEverySection) {
    const auto snapshot = probe_.capture();

    EXPECT_EQ(snapshot.host, "guest-01");
    EXPECT_EQ(snapshot.platform, "windows");
    EXPECT_GT(snapshot.captured_at_ms, 0);
    EXPECT_EQ(snapshot.devices.size(), 1u);
    EXPECT_EQ(snapshot.drivers.size(), 1u);
    EXPECT_EQ(snapshot.network.size(), 1u);
    EXPECT_TRUE(snapshot.disks.empty());
    EXPECT_EQ(snapshot.software.size(), 1u);
    EXPECT_FALSE(snapshot.partial);
    EXPECT_TRUE(snapshot.failed_sections.empty());
    EXPECT_EQ(system_.state().inventory_queries, 5);
    EXPECT_EQ(system_.mutationCount(), 0u);
}

TEST_F(InventoryProbeTest, FailingSection_ShouldYieldPartialSnapshot) {
    system_.state().failing_sections = {"drivers", "disks"};

    const auto snapshot = probe_.capture();

    EXPECT_TRUE(snapshot.partial);
    EXPECT_EQ(snapshot.failed_sections, (std::vector<std::string>{"drivers", "disks"}));
    EXPECT_TRUE(snapshot.drivers.empty());
    EXPECT_EQ(snapshot.devices.size(), 1u);
    EXPECT_EQ(snapshot.software.size(), 1u);
    EXPECT_NE(log_.str().find("partial"), std::string::npos);
}
