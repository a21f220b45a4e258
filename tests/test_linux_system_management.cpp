// EN: Unit tests for the Linux collaborator against a fixture sysfs/procfs tree.
// FR: Tests unitaires pour le collaborateur Linux sur une arborescence sysfs/procfs de test.

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

#include "common/fake_process_runner.hpp"
#include "common/test_helpers.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/workflow_errors.hpp"
#include "platform/linux_system_management.hpp"

using namespace HVC;
using namespace HVC::Platform;
using HVC::Testing::FakeProcessRunner;

namespace fs = std::filesystem;

class LinuxSystemManagementTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_.setOutputStream(&log_);

        // EN: One VMware NIC bound to vmxnet3 and one unbound bridge.
        // FR: Une carte VMware liée à vmxnet3 et un pont non lié.
        root_.write("sys/bus/pci/devices/0000:0b:00.0/vendor", "0x15ad\n");
        root_.write("sys/bus/pci/devices/0000:0b:00.0/device", "0x07b0\n");
        root_.write("sys/bus/pci/devices/0000:0b:00.0/class", "0x020000\n");
        root_.write("sys/bus/pci/drivers/vmxnet3/.keep", "");
        fs::create_directory_symlink(root_.path() / "sys/bus/pci/drivers/vmxnet3",
                                     root_.path() / "sys/bus/pci/devices/0000:0b:00.0/driver");
        root_.write("sys/bus/pci/devices/0000:00:01.0/vendor", "0x8086\n");
        root_.write("sys/bus/pci/devices/0000:00:01.0/device", "0x7191\n");
        root_.write("sys/bus/pci/devices/0000:00:01.0/class", "0x060400\n");
        root_.write("sys/bus/pci/rescan", "");

        root_.write("proc/modules",
                    "vmw_vmci 98304 1 vmw_vsock_vmci_transport, Live 0x0000000000000000\n"
                    "vmxnet3 69632 0 - Live 0x0000000000000000\n");
        root_.write("sys/module/vmxnet3/version", "1.7.0.0-k\n");
        root_.write("proc/sys/kernel/hostname", "guest-linux\n");
        root_.write("etc/resolv.conf", "# generated\nnameserver 10.0.0.53\nnameserver 10.0.0.54\nsearch corp\n");

        paths_.sysfs_root = root_.path() / "sys";
        paths_.procfs_root = root_.path() / "proc";
        paths_.etc_root = root_.path() / "etc";
    }

    LinuxSystemManagement makeSystem() { return LinuxSystemManagement(runner_, logger_, paths_); }

    Testing::ScratchDir root_{"hvc-linux"};
    LinuxPaths paths_;
    std::ostringstream log_;
    Logger logger_;
    FakeProcessRunner runner_;
};

TEST_F(LinuxSystemManagementTest, Identity_ShouldComeFromProcfs) {
    auto system = makeSystem();
    EXPECT_EQ(system.platformName(), "linux");
    EXPECT_EQ(system.hostName(), "guest-linux");
}

TEST_F(LinuxSystemManagementTest, ListDevices_ShouldReadPciTree) {
    auto system = makeSystem();
    const auto devices = system.listDevices();

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].id, "0000:00:01.0");
    EXPECT_EQ(devices[0].device_class, "Bridge");
    EXPECT_EQ(devices[0].driver, "");
    EXPECT_EQ(devices[1].id, "0000:0b:00.0");
    EXPECT_EQ(devices[1].device_class, "Net");
    EXPECT_EQ(devices[1].hardware_ids, std::vector<std::string>{"pci:v000015ADd000007B0"});
    EXPECT_EQ(devices[1].driver, "vmxnet3");
    EXPECT_TRUE(devices[1].present);
}

TEST_F(LinuxSystemManagementTest, ListDevices_ShouldThrowWithoutSysfs) {
    paths_.sysfs_root = root_.path() / "missing";
    auto system = makeSystem();
    EXPECT_THROW(system.listDevices(), SystemQueryError);
}

TEST_F(LinuxSystemManagementTest, RemoveDevice_ShouldWriteSysfsAndRejectTraversal) {
    auto system = makeSystem();

    EXPECT_TRUE(system.removeDevice("0000:0b:00.0").succeeded());
    EXPECT_EQ(Testing::readFile(root_.path() / "sys/bus/pci/devices/0000:0b:00.0/remove"), "1");

    EXPECT_FALSE(system.removeDevice("../../etc").succeeded());
    EXPECT_FALSE(system.removeDevice("0000:ff:00.0").succeeded());

    EXPECT_TRUE(system.rescanDevices().succeeded());
    EXPECT_EQ(Testing::readFile(root_.path() / "sys/bus/pci/rescan"), "1");
}

TEST_F(LinuxSystemManagementTest, ListDriverPackages_ShouldReadLoadedModules) {
    auto system = makeSystem();
    const auto drivers = system.listDriverPackages();

    ASSERT_EQ(drivers.size(), 2u);
    EXPECT_EQ(drivers[0].published_name, "vmw_vmci");
    EXPECT_EQ(drivers[0].original_name, "vmw_vmci.ko");
    EXPECT_EQ(drivers[0].version, "");
    EXPECT_EQ(drivers[1].version, "1.7.0.0-k");
    EXPECT_EQ(drivers[1].class_name, "kernel-module");
}

TEST_F(LinuxSystemManagementTest, ExportAndImport_ShouldReloadMissingModules) {
    auto system = makeSystem();
    const auto store = root_.path() / "backup" / "driver-store";

    ASSERT_TRUE(system.exportDriverPackages(store.string()).succeeded());
    EXPECT_EQ(Testing::readFile(store / "modules.txt"), "vmw_vmci\nvmxnet3\n");

    // EN: vmxnet3 was unloaded since the export.
    // FR: vmxnet3 a été déchargé depuis l'export.
    root_.write("proc/modules", "vmw_vmci 98304 1 - Live 0x0\n");
    const auto result = system.importDriverPackages(store.string());

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(runner_.count("modprobe"), 1u);
    EXPECT_TRUE(runner_.ran("modprobe vmxnet3"));
}

TEST_F(LinuxSystemManagementTest, Import_ShouldFailWithoutModuleList) {
    auto system = makeSystem();
    EXPECT_FALSE(system.importDriverPackages((root_.path() / "nowhere").string()).succeeded());
}

TEST_F(LinuxSystemManagementTest, DeleteDriverPackage_ShouldUnloadModule) {
    auto system = makeSystem();
    system.deleteDriverPackage("vmw_vmci");
    EXPECT_EQ(runner_.calls.back(), (std::vector<std::string>{"modprobe", "-r", "vmw_vmci"}));
}

TEST_F(LinuxSystemManagementTest, ListNetworkInterfaces_ShouldCombineAddrRoutesAndResolv) {
    runner_.when("ip -j addr show", FakeProcessRunner::ok(R"([
        {"ifname":"lo","link_type":"loopback","address":"00:00:00:00:00:00","addr_info":[]},
        {"ifname":"ens192","link_type":"ether","address":"00:50:56:ab:cd:01",
         "addr_info":[{"family":"inet6","local":"fe80::1","prefixlen":64},
                      {"family":"inet","local":"10.0.0.10","prefixlen":24}]},
        {"ifname":"ens224","link_type":"ether","address":"00:50:56:ab:cd:02",
         "addr_info":[{"family":"inet","local":"192.168.5.20","prefixlen":24,"dynamic":true}]}
    ])"));
    runner_.when("ip -j route show default", FakeProcessRunner::ok(
        R"([{"dst":"default","gateway":"10.0.0.1","dev":"ens192"}])"));

    auto system = makeSystem();
    const auto interfaces = system.listNetworkInterfaces();

    ASSERT_EQ(interfaces.size(), 2u);
    EXPECT_EQ(interfaces[0], Testing::staticInterface("ens192", "ens192", "00:50:56:AB:CD:01", "10.0.0.10"));
    EXPECT_TRUE(interfaces[1].dhcp_enabled);
    EXPECT_EQ(interfaces[1].gateway, "");
}

TEST_F(LinuxSystemManagementTest, ListNetworkInterfaces_ShouldThrowWhenIpFails) {
    runner_.when("ip -j addr show", FakeProcessRunner::exit(1));
    auto system = makeSystem();
    EXPECT_THROW(system.listNetworkInterfaces(), SystemQueryError);
}

TEST_F(LinuxSystemManagementTest, ApplyNetworkSettings_ShouldConfigureStaticAddress) {
    auto system = makeSystem();
    const auto saved = Testing::staticInterface("eth0", "eth0", "00:50:56:AB:CD:01", "10.0.0.10");

    EXPECT_TRUE(system.applyNetworkSettings("ens192", saved).succeeded());

    ASSERT_EQ(runner_.calls.size(), 4u);
    EXPECT_EQ(FakeProcessRunner::join(runner_.calls[0]), "ip addr flush dev ens192");
    EXPECT_EQ(FakeProcessRunner::join(runner_.calls[1]), "ip addr add 10.0.0.10/24 dev ens192");
    EXPECT_EQ(FakeProcessRunner::join(runner_.calls[2]), "ip route replace default via 10.0.0.1 dev ens192");
    EXPECT_EQ(FakeProcessRunner::join(runner_.calls[3]), "resolvectl dns ens192 10.0.0.53 10.0.0.54");
}

TEST_F(LinuxSystemManagementTest, NetworkMaintenance_ShouldUseSystemdTools) {
    auto system = makeSystem();
    system.flushDnsCache();
    EXPECT_TRUE(runner_.ran("resolvectl flush-caches"));
    system.resetNetworkStack();
    EXPECT_TRUE(runner_.ran("systemctl restart systemd-networkd"));
}

TEST_F(LinuxSystemManagementTest, ListInstalledSoftware_ShouldFallBackToRpm) {
    runner_.when("dpkg-query", FakeProcessRunner::notStarted());
    runner_.when("rpm -qa", FakeProcessRunner::ok("open-vm-tools\t12.1.5-1.el9\tRed Hat, Inc.\n\n"));

    auto system = makeSystem();
    const auto software = system.listInstalledSoftware();

    ASSERT_EQ(software.size(), 1u);
    EXPECT_EQ(software[0].name, "open-vm-tools");
    EXPECT_EQ(software[0].version, "12.1.5-1.el9");
    EXPECT_EQ(software[0].uninstall_command, "dnf remove -y open-vm-tools");

    system.uninstallSoftware(software[0]);
    EXPECT_EQ(runner_.calls.back(), (std::vector<std::string>{"dnf", "remove", "-y", "open-vm-tools"}));
}

TEST_F(LinuxSystemManagementTest, ListDisks_ShouldParseLsblk) {
    runner_.when("lsblk", FakeProcessRunner::ok(R"({"blockdevices":[
        {"name":"sda","type":"disk","size":42949672960,"ro":false,"model":"Virtual disk","pttype":"gpt",
         "children":[{"name":"sda1","type":"part","size":536870912,"ro":false},
                     {"name":"sda2","type":"part","size":42411753472,"ro":false}]},
        {"name":"sr0","type":"rom","size":1073741312,"ro":true},
        {"name":"sdb","type":"disk","size":10737418240,"ro":true,"pttype":"dos"}
    ]})"));

    auto system = makeSystem();
    const auto disks = system.listDisks();

    ASSERT_EQ(disks.size(), 2u);
    EXPECT_EQ(disks[0].name, "/dev/sda");
    EXPECT_EQ(disks[0].partition_style, "GPT");
    ASSERT_EQ(disks[0].partitions.size(), 2u);
    EXPECT_EQ(disks[0].partitions[1].number, 2);
    EXPECT_EQ(disks[0].partitions[1].type, "part");
    EXPECT_EQ(disks[1].number, 1);
    EXPECT_TRUE(disks[1].read_only);
    EXPECT_EQ(disks[1].partition_style, "MBR");

    EXPECT_TRUE(system.clearDiskReadOnly(1).succeeded());
    EXPECT_EQ(runner_.calls.back(), (std::vector<std::string>{"blockdev", "--setrw", "/dev/sdb"}));
    EXPECT_FALSE(system.clearDiskReadOnly(7).succeeded());
}

TEST_F(LinuxSystemManagementTest, UnsupportedDiskOperations_ShouldFail) {
    auto system = makeSystem();
    EXPECT_FALSE(system.setDiskOnline(0).succeeded());
    EXPECT_FALSE(system.assignDriveLetter(0, 1, "D").succeeded());
    EXPECT_TRUE(runner_.calls.empty());
}
