// EN: hvcctl command dispatcher implementation.
// FR: Implémentation du répartiteur de commandes hvcctl.

#include "app/cleanup_app.hpp"

#include "infrastructure/cli/command_line.hpp"
#include "infrastructure/system/process_runner.hpp"
#include "orchestrator/backup_store.hpp"
#include "orchestrator/cleanup_tasks.hpp"
#include "orchestrator/confirmation_gate.hpp"
#include "orchestrator/inventory_probe.hpp"
#include "orchestrator/restore_engine.hpp"
#include "orchestrator/step_executor.hpp"
#include "orchestrator/workflow_errors.hpp"
#include "orchestrator/workflow_sequencer.hpp"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <stdexcept>
#include <system_error>

namespace HVC {
namespace App {

namespace {

constexpr const char* kModule = "hvcctl";

// EN: Commands that never mutate the system.
// FR: Commandes qui ne modifient jamais le système.
bool isReadOnly(const std::string& command) {
    return command == "scan" || command == "list-backups";
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string joined;
    for (const auto& line : lines) {
        joined += (joined.empty() ? "" : "; ") + line;
    }
    return joined;
}

} // namespace

CleanupApplication::CleanupApplication(std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in), out_(out), err_(err), config_(logger_),
      system_factory_([](IProcessRunner& runner, Logger& logger) {
          return Platform::createSystemManagement(runner, logger);
      }) {
    logger_.setConsoleOutput(false);
}

void CleanupApplication::setSystemFactory(SystemFactory factory) {
    system_factory_ = std::move(factory);
}

ExitCode CleanupApplication::exitCodeFor(const Orchestrator::WorkflowRun& run) {
    using Orchestrator::AbortCause;
    using Orchestrator::RunStatus;

    switch (run.status()) {
        case RunStatus::Aborted:
            return run.abort_cause == AbortCause::ConfirmationDenied ? ExitCode::kAborted
                                                                     : ExitCode::kPreconditionFailure;
        case RunStatus::CompletedWithErrors:
            return ExitCode::kPartialFailure;
        default:
            return ExitCode::kSuccess;
    }
}

int CleanupApplication::run(int argc, char* argv[]) {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return run(arguments);
}

int CleanupApplication::run(const std::vector<std::string>& arguments) {
    CLI::CommandLineParser parser;
    parser.setVersionInfo(kVersion);
    parser.addStandardOptions();

    const auto parsed = parser.parse(arguments);
    switch (parsed.status) {
        case CLI::CliParseStatus::HELP_REQUESTED:
            out_ << parsed.help_text;
            return ToInt(ExitCode::kSuccess);
        case CLI::CliParseStatus::VERSION_REQUESTED:
            out_ << parsed.version_text;
            return ToInt(ExitCode::kSuccess);
        case CLI::CliParseStatus::SUCCESS:
            break;
        default:
            for (const auto& error : parsed.errors) {
                err_ << "hvcctl: " << error << "\n";
            }
            err_ << "Try 'hvcctl --help' for more information.\n";
            return ToInt(ExitCode::kPreconditionFailure);
    }

    try {
        return execute(parsed);
    } catch (const PreconditionError& e) {
        err_ << "hvcctl: " << e.what() << "\n";
        logger_.error(kModule, "Precondition failed", {{"error", e.what()}});
    } catch (const NotFoundError& e) {
        err_ << "hvcctl: " << e.what() << "\n";
        logger_.error(kModule, "Backup not found", {{"backup", e.backupId()}});
    } catch (const CorruptDataError& e) {
        err_ << "hvcctl: " << e.what() << "\n";
        logger_.error(kModule, "Backup corrupt", {{"backup", e.backupId()}, {"error", e.what()}});
    } catch (const BackupError& e) {
        err_ << "hvcctl: " << e.what() << "\n";
        logger_.error(kModule, "Backup failed", {{"error", e.what()}});
    }
    logger_.flush();
    return ToInt(ExitCode::kPreconditionFailure);
}

void CleanupApplication::loadConfiguration(const CLI::CliParseResult& parsed) {
    config_.loadDefaults();

    if (const auto file = parsed.text("_config_file")) {
        if (!config_.loadFromFile(*file)) {
            throw PreconditionError("cannot load configuration file " + *file);
        }
    }
    config_.loadEnvironmentOverrides("HVC_");
    config_.applyOverrides(parsed.overrides);

    std::vector<std::string> errors;
    if (!config_.validate(errors)) {
        throw PreconditionError("invalid configuration: " + joinLines(errors));
    }
}

void CleanupApplication::openRunLog(const std::string& run_id) {
    logger_.setLogLevel(Logger::levelFromString(config_.getString("general", "log_level", "info")));
    logger_.setCorrelationId(run_id);

    const std::filesystem::path log_dir = config_.getString("general", "log_dir", "");
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    const auto log_file = log_dir / ("hvc-" + run_id + ".ndjson");
    if (ec || !logger_.setOutputFile(log_file.string())) {
        err_ << "hvcctl: warning: cannot write run log to " << log_file.string() << "\n";
    }
}

std::set<int> CleanupApplication::rebootRequiredCodes() const {
    std::set<int> codes;
    for (const auto& text : config_.getStringList("executor", "reboot_required_codes")) {
        try {
            size_t consumed = 0;
            const int code = std::stoi(text, &consumed);
            if (consumed != text.size()) {
                throw std::invalid_argument(text);
            }
            codes.insert(code);
        } catch (const std::logic_error&) {
            throw PreconditionError("invalid executor.reboot_required_codes entry: " + text);
        }
    }
    return codes;
}

int CleanupApplication::execute(const CLI::CliParseResult& parsed) {
    loadConfiguration(parsed);

    const std::string run_id = Logger::generateCorrelationId();
    openRunLog(run_id);
    logger_.addGlobalMetadata("command", parsed.command);
    logger_.info(kModule, "hvcctl started", {
        {"version", kVersion},
        {"command", parsed.command},
        {"dry_run", parsed.flag("_dry_run") ? "true" : "false"},
        {"unattended", parsed.flag("_yes") ? "true" : "false"},
    });

    if (parsed.command == "list-backups") {
        return listBackups();
    }

    ProcessRunner runner(logger_, std::chrono::seconds(config_.getInt("general", "process_timeout_seconds", 300)));
    auto system = system_factory_(runner, logger_);
    if (!system) {
        throw PreconditionError("no system management backend for this platform");
    }
    logger_.info(kModule, "Platform selected", {{"platform", system->platformName()}, {"host", system->hostName()}});

    if (!isReadOnly(parsed.command) && !parsed.flag("_dry_run") && !system->isElevated()) {
        throw PreconditionError("'" + parsed.command + "' must run with administrator privileges");
    }

    int exit_code = ToInt(ExitCode::kSuccess);
    if (parsed.command == "scan") {
        exit_code = scan(*system);
    } else if (parsed.command == "restore") {
        exit_code = restore(*system, parsed, run_id);
    } else {
        exit_code = cleanup(*system, parsed, run_id);
    }
    logger_.flush();
    return exit_code;
}

int CleanupApplication::listBackups() {
    Orchestrator::BackupStore store(config_.getString("general", "backup_dir", ""), logger_);
    const auto handles = store.list();
    if (handles.empty()) {
        out_ << "No backups found in " << store.root().string() << "\n";
        return ToInt(ExitCode::kSuccess);
    }

    for (const auto& handle : handles) {
        out_ << handle.id << "  ";
        try {
            const auto snapshot = store.load(handle);
            out_ << snapshot.host << "  " << snapshot.platform << "  "
                 << SnapshotUtils::formatTimestampMs(snapshot.captured_at_ms)
                 << (snapshot.partial ? "  (partial)" : "")
                 << (std::filesystem::is_directory(Orchestrator::BackupStore::driverStorePath(handle))
                         ? "  +drivers" : "")
                 << "\n";
        } catch (const CorruptDataError& e) {
            out_ << "CORRUPT: " << e.what() << "\n";
        }
    }
    return ToInt(ExitCode::kSuccess);
}

int CleanupApplication::scan(Platform::ISystemManagement& system) {
    Orchestrator::InventoryProbe probe(system, logger_);
    Orchestrator::BackupStore store(config_.getString("general", "backup_dir", ""), logger_);
    Orchestrator::ConfirmationGate gate(in_, out_, logger_, true);
    Orchestrator::StepExecutor executor(system, logger_, rebootRequiredCodes());
    Orchestrator::WorkflowSequencer sequencer(probe, store, gate, executor, system, logger_);
    Orchestrator::CleanupTaskCatalog catalog(Orchestrator::CleanupRules::fromConfig(config_));

    if (logger_.getLogLevel() == LogLevel::DEBUG) {
        out_ << "Effective configuration:\n" << config_.dump();
    }

    const auto snapshot = probe.capture();
    printInventory(snapshot);

    std::vector<Orchestrator::Step> steps;
    for (const auto& task_steps : sequencer.plan(catalog.forCommand(Orchestrator::CleanupTaskCatalog::kCleanAll),
                                                 snapshot)) {
        steps.insert(steps.end(), task_steps.begin(), task_steps.end());
    }
    printPlan(steps);
    return ToInt(ExitCode::kSuccess);
}

int CleanupApplication::cleanup(Platform::ISystemManagement& system, const CLI::CliParseResult& parsed,
                                const std::string& run_id) {
    Orchestrator::CleanupTaskCatalog catalog(Orchestrator::CleanupRules::fromConfig(config_));
    const auto tasks = catalog.forCommand(parsed.command);

    Orchestrator::InventoryProbe probe(system, logger_);
    Orchestrator::BackupStore store(config_.getString("general", "backup_dir", ""), logger_);
    Orchestrator::ConfirmationGate gate(in_, out_, logger_, parsed.flag("_yes"));
    Orchestrator::StepExecutor executor(system, logger_, rebootRequiredCodes());
    Orchestrator::WorkflowSequencer sequencer(probe, store, gate, executor, system, logger_);

    // EN: Driver packages stay in use while the guest tools are installed.
    // FR: Les paquets de pilotes restent utilisés tant que les outils invités sont installés.
    if (parsed.command == Orchestrator::CleanupTaskCatalog::kCleanDrivers && catalog.rules().require_tools_removed) {
        const auto conflicting = catalog.conflictingSoftware(probe.capture());
        if (!conflicting.empty()) {
            throw PreconditionError("remove the guest tools first (run 'hvcctl remove-tools'): " +
                                    joinLines(conflicting));
        }
    }

    Orchestrator::SequencerOptions options;
    options.run_id = run_id;
    options.command = parsed.command;
    options.dry_run = parsed.flag("_dry_run");
    options.export_driver_packages = config_.getBool("general", "export_driver_packages", true);
    options.on_plan = [this](const std::vector<Orchestrator::Step>& steps) { printPlan(steps); };

    return report(sequencer.run(tasks, options));
}

int CleanupApplication::restore(Platform::ISystemManagement& system, const CLI::CliParseResult& parsed,
                                const std::string& run_id) {
    Orchestrator::InventoryProbe probe(system, logger_);
    Orchestrator::BackupStore store(config_.getString("general", "backup_dir", ""), logger_);
    Orchestrator::ConfirmationGate gate(in_, out_, logger_, parsed.flag("_yes"));
    Orchestrator::StepExecutor executor(system, logger_, rebootRequiredCodes());
    Orchestrator::WorkflowSequencer sequencer(probe, store, gate, executor, system, logger_);
    Orchestrator::RestoreEngine engine(sequencer, store, logger_);

    std::optional<Orchestrator::BackupHandle> chosen;
    SystemSnapshot saved;

    if (const auto id = parsed.text("_backup_id")) {
        chosen = store.find(*id);
        if (!chosen) {
            throw NotFoundError(*id);
        }
        saved = store.load(*chosen);
    } else {
        const auto handles = store.list();
        if (handles.empty()) {
            throw NotFoundError("(latest) in " + store.root().string());
        }
        // EN: Without an explicit id, fall back to older backups when the newest is corrupt.
        // FR: Sans id explicite, on se replie sur des sauvegardes plus anciennes si la plus récente est corrompue.
        for (const auto& handle : handles) {
            try {
                saved = store.load(handle);
                chosen = handle;
                break;
            } catch (const CorruptDataError& e) {
                err_ << "hvcctl: warning: " << e.what() << ", trying an older backup\n";
                logger_.warn(kModule, "Skipping corrupt backup", {{"backup", handle.id}, {"error", e.what()}});
            }
        }
        if (!chosen) {
            throw CorruptDataError(handles.front().id, "no readable backup in " + store.root().string());
        }
    }

    out_ << "Restoring from backup " << chosen->id << " (" << saved.host << ", "
         << SnapshotUtils::formatTimestampMs(saved.captured_at_ms) << ")\n";

    Orchestrator::RestoreOptions options;
    options.run_id = run_id;
    options.include_network = parsed.flag("_with_network");
    options.dry_run = parsed.flag("_dry_run");
    options.on_plan = [this](const std::vector<Orchestrator::Step>& steps) { printPlan(steps); };

    return report(engine.restore(*chosen, saved, options));
}

int CleanupApplication::report(const Orchestrator::WorkflowRun& run) {
    // EN: The sequencer already wrote the workflow_run entry, which closes the run log.
    // FR: Le séquenceur a déjà écrit l'entrée workflow_run, qui clôt le journal d'exécution.
    out_ << Orchestrator::WorkflowUtils::formatSummary(run);
    return ToInt(exitCodeFor(run));
}

void CleanupApplication::printPlan(const std::vector<Orchestrator::Step>& steps) {
    out_ << "Planned steps (" << steps.size() << "):\n";
    for (const auto& step : steps) {
        out_ << "  [" << step.task << "] " << step.description
             << (step.destructive ? "" : " (non-destructive)") << "\n";
    }
}

void CleanupApplication::printInventory(const SystemSnapshot& snapshot) {
    out_ << "Host: " << snapshot.host << " (" << snapshot.platform << ")\n";
    if (snapshot.partial) {
        out_ << "Warning: inventory is partial, failed sections: " << joinLines(snapshot.failed_sections) << "\n";
    }

    out_ << "Devices (" << snapshot.devices.size() << "):\n";
    for (const auto& device : snapshot.devices) {
        out_ << "  " << (device.present ? "[present] " : "[ghost]   ") << std::left << std::setw(40)
             << device.display_name << " " << device.id << "\n";
    }

    out_ << "Driver packages (" << snapshot.drivers.size() << "):\n";
    for (const auto& driver : snapshot.drivers) {
        out_ << "  " << driver.published_name << "  " << driver.original_name << "  " << driver.provider
             << "  " << driver.version << "\n";
    }

    out_ << "Network interfaces (" << snapshot.network.size() << "):\n";
    for (const auto& iface : snapshot.network) {
        out_ << "  " << iface.name << "  " << iface.mac_address << "  ";
        if (iface.dhcp_enabled) {
            out_ << "dhcp";
        } else {
            out_ << iface.ip_address << "/" << iface.prefix_length << " gw " << iface.gateway;
        }
        out_ << "  dns " << joinLines(iface.dns_servers) << "\n";
    }

    out_ << "Disks (" << snapshot.disks.size() << "):\n";
    for (const auto& disk : snapshot.disks) {
        out_ << "  Disk " << disk.number << "  " << disk.name << "  " << disk.partition_style
             << (disk.offline ? "  offline" : "") << (disk.read_only ? "  read-only" : "") << "\n";
        for (const auto& partition : disk.partitions) {
            out_ << "    Partition " << partition.number << "  "
                 << (partition.drive_letter.empty() ? "-" : partition.drive_letter + ":") << "  "
                 << partition.type << "  " << partition.size_bytes << " bytes\n";
        }
    }

    out_ << "Installed software (" << snapshot.software.size() << "):\n";
    for (const auto& software : snapshot.software) {
        out_ << "  " << software.name << "  " << software.version << "  " << software.publisher << "\n";
    }
}

} // namespace App
} // namespace HVC
