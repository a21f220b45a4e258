// EN: hvcctl command dispatcher - maps subcommands to tasks, preconditions and exit codes
// FR: Répartiteur de commandes hvcctl - associe les sous-commandes aux tâches, préconditions et codes de sortie

#pragma once

#include <functional>
#include <istream>
#include <memory>
#include <set>
#include <ostream>
#include <string>
#include <vector>

#include "app/exit_codes.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/workflow_run.hpp"
#include "platform/system_management.hpp"

namespace HVC {

class IProcessRunner;

namespace CLI {
struct CliParseResult;
}

namespace App {

class CleanupApplication {
public:
    using SystemFactory =
        std::function<std::unique_ptr<Platform::ISystemManagement>(IProcessRunner&, Logger&)>;

    static constexpr const char* kVersion = "1.0.0";

    CleanupApplication(std::istream& in, std::ostream& out, std::ostream& err);

    // EN: Replace the platform collaborator (tests, embedding). Defaults to createSystemManagement.
    // FR: Remplace le collaborateur de plateforme (tests, intégration). Par défaut createSystemManagement.
    void setSystemFactory(SystemFactory factory);

    int run(int argc, char* argv[]);
    int run(const std::vector<std::string>& arguments);

    static ExitCode exitCodeFor(const Orchestrator::WorkflowRun& run);

    const ConfigManager& config() const { return config_; }

private:
    int execute(const CLI::CliParseResult& parsed);
    void loadConfiguration(const CLI::CliParseResult& parsed);
    void openRunLog(const std::string& run_id);

    int listBackups();
    int scan(Platform::ISystemManagement& system);
    int cleanup(Platform::ISystemManagement& system, const CLI::CliParseResult& parsed, const std::string& run_id);
    int restore(Platform::ISystemManagement& system, const CLI::CliParseResult& parsed, const std::string& run_id);

    std::set<int> rebootRequiredCodes() const;
    void printInventory(const SystemSnapshot& snapshot);
    void printPlan(const std::vector<Orchestrator::Step>& steps);
    int report(const Orchestrator::WorkflowRun& run);

    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    Logger logger_;
    ConfigManager config_;
    SystemFactory system_factory_;
};

} // namespace App
} // namespace HVC
