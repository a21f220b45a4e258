// EN: Step and result descriptors for the cleanup workflow
// FR: Descripteurs d'étape et de résultat pour le workflow de nettoyage

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "model/system_snapshot.hpp"
#include "platform/system_management.hpp"

namespace HVC {
namespace Orchestrator {

// EN: Outcome of one step
// FR: Résultat d'une étape
enum class StepOutcome {
    Success,                // EN: Mutation applied / FR: Mutation appliquée
    SuccessRebootRequired,  // EN: Applied, restart pending / FR: Appliquée, redémarrage en attente
    Skipped,                // EN: Predicate false, nothing to do / FR: Prédicat faux, rien à faire
    Failed,                 // EN: Action failed or timed out / FR: Action échouée ou expirée
    WouldPerform            // EN: Dry-run report only / FR: Rapport de simulation uniquement
};

// EN: Named, declarative unit of work. The sequencer owns ordering; the executor supplies the collaborator.
// FR: Unité de travail nommée et déclarative. Le séquenceur gère l'ordre ; l'exécuteur fournit le collaborateur.
struct Step {
    std::string name;
    std::string task;                                                   // EN: Owning task / FR: Tâche propriétaire
    std::string description;
    std::function<bool(const SystemSnapshot&)> predicate;              // EN: Is the step applicable? / FR: L'étape est-elle applicable ?
    std::function<Platform::OperationResult(Platform::ISystemManagement&)> action;
    bool idempotent = true;                                             // EN: Second run on updated state is Skipped / FR: Une seconde exécution sur l'état à jour est ignorée
    bool destructive = true;                                            // EN: Needs backup and confirmation / FR: Nécessite sauvegarde et confirmation
    int confirmations_required = 1;
};

// EN: Immutable result of running one step.
// FR: Résultat immuable de l'exécution d'une étape.
struct StepResult {
    std::string step_name;
    std::string task;
    StepOutcome outcome = StepOutcome::Skipped;
    std::string detail;
};

// EN: A task expands a snapshot into its concrete, ordered steps.
// FR: Une tâche développe un instantané en étapes concrètes et ordonnées.
struct TaskDefinition {
    std::string name;
    std::string description;
    std::function<std::vector<Step>(const SystemSnapshot&)> plan;
};

namespace StepUtils {
    std::string outcomeToString(StepOutcome outcome);
}

} // namespace Orchestrator
} // namespace HVC
