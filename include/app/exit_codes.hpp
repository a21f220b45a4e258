// EN: Process exit contract of hvcctl, stable for scripts and deployment tooling.
// FR: Contrat de code de sortie de hvcctl, stable pour les scripts et outils de déploiement.

#pragma once

namespace HVC {
namespace App {

enum class ExitCode : int {
    kSuccess = 0,
    kPreconditionFailure = 1,   // EN: Not elevated, unsupported platform, bad usage, missing/corrupt backup, backup write failure
                                // FR: Non élevé, plateforme non supportée, mauvais usage, sauvegarde absente/corrompue, écriture impossible
    kPartialFailure = 2,        // EN: At least one step failed / FR: Au moins une étape a échoué
    kAborted = 3                // EN: Operator declined / FR: L'opérateur a refusé
};

constexpr int ToInt(ExitCode code) {
    return static_cast<int>(code);
}

} // namespace App
} // namespace HVC
