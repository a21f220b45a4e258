// EN: Operator confirmation gate for destructive workflows
// FR: Porte de confirmation opérateur pour les workflows destructifs

#pragma once

#include <istream>
#include <ostream>
#include <string>

namespace HVC {

class Logger;

namespace Orchestrator {

class ConfirmationGate {
public:
    // EN: In headless mode every question is answered yes and the bypass is logged.
    // FR: En mode sans interaction chaque question reçoit oui et le contournement est journalisé.
    ConfirmationGate(std::istream& in, std::ostream& out, Logger& logger, bool headless = false);

    // EN: Ask the question `required` times (1 or 2). Any refusal or end of input returns false.
    //     Throws std::invalid_argument for other round counts.
    // FR: Pose la question `required` fois (1 ou 2). Un refus ou une fin d'entrée retourne false.
    //     Lance std::invalid_argument pour d'autres nombres de tours.
    bool confirm(const std::string& question, int required = 1);

    bool isHeadless() const { return headless_; }

private:
    // EN: One yes/no round; re-prompts on unrecognized answers.
    // FR: Un tour oui/non ; redemande si la réponse est inconnue.
    bool askOnce(const std::string& prompt);

    std::istream& in_;
    std::ostream& out_;
    Logger& logger_;
    bool headless_;
};

} // namespace Orchestrator
} // namespace HVC
