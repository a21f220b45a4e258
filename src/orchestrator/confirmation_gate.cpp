// EN: Confirmation gate implementation.
// FR: Implémentation de la porte de confirmation.

#include "orchestrator/confirmation_gate.hpp"

#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace HVC {
namespace Orchestrator {

namespace {

constexpr const char* kModule = "confirmation";

std::string normalizeAnswer(std::string answer) {
    const auto first = answer.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = answer.find_last_not_of(" \t\r\n");
    answer = answer.substr(first, last - first + 1);
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer;
}

} // namespace

ConfirmationGate::ConfirmationGate(std::istream& in, std::ostream& out, Logger& logger, bool headless)
    : in_(in), out_(out), logger_(logger), headless_(headless) {}

bool ConfirmationGate::confirm(const std::string& question, int required) {
    if (required < 1 || required > 2) {
        throw std::invalid_argument("confirmation rounds must be 1 or 2, got " + std::to_string(required));
    }

    if (headless_) {
        logger_.warn(kModule, "confirmation_bypassed",
                     {{"question", question}, {"rounds", std::to_string(required)}});
        return true;
    }

    for (int round = 1; round <= required; ++round) {
        const std::string prompt = round == 1 ? question : "Are you absolutely sure? " + question;
        if (!askOnce(prompt)) {
            logger_.info(kModule, "Confirmation denied",
                         {{"question", question}, {"round", std::to_string(round)}});
            return false;
        }
    }

    logger_.info(kModule, "Confirmation granted",
                 {{"question", question}, {"rounds", std::to_string(required)}});
    return true;
}

bool ConfirmationGate::askOnce(const std::string& prompt) {
    std::string line;
    while (true) {
        out_ << prompt << " [y/N] " << std::flush;
        if (!std::getline(in_, line)) {
            // EN: End of input counts as a refusal.
            // FR: La fin d'entrée vaut refus.
            out_ << '\n';
            return false;
        }
        const std::string answer = normalizeAnswer(line);
        if (answer == "y" || answer == "yes") {
            return true;
        }
        if (answer == "n" || answer == "no") {
            return false;
        }
        out_ << "Please answer 'y' or 'n'.\n";
    }
}

} // namespace Orchestrator
} // namespace HVC
