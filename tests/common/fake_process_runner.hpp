// EN: Scripted process runner for collaborator tests. Records every command line.
// FR: Exécuteur de processus scripté pour les tests de collaborateurs. Enregistre chaque ligne de commande.

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "infrastructure/system/process_runner.hpp"

namespace HVC {
namespace Testing {

class FakeProcessRunner : public IProcessRunner {
public:
    static ProcessResult ok(const std::string& output = "") {
        ProcessResult result;
        result.started = true;
        result.exit_code = 0;
        result.output = output;
        return result;
    }

    static ProcessResult exit(int code, const std::string& output = "") {
        ProcessResult result = ok(output);
        result.exit_code = code;
        return result;
    }

    static ProcessResult timeout() {
        ProcessResult result = ok();
        result.exit_code = -1;
        result.timed_out = true;
        return result;
    }

    static ProcessResult notStarted(const std::string& error = "No such file or directory") {
        ProcessResult result;
        result.started = false;
        result.error = error;
        return result;
    }

    // EN: Answer commands whose joined text contains `needle`. Later rules win.
    // FR: Répond aux commandes dont le texte joint contient `needle`. Les règles récentes l'emportent.
    void when(const std::string& needle, ProcessResult result) {
        rules_.emplace_back(needle, std::move(result));
    }

    ProcessResult run(const std::vector<std::string>& command) override {
        calls.push_back(command);
        const std::string text = join(command);
        for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
            if (text.find(it->first) != std::string::npos) {
                return it->second;
            }
        }
        return ok();
    }

    static std::string join(const std::vector<std::string>& command) {
        std::string text;
        for (const auto& part : command) {
            text += (text.empty() ? "" : " ") + part;
        }
        return text;
    }

    size_t count(const std::string& needle) const {
        size_t matches = 0;
        for (const auto& call : calls) {
            if (join(call).find(needle) != std::string::npos) {
                ++matches;
            }
        }
        return matches;
    }

    bool ran(const std::string& needle) const { return count(needle) > 0; }

    std::vector<std::vector<std::string>> calls;

private:
    std::vector<std::pair<std::string, ProcessResult>> rules_;
};

} // namespace Testing
} // namespace HVC
