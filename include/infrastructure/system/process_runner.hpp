// EN: Synchronous external process execution with a per-call timeout.
// FR: Exécution synchrone de processus externes avec timeout par appel.

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace HVC {

class Logger;

// EN: Outcome of one external invocation. stdout and stderr are merged into output.
// FR: Résultat d'une invocation externe. stdout et stderr sont fusionnés dans output.
struct ProcessResult {
    bool started = false;                   // EN: False if the program could not be launched / FR: Faux si le programme n'a pu être lancé
    int exit_code = -1;
    bool timed_out = false;                 // EN: Killed after the timeout elapsed / FR: Tué après expiration du timeout
    std::string output;
    std::string error;                      // EN: Launch error description / FR: Description de l'erreur de lancement
};

// EN: Process execution seam. Platform collaborators depend on this interface, tests replace it.
// FR: Point d'extension d'exécution de processus. Les collaborateurs plateforme en dépendent, les tests le remplacent.
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    // EN: Run command[0] with the remaining elements as arguments, no shell involved.
    // FR: Exécute command[0] avec les éléments suivants comme arguments, sans shell.
    virtual ProcessResult run(const std::vector<std::string>& command) = 0;
};

// EN: Real process runner (fork/exec on POSIX, CreateProcess on Windows).
// FR: Exécuteur de processus réel (fork/exec sous POSIX, CreateProcess sous Windows).
class ProcessRunner : public IProcessRunner {
public:
    ProcessRunner(Logger& logger, std::chrono::seconds timeout);

    ProcessResult run(const std::vector<std::string>& command) override;

    std::chrono::seconds timeout() const { return timeout_; }

    // EN: Quote one argument for a Windows command line (CommandLineToArgvW rules).
    // FR: Cite un argument pour une ligne de commande Windows (règles de CommandLineToArgvW).
    static std::string quoteWindowsArgument(const std::string& argument);

private:
    ProcessResult runPlatform(const std::vector<std::string>& command);

    Logger& logger_;
    std::chrono::seconds timeout_;
};

} // namespace HVC
