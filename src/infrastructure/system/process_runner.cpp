// EN: Process runner implementation. Output is captured through a pipe while the deadline is enforced.
// FR: Implémentation de l'exécuteur de processus. La sortie est capturée par un tube pendant que l'échéance est appliquée.

#include "infrastructure/system/process_runner.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstring>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#include <future>
#include <thread>
#else
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace HVC {

namespace {

constexpr const char* kModule = "process";

#ifdef _WIN32
constexpr std::chrono::seconds kDrainGrace{5};
#endif

std::string joinCommand(const std::vector<std::string>& command) {
    std::ostringstream oss;
    for (size_t i = 0; i < command.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << command[i];
    }
    return oss.str();
}

} // namespace

ProcessRunner::ProcessRunner(Logger& logger, std::chrono::seconds timeout)
    : logger_(logger), timeout_(timeout) {}

ProcessResult ProcessRunner::run(const std::vector<std::string>& command) {
    if (command.empty()) {
        ProcessResult result;
        result.error = "empty command";
        return result;
    }

    logger_.debug(kModule, "Running: " + joinCommand(command));
    ProcessResult result = runPlatform(command);

    if (!result.started) {
        logger_.warn(kModule, "Failed to start " + command.front() + ": " + result.error);
    } else if (result.timed_out) {
        logger_.warn(kModule, command.front() + " timed out",
                     {{"timeout_seconds", std::to_string(timeout_.count())}});
    } else {
        logger_.debug(kModule, command.front() + " exited",
                      {{"exit_code", std::to_string(result.exit_code)}});
    }
    return result;
}

std::string ProcessRunner::quoteWindowsArgument(const std::string& argument) {
    if (!argument.empty() && argument.find_first_of(" \t\n\v\"") == std::string::npos) {
        return argument;
    }

    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : argument) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            // EN: Backslashes before a quote are doubled, then the quote is escaped.
            // FR: Les barres obliques avant un guillemet sont doublées, puis le guillemet est échappé.
            quoted.append(backslashes * 2 + 1, '\\');
        } else {
            quoted.append(backslashes, '\\');
        }
        backslashes = 0;
        quoted.push_back(c);
    }
    quoted.append(backslashes * 2, '\\');
    quoted.push_back('"');
    return quoted;
}

#ifdef _WIN32

ProcessResult ProcessRunner::runPlatform(const std::vector<std::string>& command) {
    ProcessResult result;

    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE read_end = nullptr;
    HANDLE write_end = nullptr;
    if (!CreatePipe(&read_end, &write_end, &sa, 0)) {
        result.error = "CreatePipe failed with error " + std::to_string(GetLastError());
        return result;
    }
    SetHandleInformation(read_end, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdOutput = write_end;
    si.hStdError = write_end;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);

    std::string command_line;
    for (size_t i = 0; i < command.size(); ++i) {
        if (i > 0) command_line.push_back(' ');
        command_line += quoteWindowsArgument(command[i]);
    }

    // EN: The child and every descendant live in one job, so a grandchild holding the pipe can be killed too.
    // FR: L'enfant et tous ses descendants vivent dans un job, un petit-enfant qui tient le tube peut donc être tué.
    HANDLE job = CreateJobObjectA(nullptr, nullptr);
    if (job) {
        JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits{};
        limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
        SetInformationJobObject(job, JobObjectExtendedLimitInformation, &limits, sizeof(limits));
    }

    PROCESS_INFORMATION pi{};
    if (!CreateProcessA(nullptr, command_line.data(), nullptr, nullptr, TRUE,
                        CREATE_NO_WINDOW | CREATE_SUSPENDED, nullptr, nullptr, &si, &pi)) {
        result.error = "CreateProcess failed with error " + std::to_string(GetLastError());
        CloseHandle(read_end);
        CloseHandle(write_end);
        if (job) CloseHandle(job);
        return result;
    }
    if (job && !AssignProcessToJobObject(job, pi.hProcess)) {
        logger_.warn(kModule, "Cannot place child in a job object, descendants will not be tracked",
                     {{"command", joinCommand(command)}, {"error", std::to_string(GetLastError())}});
        CloseHandle(job);
        job = nullptr;
    }
    ResumeThread(pi.hThread);
    result.started = true;
    CloseHandle(write_end);

    auto killTree = [&]() {
        if (job) {
            TerminateJobObject(job, 1);
        } else {
            TerminateProcess(pi.hProcess, 1);
        }
    };

    // EN: Drain the pipe on a helper thread so a chatty child never blocks on a full pipe.
    // FR: Vide le tube sur un thread auxiliaire pour qu'un enfant bavard ne bloque jamais sur un tube plein.
    std::string output;
    std::promise<void> drained;
    std::future<void> drained_future = drained.get_future();
    std::thread reader([read_end, &output, &drained]() {
        char buffer[4096];
        DWORD bytes_read = 0;
        while (ReadFile(read_end, buffer, sizeof(buffer), &bytes_read, nullptr) && bytes_read > 0) {
            output.append(buffer, bytes_read);
        }
        drained.set_value();
    });

    const auto timeout_ms = static_cast<DWORD>(
        std::chrono::duration_cast<std::chrono::milliseconds>(timeout_).count());
    if (WaitForSingleObject(pi.hProcess, timeout_ms) == WAIT_TIMEOUT) {
        killTree();
        WaitForSingleObject(pi.hProcess, INFINITE);
        result.timed_out = true;
    }

    DWORD exit_code = 0;
    GetExitCodeProcess(pi.hProcess, &exit_code);
    result.exit_code = static_cast<int>(exit_code);

    // EN: A descendant that inherited the write end keeps ReadFile blocked after the child exits.
    // FR: Un descendant qui a hérité de l'extrémité d'écriture bloque ReadFile après la fin de l'enfant.
    if (drained_future.wait_for(kDrainGrace) == std::future_status::timeout) {
        logger_.warn(kModule, "Output pipe still held by a descendant, terminating it",
                     {{"command", joinCommand(command)}});
        killTree();
        if (!job) {
            CancelIoEx(read_end, nullptr);
        }
    }
    reader.join();
    result.output = std::move(output);

    CloseHandle(read_end);
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    if (job) CloseHandle(job);
    return result;
}

#else

ProcessResult ProcessRunner::runPlatform(const std::vector<std::string>& command) {
    ProcessResult result;

    int output_pipe[2];
    if (pipe(output_pipe) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    // EN: The exec pipe is close-on-exec: it stays silent on success and carries errno on failure.
    // FR: Le tube d'exec est close-on-exec : silencieux en cas de succès, il transporte errno en cas d'échec.
    int exec_pipe[2];
    if (pipe(exec_pipe) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        close(output_pipe[0]);
        close(output_pipe[1]);
        return result;
    }
    fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        close(output_pipe[0]);
        close(output_pipe[1]);
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // EN: Own process group, so a timeout also reaches the descendants holding the pipe.
        // FR: Groupe de processus propre, pour qu'une expiration atteigne aussi les descendants qui tiennent le tube.
        setpgid(0, 0);
        close(output_pipe[0]);
        close(exec_pipe[0]);
        dup2(output_pipe[1], STDOUT_FILENO);
        dup2(output_pipe[1], STDERR_FILENO);
        close(output_pipe[1]);
        execvp(argv[0], argv.data());
        const int exec_errno = errno;
        ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    setpgid(pid, pid);
    close(output_pipe[1]);
    close(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t exec_bytes = 0;
    do {
        exec_bytes = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (exec_bytes < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (exec_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        close(output_pipe[0]);
        int status = 0;
        waitpid(pid, &status, 0);
        result.error = std::string("exec failed: ") + std::strerror(exec_errno);
        return result;
    }
    result.started = true;

    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    char buffer[4096];
    bool eof = false;

    while (!eof) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            kill(-pid, SIGKILL);
            result.timed_out = true;
            break;
        }

        pollfd pfd{output_pipe[0], POLLIN, 0};
        const int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            kill(-pid, SIGKILL);
            result.error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = read(output_pipe[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            eof = true;
        }
    }
    close(output_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

#endif

} // namespace HVC
