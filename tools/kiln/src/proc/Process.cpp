#include <kiln_tool/proc/Process.hpp>

#include <cerrno>
#include <cstdint>
#include <cstring>

#if defined(_WIN32)
#include <process.h>
#else
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
extern char** environ;
#endif

namespace kiln_tool::proc {

namespace {

template <typename Char>
std::vector<Char*> c_argv(const std::vector<std::string>& argv) {
    std::vector<Char*> out;
    out.reserve(argv.size() + 1);
    for (const auto& a : argv) out.push_back(const_cast<Char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

Outcome not_started(const std::string& program, int err) {
    Outcome o{};
    o.status = 127;
    o.error = "cannot run '" + program + "': " + std::strerror(err);
    return o;
}

} // namespace

Outcome run_executor(const std::vector<std::string>& argv) {
    if (argv.empty()) return not_started("", EINVAL);

#if defined(_WIN32)
    auto args = c_argv<const char>(argv);
    const intptr_t rc = _spawnvp(_P_WAIT, argv.front().c_str(), args.data());
    if (rc < 0) return not_started(argv.front(), errno);
    return Outcome{true, static_cast<int>(rc), {}};
#else
    auto args = c_argv<char>(argv);
    pid_t pid = -1;
    if (const int rc = posix_spawnp(&pid, argv.front().c_str(), nullptr, nullptr, args.data(), environ); rc != 0) {
        return not_started(argv.front(), rc);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return Outcome{true, 1, "waitpid failed: " + std::string(std::strerror(errno))};
    }
    if (WIFSIGNALED(status)) return Outcome{true, 128 + WTERMSIG(status), {}};
    return Outcome{true, WIFEXITED(status) ? WEXITSTATUS(status) : 1, {}};
#endif
}

} // namespace kiln_tool::proc
