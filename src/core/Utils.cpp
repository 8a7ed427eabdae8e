#include "Utils.h"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace lan_scan {
namespace utils {

std::optional<std::string> read_file(const std::string& path, size_t max_bytes){
    std::ifstream f(path, std::ios::binary);
    if(!f) return std::nullopt;
    std::string out;
    out.resize(max_bytes);
    f.read(out.data(), static_cast<std::streamsize>(max_bytes));
    out.resize(static_cast<size_t>(f.gcount()));
    return out;
}

std::string trim(const std::string& s){
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if(b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

CommandResult run_command(const std::vector<std::string>& argv, size_t max_output){
    CommandResult res;
    if(argv.empty()) return res;
    std::vector<char*> cargv;
    for(const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int fds[2];
    if(pipe2(fds, O_CLOEXEC) != 0) return res;
    pid_t pid = fork();
    if(pid < 0){ close(fds[0]); close(fds[1]); return res; }
    if(pid == 0){
        // child: only async-signal-safe calls until exec
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if(devnull >= 0) dup2(devnull, STDIN_FILENO);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }
    close(fds[1]);
    res.launched = true;
    char buf[4096];
    while(true){
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if(n < 0 && errno == EINTR) continue;
        if(n <= 0) break;
        if(res.output.size() < max_output){
            size_t take = std::min(static_cast<size_t>(n), max_output - res.output.size());
            res.output.append(buf, take);
        }
    }
    close(fds[0]);
    int status = 0;
    while(waitpid(pid, &status, 0) < 0){
        if(errno != EINTR){ res.exit_status = -1; return res; }
    }
    if(WIFEXITED(status)) res.exit_status = WEXITSTATUS(status);
    else res.exit_status = -1;
    return res;
}

}
}
