/*
    Copyright (c) 2011-2015 Andrey Sibiryov <me@kobology.ru>
    Copyright (c) 2011-2015 Other contributors as noted in the AUTHORS file.

    This file is part of Runas.

    Runas is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.

    Runas is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/


#include "runas/detail/process.hpp"

#include <array>
#include <iostream>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace runas { namespace detail { namespace process {

namespace {

void
close_all(std::array<int, 2>& pipes) {
    for(auto it = pipes.begin(); it != pipes.end(); ++it) {
        if(*it >= 0) {
            ::close(*it);
            *it = -1;
        }
    }
}

// Child initialization, never returns.
__attribute__((noreturn))
void
exec(const std::string& command, const std::vector<std::string>& args,
     const string_map_t& environment)
{
    std::vector<char*> argv = { ::strdup(command.c_str()) }, envp;

    for(auto it = args.begin(); it != args.end(); ++it) {
        argv.push_back(::strdup(it->c_str()));
    }

    argv.push_back(nullptr);

    for(char** ptr = environ; *ptr != nullptr; ++ptr) {
        const char* separator = std::strchr(*ptr, '=');
        const std::string name(*ptr, separator ? separator - *ptr : std::strlen(*ptr));

        if(environment.count(name) == 0) {
            envp.push_back(::strdup(*ptr));
        }
    }

    for(auto it = environment.begin(); it != environment.end(); ++it) {
        if(!it->second.empty()) {
            envp.push_back(::strdup(runas::format("{}={}", it->first, it->second).c_str()));
        }
    }

    envp.push_back(nullptr);

    // Unblock all the signals

    sigset_t sigset;

    sigfillset(&sigset);

    ::sigprocmask(SIG_UNBLOCK, &sigset, nullptr);

    if(::execvpe(argv[0], argv.data(), envp.data()) != 0) {
        std::error_code ec(errno, std::system_category());
        std::cerr << runas::format("unable to execute '{}' - [{}] {}", command, ec.value(), ec.message());
    }

    std::_Exit(kExecFailure);
}

} // namespace

auto
run(const std::string& command, const std::vector<std::string>& args,
    const string_map_t& environment) -> result_t
{
    std::array<int, 2> out = {{ -1, -1 }}, err = {{ -1, -1 }};

    if(::pipe2(out.data(), O_CLOEXEC) != 0) {
        throw error_t(error::spawn_failed, "unable to create an output pipe - {}", std::strerror(errno));
    }

    if(::pipe2(err.data(), O_CLOEXEC) != 0) {
        const int ec = errno;
        close_all(out);
        throw error_t(error::spawn_failed, "unable to create an error pipe - {}", std::strerror(ec));
    }

    const pid_t pid = ::fork();

    if(pid < 0) {
        const int ec = errno;
        close_all(out);
        close_all(err);
        throw error_t(error::spawn_failed, "unable to fork - {}", std::strerror(ec));
    }

    if(pid == 0) {
        ::dup2(out[1], STDOUT_FILENO);
        ::dup2(err[1], STDERR_FILENO);

        exec(command, args, environment);
    }

    ::close(out[1]);
    ::close(err[1]);

    result_t result;

    std::array<pollfd, 2> fds = {{
        { out[0], POLLIN, 0 },
        { err[0], POLLIN, 0 }
    }};

    std::array<std::string*, 2> sinks = {{ &result.out, &result.err }};
    std::array<char, 4096> buffer;

    std::size_t open = fds.size();

    while(open > 0) {
        if(::poll(fds.data(), fds.size(), -1) < 0) {
            if(errno == EINTR) {
                continue;
            }

            break;
        }

        for(std::size_t i = 0; i < fds.size(); ++i) {
            if(fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }

            const ssize_t size = ::read(fds[i].fd, buffer.data(), buffer.size());

            if(size > 0) {
                sinks[i]->append(buffer.data(), size);
            } else if(size == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open;
            }
        }
    }

    for(auto it = fds.begin(); it != fds.end(); ++it) {
        if(it->fd >= 0) {
            ::close(it->fd);
        }
    }

    int status = 0;

    while(::waitpid(pid, &status, 0) < 0) {
        if(errno != EINTR) {
            throw error_t(error::spawn_failed, "unable to collect '{}' - {}", command, std::strerror(errno));
        }
    }

    if(WIFEXITED(status)) {
        result.status = WEXITSTATUS(status);
    } else if(WIFSIGNALED(status)) {
        result.status = 128 + WTERMSIG(status);
    } else {
        result.status = -1;
    }

    if(result.status == kExecFailure) {
        throw error_t(error::spawn_failed, "unable to execute '{}' - {}", command, result.err);
    }

    return result;
}

}}} // namespace runas::detail::process
