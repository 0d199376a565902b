/** \file    ExecUtil.cc
 *  \brief   Implementation of the ExecUtil class.
 *  \author  Dr. Gordon W. Paynter
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2004-2008 Project iVia.
 *  Copyright 2004-2008 The Regents of The University of California.
 *  Copyright 2017-2020 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#include "ExecUtil.h"
#include <stdexcept>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include "StringUtil.h"
#include "util.h"


namespace {


// The following variable is set in Exec.
volatile sig_atomic_t alarm_went_off;


// SigAlarmHandler -- Used by Exec.
//
void SigAlarmHandler(int /* sig_no */) {
    alarm_went_off = 1;
}


bool IsExecutableFile(const std::string &path) {
    struct stat statbuf;
    return ::stat(path.c_str(), &statbuf) == 0 and S_ISREG(statbuf.st_mode) and (statbuf.st_mode & S_IXUSR);
}


// Replaces "target_fd" with "path" opened w/ "flags".  Only to be called in the child after fork(2).
void RedirectOrExit(const std::string &path, const int flags, const int target_fd) {
    const int new_fd(::open(path.c_str(), flags, 0644));
    if (new_fd == -1)
        ::_exit(-1);
    if (::dup2(new_fd, target_fd) == -1)
        ::_exit(-1);
    ::close(new_fd);
}


} // unnamed namespace


namespace ExecUtil {


int Exec(const std::string &command, const std::vector<std::string> &args, const std::string &new_stdin, const std::string &new_stdout,
         const std::string &new_stderr, const unsigned timeout_in_seconds, const int tardy_child_signal)
{
    errno = 0;
    if (::access(command.c_str(), X_OK) != 0)
        throw std::runtime_error("in ExecUtil::Exec: can't execute \"" + command + "\"!");

    const int EXECVE_FAILURE(248);

    const pid_t pid = ::fork();
    if (pid == -1)
        throw std::runtime_error("in ExecUtil::Exec: ::fork() failed: " + std::to_string(errno) + "!");

    // The child process:
    else if (pid == 0) {
        // Make us the leader of a new process group so that a timeout can take down our offspring as well:
        if (::setsid() == static_cast<pid_t>(-1))
            ::_exit(EXECVE_FAILURE);

        if (not new_stdin.empty())
            RedirectOrExit(new_stdin, O_RDONLY, STDIN_FILENO);
        if (not new_stdout.empty())
            RedirectOrExit(new_stdout, O_WRONLY | O_CREAT | O_TRUNC, STDOUT_FILENO);
        if (not new_stderr.empty())
            RedirectOrExit(new_stderr, O_WRONLY | O_CREAT | O_TRUNC, STDERR_FILENO);

        // Build the argument list for execv(2):
        std::vector<char *> argv;
        argv.reserve(1 + args.size() + 1);
        argv.emplace_back(::strdup(command.c_str()));
        for (const auto &arg : args)
            argv.emplace_back(::strdup(arg.c_str()));
        argv.emplace_back(nullptr);
        ::execv(command.c_str(), argv.data());

        ::_exit(EXECVE_FAILURE); // We typically never get here.
    }

    // The parent of the fork:
    struct sigaction old_alarm_action;
    if (timeout_in_seconds > 0) {
        // Install new alarm handler w/o SA_RESTART so that wait4(2) gets interrupted...
        alarm_went_off = 0;
        struct sigaction new_alarm_action;
        std::memset(&new_alarm_action, 0, sizeof new_alarm_action);
        new_alarm_action.sa_handler = SigAlarmHandler;
        ::sigemptyset(&new_alarm_action.sa_mask);
        ::sigaction(SIGALRM, &new_alarm_action, &old_alarm_action);

        // ...and wind the clock:
        ::alarm(timeout_in_seconds);
    }

    int child_exit_status(0);
    pid_t wait_retval;
    do {
        errno = 0;
        wait_retval = ::wait4(pid, &child_exit_status, 0, nullptr);
    } while (wait_retval == -1 and errno == EINTR and not alarm_went_off);
    const int wait_errno(errno);

    if (timeout_in_seconds > 0) {
        // Cancel any outstanding alarm:
        ::alarm(0);

        // Restore the old alarm handler:
        ::sigaction(SIGALRM, &old_alarm_action, nullptr);

        // Check to see whether the child timed out or not:
        if (alarm_went_off and wait_retval != pid) {
            // Snuff out all of our offspring.
            ::kill(-pid, tardy_child_signal);
            while (::wait4(-pid, &child_exit_status, 0, nullptr) != -1)
                /* Intentionally empty! */;

            errno = ETIME;
            return -1;
        }
    }

    if (unlikely(wait_retval != pid))
        throw std::runtime_error("in ExecUtil::Exec: wait4(2) failed: " + std::string(std::strerror(wait_errno)));
    errno = 0;

    // Now process the child's various exit status values:
    if (WIFEXITED(child_exit_status)) {
        if (WEXITSTATUS(child_exit_status) == EXECVE_FAILURE)
            throw std::runtime_error("in ExecUtil::Exec: failed to execve(2) \"" + command + "\" in child!");
        return WEXITSTATUS(child_exit_status);
    } else if (WIFSIGNALED(child_exit_status))
        throw std::runtime_error("in ExecUtil::Exec: \"" + command + "\" killed by signal " + std::to_string(WTERMSIG(child_exit_status))
                                 + "!");

    throw std::runtime_error("in ExecUtil::Exec: unexpected exit status for \"" + command + "\"!");
}


std::string Which(const std::string &executable_candidate) {
    if (executable_candidate.find('/') != std::string::npos)
        return IsExecutableFile(executable_candidate) ? executable_candidate : "";

    const char * const PATH(::getenv("PATH"));
    if (PATH == nullptr)
        return "";

    std::vector<std::string> path_components;
    StringUtil::Split(PATH, ':', &path_components, /* suppress_empty_components = */ true);
    for (const auto &path_component : path_components) {
        const std::string full_path(path_component + "/" + executable_candidate);
        if (IsExecutableFile(full_path))
            return full_path;
    }

    return "";
}


} // namespace ExecUtil
