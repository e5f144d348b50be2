#include "process/execution.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <pty.h>
#include <signal.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>
#include <chrono>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace executor {
using namespace std;
using namespace std::chrono;

const int BUF_SIZE = 4096;

// 子进程退出但管道仍被后台进程占用时，每次等待输出的最长时间
const milliseconds poll_interval(100);

bool result::is_ok() const {
    return ok;
}

static void close_fd(int &fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

/**
 * @brief 子进程中 exec 失败时调用，将 errno 通过管道告知父进程
 */
[[noreturn]] static void child_failed(int report_fd) {
    int err = errno;
    ssize_t ignored = write(report_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

/**
 * @brief 创建连接子进程的伪终端
 * 关闭回显，输出时不把 \n 转换为 \r\n，这样读到的输出与程序写出的内容一致。
 */
static void open_terminal(int &master, int &slave) {
    if (openpty(&master, &slave, nullptr, nullptr, nullptr) != 0)
        throw system_error(errno, system_category(), "Unable to open pseudo terminal");

    struct termios tios;
    if (tcgetattr(slave, &tios) == 0) {
        tios.c_lflag &= ~(ECHO | ECHOE | ECHOK | ECHONL);
        tios.c_oflag &= ~ONLCR;
        if (tcsetattr(slave, TCSANOW, &tios) == 0 &&
            fcntl(master, F_SETFD, FD_CLOEXEC) == 0 &&
            fcntl(slave, F_SETFD, FD_CLOEXEC) == 0)
            return;
    }
    int err = errno;
    close(master), close(slave);
    throw system_error(err, system_category(), "Unable to configure pseudo terminal");
}

child_process spawn_child(const vector<string> &argv, const filesystem::path &working_dir, bool terminal) {
    if (argv.empty())
        throw invalid_argument("Command line is empty");

    // 使用伪终端时 in[1] 和 out[0] 都是终端的主设备，in[0] 和 out[1] 都是从设备
    int in[2] = {-1, -1}, out[2] = {-1, -1}, report[2] = {-1, -1};
    auto close_all = [&] {
        for (int *fd : {&in[0], &in[1], &out[0], &out[1], &report[0], &report[1]}) close_fd(*fd);
    };

    if (terminal) {
        open_terminal(in[1], in[0]);
        out[0] = fcntl(in[1], F_DUPFD_CLOEXEC, 0);
        out[1] = fcntl(in[0], F_DUPFD_CLOEXEC, 0);
        if (out[0] < 0 || out[1] < 0) {
            int err = errno;
            close_all();
            throw system_error(err, system_category(), "Unable to duplicate pseudo terminal");
        }
    } else {
        if (pipe2(in, O_CLOEXEC) != 0)
            throw system_error(errno, system_category(), "Unable to create pipe");
        if (pipe2(out, O_CLOEXEC) != 0) {
            int err = errno;
            close_all();
            throw system_error(err, system_category(), "Unable to create pipe");
        }
    }
    if (pipe2(report, O_CLOEXEC) != 0) {
        int err = errno;
        close_all();
        throw system_error(err, system_category(), "Unable to create pipe");
    }

    vector<char *> args;
    for (auto &arg : argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);
    string dir = working_dir.string();

    pid_t pid = fork();
    switch (pid) {
        case -1: {  // fork 失败
            int err = errno;
            close_all();
            throw system_error(err, system_category(), "Unable to fork");
        }
        case 0:  // 子进程
            // 独立的进程组，以便通过 kill(-pid) 终止程序 fork 出来的所有进程。
            // 使用伪终端时新建会话，进程组 id 同样是 pid，并将伪终端设为控制终端
            if (terminal) {
                if (setsid() < 0 || ioctl(in[0], TIOCSCTTY, 0) < 0)
                    child_failed(report[1]);
            } else {
                setpgid(0, 0);
            }
            // 执行机忽略了 SIGPIPE，exec 会继承被忽略的信号
            signal(SIGPIPE, SIG_DFL);
            signal(SIGINT, SIG_DFL);
            if (dup2(in[0], STDIN_FILENO) < 0 ||
                dup2(out[1], STDOUT_FILENO) < 0 ||
                dup2(out[1], STDERR_FILENO) < 0)
                child_failed(report[1]);
            if (!dir.empty() && chdir(dir.c_str()) != 0)
                child_failed(report[1]);
            execvp(args[0], args.data());
            child_failed(report[1]);
        default:  // 父进程
            break;
    }

    // 子进程也会设置，这里再设置一次避免父进程先于子进程使用进程组。
    // 新建会话的子进程不能由父进程设置，否则 setsid 会失败
    if (!terminal) setpgid(pid, pid);
    close_fd(in[0]), close_fd(out[1]), close_fd(report[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(report[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close_fd(report[0]);

    if (n == sizeof(child_errno)) {
        // exec 失败，报告管道在 exec 成功时会因为 O_CLOEXEC 被关闭而读到 EOF
        int status;
        waitpid(pid, &status, 0);
        close_all();
        throw system_error(child_errno, system_category(), "Unable to execute " + argv[0]);
    }

    child_process child;
    child.pid = pid;
    child.input_fd = in[1];
    child.output_fd = out[0];
    return child;
}

optional<int> exit_status_of(int wait_status) {
    if (WIFEXITED(wait_status))
        return WEXITSTATUS(wait_status);
    return nullopt;
}

void terminate_process_group(pid_t pgid) {
    if (pgid <= 0) return;
    if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "Unable to kill process group " << pgid << ": " << strerror(errno);
}

static mutex longrunning_mutex;
static set<pid_t> longrunning;

void register_longrunning(pid_t pgid) {
    lock_guard<mutex> guard(longrunning_mutex);
    longrunning.insert(pgid);
}

void unregister_longrunning(pid_t pgid) {
    lock_guard<mutex> guard(longrunning_mutex);
    longrunning.erase(pgid);
}

size_t kill_longrunning() {
    lock_guard<mutex> guard(longrunning_mutex);
    size_t killed = 0;
    for (pid_t pgid : longrunning) {
        if (kill(-pgid, 0) == 0) {
            LOG(INFO) << "Killing process group " << pgid << " left behind by a previous program";
            terminate_process_group(pgid);
            ++killed;
        }
    }
    longrunning.clear();
    return killed;
}

/**
 * @brief 在 deadline 之前等待子进程结束
 * @return 子进程是否已经结束，结束时 status 为 waitpid 得到的状态
 */
static bool wait_until(pid_t pid, int &status, steady_clock::time_point deadline) {
    while (true) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) return true;
        if (ret < 0 && errno != EINTR) {
            status = 0;
            return true;
        }
        if (steady_clock::now() >= deadline) return false;
        this_thread::sleep_for(milliseconds(10));
    }
}

result execute_program(const vector<string> &argv, const filesystem::path &working_dir, int timeout) {
    result res;
    string command = join_command(argv);
    LOG(INFO) << "Running " << command << " in " << working_dir << " with timeout " << timeout << "s";

    child_process child;
    try {
        child = spawn_child(argv, working_dir);
    } catch (system_error &ex) {
        LOG(WARNING) << ex.what();
        res.output = ex.what();
        return res;
    }
    close_fd(child.input_fd);

    auto deadline = steady_clock::now() + seconds(timeout);
    string output;
    char buffer[BUF_SIZE];
    bool eof = false, exited = false;
    int status = 0;

    while (!eof) {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) break;

        struct pollfd pfd = {child.output_fd, POLLIN, 0};
        int ret = poll(&pfd, 1, (int)min(remaining, poll_interval).count());
        if (ret < 0) {
            if (errno == EINTR) continue;
            LOG(WARNING) << "Unable to poll output of " << command << ": " << strerror(errno);
            break;
        } else if (ret == 0) {
            // 程序已经结束，但它启动的后台进程仍然持有管道
            if (exited) break;
            if (waitpid(child.pid, &status, WNOHANG) == child.pid) exited = true;
            continue;
        }

        ssize_t n = read(child.output_fd, buffer, sizeof(buffer));
        if (n > 0)
            output.append(buffer, n);
        else if (n == 0 || errno != EINTR)
            eof = true;
    }
    close_fd(child.output_fd);

    if (!exited && !wait_until(child.pid, status, deadline)) {
        LOG(WARNING) << command << " exceeded the time limit of " << timeout << "s";
        terminate_process_group(child.pid);
        waitpid(child.pid, &status, 0);
        res.timed_out = true;
    }

    // 仍然存活的进程留给下一个独占执行的程序处理
    if (kill(-child.pid, 0) == 0)
        register_longrunning(child.pid);

    res.output = decode_output(output);
    if (!res.timed_out)
        res.exit_status = exit_status_of(status);
    res.ok = res.exit_status && *res.exit_status == 0;

    DLOG(INFO) << command << " finished, exit status "
               << (res.exit_status ? to_string(*res.exit_status) : "none") << ", output: " << res.output;
    return res;
}

}  // namespace executor
