#include "process/interactive_process.hpp"
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>
#include <system_error>
#include <thread>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "process/execution.hpp"

namespace executor {
using namespace std;
using namespace std::chrono;

// 每次等待输出的最长时间，超过后检查子进程是否已经结束
static const milliseconds poll_interval(100);

interactive_process::~interactive_process() = default;

local_process::local_process(const vector<string> &argv, const filesystem::path &working_dir) {
    child_process child = spawn_child(argv, working_dir, true);
    child_pid = child.pid;
    input_fd = child.input_fd;
    output_fd = child.output_fd;
    register_longrunning(child_pid);
    LOG(INFO) << "Spawned " << join_command(argv) << " in " << working_dir << " as pid " << child_pid;
}

local_process::~local_process() {
    kill();
    close_input();
    if (output_fd >= 0) close(output_fd);
    unregister_longrunning(child_pid);
}

void local_process::close_input() {
    if (input_fd >= 0) close(input_fd);
    input_fd = -1;
}

void local_process::write(const string &text) {
    // 程序结束后写入伪终端不会失败，需要自己检查
    if (input_fd >= 0 && reap(nullopt)) close_input();
    if (input_fd < 0)
        throw system_error(EPIPE, system_category(), "Standard input of the program is closed");

    size_t written = 0;
    while (written < text.size()) {
        ssize_t n = ::write(input_fd, text.data() + written, text.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            if (err == EPIPE) close_input();
            throw system_error(err, system_category(), "Unable to write to the program");
        }
        written += n;
    }
}

bool local_process::fill(steady_clock::time_point deadline) {
    while (!eof) {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) return false;

        struct pollfd pfd = {output_fd, POLLIN, 0};
        int ret = poll(&pfd, 1, (int)min(remaining, poll_interval).count());
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "Unable to poll output of the program");
        } else if (ret == 0) {
            // 程序结束后，它的后台进程可能仍然持有管道，此时不再等待输出
            if (reap(nullopt)) {
                drain(deadline);
                eof = true;
                return true;
            }
            continue;
        }

        char chunk[4096];
        ssize_t n = read(output_fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, n);
            output.append(chunk, n);
            return true;
        } else if (n == 0 || errno != EINTR) {
            eof = true;
            return true;
        }
    }
    return true;
}

void local_process::drain(steady_clock::time_point deadline) {
    char chunk[4096];
    while (steady_clock::now() < deadline) {
        struct pollfd pfd = {output_fd, POLLIN, 0};
        int ret = poll(&pfd, 1, 0);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) break;

        ssize_t n = read(output_fd, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        buffer.append(chunk, n);
        output.append(chunk, n);
    }
}

bool local_process::reap(optional<steady_clock::time_point> deadline) {
    while (!exited) {
        int wstatus = 0;
        pid_t ret = waitpid(child_pid, &wstatus, WNOHANG);
        if (ret == child_pid) {
            exited = true;
            status = exit_status_of(wstatus);
            LOG(INFO) << "Program " << child_pid << " finished, exit status "
                      << (status ? to_string(*status) : "none");
            break;
        } else if (ret < 0 && errno != EINTR) {
            exited = true;
            LOG(WARNING) << "Unable to wait for program " << child_pid << ": " << strerror(errno);
            break;
        }
        if (!deadline || steady_clock::now() >= *deadline) return false;
        this_thread::sleep_for(milliseconds(10));
    }
    return true;
}

wait_outcome local_process::read_until(const output_matcher &matcher, milliseconds timeout) {
    auto deadline = steady_clock::now() + timeout;
    while (true) {
        if (auto region = matcher(buffer)) {
            wait_outcome outcome{wait_outcome::status::MATCHED, decode_output(buffer.substr(0, region->begin)),
                                 decode_output(buffer.substr(region->begin, region->end - region->begin))};
            buffer.erase(0, region->end);
            return outcome;
        }

        if (eof) {
            // 输出已经关闭，期望的内容不会再出现了。程序关闭输出后稍后才会退出，
            // 短暂等待以便取得返回值，程序仍未退出时同样视为结束
            reap(min(deadline, steady_clock::now() + poll_interval));
            return {wait_outcome::status::ENDED, decode_output(buffer), ""};
        }

        if (!fill(deadline))
            return {wait_outcome::status::TIMED_OUT, decode_output(buffer), ""};
    }
}

wait_outcome local_process::wait_for_exit(milliseconds timeout) {
    auto deadline = steady_clock::now() + timeout;
    while (!eof)
        if (!fill(deadline))
            return {wait_outcome::status::TIMED_OUT, decode_output(buffer), ""};

    if (!reap(deadline))
        return {wait_outcome::status::TIMED_OUT, decode_output(buffer), ""};

    wait_outcome outcome{wait_outcome::status::ENDED, decode_output(buffer), ""};
    buffer.clear();
    return outcome;
}

void local_process::kill() {
    if (child_pid <= 0) return;
    // 即使主进程已经结束，进程组中也可能残留后台进程
    terminate_process_group(child_pid);
    if (!exited) {
        int wstatus = 0;
        pid_t ret;
        do {
            ret = waitpid(child_pid, &wstatus, 0);
        } while (ret < 0 && errno == EINTR);
        exited = true;
        if (ret == child_pid) status = exit_status_of(wstatus);
    }
}

bool local_process::finished() const {
    return exited;
}

optional<int> local_process::exit_status() const {
    return status;
}

string local_process::transcript() const {
    return decode_output(output);
}

pid_t local_process::pid() const {
    return child_pid;
}

}  // namespace executor
