#include "SecretProvider.hpp"
#include "LogUtils.hpp"
#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <system_error>
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

namespace {

class EchoDisabler {
public:
    explicit EchoDisabler(int fd) : fd_(fd) {
        if (::tcgetattr(fd_, &saved_) == 0) {
            termios silent = saved_;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            active_ = ::tcsetattr(fd_, TCSAFLUSH, &silent) == 0;
        }
    }

    ~EchoDisabler() {
        if (active_) {
            ::tcsetattr(fd_, TCSAFLUSH, &saved_);
        }
    }

    EchoDisabler(const EchoDisabler&) = delete;
    EchoDisabler& operator=(const EchoDisabler&) = delete;

private:
    int fd_;
    termios saved_{};
    bool active_ = false;
};

void write_all(int fd, const std::string& text) {
    size_t written = 0;
    while (written < text.size()) {
        ssize_t n = ::write(fd, text.data() + written, text.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("cannot write password prompt: " + std::system_category().message(errno));
        }
        written += static_cast<size_t>(n);
    }
}

}

std::string TerminalSecretProvider::obtain_secret(const std::string& host) {
    std::lock_guard<std::mutex> lock(prompt_mutex_);

    int fd = ::open("/dev/tty", O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        throw std::runtime_error("no terminal available to ask for the SSH password of " + host);
    }

    std::string secret;
    try {
        write_all(fd, "Enter SSH password for " + host + ": ");
        {
            EchoDisabler no_echo(fd);
            char ch;
            while (true) {
                ssize_t n = ::read(fd, &ch, 1);
                if (n < 0 && errno == EINTR) continue;
                if (n <= 0 || ch == '\n' || ch == '\r') break;
                secret.push_back(ch);
            }
        }
        write_all(fd, "\n");
    } catch (const std::exception&) {
        ::close(fd);
        throw;
    }

    ::close(fd);
    LogUtils::debug("Password obtained for host {}", host);
    return secret;
}
