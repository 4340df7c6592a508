// keyboard.cpp
#include "keyboard.hpp"

#include <linux/input.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>

#include <dirent.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

static bool test_bit(const unsigned long* bits, int bit) {
    const int per = (int)(sizeof(unsigned long) * 8);
    return (bits[bit / per] >> (bit % per)) & 1UL;
}

// A device is a keyboard for our purposes if it reports EV_KEY and the
// chord key itself.
static bool reports_key(int fd, int key) {
    unsigned long evbits[(EV_MAX + 1 + sizeof(unsigned long) * 8 - 1) / (sizeof(unsigned long) * 8)] = {0};
    if (::ioctl(fd, EVIOCGBIT(0, sizeof(evbits)), evbits) < 0) return false;
    if (!test_bit(evbits, EV_KEY)) return false;

    unsigned long keybits[(KEY_MAX + 1 + sizeof(unsigned long) * 8 - 1) / (sizeof(unsigned long) * 8)] = {0};
    if (::ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keybits)), keybits) < 0) return false;
    return test_bit(keybits, key);
}

KeyboardListener::KeyboardListener(const Params& p, Callback cb)
    : p_(p), cb_(std::move(cb)), tracker_(p.keys) {}

KeyboardListener::~KeyboardListener() {
    stop();
}

void KeyboardListener::start() {
    if (running_.load()) return;

    DIR* dir = ::opendir(p_.input_dir.c_str());
    if (!dir) {
        throw std::runtime_error("cannot open " + p_.input_dir + ": " + std::strerror(errno));
    }

    int denied = 0;
    while (struct dirent* ent = ::readdir(dir)) {
        if (std::strncmp(ent->d_name, "event", 5) != 0) continue;

        const std::string path = p_.input_dir + "/" + ent->d_name;
        int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            if (errno == EACCES || errno == EPERM) denied++;
            continue;
        }
        if (!reports_key(fd, p_.keys.hotkey.key)) {
            ::close(fd);
            continue;
        }

        char name[256] = {0};
        if (::ioctl(fd, EVIOCGNAME(sizeof(name) - 1), name) < 0) {
            std::snprintf(name, sizeof(name), "unknown");
        }
        std::fprintf(stderr, "[keys] listening on %s (%s)\n", path.c_str(), name);
        fds_.push_back(fd);
    }
    ::closedir(dir);

    if (fds_.empty()) {
        if (denied > 0) {
            throw std::runtime_error("permission denied on " + p_.input_dir +
                                     "/event*; add yourself to the 'input' group");
        }
        throw std::runtime_error("no keyboard found under " + p_.input_dir);
    }

    if (::pipe2(wake_pipe_, O_CLOEXEC) != 0) {
        close_all();
        throw std::runtime_error(std::string("pipe2() failed: ") + std::strerror(errno));
    }

    tracker_.reset();
    running_.store(true);
    thread_ = std::thread([this]{ run(); });
}

void KeyboardListener::stop() {
    if (running_.exchange(false)) {
        const char b = 'x';
        if (::write(wake_pipe_[1], &b, 1) < 0) {
            std::fprintf(stderr, "[keys] wake write failed: %s\n", std::strerror(errno));
        }
    }
    if (thread_.joinable()) thread_.join();
    close_all();
}

void KeyboardListener::close_all() {
    for (int fd : fds_) ::close(fd);
    fds_.clear();
    for (int& fd : wake_pipe_) {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
}

void KeyboardListener::run() {
    std::vector<struct pollfd> pfds;
    pfds.push_back({wake_pipe_[0], POLLIN, 0});
    for (int fd : fds_) pfds.push_back({fd, POLLIN, 0});

    struct input_event evs[64];

    while (running_.load()) {
        int rc = ::poll(pfds.data(), (nfds_t)pfds.size(), -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::fprintf(stderr, "[keys] poll failed: %s\n", std::strerror(errno));
            break;
        }
        if (pfds[0].revents & POLLIN) break;

        for (size_t i = 1; i < pfds.size(); ++i) {
            if (pfds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                // Device unplugged; stop polling it.
                std::fprintf(stderr, "[keys] device fd=%d went away\n", pfds[i].fd);
                pfds[i].fd = -1;
                continue;
            }
            if (!(pfds[i].revents & POLLIN)) continue;

            ssize_t n = ::read(pfds[i].fd, evs, sizeof(evs));
            if (n < 0) {
                if (errno == EAGAIN || errno == EINTR) continue;
                std::fprintf(stderr, "[keys] read failed: %s\n", std::strerror(errno));
                pfds[i].fd = -1;
                continue;
            }

            const size_t count = (size_t)n / sizeof(struct input_event);
            for (size_t k = 0; k < count; ++k) {
                if (evs[k].type != EV_KEY) continue;
                for (ChordTracker::Action a : tracker_.feed(evs[k].code, evs[k].value)) {
                    cb_(a);
                }
            }
        }
    }
}
