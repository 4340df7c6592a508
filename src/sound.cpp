// sound.cpp
#include "sound.hpp"

#include <cstdio>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

SoundPlayer::SoundPlayer(const Params& p)
    : p_(p) {}

SoundPlayer::~SoundPlayer() {
    std::lock_guard<std::mutex> lk(m_);
    reap_locked(true);
}

std::string SoundPlayer::last_error() const {
    std::lock_guard<std::mutex> lk(m_);
    return last_err_;
}

const char* SoundPlayer::cue_name(Cue cue) {
    switch (cue) {
        case Cue::Start:   return "start";
        case Cue::Stop:    return "stop";
        case Cue::Error:   return "error";
        case Cue::Success: return "success";
    }
    return "unknown";
}

std::string SoundPlayer::cue_path(Cue cue) const {
    std::string dir = p_.sound_dir;
    if (!dir.empty() && dir.back() != '/') dir.push_back('/');
    return dir + cue_name(cue) + ".wav";
}

void SoundPlayer::reap_locked(bool block) {
    std::vector<pid_t> alive;
    alive.reserve(children_.size());
    for (pid_t pid : children_) {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, block ? 0 : WNOHANG);
        if (r == 0) alive.push_back(pid);
    }
    children_.swap(alive);
}

bool SoundPlayer::play(Cue cue) {
    if (!p_.enabled) return false;

    std::lock_guard<std::mutex> lk(m_);
    reap_locked(false);

    const std::string wav_path = cue_path(cue);
    struct stat st;
    if (::stat(wav_path.c_str(), &st) != 0) {
        // Missing cue files are not an error; sounds are optional.
        return false;
    }

    std::vector<std::string> args;
    args.push_back(p_.player_bin);
    args.push_back("-q");
    if (!p_.out_device.empty()) {
        args.push_back("-D");
        args.push_back(p_.out_device);
    }
    args.push_back(wav_path);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        last_err_ = "fork() failed for " + p_.player_bin;
        std::fprintf(stderr, "[sound] %s\n", last_err_.c_str());
        return false;
    }
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    children_.push_back(pid);
    return true;
}
