#include "audio_sink.hpp"
#include "log.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lanejump {

namespace {

void put_u16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
}

void put_u32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
}

bool have_cmd(const char* name) {
    std::string cmd = "command -v "; cmd += name; cmd += " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

bool write_file(const std::string& path, const std::string& data) {
    FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) return false;
    bool ok = std::fwrite(data.data(), 1, data.size(), f) == data.size();
    if (std::fclose(f) != 0) ok = false;
    return ok;
}

// Reaps pid, retrying on EINTR. Returns false if it is still running
// (only possible with WNOHANG).
bool reap(pid_t pid, int flags) {
    while (true) {
        pid_t r = waitpid(pid, nullptr, flags);
        if (r == pid) return true;
        if (r == 0) return false;
        if (errno == EINTR) continue;
        return true; // ECHILD: already gone
    }
}

} // namespace

std::string encode_wav(const ToneBuffer& buffer) {
    const uint16_t channels = 1;
    const uint16_t bits = 16;
    const uint16_t block_align = channels * (bits / 8);
    const uint32_t rate = static_cast<uint32_t>(buffer.sample_rate());
    const uint32_t data_size = static_cast<uint32_t>(buffer.size() * block_align);

    std::string out;
    out.reserve(44 + data_size);
    out += "RIFF";
    put_u32(out, 36 + data_size);
    out += "WAVE";
    out += "fmt ";
    put_u32(out, 16);
    put_u16(out, 1); // PCM
    put_u16(out, channels);
    put_u32(out, rate);
    put_u32(out, rate * block_align);
    put_u16(out, block_align);
    put_u16(out, bits);
    out += "data";
    put_u32(out, data_size);
    for (int16_t s : buffer.samples()) put_u16(out, static_cast<uint16_t>(s));
    return out;
}

// ---------- ProcessPlayback ----------
void ProcessPlayback::wait() {
    if (pid_ <= 0) return;
    reap(pid_, 0);
    pid_ = -1;
}

bool ProcessPlayback::finished() {
    if (pid_ <= 0) return true;
    if (!reap(pid_, WNOHANG)) return false;
    pid_ = -1;
    return true;
}

void ProcessPlayback::stop() {
    if (pid_ <= 0) return;
    kill(-pid_, SIGTERM);
    for (int i = 0; i < 50; ++i) { // up to ~500ms
        if (reap(pid_, WNOHANG)) { pid_ = -1; return; }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    kill(-pid_, SIGKILL);
    reap(pid_, 0);
    pid_ = -1;
}

// ---------- ProcessAudioSink ----------
ProcessAudioSink::ProcessAudioSink() {
    if (have_cmd("aplay")) {
        player_ = "aplay";
        player_args_ = { "aplay", "-q" };
    } else if (have_cmd("paplay")) {
        player_ = "paplay";
        player_args_ = { "paplay" };
    } else if (have_cmd("afplay")) {
        player_ = "afplay";
        player_args_ = { "afplay" };
    } else {
        log_warn("no audio player found (aplay, paplay, afplay); running silent");
        return;
    }
    make_scratch_dir();
}

ProcessAudioSink::ProcessAudioSink(std::vector<std::string> player_args)
    : player_args_(std::move(player_args)) {
    if (player_args_.empty()) return;
    player_ = player_args_.front();
    make_scratch_dir();
}

void ProcessAudioSink::make_scratch_dir() {
    const char* tmp = std::getenv("TMPDIR");
    std::string tmpl = std::string(tmp && *tmp ? tmp : "/tmp") + "/lanejump-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        log_warn("cannot create audio scratch directory under " + tmpl);
        return;
    }
    dir_ = buf.data();
    log_info("audio via " + player_ + ", clips in " + dir_);
}

ProcessAudioSink::~ProcessAudioSink() {
    for (const auto& kv : clips_) std::remove(kv.second.path.c_str());
    if (!dir_.empty()) rmdir(dir_.c_str());
}

const std::string* ProcessAudioSink::clip_path(const ToneBufferPtr& buffer) {
    auto it = clips_.find(buffer.get());
    if (it != clips_.end()) return &it->second.path;

    std::string path = dir_ + "/clip-" + std::to_string(next_clip_++) + ".wav";
    if (!write_file(path, encode_wav(*buffer))) {
        log_warn("cannot write " + path);
        std::remove(path.c_str());
        return nullptr;
    }
    auto ins = clips_.emplace(buffer.get(), Clip{buffer, path});
    return &ins.first->second.path;
}

std::unique_ptr<Playback> ProcessAudioSink::start(const ToneBufferPtr& buffer) {
    if (!available() || !buffer || buffer->empty()) return nullptr;

    const std::string* path = clip_path(buffer);
    if (!path) return nullptr;

    std::vector<char*> argv;
    for (auto& a : player_args_) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(const_cast<char*>(path->c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == 0) {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }
    if (pid < 0) {
        log_warn("fork failed for " + player_);
        return nullptr;
    }
    setpgid(pid, pid);
    return std::unique_ptr<Playback>(new ProcessPlayback(pid));
}

} // namespace lanejump
