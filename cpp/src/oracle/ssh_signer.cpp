#include "touchseal/oracle/ssh_signer.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <ctime>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "touchseal/codec/encoding.hpp"
#include "touchseal/codec/ssh_wire.hpp"

namespace touchseal::oracle {
    namespace {
        using touchseal::core::Status;
        using touchseal::core::StatusCode;
        using touchseal::core::StatusDomain;

        constexpr std::size_t kMaxSignerOutputBytes = 64 * 1024;
        constexpr std::string_view kArmorBegin = "-----BEGIN SSH SIGNATURE-----";
        constexpr std::string_view kArmorEnd = "-----END SSH SIGNATURE-----";
        constexpr std::string_view kSshsigMagic = "SSHSIG";

        [[nodiscard]] Status oracle_status(StatusCode code, u32 aux = 0) noexcept {
            return touchseal::core::make_status(StatusDomain::Oracle, code, aux);
        }

        void close_fd(int* fd) noexcept {
            if (*fd >= 0) {
                ::close(*fd);
                *fd = -1;
            }
        }

        struct ChildPipes {
            int in[2]{-1, -1};
            int out[2]{-1, -1};
            int err[2]{-1, -1};

            ~ChildPipes() {
                for (int* fd : {&in[0], &in[1], &out[0], &out[1], &err[0], &err[1]}) {
                    close_fd(fd);
                }
            }
        };

        // Writes with SIGPIPE blocked so a child that died early surfaces as EPIPE.
        [[nodiscard]] bool write_all_nosigpipe(int fd, BufferView data) noexcept {
            sigset_t block;
            sigset_t old;
            sigemptyset(&block);
            sigaddset(&block, SIGPIPE);
            pthread_sigmask(SIG_BLOCK, &block, &old);

            bool ok = true;
            bool got_epipe = false;
            u32 off = 0;
            while (off < data.len) {
                const ssize_t n = ::write(fd, data.data + off, data.len - off);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    got_epipe = (errno == EPIPE);
                    ok = false;
                    break;
                }
                off += static_cast<u32>(n);
            }

            if (got_epipe) {
                const struct timespec zero{0, 0};
                sigtimedwait(&block, nullptr, &zero);
            }
            pthread_sigmask(SIG_SETMASK, &old, nullptr);
            return ok;
        }

        [[nodiscard]] bool contains_ci(std::string_view haystack, std::string_view needle) noexcept {
            const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
                });
            return it != haystack.end();
        }

        void kill_and_reap(pid_t pid) noexcept {
            ::kill(pid, SIGKILL);
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
        }

        [[nodiscard]] int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            return left.count() <= 0 ? 0 : static_cast<int>(left.count());
        }

        struct SignerRun {
            std::string out;
            std::string err;
            int exit_code{-1};
            bool timed_out{false};
        };

        Status run_signer(const SshSignerConfig& cfg, const std::string& key_path, BufferView message, SignerRun* run) {
            std::vector<std::string> args = {
                cfg.program, "-Y", "sign", "-f", key_path, "-n", cfg.sign_namespace,
            };
            std::vector<char*> argv;
            argv.reserve(args.size() + 1);
            for (std::string& a : args) {
                argv.push_back(a.data());
            }
            argv.push_back(nullptr);

            ChildPipes p;
            if (::pipe2(p.in, O_CLOEXEC) != 0 || ::pipe2(p.out, O_CLOEXEC) != 0 || ::pipe2(p.err, O_CLOEXEC) != 0) {
                return oracle_status(StatusCode::Unavailable, static_cast<u32>(errno));
            }

            const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg.timeout_ms);

            const pid_t pid = ::fork();
            if (pid < 0) {
                return oracle_status(StatusCode::Unavailable, static_cast<u32>(errno));
            }
            if (pid == 0) {
                ::dup2(p.in[0], STDIN_FILENO);
                ::dup2(p.out[1], STDOUT_FILENO);
                ::dup2(p.err[1], STDERR_FILENO);
                ::execvp(argv[0], argv.data());
                ::_exit(127);
            }

            close_fd(&p.in[0]);
            close_fd(&p.out[1]);
            close_fd(&p.err[1]);

            // A short write means the child is already gone; its exit status says why.
            (void)write_all_nosigpipe(p.in[1], message);
            close_fd(&p.in[1]);

            char chunk[4096];
            while (p.out[0] >= 0 || p.err[0] >= 0) {
                const int wait_ms = remaining_ms(deadline);
                if (wait_ms == 0) {
                    kill_and_reap(pid);
                    run->timed_out = true;
                    return touchseal::core::ok_status();
                }

                struct pollfd fds[2];
                int nfds = 0;
                int* owners[2] = {nullptr, nullptr};
                std::string* sinks[2] = {nullptr, nullptr};
                if (p.out[0] >= 0) {
                    fds[nfds] = pollfd{p.out[0], POLLIN, 0};
                    owners[nfds] = &p.out[0];
                    sinks[nfds] = &run->out;
                    ++nfds;
                }
                if (p.err[0] >= 0) {
                    fds[nfds] = pollfd{p.err[0], POLLIN, 0};
                    owners[nfds] = &p.err[0];
                    sinks[nfds] = &run->err;
                    ++nfds;
                }

                const int rc = ::poll(fds, static_cast<nfds_t>(nfds), wait_ms);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    const int err = errno;
                    kill_and_reap(pid);
                    return oracle_status(StatusCode::DeviceError, static_cast<u32>(err));
                }

                for (int i = 0; i < nfds; ++i) {
                    if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                        continue;
                    }
                    const ssize_t n = ::read(*owners[i], chunk, sizeof(chunk));
                    if (n < 0 && errno == EINTR) {
                        continue;
                    }
                    if (n <= 0) {
                        close_fd(owners[i]);
                        continue;
                    }
                    if (sinks[i] == &run->err && cfg.prompt_fd >= 0) {
                        const ssize_t relayed = ::write(cfg.prompt_fd, chunk, static_cast<size_t>(n));
                        (void)relayed;
                    }
                    sinks[i]->append(chunk, static_cast<size_t>(n));
                    if (sinks[i]->size() > kMaxSignerOutputBytes) {
                        kill_and_reap(pid);
                        return oracle_status(StatusCode::DeviceError);
                    }
                }
            }

            // Both streams are closed; the child should be exiting.
            int status = 0;
            for (;;) {
                const pid_t w = ::waitpid(pid, &status, WNOHANG);
                if (w == pid) {
                    break;
                }
                if (w < 0 && errno != EINTR) {
                    return oracle_status(StatusCode::DeviceError, static_cast<u32>(errno));
                }
                if (remaining_ms(deadline) == 0) {
                    kill_and_reap(pid);
                    run->timed_out = true;
                    return touchseal::core::ok_status();
                }
                ::usleep(10 * 1000);
            }

            if (WIFEXITED(status)) {
                run->exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                run->exit_code = 128 + WTERMSIG(status);
            }
            return touchseal::core::ok_status();
        }
    } // namespace

    Status classify_signer_failure(int exit_code, std::string_view stderr_text) noexcept {
        const u32 aux = static_cast<u32>(exit_code);
        if (exit_code == 127) {
            return oracle_status(StatusCode::Unavailable, aux);
        }
        if (contains_ci(stderr_text, "device not found") || contains_ci(stderr_text, "no device") ||
            contains_ci(stderr_text, "not connected")) {
            return oracle_status(StatusCode::DeviceAbsent, aux);
        }
        if (contains_ci(stderr_text, "timeout") || contains_ci(stderr_text, "timed out")) {
            return oracle_status(StatusCode::Timeout, aux);
        }
        if (contains_ci(stderr_text, "denied") || contains_ci(stderr_text, "cancel") ||
            contains_ci(stderr_text, "declined") || contains_ci(stderr_text, "incorrect pin")) {
            return oracle_status(StatusCode::UserDeclined, aux);
        }
        return oracle_status(StatusCode::DeviceError, aux);
    }

    Status sshsig_parse(std::string_view armored,
        const touchseal::credential::Credential& cred,
        std::string_view expected_namespace,
        std::vector<u8>* signature_out) {
        if (signature_out == nullptr) {
            return oracle_status(StatusCode::Invalid);
        }

        const std::size_t begin = armored.find(kArmorBegin);
        const std::size_t end = armored.find(kArmorEnd);
        if (begin == std::string_view::npos || end == std::string_view::npos || end < begin) {
            return oracle_status(StatusCode::DeviceError);
        }

        std::string body;
        for (const char c : armored.substr(begin + kArmorBegin.size(), end - begin - kArmorBegin.size())) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                body.push_back(c);
            }
        }

        std::vector<u8> raw;
        if (!touchseal::core::is_ok(touchseal::codec::base64_decode(body, touchseal::codec::Base64Variant::Standard, &raw))) {
            return oracle_status(StatusCode::DeviceError);
        }

        touchseal::codec::SshReader r{touchseal::core::view_of(raw), 0};
        BufferView magic{};
        u32 version = 0;
        BufferView public_key{};
        BufferView ns{};
        BufferView reserved{};
        BufferView hash_alg{};
        BufferView signature{};

        const bool framed =
            touchseal::core::is_ok(touchseal::codec::ssh_read_bytes(&r, static_cast<u32>(kSshsigMagic.size()), &magic)) &&
            touchseal::core::is_ok(touchseal::codec::ssh_read_u32(&r, &version)) &&
            touchseal::core::is_ok(touchseal::codec::ssh_read_string(&r, &public_key)) &&
            touchseal::core::is_ok(touchseal::codec::ssh_read_string(&r, &ns)) &&
            touchseal::core::is_ok(touchseal::codec::ssh_read_string(&r, &reserved)) &&
            touchseal::core::is_ok(touchseal::codec::ssh_read_string(&r, &hash_alg)) &&
            touchseal::core::is_ok(touchseal::codec::ssh_read_string(&r, &signature)) &&
            touchseal::codec::ssh_reader_done(r);
        if (!framed || touchseal::codec::ssh_as_text(magic) != kSshsigMagic || version != 1) {
            return oracle_status(StatusCode::DeviceError);
        }
        if (touchseal::codec::ssh_as_text(ns) != expected_namespace) {
            return oracle_status(StatusCode::DeviceError);
        }
        if (!cred.public_blob.empty() &&
            (public_key.len != cred.public_blob.size() ||
                std::memcmp(public_key.data, cred.public_blob.data(), public_key.len) != 0)) {
            return oracle_status(StatusCode::DeviceError);
        }

        // Signature encoding: string type, string blob, then flags/counter for sk keys.
        touchseal::codec::SshReader sr{signature, 0};
        BufferView sig_type{};
        BufferView sig_blob{};
        if (!touchseal::core::is_ok(touchseal::codec::ssh_read_string(&sr, &sig_type)) ||
            !touchseal::core::is_ok(touchseal::codec::ssh_read_string(&sr, &sig_blob)) || sig_blob.len == 0) {
            return oracle_status(StatusCode::DeviceError);
        }

        signature_out->assign(sig_blob.data, sig_blob.data + sig_blob.len);
        return touchseal::core::ok_status();
    }

    Status ssh_keygen_sign(void* ctx,
        BufferView message,
        const touchseal::credential::Credential& cred,
        std::vector<u8>* signature_out) {
        static const SshSignerConfig kDefaults{};
        const SshSignerConfig& cfg = (ctx != nullptr) ? *static_cast<const SshSignerConfig*>(ctx) : kDefaults;

        if (signature_out == nullptr || cfg.program == nullptr || cfg.sign_namespace == nullptr ||
            cfg.sign_namespace[0] == '\0' || cfg.timeout_ms == 0) {
            return oracle_status(StatusCode::Invalid);
        }
        if (cred.key_path.empty()) {
            return oracle_status(StatusCode::DeviceError);
        }

        SignerRun run;
        const Status s = run_signer(cfg, cred.key_path, message, &run);
        if (!touchseal::core::is_ok(s)) {
            return s;
        }
        if (run.timed_out) {
            return oracle_status(StatusCode::Timeout, cfg.timeout_ms);
        }
        if (run.exit_code != 0) {
            return classify_signer_failure(run.exit_code, run.err);
        }

        return sshsig_parse(run.out, cred, cfg.sign_namespace, signature_out);
    }
} // namespace touchseal::oracle
