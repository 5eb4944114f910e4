#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <cstring>
#include <cstdlib>
#include <limits>

namespace {

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// Answer every keyboard-interactive prompt with the password.
void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        sshexpect_log(fmt::format("auth: keyboard-interactive prompt '{}'", prompt_text));
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

// PTY mode string: ECHO (opcode 53) = 0, then TTY_OP_END (0).
// The remote shell then leaves input unechoed.
const char NO_ECHO_MODES[] = {53, 0, 0, 0, 0, 0};

}  // namespace

SessionManager::SessionManager(const SessionConfig& config)
    : config_(config), session_(nullptr), channel_(nullptr),
      sock_(SSHEXPECT_INVALID_SOCKET), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

Result<void> SessionManager::fail(const std::string& reason, const std::string& message) {
    sshexpect_log(fmt::format("session: {} ({})", message, reason));
    if (channel_) {
        libssh2_channel_close(channel_);
        libssh2_channel_free(channel_);
        channel_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, reason.c_str());
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != SSHEXPECT_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SSHEXPECT_INVALID_SOCKET;
    }
    return Result<void>::Err(Status::ConnectionFailed, message);
}

// libssh2_init once per process, libssh2_exit at static destruction.
static int init_libssh2() {
    struct Library {
        int rc;
        Library() : rc(libssh2_init(0)) {}
        ~Library() { if (rc == 0) libssh2_exit(); }
    };
    static Library library;
    return library.rc;
}

int connect_budget_ms(std::chrono::seconds timeout) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
    if (ms <= 0) return 0;
    if (ms > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    return static_cast<int>(ms);
}

Result<void> SessionManager::establish(StatusCallback callback) {
    target_str_ = fmt::format("{}@{}:{}", config_.user, config_.host, config_.port);
    if (callback) callback("Connecting to " + config_.host + "...");
    sshexpect_log("session: connecting to " + target_str_);

    if (init_libssh2() != 0) {
        return Result<void>::Err(Status::ConnectionFailed, "Failed to initialize libssh2");
    }

    int timeout_ms = connect_budget_ms(config_.timeout);
    std::string error;
    sock_ = platform::connect_tcp(config_.host, config_.port, timeout_ms, error);
    if (sock_ == SSHEXPECT_INVALID_SOCKET) {
        return fail("TCP connect failed", error);
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return fail("Session init failed", "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);
    libssh2_session_set_timeout(session_, timeout_ms);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::poll_socket(sock_, POLLIN | POLLOUT, SSH_CONNECT_RETRY_MS);
    }
    if (ret != 0) {
        return fail("Handshake failed", fmt::format("SSH handshake failed ({})", ret));
    }

    platform::enable_keepalive(sock_, 60, 15, 4);
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = userauth(callback);
    if (auth_result.is_err()) {
        return fail("Authentication failed", auth_result.error);
    }

    auto shell_result = open_shell(callback);
    if (shell_result.is_err()) {
        return fail("Shell setup failed", shell_result.error);
    }

    active_ = true;
    sshexpect_log("session: shell open on " + target_str_);
    if (callback) callback("Connected to " + config_.host);
    return Result<void>::Ok();
}

Result<void> SessionManager::userauth(StatusCallback callback) {
    int ret;
    const std::string& user = config_.user;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(SSH_CONNECT_RETRY_MS);
    }

    // Server accepted "none" auth
    if (!auth_list && libssh2_userauth_authenticated(session_)) {
        return Result<void>::Ok();
    }

    std::string methods = auth_list ? auth_list : "";
    sshexpect_log("auth: server offers [" + methods + "]");

    if (config_.ssh_key_path && methods.find("publickey") != std::string::npos) {
        std::string key = platform::expand_user(*config_.ssh_key_path).string();
        if (callback) callback("Using public key " + key + "...");

        while ((ret = libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                    key.c_str(), config_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_CONNECT_RETRY_MS);
        }
        if (ret == 0) {
            sshexpect_log("auth: publickey accepted");
            return Result<void>::Ok();
        }
        sshexpect_log(fmt::format("auth: publickey rejected ({})", ret));
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = config_.password;
        kbd_data.prompt_round = 0;
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_CONNECT_RETRY_MS);
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            sshexpect_log("auth: keyboard-interactive accepted");
            return Result<void>::Ok();
        }
        sshexpect_log(fmt::format("auth: keyboard-interactive rejected ({})", ret));
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                user.c_str(), config_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_CONNECT_RETRY_MS);
        }
        if (ret == 0) {
            sshexpect_log("auth: password accepted");
            return Result<void>::Ok();
        }
    }

    return Result<void>::Err(Status::ConnectionFailed,
                             "Authentication failed (check username/password)");
}

Result<void> SessionManager::open_shell(StatusCallback callback) {
    int ret;

    while ((channel_ = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err(Status::ConnectionFailed, "Failed to open SSH channel");
        }
        platform::sleep_ms(SSH_CONNECT_RETRY_MS);
    }

    while ((ret = libssh2_channel_request_pty_ex(
                channel_, config_.term_type.c_str(),
                static_cast<unsigned int>(config_.term_type.size()),
                NO_ECHO_MODES, sizeof(NO_ECHO_MODES),
                config_.term_width, config_.term_height, 0, 0)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_CONNECT_RETRY_MS);
    }
    if (ret != 0) {
        return Result<void>::Err(Status::ConnectionFailed,
                                 fmt::format("PTY request failed ({})", ret));
    }

    while ((ret = libssh2_channel_shell(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_CONNECT_RETRY_MS);
    }
    if (ret != 0) {
        return Result<void>::Err(Status::ConnectionFailed, "Failed to request shell");
    }

    if (callback) callback("Shell started");
    return Result<void>::Ok();
}

void SessionManager::close() {
    active_ = false;

    // Each libssh2 call gets its own brief lock
    if (channel_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_channel_close(channel_);
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_channel_free(channel_);
        }
        channel_ = nullptr;
    }

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ != SSHEXPECT_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SSHEXPECT_INVALID_SOCKET;
        sshexpect_log("session: closed " + target_str_);
    }
}

bool SessionManager::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ == SSHEXPECT_INVALID_SOCKET) return false;

    int seconds_to_next = 0;
    if (libssh2_keepalive_send(session_, &seconds_to_next) != 0) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }

    if (channel_ && libssh2_channel_eof(channel_)) {
        active_ = false;
        return false;
    }
    return true;
}
