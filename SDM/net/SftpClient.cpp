#include "SftpClient.h"
#include "../monitor/Logger.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace {
const std::size_t kReadBlock = 1024 * 1024;
const std::uint64_t kMinWindow = 8 * 1024 * 1024;

bool connectWithTimeout(int fd, const sockaddr* addr, socklen_t len, std::chrono::seconds timeout, std::string& failure) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        failure = std::strerror(errno);
        return false;
    }

    int rc = ::connect(fd, addr, len);
    if (rc < 0 && errno != EINPROGRESS) {
        failure = std::strerror(errno);
        return false;
    }

    if (rc < 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int ready;
        do {
            ready = poll(&pfd, 1, static_cast<int>(timeout.count() * 1000));
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            failure = "connection timed out";
            return false;
        }
        if (ready < 0) {
            failure = std::strerror(errno);
            return false;
        }

        int soError = 0;
        socklen_t soLen = sizeof(soError);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &soLen) < 0 || soError != 0) {
            failure = std::strerror(soError != 0 ? soError : errno);
            return false;
        }
    }

    // libssh2 runs in blocking mode on this socket
    if (fcntl(fd, F_SETFL, flags) < 0) {
        failure = std::strerror(errno);
        return false;
    }
    return true;
}

std::string sftpStatusText(unsigned long status) {
    switch (status) {
    case LIBSSH2_FX_NO_SUCH_FILE: return "no such file";
    case LIBSSH2_FX_PERMISSION_DENIED: return "permission denied";
    case LIBSSH2_FX_FAILURE: return "failure";
    case LIBSSH2_FX_NO_SUCH_PATH: return "no such path";
    default: return "status " + std::to_string(status);
    }
}

// answers every keyboard-interactive prompt with the configured password
LIBSSH2_USERAUTH_KBDINT_RESPONSE_FUNC(answerPrompts) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    (void)prompts;

    const auto* config = static_cast<const SessionConfig*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        // released by libssh2 with its default free()
        char* text = static_cast<char*>(std::malloc(config->password.size() + 1));
        if (!text) {
            responses[i].text = nullptr;
            responses[i].length = 0;
            continue;
        }
        std::memcpy(text, config->password.c_str(), config->password.size() + 1);
        responses[i].text = text;
        responses[i].length = static_cast<unsigned int>(config->password.size());
    }
}
}

SftpClient::SocketTuning SftpClient::tuneKeepalive(int fd, const TcpKeepalive& opts) {
    SocketTuning result;

    int on = 1;
    result.keepalive = setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on)) == 0;

    int idle = static_cast<int>(opts.idleSeconds);
    int interval = static_cast<int>(opts.intervalSeconds);
    int count = static_cast<int>(opts.probeCount);
#if defined(TCP_KEEPIDLE)
    result.idle = setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle)) == 0;
#elif defined(TCP_KEEPALIVE)
    result.idle = setsockopt(fd, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle)) == 0;
#else
    (void)idle;
#endif
#ifdef TCP_KEEPINTVL
    result.interval = setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval)) == 0;
#else
    (void)interval;
#endif
#ifdef TCP_KEEPCNT
    result.count = setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &count, sizeof(count)) == 0;
#else
    (void)count;
#endif
    return result;
}

std::string SftpClient::describeTuning(const SocketTuning& tuning, const TcpKeepalive& opts) {
    if (tuning.complete()) {
        return "TCP keepalive: idle " + std::to_string(opts.idleSeconds) + "s, interval " +
            std::to_string(opts.intervalSeconds) + "s, count " + std::to_string(opts.probeCount);
    }

    std::string missing;
    auto note = [&](bool ok, const char* what) {
        if (ok)
            return;
        if (!missing.empty())
            missing += ", ";
        missing += what;
    };
    note(tuning.keepalive, "SO_KEEPALIVE");
    note(tuning.idle, "idle");
    note(tuning.interval, "interval");
    note(tuning.count, "count");
    return "TCP keepalive limited on this platform (not set: " + missing + "), continuing";
}

SftpClient::SftpClient(const SessionConfig& config, Logger& logger)
    : cfg(config), log(logger) {
}

SftpClient::~SftpClient() {
    close();
}

bool SftpClient::open() {
    if (opened)
        return true;

    // leftovers of an earlier session that died
    shutdown();
    error.clear();

    if (!connectSocket())
        return false;
    tuning = tuneKeepalive(sock, cfg.tcpKeepalive);

    if (!startSession() || !verifyHostKey() || !authenticate()) {
        shutdown();
        return false;
    }

    libssh2_keepalive_config(session, 0, static_cast<unsigned int>(cfg.keepaliveInterval.count()));

    sftp = libssh2_sftp_init(session);
    if (!sftp) {
        fail("start SFTP subsystem");
        shutdown();
        return false;
    }
    widenWindow();

    opened = true;
    logHardening();
    return true;
}

void SftpClient::close() {
    opened = false;
    shutdown();
}

bool SftpClient::stat(const std::string& path, RemoteStat& out) {
    if (!opened) {
        error = "stat " + path + ": channel closed";
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    if (libssh2_sftp_stat(sftp, path.c_str(), &attrs) != 0)
        return fail("stat " + path);

    // a missing size must not pass for an empty file
    if (!(attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)) {
        error = "stat " + path + ": server did not report a size";
        return false;
    }
    out.size = attrs.filesize;
    return true;
}

bool SftpClient::listDirectory(const std::string& path, std::vector<std::string>& out) {
    if (!opened) {
        error = "list " + path + ": channel closed";
        return false;
    }

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp, path.c_str());
    if (!dir)
        return fail("list " + path);

    out.clear();
    char name[512];
    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    int rc;
    while ((rc = libssh2_sftp_readdir(dir, name, sizeof(name), &attrs)) > 0) {
        std::string entry(name, static_cast<std::size_t>(rc));
        if (entry == "." || entry == "..")
            continue;
        out.push_back(entry);
    }

    if (rc < 0) {
        fail("list " + path);
        libssh2_sftp_closedir(dir);
        return false;
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool SftpClient::readRange(const std::string& path,
    std::uint64_t offset,
    std::uint64_t size,
    const DataCallback& onData) {
    if (!opened) {
        error = "read " + path + ": channel closed";
        return false;
    }
    if (size == 0)
        return true;

    // the handle stays open across chunks of the same file
    if (!readHandle || readPath != path) {
        dropReadHandle();
        readHandle = libssh2_sftp_open(sftp, path.c_str(), LIBSSH2_FXF_READ, 0);
        if (!readHandle)
            return fail("open " + path);
        readPath = path;
    }
    libssh2_sftp_seek64(readHandle, offset);

    std::vector<char> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(size, kReadBlock)));
    std::uint64_t remaining = size;
    while (remaining > 0) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        ssize_t n = libssh2_sftp_read(readHandle, buffer.data(), want);
        if (n < 0) {
            fail("read " + path + " at " + std::to_string(offset + (size - remaining)));
            if (opened)
                dropReadHandle();
            return false;
        }
        if (n == 0)
            break;

        if (!onData(buffer.data(), static_cast<std::size_t>(n))) {
            error = "read " + path + ": receiver refused data";
            return false;
        }
        remaining -= static_cast<std::uint64_t>(n);
    }
    return true;
}

bool SftpClient::probe() {
    if (!opened) {
        error = "probe: channel closed";
        return false;
    }

    // attribute request on the remote directory, no file payload
    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    if (libssh2_sftp_stat(sftp, cfg.remoteDir.c_str(), &attrs) != 0) {
        fail("probe");
        opened = false;
        return false;
    }
    return true;
}

void SftpClient::keepAlive() {
    if (!opened)
        return;

    // sends only once the configured interval has passed since the last one
    int secondsToNext = 0;
    if (libssh2_keepalive_send(session, &secondsToNext) != 0) {
        fail("keepalive");
        log.debug(error);
    }
}

bool SftpClient::connectSocket() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string port = std::to_string(cfg.port);
    addrinfo* result = nullptr;
    int rc = getaddrinfo(cfg.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        error = "resolve " + cfg.host + ": " + gai_strerror(rc);
        return false;
    }

    std::string failure = "no usable address";
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            failure = std::strerror(errno);
            continue;
        }
        if (connectWithTimeout(fd, ai->ai_addr, ai->ai_addrlen, cfg.connectTimeout, failure)) {
            sock = fd;
            break;
        }
        ::close(fd);
    }
    freeaddrinfo(result);

    if (sock < 0) {
        error = "connect to " + cfg.host + ":" + port + ": " + failure;
        return false;
    }
    return true;
}

bool SftpClient::startSession() {
    session = libssh2_session_init_ex(nullptr, nullptr, nullptr,
        static_cast<void*>(const_cast<SessionConfig*>(&cfg)));
    if (!session) {
        error = "cannot allocate SSH session";
        return false;
    }

    libssh2_session_set_blocking(session, 1);
    // negotiated during the handshake, so it has to be set first
    libssh2_session_flag(session, LIBSSH2_FLAG_COMPRESS, cfg.compression ? 1 : 0);
    // a read that sees no data for this long fails instead of hanging
    libssh2_session_set_timeout(session, static_cast<long>(cfg.stallTimeout.count() * 1000));

    if (libssh2_session_handshake(session, sock) != 0)
        return fail("SSH handshake with " + cfg.host);
    return true;
}

bool SftpClient::verifyHostKey() {
    if (cfg.knownHostsFile.empty())
        return true;

    LIBSSH2_KNOWNHOSTS* hosts = libssh2_knownhost_init(session);
    if (!hosts)
        return fail("known hosts");

    if (libssh2_knownhost_readfile(hosts, cfg.knownHostsFile.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        libssh2_knownhost_free(hosts);
        error = "cannot read known hosts file " + cfg.knownHostsFile;
        return false;
    }

    std::size_t keyLen = 0;
    int keyType = 0;
    const char* key = libssh2_session_hostkey(session, &keyLen, &keyType);
    int check = LIBSSH2_KNOWNHOST_CHECK_FAILURE;
    if (key) {
        check = libssh2_knownhost_checkp(hosts, cfg.host.c_str(), cfg.port, key, keyLen,
            LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW, nullptr);
    }
    libssh2_knownhost_free(hosts);

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH)
        return true;

    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
        error = "host key for " + cfg.host + " does not match " + cfg.knownHostsFile;
    else
        error = "host key for " + cfg.host + " not found in " + cfg.knownHostsFile;
    return false;
}

bool SftpClient::authenticate() {
    const char* methods = libssh2_userauth_list(session, cfg.username.c_str(),
        static_cast<unsigned int>(cfg.username.size()));
    if (!methods) {
        if (libssh2_userauth_authenticated(session))
            return true;
        return fail("authenticate " + cfg.username + "@" + cfg.host);
    }

    const std::string offered = methods;
    bool tried = false;

    if (offered.find("password") != std::string::npos) {
        tried = true;
        if (libssh2_userauth_password(session, cfg.username.c_str(), cfg.password.c_str()) == 0)
            return true;
    }
    if (offered.find("keyboard-interactive") != std::string::npos) {
        tried = true;
        if (libssh2_userauth_keyboard_interactive(session, cfg.username.c_str(), &answerPrompts) == 0)
            return true;
    }

    if (!tried) {
        error = "authenticate " + cfg.username + "@" + cfg.host + ": server offers " + offered;
        return false;
    }
    return fail("authenticate " + cfg.username + "@" + cfg.host);
}

void SftpClient::widenWindow() {
    LIBSSH2_CHANNEL* channel = libssh2_sftp_get_channel(sftp);
    if (!channel)
        return;

    unsigned int granted = 0;
    if (libssh2_channel_receive_window_adjust2(channel, static_cast<unsigned long>(cfg.windowSize), 1, &granted) == 0)
        window = granted;
}

void SftpClient::shutdown() {
    // bounded teardown even when the peer stopped answering
    if (session)
        libssh2_session_set_timeout(session, 5000);

    dropReadHandle();
    if (sftp) {
        libssh2_sftp_shutdown(sftp);
        sftp = nullptr;
    }
    if (session) {
        libssh2_session_disconnect(session, "Normal shutdown");
        libssh2_session_free(session);
        session = nullptr;
    }
    if (sock >= 0) {
        ::close(sock);
        sock = -1;
    }
    window = 0;
}

void SftpClient::dropReadHandle() {
    if (readHandle) {
        libssh2_sftp_close_handle(readHandle);
        readHandle = nullptr;
    }
    readPath.clear();
}

bool SftpClient::fail(const std::string& what) {
    char* msg = nullptr;
    int len = 0;
    int code = session ? libssh2_session_last_error(session, &msg, &len, 0) : 0;

    std::string reason = (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len)) : "error " + std::to_string(code);
    if (code == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp)
        reason += " (" + sftpStatusText(libssh2_sftp_last_error(sftp)) + ")";
    error = what + ": " + reason;

    switch (code) {
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_CHANNEL_CLOSED:
    case LIBSSH2_ERROR_CHANNEL_FAILURE:
        opened = false;
        break;
    default:
        break;
    }
    return false;
}

void SftpClient::logHardening() {
    if (window >= kMinWindow)
        log.debug("SFTP receive window " + std::to_string(window) + " bytes");
    else
        log.warning("SFTP receive window stayed at " + std::to_string(window) + " bytes, requested " +
            std::to_string(cfg.windowSize));

    const char* comp = libssh2_session_methods(session, LIBSSH2_METHOD_COMP_SC);
    log.debug(std::string("SSH compression ") + (comp ? comp : "none") + ", keepalive every " +
        std::to_string(cfg.keepaliveInterval.count()) + "s");
    log.info("Rekey threshold is not configurable through libssh2; requested " +
        std::to_string(cfg.rekeyBytes / 1024 / 1024) + "MB not applied");

    const std::string notice = describeTuning(tuning, cfg.tcpKeepalive);
    if (tuning.complete())
        log.info(notice);
    else
        log.warning(notice);
}
