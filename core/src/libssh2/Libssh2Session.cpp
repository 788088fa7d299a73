// libssh2 session: TCP socket, SSH session and SFTP channel behind the
// listener-based NativeSession contract.
#include "mirrorcore/Libssh2Session.hpp"
#include "mirrorcore/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
Q_LOGGING_CATEGORY(mcSession, "mirrorcore.session")

namespace mirrorcore {

namespace {

// libssh2 global init, once per process
std::once_flag g_libssh2Init;

constexpr std::size_t kChunk = 64 * 1024;

struct KbdIntCtx {
    const char *user;
    const char *pass;
};

// keyboard-interactive: answers the user name to prompts mentioning "user"
// or "name" and the password to everything else.
void kbintPasswordCallback(const char *name, int name_len,
                           const char *instruction, int instruction_len,
                           int num_prompts,
                           const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                           LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                           void **abstract) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt;
        if (prompts && prompts[i].text)
            prompt.assign(reinterpret_cast<const char *>(prompts[i].text),
                          prompts[i].length);
        for (char &c : prompt)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char *ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (alen == 0)
            continue;
        char *buf = static_cast<char *>(std::malloc(alen + 1));
        if (!buf)
            continue;
        std::memcpy(buf, ans, alen);
        buf[alen] = '\0';
        responses[i].text = buf;
        responses[i].length = static_cast<unsigned int>(alen);
    }
}

std::string lastSessionError(LIBSSH2_SESSION *session) {
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len))
                            : std::string();
}

int knownHostKeyAlg(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

std::string baseName(const std::string &path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos)
        return path;
    return path.substr(pos + 1);
}

} // namespace

Libssh2Session::Libssh2Session(SessionOptions opt) : opt_(std::move(opt)) {
    std::call_once(g_libssh2Init, [] {
        const int rc = libssh2_init(0);
        if (rc != 0)
            qCWarning(mcSession) << "libssh2_init failed rc=" << rc;
    });
}

Libssh2Session::~Libssh2Session() { release(); }

void Libssh2Session::addListener(NativeListener *listener) {
    listeners_.add(listener);
}

void Libssh2Session::removeListener(NativeListener *listener) {
    listeners_.remove(listener);
}

bool Libssh2Session::tcpConnect(const std::string &host, uint16_t port,
                                std::string &err) {
    struct addrinfo hints {};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    const int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        // TCP keepalive; timeouts are left to libssh2_session_set_timeout.
        int on = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#ifdef __linux__
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Could not connect to host/port";
    return false;
}

bool Libssh2Session::verifyHostKey(std::string &err) {
    if (opt_.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt_.known_hosts_path.has_value()) {
        khPath = *opt_.known_hosts_path;
    } else if (const char *home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(),
                                              LIBSSH2_KNOWNHOST_FILE_OPENSSH) >=
                   0;
    if (!khLoaded && opt_.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not read server host key";
        return false;
    }

    const int alg = knownHostKeyAlg(keytype);
    const int plainMask =
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int hashMask =
        LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost *host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt_.host.c_str(), opt_.port,
                                         hostkey, keylen, plainMask, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH)
        check = libssh2_knownhost_checkp(nh, opt_.host.c_str(), opt_.port,
                                         hostkey, keylen, hashMask, &host);

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (opt_.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        // Unattended: there is nobody to confirm a fingerprint, new hosts are
        // trusted on first use and recorded.
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path not defined";
            return false;
        }
        const int rc = libssh2_knownhost_addc(nh, opt_.host.c_str(), nullptr,
                                              hostkey, keylen, nullptr, 0,
                                              plainMask, nullptr);
        if (rc != 0 || libssh2_knownhost_writefile(
                           nh, khPath.c_str(),
                           LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Could not record host in known_hosts";
            return false;
        }
        libssh2_knownhost_free(nh);
        qCInfo(mcSession) << "host added to known_hosts"
                          << "host=" << sensitive(opt_.host).c_str();
        return true;
    }
    libssh2_knownhost_free(nh);
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "Host key does not match known_hosts"
              : "Host unknown in known_hosts";
    return false;
}

bool Libssh2Session::authenticate(std::string &err, int &code) {
    code = nativecode::Access;
    const char *user = opt_.username.c_str();
    const unsigned userLen = static_cast<unsigned>(opt_.username.size());

    // Explicit key first.
    if (opt_.private_key_path.has_value()) {
        const char *passphrase = opt_.private_key_passphrase
                                     ? opt_.private_key_passphrase->c_str()
                                     : nullptr;
        const int rc = libssh2_userauth_publickey_fromfile(
            session_, user, nullptr, opt_.private_key_path->c_str(),
            passphrase);
        if (rc != 0) {
            err = "Key authentication failed: " + lastSessionError(session_);
            return false;
        }
        return true;
    }

    std::string authlist;
    auto hasMethod = [&](const char *m) {
        return authlist.find(m) != std::string::npos;
    };
    auto loadAuthList = [&]() {
        if (!authlist.empty())
            return;
        char *methods = libssh2_userauth_list(session_, user, userLen);
        authlist = methods ? std::string(methods) : std::string();
    };

    if (opt_.password.has_value()) {
        int rc = LIBSSH2_ERROR_EAGAIN;
        while (rc == LIBSSH2_ERROR_EAGAIN) {
            rc = libssh2_userauth_password(session_, user,
                                           opt_.password->c_str());
            if (rc == LIBSSH2_ERROR_EAGAIN)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (rc == 0)
            return true;
        if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc == LIBSSH2_ERROR_SOCKET_SEND ||
            rc == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after the password attempt";
            code = nativecode::Failed;
            return false;
        }
        loadAuthList();
        if (hasMethod("keyboard-interactive")) {
            KbdIntCtx ctx{user, opt_.password->c_str()};
            void **abs = libssh2_session_abstract(session_);
            if (abs)
                *abs = &ctx;
            int krc = LIBSSH2_ERROR_EAGAIN;
            while (krc == LIBSSH2_ERROR_EAGAIN) {
                krc = libssh2_userauth_keyboard_interactive(
                    session_, user, kbintPasswordCallback);
                if (krc == LIBSSH2_ERROR_EAGAIN)
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs)
                *abs = nullptr;
            if (krc == 0)
                return true;
        }
    }

    // Last resort: ssh-agent, a few identities at most.
    loadAuthList();
    if (hasMethod("publickey")) {
        bool authed = false;
        LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
        if (agent && libssh2_agent_connect(agent) == 0 &&
            libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey *identity = nullptr;
            struct libssh2_agent_publickey *prev = nullptr;
            const int kMaxAgentTries = 3;
            int tries = 0;
            while (!authed && tries < kMaxAgentTries &&
                   libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                prev = identity;
                ++tries;
                int arc = LIBSSH2_ERROR_EAGAIN;
                while (arc == LIBSSH2_ERROR_EAGAIN) {
                    arc = libssh2_agent_userauth(agent, user, identity);
                    if (arc == LIBSSH2_ERROR_EAGAIN)
                        std::this_thread::sleep_for(
                            std::chrono::milliseconds(50));
                }
                authed = arc == 0;
            }
        }
        if (agent) {
            libssh2_agent_disconnect(agent);
            libssh2_agent_free(agent);
        }
        if (authed)
            return true;
    }

    const std::string last = lastSessionError(session_);
    err = opt_.password.has_value() ? "Password authentication failed"
                                    : "No credentials: key/agent/password";
    if (!authlist.empty())
        err += " (methods: " + authlist + ")";
    if (!last.empty())
        err += ": " + last;
    return false;
}

bool Libssh2Session::openSftp(std::string &err) {
    if (sftp_)
        return true;
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not initialize SFTP: " + lastSessionError(session_);
        return false;
    }
    return true;
}

void Libssh2Session::teardownLocked() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        if (connected_.load())
            libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_.store(false);
}

void Libssh2Session::finishRequest(CorrelationId id, RequestType type,
                                   int code, const std::string &message,
                                   const NodeInfo &node) {
    const NativeError error{code, message};
    listeners_.forEach([&](NativeListener &l) {
        l.onRequestFinish(id, type, error, node);
    });
}

void Libssh2Session::transferUpdate(CorrelationId id, std::uint64_t done,
                                    std::uint64_t total) {
    // libssh2 does not measure speed; the status adapter does.
    listeners_.forEach([&](NativeListener &l) {
        l.onTransferUpdate(id, done, total, -1.0);
    });
}

void Libssh2Session::finishTransfer(CorrelationId id, int code,
                                    const std::string &message,
                                    const std::string &link) {
    const NativeError error{code, message};
    listeners_.forEach(
        [&](NativeListener &l) { l.onTransferFinish(id, error, link); });
}

void Libssh2Session::login(CorrelationId id) {
    listeners_.forEach(
        [&](NativeListener &l) { l.onRequestStart(id, RequestType::Login); });
    std::unique_lock<std::mutex> lk(ioMtx_);
    if (connected_.load()) {
        lk.unlock();
        finishRequest(id, RequestType::Login, nativecode::Ok, {});
        fetchNodes(id);
        return;
    }
    qCInfo(mcSession) << "connecting"
                      << "host=" << sensitive(opt_.host).c_str()
                      << "port=" << opt_.port
                      << "user=" << sensitive(opt_.username).c_str();

    std::string err;
    int code = nativecode::Failed;
    bool ok = tcpConnect(opt_.host, opt_.port, err);
    if (ok) {
        session_ = libssh2_session_init();
        if (!session_) {
            err = "libssh2_session_init failed";
            ok = false;
        }
    }
    if (ok && libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastSessionError(session_);
        ok = false;
    }
    if (ok) {
        libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
        libssh2_session_set_timeout(session_, 20000);
#endif
        libssh2_keepalive_config(session_, 1, 30);
        ok = verifyHostKey(err);
        if (!ok)
            code = nativecode::Access;
    }
    if (ok)
        ok = authenticate(err, code);
    if (!ok) {
        teardownLocked();
        lk.unlock();
        qCWarning(mcSession) << "login failed" << err.c_str();
        finishRequest(id, RequestType::Login, code, err);
        return;
    }
    connected_.store(true);
    lk.unlock();
    finishRequest(id, RequestType::Login, nativecode::Ok, {});
    fetchNodes(id);
}

void Libssh2Session::fetchNodes(CorrelationId id) {
    std::string err;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lk(ioMtx_);
        if (!connected_.load())
            err = "Not connected";
        else
            ok = openSftp(err);
    }
    if (!ok) {
        qCWarning(mcSession) << "sftp init failed" << err.c_str();
        finishRequest(id, RequestType::FetchNodes, nativecode::Failed, err);
        return;
    }
    finishRequest(id, RequestType::FetchNodes, nativecode::Ok, {});
}

void Libssh2Session::resolveSource(CorrelationId id,
                                   const std::string &source) {
    NodeInfo node;
    int code = nativecode::Ok;
    std::string err;
    {
        std::lock_guard<std::mutex> lk(ioMtx_);
        if (!sftp_) {
            code = nativecode::Failed;
            err = "Not connected";
        } else {
            LIBSSH2_SFTP_ATTRIBUTES st{};
            const int rc = libssh2_sftp_stat_ex(
                sftp_, source.c_str(), static_cast<unsigned>(source.size()),
                LIBSSH2_SFTP_STAT, &st);
            if (rc != 0) {
                const unsigned long sftpErr = libssh2_sftp_last_error(sftp_);
                code = (sftpErr == LIBSSH2_FX_NO_SUCH_FILE)
                           ? nativecode::NotFound
                           : nativecode::Failed;
                err = "Remote stat failed for: " + source;
            } else {
                node.name = baseName(source);
                node.size = (st.flags & LIBSSH2_SFTP_ATTR_SIZE)
                                ? static_cast<std::uint64_t>(st.filesize)
                                : 0;
                node.is_dir =
                    (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
                    (st.permissions & LIBSSH2_SFTP_S_IFMT) ==
                        LIBSSH2_SFTP_S_IFDIR;
            }
        }
    }
    finishRequest(id, RequestType::ResolveSource, code, err, node);
}

void Libssh2Session::startDownload(CorrelationId id, const std::string &source,
                                   const std::string &localPath) {
    std::unique_lock<std::mutex> lk(ioMtx_);
    if (!sftp_) {
        lk.unlock();
        finishTransfer(id, nativecode::Failed, "Not connected");
        return;
    }
    LIBSSH2_SFTP_ATTRIBUTES st{};
    std::uint64_t total = 0;
    if (libssh2_sftp_stat_ex(sftp_, source.c_str(),
                             static_cast<unsigned>(source.size()),
                             LIBSSH2_SFTP_STAT, &st) == 0 &&
        (st.flags & LIBSSH2_SFTP_ATTR_SIZE))
        total = static_cast<std::uint64_t>(st.filesize);

    LIBSSH2_SFTP_HANDLE *rh = libssh2_sftp_open_ex(
        sftp_, source.c_str(), static_cast<unsigned>(source.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        lk.unlock();
        finishTransfer(id, nativecode::NotFound,
                       "Could not open remote file for reading");
        return;
    }
    FILE *lf = std::fopen(localPath.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        lk.unlock();
        finishTransfer(id, nativecode::Io,
                       "Could not open local file for writing");
        return;
    }
    listeners_.forEach(
        [&](NativeListener &l) { l.onTransferStart(id, total); });

    std::vector<char> buf(kChunk);
    std::uint64_t done = 0;
    int code = nativecode::Ok;
    std::string err;
    while (true) {
        if (cancelled_.load()) {
            code = nativecode::Incomplete;
            err = "Transfer cancelled";
            break;
        }
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, static_cast<size_t>(n), lf) !=
                static_cast<size_t>(n)) {
                code = nativecode::Io;
                err = "Local write failed";
                break;
            }
            done += static_cast<std::uint64_t>(n);
            transferUpdate(id, done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            code = nativecode::Io;
            err = "Remote read failed";
            break;
        }
    }
    std::fclose(lf);
    libssh2_sftp_close(rh);
    lk.unlock();
    finishTransfer(id, code, err, code == nativecode::Ok ? localPath : "");
}

void Libssh2Session::startUpload(CorrelationId id, const std::string &localPath,
                                 const std::string &remotePath) {
    std::unique_lock<std::mutex> lk(ioMtx_);
    if (!sftp_) {
        lk.unlock();
        finishTransfer(id, nativecode::Failed, "Not connected");
        return;
    }
    FILE *lf = std::fopen(localPath.c_str(), "rb");
    if (!lf) {
        lk.unlock();
        finishTransfer(id, nativecode::NotFound,
                       "Could not open local file for reading");
        return;
    }
    std::fseek(lf, 0, SEEK_END);
    const long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::uint64_t total = fsz > 0 ? static_cast<std::uint64_t>(fsz) : 0;

    LIBSSH2_SFTP_HANDLE *wh = libssh2_sftp_open_ex(
        sftp_, remotePath.c_str(), static_cast<unsigned>(remotePath.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, 0644,
        LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        lk.unlock();
        finishTransfer(id, nativecode::Failed,
                       "Could not open remote file for writing");
        return;
    }
    listeners_.forEach(
        [&](NativeListener &l) { l.onTransferStart(id, total); });

    std::vector<char> buf(kChunk);
    std::uint64_t done = 0;
    int code = nativecode::Ok;
    std::string err;
    while (code == nativecode::Ok) {
        const size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                code = nativecode::Io;
                err = "Local read failed";
            }
            break; // EOF
        }
        const char *p = buf.data();
        size_t remain = n;
        while (remain > 0) {
            if (cancelled_.load()) {
                code = nativecode::Incomplete;
                err = "Transfer cancelled";
                break;
            }
            const ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                code = nativecode::Io;
                err = "Remote write failed";
                break;
            }
            remain -= static_cast<size_t>(w);
            p += w;
            done += static_cast<std::uint64_t>(w);
            transferUpdate(id, done, total);
        }
    }
    libssh2_sftp_close(wh);
    std::fclose(lf);
    lk.unlock();
    finishTransfer(id, code, err, code == nativecode::Ok ? remotePath : "");
}

void Libssh2Session::startCopy(CorrelationId id, const std::string &source,
                               const std::string &remotePath) {
    std::unique_lock<std::mutex> lk(ioMtx_);
    if (!sftp_) {
        lk.unlock();
        finishTransfer(id, nativecode::Failed, "Not connected");
        return;
    }
    LIBSSH2_SFTP_ATTRIBUTES st{};
    std::uint64_t total = 0;
    if (libssh2_sftp_stat_ex(sftp_, source.c_str(),
                             static_cast<unsigned>(source.size()),
                             LIBSSH2_SFTP_STAT, &st) == 0 &&
        (st.flags & LIBSSH2_SFTP_ATTR_SIZE))
        total = static_cast<std::uint64_t>(st.filesize);

    LIBSSH2_SFTP_HANDLE *rh = libssh2_sftp_open_ex(
        sftp_, source.c_str(), static_cast<unsigned>(source.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        lk.unlock();
        finishTransfer(id, nativecode::NotFound,
                       "Could not open source for reading");
        return;
    }
    LIBSSH2_SFTP_HANDLE *wh = libssh2_sftp_open_ex(
        sftp_, remotePath.c_str(), static_cast<unsigned>(remotePath.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, 0644,
        LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        libssh2_sftp_close(rh);
        lk.unlock();
        finishTransfer(id, nativecode::Failed,
                       "Could not open destination for writing");
        return;
    }
    listeners_.forEach(
        [&](NativeListener &l) { l.onTransferStart(id, total); });

    std::vector<char> buf(kChunk);
    std::uint64_t done = 0;
    int code = nativecode::Ok;
    std::string err;
    while (code == nativecode::Ok) {
        if (cancelled_.load()) {
            code = nativecode::Incomplete;
            err = "Transfer cancelled";
            break;
        }
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n == 0)
            break; // EOF
        if (n < 0) {
            code = nativecode::Io;
            err = "Remote read failed";
            break;
        }
        const char *p = buf.data();
        size_t remain = static_cast<size_t>(n);
        while (remain > 0) {
            const ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                code = nativecode::Io;
                err = "Remote write failed";
                break;
            }
            remain -= static_cast<size_t>(w);
            p += w;
            done += static_cast<std::uint64_t>(w);
        }
        transferUpdate(id, done, total);
    }
    libssh2_sftp_close(wh);
    libssh2_sftp_close(rh);
    lk.unlock();
    finishTransfer(id, code, err, code == nativecode::Ok ? remotePath : "");
}

void Libssh2Session::logout(CorrelationId id) {
    {
        std::lock_guard<std::mutex> lk(ioMtx_);
        if (sftp_) {
            libssh2_sftp_shutdown(sftp_);
            sftp_ = nullptr;
        }
        if (session_)
            libssh2_session_disconnect(session_, "bye");
        connected_.store(false);
    }
    finishRequest(id, RequestType::Logout, nativecode::Ok, {});
}

void Libssh2Session::cancelTransfers() { cancelled_.store(true); }

void Libssh2Session::release() {
    std::lock_guard<std::mutex> lk(ioMtx_);
    teardownLocked();
}

} // namespace mirrorcore
