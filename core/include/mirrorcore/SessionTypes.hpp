// Credentials and native result codes shared by every NativeSession.
// Kept as plain values so backends can copy them into worker jobs.
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace mirrorcore {

// Server key validation policy against known_hosts.
enum class KnownHostsPolicy {
    Strict,    // exact match required
    AcceptNew, // unknown hosts are added; changed keys are rejected
    Off        // no verification
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    std::optional<std::string> known_hosts_path; // default ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;
};

// Result codes carried by native callbacks.
namespace nativecode {
constexpr int Ok = 0;
constexpr int Failed = -1;     // generic failure
constexpr int Args = -2;       // invalid request arguments
constexpr int Again = -3;      // temporary condition, the SDK may retry
constexpr int NotFound = -9;   // source or destination missing
constexpr int Access = -11;    // credentials rejected
constexpr int Incomplete = -13; // transfer interrupted by cancelTransfers()
constexpr int Io = -20;        // local or remote read/write failure
} // namespace nativecode

struct NativeError {
    int code = nativecode::Ok;
    std::string message;

    bool ok() const { return code == nativecode::Ok; }
};

// Node resolved by a ResolveSource request.
struct NodeInfo {
    std::string name;
    std::uint64_t size = 0;
    bool is_dir = false;
};

} // namespace mirrorcore
