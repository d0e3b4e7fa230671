#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>
#include <string>

namespace ambassador {

/// Called once per complete, trimmed, non-empty inbound line.
using LineCallback = std::function<void(std::string line)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Host-facing, line-oriented transport.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until end of input or shutdown().
    virtual void start(LineCallback on_line,
                       ErrorCallback on_error = nullptr) = 0;

    /// Queue one response; it is written as a single line.
    virtual void send(const JsonRpcResponse& msg) = 0;

    /// Stop reading, flush queued writes and release the peer.
    virtual void shutdown() = 0;

    /// False once the input has ended or the transport was shut down.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace ambassador
