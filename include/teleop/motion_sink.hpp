#pragma once

#include <string>

#include "core/types.hpp"

namespace rover {

class MotionSink {
public:
    virtual ~MotionSink() = default;
    virtual bool publish(const VelocityCommand& cmd, std::string& error) = 0;
};

// Sends "cmd_vel <linear> <angular>\n" to the motion bridge's UNIX socket and
// expects a reply starting with "OK".
class UnixSocketMotionSink : public MotionSink {
public:
    explicit UnixSocketMotionSink(std::string socket_path);

    bool publish(const VelocityCommand& cmd, std::string& error) override;

    const std::string& socketPath() const { return socket_path_; }

    static std::string formatCommand(const VelocityCommand& cmd);

private:
    std::string socket_path_;
};

}  // namespace rover
