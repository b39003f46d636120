#ifndef STEER_ERRORS_HPP
#define STEER_ERRORS_HPP

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace steer
{

// Base exception
class SteerError : public std::runtime_error
{
  public:
    explicit SteerError(const std::string& message) : std::runtime_error(message) {}
};

// Agent id resolves to no session, or a settings file cannot be used
class ConfigurationError : public SteerError
{
  public:
    explicit ConfigurationError(const std::string& message) : SteerError(message) {}
};

// Backend failed to start a query
class ChannelError : public SteerError
{
  public:
    explicit ChannelError(const std::string& message) : SteerError(message), exit_code_(-1) {}

    ChannelError(const std::string& message, int exit_code)
        : SteerError(message), exit_code_(exit_code)
    {
    }

    // -1 when no process exit status is involved
    int exit_code() const
    {
        return exit_code_;
    }

  private:
    int exit_code_;
};

// Malformed message on one session's stream
class ProtocolError : public SteerError
{
  public:
    explicit ProtocolError(const std::string& message) : SteerError(message), data_(nullptr) {}

    ProtocolError(const std::string& message, const nlohmann::json& data)
        : SteerError(message), data_(std::make_shared<nlohmann::json>(data))
    {
    }

    // Offending payload, if one was captured
    const nlohmann::json* data() const
    {
        return data_.get();
    }

  private:
    std::shared_ptr<nlohmann::json> data_;
};

// Well-formed message that fails the schema check for its kind
class ValidationError : public SteerError
{
  public:
    ValidationError(const std::string& message, std::vector<std::string> fields)
        : SteerError(message), fields_(std::move(fields))
    {
    }

    const std::vector<std::string>& fields() const
    {
        return fields_;
    }

  private:
    std::vector<std::string> fields_;
};

} // namespace steer

#endif // STEER_ERRORS_HPP
