#ifndef STEER_USAGE_HPP
#define STEER_USAGE_HPP

#include <cstdint>
#include <nlohmann/json.hpp>

namespace steer
{

struct TokenCounts
{
    std::uint64_t input_tokens = 0;
    std::uint64_t output_tokens = 0;
    std::uint64_t cache_creation_input_tokens = 0;
    std::uint64_t cache_read_input_tokens = 0;

    bool is_empty() const;
    std::uint64_t total() const;
    void reset();

    TokenCounts& operator+=(const TokenCounts& other);

    // Reads the backend's "usage" object; absent or negative fields count as zero.
    static TokenCounts from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Pointwise sum
TokenCounts add(const TokenCounts& a, const TokenCounts& b);

TokenCounts operator+(const TokenCounts& a, const TokenCounts& b);
bool operator==(const TokenCounts& a, const TokenCounts& b);
bool operator!=(const TokenCounts& a, const TokenCounts& b);

struct UsageSnapshot
{
    TokenCounts turn;
    TokenCounts session;
    std::uint64_t current_response_output_tokens = 0;
    // Tokens occupying the context window as of the latest assistant message
    std::uint64_t context_tokens = 0;
    double session_cost_usd = 0.0;
    std::uint64_t turns = 0;
};

// Running usage for one agent session.
class UsageAccumulator
{
  public:
    // Starts a new turn: clears the per-turn and current-response figures.
    void begin_turn();

    // A content delta was observed; a new message restarts the current response.
    void on_content_delta(bool is_new_message);

    // Usage reported by one assistant message.
    void on_usage(const TokenCounts& usage);

    // Result arrived. A non-empty result usage replaces the streamed turn figure.
    void finalize_turn(const TokenCounts& result_usage, double cost_usd);

    void reset_context();

    UsageSnapshot snapshot() const;

  private:
    TokenCounts turn_;
    TokenCounts session_;
    std::uint64_t current_response_output_ = 0;
    std::uint64_t context_tokens_ = 0;
    double session_cost_usd_ = 0.0;
    std::uint64_t turns_ = 0;
};

} // namespace steer

#endif // STEER_USAGE_HPP
