#include <steer/usage.hpp>

namespace steer
{

namespace
{

std::uint64_t read_counter(const nlohmann::json& j, const char* key)
{
    if (!j.contains(key))
        return 0;
    const auto& value = j[key];
    if (value.is_number_unsigned())
        return value.get<std::uint64_t>();
    if (value.is_number_integer())
    {
        auto signed_value = value.get<std::int64_t>();
        return signed_value > 0 ? static_cast<std::uint64_t>(signed_value) : 0;
    }
    if (value.is_number_float())
    {
        double d = value.get<double>();
        return d > 0 ? static_cast<std::uint64_t>(d) : 0;
    }
    return 0;
}

} // namespace

bool TokenCounts::is_empty() const
{
    return input_tokens == 0 && output_tokens == 0 && cache_creation_input_tokens == 0 &&
           cache_read_input_tokens == 0;
}

std::uint64_t TokenCounts::total() const
{
    return input_tokens + output_tokens + cache_creation_input_tokens + cache_read_input_tokens;
}

void TokenCounts::reset()
{
    *this = TokenCounts{};
}

TokenCounts& TokenCounts::operator+=(const TokenCounts& other)
{
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    cache_creation_input_tokens += other.cache_creation_input_tokens;
    cache_read_input_tokens += other.cache_read_input_tokens;
    return *this;
}

TokenCounts TokenCounts::from_json(const nlohmann::json& j)
{
    TokenCounts counts;
    if (!j.is_object())
        return counts;
    counts.input_tokens = read_counter(j, "input_tokens");
    counts.output_tokens = read_counter(j, "output_tokens");
    counts.cache_creation_input_tokens = read_counter(j, "cache_creation_input_tokens");
    counts.cache_read_input_tokens = read_counter(j, "cache_read_input_tokens");
    return counts;
}

nlohmann::json TokenCounts::to_json() const
{
    return {{"input_tokens", input_tokens},
            {"output_tokens", output_tokens},
            {"cache_creation_input_tokens", cache_creation_input_tokens},
            {"cache_read_input_tokens", cache_read_input_tokens}};
}

TokenCounts add(const TokenCounts& a, const TokenCounts& b)
{
    TokenCounts sum = a;
    sum += b;
    return sum;
}

TokenCounts operator+(const TokenCounts& a, const TokenCounts& b)
{
    return add(a, b);
}

bool operator==(const TokenCounts& a, const TokenCounts& b)
{
    return a.input_tokens == b.input_tokens && a.output_tokens == b.output_tokens &&
           a.cache_creation_input_tokens == b.cache_creation_input_tokens &&
           a.cache_read_input_tokens == b.cache_read_input_tokens;
}

bool operator!=(const TokenCounts& a, const TokenCounts& b)
{
    return !(a == b);
}

void UsageAccumulator::begin_turn()
{
    turn_.reset();
    current_response_output_ = 0;
}

void UsageAccumulator::on_content_delta(bool is_new_message)
{
    if (is_new_message)
        current_response_output_ = 0;
}

void UsageAccumulator::on_usage(const TokenCounts& usage)
{
    turn_ += usage;
    current_response_output_ += usage.output_tokens;
    context_tokens_ =
        usage.input_tokens + usage.cache_creation_input_tokens + usage.cache_read_input_tokens;
}

void UsageAccumulator::finalize_turn(const TokenCounts& result_usage, double cost_usd)
{
    if (!result_usage.is_empty())
        turn_ = result_usage;
    session_ += turn_;
    if (cost_usd > 0.0)
        session_cost_usd_ += cost_usd;
    ++turns_;
}

void UsageAccumulator::reset_context()
{
    context_tokens_ = 0;
}

UsageSnapshot UsageAccumulator::snapshot() const
{
    UsageSnapshot snapshot;
    snapshot.turn = turn_;
    snapshot.session = session_;
    snapshot.current_response_output_tokens = current_response_output_;
    snapshot.context_tokens = context_tokens_;
    snapshot.session_cost_usd = session_cost_usd_;
    snapshot.turns = turns_;
    return snapshot;
}

} // namespace steer
