#ifndef WSPLUS_RECONNECT_HPP
#define WSPLUS_RECONNECT_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace wsplus {

using Ms = std::chrono::milliseconds;

/*
 * ReconnectPolicy
 *
 * Purpose:
 *   Decide how long to wait before reconnection attempt N and whether attempt N
 *   should happen at all. Attempts are numbered from 1 within one reconnection
 *   campaign; the owner resets the policy when a campaign ends.
 *
 * Contract:
 *   - delay(attempt)                    : wait before the attempt; never negative.
 *   - should_retry(attempt, max)        : false stops the campaign.
 *   - reset()                           : forget per-campaign state (stateful policies).
 */
class ReconnectPolicy {
public:
    virtual ~ReconnectPolicy() = default;

    virtual Ms delay(int attempt) = 0;
    virtual bool should_retry(int attempt, int max_attempts) const = 0;
    virtual void reset() = 0;
    virtual std::string describe() const = 0;
};

// initial x multiplier^(attempt-1), capped at max_delay, then scaled by a
// uniform factor in [1 - randomization, 1 + randomization].
class ExponentialBackoffPolicy : public ReconnectPolicy {
public:
    ExponentialBackoffPolicy(Ms initial_delay = Ms{1'000},
                             Ms max_delay = Ms{300'000},
                             double multiplier = 2.0,
                             double randomization_factor = 0.1);

    Ms delay(int attempt) override;
    bool should_retry(int attempt, int max_attempts) const override;
    void reset() override {}
    std::string describe() const override;

    // Un-jittered delay for the attempt.
    Ms base_delay(int attempt) const;

    Ms initial_delay() const { return initial_delay_; }
    Ms max_delay() const { return max_delay_; }
    double multiplier() const { return multiplier_; }
    double randomization_factor() const { return randomization_factor_; }

private:
    Ms initial_delay_;
    Ms max_delay_;
    double multiplier_;
    double randomization_factor_;
};

class LinearBackoffPolicy : public ReconnectPolicy {
public:
    LinearBackoffPolicy(Ms initial_delay = Ms{1'000},
                        Ms max_delay = Ms{300'000},
                        Ms increment = Ms{1'000});

    Ms delay(int attempt) override;
    bool should_retry(int attempt, int max_attempts) const override;
    void reset() override {}
    std::string describe() const override;

    Ms initial_delay() const { return initial_delay_; }
    Ms max_delay() const { return max_delay_; }
    Ms increment() const { return increment_; }

private:
    Ms initial_delay_;
    Ms max_delay_;
    Ms increment_;
};

class FixedDelayPolicy : public ReconnectPolicy {
public:
    explicit FixedDelayPolicy(Ms delay = Ms{5'000}) : delay_(delay) {}

    Ms delay(int) override { return delay_; }
    bool should_retry(int attempt, int max_attempts) const override { return attempt <= max_attempts; }
    void reset() override {}
    std::string describe() const override;

private:
    Ms delay_;
};

class NoReconnectPolicy : public ReconnectPolicy {
public:
    Ms delay(int) override { return Ms{0}; }
    bool should_retry(int, int) const override { return false; }
    void reset() override {}
    std::string describe() const override { return "NoReconnectPolicy()"; }
};

enum class PolicyType { Exponential, Linear, Fixed, None };

const char* to_string(PolicyType type);
std::optional<PolicyType> policy_type_from_string(const std::string& s);

// Absent fields fall back to the defaults of the selected policy; Fixed takes
// its delay from initial_delay.
struct PolicyParams {
    std::optional<Ms> initial_delay;
    std::optional<Ms> max_delay;
    std::optional<double> multiplier;
    std::optional<Ms> increment;
    std::optional<double> randomization_factor;
};

std::unique_ptr<ReconnectPolicy> make_reconnect_policy(PolicyType type, const PolicyParams& params = {});

} // namespace wsplus

#endif // WSPLUS_RECONNECT_HPP
