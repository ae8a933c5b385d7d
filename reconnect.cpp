#include "reconnect.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>

namespace wsplus {

namespace {

double clamp_ms(double value, Ms cap) {
    const double hi = static_cast<double>(std::max<Ms::rep>(0, cap.count()));
    if( std::isnan(value) ) return hi;
    return std::clamp(value, 0.0, hi);
}

} // namespace

ExponentialBackoffPolicy::ExponentialBackoffPolicy(Ms initial_delay, Ms max_delay,
                                                   double multiplier, double randomization_factor)
    : initial_delay_(initial_delay),
      max_delay_(max_delay),
      multiplier_(multiplier),
      randomization_factor_(std::clamp(randomization_factor, 0.0, 1.0)) {}

Ms ExponentialBackoffPolicy::base_delay(int attempt) const {
    const int exponent = std::max(attempt, 1) - 1;
    // pow() saturates to inf for large exponents, which the clamp turns into max_delay
    const double raw = static_cast<double>(initial_delay_.count()) * std::pow(multiplier_, exponent);
    return Ms{static_cast<Ms::rep>(clamp_ms(raw, max_delay_))};
}

Ms ExponentialBackoffPolicy::delay(int attempt) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    const double signed_frac = (dist(rng) * 2.0 - 1.0) * randomization_factor_;
    const double jittered = static_cast<double>(base_delay(attempt).count()) * (1.0 + signed_frac);
    return Ms{static_cast<Ms::rep>(std::llround(std::max(0.0, jittered)))};
}

bool ExponentialBackoffPolicy::should_retry(int attempt, int max_attempts) const {
    return attempt <= max_attempts;
}

std::string ExponentialBackoffPolicy::describe() const {
    std::ostringstream os;
    os << "ExponentialBackoffPolicy(initial_delay=" << initial_delay_.count()
       << "ms, max_delay=" << max_delay_.count()
       << "ms, multiplier=" << multiplier_
       << ", randomization_factor=" << randomization_factor_ << ")";
    return os.str();
}

LinearBackoffPolicy::LinearBackoffPolicy(Ms initial_delay, Ms max_delay, Ms increment)
    : initial_delay_(initial_delay), max_delay_(max_delay), increment_(increment) {}

Ms LinearBackoffPolicy::delay(int attempt) {
    const double steps = static_cast<double>(std::max(attempt, 1) - 1);
    const double raw = static_cast<double>(initial_delay_.count()) + static_cast<double>(increment_.count()) * steps;
    return Ms{static_cast<Ms::rep>(clamp_ms(raw, max_delay_))};
}

bool LinearBackoffPolicy::should_retry(int attempt, int max_attempts) const {
    return attempt <= max_attempts;
}

std::string LinearBackoffPolicy::describe() const {
    std::ostringstream os;
    os << "LinearBackoffPolicy(initial_delay=" << initial_delay_.count()
       << "ms, max_delay=" << max_delay_.count()
       << "ms, increment=" << increment_.count() << "ms)";
    return os.str();
}

std::string FixedDelayPolicy::describe() const {
    return "FixedDelayPolicy(delay=" + std::to_string(delay_.count()) + "ms)";
}

const char* to_string(PolicyType type) {
    switch( type ) {
        case PolicyType::Exponential: return "exponential";
        case PolicyType::Linear:      return "linear";
        case PolicyType::Fixed:       return "fixed";
        case PolicyType::None:        return "none";
    }
    return "exponential";
}

std::optional<PolicyType> policy_type_from_string(const std::string& s) {
    if( s == "exponential" ) return PolicyType::Exponential;
    if( s == "linear" )      return PolicyType::Linear;
    if( s == "fixed" )       return PolicyType::Fixed;
    if( s == "none" )        return PolicyType::None;
    return std::nullopt;
}

std::unique_ptr<ReconnectPolicy> make_reconnect_policy(PolicyType type, const PolicyParams& p) {
    switch( type ) {
        case PolicyType::Exponential:
            return std::make_unique<ExponentialBackoffPolicy>(
                p.initial_delay.value_or(Ms{1'000}),
                p.max_delay.value_or(Ms{300'000}),
                p.multiplier.value_or(2.0),
                p.randomization_factor.value_or(0.1));
        case PolicyType::Linear:
            return std::make_unique<LinearBackoffPolicy>(
                p.initial_delay.value_or(Ms{1'000}),
                p.max_delay.value_or(Ms{300'000}),
                p.increment.value_or(Ms{1'000}));
        case PolicyType::Fixed:
            return std::make_unique<FixedDelayPolicy>(p.initial_delay.value_or(Ms{5'000}));
        case PolicyType::None:
            return std::make_unique<NoReconnectPolicy>();
    }
    return std::make_unique<NoReconnectPolicy>();
}

} // namespace wsplus
