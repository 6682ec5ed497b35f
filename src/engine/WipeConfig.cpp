/**
 * @file WipeConfig.cpp
 */

#include "engine/WipeConfig.hpp"

#include <initializer_list>

namespace engine {

auto to_string(VerificationPolicy policy) -> std::string_view {
    switch (policy) {
        case VerificationPolicy::AS_REQUIRED:
            return "as-required";
        case VerificationPolicy::ALWAYS_FULL:
            return "always-full";
        case VerificationPolicy::SAMPLED_ONLY:
            return "sampled-only";
        case VerificationPolicy::SKIP:
            return "skip";
    }
    return "unknown";
}

auto verification_policy_from_string(std::string_view name) -> std::optional<VerificationPolicy> {
    for (auto policy : {VerificationPolicy::AS_REQUIRED, VerificationPolicy::ALWAYS_FULL,
                        VerificationPolicy::SAMPLED_ONLY, VerificationPolicy::SKIP}) {
        if (to_string(policy) == name) {
            return policy;
        }
    }
    return std::nullopt;
}

}  // namespace engine
