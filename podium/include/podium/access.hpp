#pragma once
// Access: capability checks injected around mutating entry points
//
// The ranking core never decides who may write. It asks the injected
// CapabilityCheck before touching state and returns whatever error the
// check produced. Reads are never gated.
//
// RoleGate is a small reference collaborator (roles + pause) used by the
// CLI and tests. Hosts with their own access control plug in their own
// function instead.

#include "types.hpp"
#include <functional>
#include <set>
#include <string>
#include <unordered_map>

namespace podium {

enum class Capability : uint8_t {
    UpdateScore,   // score / activity / achievement writes
    Administer,    // reset, config, seasons, cleanup
};

// Returns Error::None to allow the call
using CapabilityCheck = std::function<Error(Capability)>;

inline CapabilityCheck allow_all() {
    return [](Capability) { return Error::None; };
}

enum class Role : uint8_t {
    Admin,
    ScoreManager,
};

inline std::string role_name(Role r) {
    switch (r) {
        case Role::Admin: return "admin";
        case Role::ScoreManager: return "score_manager";
        default: return "unknown";
    }
}

class RoleGate {
public:
    RoleGate() = default;

    // Owner gets every role, as a freshly deployed registry would
    explicit RoleGate(const std::string& owner) {
        grant(owner, Role::Admin);
        grant(owner, Role::ScoreManager);
    }

    void grant(const std::string& caller, Role role) {
        roles_[caller].insert(role);
    }

    void revoke(const std::string& caller, Role role) {
        auto it = roles_.find(caller);
        if (it == roles_.end()) return;
        it->second.erase(role);
        if (it->second.empty()) roles_.erase(it);
    }

    bool has_role(const std::string& caller, Role role) const {
        auto it = roles_.find(caller);
        return it != roles_.end() && it->second.count(role) > 0;
    }

    void pause() { paused_ = true; }
    void unpause() { paused_ = false; }
    bool paused() const { return paused_; }

    Error check(const std::string& caller, Capability cap) const {
        switch (cap) {
            case Capability::UpdateScore:
                if (!has_role(caller, Role::ScoreManager)) return Error::Unauthorized;
                if (paused_) return Error::Paused;
                return Error::None;
            case Capability::Administer:
                if (!has_role(caller, Role::Admin)) return Error::Unauthorized;
                return Error::None;
        }
        return Error::Unauthorized;
    }

    // Bind a caller identity into a CapabilityCheck.
    // The gate must outlive the returned function.
    CapabilityCheck for_caller(std::string caller) const {
        return [this, caller = std::move(caller)](Capability cap) {
            return check(caller, cap);
        };
    }

private:
    std::unordered_map<std::string, std::set<Role>> roles_;
    bool paused_ = false;
};

} // namespace podium
