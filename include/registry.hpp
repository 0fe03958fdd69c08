#pragma once

#include "errors.hpp"
#include "ledger_types.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>

namespace wx {

// Role registry keyed by identity. Removal deactivates the record so its
// history stays readable; re-adding reactivates it through
// Record::reactivate. Record must expose a `bool active` member.
template <typename Record>
class Registry {
public:
    explicit Registry(std::string roleName) : roleName_(std::move(roleName)) {}

    bool isActive(const Identity& id) const {
        auto it = records_.find(id);
        return it != records_.end() && it->second.active;
    }

    const Record* lookup(const Identity& id) const {
        auto it = records_.find(id);
        if (it == records_.end()) {
            return nullptr;
        }
        return &it->second;
    }

    Record& requireActive(const Identity& id) {
        auto it = records_.find(id);
        if (it == records_.end() || !it->second.active) {
            throw AuthorizationError(id + " is not an active " + roleName_);
        }
        return it->second;
    }

    void add(const Identity& id, Record record) {
        if (id.empty()) {
            throw ValidationError(roleName_ + " identity must not be empty");
        }
        auto it = records_.find(id);
        if (it == records_.end()) {
            record.active = true;
            records_.emplace(id, std::move(record));
            return;
        }
        if (it->second.active) {
            throw ValidationError(id + " is already an active " + roleName_);
        }
        it->second.reactivate(record);
        it->second.active = true;
    }

    void remove(const Identity& id) {
        auto it = records_.find(id);
        if (it == records_.end() || !it->second.active) {
            throw ValidationError(id + " is not an active " + roleName_);
        }
        it->second.active = false;
    }

    std::size_t activeCount() const {
        std::size_t count = 0;
        for (const auto& entry : records_) {
            if (entry.second.active) {
                ++count;
            }
        }
        return count;
    }

    const std::string& roleName() const { return roleName_; }

private:
    std::string roleName_;
    std::unordered_map<Identity, Record> records_;
};

} // namespace wx
