#include "credentials/Channel.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace lb::logging;

namespace lb::credentials {

void Channel::add(const std::string& id, const std::shared_ptr<const CredentialsData>& data) {
    std::scoped_lock lock(mutex_);
    prune_();
    entries_[id] = data;
}

std::shared_ptr<const CredentialsData> Channel::get(const std::string& id) {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        LogRegistry::credentials()->warn("[Channel] No credentials registered for id {}", id);
        throw std::invalid_argument("Unknown credentials: " + id);
    }

    auto data = it->second.lock();
    if (!data) {
        entries_.erase(it);
        LogRegistry::credentials()->warn("[Channel] Credentials {} have expired", id);
        throw std::invalid_argument("Credentials expired: " + id);
    }
    return data;
}

bool Channel::contains(const std::string& id) {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(id);
    return it != entries_.end() && !it->second.expired();
}

size_t Channel::size() {
    std::scoped_lock lock(mutex_);
    prune_();
    return entries_.size();
}

void Channel::prune_() {
    std::erase_if(entries_, [](const auto& entry) { return entry.second.expired(); });
}

}
