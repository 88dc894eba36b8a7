#include <langextract/core/format.h>
#include <langextract/engine/request_registry.h>

#include <mutex>

namespace langextract::engine {

Result<void> RequestRegistry::add(ActiveRequestInfo info) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (requests_.count(info.requestId) > 0) {
        return Error{ErrorCode::InvalidArgument,
                     format("request '{}' is already active", info.requestId)};
    }
    auto id = info.requestId;
    requests_.emplace(std::move(id), std::move(info));
    return {};
}

void RequestRegistry::remove(const std::string& requestId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    requests_.erase(requestId);
}

bool RequestRegistry::contains(const std::string& requestId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return requests_.count(requestId) > 0;
}

std::optional<ActiveRequestInfo> RequestRegistry::get(const std::string& requestId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = requests_.find(requestId);
    if (it == requests_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ActiveRequestInfo> RequestRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ActiveRequestInfo> out;
    out.reserve(requests_.size());
    for (const auto& [_, info] : requests_) {
        out.push_back(info);
    }
    return out;
}

std::size_t RequestRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return requests_.size();
}

bool RequestRegistry::update(const std::string& requestId,
                             const std::function<void(ActiveRequestInfo&)>& mutate) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = requests_.find(requestId);
    if (it == requests_.end()) {
        return false;
    }
    mutate(it->second);
    return true;
}

bool RequestRegistry::cancel(const std::string& requestId) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = requests_.find(requestId);
    if (it == requests_.end()) {
        return false;
    }
    it->second.context.cancel();
    return true;
}

} // namespace langextract::engine
