#include "result_store.hpp"

ResultStore::ResultStore(const std::vector<int>& ports) {
    const std::string created = isoTimestamp();
    for (int port : ports) {
        PortResult result;
        result.scan_time = created;
        results_.emplace(port, result);
    }
}

void ResultStore::update(int port, const std::function<void(PortResult&)>& mutation) {
    std::lock_guard<std::mutex> lock(mutex_);
    mutation(results_.at(port));
}

PortResult ResultStore::get(int port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.at(port);
}

std::map<int, PortResult> ResultStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

size_t ResultStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}
