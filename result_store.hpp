#ifndef RESULT_STORE_HPP
#define RESULT_STORE_HPP

#include <functional>
#include <map>
#include <mutex>
#include <vector>

#include "scan_types.hpp"

/**
 * @class ResultStore
 * @brief Per-port results of one scan, guarded by a single mutex.
 *
 * Port tasks never touch the map directly: every read and write goes
 * through update()/get() under the lock.
 */
class ResultStore {
public:
    /** @brief Creates an empty record stamped with the current time for each port. */
    explicit ResultStore(const std::vector<int>& ports);

    /**
     * @brief Applies @p mutation to the record of @p port under the lock.
     * @throws std::out_of_range if @p port was not part of the scan.
     */
    void update(int port, const std::function<void(PortResult&)>& mutation);

    /** @brief Copy of one record. @throws std::out_of_range for unknown ports. */
    PortResult get(int port) const;

    /** @brief Copy of every record, ordered by port. */
    std::map<int, PortResult> snapshot() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<int, PortResult> results_;
};

#endif // RESULT_STORE_HPP
