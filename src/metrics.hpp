#pragma once
#include <atomic>
#include <string>
#include <sstream>

class Metrics {
public:
    // HTTP
    void incHttpTotal() { http_requests_total_.fetch_add(1, std::memory_order_relaxed); }
    void incHttpRouteHealth() { http_requests_health_.fetch_add(1, std::memory_order_relaxed); }
    void incHttpRouteMetrics() { http_requests_metrics_.fetch_add(1, std::memory_order_relaxed); }
    void incHttpRouteLocks() { http_requests_locks_.fetch_add(1, std::memory_order_relaxed); }
    void incHttpRouteOther() { http_requests_other_.fetch_add(1, std::memory_order_relaxed); }

    // Record table
    void incRecordReads() { record_reads_.fetch_add(1, std::memory_order_relaxed); }
    void incRecordHits() { record_hits_.fetch_add(1, std::memory_order_relaxed); }
    void incRecordMisses() { record_misses_.fetch_add(1, std::memory_order_relaxed); }
    void incRecordWrites() { record_writes_.fetch_add(1, std::memory_order_relaxed); }
    void incWriteConflicts() { write_conflicts_.fetch_add(1, std::memory_order_relaxed); }

    // Locks
    void incLockAcquired() { lock_acquired_.fetch_add(1, std::memory_order_relaxed); }
    void incLockReentrant() { lock_reentrant_.fetch_add(1, std::memory_order_relaxed); }
    void incLockAcquiredAfterWait() { lock_acquired_after_wait_.fetch_add(1, std::memory_order_relaxed); }
    void incLockAcquireTimeouts() { lock_acquire_timeouts_.fetch_add(1, std::memory_order_relaxed); }
    void incLockExpiredReclaimed() { lock_expired_reclaimed_.fetch_add(1, std::memory_order_relaxed); }
    void incLockReleases() { lock_releases_.fetch_add(1, std::memory_order_relaxed); }
    void incLockReleaseErrors() { lock_release_errors_.fetch_add(1, std::memory_order_relaxed); }
    void incLockWaits() { lock_waits_.fetch_add(1, std::memory_order_relaxed); }
    void incLockWaitTimeouts() { lock_wait_timeouts_.fetch_add(1, std::memory_order_relaxed); }

    unsigned long long recordHits() const { return record_hits_.load(std::memory_order_relaxed); }
    unsigned long long recordWrites() const { return record_writes_.load(std::memory_order_relaxed); }
    unsigned long long lockAcquireTimeouts() const { return lock_acquire_timeouts_.load(std::memory_order_relaxed); }
    unsigned long long lockReleaseErrors() const { return lock_release_errors_.load(std::memory_order_relaxed); }

    std::string renderPrometheus() const {
        std::ostringstream os;

        // HTTP
        os << "# TYPE http_requests_total counter\n";
        os << "http_requests_total " << http_requests_total_.load(std::memory_order_relaxed) << "\n";
        os << "http_requests_total{route=\"health\"} " << http_requests_health_.load(std::memory_order_relaxed) << "\n";
        os << "http_requests_total{route=\"metrics\"} " << http_requests_metrics_.load(std::memory_order_relaxed) << "\n";
        os << "http_requests_total{route=\"locks\"} " << http_requests_locks_.load(std::memory_order_relaxed) << "\n";
        os << "http_requests_total{route=\"other\"} " << http_requests_other_.load(std::memory_order_relaxed) << "\n";

        // Records
        os << "# TYPE record_reads_total counter\n";
        os << "record_reads_total " << record_reads_.load(std::memory_order_relaxed) << "\n";
        os << "record_reads_total{result=\"hit\"} " << record_hits_.load(std::memory_order_relaxed) << "\n";
        os << "record_reads_total{result=\"miss\"} " << record_misses_.load(std::memory_order_relaxed) << "\n";

        os << "# TYPE record_writes_total counter\n";
        os << "record_writes_total " << record_writes_.load(std::memory_order_relaxed) << "\n";

        os << "# TYPE record_write_conflicts_total counter\n";
        os << "record_write_conflicts_total " << write_conflicts_.load(std::memory_order_relaxed) << "\n";

        // Locks
        os << "# TYPE lock_acquisitions_total counter\n";
        os << "lock_acquisitions_total{mode=\"immediate\"} " << lock_acquired_.load(std::memory_order_relaxed) << "\n";
        os << "lock_acquisitions_total{mode=\"reentrant\"} " << lock_reentrant_.load(std::memory_order_relaxed) << "\n";
        os << "lock_acquisitions_total{mode=\"after_wait\"} " << lock_acquired_after_wait_.load(std::memory_order_relaxed) << "\n";

        os << "# TYPE lock_acquire_timeouts_total counter\n";
        os << "lock_acquire_timeouts_total " << lock_acquire_timeouts_.load(std::memory_order_relaxed) << "\n";

        os << "# TYPE lock_expired_reclaimed_total counter\n";
        os << "lock_expired_reclaimed_total " << lock_expired_reclaimed_.load(std::memory_order_relaxed) << "\n";

        os << "# TYPE lock_releases_total counter\n";
        os << "lock_releases_total{status=\"ok\"} " << lock_releases_.load(std::memory_order_relaxed) << "\n";
        os << "lock_releases_total{status=\"not_holder\"} " << lock_release_errors_.load(std::memory_order_relaxed) << "\n";

        os << "# TYPE lock_waits_total counter\n";
        os << "lock_waits_total " << lock_waits_.load(std::memory_order_relaxed) << "\n";
        os << "lock_waits_total{status=\"timeout\"} " << lock_wait_timeouts_.load(std::memory_order_relaxed) << "\n";

        return os.str();
    }

private:
    // HTTP
    std::atomic<unsigned long long> http_requests_total_{0};
    std::atomic<unsigned long long> http_requests_health_{0};
    std::atomic<unsigned long long> http_requests_metrics_{0};
    std::atomic<unsigned long long> http_requests_locks_{0};
    std::atomic<unsigned long long> http_requests_other_{0};

    // Records
    std::atomic<unsigned long long> record_reads_{0};
    std::atomic<unsigned long long> record_hits_{0};
    std::atomic<unsigned long long> record_misses_{0};
    std::atomic<unsigned long long> record_writes_{0};
    std::atomic<unsigned long long> write_conflicts_{0};

    // Locks
    std::atomic<unsigned long long> lock_acquired_{0};
    std::atomic<unsigned long long> lock_reentrant_{0};
    std::atomic<unsigned long long> lock_acquired_after_wait_{0};
    std::atomic<unsigned long long> lock_acquire_timeouts_{0};
    std::atomic<unsigned long long> lock_expired_reclaimed_{0};
    std::atomic<unsigned long long> lock_releases_{0};
    std::atomic<unsigned long long> lock_release_errors_{0};
    std::atomic<unsigned long long> lock_waits_{0};
    std::atomic<unsigned long long> lock_wait_timeouts_{0};
};
