#pragma once

#include "gesu/core/result.hpp"
#include "gesu/device/device.hpp"
#include "gesu/events/event_bus.hpp"
#include "gesu/process/process.hpp"
#include "gesu/transfer/progress.hpp"
#include "gesu/transfer/types.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/circular_buffer.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gesu::transfer {

struct QueueOptions {
    std::string adb_path = "adb";
    std::string default_device_dir = "Download/GesuBridge";
    std::size_t per_device_concurrency = 1;
    std::size_t workers = 4;
    std::size_t history_capacity = 50;
    std::chrono::milliseconds cancel_grace{3000};
};

/**
 * @brief Asynchronous push/pull job queue with per-device concurrency
 *
 * SCHEDULING:
 * Jobs run in submission order per device. A Queued job starts only when
 * its device has fewer than per_device_concurrency Transferring jobs;
 * jobs of different devices interleave freely. Each started job runs on
 * a worker of a boost::asio::thread_pool.
 *
 * THREAD SAFETY:
 * All public members are thread-safe. Structural changes (enqueue,
 * dispatch, cancel, completion) happen under one mutex; byte progress is
 * an atomic updated without it. Events are emitted with no lock held.
 */
class TransferQueue {
public:
    TransferQueue(process::ProcessRunner& runner,
                  device::DeviceProbe& devices,
                  events::EventBus& bus,
                  QueueOptions options = {},
                  std::shared_ptr<const ProgressParser> parser = std::make_shared<AdbProgressParser>());

    /// Cancels outstanding jobs and waits for the workers
    ~TransferQueue();

    TransferQueue(const TransferQueue&) = delete;
    TransferQueue& operator=(const TransferQueue&) = delete;

    /**
     * @brief Enqueue one job per path pair
     *
     * Returns immediately with the Queued snapshots; execution is
     * asynchronous. Fails with DeviceUnready or InvalidArgument and then
     * enqueues nothing.
     */
    Result<std::vector<TransferJob>> submit(const std::string& device_id,
                                            Direction direction,
                                            const std::vector<PathPair>& paths);

    /// Push host files into @p device_dir (default_device_dir when empty)
    Result<std::vector<TransferJob>> submit_push(const std::string& device_id,
                                                 const std::vector<std::string>& local_paths,
                                                 const std::string& device_dir = {});

    /// Pull device files into the host directory @p local_dir
    Result<std::vector<TransferJob>> submit_pull(const std::string& device_id,
                                                 const std::vector<std::string>& remote_paths,
                                                 const std::string& local_dir);

    /**
     * @brief Cancel a job
     *
     * Queued: Cancelled at once, the tool is never invoked.
     * Transferring: the tool is interrupted (forced after cancel_grace)
     * and the job becomes Cancelled when it exits. Partial output is kept.
     * Terminal: no-op success.
     */
    Result<void> cancel(const std::string& job_id);

    /// Active jobs in submission order
    [[nodiscard]] std::vector<TransferJob> list_active() const;

    /// Finished jobs, most recent first
    [[nodiscard]] std::vector<TransferJob> list_history() const;

    [[nodiscard]] std::optional<TransferJob> find(const std::string& job_id) const;

    /// Blocks until no job is active; false on timeout
    bool wait_idle(std::chrono::milliseconds timeout);

private:
    struct JobRecord {
        TransferJob job;
        std::atomic<std::uint64_t> transferred{0};
        std::shared_ptr<process::Process> process;
        bool cancel_requested = false;
        std::chrono::steady_clock::time_point started{};
    };
    using RecordPtr = std::shared_ptr<JobRecord>;

    struct Finished {
        TransferJob job;
        std::chrono::milliseconds duration{0};
    };

    using Started = std::vector<std::pair<RecordPtr, TransferJob>>;

    Started dispatch_locked();
    void post_jobs(const Started& started);
    /// Runs execute_job; a job that throws ends Failed instead of stranding its device slot
    void run_job(const RecordPtr& record);
    void execute_job(const RecordPtr& record);
    void finish_job(const RecordPtr& record, TransferStatus status, std::optional<std::string> error,
                    std::optional<std::uint64_t> final_bytes = std::nullopt);
    Finished retire_locked(const RecordPtr& record, TransferStatus status, std::optional<std::string> error);
    void schedule_escalation(std::shared_ptr<process::Process> process, const std::string& job_id);

    static TransferJob snapshot(const JobRecord& record);
    static void advance(std::atomic<std::uint64_t>& counter, std::uint64_t value);

    process::ProcessRunner& runner_;
    device::DeviceProbe& devices_;
    events::EventBus& event_bus_;
    QueueOptions options_;
    std::shared_ptr<const ProgressParser> parser_;

    std::atomic<std::uint64_t> job_counter_{0};

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::deque<RecordPtr> active_;
    boost::circular_buffer<TransferJob> history_;  ///< Newest at front
    std::unordered_map<std::string, std::size_t> running_per_device_;
    bool shutting_down_ = false;

    boost::asio::thread_pool workers_;

    // Escalation timers for cancelled transfers
    boost::asio::io_context timer_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> timer_guard_;
    std::thread timer_thread_;
};

} // namespace gesu::transfer
