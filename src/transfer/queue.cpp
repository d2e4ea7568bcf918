#include "gesu/transfer/queue.hpp"
#include "gesu/events/events.hpp"
#include "gesu/transfer/adb_command.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace gesu::transfer {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kErrorTailLines = 5;

std::string join_tail(const std::deque<std::string>& tail) {
    std::string text;
    for (const auto& line : tail) {
        if (!text.empty()) {
            text += ' ';
        }
        text += line;
    }
    return text;
}

std::string io_error(std::string message) {
    return Error{ErrorKind::TransferIO, std::move(message)}.describe();
}

std::optional<std::uint64_t> regular_file_size(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

} // namespace

TransferQueue::TransferQueue(process::ProcessRunner& runner,
                             device::DeviceProbe& devices,
                             events::EventBus& bus,
                             QueueOptions options,
                             std::shared_ptr<const ProgressParser> parser)
    : runner_(runner),
      devices_(devices),
      event_bus_(bus),
      options_(std::move(options)),
      parser_(std::move(parser)),
      history_(std::max<std::size_t>(options_.history_capacity, 1)),
      workers_(std::max<std::size_t>(options_.workers, 1)) {
    options_.per_device_concurrency = std::max<std::size_t>(options_.per_device_concurrency, 1);
    timer_guard_.emplace(boost::asio::make_work_guard(timer_context_));
    timer_thread_ = std::thread([this] { timer_context_.run(); });
}

TransferQueue::~TransferQueue() {
    std::vector<Finished> cancelled;
    std::vector<std::shared_ptr<process::Process>> running;
    {
        std::lock_guard lock(mutex_);
        shutting_down_ = true;
        const auto snapshot = active_;
        for (const auto& record : snapshot) {
            record->cancel_requested = true;
            if (record->job.status == TransferStatus::Queued) {
                cancelled.push_back(retire_locked(record, TransferStatus::Cancelled, std::nullopt));
            } else if (record->process) {
                running.push_back(record->process);
            }
        }
    }
    idle_cv_.notify_all();

    for (const auto& finished : cancelled) {
        event_bus_.emit(events::TransferFinishedEvent{finished.job, finished.duration});
    }
    if (!running.empty()) {
        spdlog::info("Stopping {} running transfer(s)", running.size());
    }
    for (const auto& process : running) {
        process->terminate(options_.cancel_grace);
    }

    workers_.join();

    timer_guard_.reset();
    timer_context_.stop();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

Result<std::vector<TransferJob>> TransferQueue::submit(const std::string& device_id,
                                                       Direction direction,
                                                       const std::vector<PathPair>& paths) {
    if (device_id.empty()) {
        return Err<std::vector<TransferJob>>(ErrorKind::InvalidArgument, "Device identifier must not be empty");
    }
    if (paths.empty()) {
        return Err<std::vector<TransferJob>>(ErrorKind::InvalidArgument, "No files to transfer");
    }
    for (const auto& pair : paths) {
        if (pair.source.empty() || pair.destination.empty()) {
            return Err<std::vector<TransferJob>>(ErrorKind::InvalidArgument,
                                                 "Transfer source and destination must not be empty");
        }
    }
    if (!devices_.is_ready(device_id)) {
        return Err<std::vector<TransferJob>>(ErrorKind::DeviceUnready, "Device " + device_id + " is not ready");
    }

    std::vector<RecordPtr> records;
    records.reserve(paths.size());
    const auto now = std::chrono::system_clock::now();
    for (const auto& pair : paths) {
        auto record = std::make_shared<JobRecord>();
        record->job.id = "transfer-" + std::to_string(++job_counter_);
        record->job.direction = direction;
        record->job.device_id = device_id;
        record->job.source = pair.source;
        record->job.destination = pair.destination;
        record->job.file_name = file_name_of(pair.source);
        record->job.created_at = now;
        if (direction == Direction::Push) {
            record->job.total_bytes = regular_file_size(pair.source);
        }
        records.push_back(std::move(record));
    }

    std::vector<TransferJob> queued;
    Started started;
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_) {
            return Err<std::vector<TransferJob>>(ErrorKind::Cancellation, "Transfer queue is shutting down");
        }
        for (const auto& record : records) {
            queued.push_back(record->job);
            active_.push_back(record);
        }
        started = dispatch_locked();
    }

    spdlog::info("Queued {} {} job(s) for device {}", queued.size(), to_string(direction), device_id);
    for (const auto& job : queued) {
        event_bus_.emit(events::TransferQueuedEvent{job});
    }
    post_jobs(started);
    return Ok(std::move(queued));
}

Result<std::vector<TransferJob>> TransferQueue::submit_push(const std::string& device_id,
                                                            const std::vector<std::string>& local_paths,
                                                            const std::string& device_dir) {
    const std::string& dir = device_dir.empty() ? options_.default_device_dir : device_dir;
    std::vector<PathPair> pairs;
    pairs.reserve(local_paths.size());
    for (const auto& local : local_paths) {
        pairs.push_back({local, resolve_push_destination(dir, local)});
    }
    return submit(device_id, Direction::Push, pairs);
}

Result<std::vector<TransferJob>> TransferQueue::submit_pull(const std::string& device_id,
                                                            const std::vector<std::string>& remote_paths,
                                                            const std::string& local_dir) {
    if (local_dir.empty()) {
        return Err<std::vector<TransferJob>>(ErrorKind::InvalidArgument, "Destination directory must not be empty");
    }
    std::vector<PathPair> pairs;
    pairs.reserve(remote_paths.size());
    for (const auto& remote : remote_paths) {
        pairs.push_back({remote, resolve_pull_destination(local_dir, remote)});
    }
    return submit(device_id, Direction::Pull, pairs);
}

Result<void> TransferQueue::cancel(const std::string& job_id) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(active_.begin(), active_.end(),
                           [&](const RecordPtr& record) { return record->job.id == job_id; });

    if (it == active_.end()) {
        const bool finished = std::any_of(history_.begin(), history_.end(),
                                          [&](const TransferJob& job) { return job.id == job_id; });
        if (!finished) {
            return Err<void>(ErrorKind::TransferNotFound, "Unknown transfer " + job_id);
        }
        spdlog::debug("Cancel of finished transfer {} ignored", job_id);
        return Ok();
    }

    const RecordPtr record = *it;
    if (record->job.status == TransferStatus::Queued) {
        const auto finished = retire_locked(record, TransferStatus::Cancelled, std::nullopt);
        lock.unlock();
        idle_cv_.notify_all();
        spdlog::info("Cancelled queued transfer {}", job_id);
        event_bus_.emit(events::TransferFinishedEvent{finished.job, finished.duration});
        return Ok();
    }

    if (record->cancel_requested) {
        return Ok();
    }
    record->cancel_requested = true;
    auto process = record->process;
    lock.unlock();

    spdlog::info("Cancelling running transfer {}", job_id);
    // Not spawned yet: run_job sees the flag before or right after spawning
    if (process) {
        process->interrupt();
        schedule_escalation(std::move(process), job_id);
    }
    return Ok();
}

std::vector<TransferJob> TransferQueue::list_active() const {
    std::lock_guard lock(mutex_);
    std::vector<TransferJob> jobs;
    jobs.reserve(active_.size());
    for (const auto& record : active_) {
        jobs.push_back(snapshot(*record));
    }
    return jobs;
}

std::vector<TransferJob> TransferQueue::list_history() const {
    std::lock_guard lock(mutex_);
    return {history_.begin(), history_.end()};
}

std::optional<TransferJob> TransferQueue::find(const std::string& job_id) const {
    std::lock_guard lock(mutex_);
    for (const auto& record : active_) {
        if (record->job.id == job_id) {
            return snapshot(*record);
        }
    }
    for (const auto& job : history_) {
        if (job.id == job_id) {
            return job;
        }
    }
    return std::nullopt;
}

bool TransferQueue::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return active_.empty(); });
}

TransferQueue::Started TransferQueue::dispatch_locked() {
    Started started;
    if (shutting_down_) {
        return started;
    }
    for (const auto& record : active_) {
        if (record->job.status != TransferStatus::Queued) {
            continue;
        }
        auto& running = running_per_device_[record->job.device_id];
        if (running >= options_.per_device_concurrency) {
            continue;
        }
        ++running;
        record->job.status = TransferStatus::Transferring;
        record->job.started_at = std::chrono::system_clock::now();
        record->started = std::chrono::steady_clock::now();
        started.emplace_back(record, record->job);
    }
    return started;
}

void TransferQueue::post_jobs(const Started& started) {
    for (const auto& [record, job] : started) {
        spdlog::debug("Starting transfer {} ({} {})", job.id, to_string(job.direction), job.source);
        event_bus_.emit(events::TransferStartedEvent{job});
        boost::asio::post(workers_, [this, record = record] { run_job(record); });
    }
}

void TransferQueue::run_job(const RecordPtr& record) {
    try {
        execute_job(record);
    } catch (const std::exception& e) {
        spdlog::error("Transfer {} aborted: {}", record->job.id, e.what());
        std::shared_ptr<process::Process> process;
        bool still_active = false;
        {
            std::lock_guard lock(mutex_);
            process = record->process;
            still_active = !is_terminal(record->job.status);
        }
        if (process && process->is_alive()) {
            process->terminate(options_.cancel_grace);
        }
        if (still_active) {
            finish_job(record, TransferStatus::Failed, io_error(e.what()));
        }
    }
}

void TransferQueue::execute_job(const RecordPtr& record) {
    // Path fields are immutable once the record is published
    const TransferJob& job = record->job;

    if (job.direction == Direction::Push) {
        if (!regular_file_size(job.source)) {
            finish_job(record, TransferStatus::Failed, io_error("Source file not found: " + job.source));
            return;
        }
        std::ifstream probe(job.source, std::ios::binary);
        if (!probe) {
            finish_job(record, TransferStatus::Failed, io_error("Source file is not readable: " + job.source));
            return;
        }
    } else {
        const auto parent = fs::path(job.destination).parent_path();
        std::error_code ec;
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
        }
        if (ec) {
            finish_job(record, TransferStatus::Failed,
                       io_error("Cannot create " + parent.string() + ": " + ec.message()));
            return;
        }
    }

    bool cancelled_early = false;
    {
        std::lock_guard lock(mutex_);
        cancelled_early = record->cancel_requested;
    }
    if (cancelled_early) {
        finish_job(record, TransferStatus::Cancelled, std::nullopt);
        return;
    }

    auto spawned = runner_.spawn(
        make_adb_transfer_command(options_.adb_path, job.device_id, job.direction, job.source, job.destination));
    if (spawned.is_error()) {
        spdlog::warn("Transfer {} could not start: {}", job.id, spawned.error().message);
        finish_job(record, TransferStatus::Failed, spawned.error().describe());
        return;
    }

    std::shared_ptr<process::Process> process(std::move(spawned.value()));
    bool cancel_pending = false;
    {
        std::lock_guard lock(mutex_);
        record->process = process;
        cancel_pending = record->cancel_requested;
    }
    if (cancel_pending) {
        process->interrupt();
        schedule_escalation(process, job.id);
    }

    ProgressReporter reporter(parser_, job.total_bytes);
    std::deque<std::string> tail;
    while (auto line = process->read_line()) {
        if (!line->empty() && line->back() == '\r') {
            line->pop_back();
        }
        if (line->empty()) {
            continue;
        }
        tail.push_back(*line);
        if (tail.size() > kErrorTailLines) {
            tail.pop_front();
        }
        if (const auto advanced = reporter.on_line(*line)) {
            advance(record->transferred, *advanced);
            event_bus_.emit(events::TransferProgressEvent{job.id, *advanced, reporter.total()});
        }
    }
    const int code = process->wait_exit();

    bool cancelled = false;
    {
        std::lock_guard lock(mutex_);
        cancelled = record->cancel_requested;
    }

    if (cancelled) {
        finish_job(record, TransferStatus::Cancelled, std::nullopt);
        return;
    }
    if (code != 0) {
        std::string detail = join_tail(tail);
        if (detail.empty()) {
            detail = "adb exited with code " + std::to_string(code);
        }
        spdlog::warn("Transfer {} failed: {}", job.id, detail);
        finish_job(record, TransferStatus::Failed, io_error(std::move(detail)));
        return;
    }

    std::optional<std::uint64_t> final_size;
    if (job.direction == Direction::Pull) {
        final_size = regular_file_size(job.destination);
    }
    if (reporter.degraded()) {
        spdlog::debug("No progress parsed for transfer {}", job.id);
    }
    const auto final_bytes = reporter.on_success(final_size);
    advance(record->transferred, final_bytes);
    event_bus_.emit(events::TransferProgressEvent{job.id, final_bytes, final_bytes});
    finish_job(record, TransferStatus::Complete, std::nullopt, final_bytes);
}

void TransferQueue::finish_job(const RecordPtr& record, TransferStatus status,
                               std::optional<std::string> error,
                               std::optional<std::uint64_t> final_bytes) {
    Finished finished;
    Started started;
    {
        std::lock_guard lock(mutex_);
        if (final_bytes) {
            record->job.total_bytes = final_bytes;
        }
        finished = retire_locked(record, status, std::move(error));
        started = dispatch_locked();
    }
    idle_cv_.notify_all();

    const auto& job = finished.job;
    if (status == TransferStatus::Complete) {
        spdlog::info("Transfer {} complete ({} bytes in {}ms)", job.id, job.transferred_bytes,
                     finished.duration.count());
    }
    event_bus_.emit(events::TransferFinishedEvent{job, finished.duration});
    post_jobs(started);
}

TransferQueue::Finished TransferQueue::retire_locked(const RecordPtr& record, TransferStatus status,
                                                     std::optional<std::string> error) {
    auto& job = record->job;
    const bool was_running = job.status == TransferStatus::Transferring;
    if (!can_transition(job.status, status)) {
        spdlog::error("Illegal transfer transition {} -> {} for {}", to_string(job.status), to_string(status), job.id);
    }

    job.status = status;
    job.error = std::move(error);
    job.completed_at = std::chrono::system_clock::now();
    job.transferred_bytes = std::max(job.transferred_bytes, record->transferred.load());
    if (job.total_bytes) {
        job.transferred_bytes = std::min(job.transferred_bytes, *job.total_bytes);
    }

    if (was_running) {
        auto it = running_per_device_.find(job.device_id);
        if (it != running_per_device_.end() && --it->second == 0) {
            running_per_device_.erase(it);
        }
    }
    active_.erase(std::remove(active_.begin(), active_.end(), record), active_.end());
    history_.push_front(job);

    Finished finished{job, std::chrono::milliseconds{0}};
    if (was_running) {
        finished.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - record->started);
    }
    return finished;
}

void TransferQueue::schedule_escalation(std::shared_ptr<process::Process> process, const std::string& job_id) {
    auto timer = std::make_shared<boost::asio::steady_timer>(timer_context_, options_.cancel_grace);
    timer->async_wait([timer, process = std::move(process), job_id](const boost::system::error_code& ec) {
        if (ec || !process->is_alive()) {
            return;
        }
        spdlog::warn("Transfer {} ignored interrupt, forcing termination", job_id);
        process->terminate(std::chrono::milliseconds{0});
    });
}

TransferJob TransferQueue::snapshot(const JobRecord& record) {
    TransferJob job = record.job;
    job.transferred_bytes = std::max(job.transferred_bytes, record.transferred.load());
    return job;
}

void TransferQueue::advance(std::atomic<std::uint64_t>& counter, std::uint64_t value) {
    auto current = counter.load();
    while (current < value && !counter.compare_exchange_weak(current, value)) {
    }
}

} // namespace gesu::transfer
