#include <spdlog/spdlog.h>
#include <canopy/concurrency/operation_serializer.h>
#include <canopy/storage/storage_key.h>

#include <boost/asio/post.hpp>

namespace canopy::concurrency {

OperationSerializer::OperationSerializer(boost::asio::any_io_executor executor)
    : executor_(std::move(executor)) {}

OperationSerializer::~OperationSerializer() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!lanes_.empty()) {
        spdlog::warn("Operation serializer destroyed with {} projects still queued",
                     lanes_.size());
    }
}

OperationSerializer::HeldScope::HeldScope(const std::string& projectId) : projectId_(projectId) {
    heldProjects().insert(projectId_);
}

OperationSerializer::HeldScope::~HeldScope() {
    heldProjects().erase(projectId_);
}

OperationSerializer::Turn::Turn(OperationSerializer& owner, const std::string& projectId)
    : owner_(owner), projectId_(projectId) {
    owner_.waitForTurn(projectId_);
    held_.emplace(projectId_);
}

OperationSerializer::Turn::~Turn() {
    held_.reset();
    std::unique_lock<std::mutex> lock(owner_.mutex_);
    owner_.finishLocked(lock, projectId_);
}

std::unordered_set<std::string>& OperationSerializer::heldProjects() {
    static thread_local std::unordered_set<std::string> held;
    return held;
}

bool OperationSerializer::isHeldByCurrentThread(const std::string& projectId) {
    return heldProjects().contains(projectId);
}

Result<void> OperationSerializer::validate(std::string_view projectId) {
    return storage::validateProjectId(projectId);
}

void OperationSerializer::enqueueJob(const std::string& projectId, std::function<void()> job) {
    auto ticket = std::make_shared<Ticket>();
    ticket->job = std::move(job);

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = lanes_.try_emplace(projectId);
    if (inserted) {
        spdlog::debug("Serializer lane opened for project {}", projectId);
    }
    it->second.queue.push_back(ticket);
    if (it->second.queue.size() == 1) {
        dispatchFrontLocked(projectId, it->second);
    }
}

void OperationSerializer::waitForTurn(const std::string& projectId) {
    auto ticket = std::make_shared<Ticket>();

    std::unique_lock<std::mutex> lock(mutex_);
    auto [it, inserted] = lanes_.try_emplace(projectId);
    if (inserted) {
        spdlog::debug("Serializer lane opened for project {}", projectId);
    }
    it->second.queue.push_back(ticket);

    while (true) {
        // Our ticket keeps the lane alive; re-find it since other lanes may have been erased
        auto front = lanes_.find(projectId)->second.queue.front();
        if (front == ticket) {
            return;
        }
        if (front->job && !front->started) {
            // Run the queued job ahead of us here instead of waiting for a worker
            front->started = true;
            lock.unlock();
            helpedRuns_.fetch_add(1, std::memory_order_relaxed);
            runJob(projectId, front);
            lock.lock();
            continue;
        }
        turnChanged_.wait(lock);
    }
}

void OperationSerializer::runJob(const std::string& projectId,
                                 const std::shared_ptr<Ticket>& ticket) {
    {
        HeldScope held(projectId);
        ticket->job();
    }
    std::unique_lock<std::mutex> lock(mutex_);
    finishLocked(lock, projectId);
}

void OperationSerializer::dispatchFrontLocked(const std::string& projectId, Lane& lane) {
    auto front = lane.queue.front();
    if (front->job && !front->started) {
        boost::asio::post(executor_, [this, projectId, front]() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (front->started) {
                    return;
                }
                front->started = true;
            }
            runJob(projectId, front);
        });
    }
    turnChanged_.notify_all();
}

void OperationSerializer::finishLocked(std::unique_lock<std::mutex>& lock,
                                       const std::string& projectId) {
    (void)lock;
    auto it = lanes_.find(projectId);
    if (it == lanes_.end() || it->second.queue.empty()) {
        spdlog::error("Serializer lane for project {} missing on release", projectId);
        return;
    }

    it->second.queue.pop_front();
    if (it->second.queue.empty()) {
        lanes_.erase(it);
        spdlog::debug("Serializer lane closed for project {}", projectId);
        return;
    }
    dispatchFrontLocked(projectId, it->second);
}

std::size_t OperationSerializer::activeProjects() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lanes_.size();
}

std::size_t OperationSerializer::pending(const std::string& projectId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lanes_.find(projectId);
    return it == lanes_.end() ? 0 : it->second.queue.size();
}

OperationSerializer::Stats OperationSerializer::getStats() const noexcept {
    Stats s;
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.completed = completed_.load(std::memory_order_relaxed);
    s.failed = failed_.load(std::memory_order_relaxed);
    s.inlineRuns = inlineRuns_.load(std::memory_order_relaxed);
    s.helpedRuns = helpedRuns_.load(std::memory_order_relaxed);
    return s;
}

} // namespace canopy::concurrency
