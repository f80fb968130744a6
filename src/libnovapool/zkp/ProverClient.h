#pragma once

#include <libnovapool/zkp/ProverWorker.h>
#include <xrpl/basics/Blob.h>
#include <xrpl/beast/utility/Journal.h>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>

namespace novapool {
namespace zkp {

struct ProveResult
{
    ripple::Blob compressed;
    ripple::Blob onChain;
    std::vector<FieldT> publicInputs;
    Json::Value timings;
};

/**
 * Request/response front end of a ProverWorker.
 *
 * Each request gets a fresh message id and waits on a future until the
 * matching response arrives or its timeout expires. An expired request
 * is forgotten; if the worker answers later the response is logged and
 * dropped. Idempotent requests are resent after a timeout up to
 * maxRetries times; PROVE never is.
 */
class ProverClient
{
public:
    ProverClient(
        std::unique_ptr<ProverWorker> worker,
        PoolConfig const& config,
        beast::Journal journal);

    ~ProverClient();

    ProverClient(ProverClient const&) = delete;
    ProverClient&
    operator=(ProverClient const&) = delete;

    /**
     * Start the worker and wait for READY.
     *
     * The worker thread is spawned once. After a timeout a later call
     * waits for the same READY again.
     *
     * @throws PoolError(WorkerTimeout) if it does not come in time
     */
    void
    start();

    /**
     * Send a request and wait for its result.
     *
     * @throws PoolError with the worker's error code on failure, or
     *         WorkerTimeout when no response arrived in time
     */
    Json::Value
    call(
        MessageType type,
        Json::Value const& data = Json::Value(Json::objectValue),
        ProgressCallback progress = {});

    WorkerState
    ping();

    WorkerState
    getState();

    bool
    isCached();

    void
    clearCache();

    void
    configure(ArtifactUrls const& urls);

    void
    initializeProver(ProgressCallback progress = {});

    bool
    isReady() const
    {
        return proverReady_;
    }

    ProveResult
    prove(Json::Value const& circuitInputs, ProgressCallback progress = {});

    bool
    verify(ripple::Blob const& compressedProof, std::vector<FieldT> const& publicInputs);

    ripple::Blob
    verifyingKey();

    Json::Value
    circuitInfo();

    /** Requests still awaiting a response. */
    std::size_t
    pendingCount() const;

private:
    struct Pending
    {
        std::promise<Json::Value> promise;
        ProgressCallback progress;
    };

    Json::Value
    send(MessageType type, Json::Value const& data, ProgressCallback const& progress);

    void
    onMessage(Json::Value const& message);

    std::chrono::milliseconds
    timeoutFor(MessageType type) const;

    std::unique_ptr<ProverWorker> worker_;
    std::chrono::milliseconds proveTimeout_;
    std::chrono::milliseconds callTimeout_;
    std::chrono::milliseconds spawnTimeout_;
    unsigned maxRetries_;
    beast::Journal j_;

    std::atomic<std::uint64_t> nextId_{0};
    std::atomic<bool> proverReady_{false};
    std::promise<void> ready_;
    std::shared_future<void> readyFuture_;
    bool spawned_ = false;
    bool started_ = false;

    mutable std::mutex lock_;
    std::map<std::uint64_t, std::shared_ptr<Pending>> pending_;
};

}  // namespace zkp
}  // namespace novapool
