#pragma once

#include <libnovapool/zkp/ArtifactProvider.h>
#include <libnovapool/zkp/Config.h>
#include <libnovapool/zkp/Poseidon2.h>
#include <libnovapool/zkp/ProverMessages.h>
#include <libnovapool/zkp/WitnessCalculator.h>
#include <libnovapool/zkp/ZKProver.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/json_value.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

namespace novapool {
namespace zkp {

/** Readiness tuple reported by PING and GET_STATE. */
struct WorkerState
{
    bool modulesReady = false;
    bool witnessReady = false;
    bool proverReady = false;

    Json::Value
    toJson() const;
};

/**
 * Background prover.
 *
 * Owns the witness calculator, the proving key and the R1CS, and serves
 * one request at a time from a FIFO queue on its own thread. Readiness
 * only moves forward:
 *
 *   LOADED -> MOD_READY -> WIT_READY -> PROVER_READY
 *
 * INIT_PROVER and PROVE run any missing earlier step first. A failed
 * step leaves the state where it was.
 */
class ProverWorker
{
public:
    using Sink = std::function<void(Json::Value const&)>;

    ProverWorker(
        std::shared_ptr<ArtifactProvider> artifacts,
        std::shared_ptr<WitnessCalculatorFactory> calculators,
        Poseidon2 hasher,
        PoolConfig const& config,
        beast::Journal journal);

    ~ProverWorker();

    ProverWorker(ProverWorker const&) = delete;
    ProverWorker&
    operator=(ProverWorker const&) = delete;

    /** Spawn the thread; sink receives READY, PROGRESS and responses. */
    void
    start(Sink sink);

    /** Drop queued requests and join the thread. */
    void
    stop();

    /** Queue a request. Ignored once stopped. */
    void
    post(Json::Value request);

    /**
     * Serve a single request on the calling thread. PROGRESS frames go
     * to sink.
     */
    Json::Value
    handle(Json::Value const& request, Sink const& sink);

    WorkerState
    state() const;

private:
    enum class Stage { Loaded, ModulesReady, WitnessReady, ProverReady };

    void
    run();

    Json::Value
    dispatch(MessageType type, Json::Value const& data, ProgressCallback const& progress);

    Json::Value
    initModules();

    Json::Value
    initWitness(Json::Value const& data, ProgressCallback const& progress);

    Json::Value
    initProver(ProgressCallback const& progress);

    Json::Value
    prove(Json::Value const& data, ProgressCallback const& progress);

    Json::Value
    verify(Json::Value const& data);

    Json::Value
    circuitInfo() const;

    Json::Value
    configure(Json::Value const& data);

    void
    advance(Stage stage);

    std::shared_ptr<ArtifactProvider> artifacts_;
    std::shared_ptr<WitnessCalculatorFactory> calculators_;
    Poseidon2 hasher_;
    ArtifactUrls urls_;
    bool verifyHashVectors_;
    beast::Journal j_;

    std::atomic<Stage> stage_{Stage::Loaded};
    std::unique_ptr<WitnessCalculator> calculator_;
    ZkProver prover_;

    mutable std::mutex lock_;
    std::condition_variable condition_;
    std::queue<Json::Value> queue_;
    bool closed_ = false;
    Sink sink_;
    std::thread thread_;
};

}  // namespace zkp
}  // namespace novapool
