#include <libnovapool/zkp/ProverWorker.h>
#include <libnovapool/zkp/PoolError.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/StringUtilities.h>
#include <xrpl/basics/strHex.h>

#include <boost/lexical_cast.hpp>

#include <chrono>
#include <stdexcept>
#include <utility>

namespace novapool {
namespace zkp {

namespace {

using clock_type = std::chrono::steady_clock;

Json::UInt
elapsedMs(clock_type::time_point start)
{
    return static_cast<Json::UInt>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            clock_type::now() - start)
            .count());
}

std::uint64_t
messageIdOf(Json::Value const& request)
{
    try
    {
        return boost::lexical_cast<std::uint64_t>(
            request["messageId"].asString());
    }
    catch (boost::bad_lexical_cast const&)
    {
        return 0;
    }
}

std::string
stringField(Json::Value const& data, char const* key)
{
    if (!data.isObject() || !data.isMember(key) || !data[key].isString())
        throw std::invalid_argument(std::string("Missing field '") + key + "'");
    return data[key].asString();
}

Json::Value
progressFrame(std::uint64_t messageId, DownloadProgress const& p)
{
    Json::Value frame(Json::objectValue);
    frame["type"] = to_string(MessageType::Progress);
    frame["messageId"] = std::to_string(messageId);
    frame["loaded"] = std::to_string(p.loaded);
    frame["total"] = std::to_string(p.total);
    frame["percent"] = p.percent;
    frame["message"] = p.message;
    return frame;
}

}  // namespace

Json::Value
WorkerState::toJson() const
{
    Json::Value json(Json::objectValue);
    json["modulesReady"] = modulesReady;
    json["witnessReady"] = witnessReady;
    json["proverReady"] = proverReady;
    return json;
}

ProverWorker::ProverWorker(
    std::shared_ptr<ArtifactProvider> artifacts,
    std::shared_ptr<WitnessCalculatorFactory> calculators,
    Poseidon2 hasher,
    PoolConfig const& config,
    beast::Journal journal)
    : artifacts_(std::move(artifacts))
    , calculators_(std::move(calculators))
    , hasher_(std::move(hasher))
    , urls_(config.artifacts)
    , verifyHashVectors_(config.verifyHashVectors)
    , j_(journal)
    , prover_(journal)
{
}

ProverWorker::~ProverWorker()
{
    stop();
}

void
ProverWorker::start(Sink sink)
{
    std::lock_guard guard(lock_);
    if (thread_.joinable())
        throw std::logic_error("Prover worker already started");
    closed_ = false;
    sink_ = std::move(sink);
    thread_ = std::thread(&ProverWorker::run, this);
}

void
ProverWorker::stop()
{
    {
        std::lock_guard guard(lock_);
        closed_ = true;
        while (!queue_.empty())
            queue_.pop();
    }
    condition_.notify_all();
    if (thread_.joinable())
        thread_.join();
}

void
ProverWorker::post(Json::Value request)
{
    {
        std::lock_guard guard(lock_);
        if (closed_)
            return;
        queue_.push(std::move(request));
    }
    condition_.notify_one();
}

void
ProverWorker::run()
{
    {
        Json::Value ready(Json::objectValue);
        ready["type"] = to_string(MessageType::Ready);
        sink_(ready);
    }

    while (true)
    {
        Json::Value request;
        {
            std::unique_lock guard(lock_);
            condition_.wait(guard, [this] { return closed_ || !queue_.empty(); });
            if (closed_)
                break;
            request = std::move(queue_.front());
            queue_.pop();
        }
        sink_(handle(request, sink_));
    }
    JLOG(j_.debug()) << "Prover worker stopped";
}

WorkerState
ProverWorker::state() const
{
    auto const stage = stage_.load();
    WorkerState s;
    s.modulesReady = stage >= Stage::ModulesReady;
    s.witnessReady = stage >= Stage::WitnessReady;
    s.proverReady = stage >= Stage::ProverReady;
    return s;
}

void
ProverWorker::advance(Stage stage)
{
    if (stage > stage_.load())
        stage_ = stage;
}

Json::Value
ProverWorker::handle(Json::Value const& request, Sink const& sink)
{
    auto const type = request["type"].asString();
    auto const id = messageIdOf(request);

    auto const kind = messageTypeFromString(type);
    if (!kind || *kind == MessageType::Progress || *kind == MessageType::Ready)
        return makeFailure(
            type,
            id,
            ErrorCode::UnknownMessageType,
            "Unknown message type: " + type);

    ProgressCallback const progress = [&sink, id](DownloadProgress const& p) {
        if (sink)
            sink(progressFrame(id, p));
    };

    JLOG(j_.trace()) << "Handling " << type << " #" << id;
    try
    {
        return makeSuccess(type, id, dispatch(*kind, request["data"], progress));
    }
    catch (PoolError const& e)
    {
        JLOG(j_.warn()) << type << " failed: " << e.what();
        return makeFailure(type, id, e.code(), e.what());
    }
    catch (std::exception const& e)
    {
        JLOG(j_.warn()) << type << " failed: " << e.what();
        return makeFailure(type, id, ErrorCode::ProverFailure, e.what());
    }
}

Json::Value
ProverWorker::dispatch(
    MessageType type,
    Json::Value const& data,
    ProgressCallback const& progress)
{
    switch (type)
    {
        case MessageType::InitModules:
            return initModules();
        case MessageType::InitWitness:
            return initWitness(data, progress);
        case MessageType::InitProver:
            return initProver(progress);
        case MessageType::Prove:
            return prove(data, progress);
        case MessageType::Verify:
            return verify(data);
        case MessageType::GetVk: {
            if (!state().proverReady)
                throw PoolError(ErrorCode::WorkerNotReady, "Prover not initialized");
            Json::Value result(Json::objectValue);
            result["verifyingKey"] = ripple::strHex(prover_.sorobanVerifyingKey());
            return result;
        }
        case MessageType::GetCircuitInfo:
            return circuitInfo();
        case MessageType::Ping: {
            Json::Value result(Json::objectValue);
            result["ready"] = state().proverReady;
            result["state"] = state().toJson();
            return result;
        }
        case MessageType::CheckCache: {
            Json::Value result(Json::objectValue);
            result["cached"] = !urls_.provingKey.empty() && !urls_.r1cs.empty() &&
                artifacts_->isCached(urls_.provingKey) &&
                artifacts_->isCached(urls_.r1cs);
            return result;
        }
        case MessageType::ClearCache:
            artifacts_->clearCache();
            return Json::Value(Json::objectValue);
        case MessageType::Configure:
            return configure(data);
        case MessageType::GetState: {
            Json::Value result(Json::objectValue);
            result["state"] = state().toJson();
            return result;
        }
        case MessageType::Progress:
        case MessageType::Ready:
            break;
    }
    throw PoolError(
        ErrorCode::UnknownMessageType,
        std::string("Unknown message type: ") + to_string(type));
}

Json::Value
ProverWorker::initModules()
{
    if (!state().modulesReady)
    {
        initCurve();
        if (verifyHashVectors_ && !hasher_.selfTest())
            throw PoolError(
                ErrorCode::ProverFailure,
                "Poseidon2 does not reproduce the circuit's known vectors");
        advance(Stage::ModulesReady);
        JLOG(j_.debug()) << "Modules ready";
    }
    Json::Value result(Json::objectValue);
    result["modulesReady"] = true;
    return result;
}

Json::Value
ProverWorker::initWitness(Json::Value const& data, ProgressCallback const& progress)
{
    initModules();

    if (data.isObject() && data.isMember("circuitWasmUrl"))
        urls_.circuitWasm = data["circuitWasmUrl"].asString();

    if (!state().witnessReady)
    {
        if (urls_.circuitWasm.empty())
            throw PoolError(
                ErrorCode::ArtifactFetchError, "No circuit WASM URL configured");
        auto const wasm = artifacts_->fetchWithProgress(urls_.circuitWasm, progress);
        calculator_ = calculators_->create(wasm);
        advance(Stage::WitnessReady);
        JLOG(j_.debug()) << "Witness calculator ready, "
                         << calculator_->witnessSize() << " wires";
    }

    Json::Value result(Json::objectValue);
    result["circuitInfo"] = circuitInfo();
    result["witnessReady"] = true;
    return result;
}

Json::Value
ProverWorker::initProver(ProgressCallback const& progress)
{
    initWitness(Json::Value(Json::objectValue), progress);

    if (!state().proverReady)
    {
        if (urls_.provingKey.empty() || urls_.r1cs.empty())
            throw PoolError(
                ErrorCode::ArtifactFetchError,
                "Proving key and R1CS URLs must be configured");
        auto const pk = artifacts_->fetchWithProgress(urls_.provingKey, progress);
        auto const r1cs = artifacts_->fetchWithProgress(urls_.r1cs, progress);
        prover_.load(pk, r1cs);
        if (prover_.numWires() != calculator_->witnessSize())
            throw PoolError(
                ErrorCode::ProverFailure,
                "Witness calculator produces " +
                    std::to_string(calculator_->witnessSize()) +
                    " wires, R1CS has " + std::to_string(prover_.numWires()));
        advance(Stage::ProverReady);
        JLOG(j_.info()) << "Prover ready";
    }

    Json::Value result(Json::objectValue);
    result["info"] = circuitInfo();
    result["proverReady"] = true;
    return result;
}

Json::Value
ProverWorker::prove(Json::Value const& data, ProgressCallback const& progress)
{
    if (!state().proverReady)
        initProver(progress);

    if (!data.isObject() || !data.isMember("inputs"))
        throw std::invalid_argument("PROVE requires circuit inputs");

    auto const start = clock_type::now();
    std::vector<FieldT> witness;
    try
    {
        witness = calculator_->calculateWitness(data["inputs"]);
    }
    catch (PoolError const&)
    {
        throw;
    }
    catch (std::exception const& e)
    {
        throw PoolError(
            ErrorCode::ProverFailure,
            std::string("Witness calculation failed: ") + e.what(),
            std::current_exception());
    }
    auto const witnessMs = elapsedMs(start);

    auto const proveStart = clock_type::now();
    auto const proof = prover_.prove(witness);
    auto const proveMs = elapsedMs(proveStart);

    Json::Value result(Json::objectValue);
    result["proof"] = ripple::strHex(proof.compressed);
    result["onChainProof"] = ripple::strHex(proof.onChain);
    Json::Value& publicInputs = result["publicInputs"] =
        Json::Value(Json::arrayValue);
    for (auto const& x : proof.publicInputs)
        publicInputs.append(fieldToDecimal(x));
    Json::Value& timings = result["timings"] = Json::Value(Json::objectValue);
    timings["witness"] = witnessMs;
    timings["prove"] = proveMs;
    timings["total"] = elapsedMs(start);

    JLOG(j_.debug()) << "Proof generated in " << elapsedMs(start) << "ms";
    return result;
}

Json::Value
ProverWorker::verify(Json::Value const& data)
{
    if (!state().proverReady)
        throw PoolError(ErrorCode::WorkerNotReady, "Prover not initialized");

    auto const proof = ripple::strUnHex(stringField(data, "proof"));
    if (!proof)
        throw PoolError(ErrorCode::InvalidHex, "Proof is not hex");

    std::vector<FieldT> publicInputs;
    Json::Value const& inputs = data["publicInputs"];
    if (!inputs.isArray())
        throw std::invalid_argument("Missing field 'publicInputs'");
    for (Json::UInt i = 0; i < inputs.size(); ++i)
        publicInputs.push_back(fieldFromDecimal(inputs[i].asString()));

    Json::Value result(Json::objectValue);
    result["verified"] = prover_.verify(*proof, publicInputs);
    return result;
}

Json::Value
ProverWorker::circuitInfo() const
{
    if (!state().witnessReady)
        throw PoolError(ErrorCode::WorkerNotReady, "Witness not initialized");

    Json::Value info(Json::objectValue);
    info["witnessSize"] = static_cast<Json::UInt>(calculator_->witnessSize());
    if (state().proverReady)
    {
        info["numPublic"] = static_cast<Json::UInt>(prover_.numPublic());
        info["numConstraints"] = static_cast<Json::UInt>(prover_.numConstraints());
    }
    return info;
}

Json::Value
ProverWorker::configure(Json::Value const& data)
{
    if (!data.isObject())
        throw std::invalid_argument("CONFIGURE requires an object");
    if (data.isMember("circuitWasmUrl"))
        urls_.circuitWasm = data["circuitWasmUrl"].asString();
    if (data.isMember("provingKeyUrl"))
        urls_.provingKey = data["provingKeyUrl"].asString();
    if (data.isMember("r1csUrl"))
        urls_.r1cs = data["r1csUrl"].asString();
    return Json::Value(Json::objectValue);
}

}  // namespace zkp
}  // namespace novapool
