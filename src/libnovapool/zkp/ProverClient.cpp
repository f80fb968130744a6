#include <libnovapool/zkp/ProverClient.h>
#include <libnovapool/zkp/PoolError.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/StringUtilities.h>
#include <xrpl/basics/strHex.h>

#include <boost/lexical_cast.hpp>

#include <utility>

namespace novapool {
namespace zkp {

namespace {

ripple::Blob
blobField(Json::Value const& result, char const* key)
{
    auto blob = ripple::strUnHex(result[key].asString());
    if (!blob)
        throw PoolError(
            ErrorCode::InvalidHex,
            std::string("Worker returned malformed '") + key + "'");
    return std::move(*blob);
}

WorkerState
stateFrom(Json::Value const& json)
{
    WorkerState s;
    s.modulesReady = json["modulesReady"].asBool();
    s.witnessReady = json["witnessReady"].asBool();
    s.proverReady = json["proverReady"].asBool();
    return s;
}

}  // namespace

ProverClient::ProverClient(
    std::unique_ptr<ProverWorker> worker,
    PoolConfig const& config,
    beast::Journal journal)
    : worker_(std::move(worker))
    , proveTimeout_(config.proveTimeout)
    , callTimeout_(config.callTimeout)
    , spawnTimeout_(config.spawnTimeout)
    , maxRetries_(config.maxRetries)
    , j_(journal)
    , readyFuture_(ready_.get_future().share())
{
}

ProverClient::~ProverClient()
{
    worker_->stop();
}

void
ProverClient::start()
{
    if (started_)
        return;
    if (!spawned_)
    {
        worker_->start(
            [this](Json::Value const& message) { onMessage(message); });
        spawned_ = true;
    }
    if (readyFuture_.wait_for(spawnTimeout_) != std::future_status::ready)
        throw PoolError(
            ErrorCode::WorkerTimeout, "Worker initialization timeout");
    started_ = true;
    JLOG(j_.debug()) << "Prover worker ready";
}

std::chrono::milliseconds
ProverClient::timeoutFor(MessageType type) const
{
    return type == MessageType::Prove ? proveTimeout_ : callTimeout_;
}

void
ProverClient::onMessage(Json::Value const& message)
{
    auto const type = message["type"].asString();
    if (type == to_string(MessageType::Ready))
    {
        try
        {
            ready_.set_value();
        }
        catch (std::future_error const&)
        {
            JLOG(j_.warn()) << "Duplicate READY from prover worker";
        }
        return;
    }

    std::uint64_t id = 0;
    try
    {
        id = boost::lexical_cast<std::uint64_t>(message["messageId"].asString());
    }
    catch (boost::bad_lexical_cast const&)
    {
        JLOG(j_.warn()) << "Dropping worker message without id: " << type;
        return;
    }

    std::shared_ptr<Pending> pending;
    {
        std::lock_guard guard(lock_);
        auto const it = pending_.find(id);
        if (it == pending_.end())
        {
            JLOG(j_.warn()) << "Dropping late " << type << " response #" << id;
            return;
        }
        pending = it->second;
        if (type != to_string(MessageType::Progress))
            pending_.erase(it);
    }

    if (type == to_string(MessageType::Progress))
    {
        if (pending->progress)
        {
            DownloadProgress p;
            p.loaded = boost::lexical_cast<std::uint64_t>(message["loaded"].asString());
            p.total = boost::lexical_cast<std::uint64_t>(message["total"].asString());
            p.percent = message["percent"].asInt();
            p.message = message["message"].asString();
            pending->progress(p);
        }
        return;
    }
    pending->promise.set_value(message);
}

Json::Value
ProverClient::send(
    MessageType type,
    Json::Value const& data,
    ProgressCallback const& progress)
{
    auto const id = ++nextId_;
    auto pending = std::make_shared<Pending>();
    pending->progress = progress;
    auto response = pending->promise.get_future();
    {
        std::lock_guard guard(lock_);
        pending_.emplace(id, pending);
    }

    worker_->post(makeRequest(type, id, data));

    if (response.wait_for(timeoutFor(type)) != std::future_status::ready)
    {
        std::lock_guard guard(lock_);
        if (pending_.erase(id) != 0)
            throw PoolError(
                ErrorCode::WorkerTimeout,
                std::string(to_string(type)) + " timeout");
        // answered while we were giving up
    }

    auto const message = response.get();
    if (!message["success"].asBool())
    {
        auto const code = errorCodeFromString(message["errorCode"].asString())
                              .value_or(ErrorCode::ProverFailure);
        auto error = message["error"].asString();
        if (error.empty())
            error = std::string("Worker error (type: ") + to_string(type) + ")";
        throw PoolError(code, error);
    }
    return message["result"];
}

Json::Value
ProverClient::call(
    MessageType type,
    Json::Value const& data,
    ProgressCallback progress)
{
    if (!started_)
        start();

    unsigned attempt = 0;
    while (true)
    {
        try
        {
            return send(type, data, progress);
        }
        catch (PoolError const& e)
        {
            if (e.code() != ErrorCode::WorkerTimeout || !isIdempotent(type) ||
                attempt >= maxRetries_)
                throw;
            ++attempt;
            JLOG(j_.info()) << to_string(type) << " timed out, retry "
                            << attempt << " of " << maxRetries_;
        }
    }
}

WorkerState
ProverClient::ping()
{
    return stateFrom(call(MessageType::Ping)["state"]);
}

WorkerState
ProverClient::getState()
{
    return stateFrom(call(MessageType::GetState)["state"]);
}

bool
ProverClient::isCached()
{
    return call(MessageType::CheckCache)["cached"].asBool();
}

void
ProverClient::clearCache()
{
    call(MessageType::ClearCache);
}

void
ProverClient::configure(ArtifactUrls const& urls)
{
    Json::Value data(Json::objectValue);
    data["circuitWasmUrl"] = urls.circuitWasm;
    data["provingKeyUrl"] = urls.provingKey;
    data["r1csUrl"] = urls.r1cs;
    call(MessageType::Configure, data);
}

void
ProverClient::initializeProver(ProgressCallback progress)
{
    if (proverReady_)
        return;
    call(MessageType::InitProver, Json::Value(Json::objectValue), std::move(progress));
    proverReady_ = true;
}

ProveResult
ProverClient::prove(Json::Value const& circuitInputs, ProgressCallback progress)
{
    if (!proverReady_)
        initializeProver(progress);

    Json::Value data(Json::objectValue);
    data["inputs"] = circuitInputs;
    auto const result = call(MessageType::Prove, data, std::move(progress));

    ProveResult proof;
    proof.compressed = blobField(result, "proof");
    proof.onChain = blobField(result, "onChainProof");
    Json::Value const& inputs = result["publicInputs"];
    for (Json::UInt i = 0; i < inputs.size(); ++i)
        proof.publicInputs.push_back(fieldFromDecimal(inputs[i].asString()));
    proof.timings = result["timings"];
    return proof;
}

bool
ProverClient::verify(
    ripple::Blob const& compressedProof,
    std::vector<FieldT> const& publicInputs)
{
    if (!proverReady_)
        throw PoolError(ErrorCode::WorkerNotReady, "Prover not initialized");

    Json::Value data(Json::objectValue);
    data["proof"] = ripple::strHex(compressedProof);
    Json::Value& inputs = data["publicInputs"] = Json::Value(Json::arrayValue);
    for (auto const& x : publicInputs)
        inputs.append(fieldToDecimal(x));
    return call(MessageType::Verify, data)["verified"].asBool();
}

ripple::Blob
ProverClient::verifyingKey()
{
    return blobField(call(MessageType::GetVk), "verifyingKey");
}

Json::Value
ProverClient::circuitInfo()
{
    return call(MessageType::GetCircuitInfo);
}

std::size_t
ProverClient::pendingCount() const
{
    std::lock_guard guard(lock_);
    return pending_.size();
}

}  // namespace zkp
}  // namespace novapool
